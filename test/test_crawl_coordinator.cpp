#include <gtest/gtest.h>
#include "crawl_coordinator.hpp"
#include "fake_fetcher.hpp"
#include "logger.hpp"
#include "worker_pool.hpp"
#include "duckdb.hpp"

#include <random>
#include <set>
#include <thread>

using namespace webcrawl;
using webcrawl::testing::FakeFetcher;
using webcrawl::testing::FakePage;
using webcrawl::testing::MemoryResultStore;

static const std::string kSeed = "http://site.test/";

static std::string PageUrl(int i) {
	return "http://site.test/p" + std::to_string(i);
}

class CrawlCoordinatorTest : public ::testing::Test {
protected:
	void SetUp() override {
		Logger::SetLevel(LogLevel::OFF);
		config_.pop_timeout = std::chrono::milliseconds(20);
	}

	// Seed links to every page, and each page links to every other one
	void BuildCompleteSite(int pages) {
		std::vector<std::string> all;
		for (int i = 0; i < pages; i++) {
			all.push_back("/p" + std::to_string(i));
		}
		fetcher_.AddPage(kSeed, all);
		for (int i = 0; i < pages; i++) {
			fetcher_.AddPage(PageUrl(i), all);
		}
	}

	CrawlerConfig config_;
	FakeFetcher fetcher_;
};

TEST_F(CrawlCoordinatorTest, DepthZeroProcessesSeedOnly) {
	fetcher_.AddPage(kSeed, {"/a", "/b"});
	DuckDBResultStore store(":memory:");
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 0, 10, 2);
	EXPECT_EQ(report.pages_crawled, 1);
	EXPECT_EQ(report.error_count, 0);
	EXPECT_EQ(report.max_depth_reached, 0);
	ASSERT_EQ(report.visited_urls.size(), 1u);
	EXPECT_EQ(report.visited_urls[0], kSeed);

	auto rows = store.QueryAll();
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].status, PageStatus::SUCCESS);
	EXPECT_EQ(rows[0].links, (std::vector<std::string> {"http://site.test/a", "http://site.test/b"}));
	EXPECT_EQ(fetcher_.FetchCount(), 1);
}

TEST_F(CrawlCoordinatorTest, SelfLinkIsProcessedOnce) {
	fetcher_.AddPage(kSeed, {"/", "http://site.test", "#top", "http://SITE.test/"});
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 3, 10, 4);
	EXPECT_EQ(report.pages_crawled, 1);
	EXPECT_EQ(report.visited_urls.size(), 1u);
	EXPECT_EQ(fetcher_.FetchCount(), 1);
}

TEST_F(CrawlCoordinatorTest, PageBudgetStopsLargeSite) {
	BuildCompleteSite(20);
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 3, 5, 4);
	EXPECT_EQ(report.pages_crawled, 5);
	EXPECT_EQ(report.visited_urls.size(), 5u);
	EXPECT_EQ(store.QueryAll().size(), 5u);
	EXPECT_EQ(fetcher_.FetchCount(), 5);
}

TEST_F(CrawlCoordinatorTest, ServerErrorIsCountedAndCrawlContinues) {
	fetcher_.AddPage(kSeed, {"/ok", "/broken"});
	fetcher_.AddPage("http://site.test/ok", {});
	fetcher_.AddPage("http://site.test/broken", {}, 500);
	DuckDBResultStore store(":memory:");
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 2, 10, 3);
	EXPECT_EQ(report.pages_crawled, 3);
	EXPECT_EQ(report.error_count, 1);
	EXPECT_EQ(report.max_depth_reached, 1);

	int errors = 0;
	for (const auto &row : store.QueryAll()) {
		if (row.url == "http://site.test/broken") {
			errors++;
			EXPECT_EQ(row.status, PageStatus::FETCH_ERROR);
			EXPECT_EQ(row.http_status, 500);
			EXPECT_EQ(row.error_type, CrawlErrorType::HTTP_SERVER_ERROR);
		}
	}
	EXPECT_EQ(errors, 1);
}

TEST_F(CrawlCoordinatorTest, ParseErrorAndSkippedContent) {
	fetcher_.AddPage(kSeed, {"/binary", "/data"});
	FakePage binary;
	binary.body = std::string("GIF89a\0\0\0", 9);
	fetcher_.SetPage("http://site.test/binary", binary);
	FakePage data;
	data.content_type = "application/octet-stream";
	data.body = "<a href=\"/hidden\">never parsed</a>";
	fetcher_.SetPage("http://site.test/data", data);
	fetcher_.AddPage("http://site.test/hidden", {});
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 3, 10, 2);
	EXPECT_EQ(report.pages_crawled, 3);
	EXPECT_EQ(report.error_count, 1);
	for (const auto &row : store.QueryAll()) {
		if (row.url == "http://site.test/binary") {
			EXPECT_EQ(row.status, PageStatus::PARSE_ERROR);
		} else if (row.url == "http://site.test/data") {
			EXPECT_EQ(row.status, PageStatus::SKIPPED);
			EXPECT_EQ(row.error_type, CrawlErrorType::CONTENT_TYPE_REJECTED);
			EXPECT_TRUE(row.links.empty());
		}
	}
}

TEST_F(CrawlCoordinatorTest, ExternalLinksAreNotFollowedByDefault) {
	fetcher_.AddPage(kSeed, {"http://elsewhere.test/", "/local", "mailto:a@site.test", "/file.pdf"});
	fetcher_.AddPage("http://site.test/local", {});
	fetcher_.AddPage("http://elsewhere.test/", {});
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 2, 10, 2);
	EXPECT_EQ(report.pages_crawled, 2);
	for (const auto &url : fetcher_.Fetched()) {
		EXPECT_EQ(url.find("elsewhere"), std::string::npos);
	}

	config_.domain_policy = DomainPolicy::ANY_DOMAIN;
	MemoryResultStore open_store;
	FakeFetcher open_fetcher;
	open_fetcher.AddPage(kSeed, {"http://elsewhere.test/"});
	open_fetcher.AddPage("http://elsewhere.test/", {});
	CrawlCoordinator open_coordinator(config_, open_fetcher, open_store);
	EXPECT_EQ(open_coordinator.Run(kSeed, 2, 10, 2).pages_crawled, 2);
}

TEST_F(CrawlCoordinatorTest, InvariantsHoldOnRandomSites) {
	std::mt19937 rng(1234);
	for (int round = 0; round < 6; round++) {
		FakeFetcher fetcher;
		const int pages = 40;
		std::uniform_int_distribution<int> pick(0, pages - 1);
		fetcher.AddPage(kSeed, {"/p0", "/p1"});
		for (int i = 0; i < pages; i++) {
			std::vector<std::string> links;
			for (int l = 0; l < 4; l++) {
				links.push_back("/p" + std::to_string(pick(rng)));
			}
			fetcher.AddPage(PageUrl(i), links, i % 7 == 3 ? 503 : 200);
		}

		const int max_depth = 1 + round % 3;
		const int max_pages = 5 + round * 5;
		const int workers = 1 + round;
		MemoryResultStore store;
		CrawlCoordinator coordinator(config_, fetcher, store);
		auto report = coordinator.Run(kSeed, max_depth, max_pages, workers);

		auto rows = store.QueryAll();
		EXPECT_LE(report.pages_crawled, max_pages);
		EXPECT_EQ(static_cast<int64_t>(rows.size()), report.pages_crawled);
		std::set<std::string> unique(report.visited_urls.begin(), report.visited_urls.end());
		EXPECT_EQ(unique.size(), report.visited_urls.size());
		EXPECT_EQ(static_cast<int64_t>(report.visited_urls.size()), report.pages_crawled);
		int64_t errors = 0;
		for (const auto &row : rows) {
			EXPECT_LE(row.depth, max_depth);
			if (row.IsError()) {
				errors++;
			}
		}
		EXPECT_EQ(errors, report.error_count);
		EXPECT_LE(report.max_depth_reached, max_depth);
	}
}

TEST_F(CrawlCoordinatorTest, StoreFailuresDoNotStopTheCrawl) {
	BuildCompleteSite(6);
	MemoryResultStore store(2);
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 2, 100, 3);
	EXPECT_EQ(report.pages_crawled, 7);
	EXPECT_EQ(store.Attempts(), 7);
	EXPECT_EQ(store.QueryAll().size(), 4u);
	// Reported from the in-memory completion log
	EXPECT_EQ(report.visited_urls.size(), 7u);
}

TEST_F(CrawlCoordinatorTest, RetriesRecoverTransientErrors) {
	config_.retry.max_retries = 2;
	config_.retry.initial_backoff_ms = 1;
	fetcher_.AddPage(kSeed, {}, 503);
	fetcher_.OnFetch([this](const std::string &url) {
		if (fetcher_.FetchCount() == 2) {
			fetcher_.AddPage(url, {});
		}
	});
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 1, 10, 1);
	EXPECT_EQ(report.pages_crawled, 1);
	EXPECT_EQ(report.error_count, 0);
	EXPECT_EQ(fetcher_.FetchCount(), 2);
}

TEST_F(CrawlCoordinatorTest, ClientErrorsAreNotRetried) {
	config_.retry.max_retries = 3;
	config_.retry.initial_backoff_ms = 1;
	fetcher_.AddPage(kSeed, {}, 404);
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 1, 10, 1);
	EXPECT_EQ(report.error_count, 1);
	EXPECT_EQ(fetcher_.FetchCount(), 1);
}

TEST_F(CrawlCoordinatorTest, StopRequestFinishesInFlightPages) {
	BuildCompleteSite(30);
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);
	fetcher_.OnFetch([&coordinator](const std::string &) {
		coordinator.RequestStop();
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	});

	auto report = coordinator.Run(kSeed, 3, 100, 2);
	EXPECT_GE(report.pages_crawled, 1);
	EXPECT_LT(report.pages_crawled, 31);
	EXPECT_EQ(static_cast<int64_t>(store.QueryAll().size()), report.pages_crawled);
	EXPECT_EQ(fetcher_.FetchCount(), report.pages_crawled);
}

TEST_F(CrawlCoordinatorTest, InvalidSeedIsFatal) {
	MemoryResultStore store;
	CrawlCoordinator coordinator(config_, fetcher_, store);
	EXPECT_THROW(coordinator.Run("not a url"), duckdb::InvalidInputException);
	EXPECT_THROW(coordinator.Run("mailto:someone@site.test"), duckdb::InvalidInputException);
	EXPECT_THROW(coordinator.Run("http://site.test/manual.pdf"), duckdb::InvalidInputException);
	EXPECT_THROW(coordinator.Run(kSeed, -1, 10, 1), duckdb::InvalidInputException);
	EXPECT_THROW(coordinator.Run(kSeed, 1, 0, 1), duckdb::InvalidInputException);
	EXPECT_THROW(coordinator.Run(kSeed, 1, 10, 0), duckdb::InvalidInputException);
	EXPECT_EQ(fetcher_.FetchCount(), 0);
	EXPECT_TRUE(store.QueryAll().empty());
}

TEST_F(CrawlCoordinatorTest, CheckSeedNeedsNoStore) {
	EXPECT_NO_THROW(CrawlCoordinator::CheckSeed(kSeed));
	EXPECT_NO_THROW(CrawlCoordinator::CheckSeed("https://site.test/docs/"));
	EXPECT_THROW(CrawlCoordinator::CheckSeed("not a url"), duckdb::InvalidInputException);
	EXPECT_THROW(CrawlCoordinator::CheckSeed("ftp://site.test/"), duckdb::InvalidInputException);
	EXPECT_THROW(CrawlCoordinator::CheckSeed(""), duckdb::InvalidInputException);
}

TEST_F(CrawlCoordinatorTest, SuccessfulPagesKeepTheirBody) {
	fetcher_.AddPage(kSeed, {"/missing"});
	DuckDBResultStore store(":memory:");
	CrawlCoordinator coordinator(config_, fetcher_, store);

	auto report = coordinator.Run(kSeed, 1, 10, 1);
	EXPECT_EQ(report.pages_crawled, 2);
	auto rows = store.QueryAll();
	ASSERT_EQ(rows.size(), 2u);
	EXPECT_EQ(rows[0].status, PageStatus::SUCCESS);
	EXPECT_EQ(rows[0].content, "<html><body><a href=\"/missing\">/missing</a></body></html>");
	EXPECT_EQ(rows[1].status, PageStatus::FETCH_ERROR);
	EXPECT_TRUE(rows[1].content.empty());
}

TEST_F(CrawlCoordinatorTest, ContentStorageCanBeTurnedOff) {
	config_.store_content = false;
	fetcher_.AddPage(kSeed, {});
	DuckDBResultStore store(":memory:");
	CrawlCoordinator coordinator(config_, fetcher_, store);

	coordinator.Run(kSeed, 0, 10, 1);
	auto rows = store.QueryAll();
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].status, PageStatus::SUCCESS);
	EXPECT_FALSE(rows[0].content_hash.empty());
	EXPECT_TRUE(rows[0].content.empty());
}

TEST(WorkerPoolTest, ProcessItemResolvesAgainstPageUrl) {
	Logger::SetLevel(LogLevel::OFF);
	CrawlerConfig config;
	FakeFetcher fetcher;
	fetcher.AddPage("http://site.test/docs/intro", {"setup", "../about", "/docs/intro", "setup"});
	UrlNormalizer normalizer(config, kSeed);
	Frontier frontier(normalizer, 1);
	LinkExtractor extractor;
	MemoryResultStore store;
	CrawlCounters counters(10);
	CrawlContext context {config, normalizer, frontier, fetcher, extractor, store, counters};
	WorkerPool pool(context, 1);

	auto result = pool.ProcessItem(FrontierItem("http://site.test/docs/intro", 0));
	EXPECT_EQ(result.status, PageStatus::SUCCESS);
	EXPECT_EQ(result.http_status, 200);
	EXPECT_FALSE(result.content_hash.empty());
	EXPECT_EQ(result.links, (std::vector<std::string> {"http://site.test/docs/setup", "http://site.test/about",
	                                                   "http://site.test/docs/intro"}));
	EXPECT_EQ(frontier.Size(), 3u);

	// Depth 1 is the limit, so links of a depth-1 page are recorded but not queued
	auto deeper = pool.ProcessItem(FrontierItem("http://site.test/docs/intro", 1));
	EXPECT_EQ(deeper.links.size(), 3u);
	EXPECT_EQ(frontier.Size(), 3u);
}

TEST(WorkerPoolTest, DirectoryBaseHrefKeepsTrailingSlash) {
	Logger::SetLevel(LogLevel::OFF);
	CrawlerConfig config;
	FakeFetcher fetcher;
	FakePage page;
	page.body = "<html><head><base href=\"http://site.test/docs/\"></head>"
	            "<body><a href=\"guide.html\">g</a><a href=\"../faq\">f</a></body></html>";
	fetcher.SetPage("http://site.test/index", page);
	UrlNormalizer normalizer(config, kSeed);
	Frontier frontier(normalizer, 1);
	LinkExtractor extractor;
	MemoryResultStore store;
	CrawlCounters counters(10);
	CrawlContext context {config, normalizer, frontier, fetcher, extractor, store, counters};
	WorkerPool pool(context, 1);

	auto result = pool.ProcessItem(FrontierItem("http://site.test/index", 0));
	EXPECT_EQ(result.status, PageStatus::SUCCESS);
	EXPECT_EQ(result.links, (std::vector<std::string> {"http://site.test/docs/guide.html", "http://site.test/faq"}));
}

TEST(WorkerPoolTest, StateNames) {
	EXPECT_STREQ(WorkerStateToString(WorkerState::STOPPED_BUDGET), "stopped_budget");
	EXPECT_TRUE(IsTerminalState(WorkerState::STOPPED_DRAINED));
	EXPECT_FALSE(IsTerminalState(WorkerState::FETCHING));
}

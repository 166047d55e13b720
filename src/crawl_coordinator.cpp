#include "crawl_coordinator.hpp"
#include "frontier.hpp"
#include "link_extractor.hpp"
#include "logger.hpp"
#include "url_normalizer.hpp"
#include "worker_pool.hpp"
#include "duckdb.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <thread>
#include <unordered_set>

namespace webcrawl {

using duckdb::InvalidInputException;

// Global signal flag for graceful shutdown
static std::atomic<bool> g_shutdown_requested(false);
static std::atomic<int> g_sigint_count(0);
static std::atomic<int64_t> g_last_sigint_ms(0);

static int64_t SteadyMillis() {
	return std::chrono::duration_cast<std::chrono::milliseconds>(
	    std::chrono::steady_clock::now().time_since_epoch()).count();
}

// Signal handler
static void SignalHandler(int signum) {
	if (signum == SIGINT) {
		int64_t now = SteadyMillis();
		int64_t elapsed = now - g_last_sigint_ms.load();

		g_sigint_count++;
		g_last_sigint_ms = now;

		if (g_sigint_count >= 2 && elapsed < 3000) {
			// Double Ctrl+C within 3 seconds - force exit
			std::_Exit(1);
		}

		g_shutdown_requested = true;
	}
}

void CrawlCoordinator::InstallSignalHandler() {
	g_shutdown_requested = false;
	g_sigint_count = 0;
	std::signal(SIGINT, SignalHandler);
}

CrawlCoordinator::CrawlCoordinator(const CrawlerConfig &config, PageFetcher &fetcher, ResultStore &store)
    : config_(config), fetcher_(fetcher), store_(store), stop_requested_(false) {
}

void CrawlCoordinator::RequestStop() {
	stop_requested_.store(true);
}

bool CrawlCoordinator::StopRequested() const {
	return stop_requested_.load() || g_shutdown_requested.load();
}

void CrawlCoordinator::CheckSeed(const std::string &base_url) {
	if (UrlNormalizer::Canonicalize(base_url).empty()) {
		throw InvalidInputException("Invalid seed URL '%s': expected an absolute http(s) URL", base_url);
	}
}

CrawlReport CrawlCoordinator::Run(const std::string &base_url) {
	return Run(base_url, config_.max_depth, config_.max_pages, config_.num_threads);
}

CrawlReport CrawlCoordinator::Run(const std::string &base_url, int max_depth, int max_pages, int num_workers) {
	CrawlerConfig config = config_;
	config.max_depth = max_depth;
	config.max_pages = max_pages;
	config.num_threads = num_workers;
	config.Validate();
	stop_requested_.store(false);

	CheckSeed(base_url);
	UrlNormalizer normalizer(config, base_url);
	Frontier frontier(normalizer, config.max_depth);
	if (!frontier.Seed(base_url)) {
		throw InvalidInputException("Seed URL '%s' is excluded by the crawl policy", base_url);
	}

	CrawlCounters counters(config.max_pages);
	LinkExtractor extractor(config.respect_nofollow);
	CrawlContext context {config, normalizer, frontier, fetcher_, extractor, store_, counters};

	Logger::Info("Starting crawl of " + base_url + " (max_depth=" + std::to_string(config.max_depth) +
	             ", max_pages=" + std::to_string(config.max_pages) + ", workers=" +
	             std::to_string(config.num_threads) + ")");

	auto start = std::chrono::steady_clock::now();
	WorkerPool pool(context, config.num_threads);
	pool.Start();

	// Monitor for shutdown while workers run
	bool interrupted = false;
	while (!pool.AllStopped()) {
		if (StopRequested()) {
			Logger::Warn("Interrupt received, finishing in-flight pages");
			interrupted = true;
			pool.Stop();
			frontier.Shutdown();
			break;
		}
		std::this_thread::sleep_for(MONITOR_INTERVAL);
	}
	pool.Join();
	frontier.Shutdown();

	auto elapsed = std::chrono::steady_clock::now() - start;

	CrawlReport report;
	report.base_url = base_url;
	report.max_depth_reached = std::max(0, counters.max_depth_seen.load());
	report.pages_crawled = counters.pages_processed.load();
	report.error_count = counters.error_count.load();
	report.duration_seconds = std::chrono::duration<double>(elapsed).count();

	std::vector<std::string> completed;
	try {
		for (const auto &page : store_.QueryAll()) {
			completed.push_back(page.url);
		}
	} catch (std::exception &e) {
		Logger::Error(std::string("Failed to read results back, reporting from memory: ") + e.what());
		completed = pool.ProcessedUrls();
	}
	if (pool.StoreErrors() > 0) {
		Logger::Error(std::to_string(pool.StoreErrors()) + " result(s) could not be stored");
		completed = pool.ProcessedUrls();
	}
	std::unordered_set<std::string> seen;
	for (auto &url : completed) {
		if (seen.insert(url).second) {
			report.visited_urls.push_back(std::move(url));
		}
	}

	Logger::Info(std::string(interrupted ? "Crawl interrupted" : "Crawl finished") + ": " +
	             std::to_string(report.pages_crawled) + " pages, " + std::to_string(report.error_count) +
	             " errors, max depth " + std::to_string(report.max_depth_reached));
	return report;
}

} // namespace webcrawl

#pragma once

#include "crawl_state.hpp"
#include "crawler_config.hpp"
#include "frontier.hpp"
#include "link_extractor.hpp"
#include "page_fetcher.hpp"
#include "result_store.hpp"
#include "url_normalizer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace webcrawl {

enum class WorkerState : uint8_t {
	IDLE = 0,
	POPPING = 1,
	FETCHING = 2,
	EXTRACTING = 3,
	RECORDING = 4,
	// Terminal states
	STOPPED_BUDGET = 5,
	STOPPED_DRAINED = 6,
	STOPPED_INTERRUPTED = 7
};

const char *WorkerStateToString(WorkerState state);
bool IsTerminalState(WorkerState state);

// Collaborators shared by every worker of one crawl. All referenced objects
// must outlive the WorkerPool.
struct CrawlContext {
	const CrawlerConfig &config;
	const UrlNormalizer &normalizer;
	Frontier &frontier;
	PageFetcher &fetcher;
	const LinkExtractor &extractor;
	ResultStore &store;
	CrawlCounters &counters;
};

//===--------------------------------------------------------------------===//
// WorkerPool - fixed set of threads draining the frontier
//===--------------------------------------------------------------------===//
// Each worker loops: reserve a budget slot, pop, fetch, extract, push links,
// record. Workers stop on their own when the budget is spent or the frontier
// drains; Stop() asks them to finish the current item and exit.

class WorkerPool {
public:
	WorkerPool(CrawlContext context, int num_workers);
	~WorkerPool();

	WorkerPool(const WorkerPool &) = delete;
	WorkerPool &operator=(const WorkerPool &) = delete;

	void Start();
	void Stop();
	void Join();

	bool AllStopped() const;
	WorkerState State(int worker_id) const;

	// Store writes that failed and were logged
	int64_t StoreErrors() const {
		return store_errors_.load();
	}

	// URLs processed by this pool in completion order, kept independent of the store
	std::vector<std::string> ProcessedUrls() const;

	// Fetch, classify and extract one item, pushing accepted links to the frontier.
	// Never throws; every failure becomes a PageResult.
	PageResult ProcessItem(const FrontierItem &item, int worker_id = -1);

private:
	void RunWorker(int worker_id);
	FetchOutcome FetchWithRetry(const std::string &url);
	void Record(const PageResult &result);
	void SetState(int worker_id, WorkerState state);

	CrawlContext ctx_;
	const int num_workers_;
	std::unique_ptr<std::atomic<uint8_t>[]> states_;
	std::atomic<bool> should_stop_;
	std::atomic<int64_t> store_errors_;
	std::vector<std::thread> threads_;

	mutable std::mutex processed_mutex_;
	std::vector<std::string> processed_urls_;
};

} // namespace webcrawl

#pragma once

#include "crawl_report.hpp"
#include "crawler_config.hpp"
#include "page_fetcher.hpp"
#include "result_store.hpp"

#include <atomic>
#include <chrono>
#include <string>

namespace webcrawl {

//===--------------------------------------------------------------------===//
// CrawlCoordinator - one crawl from seed to report
//===--------------------------------------------------------------------===//

class CrawlCoordinator {
public:
	// fetcher and store must outlive the coordinator
	CrawlCoordinator(const CrawlerConfig &config, PageFetcher &fetcher, ResultStore &store);

	// Crawl with the limits of the configuration
	CrawlReport Run(const std::string &base_url);

	// Crawl with explicit limits overriding the configuration.
	// Throws InvalidInputException for bad limits or a seed URL that cannot be crawled.
	CrawlReport Run(const std::string &base_url, int max_depth, int max_pages, int num_workers);

	// Throws InvalidInputException unless base_url is an absolute http(s) URL
	static void CheckSeed(const std::string &base_url);

	// Ask a running crawl to stop; in-flight pages are still recorded. Thread-safe.
	void RequestStop();

	// Route SIGINT to every running crawl. A second SIGINT within 3 seconds exits the process.
	static void InstallSignalHandler();

private:
	bool StopRequested() const;

	CrawlerConfig config_;
	PageFetcher &fetcher_;
	ResultStore &store_;
	std::atomic<bool> stop_requested_;
};

static constexpr std::chrono::milliseconds MONITOR_INTERVAL{50};

} // namespace webcrawl

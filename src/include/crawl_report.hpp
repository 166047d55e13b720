#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace webcrawl {

// Summary of one finished crawl run
struct CrawlReport {
	std::string base_url;
	int max_depth_reached = 0;
	int64_t pages_crawled = 0;
	int64_t error_count = 0;
	double duration_seconds = 0.0;
	std::vector<std::string> visited_urls;  // completion order, unique
};

// Serialize as a JSON object; pretty = two-space indentation
std::string CrawlReportToJson(const CrawlReport &report, bool pretty = true);

// Write the JSON report to path, or to stdout when path is empty.
// Throws duckdb::IOException if the file cannot be written.
void WriteReport(const CrawlReport &report, const std::string &path);

} // namespace webcrawl

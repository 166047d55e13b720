#pragma once

#include "crawler_utils.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace webcrawl {

// Which discovered hosts the crawl may follow
enum class DomainPolicy : uint8_t {
	SAME_DOMAIN = 0,  // seed host only ("www." ignored), optionally its subdomains
	ANY_DOMAIN = 1
};

//===--------------------------------------------------------------------===//
// CrawlerConfig - every tunable of a crawl run
//===--------------------------------------------------------------------===//

struct CrawlerConfig {
	// Budget
	int max_depth = 3;
	int max_pages = 100;
	int num_threads = 5;

	// Output
	std::string database_path = "web_crawler_results.db";
	std::string output_path;  // empty = stdout
	bool store_content = true;  // keep the body of successful pages in the pages table

	// HTTP
	std::string user_agent = "AdvancedWebCrawler/1.0";
	int64_t timeout_ms = 10000;
	int64_t connect_timeout_ms = 5000;
	int64_t max_response_bytes = 10 * 1024 * 1024;  // 10MB
	bool compress = true;
	RetryConfig retry;

	// Link policy
	DomainPolicy domain_policy = DomainPolicy::SAME_DOMAIN;
	bool allow_subdomains = false;
	bool respect_nofollow = false;
	std::vector<std::string> skip_extensions = {".pdf", ".jpg", ".jpeg", ".png", ".gif"};

	// Responses outside the accept list are recorded as skipped
	std::string accept_content_types = "text/*, application/xhtml+xml, application/xml";
	std::string reject_content_types;

	// Bounded wait of an idle worker on the frontier
	std::chrono::milliseconds pop_timeout{100};

	// Throws InvalidInputException describing the first bad value
	void Validate() const;
};

static constexpr int MAX_WORKER_THREADS = 64;

} // namespace webcrawl

#pragma once

#include "crawler_utils.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace webcrawl {

//===--------------------------------------------------------------------===//
// FrontierItem - one discovered URL waiting to be processed
//===--------------------------------------------------------------------===//

struct FrontierItem {
	std::string url;
	int depth = 0;

	FrontierItem() = default;
	FrontierItem(std::string u, int d) : url(std::move(u)), depth(d) {}
};

//===--------------------------------------------------------------------===//
// PageResult - outcome of one processed frontier item
//===--------------------------------------------------------------------===//

enum class PageStatus : uint8_t {
	SUCCESS = 0,
	FETCH_ERROR = 1,
	PARSE_ERROR = 2,
	SKIPPED = 3
};

const char *PageStatusToString(PageStatus status);
// Returns false for an unknown name
bool PageStatusFromString(const std::string &name, PageStatus &status);

struct PageResult {
	std::string url;
	int depth = 0;
	PageStatus status = PageStatus::SUCCESS;
	int http_status = 0;            // 0 = no HTTP response
	std::string error_message;      // empty unless the page failed or was skipped
	CrawlErrorType error_type = CrawlErrorType::NONE;
	std::string fetched_at;         // UTC, see FormatTimestamp
	std::vector<std::string> links; // normalized links found on the page, document order
	std::string content_type;
	int64_t elapsed_ms = 0;
	std::string content_hash;
	std::string content;            // decoded body, successful pages only

	bool IsError() const {
		return status == PageStatus::FETCH_ERROR || status == PageStatus::PARSE_ERROR;
	}
};

//===--------------------------------------------------------------------===//
// CrawlCounters - shared progress of one crawl run
//===--------------------------------------------------------------------===//
// Workers reserve a page slot before popping, so pages_processed can never
// pass max_pages no matter how many workers race for the last slot.

struct CrawlCounters {
	const int64_t max_pages;
	std::atomic<int64_t> pages_reserved;
	std::atomic<int64_t> pages_processed;
	std::atomic<int> max_depth_seen;
	std::atomic<int64_t> error_count;

	explicit CrawlCounters(int64_t max_pages_p)
	    : max_pages(max_pages_p), pages_reserved(0), pages_processed(0), max_depth_seen(-1), error_count(0) {}

	CrawlCounters(const CrawlCounters &) = delete;
	CrawlCounters &operator=(const CrawlCounters &) = delete;

	// Claim one page of the budget. False once max_pages slots are taken.
	bool TryReservePage();
	// Give back a slot that was not used (nothing to pop)
	void ReleasePage();
	// Account a processed page holding a reserved slot
	void RecordPage(int depth, bool is_error);

	bool BudgetExhausted() const {
		return pages_reserved.load() >= max_pages;
	}
};

} // namespace webcrawl

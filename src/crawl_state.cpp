#include "crawl_state.hpp"

namespace webcrawl {

const char *PageStatusToString(PageStatus status) {
	switch (status) {
		case PageStatus::SUCCESS: return "success";
		case PageStatus::FETCH_ERROR: return "fetch_error";
		case PageStatus::PARSE_ERROR: return "parse_error";
		case PageStatus::SKIPPED: return "skipped";
		default: return "unknown";
	}
}

bool PageStatusFromString(const std::string &name, PageStatus &status) {
	if (name == "success") {
		status = PageStatus::SUCCESS;
	} else if (name == "fetch_error") {
		status = PageStatus::FETCH_ERROR;
	} else if (name == "parse_error") {
		status = PageStatus::PARSE_ERROR;
	} else if (name == "skipped") {
		status = PageStatus::SKIPPED;
	} else {
		return false;
	}
	return true;
}

bool CrawlCounters::TryReservePage() {
	int64_t current = pages_reserved.load();
	while (current < max_pages) {
		if (pages_reserved.compare_exchange_weak(current, current + 1)) {
			return true;
		}
	}
	return false;
}

void CrawlCounters::ReleasePage() {
	pages_reserved.fetch_sub(1);
}

void CrawlCounters::RecordPage(int depth, bool is_error) {
	pages_processed.fetch_add(1);
	if (is_error) {
		error_count.fetch_add(1);
	}
	int seen = max_depth_seen.load();
	while (depth > seen && !max_depth_seen.compare_exchange_weak(seen, depth)) {
	}
}

} // namespace webcrawl

#pragma once

#include "crawler_config.hpp"
#include "crawler_utils.hpp"
#include "http_client.hpp"

#include <cstdint>
#include <string>

namespace webcrawl {

//===--------------------------------------------------------------------===//
// FetchOutcome - content or typed failure of one GET
//===--------------------------------------------------------------------===//

struct FetchOutcome {
	bool ok = false;
	int http_status = 0;      // 0 = no HTTP response (network failure)
	std::string body;
	std::string content_type;
	std::string final_url;    // after redirects; equals the requested URL when none were followed
	int64_t elapsed_ms = 0;
	CrawlErrorType error_type = CrawlErrorType::NONE;
	std::string error;

	bool IsNetworkFailure() const {
		return IsNetworkError(error_type);
	}
	bool IsHttpFailure() const {
		return IsHttpError(error_type);
	}
	bool IsTooLarge() const {
		return error_type == CrawlErrorType::CONTENT_TOO_LARGE;
	}
};

// Stateless page retrieval. Implementations must tolerate concurrent Fetch calls.
class PageFetcher {
public:
	virtual ~PageFetcher() = default;
	virtual FetchOutcome Fetch(const std::string &url) = 0;
};

// libcurl-backed fetcher sharing the process-wide HttpConnectionPool
class CurlPageFetcher : public PageFetcher {
public:
	explicit CurlPageFetcher(const CrawlerConfig &config);

	FetchOutcome Fetch(const std::string &url) override;

private:
	HttpRequestOptions options_;
};

// Map a raw HttpResponse onto a FetchOutcome. Inflates bodies that arrive
// gzip-compressed without a Content-Encoding header.
FetchOutcome ToFetchOutcome(const std::string &url, HttpResponse response);

} // namespace webcrawl

#include "page_fetcher.hpp"

namespace webcrawl {

CurlPageFetcher::CurlPageFetcher(const CrawlerConfig &config) {
	options_.user_agent = config.user_agent;
	options_.timeout_ms = config.timeout_ms;
	options_.connect_timeout_ms = config.connect_timeout_ms;
	options_.max_response_bytes = config.max_response_bytes;
	options_.compress = config.compress;
}

FetchOutcome CurlPageFetcher::Fetch(const std::string &url) {
	return ToFetchOutcome(url, HttpClient::Get(url, options_));
}

FetchOutcome ToFetchOutcome(const std::string &url, HttpResponse response) {
	FetchOutcome outcome;
	outcome.http_status = response.status_code;
	outcome.content_type = std::move(response.content_type);
	outcome.final_url = response.final_url.empty() ? url : std::move(response.final_url);
	outcome.elapsed_ms = response.elapsed_ms;

	if (response.too_large) {
		outcome.error_type = CrawlErrorType::CONTENT_TOO_LARGE;
		outcome.error = std::move(response.error);
		return outcome;
	}
	if (!response.success) {
		outcome.error_type = ClassifyError(response.status_code, response.error);
		if (outcome.error_type == CrawlErrorType::NONE) {
			// Unfollowed 3xx or other non-2xx outside the 4xx/5xx ranges
			outcome.error_type = CrawlErrorType::HTTP_CLIENT_ERROR;
		}
		outcome.error = response.error.empty() ? "HTTP " + std::to_string(response.status_code)
		                                       : std::move(response.error);
		return outcome;
	}

	if (IsGzippedData(response.body)) {
		std::string inflated = DecompressGzip(response.body);
		if (inflated.empty()) {
			outcome.error_type = CrawlErrorType::PARSE_ERROR;
			outcome.error = "Failed to decompress gzip body";
			return outcome;
		}
		response.body = std::move(inflated);
	}

	outcome.ok = true;
	outcome.body = std::move(response.body);
	return outcome;
}

} // namespace webcrawl

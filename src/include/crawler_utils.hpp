#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace webcrawl {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

enum class CrawlErrorType : uint8_t {
	NONE = 0,
	NETWORK_TIMEOUT = 1,
	NETWORK_DNS_FAILURE = 2,
	NETWORK_CONNECTION_REFUSED = 3,
	NETWORK_SSL_ERROR = 4,
	NETWORK_OTHER = 5,
	HTTP_CLIENT_ERROR = 6,
	HTTP_SERVER_ERROR = 7,
	HTTP_RATE_LIMITED = 8,
	CONTENT_TOO_LARGE = 9,
	CONTENT_TYPE_REJECTED = 10,
	PARSE_ERROR = 11
};

const char *ErrorTypeToString(CrawlErrorType type);
CrawlErrorType ErrorTypeFromString(const std::string &name);

// Classify a failed response. status_code <= 0 means no HTTP response was received
// and error_msg is the transport error text.
CrawlErrorType ClassifyError(int status_code, const std::string &error_msg);

bool IsNetworkError(CrawlErrorType type);
bool IsHttpError(CrawlErrorType type);

// 429, 5xx and transport failures are worth another attempt
bool IsRetryableError(CrawlErrorType type);

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

// Decompress gzip data. Returns empty string on error.
std::string DecompressGzip(const std::string &compressed_data);

// Check if data starts with gzip magic bytes (0x1f 0x8b)
bool IsGzippedData(const std::string &data);

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

struct RetryConfig {
	int max_retries = 0;
	int initial_backoff_ms = 100;
	double backoff_multiplier = 2.0;
	int max_backoff_ms = 30000;
};

// Delay before retry number `attempt` (1-based)
std::chrono::milliseconds ExponentialBackoff(const RetryConfig &config, int attempt);

//===--------------------------------------------------------------------===//
// Date/Time Utilities
//===--------------------------------------------------------------------===//

// UTC timestamp in the format DuckDB casts to TIMESTAMP: "2025-01-14 12:00:00.123"
std::string FormatTimestamp(std::chrono::system_clock::time_point time);
std::string CurrentTimestamp();

//===--------------------------------------------------------------------===//
// Content Utilities
//===--------------------------------------------------------------------===//

// Generate content hash for deduplication (hex string)
std::string GenerateContentHash(const std::string &content);

// Check if content-type matches pattern (supports wildcards like "text/*")
bool ContentTypeMatches(const std::string &content_type, const std::string &pattern);

// Check if content-type is acceptable (matches accept list, not in reject list).
// A missing content-type is accepted.
bool IsContentTypeAcceptable(const std::string &content_type,
                             const std::string &accept_types,
                             const std::string &reject_types);

} // namespace webcrawl

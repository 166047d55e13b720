#include "crawler_utils.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <sstream>

namespace webcrawl {

//===--------------------------------------------------------------------===//
// Error Classification
//===--------------------------------------------------------------------===//

const char *ErrorTypeToString(CrawlErrorType type) {
	switch (type) {
		case CrawlErrorType::NONE: return "";
		case CrawlErrorType::NETWORK_TIMEOUT: return "network_timeout";
		case CrawlErrorType::NETWORK_DNS_FAILURE: return "network_dns_failure";
		case CrawlErrorType::NETWORK_CONNECTION_REFUSED: return "network_connection_refused";
		case CrawlErrorType::NETWORK_SSL_ERROR: return "network_ssl_error";
		case CrawlErrorType::NETWORK_OTHER: return "network_error";
		case CrawlErrorType::HTTP_CLIENT_ERROR: return "http_client_error";
		case CrawlErrorType::HTTP_SERVER_ERROR: return "http_server_error";
		case CrawlErrorType::HTTP_RATE_LIMITED: return "http_rate_limited";
		case CrawlErrorType::CONTENT_TOO_LARGE: return "content_too_large";
		case CrawlErrorType::CONTENT_TYPE_REJECTED: return "content_type_rejected";
		case CrawlErrorType::PARSE_ERROR: return "parse_error";
		default: return "unknown";
	}
}

CrawlErrorType ErrorTypeFromString(const std::string &name) {
	static const CrawlErrorType all_types[] = {
	    CrawlErrorType::NETWORK_TIMEOUT,     CrawlErrorType::NETWORK_DNS_FAILURE,
	    CrawlErrorType::NETWORK_CONNECTION_REFUSED, CrawlErrorType::NETWORK_SSL_ERROR,
	    CrawlErrorType::NETWORK_OTHER,       CrawlErrorType::HTTP_CLIENT_ERROR,
	    CrawlErrorType::HTTP_SERVER_ERROR,   CrawlErrorType::HTTP_RATE_LIMITED,
	    CrawlErrorType::CONTENT_TOO_LARGE,   CrawlErrorType::CONTENT_TYPE_REJECTED,
	    CrawlErrorType::PARSE_ERROR};
	for (auto type : all_types) {
		if (name == ErrorTypeToString(type)) {
			return type;
		}
	}
	return CrawlErrorType::NONE;
}

CrawlErrorType ClassifyError(int status_code, const std::string &error_msg) {
	if (status_code == 429) return CrawlErrorType::HTTP_RATE_LIMITED;
	if (status_code >= 500 && status_code < 600) return CrawlErrorType::HTTP_SERVER_ERROR;
	if (status_code >= 400 && status_code < 500) return CrawlErrorType::HTTP_CLIENT_ERROR;
	if (status_code <= 0) {
		// Transport error - classify from curl's message
		if (error_msg.find("timeout") != std::string::npos ||
		    error_msg.find("Timeout") != std::string::npos ||
		    error_msg.find("timed out") != std::string::npos) {
			return CrawlErrorType::NETWORK_TIMEOUT;
		}
		if (error_msg.find("resolve") != std::string::npos ||
		    error_msg.find("DNS") != std::string::npos) {
			return CrawlErrorType::NETWORK_DNS_FAILURE;
		}
		if (error_msg.find("SSL") != std::string::npos ||
		    error_msg.find("certificate") != std::string::npos) {
			return CrawlErrorType::NETWORK_SSL_ERROR;
		}
		if (error_msg.find("refused") != std::string::npos ||
		    error_msg.find("connect") != std::string::npos) {
			return CrawlErrorType::NETWORK_CONNECTION_REFUSED;
		}
		return CrawlErrorType::NETWORK_OTHER;
	}
	return CrawlErrorType::NONE;
}

bool IsNetworkError(CrawlErrorType type) {
	switch (type) {
		case CrawlErrorType::NETWORK_TIMEOUT:
		case CrawlErrorType::NETWORK_DNS_FAILURE:
		case CrawlErrorType::NETWORK_CONNECTION_REFUSED:
		case CrawlErrorType::NETWORK_SSL_ERROR:
		case CrawlErrorType::NETWORK_OTHER:
			return true;
		default:
			return false;
	}
}

bool IsHttpError(CrawlErrorType type) {
	return type == CrawlErrorType::HTTP_CLIENT_ERROR ||
	       type == CrawlErrorType::HTTP_SERVER_ERROR ||
	       type == CrawlErrorType::HTTP_RATE_LIMITED;
}

bool IsRetryableError(CrawlErrorType type) {
	// SSL failures do not heal on their own
	if (type == CrawlErrorType::NETWORK_SSL_ERROR) {
		return false;
	}
	return IsNetworkError(type) ||
	       type == CrawlErrorType::HTTP_SERVER_ERROR ||
	       type == CrawlErrorType::HTTP_RATE_LIMITED;
}

//===--------------------------------------------------------------------===//
// Compression Utilities
//===--------------------------------------------------------------------===//

std::string DecompressGzip(const std::string &compressed_data) {
	if (compressed_data.empty()) {
		return "";
	}

	z_stream zs;
	memset(&zs, 0, sizeof(zs));

	// 16+MAX_WBITS selects the gzip wrapper
	if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) {
		return "";
	}

	zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed_data.data()));
	zs.avail_in = static_cast<uInt>(compressed_data.size());

	std::string decompressed;
	char buffer[32768];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(buffer);
		zs.avail_out = sizeof(buffer);

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret != Z_OK && ret != Z_STREAM_END) {
			// Z_BUF_ERROR with no input left means a truncated stream
			inflateEnd(&zs);
			return "";
		}

		size_t have = sizeof(buffer) - zs.avail_out;
		decompressed.append(buffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

bool IsGzippedData(const std::string &data) {
	return data.size() >= 2 &&
	       static_cast<unsigned char>(data[0]) == 0x1f &&
	       static_cast<unsigned char>(data[1]) == 0x8b;
}

//===--------------------------------------------------------------------===//
// Backoff
//===--------------------------------------------------------------------===//

std::chrono::milliseconds ExponentialBackoff(const RetryConfig &config, int attempt) {
	if (attempt <= 1) {
		return std::chrono::milliseconds(std::min(config.initial_backoff_ms, config.max_backoff_ms));
	}
	double delay = config.initial_backoff_ms * std::pow(config.backoff_multiplier, attempt - 1);
	if (delay > config.max_backoff_ms) {
		delay = config.max_backoff_ms;
	}
	return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

//===--------------------------------------------------------------------===//
// Date/Time Utilities
//===--------------------------------------------------------------------===//

std::string FormatTimestamp(std::chrono::system_clock::time_point time) {
	auto time_t_value = std::chrono::system_clock::to_time_t(time);
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;

	struct tm gmt;
	gmtime_r(&time_t_value, &gmt);

	char buf[32];
	strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &gmt);

	char result[40];
	snprintf(result, sizeof(result), "%s.%03d", buf, static_cast<int>(millis));
	return std::string(result);
}

std::string CurrentTimestamp() {
	return FormatTimestamp(std::chrono::system_clock::now());
}

//===--------------------------------------------------------------------===//
// Content Utilities
//===--------------------------------------------------------------------===//

std::string GenerateContentHash(const std::string &content) {
	if (content.empty()) {
		return "";
	}
	std::hash<std::string> hasher;
	size_t hash_value = hasher(content);
	char buf[17];
	snprintf(buf, sizeof(buf), "%016zx", hash_value);
	return std::string(buf);
}

static std::string TrimAndLower(const std::string &value) {
	size_t start = value.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) {
		return "";
	}
	size_t end = value.find_last_not_of(" \t\r\n");
	std::string result = value.substr(start, end - start + 1);
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

bool ContentTypeMatches(const std::string &content_type, const std::string &pattern) {
	if (pattern.empty()) {
		return false;
	}
	// Drop parameters such as "; charset=utf-8"
	std::string ct = content_type;
	size_t semicolon = ct.find(';');
	if (semicolon != std::string::npos) {
		ct = ct.substr(0, semicolon);
	}
	std::string ct_lower = TrimAndLower(ct);
	std::string pat_lower = TrimAndLower(pattern);

	// Wildcard such as "text/*"
	if (pat_lower.length() >= 2 && pat_lower.substr(pat_lower.length() - 2) == "/*") {
		std::string prefix = pat_lower.substr(0, pat_lower.length() - 1);
		return ct_lower.find(prefix) == 0;
	}

	return ct_lower == pat_lower;
}

static bool MatchesAnyPattern(const std::string &content_type, const std::string &patterns) {
	std::istringstream stream(patterns);
	std::string pattern;
	while (std::getline(stream, pattern, ',')) {
		if (ContentTypeMatches(content_type, pattern)) {
			return true;
		}
	}
	return false;
}

bool IsContentTypeAcceptable(const std::string &content_type,
                             const std::string &accept_types,
                             const std::string &reject_types) {
	if (TrimAndLower(content_type).empty()) {
		return true;
	}
	if (!accept_types.empty() && !MatchesAnyPattern(content_type, accept_types)) {
		return false;
	}
	if (!reject_types.empty() && MatchesAnyPattern(content_type, reject_types)) {
		return false;
	}
	return true;
}

} // namespace webcrawl

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace webcrawl {

struct HttpResponse {
	int status_code = 0;
	std::string body;
	std::string content_type;
	std::string error;
	int64_t elapsed_ms = 0;
	bool success = false;         // 2xx received and body within the size cap
	bool too_large = false;       // body exceeded max_response_bytes; body is empty
	std::string final_url;        // Final URL after redirects
};

struct HttpRequestOptions {
	std::string user_agent;
	int64_t timeout_ms = 10000;
	int64_t connect_timeout_ms = 5000;
	int64_t max_response_bytes = 0;  // 0 = unlimited
	bool compress = true;
};

// Thread-safe connection pool for curl handles
class HttpConnectionPool {
public:
	HttpConnectionPool();
	~HttpConnectionPool();

	// Disable copy/move
	HttpConnectionPool(const HttpConnectionPool &) = delete;
	HttpConnectionPool &operator=(const HttpConnectionPool &) = delete;

	// Get a curl easy handle (reuses from pool or creates new)
	CURL *AcquireHandle();
	// Return handle to pool for reuse
	void ReleaseHandle(CURL *handle);

private:
	std::mutex pool_mutex_;
	std::vector<CURL *> available_handles_;
};

// Global connection pool access
HttpConnectionPool &GetConnectionPool();

// Call once from main() before any worker thread starts
void InitializeHttpClient();
// Call once after all workers have been joined
void CleanupHttpClient();

class HttpClient {
public:
	// Single GET attempt. Never retries; transport failures are reported in
	// HttpResponse::error with status_code 0.
	static HttpResponse Get(const std::string &url, const HttpRequestOptions &options);
};

} // namespace webcrawl

#include "http_client.hpp"
#include <chrono>

namespace webcrawl {

static constexpr size_t MAX_POOLED_HANDLES = 100;

// Global connection pool (singleton)
static HttpConnectionPool *g_connection_pool = nullptr;
static std::mutex g_pool_init_mutex;

HttpConnectionPool &GetConnectionPool() {
	std::lock_guard<std::mutex> lock(g_pool_init_mutex);
	if (!g_connection_pool) {
		g_connection_pool = new HttpConnectionPool();
	}
	return *g_connection_pool;
}

void InitializeHttpClient() {
	curl_global_init(CURL_GLOBAL_DEFAULT);
	GetConnectionPool();
}

void CleanupHttpClient() {
	{
		std::lock_guard<std::mutex> lock(g_pool_init_mutex);
		delete g_connection_pool;
		g_connection_pool = nullptr;
	}
	curl_global_cleanup();
}

HttpConnectionPool::HttpConnectionPool() {
}

HttpConnectionPool::~HttpConnectionPool() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	for (CURL *handle : available_handles_) {
		curl_easy_cleanup(handle);
	}
	available_handles_.clear();
}

CURL *HttpConnectionPool::AcquireHandle() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (!available_handles_.empty()) {
		CURL *handle = available_handles_.back();
		available_handles_.pop_back();
		curl_easy_reset(handle);  // Reset options but keep connection alive
		return handle;
	}
	return curl_easy_init();
}

void HttpConnectionPool::ReleaseHandle(CURL *handle) {
	if (!handle) return;
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (available_handles_.size() < MAX_POOLED_HANDLES) {
		available_handles_.push_back(handle);
	} else {
		curl_easy_cleanup(handle);
	}
}

// Callback data for the response body
struct WriteData {
	std::string *body;
	int64_t max_bytes;
	bool exceeded;
};

// Write callback for response body. Returning less than the chunk size aborts
// the transfer, which is how the size cap stops a runaway download.
static size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
	size_t total_size = size * nmemb;
	WriteData *data = static_cast<WriteData *>(userp);
	if (data->max_bytes > 0 &&
	    static_cast<int64_t>(data->body->size() + total_size) > data->max_bytes) {
		data->exceeded = true;
		return 0;
	}
	data->body->append(static_cast<char *>(contents), total_size);
	return total_size;
}

HttpResponse HttpClient::Get(const std::string &url, const HttpRequestOptions &options) {
	HttpResponse response;

	auto &pool = GetConnectionPool();
	CURL *curl = pool.AcquireHandle();
	if (!curl) {
		response.error = "Failed to acquire curl handle";
		return response;
	}

	std::string body;
	WriteData write_data{&body, options.max_response_bytes, false};
	char error_buffer[CURL_ERROR_SIZE];
	error_buffer[0] = '\0';

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
	curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
	curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_data);
	curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
	// Worker threads must not receive SIGALRM from the resolver
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	if (!options.user_agent.empty()) {
		curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
	}
	if (options.compress) {
		// Empty string = every encoding this libcurl supports
		curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
	}
	if (options.max_response_bytes > 0) {
		// Refuses up front when Content-Length already announces an oversized body
		curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(options.max_response_bytes));
	}

	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeout_ms));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout_ms));

	// Follow redirects
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

	auto start = std::chrono::steady_clock::now();
	CURLcode res = curl_easy_perform(curl);
	response.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
	    std::chrono::steady_clock::now() - start).count();

	long status_code = 0;
	curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
	response.status_code = static_cast<int>(status_code);

	char *effective_url = nullptr;
	curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
	if (effective_url) {
		response.final_url = effective_url;
	}

	char *content_type = nullptr;
	curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type);
	if (content_type) {
		response.content_type = content_type;
	}

	if (write_data.exceeded || res == CURLE_FILESIZE_EXCEEDED) {
		response.too_large = true;
		response.error = "Response larger than " + std::to_string(options.max_response_bytes) + " bytes";
	} else if (res == CURLE_OK) {
		response.body = std::move(body);
		response.success = response.status_code >= 200 && response.status_code < 300;
		if (!response.success) {
			response.error = "HTTP " + std::to_string(response.status_code);
		}
	} else {
		response.error = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(res);
		// A partial transfer is not an HTTP response we can use
		response.status_code = 0;
	}

	pool.ReleaseHandle(curl);
	return response;
}

} // namespace webcrawl

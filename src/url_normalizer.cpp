#include "url_normalizer.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>

namespace webcrawl {

// RAII wrapper for a curl URL handle
class CurlUrlGuard {
public:
	CurlUrlGuard() : handle_(curl_url()) {}
	~CurlUrlGuard() {
		if (handle_) {
			curl_url_cleanup(handle_);
		}
	}

	CurlUrlGuard(const CurlUrlGuard &) = delete;
	CurlUrlGuard &operator=(const CurlUrlGuard &) = delete;

	CURLU *get() const { return handle_; }
	explicit operator bool() const { return handle_ != nullptr; }

private:
	CURLU *handle_;
};

// Helper: Convert string to lowercase
static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

// Helper: Trim whitespace
static std::string Trim(const std::string &str) {
	size_t start = 0;
	size_t end = str.length();
	while (start < end && std::isspace(static_cast<unsigned char>(str[start]))) {
		start++;
	}
	while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
		end--;
	}
	return str.substr(start, end - start);
}

// Browsers drop tabs and newlines inside href values and send spaces encoded
static std::string CleanHref(const std::string &href) {
	std::string result;
	result.reserve(href.size());
	for (char c : href) {
		if (c == '\t' || c == '\n' || c == '\r') {
			continue;
		}
		if (c == ' ') {
			result += "%20";
		} else {
			result += c;
		}
	}
	return result;
}

// Scheme of an absolute reference, lower-cased. Empty for relative references.
static std::string ExtractScheme(const std::string &link) {
	for (size_t i = 0; i < link.size(); i++) {
		unsigned char c = static_cast<unsigned char>(link[i]);
		if (c == ':') {
			return i > 0 ? ToLower(link.substr(0, i)) : "";
		}
		bool valid = std::isalpha(c) || (i > 0 && (std::isdigit(c) || c == '+' || c == '-' || c == '.'));
		if (!valid) {
			return "";
		}
	}
	return "";
}

static std::string GetPart(CURLU *handle, CURLUPart part) {
	char *value = nullptr;
	if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || !value) {
		return "";
	}
	std::string result(value);
	curl_free(value);
	return result;
}

UrlNormalizer::UrlNormalizer(const CrawlerConfig &config, const std::string &seed_url)
    : policy_(config.domain_policy), allow_subdomains_(config.allow_subdomains),
      skip_extensions_(config.skip_extensions) {
	std::string canonical_seed = Canonicalize(seed_url);
	if (!canonical_seed.empty()) {
		seed_host_ = ExtractDomain(canonical_seed);
	}
}

// Resolve raw_link against source_url into url. False for empty, fragment-only,
// overlong, non-HTTP(S), host-less or malformed links.
static bool ParseLink(const std::string &raw_link, const std::string &source_url, CurlUrlGuard &url) {
	std::string link = CleanHref(Trim(raw_link));
	if (link.empty() || link[0] == '#' || link.length() > MAX_URL_LENGTH) {
		return false;
	}

	// Reject mailto:, javascript:, tel:, data:, ftp: ... before curl sees them
	std::string scheme = ExtractScheme(link);
	if (!scheme.empty() && scheme != "http" && scheme != "https") {
		return false;
	}
	if (scheme.empty() && source_url.empty()) {
		return false;  // Relative reference without a base
	}

	if (!url) {
		return false;
	}
	if (scheme.empty()) {
		// Relative reference - curl resolves it against the URL already set
		if (curl_url_set(url.get(), CURLUPART_URL, source_url.c_str(), 0) != CURLUE_OK) {
			return false;
		}
	}
	if (curl_url_set(url.get(), CURLUPART_URL, link.c_str(), 0) != CURLUE_OK) {
		return false;
	}

	std::string result_scheme = ToLower(GetPart(url.get(), CURLUPART_SCHEME));
	if (result_scheme != "http" && result_scheme != "https") {
		return false;
	}
	return !GetPart(url.get(), CURLUPART_HOST).empty();
}

std::string UrlNormalizer::Resolve(const std::string &raw_link, const std::string &source_url) {
	CurlUrlGuard url;
	if (!ParseLink(raw_link, source_url, url)) {
		return "";
	}
	std::string resolved = GetPart(url.get(), CURLUPART_URL);
	if (resolved.length() > MAX_URL_LENGTH) {
		return "";
	}
	return resolved;
}

std::string UrlNormalizer::Canonicalize(const std::string &raw_link, const std::string &source_url) {
	CurlUrlGuard url;
	if (!ParseLink(raw_link, source_url, url)) {
		return "";
	}

	std::string result_scheme = ToLower(GetPart(url.get(), CURLUPART_SCHEME));
	std::string host = ToLower(GetPart(url.get(), CURLUPART_HOST));

	// Only an explicitly given port is returned; drop it when it is the default one
	std::string port = GetPart(url.get(), CURLUPART_PORT);
	if ((result_scheme == "http" && port == "80") || (result_scheme == "https" && port == "443")) {
		port.clear();
	}

	std::string path = GetPart(url.get(), CURLUPART_PATH);
	if (path.empty() || path[0] != '/') {
		path = "/" + path;
	}
	while (path.length() > 1 && path.back() == '/') {
		path.pop_back();
	}

	std::string query = GetPart(url.get(), CURLUPART_QUERY);

	std::string canonical = result_scheme + "://" + host;
	if (!port.empty()) {
		canonical += ":" + port;
	}
	canonical += path;
	if (!query.empty()) {
		canonical += "?" + query;
	}

	if (canonical.length() > MAX_URL_LENGTH) {
		return "";
	}
	return canonical;
}

std::string UrlNormalizer::Normalize(const std::string &raw_link, const std::string &source_url) const {
	std::string canonical = Canonicalize(raw_link, source_url);
	if (canonical.empty()) {
		return "";
	}

	if (policy_ == DomainPolicy::SAME_DOMAIN && !seed_host_.empty() &&
	    !IsSameDomain(ExtractDomain(canonical), seed_host_, allow_subdomains_)) {
		return "";
	}

	if (HasSkippedExtension(canonical, skip_extensions_)) {
		return "";
	}

	return canonical;
}

std::string UrlNormalizer::ExtractDomain(const std::string &url) {
	size_t proto_end = url.find("://");
	if (proto_end == std::string::npos) {
		return "";
	}

	size_t domain_start = proto_end + 3;
	size_t domain_end;
	if (domain_start < url.length() && url[domain_start] == '[') {
		// IPv6 literal keeps its brackets
		domain_end = url.find(']', domain_start);
		domain_end = (domain_end == std::string::npos) ? url.length() : domain_end + 1;
	} else {
		domain_end = url.find_first_of(":/?#", domain_start);
		if (domain_end == std::string::npos) {
			domain_end = url.length();
		}
	}

	return ToLower(url.substr(domain_start, domain_end - domain_start));
}

std::string UrlNormalizer::ExtractBaseDomain(const std::string &hostname) {
	std::string domain = ToLower(hostname);
	// Remove www. prefix
	if (domain.length() > 4 && domain.substr(0, 4) == "www.") {
		domain = domain.substr(4);
	}
	return domain;
}

bool UrlNormalizer::IsSameDomain(const std::string &host, const std::string &base_domain, bool allow_subdomains) {
	if (host.empty()) {
		return false;
	}

	std::string base = ExtractBaseDomain(base_domain);
	std::string host_base = ExtractBaseDomain(host);

	if (host_base == base) {
		return true;
	}

	if (allow_subdomains) {
		// Check if host ends with .base_domain
		std::string suffix = "." + base;
		if (host.length() > suffix.length() &&
		    host.compare(host.length() - suffix.length(), suffix.length(), suffix) == 0) {
			return true;
		}
	}

	return false;
}

bool UrlNormalizer::HasSkippedExtension(const std::string &url, const std::vector<std::string> &extensions) {
	if (extensions.empty()) {
		return false;
	}

	size_t proto_end = url.find("://");
	size_t path_start = url.find('/', proto_end == std::string::npos ? 0 : proto_end + 3);
	if (path_start == std::string::npos) {
		return false;
	}
	size_t path_end = url.find_first_of("?#", path_start);
	std::string path = ToLower(url.substr(path_start, path_end == std::string::npos ? std::string::npos
	                                                                                 : path_end - path_start));

	for (const auto &extension : extensions) {
		std::string ext = ToLower(extension);
		if (!ext.empty() && path.length() >= ext.length() &&
		    path.compare(path.length() - ext.length(), ext.length(), ext) == 0) {
			return true;
		}
	}
	return false;
}

} // namespace webcrawl

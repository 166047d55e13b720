#pragma once

#include "crawler_config.hpp"

#include <string>
#include <vector>

namespace webcrawl {

static constexpr size_t MAX_URL_LENGTH = 2048;

//===--------------------------------------------------------------------===//
// UrlNormalizer - canonical absolute URLs for deduplication
//===--------------------------------------------------------------------===//
// Canonical form: lower-case scheme and host, no default port, no fragment,
// no empty query, dot segments resolved, no trailing slash except the root "/".
// All methods are const and safe to call from any number of workers.

class UrlNormalizer {
public:
	// The seed URL fixes the home host for DomainPolicy::SAME_DOMAIN
	UrlNormalizer(const CrawlerConfig &config, const std::string &seed_url);

	// Canonicalize raw_link (resolved against source_url) and apply the crawl policy
	// (domain and skipped extensions). Returns empty string if the link is rejected.
	std::string Normalize(const std::string &raw_link, const std::string &source_url = "") const;

	const std::string &SeedHost() const {
		return seed_host_;
	}

	// Pure syntactic canonicalization, no crawl policy. Returns empty string for
	// malformed, fragment-only or non-HTTP(S) links.
	static std::string Canonicalize(const std::string &raw_link, const std::string &source_url = "");

	// Absolute form of raw_link against source_url with the path kept as written,
	// for use as a resolution base (<base href="/dir/"> keeps its trailing slash).
	// Same rejections as Canonicalize.
	static std::string Resolve(const std::string &raw_link, const std::string &source_url = "");

	// Extract lower-case host from URL (without port)
	static std::string ExtractDomain(const std::string &url);

	// Extract base domain (removes www. prefix)
	static std::string ExtractBaseDomain(const std::string &hostname);

	// Check if host belongs to base domain (or an allowed subdomain)
	static bool IsSameDomain(const std::string &host, const std::string &base_domain, bool allow_subdomains);

	// Check if the URL path ends with one of the extensions (case-insensitive)
	static bool HasSkippedExtension(const std::string &url, const std::vector<std::string> &extensions);

private:
	DomainPolicy policy_;
	bool allow_subdomains_;
	std::vector<std::string> skip_extensions_;
	std::string seed_host_;
};

} // namespace webcrawl

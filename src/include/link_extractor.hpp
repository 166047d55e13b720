#pragma once

#include <string>
#include <vector>

namespace webcrawl {

struct LinkExtraction {
	bool ok = false;
	std::vector<std::string> hrefs;  // raw href values, document order, no duplicates
	std::string base_href;           // <base href> if the page declares one
	std::string error;               // set when ok == false
};

// Pulls anchor targets out of an HTML document with libxml2's recovering parser.
// Stateless; one instance may be shared by every worker.
class LinkExtractor {
public:
	explicit LinkExtractor(bool respect_nofollow = false) : respect_nofollow_(respect_nofollow) {
	}

	// Fails only for bodies that are not text (NUL bytes) or that libxml2
	// cannot turn into a document at all. An empty body is a page without links.
	LinkExtraction ExtractLinks(const std::string &html) const;

private:
	bool respect_nofollow_;
};

} // namespace webcrawl

#include "link_extractor.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/tree.h>
#include <algorithm>
#include <cctype>
#include <climits>
#include <unordered_set>

namespace webcrawl {

// RAII wrapper for xmlDoc
class HtmlDocGuard {
public:
	explicit HtmlDocGuard(xmlDocPtr doc) : doc_(doc) {}
	~HtmlDocGuard() {
		if (doc_) {
			xmlFreeDoc(doc_);
		}
	}
	HtmlDocGuard(const HtmlDocGuard &) = delete;
	HtmlDocGuard &operator=(const HtmlDocGuard &) = delete;

	xmlDocPtr get() const { return doc_; }
	operator bool() const { return doc_ != nullptr; }
private:
	xmlDocPtr doc_;
};

// Helper: get attribute value from xmlNode, returns empty string if not found
static std::string GetAttribute(xmlNodePtr node, const char *attr) {
	xmlChar *value = xmlGetProp(node, BAD_CAST attr);
	if (!value) {
		return "";
	}
	std::string result(reinterpret_cast<char*>(value));
	xmlFree(value);
	return result;
}

static std::string ToLower(const std::string &str) {
	std::string result = str;
	std::transform(result.begin(), result.end(), result.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	return result;
}

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

// Check a space-separated token list (rel, robots content) for a token
static bool HasToken(const std::string &list, const std::string &token) {
	std::string lower = ToLower(list);
	size_t pos = 0;
	while (pos < lower.size()) {
		while (pos < lower.size() && (std::isspace(static_cast<unsigned char>(lower[pos])) || lower[pos] == ',')) {
			pos++;
		}
		size_t end = pos;
		while (end < lower.size() && !std::isspace(static_cast<unsigned char>(lower[end])) && lower[end] != ',') {
			end++;
		}
		if (end > pos && lower.compare(pos, end - pos, token) == 0 && end - pos == token.size()) {
			return true;
		}
		pos = end;
	}
	return false;
}

struct WalkState {
	bool respect_nofollow;
	bool page_nofollow = false;
	std::unordered_set<std::string> seen;
	LinkExtraction *out;
};

static void WalkNodes(xmlNodePtr node, WalkState &state) {
	for (xmlNodePtr cur = node; cur; cur = cur->next) {
		if (cur->type != XML_ELEMENT_NODE) {
			continue;
		}
		if (xmlStrcasecmp(cur->name, BAD_CAST "a") == 0) {
			xmlChar *raw = xmlGetProp(cur, BAD_CAST "href");
			if (raw) {
				std::string href = Trim(reinterpret_cast<char*>(raw));
				xmlFree(raw);
				bool nofollow = state.respect_nofollow && HasToken(GetAttribute(cur, "rel"), "nofollow");
				if (!href.empty() && !nofollow && state.seen.insert(href).second) {
					state.out->hrefs.push_back(std::move(href));
				}
			}
		} else if (xmlStrcasecmp(cur->name, BAD_CAST "base") == 0) {
			// First <base href> wins
			if (state.out->base_href.empty()) {
				state.out->base_href = Trim(GetAttribute(cur, "href"));
			}
		} else if (xmlStrcasecmp(cur->name, BAD_CAST "meta") == 0) {
			if (state.respect_nofollow && ToLower(GetAttribute(cur, "name")) == "robots" &&
			    HasToken(GetAttribute(cur, "content"), "nofollow")) {
				state.page_nofollow = true;
			}
		}
		if (cur->children) {
			WalkNodes(cur->children, state);
		}
	}
}

LinkExtraction LinkExtractor::ExtractLinks(const std::string &html) const {
	LinkExtraction result;
	if (html.empty()) {
		result.ok = true;
		return result;
	}
	if (html.find('\0') != std::string::npos) {
		result.error = "Body contains NUL bytes, not an HTML document";
		return result;
	}
	if (html.size() > static_cast<size_t>(INT_MAX)) {
		result.error = "Body too large to parse";
		return result;
	}

	HtmlDocGuard doc(htmlReadMemory(
		html.c_str(),
		static_cast<int>(html.size()),
		nullptr,
		"UTF-8",
		HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET
	));
	if (!doc) {
		result.error = "libxml2 could not parse the document";
		return result;
	}

	xmlNodePtr root = xmlDocGetRootElement(doc.get());
	if (!root) {
		// Whitespace or comments only
		result.ok = true;
		return result;
	}

	WalkState state;
	state.respect_nofollow = respect_nofollow_;
	state.out = &result;
	WalkNodes(root, state);

	if (state.page_nofollow) {
		result.hrefs.clear();
	}
	result.ok = true;
	return result;
}

} // namespace webcrawl

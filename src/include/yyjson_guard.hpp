#pragma once

// RAII wrappers for yyjson allocations
// Include this header in files that use yyjson to get automatic memory management

#include <yyjson.h>

#include <cstdlib>
#include <string>

namespace webcrawl {

// RAII wrapper for yyjson_doc (immutable document)
class YyjsonDocGuard {
public:
	explicit YyjsonDocGuard(yyjson_doc *doc) : doc_(doc) {}
	~YyjsonDocGuard() { if (doc_) yyjson_doc_free(doc_); }

	// Non-copyable
	YyjsonDocGuard(const YyjsonDocGuard&) = delete;
	YyjsonDocGuard& operator=(const YyjsonDocGuard&) = delete;

	yyjson_doc* get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }

private:
	yyjson_doc *doc_;
};

// RAII wrapper for yyjson_mut_doc (mutable document)
class YyjsonMutDocGuard {
public:
	explicit YyjsonMutDocGuard(yyjson_mut_doc *doc) : doc_(doc) {}
	~YyjsonMutDocGuard() { if (doc_) yyjson_mut_doc_free(doc_); }

	// Non-copyable
	YyjsonMutDocGuard(const YyjsonMutDocGuard&) = delete;
	YyjsonMutDocGuard& operator=(const YyjsonMutDocGuard&) = delete;

	yyjson_mut_doc* get() const { return doc_; }
	explicit operator bool() const { return doc_ != nullptr; }

private:
	yyjson_mut_doc *doc_;
};

// Serialize a mutable document and release yyjson's buffer. Empty string on failure.
inline std::string WriteJson(const YyjsonMutDocGuard &doc, yyjson_write_flag flags = 0) {
	size_t len = 0;
	char *json = yyjson_mut_write(doc.get(), flags, &len);
	if (!json) {
		return "";
	}
	std::string result(json, len);
	free(json);
	return result;
}

} // namespace webcrawl

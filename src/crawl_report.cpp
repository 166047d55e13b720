#include "crawl_report.hpp"
#include "yyjson_guard.hpp"
#include "duckdb.hpp"

#include <cmath>
#include <fstream>
#include <iostream>

namespace webcrawl {

std::string CrawlReportToJson(const CrawlReport &report, bool pretty) {
	YyjsonMutDocGuard doc(yyjson_mut_doc_new(nullptr));
	yyjson_mut_val *root = yyjson_mut_obj(doc.get());
	yyjson_mut_doc_set_root(doc.get(), root);

	yyjson_mut_obj_add_strncpy(doc.get(), root, "base_url", report.base_url.c_str(), report.base_url.size());
	yyjson_mut_obj_add_int(doc.get(), root, "max_depth_reached", report.max_depth_reached);
	yyjson_mut_obj_add_int(doc.get(), root, "pages_crawled", report.pages_crawled);
	yyjson_mut_obj_add_int(doc.get(), root, "error_count", report.error_count);
	// Millisecond precision is all the wall clock measurement carries
	double duration = std::round(report.duration_seconds * 1000.0) / 1000.0;
	yyjson_mut_obj_add_real(doc.get(), root, "duration_seconds", duration);

	yyjson_mut_val *urls = yyjson_mut_arr(doc.get());
	for (const auto &url : report.visited_urls) {
		yyjson_mut_arr_add_strncpy(doc.get(), urls, url.c_str(), url.size());
	}
	yyjson_mut_obj_add_val(doc.get(), root, "visited_urls", urls);

	return WriteJson(doc, pretty ? YYJSON_WRITE_PRETTY_TWO_SPACES : 0);
}

void WriteReport(const CrawlReport &report, const std::string &path) {
	std::string json = CrawlReportToJson(report, true);
	if (path.empty()) {
		std::cout << json << std::endl;
		return;
	}
	std::ofstream out(path, std::ios::out | std::ios::trunc);
	if (!out) {
		throw duckdb::IOException("Cannot open report file '%s' for writing", path);
	}
	out << json << '\n';
	out.flush();
	if (!out) {
		throw duckdb::IOException("Failed to write report file '%s'", path);
	}
}

} // namespace webcrawl

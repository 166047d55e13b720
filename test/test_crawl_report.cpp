#include <gtest/gtest.h>
#include "crawl_report.hpp"
#include "yyjson_guard.hpp"
#include "duckdb.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace webcrawl;

static CrawlReport SampleReport() {
	CrawlReport report;
	report.base_url = "https://example.com/";
	report.max_depth_reached = 2;
	report.pages_crawled = 3;
	report.error_count = 1;
	report.duration_seconds = 1.23456;
	report.visited_urls = {"https://example.com/", "https://example.com/a", "https://example.com/b"};
	return report;
}

TEST(CrawlReportTest, JsonFields) {
	std::string json = CrawlReportToJson(SampleReport(), false);
	YyjsonDocGuard doc(yyjson_read(json.c_str(), json.size(), 0));
	ASSERT_TRUE(doc);
	yyjson_val *root = yyjson_doc_get_root(doc.get());
	ASSERT_TRUE(yyjson_is_obj(root));

	EXPECT_STREQ(yyjson_get_str(yyjson_obj_get(root, "base_url")), "https://example.com/");
	EXPECT_EQ(yyjson_get_int(yyjson_obj_get(root, "max_depth_reached")), 2);
	EXPECT_EQ(yyjson_get_int(yyjson_obj_get(root, "pages_crawled")), 3);
	EXPECT_EQ(yyjson_get_int(yyjson_obj_get(root, "error_count")), 1);
	EXPECT_DOUBLE_EQ(yyjson_get_real(yyjson_obj_get(root, "duration_seconds")), 1.235);

	yyjson_val *urls = yyjson_obj_get(root, "visited_urls");
	ASSERT_TRUE(yyjson_is_arr(urls));
	EXPECT_EQ(yyjson_arr_size(urls), 3u);
	EXPECT_STREQ(yyjson_get_str(yyjson_arr_get(urls, 1)), "https://example.com/a");
}

TEST(CrawlReportTest, PrettyPrintUsesTwoSpaces) {
	std::string json = CrawlReportToJson(SampleReport(), true);
	EXPECT_NE(json.find("\n  \"base_url\""), std::string::npos);
	EXPECT_NE(json.find("\n    \"https://example.com/a\""), std::string::npos);
}

TEST(CrawlReportTest, WriteToFile) {
	auto path = std::filesystem::temp_directory_path() / "webcrawl_report_test.json";
	WriteReport(SampleReport(), path.string());

	std::ifstream in(path);
	std::stringstream buffer;
	buffer << in.rdbuf();
	EXPECT_EQ(buffer.str(), CrawlReportToJson(SampleReport(), true) + "\n");
	std::filesystem::remove(path);
}

TEST(CrawlReportTest, UnwritablePathThrows) {
	EXPECT_THROW(WriteReport(SampleReport(), "/nonexistent-dir/report.json"), duckdb::IOException);
}

#include <gtest/gtest.h>
#include "link_extractor.hpp"

using namespace webcrawl;

TEST(LinkExtractorTest, DocumentOrderWithoutDuplicates) {
	LinkExtractor extractor;
	auto result = extractor.ExtractLinks(
	    "<html><body><a href=\"/b\">B</a><p><a href='/a'>A</a></p><a href=\"/b\">again</a>"
	    "<A HREF=\"/c\">C</A></body></html>");
	ASSERT_TRUE(result.ok);
	ASSERT_EQ(result.hrefs.size(), 3u);
	EXPECT_EQ(result.hrefs[0], "/b");
	EXPECT_EQ(result.hrefs[1], "/a");
	EXPECT_EQ(result.hrefs[2], "/c");
}

TEST(LinkExtractorTest, OnlyAnchorsWithHrefCount) {
	LinkExtractor extractor;
	auto result = extractor.ExtractLinks(
	    "<html><head><link href=\"/style.css\" rel=\"stylesheet\"><script src=\"/app.js\"></script></head>"
	    "<body><a name=\"anchor\">no href</a><a href=\"\">empty</a><img src=\"/i.gif\">"
	    "<a href=\"  /spaced  \">s</a></body></html>");
	ASSERT_TRUE(result.ok);
	ASSERT_EQ(result.hrefs.size(), 1u);
	EXPECT_EQ(result.hrefs[0], "/spaced");
}

TEST(LinkExtractorTest, RecoversFromBrokenMarkup) {
	LinkExtractor extractor;
	auto result = extractor.ExtractLinks("<div><a href=\"/one\">one<div><a href=\"/two\">two</p></span>");
	ASSERT_TRUE(result.ok);
	ASSERT_EQ(result.hrefs.size(), 2u);
	EXPECT_EQ(result.hrefs[1], "/two");
}

TEST(LinkExtractorTest, EntitiesAreDecoded) {
	LinkExtractor extractor;
	auto result = extractor.ExtractLinks("<a href=\"/search?a=1&amp;b=2\">s</a>");
	ASSERT_TRUE(result.ok);
	ASSERT_EQ(result.hrefs.size(), 1u);
	EXPECT_EQ(result.hrefs[0], "/search?a=1&b=2");
}

TEST(LinkExtractorTest, EmptyBodyHasNoLinks) {
	LinkExtractor extractor;
	auto result = extractor.ExtractLinks("");
	EXPECT_TRUE(result.ok);
	EXPECT_TRUE(result.hrefs.empty());
}

TEST(LinkExtractorTest, BinaryBodyIsParseError) {
	LinkExtractor extractor;
	std::string body("\x89PNG\r\n\x1a\n", 8);
	body.push_back('\0');
	body += "<a href=\"/x\">";
	auto result = extractor.ExtractLinks(body);
	EXPECT_FALSE(result.ok);
	EXPECT_FALSE(result.error.empty());
	EXPECT_TRUE(result.hrefs.empty());
}

TEST(LinkExtractorTest, BaseHrefIsReported) {
	LinkExtractor extractor;
	auto result = extractor.ExtractLinks(
	    "<html><head><base href=\"http://cdn.example.com/root/\"></head><body><a href=\"x\">x</a></body></html>");
	ASSERT_TRUE(result.ok);
	EXPECT_EQ(result.base_href, "http://cdn.example.com/root/");
}

TEST(LinkExtractorTest, NofollowIgnoredByDefault) {
	LinkExtractor extractor;
	auto result = extractor.ExtractLinks("<a rel=\"nofollow\" href=\"/ad\">ad</a><a href=\"/ok\">ok</a>");
	ASSERT_TRUE(result.ok);
	EXPECT_EQ(result.hrefs.size(), 2u);
}

TEST(LinkExtractorTest, RelNofollowDropsAnchor) {
	LinkExtractor extractor(true);
	auto result = extractor.ExtractLinks(
	    "<a rel=\"external NoFollow\" href=\"/ad\">ad</a><a rel=\"noopener\" href=\"/ok\">ok</a>");
	ASSERT_TRUE(result.ok);
	ASSERT_EQ(result.hrefs.size(), 1u);
	EXPECT_EQ(result.hrefs[0], "/ok");
}

TEST(LinkExtractorTest, MetaRobotsNofollowDropsAllAnchors) {
	LinkExtractor extractor(true);
	auto result = extractor.ExtractLinks(
	    "<html><head><meta name=\"robots\" content=\"noindex, nofollow\"></head>"
	    "<body><a href=\"/a\">a</a></body></html>");
	ASSERT_TRUE(result.ok);
	EXPECT_TRUE(result.hrefs.empty());
}

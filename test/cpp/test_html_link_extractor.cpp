#include "link_extractor.hpp"
#include <gtest/gtest.h>

using namespace linkcheck;

TEST(HtmlExtractorTest, HrefAndSrcAttributes) {
	std::string html = "<html><body>\n"
	                   "<a href=\"https://a.example/\">A</a>\n"
	                   "<img src=\"/logo.png\" alt=\"logo\">\n"
	                   "</body></html>\n";
	auto links = LinkExtractor::ExtractHtmlLinks(html);
	ASSERT_EQ(links.size(), 2u);
	EXPECT_EQ(links[0].text, "https://a.example/");
	EXPECT_EQ(links[0].kind, LinkKind::HTML_HREF);
	EXPECT_EQ(links[0].line, 2u);
	EXPECT_EQ(links[1].text, "/logo.png");
	EXPECT_EQ(links[1].kind, LinkKind::HTML_SRC);
	EXPECT_EQ(links[1].line, 3u);
}

TEST(HtmlExtractorTest, ScriptAndStyleContentIgnored) {
	std::string html = "<html><head><script>var u = 'https://script.example/';</script>"
	                   "<style>body { background: url(https://style.example/bg.png); }</style></head>"
	                   "<body><p>plain</p></body></html>";
	EXPECT_TRUE(LinkExtractor::ExtractHtmlLinks(html).empty());
}

TEST(HtmlExtractorTest, BareUrlsInTextOutsideAnchors) {
	std::string html = "<p>Docs live at https://docs.example/start today.</p>"
	                   "<p><a href=\"https://a.example/\">https://a.example/</a></p>";
	auto links = LinkExtractor::ExtractHtmlLinks(html);
	ASSERT_EQ(links.size(), 2u);
	EXPECT_EQ(links[0].text, "https://docs.example/start");
	EXPECT_EQ(links[0].kind, LinkKind::BARE_URL);
	EXPECT_EQ(links[1].kind, LinkKind::HTML_HREF);
}

TEST(HtmlExtractorTest, RecoversFromBrokenMarkup) {
	std::string html = "<div><a href=\"page.html\">unclosed<p>text";
	auto links = LinkExtractor::ExtractHtmlLinks(html);
	ASSERT_EQ(links.size(), 1u);
	EXPECT_EQ(links[0].text, "page.html");
}

TEST(HtmlExtractorTest, EmptyDocument) {
	EXPECT_TRUE(LinkExtractor::ExtractHtmlLinks("").empty());
}

TEST(HtmlAnchorTest, IdsAndNamedAnchors) {
	auto anchors = LinkExtractor::ExtractHtmlAnchors("<h2 id=\"install\">Install</h2><a name=\"old\"></a>");
	EXPECT_TRUE(anchors.count("install"));
	EXPECT_TRUE(anchors.count("old"));
	EXPECT_FALSE(anchors.count("Install"));
}

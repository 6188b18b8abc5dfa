#include "url_resolver.hpp"
#include <gtest/gtest.h>

using namespace linkcheck;

static RawLink MakeLink(const std::string &text, LinkKind kind = LinkKind::MARKDOWN_INLINE) {
	RawLink link;
	link.text = text;
	link.kind = kind;
	return link;
}

TEST(UrlResolverTest, RelativeFileWithFragment) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("./foo.md#bar"), "docs/index.md");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.kind, TargetKind::FILE_PATH);
	EXPECT_EQ(resolution.target.uri, "docs/foo.md");
	EXPECT_EQ(resolution.target.fragment, "bar");
}

TEST(UrlResolverTest, ParentDirectoryIsNormalized) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("../README.md"), "docs/guide/index.md");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.uri, "docs/README.md");
}

TEST(UrlResolverTest, WebUrlKeepsQueryDropsFragment) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("HTTPS://Example.COM?q=1#section"), "README.md");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.kind, TargetKind::WEB_URL);
	EXPECT_EQ(resolution.target.uri, "https://example.com/?q=1");
	EXPECT_EQ(resolution.target.host, "example.com");
}

TEST(UrlResolverTest, RelativeReferenceAgainstUrlBase) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("../img/a.png"), "https://site.example/docs/guide/page.html");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.uri, "https://site.example/docs/img/a.png");
}

TEST(UrlResolverTest, SchemeRelativeUsesBaseScheme) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("//cdn.example/lib.js"), "http://site.example/");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.uri, "http://cdn.example/lib.js");
}

TEST(UrlResolverTest, MailTargets) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto mailto = resolver.Resolve(MakeLink("mailto:someone@example.com?subject=Hi"), "");
	ASSERT_TRUE(mailto.is_target);
	EXPECT_EQ(mailto.target.kind, TargetKind::MAIL_ADDRESS);
	EXPECT_EQ(mailto.target.uri, "someone@example.com");

	auto bare = resolver.Resolve(MakeLink("someone@example.com", LinkKind::BARE_MAIL), "");
	ASSERT_TRUE(bare.is_target);
	EXPECT_EQ(bare.target.kind, TargetKind::MAIL_ADDRESS);
}

TEST(UrlResolverTest, BareWwwGetsHttps) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("www.example.org", LinkKind::BARE_URL), "");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.uri, "https://www.example.org/");
}

TEST(UrlResolverTest, UnsupportedSchemeIsSkipped) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("ftp://files.example/x"), "README.md");
	ASSERT_FALSE(resolution.is_target);
	EXPECT_EQ(resolution.skip.reason, SkipReason::UNSUPPORTED_SCHEME);
}

TEST(UrlResolverTest, AnchorOnlyWithoutAnchorChecking) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("#usage"), "README.md");
	ASSERT_FALSE(resolution.is_target);
	EXPECT_EQ(resolution.skip.reason, SkipReason::ANCHOR_ONLY);
}

TEST(UrlResolverTest, AnchorOnlyWithAnchorChecking) {
	LinkCheckConfig config;
	config.check_anchors = true;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("#usage"), "docs/README.md");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.uri, "docs/README.md");
	EXPECT_EQ(resolution.target.fragment, "usage");
}

TEST(UrlResolverTest, RelativeWithoutBaseIsUnsupportedPath) {
	LinkCheckConfig config;
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("guide.md"), "");
	ASSERT_FALSE(resolution.is_target);
	EXPECT_EQ(resolution.skip.reason, SkipReason::UNSUPPORTED_PATH);
}

TEST(UrlResolverTest, RootRelativeNeedsRootDir) {
	LinkCheckConfig config;
	UrlResolver without_root(config);
	EXPECT_FALSE(without_root.Resolve(MakeLink("/docs/a.md"), "README.md").is_target);

	config.root_dir = "site";
	UrlResolver with_root(config);
	auto resolution = with_root.Resolve(MakeLink("/docs/a.md"), "README.md");
	ASSERT_TRUE(resolution.is_target);
	EXPECT_EQ(resolution.target.uri, "site/docs/a.md");
}

TEST(UrlResolverTest, ExclusionAppliesAfterNormalization) {
	LinkCheckConfig config;
	config.exclude_patterns.push_back("^https://example\\.com/");
	UrlResolver resolver(config);
	auto resolution = resolver.Resolve(MakeLink("HTTPS://EXAMPLE.COM"), "");
	ASSERT_FALSE(resolution.is_target);
	EXPECT_EQ(resolution.skip.reason, SkipReason::EXCLUDED_PATTERN);
	EXPECT_EQ(SkipReasonStatus(resolution.skip.reason), CheckStatus::EXCLUDED);
}

TEST(UrlResolverTest, ResolutionIsIdempotent) {
	LinkCheckConfig config;
	config.exclude_patterns.push_back("internal");
	UrlResolver resolver(config);
	for (const char *text : {"https://a.example/x", "https://internal.example/", "./b.md#c", "tel:123", "#top"}) {
		auto first = resolver.Resolve(MakeLink(text), "docs/index.md");
		auto second = resolver.Resolve(MakeLink(text), "docs/index.md");
		EXPECT_EQ(first.is_target, second.is_target) << text;
		EXPECT_EQ(first.target.uri, second.target.uri) << text;
		EXPECT_EQ(first.skip.reason, second.skip.reason) << text;
	}
}

TEST(ResolveUrlTest, Rfc3986Examples) {
	const std::string base = "http://a/b/c/d;p?q";
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "g"), "http://a/b/c/g");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "./g"), "http://a/b/c/g");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "g/"), "http://a/b/c/g/");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "/g"), "http://a/g");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "?y"), "http://a/b/c/d;p?y");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "g?y"), "http://a/b/c/g?y");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "#s"), "http://a/b/c/d;p?q#s");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, ".."), "http://a/b/");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "../g"), "http://a/b/g");
	EXPECT_EQ(UrlResolver::ResolveUrl(base, "../../../g"), "http://a/g");
}

TEST(NormalizePathTest, RemovesDotSegments) {
	EXPECT_EQ(UrlResolver::NormalizePath("/a/b/c/./../../g"), "/a/g");
	EXPECT_EQ(UrlResolver::NormalizePath("/a/./"), "/a/");
	EXPECT_EQ(UrlResolver::NormalizePath("/a/b/.."), "/a/");
}

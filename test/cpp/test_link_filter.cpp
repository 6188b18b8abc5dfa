#include "link_filter.hpp"
#include <gtest/gtest.h>

using namespace linkcheck;

static Target WebTarget(const std::string &uri, const std::string &host) {
	Target target;
	target.kind = TargetKind::WEB_URL;
	target.uri = uri;
	target.host = host;
	return target;
}

TEST(ClassifyHostTest, Ipv4Ranges) {
	EXPECT_EQ(ClassifyHost("127.0.0.1"), HostClass::LOOPBACK);
	EXPECT_EQ(ClassifyHost("10.1.2.3"), HostClass::PRIVATE);
	EXPECT_EQ(ClassifyHost("172.16.0.1"), HostClass::PRIVATE);
	EXPECT_EQ(ClassifyHost("172.32.0.1"), HostClass::PUBLIC);
	EXPECT_EQ(ClassifyHost("192.168.1.1"), HostClass::PRIVATE);
	EXPECT_EQ(ClassifyHost("169.254.10.10"), HostClass::LINK_LOCAL);
	EXPECT_EQ(ClassifyHost("8.8.8.8"), HostClass::PUBLIC);
}

TEST(ClassifyHostTest, Ipv6AndNames) {
	EXPECT_EQ(ClassifyHost("[::1]"), HostClass::LOOPBACK);
	EXPECT_EQ(ClassifyHost("[fe80::1]"), HostClass::LINK_LOCAL);
	EXPECT_EQ(ClassifyHost("[fd00::1]"), HostClass::PRIVATE);
	EXPECT_EQ(ClassifyHost("[::ffff:10.0.0.1]"), HostClass::PRIVATE);
	EXPECT_EQ(ClassifyHost("localhost"), HostClass::LOOPBACK);
	EXPECT_EQ(ClassifyHost("app.localhost"), HostClass::LOOPBACK);
	EXPECT_EQ(ClassifyHost("example.com"), HostClass::PUBLIC);
}

TEST(LinkFilterTest, NothingExcludedByDefault) {
	LinkCheckConfig config;
	LinkFilter filter(config);
	SkipReason reason;
	EXPECT_FALSE(filter.IsExcluded(WebTarget("http://127.0.0.1/", "127.0.0.1"), reason));
	EXPECT_FALSE(filter.IsExcluded(WebTarget("https://example.com/", "example.com"), reason));
}

TEST(LinkFilterTest, PrivateAddressExclusions) {
	LinkCheckConfig config;
	config.SetSkipPrivate(true);
	LinkFilter filter(config);
	SkipReason reason;
	ASSERT_TRUE(filter.IsExcluded(WebTarget("http://192.168.0.10/", "192.168.0.10"), reason));
	EXPECT_EQ(reason, SkipReason::PRIVATE_ADDRESS);
	ASSERT_TRUE(filter.IsExcluded(WebTarget("http://localhost:8080/", "localhost"), reason));
	EXPECT_EQ(reason, SkipReason::LOOPBACK_ADDRESS);
	ASSERT_TRUE(filter.IsExcluded(WebTarget("http://169.254.169.254/", "169.254.169.254"), reason));
	EXPECT_EQ(reason, SkipReason::LINK_LOCAL_ADDRESS);
}

TEST(LinkFilterTest, IncludeOverridesExclude) {
	LinkCheckConfig config;
	config.exclude_patterns = {"example\\.com"};
	config.include_patterns = {"example\\.com/keep"};
	LinkFilter filter(config);
	SkipReason reason;
	EXPECT_FALSE(filter.IsExcluded(WebTarget("https://example.com/keep/1", "example.com"), reason));
	ASSERT_TRUE(filter.IsExcluded(WebTarget("https://example.com/drop", "example.com"), reason));
	EXPECT_EQ(reason, SkipReason::NOT_INCLUDED);
}

TEST(LinkFilterTest, ExcludePatternMatchesAnywhere) {
	LinkCheckConfig config;
	config.exclude_patterns = {"linkedin"};
	LinkFilter filter(config);
	SkipReason reason;
	ASSERT_TRUE(filter.IsExcluded(WebTarget("https://www.linkedin.com/in/x", "www.linkedin.com"), reason));
	EXPECT_EQ(reason, SkipReason::EXCLUDED_PATTERN);
}

TEST(LinkFilterTest, SchemeFilter) {
	LinkCheckConfig config;
	config.allowed_schemes = {"https"};
	LinkFilter filter(config);
	SkipReason reason;
	EXPECT_FALSE(filter.IsExcluded(WebTarget("https://a.example/", "a.example"), reason));
	ASSERT_TRUE(filter.IsExcluded(WebTarget("http://a.example/", "a.example"), reason));
	EXPECT_EQ(reason, SkipReason::EXCLUDED_SCHEME);
}

TEST(LinkFilterTest, MailExclusionAndPatterns) {
	Target mail;
	mail.kind = TargetKind::MAIL_ADDRESS;
	mail.uri = "someone@example.com";
	EXPECT_EQ(LinkFilter::MatchText(mail), "mailto:someone@example.com");

	LinkCheckConfig config;
	config.exclude_mail = true;
	LinkFilter filter(config);
	SkipReason reason;
	ASSERT_TRUE(filter.IsExcluded(mail, reason));
	EXPECT_EQ(reason, SkipReason::EXCLUDED_MAIL);
}

TEST(LinkFilterTest, InvalidPatternThrows) {
	LinkCheckConfig config;
	config.exclude_patterns = {"(unclosed"};
	EXPECT_THROW(LinkFilter filter(config), ConfigError);
}

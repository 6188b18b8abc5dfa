#include "link_config.hpp"
#include "link_types.hpp"
#include "logger.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace linkcheck;

TEST(StatusCodeSetTest, ParsesSinglesAndRanges) {
	auto codes = StatusCodeSet::Parse("200..=299, 403,500-504");
	EXPECT_TRUE(codes.Contains(200));
	EXPECT_TRUE(codes.Contains(299));
	EXPECT_TRUE(codes.Contains(403));
	EXPECT_TRUE(codes.Contains(502));
	EXPECT_FALSE(codes.Contains(404));
	EXPECT_FALSE(codes.Contains(505));
}

TEST(StatusCodeSetTest, ExclusiveRangeEndsBeforeUpperBound) {
	auto codes = StatusCodeSet::Parse("200..300");
	EXPECT_TRUE(codes.Contains(299));
	EXPECT_FALSE(codes.Contains(300));
}

TEST(StatusCodeSetTest, RejectsMalformedInput) {
	EXPECT_THROW(StatusCodeSet::Parse("abc"), ConfigError);
	EXPECT_THROW(StatusCodeSet::Parse("99"), ConfigError);
	EXPECT_THROW(StatusCodeSet::Parse("500-400"), ConfigError);
	EXPECT_THROW(StatusCodeSet::Parse("1000"), ConfigError);
}

TEST(StatusCodeSetTest, EmptyStringIsEmptySet) {
	EXPECT_TRUE(StatusCodeSet::Parse("").Empty());
}

TEST(LinkCheckConfigTest, DefaultsAreValid) {
	LinkCheckConfig config;
	EXPECT_NO_THROW(config.Validate());
	EXPECT_EQ(config.retry.max_attempts, 3);
	EXPECT_EQ(config.max_concurrency, 32);
	EXPECT_TRUE(config.retry_status_codes.Contains(503));
	EXPECT_TRUE(config.retry_status_codes.Contains(429));
	EXPECT_FALSE(config.retry_status_codes.Contains(404));
}

TEST(LinkCheckConfigTest, RejectsZeroConcurrency) {
	LinkCheckConfig config;
	config.max_concurrency = 0;
	EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(LinkCheckConfigTest, RejectsConcurrencyAboveLimit) {
	LinkCheckConfig config;
	config.max_concurrency = MAX_CONCURRENCY_LIMIT;
	EXPECT_NO_THROW(config.Validate());
	config.max_concurrency = MAX_CONCURRENCY_LIMIT + 1;
	EXPECT_THROW(config.Validate(), ConfigError);
	config.max_concurrency = 1000000;
	EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(LinkCheckConfigTest, RejectsInvalidPattern) {
	LinkCheckConfig config;
	config.exclude_patterns.push_back("([unclosed");
	EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(LinkCheckConfigTest, RejectsUncheckableSchemeFilter) {
	LinkCheckConfig config;
	config.allowed_schemes = {"ftp"};
	EXPECT_THROW(config.Validate(), ConfigError);
}

TEST(LinkCheckConfigTest, SkipPrivateSetsAllAddressExclusions) {
	LinkCheckConfig config;
	config.SetSkipPrivate(true);
	EXPECT_TRUE(config.exclude_private);
	EXPECT_TRUE(config.exclude_loopback);
	EXPECT_TRUE(config.exclude_link_local);
}

TEST(LinkCheckConfigTest, GithubTokenAddsCredentials) {
	LinkCheckConfig config;
	config.github_token = "secret";
	auto credentials = config.EffectiveCredentials();
	ASSERT_FALSE(credentials.empty());
	bool found = false;
	for (const auto &credential : credentials) {
		if (credential.Matches("github.com")) {
			EXPECT_EQ(credential.header_name, "Authorization");
			EXPECT_EQ(credential.header_value, "Bearer secret");
			found = true;
		}
	}
	EXPECT_TRUE(found);
}

TEST(HostCredentialTest, MatchesSubdomainsOnly) {
	HostCredential credential {"example.com", "X-Token", "t"};
	EXPECT_TRUE(credential.Matches("example.com"));
	EXPECT_TRUE(credential.Matches("Docs.Example.com"));
	EXPECT_FALSE(credential.Matches("badexample.com"));
}

TEST(BasicAuthTest, ParsesUserAndPassword) {
	auto auth = BasicAuth::Parse("user:pa:ss");
	EXPECT_EQ(auth.username, "user");
	EXPECT_EQ(auth.password, "pa:ss");
	EXPECT_THROW(BasicAuth::Parse("nocolon"), ConfigError);
}

TEST(RequestMethodTest, AcceptsOnlyGetAndHead) {
	EXPECT_EQ(RequestMethodFromString("HEAD"), RequestMethod::HEAD);
	EXPECT_EQ(RequestMethodFromString("get"), RequestMethod::GET);
	EXPECT_THROW(RequestMethodFromString("post"), ConfigError);
}

TEST(LogLevelTest, ParsesNames) {
	EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::DEBUG);
	EXPECT_EQ(LogLevelFromString("none"), LogLevel::NONE);
	EXPECT_THROW(LogLevelFromString("verbose"), ConfigError);
}

TEST(DocumentFormatTest, ParsesAliases) {
	EXPECT_EQ(DocumentFormatFromString("md"), DocumentFormat::MARKDOWN);
	EXPECT_EQ(DocumentFormatFromString("HTML"), DocumentFormat::HTML);
	EXPECT_EQ(DocumentFormatFromString("text"), DocumentFormat::PLAINTEXT);
	EXPECT_THROW(DocumentFormatFromString("pdf"), ConfigError);
}

TEST(LoggerTest, LevelChangesWhileOtherThreadsLog) {
	LogLevel saved = Logger::level.load();
	std::vector<std::thread> threads;
	for (int i = 0; i < 4; i++) {
		threads.emplace_back([i]() {
			for (int round = 0; round < 500; round++) {
				Logger::SetLevel((round + i) % 2 == 0 ? LogLevel::NONE : LogLevel::ERROR);
				Logger::Debug("not shown");
			}
		});
	}
	for (auto &thread : threads) {
		thread.join();
	}
	Logger::SetLevel(LogLevel::INFO);
	EXPECT_EQ(Logger::level.load(), LogLevel::INFO);
	Logger::SetLevel(saved);
}

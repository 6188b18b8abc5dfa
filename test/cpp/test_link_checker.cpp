#include "fake_transport.hpp"
#include "link_checker.hpp"
#include <gtest/gtest.h>
#include <condition_variable>
#include <mutex>

using namespace linkcheck;
using linkcheck::testing::FakeTransport;
using linkcheck::testing::TempDir;

static Target WebTarget(const std::string &uri, const std::string &host) {
	Target target;
	target.kind = TargetKind::WEB_URL;
	target.uri = uri;
	target.host = host;
	return target;
}

static LinkCheckConfig FastRetryConfig() {
	LinkCheckConfig config;
	config.retry.initial_backoff_ms = 10;
	config.retry.backoff_multiplier = 2.0;
	config.retry.max_backoff_ms = 100;
	return config;
}

TEST(RetryPolicyTest, ExponentialCappedAndMonotonic) {
	RetryConfig retry;
	retry.initial_backoff_ms = 100;
	retry.backoff_multiplier = 2.0;
	retry.max_backoff_ms = 500;
	RetryPolicy policy(retry);
	std::chrono::milliseconds previous(0);
	std::vector<int64_t> expected {100, 200, 400, 500, 500};
	for (int attempt = 1; attempt <= 5; attempt++) {
		auto delay = policy.DelayAfter(attempt, 0, previous);
		EXPECT_EQ(delay.count(), expected[attempt - 1]);
		EXPECT_GE(delay, previous);
		previous = delay;
	}
}

TEST(RetryPolicyTest, RetryAfterRaisesDelay) {
	RetryPolicy policy(RetryConfig {});
	EXPECT_EQ(policy.DelayAfter(1, 5000, std::chrono::milliseconds(0)).count(), 5000);
	// A shorter Retry-After never shrinks the schedule
	EXPECT_EQ(policy.DelayAfter(2, 10, std::chrono::milliseconds(3000)).count(), 3000);
}

TEST(LinkCheckerTest, SuccessOn200) {
	LinkCheckConfig config;
	FakeTransport transport;
	LinkChecker checker(config, transport);
	auto result = checker.Check(WebTarget("https://ok.example/", "ok.example"));
	EXPECT_EQ(result.status, CheckStatus::SUCCESS);
	EXPECT_EQ(result.reason, reason::OK);
	EXPECT_EQ(result.http_status, 200);
	EXPECT_EQ(result.attempts, 1);
}

TEST(LinkCheckerTest, NotFoundIsNotRetried) {
	LinkCheckConfig config;
	FakeTransport transport;
	transport.ScriptStatus("https://gone.example/", 404);
	LinkChecker checker(config, transport);
	auto result = checker.Check(WebTarget("https://gone.example/", "gone.example"));
	EXPECT_EQ(result.status, CheckStatus::FAILURE);
	EXPECT_EQ(result.reason, reason::HTTP_STATUS);
	EXPECT_EQ(result.http_status, 404);
	EXPECT_EQ(result.attempts, 1);
	EXPECT_EQ(transport.CallCount(), 1u);
}

TEST(LinkCheckerTest, RetryableStatusExhaustsRetries) {
	auto config = FastRetryConfig();
	config.retry.max_attempts = 3;
	FakeTransport transport;
	const std::string url = "https://busy.example/";
	transport.ScriptStatus(url, 503);
	LinkChecker checker(config, transport);

	auto result = checker.Check(WebTarget(url, "busy.example"));
	EXPECT_EQ(result.status, CheckStatus::FAILURE);
	EXPECT_EQ(result.reason, reason::EXHAUSTED_RETRIES);
	EXPECT_EQ(result.attempts, 3);
	EXPECT_EQ(result.Retries(), 2);
	EXPECT_EQ(transport.CallCount(url), 3u);

	auto times = transport.CallTimes(url);
	ASSERT_EQ(times.size(), 3u);
	EXPECT_GE(times[1] - times[0], std::chrono::milliseconds(10));
	EXPECT_GE(times[2] - times[1], std::chrono::milliseconds(20));
}

TEST(LinkCheckerTest, RecoversAfterTransientFailure) {
	auto config = FastRetryConfig();
	FakeTransport transport;
	const std::string url = "https://flaky.example/";
	transport.ScriptError(url, TransportError::CONNECT);
	transport.ScriptStatus(url, 200);
	LinkChecker checker(config, transport);
	auto result = checker.Check(WebTarget(url, "flaky.example"));
	EXPECT_EQ(result.status, CheckStatus::SUCCESS);
	EXPECT_EQ(result.attempts, 2);
}

TEST(LinkCheckerTest, TlsErrorFailsImmediately) {
	LinkCheckConfig config;
	FakeTransport transport;
	transport.ScriptError("https://badcert.example/", TransportError::TLS);
	LinkChecker checker(config, transport);
	auto result = checker.Check(WebTarget("https://badcert.example/", "badcert.example"));
	EXPECT_EQ(result.status, CheckStatus::FAILURE);
	EXPECT_EQ(result.reason, reason::TLS_ERROR);
	EXPECT_EQ(result.attempts, 1);
}

TEST(LinkCheckerTest, TimeoutIsFlagged) {
	auto config = FastRetryConfig();
	config.retry.max_attempts = 2;
	FakeTransport transport;
	transport.ScriptError("https://slow.example/", TransportError::TIMEOUT);
	LinkChecker checker(config, transport);
	auto result = checker.Check(WebTarget("https://slow.example/", "slow.example"));
	EXPECT_EQ(result.reason, reason::EXHAUSTED_RETRIES);
	EXPECT_TRUE(result.timed_out);
	EXPECT_EQ(result.attempts, 2);
}

TEST(LinkCheckerTest, HeadFallsBackToGet) {
	LinkCheckConfig config;
	FakeTransport transport;
	const std::string url = "https://nohead.example/";
	transport.ScriptStatus(url, RequestMethod::HEAD, 405);
	LinkChecker checker(config, transport);
	auto result = checker.Check(WebTarget(url, "nohead.example"));
	EXPECT_EQ(result.status, CheckStatus::SUCCESS);
	auto requests = transport.Requests();
	ASSERT_EQ(requests.size(), 2u);
	EXPECT_EQ(requests[0].method, RequestMethod::HEAD);
	EXPECT_EQ(requests[1].method, RequestMethod::GET);
}

TEST(LinkCheckerTest, StartAttemptCompletesThroughCallback) {
	std::mutex mutex;
	std::condition_variable cv;
	bool done = false;
	AttemptOutcome outcome;

	LinkCheckConfig config;
	FakeTransport transport;
	transport.SetLatency(std::chrono::milliseconds(50));
	const std::string url = "https://nohead.example/";
	transport.ScriptStatus(url, RequestMethod::HEAD, 405);
	LinkChecker checker(config, transport);

	auto before = std::chrono::steady_clock::now();
	checker.StartAttempt(WebTarget(url, "nohead.example"), 1, std::chrono::milliseconds(0), nullptr,
	                     [&](AttemptOutcome result) {
		                     std::lock_guard<std::mutex> lock(mutex);
		                     outcome = std::move(result);
		                     done = true;
		                     cv.notify_all();
	                     });
	// The caller is free again before the transfer ends
	EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::milliseconds(50));

	std::unique_lock<std::mutex> lock(mutex);
	ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(5), [&]() { return done; }));
	EXPECT_FALSE(outcome.retry);
	EXPECT_EQ(outcome.result.status, CheckStatus::SUCCESS);
	auto requests = transport.Requests();
	ASSERT_EQ(requests.size(), 2u);
	EXPECT_EQ(requests[0].method, RequestMethod::HEAD);
	EXPECT_EQ(requests[1].method, RequestMethod::GET);
}

TEST(LinkCheckerTest, CheckIsIdempotent) {
	auto config = FastRetryConfig();
	config.retry.max_attempts = 2;
	FakeTransport transport;
	transport.ScriptStatus("https://stable.example/ok", 200);
	transport.ScriptStatus("https://stable.example/gone", 404);
	transport.ScriptStatus("https://stable.example/busy", 503);
	LinkChecker checker(config, transport);

	const std::pair<const char *, const char *> expected[] = {
	    {"ok", reason::OK}, {"gone", reason::HTTP_STATUS}, {"busy", reason::EXHAUSTED_RETRIES}};
	for (const auto &entry : expected) {
		Target target = WebTarget(std::string("https://stable.example/") + entry.first, "stable.example");
		auto first = checker.Check(target);
		auto second = checker.Check(target);
		EXPECT_EQ(first.reason, entry.second) << entry.first;
		EXPECT_EQ(first.status, second.status) << entry.first;
		EXPECT_EQ(first.reason, second.reason) << entry.first;
		EXPECT_EQ(first.http_status, second.http_status) << entry.first;
		EXPECT_EQ(first.attempts, second.attempts) << entry.first;
	}
}

TEST(LinkCheckerTest, AcceptedStatusAndRedirects) {
	LinkCheckConfig config;
	config.accepted_status_codes = StatusCodeSet::Parse("403");
	FakeTransport transport;
	transport.ScriptStatus("https://forbidden.example/", 403);
	transport.ScriptStatus("https://moved.example/", 301);
	LinkChecker checker(config, transport);

	auto accepted = checker.Check(WebTarget("https://forbidden.example/", "forbidden.example"));
	EXPECT_EQ(accepted.status, CheckStatus::SUCCESS);
	EXPECT_EQ(accepted.reason, reason::ACCEPTED_STATUS);

	auto moved = checker.Check(WebTarget("https://moved.example/", "moved.example"));
	EXPECT_EQ(moved.status, CheckStatus::SUCCESS);
	EXPECT_EQ(moved.reason, reason::REDIRECTED);
}

TEST(LinkCheckerTest, TokenOnlySentToMatchingHosts) {
	LinkCheckConfig config;
	config.github_token = "tok";
	config.custom_headers["X-Trace"] = "1";
	FakeTransport transport;
	LinkChecker checker(config, transport);
	checker.Check(WebTarget("https://github.com/duckdb/duckdb", "github.com"));
	checker.Check(WebTarget("https://example.com/", "example.com"));

	auto requests = transport.Requests();
	ASSERT_EQ(requests.size(), 2u);
	auto has_header = [](const HttpRequest &request, const std::string &name, const std::string &value) {
		for (const auto &header : request.headers) {
			if (header.first == name && header.second == value) {
				return true;
			}
		}
		return false;
	};
	EXPECT_TRUE(has_header(requests[0], "Authorization", "Bearer tok"));
	EXPECT_TRUE(has_header(requests[0], "X-Trace", "1"));
	EXPECT_FALSE(has_header(requests[1], "Authorization", "Bearer tok"));
	EXPECT_TRUE(has_header(requests[1], "X-Trace", "1"));
}

TEST(LinkCheckerTest, MailIsCheckedWithoutNetwork) {
	LinkCheckConfig config;
	FakeTransport transport;
	LinkChecker checker(config, transport);
	Target mail;
	mail.kind = TargetKind::MAIL_ADDRESS;
	mail.uri = "someone@example.com";
	EXPECT_EQ(checker.Check(mail).status, CheckStatus::SUCCESS);
	mail.uri = "not an address";
	auto invalid = checker.Check(mail);
	EXPECT_EQ(invalid.status, CheckStatus::FAILURE);
	EXPECT_EQ(invalid.reason, reason::INVALID_MAIL);
	EXPECT_EQ(transport.CallCount(), 0u);
}

TEST(LinkCheckerTest, MailAddressSyntax) {
	EXPECT_TRUE(LinkChecker::IsValidMailAddress("first.last+tag@sub.example.org"));
	EXPECT_FALSE(LinkChecker::IsValidMailAddress("@example.com"));
	EXPECT_FALSE(LinkChecker::IsValidMailAddress("user@localhost"));
	EXPECT_FALSE(LinkChecker::IsValidMailAddress("user..dots@example.com"));
	EXPECT_FALSE(LinkChecker::IsValidMailAddress("user@-bad.example.com"));
	EXPECT_FALSE(LinkChecker::IsValidMailAddress(std::string("ab\0c@example.com", 16)));
}

TEST(LinkCheckerTest, FileAndAnchorChecks) {
	TempDir dir;
	std::string guide = dir.Write("docs/guide.md", "# Guide\n\n## Usage\n\nText.\n");
	LinkCheckConfig config;
	config.check_anchors = true;
	FakeTransport transport;
	LinkChecker checker(config, transport);

	Target target;
	target.kind = TargetKind::FILE_PATH;
	target.uri = guide;
	target.fragment = "usage";
	EXPECT_EQ(checker.Check(target).status, CheckStatus::SUCCESS);

	target.fragment = "Usage";
	EXPECT_EQ(checker.Check(target).status, CheckStatus::SUCCESS);

	target.fragment = "missing";
	auto missing_anchor = checker.Check(target);
	EXPECT_EQ(missing_anchor.status, CheckStatus::FAILURE);
	EXPECT_EQ(missing_anchor.reason, reason::ANCHOR_NOT_FOUND);

	target.uri = dir.Path() + "/docs/absent.md";
	target.fragment.clear();
	auto missing_file = checker.Check(target);
	EXPECT_EQ(missing_file.status, CheckStatus::FAILURE);
	EXPECT_EQ(missing_file.reason, reason::NOT_FOUND);
	EXPECT_EQ(transport.CallCount(), 0u);
}

TEST(LinkCheckerTest, AnchorsIgnoredWhenDisabled) {
	TempDir dir;
	std::string page = dir.Write("page.md", "# Title\n");
	LinkCheckConfig config;
	FakeTransport transport;
	LinkChecker checker(config, transport);
	Target target;
	target.kind = TargetKind::FILE_PATH;
	target.uri = page;
	target.fragment = "nowhere";
	EXPECT_EQ(checker.Check(target).status, CheckStatus::SUCCESS);
}

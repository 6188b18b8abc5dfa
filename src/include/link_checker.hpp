#pragma once

#include "http_client.hpp"
#include "link_config.hpp"
#include "link_types.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace linkcheck {

//===--------------------------------------------------------------------===//
// RetryPolicy
//===--------------------------------------------------------------------===//

// Exponential backoff: min(initial * multiplier^(n-1), max), raised to the
// server's Retry-After and never below the previous delay.
class RetryPolicy {
public:
	explicit RetryPolicy(const RetryConfig &config) : config_(config) {}

	int MaxAttempts() const {
		return config_.max_attempts;
	}

	// Delay after failed attempt n (1-based)
	std::chrono::milliseconds DelayAfter(int attempt, int retry_after_ms, std::chrono::milliseconds previous) const;

private:
	RetryConfig config_;
};

//===--------------------------------------------------------------------===//
// LinkChecker
//===--------------------------------------------------------------------===//

// One step of the per-target state machine
struct AttemptOutcome {
	// Schedule another attempt after delay; result then only carries the last error
	bool retry = false;
	std::chrono::milliseconds delay{0};
	CheckResult result;
};

using AttemptCallback = std::function<void(AttemptOutcome)>;

class LinkChecker {
public:
	LinkChecker(const LinkCheckConfig &config, HttpTransport &transport);

	// Runs attempts and backoff to completion on the calling thread
	CheckResult Check(const Target &target);

	// Single attempt. previous_delay is the delay that preceded it (0 for the first).
	AttemptOutcome Attempt(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
	                       const std::atomic<bool> *cancel = nullptr);

	// Same attempt without holding the calling thread during the network wait.
	// Web targets go through HttpTransport::Submit and on_done runs on a transport
	// thread; file and mail targets finish before this returns.
	void StartAttempt(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
	                  const std::atomic<bool> *cancel, AttemptCallback on_done);

	static bool IsValidMailAddress(const std::string &address);

	// Request headers for a host: custom headers plus matching host credentials
	std::vector<std::pair<std::string, std::string>> HeadersFor(const std::string &host) const;

private:
	AttemptOutcome AttemptWeb(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
	                          const std::atomic<bool> *cancel);
	HttpRequest BuildRequest(const Target &target, const std::atomic<bool> *cancel) const;
	AttemptOutcome Classify(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
	                        const HttpResponse &response) const;
	CheckResult CheckFile(const Target &target);
	CheckResult CheckMail(const Target &target) const;
	// Anchors of a local document, cached per path
	bool LoadAnchors(const std::string &path, std::set<std::string> &anchors);

	const LinkCheckConfig &config_;
	HttpTransport &transport_;
	RetryPolicy policy_;
	std::vector<HostCredential> credentials_;

	std::mutex anchor_mutex_;
	std::map<std::string, std::set<std::string>> anchor_cache_;
};

} // namespace linkcheck

#pragma once

#include "link_checker.hpp"
#include "link_config.hpp"
#include "link_types.hpp"
#include "result_aggregator.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace linkcheck {

struct ScheduledTarget {
	size_t document = 0;  // aggregator slot
	Target target;
};

struct SchedulerStats {
	size_t peak_in_flight = 0;
	size_t attempts = 0;
	size_t completed = 0;
	size_t cancelled = 0;  // recorded as cancelled without a final attempt
	bool timed_out = false;
};

// Dispatches attempts from a ready-time ordered queue on the thread that calls
// Run, keeping at most max_concurrency of them outstanding. Network waits run
// on the transport's threads and a target waiting for its backoff sits in the
// queue, so no thread is held per pending check.
class CheckScheduler {
public:
	CheckScheduler(const LinkCheckConfig &config, LinkChecker &checker);

	// Blocks until every target has a result in the aggregator
	SchedulerStats Run(std::vector<ScheduledTarget> targets, ResultAggregator &aggregator);

	// Stops dispatch and aborts in-flight transfers. Callable from any thread.
	void Cancel();

private:
	using Clock = std::chrono::steady_clock;

	enum class TargetState : uint8_t {
		QUEUED,
		ATTEMPTING,
		AWAITING_BACKOFF,
		SUCCEEDED,
		FAILED
	};

	struct Entry {
		ScheduledTarget scheduled;
		TargetState state = TargetState::QUEUED;
		int attempts = 0;
		std::chrono::milliseconds last_delay{0};
		Clock::time_point first_start;
		bool started = false;
		CheckResult last_result;
	};

	struct QueueItem {
		Clock::time_point ready_at;
		uint64_t sequence;  // FIFO among equal ready times
		size_t entry;

		bool operator>(const QueueItem &other) const {
			if (ready_at != other.ready_at) {
				return ready_at > other.ready_at;
			}
			return sequence > other.sequence;
		}
	};

	void Dispatch(std::unique_lock<std::mutex> &lock, ResultAggregator &aggregator);
	void StartAttempt(size_t entry, bool gated, std::unique_lock<std::mutex> &lock, ResultAggregator &aggregator);
	void OnAttemptDone(size_t entry, bool gated, AttemptOutcome outcome, ResultAggregator &aggregator);
	void Push(size_t entry, Clock::time_point ready_at);
	void Complete(size_t entry, CheckResult result, ResultAggregator &aggregator);

	const LinkCheckConfig &config_;
	LinkChecker &checker_;

	std::mutex mutex_;
	std::condition_variable cv_;
	std::priority_queue<QueueItem, std::vector<QueueItem>, std::greater<QueueItem>> queue_;
	std::vector<Entry> entries_;
	std::map<std::string, int> host_in_flight_;
	size_t remaining_ = 0;
	size_t in_flight_ = 0;
	uint64_t sequence_ = 0;
	SchedulerStats stats_;
	std::atomic<bool> cancel_{false};
};

} // namespace linkcheck

#include "check_scheduler.hpp"
#include "logger.hpp"
#include <algorithm>
#include <exception>

namespace linkcheck {

// Delay before a target whose host is saturated is looked at again
static constexpr std::chrono::milliseconds HOST_GATE_DELAY{20};

CheckScheduler::CheckScheduler(const LinkCheckConfig &config, LinkChecker &checker)
    : config_(config), checker_(checker) {
}

void CheckScheduler::Cancel() {
	cancel_.store(true);
	// Taking the lock orders the flag with waiters checking it
	std::lock_guard<std::mutex> lock(mutex_);
	cv_.notify_all();
}

void CheckScheduler::Push(size_t entry, Clock::time_point ready_at) {
	queue_.push({ready_at, sequence_++, entry});
}

void CheckScheduler::Complete(size_t entry, CheckResult result, ResultAggregator &aggregator) {
	Entry &state = entries_[entry];
	state.state = result.status == CheckStatus::SUCCESS ? TargetState::SUCCEEDED : TargetState::FAILED;
	result.attempts = std::max(result.attempts, state.attempts);
	if (state.started) {
		result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - state.first_start);
	}
	aggregator.Record(state.scheduled.document, std::move(result));
	stats_.completed++;
	remaining_--;
}

void CheckScheduler::OnAttemptDone(size_t entry, bool gated, AttemptOutcome outcome, ResultAggregator &aggregator) {
	std::lock_guard<std::mutex> lock(mutex_);
	Entry &state = entries_[entry];
	in_flight_--;
	if (gated) {
		host_in_flight_[state.scheduled.target.host]--;
	}
	if (outcome.retry && !cancel_.load()) {
		state.state = TargetState::AWAITING_BACKOFF;
		state.last_delay = outcome.delay;
		state.last_result = std::move(outcome.result);
		Push(entry, Clock::now() + outcome.delay);
	} else if (outcome.retry) {
		CheckResult result = std::move(outcome.result);
		result.status = CheckStatus::FAILURE;
		result.reason = reason::CANCELLED;
		Complete(entry, std::move(result), aggregator);
	} else {
		Complete(entry, std::move(outcome.result), aggregator);
	}
	cv_.notify_all();
}

// Called with the lock held; releases it while the checker starts the attempt
void CheckScheduler::StartAttempt(size_t entry, bool gated, std::unique_lock<std::mutex> &lock,
                                  ResultAggregator &aggregator) {
	Entry &state = entries_[entry];
	auto now = Clock::now();
	state.state = TargetState::ATTEMPTING;
	state.attempts++;
	if (!state.started) {
		state.started = true;
		state.first_start = now;
	}
	in_flight_++;
	stats_.peak_in_flight = std::max(stats_.peak_in_flight, in_flight_);
	stats_.attempts++;
	if (gated) {
		host_in_flight_[state.scheduled.target.host]++;
	}
	int attempt = state.attempts;
	std::chrono::milliseconds previous_delay = state.last_delay;
	// entries_ is not resized while attempts run, so the reference stays valid
	const Target &target = state.scheduled.target;

	lock.unlock();
	try {
		checker_.StartAttempt(target, attempt, previous_delay, &cancel_,
		                      [this, entry, gated, &aggregator](AttemptOutcome outcome) {
			                      OnAttemptDone(entry, gated, std::move(outcome), aggregator);
		                      });
	} catch (std::exception &e) {
		lock.lock();
		in_flight_--;
		if (gated) {
			host_in_flight_[state.scheduled.target.host]--;
		}
		throw;
	}
	lock.lock();
}

void CheckScheduler::Dispatch(std::unique_lock<std::mutex> &lock, ResultAggregator &aggregator) {
	auto deadline = Clock::time_point::max();
	if (config_.global_timeout.count() > 0) {
		deadline = Clock::now() + config_.global_timeout;
	}
	size_t limit = static_cast<size_t>(config_.max_concurrency);

	while (remaining_ > 0) {
		auto now = Clock::now();
		if (!cancel_.load() && now >= deadline) {
			stats_.timed_out = true;
			cancel_.store(true);
			Logger::Warn("Global timeout of " + std::to_string(config_.global_timeout.count()) +
			             "ms elapsed, cancelling remaining checks");
		}
		if (cancel_.load()) {
			// In-flight transfers see the flag and end as cancelled
			if (in_flight_ == 0) {
				return;
			}
			cv_.wait(lock);
			continue;
		}

		auto wake = deadline;
		while (in_flight_ < limit && !queue_.empty()) {
			QueueItem item = queue_.top();
			if (item.ready_at > now) {
				wake = std::min(wake, item.ready_at);
				break;
			}
			queue_.pop();
			const std::string &host = entries_[item.entry].scheduled.target.host;
			bool gated = config_.max_concurrency_per_host > 0 && !host.empty();
			if (gated && host_in_flight_[host] >= config_.max_concurrency_per_host) {
				Push(item.entry, now + HOST_GATE_DELAY);
				continue;
			}
			StartAttempt(item.entry, gated, lock, aggregator);
			now = Clock::now();
		}
		if (remaining_ == 0) {
			return;
		}
		if (wake == Clock::time_point::max()) {
			cv_.wait(lock);
		} else {
			cv_.wait_until(lock, wake);
		}
	}
}

SchedulerStats CheckScheduler::Run(std::vector<ScheduledTarget> targets, ResultAggregator &aggregator) {
	std::unique_lock<std::mutex> lock(mutex_);
	entries_.clear();
	queue_ = decltype(queue_)();
	host_in_flight_.clear();
	stats_ = SchedulerStats();
	in_flight_ = 0;
	remaining_ = targets.size();
	auto now = Clock::now();
	entries_.reserve(targets.size());
	for (auto &target : targets) {
		Entry entry;
		entry.scheduled = std::move(target);
		entries_.push_back(std::move(entry));
		Push(entries_.size() - 1, now);
	}
	if (entries_.empty()) {
		return stats_;
	}
	Logger::Debug("Checking " + std::to_string(entries_.size()) + " targets, at most " +
	              std::to_string(config_.max_concurrency) + " at a time");

	try {
		Dispatch(lock, aggregator);
	} catch (std::exception &) {
		// Let attempts already started report back before unwinding
		cancel_.store(true);
		cv_.wait(lock, [&]() { return in_flight_ == 0; });
		cancel_.store(false);
		throw;
	}

	// Everything still queued or waiting on backoff ends as cancelled
	for (size_t i = 0; i < entries_.size(); i++) {
		Entry &entry = entries_[i];
		if (entry.state == TargetState::SUCCEEDED || entry.state == TargetState::FAILED) {
			continue;
		}
		CheckResult result = entry.attempts > 0 ? entry.last_result : CheckResult::ForTarget(entry.scheduled.target);
		result.status = CheckStatus::FAILURE;
		result.reason = reason::CANCELLED;
		result.attempts = entry.attempts;
		result.detail = stats_.timed_out ? "Global timeout elapsed before the check completed"
		                                 : "Cancelled before the check completed";
		Complete(i, std::move(result), aggregator);
		stats_.cancelled++;
	}
	if (stats_.timed_out) {
		aggregator.MarkTimedOut();
	}
	cancel_.store(false);
	return stats_;
}

} // namespace linkcheck

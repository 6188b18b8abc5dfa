#include "result_aggregator.hpp"
#include <algorithm>

namespace linkcheck {

ResultAggregator::ResultAggregator(bool count_skipped_as_checked)
    : count_skipped_as_checked_(count_skipped_as_checked) {
}

size_t ResultAggregator::RegisterDocument(const std::string &document_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	size_t slot = documents_.size();
	DocumentReport report;
	report.document_id = document_id;
	documents_.push_back(std::move(report));
	document_index_.emplace(document_id, slot);
	return slot;
}

void ResultAggregator::Record(size_t document, CheckResult result) {
	std::lock_guard<std::mutex> lock(mutex_);
	documents_.at(document).results.push_back(std::move(result));
	recorded_++;
}

void ResultAggregator::Record(const std::string &document_id, CheckResult result) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto entry = document_index_.find(document_id);
	if (entry == document_index_.end()) {
		DocumentReport report;
		report.document_id = document_id;
		documents_.push_back(std::move(report));
		entry = document_index_.emplace(document_id, documents_.size() - 1).first;
	}
	documents_[entry->second].results.push_back(std::move(result));
	recorded_++;
}

void ResultAggregator::MarkTimedOut() {
	std::lock_guard<std::mutex> lock(mutex_);
	timed_out_ = true;
}

size_t ResultAggregator::RecordedCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return recorded_;
}

ReportCounts ResultAggregator::Count(const std::vector<DocumentReport> &documents, bool count_skipped_as_checked) {
	ReportCounts counts;
	for (const auto &document : documents) {
		for (const auto &result : document.results) {
			counts.total++;
			switch (result.status) {
			case CheckStatus::SUCCESS:
				counts.succeeded++;
				counts.checked++;
				break;
			case CheckStatus::FAILURE:
				counts.failed++;
				counts.checked++;
				break;
			case CheckStatus::EXCLUDED:
				counts.excluded++;
				if (count_skipped_as_checked) {
					counts.checked++;
				}
				break;
			case CheckStatus::SKIPPED:
				counts.skipped++;
				if (count_skipped_as_checked) {
					counts.checked++;
				}
				break;
			}
			if (result.reason == reason::REDIRECTED ||
			    (result.status == CheckStatus::SUCCESS && result.redirect_count > 0)) {
				counts.redirected++;
			}
			if (result.status == CheckStatus::FAILURE && result.timed_out) {
				counts.timeouts++;
			}
			if (result.reason == reason::CANCELLED) {
				counts.cancelled++;
			}
		}
	}
	return counts;
}

Report ResultAggregator::Finalize() {
	std::lock_guard<std::mutex> lock(mutex_);
	Report report;
	report.documents = documents_;
	for (auto &document : report.documents) {
		std::stable_sort(document.results.begin(), document.results.end(),
		                 [](const CheckResult &a, const CheckResult &b) { return a.link.index < b.link.index; });
	}
	report.counts = Count(report.documents, count_skipped_as_checked_);
	report.timed_out = timed_out_;
	return report;
}

} // namespace linkcheck

#pragma once

#include "link_types.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace linkcheck {

// Collects CheckResults from concurrent workers and restores source order
class ResultAggregator {
public:
	explicit ResultAggregator(bool count_skipped_as_checked = false);

	// Documents keep registration order in the Report. Returns the document slot.
	size_t RegisterDocument(const std::string &document_id);

	// Thread-safe
	void Record(size_t document, CheckResult result);
	// Records into the first document registered under this id, registering it if needed
	void Record(const std::string &document_id, CheckResult result);

	void MarkTimedOut();
	size_t RecordedCount() const;

	// Sorts each document's results by RawLink index and computes counts
	Report Finalize();

	static ReportCounts Count(const std::vector<DocumentReport> &documents, bool count_skipped_as_checked);

private:
	mutable std::mutex mutex_;
	std::vector<DocumentReport> documents_;
	std::unordered_map<std::string, size_t> document_index_;
	size_t recorded_ = 0;
	bool count_skipped_as_checked_;
	bool timed_out_ = false;
};

} // namespace linkcheck

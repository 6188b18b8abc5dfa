#pragma once

//===--------------------------------------------------------------------===//
// link_types.hpp - Data model shared by all linkcheck modules
//===--------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace linkcheck {

enum class DocumentFormat : uint8_t {
	MARKDOWN = 0,
	HTML = 1,
	PLAINTEXT = 2
};

const char *DocumentFormatToString(DocumentFormat format);
// Accepts "markdown"/"md", "html"/"htm", "text"/"plaintext"/"txt". Throws ConfigError otherwise.
DocumentFormat DocumentFormatFromString(const std::string &name);

struct Document {
	std::string id;       // path or URL as given by the caller
	std::string content;
	std::string base;     // path or URL used to resolve relative links (empty = none)
	DocumentFormat format = DocumentFormat::PLAINTEXT;
};

//===--------------------------------------------------------------------===//
// RawLink
//===--------------------------------------------------------------------===//

enum class LinkKind : uint8_t {
	MARKDOWN_INLINE = 0,
	MARKDOWN_REFERENCE = 1,
	MARKDOWN_AUTOLINK = 2,
	MARKDOWN_IMAGE = 3,
	HTML_HREF = 4,
	HTML_SRC = 5,
	BARE_URL = 6,
	BARE_MAIL = 7
};

const char *LinkKindToString(LinkKind kind);

struct RawLink {
	std::string text;
	size_t offset = 0;   // byte offset of text within the document
	size_t line = 1;
	size_t column = 1;
	LinkKind kind = LinkKind::BARE_URL;
	size_t index = 0;    // position in the document's link sequence
};

//===--------------------------------------------------------------------===//
// Target / SkipVerdict
//===--------------------------------------------------------------------===//

enum class TargetKind : uint8_t {
	WEB_URL = 0,
	FILE_PATH = 1,
	MAIL_ADDRESS = 2
};

const char *TargetKindToString(TargetKind kind);

struct Target {
	TargetKind kind = TargetKind::WEB_URL;
	std::string uri;       // absolute URL, normalized path, or bare mail address
	std::string fragment;  // anchor for FILE_PATH targets
	std::string host;      // lower-cased host for WEB_URL targets
	RawLink link;
};

enum class CheckStatus : uint8_t {
	SUCCESS = 0,
	FAILURE = 1,
	EXCLUDED = 2,
	SKIPPED = 3
};

const char *CheckStatusToString(CheckStatus status);

enum class SkipReason : uint8_t {
	EXCLUDED_PATTERN = 0,
	NOT_INCLUDED = 1,
	EXCLUDED_SCHEME = 2,
	PRIVATE_ADDRESS = 3,
	LOOPBACK_ADDRESS = 4,
	LINK_LOCAL_ADDRESS = 5,
	EXCLUDED_MAIL = 6,
	UNSUPPORTED_SCHEME = 7,
	ANCHOR_ONLY = 8,
	UNSUPPORTED_PATH = 9
};

const char *SkipReasonToString(SkipReason reason);
// EXCLUDED for policy exclusions, SKIPPED for links the engine cannot check
CheckStatus SkipReasonStatus(SkipReason reason);

struct SkipVerdict {
	RawLink link;
	std::string target;  // best-effort normalized text, may be empty
	SkipReason reason = SkipReason::UNSUPPORTED_SCHEME;
};

//===--------------------------------------------------------------------===//
// CheckResult
//===--------------------------------------------------------------------===//

// Stable reason codes carried by CheckResult::reason
namespace reason {
constexpr const char *OK = "ok";
constexpr const char *REDIRECTED = "redirected";
constexpr const char *ACCEPTED_STATUS = "accepted_status";
constexpr const char *HTTP_STATUS = "http_status";
constexpr const char *EXHAUSTED_RETRIES = "exhausted_retries";
constexpr const char *TOO_MANY_REDIRECTS = "too_many_redirects";
constexpr const char *TLS_ERROR = "tls_error";
constexpr const char *TRANSPORT_ERROR = "transport_error";
constexpr const char *NOT_FOUND = "not_found";
constexpr const char *ANCHOR_NOT_FOUND = "anchor_not_found";
constexpr const char *INVALID_MAIL = "invalid_mail";
constexpr const char *CANCELLED = "cancelled";
} // namespace reason

struct CheckResult {
	RawLink link;
	std::string target;
	bool has_target_kind = false;
	TargetKind target_kind = TargetKind::WEB_URL;
	CheckStatus status = CheckStatus::SKIPPED;
	std::string reason;
	int http_status = 0;
	std::string detail;
	std::chrono::milliseconds elapsed{0};
	int attempts = 0;
	std::string final_url;
	int redirect_count = 0;
	bool timed_out = false;  // last underlying error was a timeout

	int Retries() const {
		return attempts > 0 ? attempts - 1 : 0;
	}
	bool IsFailure() const {
		return status == CheckStatus::FAILURE;
	}

	static CheckResult FromSkip(const SkipVerdict &skip);
	static CheckResult ForTarget(const Target &target);
};

//===--------------------------------------------------------------------===//
// Report
//===--------------------------------------------------------------------===//

struct ReportCounts {
	int64_t total = 0;
	int64_t checked = 0;
	int64_t succeeded = 0;
	int64_t failed = 0;
	int64_t excluded = 0;
	int64_t skipped = 0;
	int64_t redirected = 0;
	int64_t timeouts = 0;
	int64_t cancelled = 0;
};

struct DocumentReport {
	std::string document_id;
	std::vector<CheckResult> results;
};

struct Report {
	std::vector<DocumentReport> documents;
	ReportCounts counts;
	bool timed_out = false;

	// 0 when nothing failed, 2 when any checked link failed
	int ExitCode() const;
	const DocumentReport *FindDocument(const std::string &document_id) const;
};

} // namespace linkcheck

#include "link_types.hpp"
#include "link_config.hpp"
#include "link_utils.hpp"

namespace linkcheck {

const char *DocumentFormatToString(DocumentFormat format) {
	switch (format) {
		case DocumentFormat::MARKDOWN: return "markdown";
		case DocumentFormat::HTML: return "html";
		case DocumentFormat::PLAINTEXT: return "plaintext";
		default: return "unknown";
	}
}

DocumentFormat DocumentFormatFromString(const std::string &name) {
	std::string lower = ToLower(Trim(name));
	if (lower == "markdown" || lower == "md") {
		return DocumentFormat::MARKDOWN;
	}
	if (lower == "html" || lower == "htm") {
		return DocumentFormat::HTML;
	}
	if (lower == "plaintext" || lower == "text" || lower == "txt") {
		return DocumentFormat::PLAINTEXT;
	}
	throw ConfigError("Unknown document format: '" + name + "' (expected markdown, html or plaintext)");
}

const char *LinkKindToString(LinkKind kind) {
	switch (kind) {
		case LinkKind::MARKDOWN_INLINE: return "markdown_inline";
		case LinkKind::MARKDOWN_REFERENCE: return "markdown_reference";
		case LinkKind::MARKDOWN_AUTOLINK: return "markdown_autolink";
		case LinkKind::MARKDOWN_IMAGE: return "markdown_image";
		case LinkKind::HTML_HREF: return "html_href";
		case LinkKind::HTML_SRC: return "html_src";
		case LinkKind::BARE_URL: return "bare_url";
		case LinkKind::BARE_MAIL: return "bare_mail";
		default: return "unknown";
	}
}

const char *TargetKindToString(TargetKind kind) {
	switch (kind) {
		case TargetKind::WEB_URL: return "web_url";
		case TargetKind::FILE_PATH: return "file_path";
		case TargetKind::MAIL_ADDRESS: return "mail_address";
		default: return "unknown";
	}
}

const char *CheckStatusToString(CheckStatus status) {
	switch (status) {
		case CheckStatus::SUCCESS: return "success";
		case CheckStatus::FAILURE: return "failure";
		case CheckStatus::EXCLUDED: return "excluded";
		case CheckStatus::SKIPPED: return "skipped";
		default: return "unknown";
	}
}

const char *SkipReasonToString(SkipReason reason) {
	switch (reason) {
		case SkipReason::EXCLUDED_PATTERN: return "excluded_pattern";
		case SkipReason::NOT_INCLUDED: return "not_included";
		case SkipReason::EXCLUDED_SCHEME: return "excluded_scheme";
		case SkipReason::PRIVATE_ADDRESS: return "private_address";
		case SkipReason::LOOPBACK_ADDRESS: return "loopback_address";
		case SkipReason::LINK_LOCAL_ADDRESS: return "link_local_address";
		case SkipReason::EXCLUDED_MAIL: return "excluded_mail";
		case SkipReason::UNSUPPORTED_SCHEME: return "unsupported_scheme";
		case SkipReason::ANCHOR_ONLY: return "anchor_only";
		case SkipReason::UNSUPPORTED_PATH: return "unsupported_path";
		default: return "unknown";
	}
}

CheckStatus SkipReasonStatus(SkipReason reason) {
	switch (reason) {
		case SkipReason::UNSUPPORTED_SCHEME:
		case SkipReason::ANCHOR_ONLY:
		case SkipReason::UNSUPPORTED_PATH:
			return CheckStatus::SKIPPED;
		default:
			return CheckStatus::EXCLUDED;
	}
}

CheckResult CheckResult::FromSkip(const SkipVerdict &skip) {
	CheckResult result;
	result.link = skip.link;
	result.target = skip.target;
	result.status = SkipReasonStatus(skip.reason);
	result.reason = SkipReasonToString(skip.reason);
	return result;
}

CheckResult CheckResult::ForTarget(const Target &target) {
	CheckResult result;
	result.link = target.link;
	result.target = target.uri;
	if (!target.fragment.empty()) {
		result.target += "#" + target.fragment;
	}
	result.has_target_kind = true;
	result.target_kind = target.kind;
	return result;
}

int Report::ExitCode() const {
	return counts.failed > 0 ? 2 : 0;
}

const DocumentReport *Report::FindDocument(const std::string &document_id) const {
	for (const auto &doc : documents) {
		if (doc.document_id == document_id) {
			return &doc;
		}
	}
	return nullptr;
}

} // namespace linkcheck

#include "url_resolver.hpp"
#include "link_utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace linkcheck {

namespace fs = std::filesystem;

//===--------------------------------------------------------------------===//
// ParsedUrl
//===--------------------------------------------------------------------===//

bool ParsedUrl::Parse(const std::string &text, ParsedUrl &result) {
	if (!UrlResolver::HasScheme(text)) {
		return false;
	}
	result = ParsedUrl();
	size_t colon = text.find(':');
	result.scheme = ToLower(text.substr(0, colon));
	std::string rest = text.substr(colon + 1);

	size_t hash = rest.find('#');
	if (hash != std::string::npos) {
		result.has_fragment = true;
		result.fragment = rest.substr(hash + 1);
		rest = rest.substr(0, hash);
	}
	size_t question = rest.find('?');
	if (question != std::string::npos) {
		result.has_query = true;
		result.query = rest.substr(question + 1);
		rest = rest.substr(0, question);
	}

	if (!StartsWith(rest, "//")) {
		result.path = rest;
		return true;
	}
	result.has_authority = true;
	size_t slash = rest.find('/', 2);
	std::string authority = slash == std::string::npos ? rest.substr(2) : rest.substr(2, slash - 2);
	result.path = slash == std::string::npos ? "" : rest.substr(slash);

	size_t at = authority.rfind('@');
	if (at != std::string::npos) {
		result.userinfo = authority.substr(0, at);
		authority = authority.substr(at + 1);
	}
	if (!authority.empty() && authority[0] == '[') {
		size_t close = authority.find(']');
		if (close == std::string::npos) {
			result.host = authority;
		} else {
			result.host = authority.substr(0, close + 1);
			if (close + 1 < authority.size() && authority[close + 1] == ':') {
				result.port = authority.substr(close + 2);
			}
		}
	} else {
		size_t port_pos = authority.rfind(':');
		if (port_pos != std::string::npos) {
			result.host = authority.substr(0, port_pos);
			result.port = authority.substr(port_pos + 1);
		} else {
			result.host = authority;
		}
	}
	result.host = ToLower(result.host);
	return true;
}

std::string ParsedUrl::ToString(bool with_fragment) const {
	std::string result = scheme + ":";
	if (has_authority) {
		result += "//";
		if (!userinfo.empty()) {
			result += userinfo + "@";
		}
		result += host;
		if (!port.empty()) {
			result += ":" + port;
		}
	}
	result += path;
	if (has_query) {
		result += "?" + query;
	}
	if (with_fragment && has_fragment) {
		result += "#" + fragment;
	}
	return result;
}

//===--------------------------------------------------------------------===//
// Reference resolution
//===--------------------------------------------------------------------===//

bool UrlResolver::HasScheme(const std::string &text) {
	if (text.empty() || !std::isalpha(static_cast<unsigned char>(text[0]))) {
		return false;
	}
	size_t pos = 1;
	while (pos < text.size()) {
		unsigned char c = static_cast<unsigned char>(text[pos]);
		if (c == ':') {
			// A single letter is a drive ("C:\docs")
			return pos >= 2;
		}
		if (!std::isalnum(c) && c != '+' && c != '.' && c != '-') {
			return false;
		}
		pos++;
	}
	return false;
}

bool UrlResolver::IsUrl(const std::string &text) {
	size_t sep = text.find("://");
	return sep != std::string::npos && HasScheme(text) && text.find(':') == sep;
}

std::string UrlResolver::NormalizePath(const std::string &path) {
	std::vector<std::string> segments;
	size_t pos = 0;
	std::string last;

	while (pos < path.length()) {
		size_t next = path.find('/', pos);
		if (next == std::string::npos) {
			next = path.length();
		}

		std::string segment = path.substr(pos, next - pos);
		last = segment;

		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (segment != "." && !segment.empty()) {
			segments.push_back(segment);
		}

		pos = next + 1;
	}

	std::string result = "/";
	for (size_t i = 0; i < segments.size(); i++) {
		result += segments[i];
		if (i < segments.size() - 1) {
			result += "/";
		}
	}

	// "a/b/" and "a/b/.." both denote a directory
	bool directory = (path.length() > 1 && path.back() == '/') || last == "." || last == "..";
	if (directory && result.back() != '/') {
		result += "/";
	}

	return result;
}

std::string UrlResolver::ResolveUrl(const std::string &base_url, const std::string &reference) {
	ParsedUrl base;
	if (!ParsedUrl::Parse(base_url, base)) {
		return "";
	}
	std::string ref = Trim(reference);

	if (HasScheme(ref)) {
		ParsedUrl absolute;
		ParsedUrl::Parse(ref, absolute);
		if (absolute.has_authority && !absolute.path.empty()) {
			absolute.path = NormalizePath(absolute.path);
		}
		return absolute.ToString();
	}
	if (StartsWith(ref, "//")) {
		return ResolveUrl(base_url, base.scheme + ":" + ref);
	}

	ParsedUrl target = base;
	target.has_fragment = false;
	target.fragment.clear();

	std::string ref_path = ref;
	size_t hash = ref_path.find('#');
	if (hash != std::string::npos) {
		target.has_fragment = true;
		target.fragment = ref_path.substr(hash + 1);
		ref_path = ref_path.substr(0, hash);
	}
	bool ref_has_query = false;
	std::string ref_query;
	size_t question = ref_path.find('?');
	if (question != std::string::npos) {
		ref_has_query = true;
		ref_query = ref_path.substr(question + 1);
		ref_path = ref_path.substr(0, question);
	}

	if (ref_path.empty()) {
		if (ref_has_query) {
			target.has_query = true;
			target.query = ref_query;
		}
		return target.ToString();
	}

	target.has_query = ref_has_query;
	target.query = ref_query;
	if (ref_path[0] == '/') {
		target.path = NormalizePath(ref_path);
		return target.ToString();
	}

	// Relative path: merge with the base directory
	std::string dir;
	if (base.has_authority && base.path.empty()) {
		dir = "/";
	} else {
		size_t last_slash = base.path.rfind('/');
		dir = last_slash == std::string::npos ? "" : base.path.substr(0, last_slash + 1);
	}
	target.path = NormalizePath(dir + ref_path);
	return target.ToString();
}

//===--------------------------------------------------------------------===//
// UrlResolver
//===--------------------------------------------------------------------===//

static Resolution Skip(const RawLink &link, const std::string &target, SkipReason reason) {
	Resolution resolution;
	resolution.is_target = false;
	resolution.skip.link = link;
	resolution.skip.target = target;
	resolution.skip.reason = reason;
	return resolution;
}

static std::string StripTrailingSeparators(std::string path) {
	while (path.size() > 1 && (path.back() == '/' || path.back() == '\\')) {
		path.pop_back();
	}
	return path;
}

UrlResolver::UrlResolver(const LinkCheckConfig &config)
    : filter_(config), check_anchors_(config.check_anchors), root_dir_(config.root_dir),
      allowed_roots_(config.allowed_roots) {
}

Resolution UrlResolver::Finish(Target target) const {
	SkipReason reason;
	if (filter_.IsExcluded(target, reason)) {
		return Skip(target.link, LinkFilter::MatchText(target), reason);
	}
	Resolution resolution;
	resolution.is_target = true;
	resolution.target = std::move(target);
	return resolution;
}

bool UrlResolver::WithinAllowedRoots(const std::string &path) const {
	if (allowed_roots_.empty()) {
		return true;
	}
	std::error_code ec;
	fs::path absolute = fs::absolute(fs::path(path), ec).lexically_normal();
	if (ec) {
		return false;
	}
	for (const auto &root : allowed_roots_) {
		fs::path root_path = fs::absolute(fs::path(StripTrailingSeparators(root)), ec).lexically_normal();
		if (ec) {
			continue;
		}
		auto mismatch = std::mismatch(root_path.begin(), root_path.end(), absolute.begin(), absolute.end());
		if (mismatch.first == root_path.end()) {
			return true;
		}
	}
	return false;
}

Resolution UrlResolver::ResolveWeb(const RawLink &link, const std::string &url) const {
	ParsedUrl parsed;
	if (!ParsedUrl::Parse(url, parsed)) {
		return Skip(link, url, SkipReason::UNSUPPORTED_PATH);
	}
	if (parsed.scheme != "http" && parsed.scheme != "https") {
		return Skip(link, url, SkipReason::UNSUPPORTED_SCHEME);
	}
	if (!parsed.has_authority || parsed.host.empty()) {
		return Skip(link, url, SkipReason::UNSUPPORTED_PATH);
	}
	if (parsed.path.empty()) {
		parsed.path = "/";
	}
	Target target;
	target.kind = TargetKind::WEB_URL;
	target.uri = parsed.ToString(false);
	target.host = parsed.host;
	target.link = link;
	return Finish(std::move(target));
}

Resolution UrlResolver::ResolveFile(const RawLink &link, const std::string &path, const std::string &fragment) const {
	if (path.empty()) {
		return Skip(link, "", SkipReason::UNSUPPORTED_PATH);
	}
	std::string normalized = fs::path(path).lexically_normal().string();
	if (!WithinAllowedRoots(normalized)) {
		return Skip(link, normalized, SkipReason::UNSUPPORTED_PATH);
	}
	Target target;
	target.kind = TargetKind::FILE_PATH;
	target.uri = normalized;
	target.fragment = fragment;
	target.link = link;
	return Finish(std::move(target));
}

Resolution UrlResolver::ResolveRelativeFile(const RawLink &link, const std::string &reference,
                                            const std::string &base) const {
	std::string path = reference;
	std::string fragment;
	size_t hash = path.find('#');
	if (hash != std::string::npos) {
		fragment = PercentDecode(path.substr(hash + 1));
		path = path.substr(0, hash);
	}
	// Query strings mean nothing to the filesystem
	size_t question = path.find('?');
	if (question != std::string::npos) {
		path = path.substr(0, question);
	}
	path = PercentDecode(path);

	if (path.empty()) {
		return ResolveFile(link, base, fragment);
	}
	fs::path full;
	if (path[0] == '/') {
		if (root_dir_.empty()) {
			return Skip(link, path, SkipReason::UNSUPPORTED_PATH);
		}
		full = fs::path(root_dir_) / path.substr(1);
	} else {
		full = fs::path(base).parent_path() / path;
	}
	return ResolveFile(link, full.string(), fragment);
}

static std::string StripQuery(const std::string &text) {
	size_t question = text.find('?');
	return question == std::string::npos ? text : text.substr(0, question);
}

Resolution UrlResolver::Resolve(const RawLink &link, const std::string &base) const {
	std::string text = Trim(link.text);
	if (text.size() >= 2 && text.front() == '<' && text.back() == '>') {
		text = Trim(text.substr(1, text.size() - 2));
	}
	if (text.empty()) {
		return Skip(link, "", SkipReason::UNSUPPORTED_PATH);
	}

	if (text[0] == '#') {
		if (check_anchors_ && !base.empty() && !IsUrl(base)) {
			return ResolveFile(link, base, PercentDecode(text.substr(1)));
		}
		return Skip(link, text, SkipReason::ANCHOR_ONLY);
	}

	if (link.kind == LinkKind::BARE_URL && StartsWithNoCase(text, "www.")) {
		text = "https://" + text;
	}

	if (HasScheme(text)) {
		size_t colon = text.find(':');
		std::string scheme = ToLower(text.substr(0, colon));
		if (scheme == "http" || scheme == "https") {
			return ResolveWeb(link, text);
		}
		if (scheme == "mailto") {
			Target target;
			target.kind = TargetKind::MAIL_ADDRESS;
			target.uri = PercentDecode(StripQuery(text.substr(colon + 1)));
			target.link = link;
			return Finish(std::move(target));
		}
		if (scheme == "file") {
			ParsedUrl parsed;
			ParsedUrl::Parse(text, parsed);
			return ResolveFile(link, PercentDecode(parsed.path), PercentDecode(parsed.fragment));
		}
		return Skip(link, text, SkipReason::UNSUPPORTED_SCHEME);
	}

	if (StartsWith(text, "//")) {
		std::string scheme = "https";
		ParsedUrl parsed_base;
		if (IsUrl(base) && ParsedUrl::Parse(base, parsed_base) &&
		    (parsed_base.scheme == "http" || parsed_base.scheme == "https")) {
			scheme = parsed_base.scheme;
		}
		return ResolveWeb(link, scheme + ":" + text);
	}

	bool mail_kind = link.kind == LinkKind::BARE_MAIL || link.kind == LinkKind::MARKDOWN_AUTOLINK;
	if (mail_kind && text.find('@') != std::string::npos && text.find('/') == std::string::npos) {
		Target target;
		target.kind = TargetKind::MAIL_ADDRESS;
		target.uri = StripQuery(text);
		target.link = link;
		return Finish(std::move(target));
	}

	if (base.empty()) {
		return Skip(link, text, SkipReason::UNSUPPORTED_PATH);
	}
	if (IsUrl(base)) {
		std::string resolved = ResolveUrl(base, text);
		ParsedUrl parsed;
		if (resolved.empty() || !ParsedUrl::Parse(resolved, parsed)) {
			return Skip(link, text, SkipReason::UNSUPPORTED_PATH);
		}
		if (parsed.scheme == "file") {
			return ResolveFile(link, PercentDecode(parsed.path), PercentDecode(parsed.fragment));
		}
		return ResolveWeb(link, resolved);
	}
	return ResolveRelativeFile(link, text, base);
}

} // namespace linkcheck

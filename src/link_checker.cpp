#include "link_checker.hpp"
#include "link_extractor.hpp"
#include "link_utils.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace linkcheck {

namespace fs = std::filesystem;

//===--------------------------------------------------------------------===//
// RetryPolicy
//===--------------------------------------------------------------------===//

std::chrono::milliseconds RetryPolicy::DelayAfter(int attempt, int retry_after_ms,
                                                  std::chrono::milliseconds previous) const {
	double delay = config_.initial_backoff_ms * std::pow(config_.backoff_multiplier, std::max(attempt - 1, 0));
	delay = std::min(delay, static_cast<double>(config_.max_backoff_ms));
	auto result = std::chrono::milliseconds(static_cast<int64_t>(delay));
	if (retry_after_ms > 0 && std::chrono::milliseconds(retry_after_ms) > result) {
		result = std::chrono::milliseconds(retry_after_ms);
	}
	return std::max(result, previous);
}

//===--------------------------------------------------------------------===//
// LinkChecker
//===--------------------------------------------------------------------===//

LinkChecker::LinkChecker(const LinkCheckConfig &config, HttpTransport &transport)
    : config_(config), transport_(transport), policy_(config.retry), credentials_(config.EffectiveCredentials()) {
}

std::vector<std::pair<std::string, std::string>> LinkChecker::HeadersFor(const std::string &host) const {
	std::vector<std::pair<std::string, std::string>> headers(config_.custom_headers.begin(),
	                                                         config_.custom_headers.end());
	for (const auto &credential : credentials_) {
		if (!credential.Matches(host)) {
			continue;
		}
		// A host credential replaces a custom header of the same name
		auto existing = std::find_if(headers.begin(), headers.end(), [&](const std::pair<std::string, std::string> &h) {
			return ToLower(h.first) == ToLower(credential.header_name);
		});
		if (existing != headers.end()) {
			existing->second = credential.header_value;
		} else {
			headers.emplace_back(credential.header_name, credential.header_value);
		}
	}
	return headers;
}

static bool ShouldFallbackToGet(const HttpResponse &response) {
	if (response.transport_error == TransportError::EMPTY_REPLY) {
		return true;
	}
	return response.Completed() && (response.status_code == 405 || response.status_code == 501);
}

HttpRequest LinkChecker::BuildRequest(const Target &target, const std::atomic<bool> *cancel) const {
	HttpRequest request;
	request.url = target.uri;
	request.method = config_.method;
	request.headers = HeadersFor(target.host);
	request.user_agent = config_.user_agent;
	request.timeout = config_.timeout;
	request.connect_timeout = config_.connect_timeout;
	request.basic_auth = config_.basic_auth;
	request.max_redirects = config_.max_redirects;
	request.insecure_tls = config_.insecure_tls;
	request.cancel = cancel;
	return request;
}

AttemptOutcome LinkChecker::AttemptWeb(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
                                       const std::atomic<bool> *cancel) {
	HttpRequest request = BuildRequest(target, cancel);
	HttpResponse response = transport_.Execute(request);
	if (request.method == RequestMethod::HEAD && ShouldFallbackToGet(response)) {
		Logger::Debug("HEAD rejected by " + target.uri + ", retrying with GET");
		request.method = RequestMethod::GET;
		response = transport_.Execute(request);
	}
	return Classify(target, attempt, previous_delay, response);
}

AttemptOutcome LinkChecker::Classify(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
                                     const HttpResponse &response) const {
	AttemptOutcome outcome;
	CheckResult &result = outcome.result;
	result = CheckResult::ForTarget(target);
	result.attempts = attempt;

	result.http_status = response.status_code;
	result.final_url = response.final_url;
	result.redirect_count = response.redirect_count;

	bool retryable = false;
	if (!response.Completed()) {
		result.detail = response.error;
		result.timed_out = response.transport_error == TransportError::TIMEOUT;
		result.status = CheckStatus::FAILURE;
		switch (response.transport_error) {
		case TransportError::CANCELLED:
			result.reason = reason::CANCELLED;
			return outcome;
		case TransportError::TLS:
			result.reason = reason::TLS_ERROR;
			return outcome;
		case TransportError::TOO_MANY_REDIRECTS:
			result.reason = reason::TOO_MANY_REDIRECTS;
			return outcome;
		default:
			if (!IsRetryableTransportError(response.transport_error)) {
				result.reason = reason::TRANSPORT_ERROR;
				return outcome;
			}
			retryable = true;
			break;
		}
	} else {
		int status = response.status_code;
		if (status >= 200 && status < 300) {
			result.status = CheckStatus::SUCCESS;
			result.reason = reason::OK;
			return outcome;
		}
		if (config_.accepted_status_codes.Contains(status)) {
			result.status = CheckStatus::SUCCESS;
			result.reason = reason::ACCEPTED_STATUS;
			return outcome;
		}
		if (status >= 300 && status < 400) {
			result.status = CheckStatus::SUCCESS;
			result.reason = reason::REDIRECTED;
			return outcome;
		}
		result.status = CheckStatus::FAILURE;
		result.detail = "HTTP " + std::to_string(status);
		if (!config_.retry_status_codes.Contains(status)) {
			result.reason = reason::HTTP_STATUS;
			return outcome;
		}
		retryable = true;
	}

	if (retryable && attempt < policy_.MaxAttempts()) {
		outcome.retry = true;
		outcome.delay = policy_.DelayAfter(attempt, ParseRetryAfter(response.retry_after), previous_delay);
		result.reason = reason::EXHAUSTED_RETRIES;
		Logger::Debug("Attempt " + std::to_string(attempt) + " for " + target.uri + " failed (" + result.detail +
		              "), retrying in " + std::to_string(outcome.delay.count()) + "ms");
		return outcome;
	}
	result.reason = reason::EXHAUSTED_RETRIES;
	return outcome;
}

bool LinkChecker::IsValidMailAddress(const std::string &address) {
	if (address.empty() || address.size() > 254) {
		return false;
	}
	size_t at = address.rfind('@');
	if (at == std::string::npos || at == 0 || at > 64 || at + 1 >= address.size()) {
		return false;
	}
	std::string local = address.substr(0, at);
	std::string domain = address.substr(at + 1);

	if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string::npos) {
		return false;
	}
	for (unsigned char c : local) {
		if (!std::isalnum(c) && (c == '\0' || !std::strchr(".!#$%&'*+/=?^_`{|}~-", c))) {
			return false;
		}
	}

	auto labels = SplitAndTrim(domain, '.');
	if (labels.size() < 2 || domain.front() == '.' || domain.back() == '.' ||
	    domain.find("..") != std::string::npos) {
		return false;
	}
	for (const auto &label : labels) {
		if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-') {
			return false;
		}
		for (unsigned char c : label) {
			if (!std::isalnum(c) && c != '-') {
				return false;
			}
		}
	}
	const std::string &tld = labels.back();
	return std::all_of(tld.begin(), tld.end(), [](unsigned char c) { return std::isalpha(c); });
}

CheckResult LinkChecker::CheckMail(const Target &target) const {
	CheckResult result = CheckResult::ForTarget(target);
	result.attempts = 1;
	if (IsValidMailAddress(target.uri)) {
		result.status = CheckStatus::SUCCESS;
		result.reason = reason::OK;
	} else {
		result.status = CheckStatus::FAILURE;
		result.reason = reason::INVALID_MAIL;
		result.detail = "Invalid mail address: " + target.uri;
	}
	return result;
}

bool LinkChecker::LoadAnchors(const std::string &path, std::set<std::string> &anchors) {
	{
		std::lock_guard<std::mutex> lock(anchor_mutex_);
		auto entry = anchor_cache_.find(path);
		if (entry != anchor_cache_.end()) {
			anchors = entry->second;
			return true;
		}
	}
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		return false;
	}
	std::ostringstream buffer;
	buffer << file.rdbuf();

	Document doc;
	doc.id = path;
	doc.content = buffer.str();
	doc.format = LinkExtractor::InferFormat(path);
	anchors = LinkExtractor::ExtractAnchors(doc);

	std::lock_guard<std::mutex> lock(anchor_mutex_);
	anchor_cache_[path] = anchors;
	return true;
}

CheckResult LinkChecker::CheckFile(const Target &target) {
	CheckResult result = CheckResult::ForTarget(target);
	result.attempts = 1;

	std::error_code ec;
	if (!fs::exists(target.uri, ec)) {
		result.status = CheckStatus::FAILURE;
		result.reason = reason::NOT_FOUND;
		result.detail = "File not found: " + target.uri;
		return result;
	}

	bool anchor_checkable = config_.check_anchors && !target.fragment.empty() && fs::is_regular_file(target.uri, ec) &&
	                        LinkExtractor::InferFormat(target.uri) != DocumentFormat::PLAINTEXT;
	if (anchor_checkable) {
		std::set<std::string> anchors;
		if (!LoadAnchors(target.uri, anchors)) {
			result.status = CheckStatus::FAILURE;
			result.reason = reason::NOT_FOUND;
			result.detail = "Cannot read file: " + target.uri;
			return result;
		}
		if (anchors.count(target.fragment) == 0 && anchors.count(ToLower(target.fragment)) == 0) {
			result.status = CheckStatus::FAILURE;
			result.reason = reason::ANCHOR_NOT_FOUND;
			result.detail = "Anchor '#" + target.fragment + "' not found in " + target.uri;
			return result;
		}
	}

	result.status = CheckStatus::SUCCESS;
	result.reason = reason::OK;
	return result;
}

AttemptOutcome LinkChecker::Attempt(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
                                    const std::atomic<bool> *cancel) {
	auto start = std::chrono::steady_clock::now();
	AttemptOutcome outcome;
	switch (target.kind) {
	case TargetKind::WEB_URL:
		outcome = AttemptWeb(target, attempt, previous_delay, cancel);
		break;
	case TargetKind::FILE_PATH:
		outcome.result = CheckFile(target);
		break;
	case TargetKind::MAIL_ADDRESS:
		outcome.result = CheckMail(target);
		break;
	}
	outcome.result.elapsed =
	    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
	return outcome;
}

void LinkChecker::StartAttempt(const Target &target, int attempt, std::chrono::milliseconds previous_delay,
                               const std::atomic<bool> *cancel, AttemptCallback on_done) {
	if (target.kind != TargetKind::WEB_URL) {
		on_done(Attempt(target, attempt, previous_delay, cancel));
		return;
	}
	auto start = std::chrono::steady_clock::now();
	auto finish = [this, target, attempt, previous_delay, start, on_done](const HttpResponse &response) {
		AttemptOutcome outcome = Classify(target, attempt, previous_delay, response);
		outcome.result.elapsed =
		    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
		on_done(std::move(outcome));
	};
	HttpRequest request = BuildRequest(target, cancel);
	bool head = request.method == RequestMethod::HEAD;
	HttpRequest fallback = request;
	fallback.method = RequestMethod::GET;
	transport_.Submit(std::move(request), [this, head, fallback, finish](HttpResponse response) {
		if (head && ShouldFallbackToGet(response)) {
			Logger::Debug("HEAD rejected by " + fallback.url + ", retrying with GET");
			transport_.Submit(fallback, [finish](HttpResponse retried) { finish(retried); });
			return;
		}
		finish(response);
	});
}

CheckResult LinkChecker::Check(const Target &target) {
	auto start = std::chrono::steady_clock::now();
	std::chrono::milliseconds delay(0);
	for (int attempt = 1;; attempt++) {
		AttemptOutcome outcome = Attempt(target, attempt, delay);
		if (!outcome.retry) {
			outcome.result.elapsed =
			    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
			return outcome.result;
		}
		delay = outcome.delay;
		std::this_thread::sleep_for(delay);
	}
}

} // namespace linkcheck

#include "link_config.hpp"
#include "link_utils.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace linkcheck {

//===--------------------------------------------------------------------===//
// StatusCodeSet
//===--------------------------------------------------------------------===//

StatusCodeSet::StatusCodeSet(std::initializer_list<int> codes) {
	for (int code : codes) {
		Add(code);
	}
}

static int ParseStatusCode(const std::string &text, const std::string &codes) {
	if (text.empty() || text.size() > 3 ||
	    !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
		throw ConfigError("Invalid status code '" + text + "' in '" + codes + "'");
	}
	int code = std::stoi(text);
	if (code < 100 || code > 999) {
		throw ConfigError("Status code " + text + " out of range 100..999 in '" + codes + "'");
	}
	return code;
}

StatusCodeSet StatusCodeSet::Parse(const std::string &codes) {
	StatusCodeSet result;
	for (const auto &token : SplitAndTrim(codes, ',')) {
		size_t dots = token.find("..");
		size_t dash = token.find('-');
		if (dots != std::string::npos) {
			bool inclusive = dots + 2 < token.size() && token[dots + 2] == '=';
			std::string first = Trim(token.substr(0, dots));
			std::string last = Trim(token.substr(dots + (inclusive ? 3 : 2)));
			int lo = ParseStatusCode(first, codes);
			int hi = ParseStatusCode(last, codes);
			if (!inclusive) {
				hi--;
			}
			if (hi < lo) {
				throw ConfigError("Empty status code range '" + token + "'");
			}
			result.AddRange(lo, hi);
		} else if (dash != std::string::npos) {
			int lo = ParseStatusCode(Trim(token.substr(0, dash)), codes);
			int hi = ParseStatusCode(Trim(token.substr(dash + 1)), codes);
			if (hi < lo) {
				throw ConfigError("Empty status code range '" + token + "'");
			}
			result.AddRange(lo, hi);
		} else {
			result.Add(ParseStatusCode(token, codes));
		}
	}
	return result;
}

void StatusCodeSet::Add(int code) {
	AddRange(code, code);
}

void StatusCodeSet::AddRange(int first, int last) {
	ranges_.emplace_back(first, last);
}

bool StatusCodeSet::Contains(int code) const {
	for (const auto &range : ranges_) {
		if (code >= range.first && code <= range.second) {
			return true;
		}
	}
	return false;
}

std::string StatusCodeSet::ToString() const {
	std::ostringstream out;
	for (size_t i = 0; i < ranges_.size(); i++) {
		if (i > 0) {
			out << ",";
		}
		if (ranges_[i].first == ranges_[i].second) {
			out << ranges_[i].first;
		} else {
			out << ranges_[i].first << "..=" << ranges_[i].second;
		}
	}
	return out.str();
}

//===--------------------------------------------------------------------===//
// Credentials
//===--------------------------------------------------------------------===//

BasicAuth BasicAuth::Parse(const std::string &credentials) {
	BasicAuth auth;
	if (credentials.empty()) {
		return auth;
	}
	size_t colon = credentials.find(':');
	if (colon == std::string::npos || colon == 0) {
		throw ConfigError("Basic auth credentials must have the form 'user:password'");
	}
	auth.username = credentials.substr(0, colon);
	auth.password = credentials.substr(colon + 1);
	return auth;
}

bool HostCredential::Matches(const std::string &host) const {
	std::string lower_host = ToLower(host);
	std::string pattern = ToLower(host_pattern);
	if (lower_host == pattern) {
		return true;
	}
	std::string suffix = "." + pattern;
	return EndsWith(lower_host, suffix);
}

RequestMethod RequestMethodFromString(const std::string &name) {
	std::string lower = ToLower(Trim(name));
	if (lower == "head") {
		return RequestMethod::HEAD;
	}
	if (lower == "get") {
		return RequestMethod::GET;
	}
	throw ConfigError("Only 'get' and 'head' request methods are allowed, got '" + name + "'");
}

//===--------------------------------------------------------------------===//
// LinkCheckConfig
//===--------------------------------------------------------------------===//

void LinkCheckConfig::SetSkipPrivate(bool skip) {
	exclude_private = skip;
	exclude_loopback = skip;
	exclude_link_local = skip;
}

std::vector<HostCredential> LinkCheckConfig::EffectiveCredentials() const {
	std::vector<HostCredential> credentials = host_credentials;
	if (!github_token.empty()) {
		for (const char *host : {"github.com", "api.github.com", "raw.githubusercontent.com"}) {
			credentials.push_back({host, "Authorization", "Bearer " + github_token});
		}
	}
	return credentials;
}

static void ValidateHeaderName(const std::string &name) {
	if (name.empty() || name.find_first_of(":\r\n ") != std::string::npos) {
		throw ConfigError("Invalid header name: '" + name + "'");
	}
}

static void ValidatePatterns(const std::vector<std::string> &patterns, const char *what) {
	for (const auto &pattern : patterns) {
		try {
			std::regex compiled(pattern, std::regex::ECMAScript);
		} catch (std::regex_error &e) {
			throw ConfigError(std::string("Invalid ") + what + " pattern '" + pattern + "': " + e.what());
		}
	}
}

void LinkCheckConfig::Validate() const {
	if (max_concurrency < 1) {
		throw ConfigError("max_concurrency must be at least 1, got " + std::to_string(max_concurrency));
	}
	if (max_concurrency > MAX_CONCURRENCY_LIMIT) {
		throw ConfigError("max_concurrency must be at most " + std::to_string(MAX_CONCURRENCY_LIMIT) + ", got " +
		                  std::to_string(max_concurrency));
	}
	if (max_concurrency_per_host < 0) {
		throw ConfigError("max_concurrency_per_host must not be negative");
	}
	if (timeout.count() <= 0) {
		throw ConfigError("timeout must be positive");
	}
	if (global_timeout.count() < 0) {
		throw ConfigError("global_timeout must not be negative");
	}
	if (retry.max_attempts < 1) {
		throw ConfigError("retry_count must be at least 1, got " + std::to_string(retry.max_attempts));
	}
	if (retry.initial_backoff_ms < 0 || retry.max_backoff_ms < 0) {
		throw ConfigError("backoff delays must not be negative");
	}
	if (retry.backoff_multiplier < 1.0) {
		throw ConfigError("backoff_multiplier must be at least 1.0");
	}
	if (max_redirects < 0) {
		throw ConfigError("max_redirects must not be negative");
	}
	for (const auto &scheme : allowed_schemes) {
		std::string lower = ToLower(scheme);
		if (lower != "http" && lower != "https") {
			throw ConfigError("Unsupported scheme filter '" + scheme + "' (only http and https can be checked)");
		}
	}
	ValidatePatterns(include_patterns, "include");
	ValidatePatterns(exclude_patterns, "exclude");
	for (const auto &header : custom_headers) {
		ValidateHeaderName(header.first);
	}
	for (const auto &credential : host_credentials) {
		if (credential.host_pattern.empty()) {
			throw ConfigError("Host credential without host pattern");
		}
		ValidateHeaderName(credential.header_name);
	}
	if (!basic_auth.username.empty() && basic_auth.username.find(':') != std::string::npos) {
		throw ConfigError("Basic auth user name must not contain ':'");
	}
}

} // namespace linkcheck

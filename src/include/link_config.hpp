#pragma once

//===--------------------------------------------------------------------===//
// link_config.hpp - Engine configuration surface
//===--------------------------------------------------------------------===//

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#define LINKCHECK_VERSION "0.4.0"

namespace linkcheck {

// Invalid configuration; raised before any checking begins
class ConfigError : public std::runtime_error {
public:
	explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {}
};

// An input document could not be read or fetched
class InputError : public std::runtime_error {
public:
	explicit InputError(const std::string &msg) : std::runtime_error(msg) {}
};

//===--------------------------------------------------------------------===//
// StatusCodeSet
//===--------------------------------------------------------------------===//

// Set of HTTP status codes, stored as inclusive ranges
class StatusCodeSet {
public:
	StatusCodeSet() = default;
	StatusCodeSet(std::initializer_list<int> codes);

	// Parses "200,204", "200..=299", "200..299" (exclusive end), "500-504".
	// Throws ConfigError on malformed input or codes outside 100..999.
	static StatusCodeSet Parse(const std::string &codes);

	void Add(int code);
	void AddRange(int first, int last);
	bool Contains(int code) const;
	bool Empty() const {
		return ranges_.empty();
	}
	std::string ToString() const;

private:
	std::vector<std::pair<int, int>> ranges_;
};

//===--------------------------------------------------------------------===//
// Credentials
//===--------------------------------------------------------------------===//

struct BasicAuth {
	std::string username;
	std::string password;

	bool Empty() const {
		return username.empty();
	}
	// Parses "user:password"
	static BasicAuth Parse(const std::string &credentials);
};

// Header injected into every request whose host matches host_pattern
// (exact host or any subdomain of it)
struct HostCredential {
	std::string host_pattern;
	std::string header_name;
	std::string header_value;

	bool Matches(const std::string &host) const;
};

enum class RequestMethod : uint8_t {
	HEAD = 0,  // HEAD, falling back to GET when the server rejects HEAD
	GET = 1
};

RequestMethod RequestMethodFromString(const std::string &name);

struct RetryConfig {
	int max_attempts = 3;
	int initial_backoff_ms = 1000;
	double backoff_multiplier = 2.0;
	int max_backoff_ms = 30000;
};

//===--------------------------------------------------------------------===//
// LinkCheckConfig
//===--------------------------------------------------------------------===//

// Upper bound for max_concurrency; each slot may hold an open connection
constexpr int MAX_CONCURRENCY_LIMIT = 1024;

struct LinkCheckConfig {
	// Scheduling
	int max_concurrency = 32;
	int max_concurrency_per_host = 0;             // 0 = no per-host gate
	std::chrono::milliseconds timeout{30000};     // per request
	std::chrono::milliseconds connect_timeout{10000};
	std::chrono::milliseconds global_timeout{0};  // 0 = none

	// Retry / backoff
	RetryConfig retry;
	StatusCodeSet retry_status_codes{429, 500, 502, 503, 504};

	// Classification
	StatusCodeSet accepted_status_codes;
	RequestMethod method = RequestMethod::HEAD;
	int max_redirects = 5;

	// Filtering
	std::vector<std::string> include_patterns;
	std::vector<std::string> exclude_patterns;
	std::vector<std::string> allowed_schemes;  // empty = http and https
	bool exclude_private = false;
	bool exclude_loopback = false;
	bool exclude_link_local = false;
	bool exclude_mail = false;

	// Request decoration
	std::string user_agent = "linkcheck/" LINKCHECK_VERSION;
	BasicAuth basic_auth;
	std::map<std::string, std::string> custom_headers;
	std::string github_token;
	std::vector<HostCredential> host_credentials;
	bool insecure_tls = false;

	// Local files
	bool check_anchors = false;
	std::string root_dir;                   // resolves "/absolute" links in files
	std::vector<std::string> allowed_roots; // empty = any path

	// Inputs
	size_t max_document_bytes = 10 * 1024 * 1024;

	// Reporting
	bool count_skipped_as_checked = false;

	// Sets exclude_private, exclude_loopback and exclude_link_local together
	void SetSkipPrivate(bool skip);

	// Credential table including the github_token entries
	std::vector<HostCredential> EffectiveCredentials() const;

	// Throws ConfigError describing the first invalid option
	void Validate() const;
};

} // namespace linkcheck

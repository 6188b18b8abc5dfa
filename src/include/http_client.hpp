#pragma once

#include "link_config.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <mutex>
#include <curl/curl.h>

namespace linkcheck {

// Transport-level failure classes. Retryability is decided by the checker.
enum class TransportError : uint8_t {
	NONE = 0,
	TIMEOUT = 1,
	DNS = 2,
	CONNECT = 3,
	TLS = 4,
	TOO_MANY_REDIRECTS = 5,
	EMPTY_REPLY = 6,
	SEND_RECV = 7,       // connection reset, partial transfer
	CANCELLED = 8,
	OTHER = 9
};

const char *TransportErrorToString(TransportError error);
bool IsRetryableTransportError(TransportError error);

struct HttpRequest {
	std::string url;
	RequestMethod method = RequestMethod::GET;
	std::vector<std::pair<std::string, std::string>> headers;
	std::string user_agent;
	std::chrono::milliseconds timeout{30000};
	std::chrono::milliseconds connect_timeout{10000};
	BasicAuth basic_auth;
	int max_redirects = 5;
	bool insecure_tls = false;
	bool compress = true;
	// Checks only need the status line; bodies are kept for documents
	bool keep_body = false;
	size_t max_body_bytes = 0;  // 0 = unlimited
	// Aborts the transfer when set
	const std::atomic<bool> *cancel = nullptr;
};

struct HttpResponse {
	int status_code = 0;
	std::string body;
	std::string content_type;
	std::string retry_after;
	std::string error;
	TransportError transport_error = TransportError::NONE;
	std::string final_url;        // Final URL after redirects
	int redirect_count = 0;       // Number of redirects followed
	bool truncated = false;       // body cut at max_body_bytes

	bool Completed() const {
		return transport_error == TransportError::NONE;
	}
};

using HttpCompletion = std::function<void(HttpResponse)>;

// Network seam of the checker and the input loader
class HttpTransport {
public:
	virtual ~HttpTransport() = default;

	// Blocks the calling thread until the transfer ends
	virtual HttpResponse Execute(const HttpRequest &request) = 0;

	// Starts a transfer and returns at once. on_done runs exactly once, on a
	// transport thread, when the transfer ends; it may call Submit again.
	virtual void Submit(HttpRequest request, HttpCompletion on_done) = 0;
};

// Thread-safe connection pool for curl handles
class HttpConnectionPool {
public:
	HttpConnectionPool();
	~HttpConnectionPool();

	// Disable copy/move
	HttpConnectionPool(const HttpConnectionPool&) = delete;
	HttpConnectionPool& operator=(const HttpConnectionPool&) = delete;

	// Get a curl easy handle (reuses from pool or creates new)
	CURL* AcquireHandle();
	// Return handle to pool for reuse
	void ReleaseHandle(CURL* handle);

	// Get HTTP version string for logging
	static std::string GetHttpVersionString();

private:
	std::mutex pool_mutex_;
	std::vector<CURL*> available_handles_;
};

// libcurl transport. Execute runs an easy handle on the caller's thread;
// Submit hands transfers to one event-loop thread driving a multi handle.
class CurlHttpTransport : public HttpTransport {
public:
	CurlHttpTransport();
	~CurlHttpTransport() override;

	CurlHttpTransport(const CurlHttpTransport&) = delete;
	CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

	HttpResponse Execute(const HttpRequest &request) override;
	void Submit(HttpRequest request, HttpCompletion on_done) override;

private:
	struct Transfer;

	void EventLoop();
	void Start(std::unique_ptr<Transfer> transfer);
	void Finish(CURL* handle, CURLcode code);
	void Abort(std::unique_ptr<Transfer> transfer, const std::string &reason);

	HttpConnectionPool pool_;

	// Guards pending_, stopping_ and the lazy start of the loop
	std::mutex loop_mutex_;
	CURLM* multi_ = nullptr;
	std::thread loop_;
	bool stopping_ = false;
	std::vector<std::unique_ptr<Transfer>> pending_;
	// Owned by the loop thread
	std::map<CURL*, std::unique_ptr<Transfer>> active_;
};

TransportError ClassifyCurlError(CURLcode code);

// Retry-After in milliseconds (delta-seconds or HTTP-date), 0 if absent or invalid
int ParseRetryAfter(const std::string &retry_after);

} // namespace linkcheck

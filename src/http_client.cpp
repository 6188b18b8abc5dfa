#include "http_client.hpp"
#include "link_utils.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace linkcheck {

// Determine HTTP version at compile time based on available features
#if defined(LINKCHECK_HTTP2_SUPPORT) && LINKCHECK_HTTP2_SUPPORT
static constexpr long LINKCHECK_HTTP_VERSION = CURL_HTTP_VERSION_2TLS;
static constexpr const char* LINKCHECK_HTTP_VERSION_STR = "HTTP/2";
#else
static constexpr long LINKCHECK_HTTP_VERSION = CURL_HTTP_VERSION_1_1;
static constexpr const char* LINKCHECK_HTTP_VERSION_STR = "HTTP/1.1";
#endif

// Max pooled handles per transport
static constexpr size_t MAX_POOLED_HANDLES = 100;

const char *TransportErrorToString(TransportError error) {
	switch (error) {
		case TransportError::NONE: return "none";
		case TransportError::TIMEOUT: return "timeout";
		case TransportError::DNS: return "dns";
		case TransportError::CONNECT: return "connect";
		case TransportError::TLS: return "tls";
		case TransportError::TOO_MANY_REDIRECTS: return "too_many_redirects";
		case TransportError::EMPTY_REPLY: return "empty_reply";
		case TransportError::SEND_RECV: return "send_recv";
		case TransportError::CANCELLED: return "cancelled";
		case TransportError::OTHER: return "other";
		default: return "unknown";
	}
}

bool IsRetryableTransportError(TransportError error) {
	switch (error) {
		case TransportError::TIMEOUT:
		case TransportError::DNS:
		case TransportError::CONNECT:
		case TransportError::EMPTY_REPLY:
		case TransportError::SEND_RECV:
			return true;
		default:
			return false;
	}
}

TransportError ClassifyCurlError(CURLcode code) {
	switch (code) {
		case CURLE_OK:
			return TransportError::NONE;
		case CURLE_OPERATION_TIMEDOUT:
			return TransportError::TIMEOUT;
		case CURLE_COULDNT_RESOLVE_HOST:
		case CURLE_COULDNT_RESOLVE_PROXY:
			return TransportError::DNS;
		case CURLE_COULDNT_CONNECT:
			return TransportError::CONNECT;
		case CURLE_SSL_CONNECT_ERROR:
		case CURLE_PEER_FAILED_VERIFICATION:
		case CURLE_SSL_CERTPROBLEM:
		case CURLE_SSL_CIPHER:
		case CURLE_SSL_CACERT_BADFILE:
		case CURLE_SSL_ENGINE_NOTFOUND:
		case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
		case CURLE_USE_SSL_FAILED:
			return TransportError::TLS;
		case CURLE_TOO_MANY_REDIRECTS:
			return TransportError::TOO_MANY_REDIRECTS;
		case CURLE_GOT_NOTHING:
			return TransportError::EMPTY_REPLY;
		case CURLE_SEND_ERROR:
		case CURLE_RECV_ERROR:
		case CURLE_PARTIAL_FILE:
		case CURLE_HTTP2:
		case CURLE_HTTP2_STREAM:
			return TransportError::SEND_RECV;
		case CURLE_ABORTED_BY_CALLBACK:
			return TransportError::CANCELLED;
		default:
			return TransportError::OTHER;
	}
}

int ParseRetryAfter(const std::string &retry_after) {
	std::string value = Trim(retry_after);
	if (value.empty()) {
		return 0;
	}
	if (std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
		if (value.size() > 6) {
			return 0;
		}
		return std::stoi(value) * 1000;
	}
	// HTTP-date form
	time_t when = curl_getdate(value.c_str(), nullptr);
	if (when < 0) {
		return 0;
	}
	time_t now = std::time(nullptr);
	if (when <= now) {
		return 0;
	}
	long long delta = static_cast<long long>(when - now);
	return delta > 86400 ? 86400 * 1000 : static_cast<int>(delta * 1000);
}

//===--------------------------------------------------------------------===//
// HttpConnectionPool
//===--------------------------------------------------------------------===//

HttpConnectionPool::HttpConnectionPool() {
}

HttpConnectionPool::~HttpConnectionPool() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	for (CURL* handle : available_handles_) {
		curl_easy_cleanup(handle);
	}
	available_handles_.clear();
}

CURL* HttpConnectionPool::AcquireHandle() {
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (!available_handles_.empty()) {
		CURL* handle = available_handles_.back();
		available_handles_.pop_back();
		curl_easy_reset(handle);  // Reset for reuse but keep connection alive
		return handle;
	}
	return curl_easy_init();
}

void HttpConnectionPool::ReleaseHandle(CURL* handle) {
	if (!handle) return;
	std::lock_guard<std::mutex> lock(pool_mutex_);
	if (available_handles_.size() < MAX_POOLED_HANDLES) {
		available_handles_.push_back(handle);
	} else {
		curl_easy_cleanup(handle);
	}
}

std::string HttpConnectionPool::GetHttpVersionString() {
	return LINKCHECK_HTTP_VERSION_STR;
}

//===--------------------------------------------------------------------===//
// CurlHttpTransport
//===--------------------------------------------------------------------===//

static std::once_flag curl_init_flag;

CurlHttpTransport::CurlHttpTransport() {
	std::call_once(curl_init_flag, []() {
		curl_global_init(CURL_GLOBAL_DEFAULT);
		Logger::Debug("curl initialized, preferring " + HttpConnectionPool::GetHttpVersionString());
	});
}

// Callback data structures
struct WriteData {
	std::string* body;
	bool keep_body;
	size_t max_bytes;
	bool stopped = false;  // transfer ended on purpose by the write callback
	bool truncated = false;
};

struct HeaderData {
	std::string content_type;
	std::string retry_after;
};

// Write callback for response body
static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
	size_t total_size = size * nmemb;
	WriteData* data = static_cast<WriteData*>(userp);
	if (!data->keep_body) {
		// Status and headers are known once the body starts
		data->stopped = true;
		return 0;
	}
	if (data->max_bytes > 0 && data->body->size() + total_size > data->max_bytes) {
		data->body->append(static_cast<char*>(contents), data->max_bytes - data->body->size());
		data->stopped = true;
		data->truncated = true;
		return 0;
	}
	data->body->append(static_cast<char*>(contents), total_size);
	return total_size;
}

// Header callback for response headers
static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
	size_t total_size = size * nitems;
	HeaderData* headers = static_cast<HeaderData*>(userdata);

	std::string header(buffer, total_size);

	// A new status line starts the headers of the next hop
	if (StartsWith(header, "HTTP/")) {
		headers->content_type.clear();
		headers->retry_after.clear();
		return total_size;
	}

	size_t colon_pos = header.find(':');
	if (colon_pos != std::string::npos) {
		std::string name = ToLower(Trim(header.substr(0, colon_pos)));
		std::string value = Trim(header.substr(colon_pos + 1));

		if (name == "content-type") {
			headers->content_type = value;
		} else if (name == "retry-after") {
			headers->retry_after = value;
		}
	}

	return total_size;
}

static int ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
	auto cancel = static_cast<const std::atomic<bool>*>(clientp);
	return cancel && cancel->load() ? 1 : 0;
}

// Applies request options to an easy handle. Returns the header list the handle
// now points at; the caller frees it once the transfer is done.
static struct curl_slist* ConfigureHandle(CURL* curl, const HttpRequest &request, WriteData &write_data,
                                          HeaderData &header_data) {
	curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, LINKCHECK_HTTP_VERSION);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

	if (request.method == RequestMethod::HEAD) {
		curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
	} else {
		curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
	}

	// Set callbacks
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_data);
	curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, HeaderCallback);
	curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_data);
	if (request.cancel) {
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
		curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, ProgressCallback);
		curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.cancel);
	}

	if (!request.user_agent.empty()) {
		curl_easy_setopt(curl, CURLOPT_USERAGENT, request.user_agent.c_str());
	}
	if (request.compress) {
		curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
	}

	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout.count()));

	// Follow redirects
	curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.max_redirects > 0 ? 1L : 0L);
	curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(request.max_redirects));

	if (request.insecure_tls) {
		curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
		curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
	}

	if (!request.basic_auth.Empty()) {
		curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
		curl_easy_setopt(curl, CURLOPT_USERNAME, request.basic_auth.username.c_str());
		curl_easy_setopt(curl, CURLOPT_PASSWORD, request.basic_auth.password.c_str());
	}

	struct curl_slist* custom_headers = nullptr;
	for (const auto &header : request.headers) {
		std::string line = header.first + ": " + header.second;
		custom_headers = curl_slist_append(custom_headers, line.c_str());
	}
	if (custom_headers) {
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, custom_headers);
	}
	return custom_headers;
}

static HttpResponse ReadResponse(CURL* curl, CURLcode res, std::string &body, const WriteData &write_data,
                                 HeaderData &header_data) {
	HttpResponse response;
	if (res == CURLE_WRITE_ERROR && write_data.stopped) {
		res = CURLE_OK;
	}

	if (res == CURLE_OK) {
		long status_code = 0;
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
		response.status_code = static_cast<int>(status_code);

		// Get redirect info
		char* effective_url = nullptr;
		curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective_url);
		if (effective_url) {
			response.final_url = effective_url;
		}
		long redirect_count = 0;
		curl_easy_getinfo(curl, CURLINFO_REDIRECT_COUNT, &redirect_count);
		response.redirect_count = static_cast<int>(redirect_count);

		response.body = std::move(body);
		response.truncated = write_data.truncated;
		response.content_type = std::move(header_data.content_type);
		response.retry_after = std::move(header_data.retry_after);
	} else {
		response.error = curl_easy_strerror(res);
		response.transport_error = ClassifyCurlError(res);
		response.status_code = 0;
	}
	return response;
}

HttpResponse CurlHttpTransport::Execute(const HttpRequest &request) {
	CURL* curl = pool_.AcquireHandle();
	if (!curl) {
		HttpResponse response;
		response.error = "Failed to acquire curl handle";
		response.transport_error = TransportError::OTHER;
		return response;
	}

	// Response data
	std::string body;
	WriteData write_data{&body, request.keep_body, request.max_body_bytes};
	HeaderData header_data;

	struct curl_slist* custom_headers = ConfigureHandle(curl, request, write_data, header_data);
	CURLcode res = curl_easy_perform(curl);
	HttpResponse response = ReadResponse(curl, res, body, write_data, header_data);

	if (custom_headers) {
		curl_slist_free_all(custom_headers);
	}
	pool_.ReleaseHandle(curl);

	return response;
}

//===--------------------------------------------------------------------===//
// Multi-handle event loop
//===--------------------------------------------------------------------===//

// How long the loop sleeps in curl_multi_poll when no socket is ready
static constexpr int LOOP_POLL_MS = 100;

struct CurlHttpTransport::Transfer {
	HttpRequest request;
	HttpCompletion on_done;
	CURL* handle = nullptr;
	struct curl_slist* headers = nullptr;
	std::string body;
	WriteData write_data{&body, false, 0};
	HeaderData header_data;
};

CurlHttpTransport::~CurlHttpTransport() {
	{
		std::lock_guard<std::mutex> lock(loop_mutex_);
		stopping_ = true;
		if (multi_) {
			curl_multi_wakeup(multi_);
		}
	}
	if (loop_.joinable()) {
		loop_.join();
	}
	if (multi_) {
		curl_multi_cleanup(multi_);
	}
}

void CurlHttpTransport::Submit(HttpRequest request, HttpCompletion on_done) {
	auto transfer = std::make_unique<Transfer>();
	transfer->request = std::move(request);
	transfer->on_done = std::move(on_done);
	transfer->write_data = WriteData{&transfer->body, transfer->request.keep_body, transfer->request.max_body_bytes};

	{
		std::lock_guard<std::mutex> lock(loop_mutex_);
		if (!stopping_) {
			if (!multi_) {
				multi_ = curl_multi_init();
				if (!multi_) {
					throw std::runtime_error("Failed to create curl multi handle");
				}
				try {
					loop_ = std::thread(&CurlHttpTransport::EventLoop, this);
				} catch (std::exception &) {
					curl_multi_cleanup(multi_);
					multi_ = nullptr;
					throw;
				}
			}
			pending_.push_back(std::move(transfer));
			curl_multi_wakeup(multi_);
			return;
		}
	}
	Abort(std::move(transfer), "HTTP transport shut down");
}

void CurlHttpTransport::Abort(std::unique_ptr<Transfer> transfer, const std::string &reason) {
	HttpResponse response;
	response.error = reason;
	response.transport_error = TransportError::CANCELLED;
	if (transfer->headers) {
		curl_slist_free_all(transfer->headers);
	}
	if (transfer->handle) {
		pool_.ReleaseHandle(transfer->handle);
	}
	transfer->on_done(std::move(response));
}

void CurlHttpTransport::Start(std::unique_ptr<Transfer> transfer) {
	CURL* curl = pool_.AcquireHandle();
	if (!curl) {
		HttpResponse response;
		response.error = "Failed to acquire curl handle";
		response.transport_error = TransportError::OTHER;
		transfer->on_done(std::move(response));
		return;
	}
	transfer->handle = curl;
	transfer->headers = ConfigureHandle(curl, transfer->request, transfer->write_data, transfer->header_data);
	CURLMcode added = curl_multi_add_handle(multi_, curl);
	if (added != CURLM_OK) {
		HttpResponse response;
		response.error = curl_multi_strerror(added);
		response.transport_error = TransportError::OTHER;
		if (transfer->headers) {
			curl_slist_free_all(transfer->headers);
		}
		pool_.ReleaseHandle(curl);
		transfer->on_done(std::move(response));
		return;
	}
	active_[curl] = std::move(transfer);
}

void CurlHttpTransport::Finish(CURL* handle, CURLcode code) {
	auto entry = active_.find(handle);
	if (entry == active_.end()) {
		return;
	}
	std::unique_ptr<Transfer> transfer = std::move(entry->second);
	active_.erase(entry);
	curl_multi_remove_handle(multi_, handle);

	HttpResponse response = ReadResponse(handle, code, transfer->body, transfer->write_data, transfer->header_data);
	if (transfer->headers) {
		curl_slist_free_all(transfer->headers);
	}
	pool_.ReleaseHandle(handle);
	transfer->on_done(std::move(response));
}

void CurlHttpTransport::EventLoop() {
	for (;;) {
		std::vector<std::unique_ptr<Transfer>> starting;
		bool stopping;
		{
			std::lock_guard<std::mutex> lock(loop_mutex_);
			stopping = stopping_;
			starting.swap(pending_);
		}
		if (stopping) {
			for (auto &transfer : starting) {
				Abort(std::move(transfer), "HTTP transport shut down");
			}
			break;
		}
		for (auto &transfer : starting) {
			Start(std::move(transfer));
		}

		int running = 0;
		CURLMcode code = curl_multi_perform(multi_, &running);
		if (code != CURLM_OK) {
			Logger::Error(std::string("curl_multi_perform failed: ") + curl_multi_strerror(code));
		}

		CURLMsg* message = nullptr;
		int queued = 0;
		while ((message = curl_multi_info_read(multi_, &queued)) != nullptr) {
			if (message->msg != CURLMSG_DONE) {
				continue;
			}
			// message is invalid once its handle leaves the multi handle
			CURL* handle = message->easy_handle;
			CURLcode result = message->data.result;
			Finish(handle, result);
		}

		curl_multi_poll(multi_, nullptr, 0, LOOP_POLL_MS, nullptr);
	}

	for (auto &entry : active_) {
		curl_multi_remove_handle(multi_, entry.first);
		Abort(std::move(entry.second), "HTTP transport shut down");
	}
	active_.clear();
}

} // namespace linkcheck

#pragma once

#include "http_client.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace linkcheck {
namespace testing {

// Scripted HttpTransport: responses are queued per URL, the last one repeats.
// Unscripted URLs answer 200. Every request is recorded. Submitted requests
// each run on their own thread, joined on destruction.
class FakeTransport : public HttpTransport {
public:
	~FakeTransport() override;

	HttpResponse Execute(const HttpRequest &request) override;
	void Submit(HttpRequest request, HttpCompletion on_done) override;

	void Script(const std::string &url, HttpResponse response);
	void ScriptStatus(const std::string &url, int status);
	void ScriptStatus(const std::string &url, RequestMethod method, int status);
	void ScriptError(const std::string &url, TransportError error);

	// Each request blocks for this long (or until the request's cancel flag is set)
	void SetLatency(std::chrono::milliseconds latency) {
		latency_ = latency;
	}

	size_t CallCount() const;
	size_t CallCount(const std::string &url) const;
	std::vector<HttpRequest> Requests() const;
	std::vector<std::chrono::steady_clock::time_point> CallTimes(const std::string &url) const;
	size_t PeakConcurrent() const {
		return peak_concurrent_.load();
	}

	static HttpResponse Status(int status);
	static HttpResponse Error(TransportError error);

private:
	struct Key {
		std::string url;
		int method;  // -1 = any
		bool operator<(const Key &other) const {
			return url != other.url ? url < other.url : method < other.method;
		}
	};

	mutable std::mutex mutex_;
	std::map<Key, std::deque<HttpResponse>> scripts_;
	std::vector<HttpRequest> requests_;
	std::map<std::string, std::vector<std::chrono::steady_clock::time_point>> call_times_;
	std::chrono::milliseconds latency_{0};
	std::atomic<size_t> concurrent_{0};
	std::atomic<size_t> peak_concurrent_{0};

	std::mutex threads_mutex_;
	std::vector<std::thread> threads_;
};

// Creates a fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
	TempDir();
	~TempDir();
	TempDir(const TempDir &) = delete;
	TempDir &operator=(const TempDir &) = delete;

	const std::string &Path() const {
		return path_;
	}
	// Writes content to a path relative to the directory, creating parents
	std::string Write(const std::string &relative, const std::string &content) const;

private:
	std::string path_;
};

} // namespace testing
} // namespace linkcheck

#include "fake_transport.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <thread>

namespace linkcheck {
namespace testing {

namespace fs = std::filesystem;

HttpResponse FakeTransport::Status(int status) {
	HttpResponse response;
	response.status_code = status;
	return response;
}

HttpResponse FakeTransport::Error(TransportError error) {
	HttpResponse response;
	response.transport_error = error;
	response.error = std::string("simulated ") + TransportErrorToString(error);
	return response;
}

void FakeTransport::Script(const std::string &url, HttpResponse response) {
	std::lock_guard<std::mutex> lock(mutex_);
	scripts_[{url, -1}].push_back(std::move(response));
}

void FakeTransport::ScriptStatus(const std::string &url, int status) {
	Script(url, Status(status));
}

void FakeTransport::ScriptStatus(const std::string &url, RequestMethod method, int status) {
	std::lock_guard<std::mutex> lock(mutex_);
	scripts_[{url, static_cast<int>(method)}].push_back(Status(status));
}

void FakeTransport::ScriptError(const std::string &url, TransportError error) {
	Script(url, Error(error));
}

HttpResponse FakeTransport::Execute(const HttpRequest &request) {
	size_t now_concurrent = ++concurrent_;
	size_t peak = peak_concurrent_.load();
	while (now_concurrent > peak && !peak_concurrent_.compare_exchange_weak(peak, now_concurrent)) {
	}

	HttpResponse response = Status(200);
	{
		std::lock_guard<std::mutex> lock(mutex_);
		requests_.push_back(request);
		call_times_[request.url].push_back(std::chrono::steady_clock::now());
		auto entry = scripts_.find({request.url, static_cast<int>(request.method)});
		if (entry == scripts_.end()) {
			entry = scripts_.find({request.url, -1});
		}
		if (entry != scripts_.end() && !entry->second.empty()) {
			response = entry->second.front();
			if (entry->second.size() > 1) {
				entry->second.pop_front();
			}
		}
	}

	auto deadline = std::chrono::steady_clock::now() + latency_;
	while (std::chrono::steady_clock::now() < deadline) {
		if (request.cancel && request.cancel->load()) {
			response = Error(TransportError::CANCELLED);
			break;
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}

	if (response.final_url.empty() && response.Completed()) {
		response.final_url = request.url;
	}
	concurrent_--;
	return response;
}

void FakeTransport::Submit(HttpRequest request, HttpCompletion on_done) {
	std::lock_guard<std::mutex> lock(threads_mutex_);
	threads_.emplace_back([this, request, on_done]() { on_done(Execute(request)); });
}

FakeTransport::~FakeTransport() {
	// Completions may submit follow-up requests, so drain until nothing is left
	for (;;) {
		std::vector<std::thread> running;
		{
			std::lock_guard<std::mutex> lock(threads_mutex_);
			running.swap(threads_);
		}
		if (running.empty()) {
			return;
		}
		for (auto &thread : running) {
			thread.join();
		}
	}
}

size_t FakeTransport::CallCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return requests_.size();
}

size_t FakeTransport::CallCount(const std::string &url) const {
	std::lock_guard<std::mutex> lock(mutex_);
	size_t count = 0;
	for (const auto &request : requests_) {
		if (request.url == url) {
			count++;
		}
	}
	return count;
}

std::vector<HttpRequest> FakeTransport::Requests() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return requests_;
}

std::vector<std::chrono::steady_clock::time_point> FakeTransport::CallTimes(const std::string &url) const {
	std::lock_guard<std::mutex> lock(mutex_);
	auto entry = call_times_.find(url);
	return entry == call_times_.end() ? std::vector<std::chrono::steady_clock::time_point>() : entry->second;
}

TempDir::TempDir() {
	std::random_device device;
	std::mt19937_64 rng(device());
	fs::path base = fs::temp_directory_path();
	for (;;) {
		fs::path candidate = base / ("linkcheck_test_" + std::to_string(rng()));
		if (fs::create_directory(candidate)) {
			path_ = candidate.string();
			return;
		}
	}
}

TempDir::~TempDir() {
	std::error_code ec;
	fs::remove_all(path_, ec);
}

std::string TempDir::Write(const std::string &relative, const std::string &content) const {
	fs::path full = fs::path(path_) / relative;
	fs::create_directories(full.parent_path());
	std::ofstream out(full, std::ios::binary);
	out << content;
	return full.string();
}

} // namespace testing
} // namespace linkcheck

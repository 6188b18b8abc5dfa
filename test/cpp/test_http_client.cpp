#include "fake_transport.hpp"
#include "http_client.hpp"
#include <gtest/gtest.h>
#include <condition_variable>
#include <mutex>

using namespace linkcheck;
using linkcheck::testing::TempDir;

static HttpRequest FileRequest(const std::string &path) {
	HttpRequest request;
	request.url = "file://" + path;
	request.method = RequestMethod::GET;
	request.keep_body = true;
	return request;
}

TEST(CurlHttpTransportTest, SubmitCompletesEveryTransfer) {
	TempDir dir;
	const size_t count = 40;
	std::vector<std::string> paths;
	for (size_t i = 0; i < count; i++) {
		paths.push_back(dir.Write("page" + std::to_string(i) + ".txt", "body " + std::to_string(i)));
	}

	std::mutex mutex;
	std::condition_variable cv;
	std::vector<HttpResponse> responses(count);
	size_t finished = 0;
	{
		CurlHttpTransport transport;
		for (size_t i = 0; i < count; i++) {
			transport.Submit(FileRequest(paths[i]), [&, i](HttpResponse response) {
				std::lock_guard<std::mutex> lock(mutex);
				responses[i] = std::move(response);
				finished++;
				cv.notify_all();
			});
		}
		std::unique_lock<std::mutex> lock(mutex);
		ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(10), [&]() { return finished == count; }));
	}
	for (size_t i = 0; i < count; i++) {
		EXPECT_TRUE(responses[i].Completed()) << responses[i].error;
		EXPECT_EQ(responses[i].body, "body " + std::to_string(i));
	}
}

TEST(CurlHttpTransportTest, SubmitReportsMissingFile) {
	TempDir dir;
	std::mutex mutex;
	std::condition_variable cv;
	bool done = false;
	HttpResponse result;

	CurlHttpTransport transport;
	transport.Submit(FileRequest(dir.Path() + "/absent.txt"), [&](HttpResponse response) {
		std::lock_guard<std::mutex> lock(mutex);
		result = std::move(response);
		done = true;
		cv.notify_all();
	});
	std::unique_lock<std::mutex> lock(mutex);
	ASSERT_TRUE(cv.wait_for(lock, std::chrono::seconds(10), [&]() { return done; }));
	EXPECT_FALSE(result.Completed());
	EXPECT_FALSE(result.error.empty());
}

TEST(CurlHttpTransportTest, ExecuteReadsFile) {
	TempDir dir;
	std::string path = dir.Write("plain.txt", "hello");
	CurlHttpTransport transport;
	HttpResponse response = transport.Execute(FileRequest(path));
	EXPECT_TRUE(response.Completed());
	EXPECT_EQ(response.body, "hello");
}

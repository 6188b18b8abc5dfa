#pragma once

//===--------------------------------------------------------------------===//
// link_check_engine.hpp - Input -> extraction -> resolution -> checking -> Report
//===--------------------------------------------------------------------===//

#include "check_scheduler.hpp"
#include "http_client.hpp"
#include "input_loader.hpp"
#include "link_checker.hpp"
#include "link_config.hpp"
#include "link_types.hpp"
#include "url_resolver.hpp"
#include <memory>
#include <vector>

namespace linkcheck {

class LinkCheckEngine {
public:
	// Both constructors validate the configuration and throw ConfigError
	explicit LinkCheckEngine(LinkCheckConfig config);
	LinkCheckEngine(LinkCheckConfig config, HttpTransport &transport);

	LinkCheckEngine(const LinkCheckEngine &) = delete;
	LinkCheckEngine &operator=(const LinkCheckEngine &) = delete;

	Report Run(const std::vector<Document> &documents);
	// Throws InputError when an input cannot be read
	Report Run(const std::vector<InputSpec> &inputs);

	// Stops a Run in progress from another thread
	void Cancel();

	const SchedulerStats &LastStats() const {
		return last_stats_;
	}
	const LinkCheckConfig &Config() const {
		return config_;
	}

private:
	LinkCheckConfig config_;
	std::unique_ptr<HttpTransport> owned_transport_;
	HttpTransport &transport_;
	UrlResolver resolver_;
	LinkChecker checker_;
	CheckScheduler scheduler_;
	SchedulerStats last_stats_;
};

} // namespace linkcheck

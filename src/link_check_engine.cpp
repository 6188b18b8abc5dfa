#include "link_check_engine.hpp"
#include "link_extractor.hpp"
#include "logger.hpp"
#include "result_aggregator.hpp"

namespace linkcheck {

static LinkCheckConfig ValidatedConfig(LinkCheckConfig config) {
	try {
		config.Validate();
	} catch (ConfigError &e) {
		Logger::Error(std::string("Invalid configuration: ") + e.what());
		throw;
	}
	return config;
}

LinkCheckEngine::LinkCheckEngine(LinkCheckConfig config)
    : config_(ValidatedConfig(std::move(config))), owned_transport_(std::make_unique<CurlHttpTransport>()),
      transport_(*owned_transport_), resolver_(config_), checker_(config_, transport_),
      scheduler_(config_, checker_) {
}

LinkCheckEngine::LinkCheckEngine(LinkCheckConfig config, HttpTransport &transport)
    : config_(ValidatedConfig(std::move(config))), transport_(transport), resolver_(config_),
      checker_(config_, transport_), scheduler_(config_, checker_) {
}

void LinkCheckEngine::Cancel() {
	scheduler_.Cancel();
}

Report LinkCheckEngine::Run(const std::vector<Document> &documents) {
	ResultAggregator aggregator(config_.count_skipped_as_checked);
	std::vector<ScheduledTarget> targets;
	size_t link_count = 0;

	for (const auto &doc : documents) {
		size_t slot = aggregator.RegisterDocument(doc.id);
		auto links = LinkExtractor::ExtractLinks(doc);
		link_count += links.size();
		for (const auto &link : links) {
			Resolution resolution = resolver_.Resolve(link, doc.base);
			if (resolution.is_target) {
				targets.push_back({slot, std::move(resolution.target)});
			} else {
				aggregator.Record(slot, CheckResult::FromSkip(resolution.skip));
			}
		}
	}

	Logger::Info("Found " + std::to_string(link_count) + " links in " + std::to_string(documents.size()) +
	             " documents, " + std::to_string(targets.size()) + " to check");

	last_stats_ = scheduler_.Run(std::move(targets), aggregator);
	Report report = aggregator.Finalize();

	Logger::Info("Checked " + std::to_string(report.counts.checked) + " links: " +
	             std::to_string(report.counts.succeeded) + " ok, " + std::to_string(report.counts.failed) +
	             " failed, " + std::to_string(report.counts.excluded) + " excluded, " +
	             std::to_string(report.counts.skipped) + " skipped (peak concurrency " +
	             std::to_string(last_stats_.peak_in_flight) + ")");
	return report;
}

Report LinkCheckEngine::Run(const std::vector<InputSpec> &inputs) {
	InputLoader loader(config_, transport_);
	std::vector<Document> documents;
	try {
		documents = loader.Load(inputs);
	} catch (InputError &e) {
		Logger::Error(e.what());
		throw;
	}
	return Run(documents);
}

} // namespace linkcheck

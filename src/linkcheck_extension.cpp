#define DUCKDB_EXTENSION_MAIN

#include "linkcheck_extension.hpp"
#include "check_links_function.hpp"
#include "extract_links_function.hpp"
#include "link_config.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/extension_helper.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	auto &db = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db);

	// Autoload json extension for the report column
	ExtensionHelper::TryAutoLoadExtension(db, "json");

	config.AddExtensionOption("linkcheck_user_agent",
	                          "User agent string for link check requests",
	                          LogicalType::VARCHAR,
	                          Value("linkcheck/" LINKCHECK_VERSION));

	config.AddExtensionOption("linkcheck_timeout_ms",
	                          "Per-request timeout in milliseconds",
	                          LogicalType::BIGINT,
	                          Value::BIGINT(30000));

	config.AddExtensionOption("linkcheck_max_concurrency",
	                          "Maximum number of links checked at the same time",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(32));

	config.AddExtensionOption("linkcheck_retry_count",
	                          "Attempts per link before a retryable failure is final",
	                          LogicalType::INTEGER,
	                          Value::INTEGER(3));

	config.AddExtensionOption("linkcheck_log_level",
	                          "Log level written to stderr: none, error, warn, info or debug",
	                          LogicalType::VARCHAR,
	                          Value("warn"));

	// Register check_links() and check_links_report()
	RegisterCheckLinksFunction(loader);

	// Register extract_links()
	RegisterExtractLinksFunction(loader);
}

void LinkcheckExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string LinkcheckExtension::Name() {
	return "linkcheck";
}

std::string LinkcheckExtension::Version() const {
#ifdef EXT_VERSION_LINKCHECK
	return EXT_VERSION_LINKCHECK;
#else
	return LINKCHECK_VERSION;
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(linkcheck, loader) {
	duckdb::LoadInternal(loader);
}

}

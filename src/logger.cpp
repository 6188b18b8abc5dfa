#include "logger.hpp"
#include "link_config.hpp"
#include "link_utils.hpp"

namespace linkcheck {

std::atomic<LogLevel> Logger::level {LogLevel::WARN};
std::mutex Logger::output_mutex;

LogLevel LogLevelFromString(const std::string &name) {
	std::string lower = ToLower(Trim(name));
	if (lower == "none" || lower == "off") return LogLevel::NONE;
	if (lower == "error") return LogLevel::ERROR;
	if (lower == "warn" || lower == "warning") return LogLevel::WARN;
	if (lower == "info") return LogLevel::INFO;
	if (lower == "debug") return LogLevel::DEBUG;
	throw ConfigError("Unknown log level: '" + name + "' (expected none, error, warn, info or debug)");
}

} // namespace linkcheck

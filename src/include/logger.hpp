#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace linkcheck {

enum class LogLevel {
	NONE,
	ERROR,
	WARN,
	INFO,
	DEBUG
};

// Accepts none/error/warn/info/debug (case-insensitive). Throws ConfigError otherwise.
LogLevel LogLevelFromString(const std::string &name);

class Logger {
public:
	static std::atomic<LogLevel> level;

	static void SetLevel(LogLevel new_level) {
		level.store(new_level);
	}

	static void Debug(const std::string &msg) {
		if (level.load() >= LogLevel::DEBUG) {
			Write("[DEBUG] ", msg);
		}
	}

	static void Info(const std::string &msg) {
		if (level.load() >= LogLevel::INFO) {
			Write("[INFO] ", msg);
		}
	}

	static void Warn(const std::string &msg) {
		if (level.load() >= LogLevel::WARN) {
			Write("[WARN] ", msg);
		}
	}

	static void Error(const std::string &msg) {
		if (level.load() >= LogLevel::ERROR) {
			Write("[ERROR] ", msg);
		}
	}

private:
	static std::mutex output_mutex;

	static void Write(const char *tag, const std::string &msg) {
		std::lock_guard<std::mutex> lock(output_mutex);
		std::cerr << "linkcheck " << tag << msg << "\n";
	}
};

} // namespace linkcheck

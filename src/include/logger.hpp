#pragma once

#include <cstdint>
#include <string>

namespace webcrawl {

enum class LogLevel : uint8_t {
	VERBOSE = 0,
	INFO = 1,
	WARN = 2,
	ERROR = 3,
	OFF = 4
};

// Process-wide logger writing "YYYY-MM-DD HH:MM:SS,mmm - LEVEL: message" lines to stderr.
// Lines from concurrent workers never interleave.
class Logger {
public:
	static void SetLevel(LogLevel level);
	static LogLevel GetLevel();

	// Accepts "debug", "info", "warn", "error", "off" (case-insensitive)
	static bool ParseLevel(const std::string &name, LogLevel &level);
	static const char *LevelName(LogLevel level);

	static void Debug(const std::string &message);
	static void Info(const std::string &message);
	static void Warn(const std::string &message);
	static void Error(const std::string &message);

private:
	static void Write(LogLevel level, const std::string &message);
};

} // namespace webcrawl

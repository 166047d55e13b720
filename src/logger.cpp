#include "logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace webcrawl {

static std::atomic<uint8_t> g_log_level(static_cast<uint8_t>(LogLevel::INFO));
static std::mutex g_log_mutex;

void Logger::SetLevel(LogLevel level) {
	g_log_level.store(static_cast<uint8_t>(level));
}

LogLevel Logger::GetLevel() {
	return static_cast<LogLevel>(g_log_level.load());
}

bool Logger::ParseLevel(const std::string &name, LogLevel &level) {
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(),
	               [](unsigned char c) { return std::tolower(c); });
	if (lower == "debug") {
		level = LogLevel::VERBOSE;
	} else if (lower == "info") {
		level = LogLevel::INFO;
	} else if (lower == "warn" || lower == "warning") {
		level = LogLevel::WARN;
	} else if (lower == "error") {
		level = LogLevel::ERROR;
	} else if (lower == "off") {
		level = LogLevel::OFF;
	} else {
		return false;
	}
	return true;
}

const char *Logger::LevelName(LogLevel level) {
	switch (level) {
		case LogLevel::VERBOSE: return "DEBUG";
		case LogLevel::INFO: return "INFO";
		case LogLevel::WARN: return "WARNING";
		case LogLevel::ERROR: return "ERROR";
		default: return "";
	}
}

void Logger::Debug(const std::string &message) {
	Write(LogLevel::VERBOSE, message);
}

void Logger::Info(const std::string &message) {
	Write(LogLevel::INFO, message);
}

void Logger::Warn(const std::string &message) {
	Write(LogLevel::WARN, message);
}

void Logger::Error(const std::string &message) {
	Write(LogLevel::ERROR, message);
}

void Logger::Write(LogLevel level, const std::string &message) {
	if (level == LogLevel::OFF || static_cast<uint8_t>(level) < g_log_level.load()) {
		return;
	}

	auto now = std::chrono::system_clock::now();
	auto now_time_t = std::chrono::system_clock::to_time_t(now);
	auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

	struct tm local;
	localtime_r(&now_time_t, &local);
	char buf[32];
	strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);

	std::lock_guard<std::mutex> lock(g_log_mutex);
	fprintf(stderr, "%s,%03d - %s: %s\n", buf, static_cast<int>(millis), LevelName(level), message.c_str());
	fflush(stderr);
}

} // namespace webcrawl

#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace toolguard::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    if (value == "debug") return LogLevel::kDebug;
    if (value == "info") return LogLevel::kInfo;
    if (value == "warn" || value == "warning") return LogLevel::kWarn;
    if (value == "error") return LogLevel::kError;
    return fallback;
}

// Fields keep insertion order so lines read the same way every time.
struct LogMessage {
    LogLevel level = LogLevel::kInfo;
    std::string tag;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline std::atomic<LogLevel>& MinLogLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline void Configure(const LogConfig& config) {
    MinLogLevel().store(config.min_level);
}

inline void Write(const LogMessage& msg) {
    if (msg.level < MinLogLevel().load()) {
        return;
    }
    std::ostringstream line;
    line << "[" << msg.tag << "] " << msg.message;
    for (const auto& [key, value] : msg.fields) {
        line << " " << key << "=" << value;
    }
    if (msg.level >= LogLevel::kWarn) {
        line << " level=" << ToString(msg.level);
    }
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    std::cerr << line.str() << std::endl;
}

inline void Log(LogLevel level,
                std::string tag,
                std::string message,
                std::vector<std::pair<std::string, std::string>> fields = {}) {
    Write(LogMessage{level, std::move(tag), std::move(message), std::move(fields)});
}

}  // namespace toolguard::utils

#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>

namespace codetutor::utils {

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
    if (value == "debug" || value == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (value == "info" || value == "INFO") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "WARN" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error" || value == "ERROR") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline std::atomic<LogLevel>& MinLogLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline void ApplyLogConfig(const LogConfig& config) {
    MinLogLevel().store(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLogLevel().load());
}

// Writes one "[tag] message" line to stderr; the whole line is built first so
// lines from concurrent handlers do not interleave.
inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        line << ToString(level) << " ";
    }
    line << message << "\n";
    std::cerr << line.str() << std::flush;
}

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace codetutor::utils

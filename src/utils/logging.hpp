#pragma once

#include <string>
#include <unordered_map>

namespace codejoin::utils {

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

using LogFields = std::unordered_map<std::string, std::string>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();
bool IsEnabled(LogLevel level);

// Writes one line to stderr: "[tag] LEVEL message key=value ...".
void Log(const LogMessage& message);

inline void Log(LogLevel level, const std::string& tag, const std::string& message,
                LogFields fields = {}) {
    if (!IsEnabled(level)) {
        return;
    }
    Log(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace codejoin::utils

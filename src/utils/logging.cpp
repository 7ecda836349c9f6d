#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace codejoin::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_write_mutex;

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

LogConfig GetLogConfig() {
    LogConfig config{};
    config.min_level = static_cast<LogLevel>(g_min_level.load());
    return config;
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(const LogMessage& message) {
    if (!IsEnabled(message.level)) {
        return;
    }
    std::ostringstream line;
    line << "[" << message.tag << "] " << ToString(message.level) << " " << message.message;
    // Sorted so that lines for the same event always read the same way.
    const std::map<std::string, std::string> ordered(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : ordered) {
        line << " " << key << "=" << value;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << line.str() << std::endl;
}

}  // namespace codejoin::utils

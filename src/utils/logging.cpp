#include "utils/logging.hpp"

#include <iostream>
#include <map>
#include <mutex>

#include "utils/common.hpp"

namespace rlm::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& MutableConfig() {
    static LogConfig config{};
    return config;
}

}  // namespace

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    MutableConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return MutableConfig();
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    const auto lowered = ToLower(value);
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

void Log(const LogMessage& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (message.level < MutableConfig().min_level) {
        return;
    }
    std::cerr << "[" << message.tag << "] ";
    if (message.level >= LogLevel::kWarn) {
        std::cerr << ToString(message.level) << ": ";
    }
    std::cerr << message.message;
    // sorted so repeated runs produce comparable lines
    const std::map<std::string, std::string> ordered(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : ordered) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    Log(LogMessage{level, tag, message, {}});
}

}  // namespace rlm::utils

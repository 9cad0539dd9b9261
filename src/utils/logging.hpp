#pragma once

#include <iostream>
#include <map>
#include <mutex>
#include <string>

namespace codeact::utils {

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
    if (value == "debug" || value == "DEBUG") return LogLevel::kDebug;
    if (value == "info" || value == "INFO") return LogLevel::kInfo;
    if (value == "warn" || value == "WARN" || value == "warning") return LogLevel::kWarn;
    if (value == "error" || value == "ERROR") return LogLevel::kError;
    return fallback;
}

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline LogConfig& GlobalLogConfig() {
    static LogConfig config{};
    return config;
}

inline void SetLogLevel(LogLevel level) {
    GlobalLogConfig().min_level = level;
}

// Writes "[tag] message key=value ..." to stderr.
inline void Emit(const LogMessage& msg) {
    if (static_cast<int>(msg.level) < static_cast<int>(GlobalLogConfig().min_level)) {
        return;
    }
    static std::mutex emit_mutex;
    std::lock_guard<std::mutex> lock(emit_mutex);
    std::cerr << "[" << msg.tag << "] ";
    if (msg.level == LogLevel::kWarn || msg.level == LogLevel::kError) {
        std::cerr << ToString(msg.level) << " ";
    }
    std::cerr << msg.message;
    for (const auto& [key, value] : msg.fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

inline void Log(LogLevel level,
                const std::string& tag,
                const std::string& message,
                std::map<std::string, std::string> fields = {}) {
    Emit(LogMessage{level, tag, message, std::move(fields)});
}

}  // namespace codeact::utils

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace pyfence::utils {

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
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Process-wide settings; PYFENCE_LOG_LEVEL is read on first use.
inline LogConfig& GlobalLogConfig() {
    static LogConfig config = [] {
        LogConfig initial{};
        if (const char* value = std::getenv("PYFENCE_LOG_LEVEL")) {
            initial.min_level = ParseLogLevel(value, initial.min_level);
        }
        return initial;
    }();
    return config;
}

inline bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(GlobalLogConfig().min_level);
}

using LogFields = std::vector<std::pair<std::string, std::string>>;

// Writes "[tag] message key=value ..." to stderr.
inline void Log(LogLevel level, const std::string& tag, const std::string& message,
                const LogFields& fields = {}) {
    if (!IsEnabled(level)) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message;
    for (const auto& [key, value] : fields) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace pyfence::utils

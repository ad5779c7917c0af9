// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/log_record.hpp"

#include <algorithm>
#include <cctype>

namespace mqttlog {

const char* to_string(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warning: return "WARNING";
        case Level::Error: return "ERROR";
        case Level::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::optional<Level> level_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (upper == "DEBUG") return Level::Debug;
    if (upper == "INFO") return Level::Info;
    if (upper == "WARNING" || upper == "WARN") return Level::Warning;
    if (upper == "ERROR") return Level::Error;
    if (upper == "CRITICAL") return Level::Critical;
    return std::nullopt;
}

LogRecord make_record(Level level, const std::string& logger_name,
                      const std::string& message, Attributes attributes) {
    LogRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.level = level;
    record.logger_name = logger_name;
    record.message = message;
    record.attributes = std::move(attributes);
    return record;
}

}  // namespace mqttlog

// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file log_record.hpp
/// @brief Log record and encoded message types

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mqttlog {

/// Record severity, ordered from least to most severe
enum class Level : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

/// Convert Level to its canonical upper-case name ("DEBUG", "INFO", ...)
const char* to_string(Level level);

/// Parse Level from string
/// @param name Level name (case-insensitive, "WARN" accepted for Warning)
/// @return Level if valid, nullopt if unknown
std::optional<Level> level_from_string(const std::string& name);

using Attributes = std::map<std::string, std::string>;

/// A single structured log record
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    Level level = Level::Info;
    std::string logger_name;
    std::string message;
    Attributes attributes;
};

/// Build a record stamped with the current wall-clock time
LogRecord make_record(Level level, const std::string& logger_name,
                      const std::string& message, Attributes attributes = {});

/// Wire-ready message: destination topic plus payload bytes
struct EncodedMessage {
    std::string topic;
    std::vector<uint8_t> payload;
    int qos = 0;
    bool retain = false;

    bool operator==(const EncodedMessage& other) const {
        return topic == other.topic && payload == other.payload &&
               qos == other.qos && retain == other.retain;
    }
    bool operator!=(const EncodedMessage& other) const { return !(*this == other); }
};

}  // namespace mqttlog

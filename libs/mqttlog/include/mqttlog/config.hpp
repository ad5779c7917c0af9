// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file config.hpp
/// @brief Pipeline configuration, validation and YAML loading
///
/// Example YAML document:
/// @code
///   mqtt:
///     host: broker.local
///     port: 1883
///     keepalive_sec: 60
///   topic:
///     template: "DVT/{loggerPath}/{level}"
///     qos: 1
///     retain: false
///   queue:
///     capacity: 1000
///     overflow: drop_oldest
///   delivery:
///     batch_size: 50
///     batch_interval_ms: 200
///     max_retries: 3
///     backoff_base_ms: 100
///     backoff_cap_ms: 30000
///   payload:
///     format: json
///     compression: none
///   level: INFO
/// @endcode

#include "mqttlog/bounded_queue.hpp"
#include "mqttlog/compressor.hpp"
#include "mqttlog/log_record.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace YAML {
class Node;
}

namespace mqttlog {

/// Payload serialization formats
enum class PayloadFormat : uint8_t {
    Json,      ///< JSON object with sorted keys
    Text,      ///< "<timestamp> - <LEVEL> - <logger> - <message>"
    Protobuf   ///< mqttlog.wire.LogRecord
};

/// Convert PayloadFormat to string ("json", "text", "protobuf")
const char* to_string(PayloadFormat format);

/// Parse PayloadFormat from string (case-insensitive)
std::optional<PayloadFormat> payload_format_from_string(const std::string& name);

/// Configuration of one forwarding pipeline. Immutable once the pipeline exists.
struct PipelineConfig {
    // Broker
    std::string hostname = "localhost";
    int port = 1884;
    std::string client_id;  // empty: broker-assigned random id
    std::chrono::seconds keepalive{60};
    std::chrono::milliseconds connect_timeout{5000};

    // Topic: {loggerName}, {loggerPath} and {level} are substituted
    std::string topic_template = "DVT/{loggerPath}";
    int qos = 1;
    bool retain = true;

    // Queue
    size_t queue_capacity = 1000;
    OverflowPolicy overflow_policy = OverflowPolicy::DropOldest;

    // Delivery
    size_t batch_size = 50;
    std::chrono::milliseconds batch_interval{200};
    int max_retries = 3;
    std::chrono::milliseconds backoff_base{100};
    std::chrono::milliseconds backoff_cap{30000};
    std::chrono::milliseconds shutdown_timeout{2000};

    // Payload
    PayloadFormat payload_format = PayloadFormat::Json;
    CompressorType compression = CompressorType::NONE;
    int compression_level = 3;

    // Records below this level are filtered before encoding
    Level min_level = Level::Debug;
};

/// Check a configuration
/// @throws ConfigError describing the first invalid field
void validate(const PipelineConfig& config);

/// Apply a parsed YAML document on top of a base configuration
/// @throws ConfigError on malformed values
PipelineConfig config_from_yaml(const YAML::Node& root, const PipelineConfig& base = {});

/// Load and validate a configuration file
/// @throws ConfigError if the file cannot be read or is invalid
PipelineConfig load_config(const std::string& path);

/// Override the broker address from MQTTLOG_HOST / MQTTLOG_PORT
void apply_env_overrides(PipelineConfig& config);

}  // namespace mqttlog

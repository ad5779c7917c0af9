// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file record_encoder.hpp
/// @brief LogRecord to MQTT message conversion
///
/// encode() is a pure function: the same record and configuration always
/// produce a byte-identical EncodedMessage.
///
/// Topic templates understand three placeholders:
/// - {loggerName}  logger name verbatim ("app.db")
/// - {loggerPath}  logger name with '.' replaced by '/' ("app/db")
/// - {level}       level name ("WARNING")
/// Any other brace sequence is copied unchanged. With nested braces the
/// innermost pair is the placeholder.
///
/// The rendered topic must be a valid MQTT topic name (non-empty, at most
/// 65535 bytes, UTF-8, no '+', '#' or NUL), otherwise encode() fails.

#include "mqttlog/config.hpp"
#include "mqttlog/log_record.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace mqttlog {

/// Longest topic name MQTT can carry
constexpr size_t kMaxTopicLength = 65535;

/// Encode a record for publishing
/// @throws EncodingError if a text field is not valid UTF-8 or the rendered
///         topic is not a valid topic name
EncodedMessage encode(const LogRecord& record, const PipelineConfig& config);

/// Serialize a record in the given payload format
/// @throws EncodingError if a text field is not valid UTF-8
std::vector<uint8_t> encode_payload(const LogRecord& record, PayloadFormat format);

/// Substitute placeholders in a topic template
std::string render_topic(const std::string& topic_template, const LogRecord& record);

/// Check a topic name for publishing (no wildcards, no NUL, length and UTF-8)
bool is_valid_topic(const std::string& topic);

/// Format a timestamp as ISO-8601 UTC with milliseconds ("2024-05-01T12:00:00.123Z")
std::string format_timestamp(std::chrono::system_clock::time_point timestamp);

/// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF
bool is_valid_utf8(const std::string& text);

}  // namespace mqttlog

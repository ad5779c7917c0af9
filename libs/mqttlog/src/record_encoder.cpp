// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/record_encoder.hpp"
#include "mqttlog/errors.hpp"

#include "log_record.pb.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mqttlog {

namespace {

void check_utf8(const std::string& text, const char* field) {
    if (!is_valid_utf8(text)) {
        throw EncodingError(std::string(field) + " is not valid UTF-8");
    }
}

void check_record(const LogRecord& record) {
    check_utf8(record.logger_name, "logger name");
    check_utf8(record.message, "message");
    for (const auto& [key, value] : record.attributes) {
        check_utf8(key, "attribute key");
        check_utf8(value, "attribute value");
    }
}

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::vector<uint8_t> encode_json(const LogRecord& record) {
    // nlohmann::json objects are std::map backed, so keys serialize sorted
    nlohmann::json doc = nlohmann::json::object();
    doc["timestamp"] = format_timestamp(record.timestamp);
    doc["level"] = to_string(record.level);
    doc["logger"] = record.logger_name;
    doc["message"] = record.message;
    if (!record.attributes.empty()) {
        doc["attributes"] = record.attributes;
    }

    try {
        return to_bytes(doc.dump());
    } catch (const nlohmann::json::type_error& e) {
        throw EncodingError(std::string("JSON serialization failed: ") + e.what());
    }
}

std::vector<uint8_t> encode_text(const LogRecord& record) {
    std::ostringstream oss;
    oss << format_timestamp(record.timestamp)
        << " - " << to_string(record.level)
        << " - " << record.logger_name
        << " - " << record.message;
    for (const auto& [key, value] : record.attributes) {
        oss << ' ' << key << '=' << value;
    }
    return to_bytes(oss.str());
}

std::vector<uint8_t> encode_protobuf(const LogRecord& record) {
    wire::LogRecord pb;
    pb.set_timestamp_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()).count());
    pb.set_level(static_cast<wire::Level>(record.level));
    pb.set_logger(record.logger_name);
    pb.set_message(record.message);
    for (const auto& [key, value] : record.attributes) {
        auto* attr = pb.add_attributes();
        attr->set_key(key);
        attr->set_value(value);
    }

    std::string serialized;
    if (!pb.SerializeToString(&serialized)) {
        throw EncodingError("protobuf serialization failed");
    }
    return to_bytes(serialized);
}

}  // namespace

EncodedMessage encode(const LogRecord& record, const PipelineConfig& config) {
    EncodedMessage msg;
    msg.topic = render_topic(config.topic_template, record);
    if (!is_valid_topic(msg.topic)) {
        throw EncodingError("'" + msg.topic + "' is not a valid MQTT topic name");
    }
    msg.payload = encode_payload(record, config.payload_format);
    msg.qos = config.qos;
    msg.retain = config.retain;
    return msg;
}

std::vector<uint8_t> encode_payload(const LogRecord& record, PayloadFormat format) {
    check_record(record);

    switch (format) {
        case PayloadFormat::Json: return encode_json(record);
        case PayloadFormat::Text: return encode_text(record);
        case PayloadFormat::Protobuf: return encode_protobuf(record);
    }
    throw EncodingError("unsupported payload format");
}

std::string render_topic(const std::string& topic_template, const LogRecord& record) {
    std::string topic;
    topic.reserve(topic_template.size() + record.logger_name.size());

    size_t pos = 0;
    while (pos < topic_template.size()) {
        size_t open = topic_template.find('{', pos);
        if (open == std::string::npos) {
            topic.append(topic_template, pos, std::string::npos);
            break;
        }
        size_t close = topic_template.find('}', open);
        if (close == std::string::npos) {
            topic.append(topic_template, pos, std::string::npos);
            break;
        }
        // Innermost placeholder: "a{b{level}" renders as "a{bWARNING"
        open = topic_template.rfind('{', close);

        topic.append(topic_template, pos, open - pos);
        std::string key = topic_template.substr(open + 1, close - open - 1);
        if (key == "loggerName") {
            topic += record.logger_name;
        } else if (key == "loggerPath") {
            std::string path = record.logger_name;
            std::replace(path.begin(), path.end(), '.', '/');
            topic += path;
        } else if (key == "level") {
            topic += to_string(record.level);
        } else {
            topic.append(topic_template, open, close - open + 1);
        }
        pos = close + 1;
    }

    return topic;
}

bool is_valid_topic(const std::string& topic) {
    if (topic.empty() || topic.size() > kMaxTopicLength) {
        return false;
    }
    if (topic.find_first_of(std::string("+#\0", 3)) != std::string::npos) {
        return false;
    }
    return is_valid_utf8(topic);
}

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch());
    auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto millis = (since_epoch - seconds).count();

    std::time_t t = static_cast<std::time_t>(seconds.count());
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        uint32_t cp;
        uint32_t min_cp;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min_cp = 0x10000;
        } else {
            return false;
        }

        if (i + len > n) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }

    return true;
}

}  // namespace mqttlog

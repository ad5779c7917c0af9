// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/config.hpp"
#include "mqttlog/errors.hpp"

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace mqttlog {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

}  // namespace

const char* to_string(PayloadFormat format) {
    switch (format) {
        case PayloadFormat::Json: return "json";
        case PayloadFormat::Text: return "text";
        case PayloadFormat::Protobuf: return "protobuf";
    }
    return "unknown";
}

std::optional<PayloadFormat> payload_format_from_string(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "json") return PayloadFormat::Json;
    if (lower == "text") return PayloadFormat::Text;
    if (lower == "protobuf" || lower == "proto") return PayloadFormat::Protobuf;
    return std::nullopt;
}

void validate(const PipelineConfig& config) {
    if (config.hostname.empty()) {
        throw ConfigError("hostname must not be empty");
    }
    if (config.port < 1 || config.port > 65535) {
        throw ConfigError("port out of range 1-65535: " + std::to_string(config.port));
    }
    if (config.keepalive.count() <= 0) {
        throw ConfigError("keepalive must be positive");
    }
    if (config.topic_template.empty()) {
        throw ConfigError("topic template must not be empty");
    }
    if (config.topic_template.find_first_of(std::string("+#\0", 3)) != std::string::npos) {
        throw ConfigError("topic template must not contain wildcards or NUL: " +
                          config.topic_template);
    }
    if (config.qos < 0 || config.qos > 2) {
        throw ConfigError("qos must be 0, 1 or 2: " + std::to_string(config.qos));
    }
    if (config.queue_capacity == 0) {
        throw ConfigError("queue capacity must be positive");
    }
    if (config.batch_size == 0 || config.batch_size > config.queue_capacity) {
        throw ConfigError("batch size must be in 1.." + std::to_string(config.queue_capacity) +
                          ": " + std::to_string(config.batch_size));
    }
    if (config.batch_interval.count() <= 0) {
        throw ConfigError("batch interval must be positive");
    }
    if (config.max_retries < 0) {
        throw ConfigError("max retries must not be negative");
    }
    if (config.backoff_base.count() <= 0) {
        throw ConfigError("backoff base must be positive");
    }
    if (config.backoff_cap < config.backoff_base) {
        throw ConfigError("backoff cap must not be below backoff base");
    }
    if (config.shutdown_timeout.count() < 0) {
        throw ConfigError("shutdown timeout must not be negative");
    }
}

PipelineConfig config_from_yaml(const YAML::Node& root, const PipelineConfig& base) {
    PipelineConfig config = base;

    try {
        if (root["mqtt"]) {
            auto mqtt = root["mqtt"];
            if (mqtt["host"]) config.hostname = mqtt["host"].as<std::string>();
            if (mqtt["port"]) config.port = mqtt["port"].as<int>();
            if (mqtt["client_id"]) config.client_id = mqtt["client_id"].as<std::string>();
            if (mqtt["keepalive_sec"]) {
                config.keepalive = std::chrono::seconds(mqtt["keepalive_sec"].as<int>());
            }
            if (mqtt["connect_timeout_ms"]) {
                config.connect_timeout = std::chrono::milliseconds(mqtt["connect_timeout_ms"].as<int>());
            }
        }

        if (root["topic"]) {
            auto topic = root["topic"];
            if (topic["template"]) config.topic_template = topic["template"].as<std::string>();
            if (topic["qos"]) config.qos = topic["qos"].as<int>();
            if (topic["retain"]) config.retain = topic["retain"].as<bool>();
        }

        if (root["queue"]) {
            auto queue = root["queue"];
            if (queue["capacity"]) config.queue_capacity = queue["capacity"].as<size_t>();
            if (queue["overflow"]) {
                auto name = queue["overflow"].as<std::string>();
                auto policy = overflow_policy_from_string(name);
                if (!policy) {
                    throw ConfigError("unknown overflow policy: " + name);
                }
                config.overflow_policy = *policy;
            }
        }

        if (root["delivery"]) {
            auto delivery = root["delivery"];
            if (delivery["batch_size"]) config.batch_size = delivery["batch_size"].as<size_t>();
            if (delivery["batch_interval_ms"]) {
                config.batch_interval = std::chrono::milliseconds(delivery["batch_interval_ms"].as<int>());
            }
            if (delivery["max_retries"]) config.max_retries = delivery["max_retries"].as<int>();
            if (delivery["backoff_base_ms"]) {
                config.backoff_base = std::chrono::milliseconds(delivery["backoff_base_ms"].as<int>());
            }
            if (delivery["backoff_cap_ms"]) {
                config.backoff_cap = std::chrono::milliseconds(delivery["backoff_cap_ms"].as<int>());
            }
            if (delivery["shutdown_timeout_ms"]) {
                config.shutdown_timeout = std::chrono::milliseconds(delivery["shutdown_timeout_ms"].as<int>());
            }
        }

        if (root["payload"]) {
            auto payload = root["payload"];
            if (payload["format"]) {
                auto name = payload["format"].as<std::string>();
                auto format = payload_format_from_string(name);
                if (!format) {
                    throw ConfigError("unknown payload format: " + name);
                }
                config.payload_format = *format;
            }
            if (payload["compression"]) {
                auto name = payload["compression"].as<std::string>();
                auto type = compressor_type_from_string(name);
                if (!type) {
                    throw ConfigError("unknown compression: " + name);
                }
                config.compression = *type;
            }
            if (payload["compression_level"]) {
                config.compression_level = payload["compression_level"].as<int>();
            }
        }

        if (root["level"]) {
            auto name = root["level"].as<std::string>();
            auto level = level_from_string(name);
            if (!level) {
                throw ConfigError("unknown level: " + name);
            }
            config.min_level = *level;
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed configuration: ") + e.what());
    }

    return config;
}

PipelineConfig load_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("failed to load " + path + ": " + e.what());
    }

    PipelineConfig config = config_from_yaml(root);
    validate(config);

    LOG(INFO) << "Loaded configuration from " << path;
    return config;
}

void apply_env_overrides(PipelineConfig& config) {
    if (const char* host = std::getenv("MQTTLOG_HOST")) {
        config.hostname = host;
    }
    if (const char* port = std::getenv("MQTTLOG_PORT")) {
        try {
            config.port = std::stoi(port);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring invalid MQTTLOG_PORT '" << port << "': " << e.what();
        }
    }
}

}  // namespace mqttlog

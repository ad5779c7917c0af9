// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief mqttlog_send - publish log records to an MQTT broker from the shell
///
/// Usage:
///   mqttlog_send --logger=app.db --level=WARNING --message="disk almost full"
///   tail -f app.log | mqttlog_send --config=mqttlog.yaml --logger=app
///   mqttlog_send --host=broker.local --port=1883 --format=text --compression=zstd
///
/// Settings are applied in order: built-in defaults, --config file,
/// MQTTLOG_HOST / MQTTLOG_PORT, then explicit flags.

#include "mqttlog/config.hpp"
#include "mqttlog/errors.hpp"
#include "mqttlog/pipeline_registry.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

DEFINE_string(config, "", "YAML configuration file");
DEFINE_string(host, "", "Broker host (overrides config)");
DEFINE_int32(port, 0, "Broker port (overrides config, 0 = keep)");
DEFINE_string(logger, "mqttlog_send", "Logger name, also used as pipeline name");
DEFINE_string(level, "INFO", "Record level: DEBUG, INFO, WARNING, ERROR, CRITICAL");
DEFINE_string(message, "", "Message to send; stdin lines are sent when empty");
DEFINE_string(topic, "", "Topic template (overrides config)");
DEFINE_string(format, "", "Payload format: json, text, protobuf (overrides config)");
DEFINE_string(compression, "", "Payload compression: none, zstd (overrides config)");
DEFINE_bool(stats, false, "Print pipeline statistics before exiting");

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    LOG(INFO) << "Received signal " << sig << ", shutting down...";
    g_shutdown = true;
}

mqttlog::PipelineConfig build_config() {
    mqttlog::PipelineConfig config;
    if (!FLAGS_config.empty()) {
        config = mqttlog::load_config(FLAGS_config);
    }
    mqttlog::apply_env_overrides(config);

    if (!FLAGS_host.empty()) {
        config.hostname = FLAGS_host;
    }
    if (FLAGS_port != 0) {
        config.port = FLAGS_port;
    }
    if (!FLAGS_topic.empty()) {
        config.topic_template = FLAGS_topic;
    }
    if (!FLAGS_format.empty()) {
        auto format = mqttlog::payload_format_from_string(FLAGS_format);
        if (!format) {
            throw mqttlog::ConfigError("unknown payload format '" + FLAGS_format + "'");
        }
        config.payload_format = *format;
    }
    if (!FLAGS_compression.empty()) {
        auto compression = mqttlog::compressor_type_from_string(FLAGS_compression);
        if (!compression) {
            throw mqttlog::ConfigError("unknown compression '" + FLAGS_compression + "'");
        }
        config.compression = *compression;
    }

    mqttlog::validate(config);
    return config;
}

void print_stats(const mqttlog::PipelineStats& stats) {
    std::cout << "submitted:        " << stats.records_submitted << "\n"
              << "filtered:         " << stats.records_filtered << "\n"
              << "encoding errors:  " << stats.encoding_errors << "\n"
              << "published:        " << stats.delivery.messages_published << "\n"
              << "bytes sent:       " << stats.transport.bytes_sent << "\n"
              << "connect failures: " << stats.connect_failures << "\n"
              << "overflow:         " << stats.overflow << "\n"
              << "rejected:         " << stats.delivery.rejected << "\n"
              << "dropped:          " << stats.dropped << "\n"
              << "undelivered:      " << stats.delivery.dropped_on_shutdown << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Publish log records to an MQTT broker");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto level = mqttlog::level_from_string(FLAGS_level);
    if (!level) {
        LOG(ERROR) << "Unknown level '" << FLAGS_level << "'";
        return 1;
    }

    mqttlog::PipelineConfig config;
    try {
        config = build_config();
    } catch (const mqttlog::ConfigError& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return 1;
    }

    mqttlog::PipelineRegistry registry;
    std::shared_ptr<mqttlog::Pipeline> pipeline;
    try {
        pipeline = registry.get_or_create(FLAGS_logger, config);
    } catch (const mqttlog::Error& e) {
        LOG(ERROR) << "Failed to create pipeline: " << e.what();
        return 1;
    }

    size_t sent = 0;
    if (!FLAGS_message.empty()) {
        sent += pipeline->log(*level, FLAGS_message) ? 1 : 0;
    } else {
        std::string line;
        while (!g_shutdown && std::getline(std::cin, line)) {
            if (line.empty()) continue;
            sent += pipeline->log(*level, line) ? 1 : 0;
        }
    }

    VLOG(1) << "Queued " << sent << " record(s)";

    // Flushes within shutdown_timeout
    registry.shutdown(FLAGS_logger);

    auto stats = pipeline->stats();
    if (FLAGS_stats) {
        print_stats(stats);
    }

    gflags::ShutDownCommandLineFlags();
    uint64_t lost = stats.dropped + stats.delivery.rejected + stats.delivery.dropped_on_shutdown;
    return lost == 0 ? 0 : 2;
}

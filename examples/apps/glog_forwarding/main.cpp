// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief Forward an application's glog output to MQTT
///
/// Every LOG() line of this process is also published as a structured record
/// on DVT/<logger path> until SIGINT/SIGTERM.
///
/// Usage:
///   glog_forwarding [--config config.yaml] [--logger vehicle.gateway] [--interval_ms 1000]

#include "mqttlog/config.hpp"
#include "mqttlog/errors.hpp"
#include "mqttlog/glog_sink.hpp"
#include "mqttlog/pipeline_registry.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

DEFINE_string(config, "", "YAML configuration file");
DEFINE_string(logger, "vehicle.gateway", "Logger (and pipeline) name");
DEFINE_int32(interval_ms, 1000, "Delay between heartbeat log lines");

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int sig) {
    LOG(INFO) << "Received signal " << sig << ", shutting down...";
    g_running = false;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Forward glog output to an MQTT broker");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    mqttlog::PipelineRegistry registry;
    std::shared_ptr<mqttlog::Pipeline> pipeline;
    try {
        mqttlog::PipelineConfig config;
        if (!FLAGS_config.empty()) {
            config = mqttlog::load_config(FLAGS_config);
        }
        mqttlog::apply_env_overrides(config);
        pipeline = registry.get_or_create(FLAGS_logger, config);
    } catch (const mqttlog::Error& e) {
        LOG(ERROR) << "Failed to set up log forwarding: " << e.what();
        return 1;
    }

    mqttlog::GlogForwardingSink sink(pipeline);
    sink.attach();

    uint64_t beat = 0;
    while (g_running) {
        LOG(INFO) << "heartbeat " << ++beat;
        if (beat % 10 == 0) {
            LOG(WARNING) << "queue depth " << pipeline->stats().queue_depth
                         << ", connection " << mqttlog::to_string(pipeline->connection_state());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(FLAGS_interval_ms));
    }

    sink.detach();
    registry.shutdown_all();

    LOG(INFO) << "Forwarded " << sink.forwarded() << " line(s), skipped " << sink.skipped();
    gflags::ShutDownCommandLineFlags();
    return 0;
}

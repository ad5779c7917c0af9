// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file mqtt_transport.hpp
/// @brief libmosquitto implementation of BrokerTransport
///
/// The mosquitto network loop is driven by poll() on the caller's thread
/// (no mosquitto_loop_start), so connect, publish and keep-alive all run on
/// the pipeline's delivery thread and reconnects stay under the control of
/// ConnectionManager.

#include "mqttlog/broker_transport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

// Forward declarations (mosquitto types are in global namespace)
struct mosquitto;

namespace mqttlog {

struct PipelineConfig;

/// Configuration for the MQTT transport
struct MqttTransportConfig {
    std::string broker_host = "localhost";
    int broker_port = 1883;
    std::string client_id;  // empty: broker-assigned
    int keepalive_sec = 60;
    std::chrono::milliseconds connect_timeout{5000};
};

/// Derive transport settings from a pipeline configuration
MqttTransportConfig transport_config_from(const PipelineConfig& config);

/// MQTT broker transport over libmosquitto
class MqttTransport : public BrokerTransport {
public:
    explicit MqttTransport(const MqttTransportConfig& config = {});
    ~MqttTransport() override;

    MqttTransport(const MqttTransport&) = delete;
    MqttTransport& operator=(const MqttTransport&) = delete;

    /// Waits for CONNACK for at most min(timeout, config().connect_timeout)
    bool connect(std::chrono::milliseconds timeout) override;
    void set_interrupted(bool interrupted) override { interrupted_ = interrupted; }
    void disconnect() override;
    PublishResult publish(const EncodedMessage& msg) override;
    bool poll(std::chrono::milliseconds timeout) override;
    bool connected() const override { return connected_; }
    TransportStats stats() const override;
    std::string name() const override { return "mqtt"; }

    const MqttTransportConfig& config() const { return config_; }

private:
    // Mosquitto callbacks
    static void on_connect(struct mosquitto* mosq, void* obj, int rc);
    static void on_disconnect(struct mosquitto* mosq, void* obj, int rc);

    bool ensure_client();
    void connection_lost(const char* reason);

    MqttTransportConfig config_;
    struct mosquitto* mosq_ = nullptr;
    bool lib_initialized_ = false;

    std::atomic<bool> connected_{false};
    std::atomic<bool> interrupted_{false};
    bool connack_received_ = false;
    int connack_rc_ = -1;

    mutable std::mutex stats_mutex_;
    TransportStats stats_;
};

}  // namespace mqttlog

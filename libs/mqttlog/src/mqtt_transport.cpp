// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/mqtt_transport.hpp"
#include "mqttlog/config.hpp"

#include <glog/logging.h>
#include <mosquitto.h>

#include <algorithm>

namespace mqttlog {

MqttTransportConfig transport_config_from(const PipelineConfig& config) {
    MqttTransportConfig transport;
    transport.broker_host = config.hostname;
    transport.broker_port = config.port;
    transport.client_id = config.client_id;
    transport.keepalive_sec = static_cast<int>(config.keepalive.count());
    transport.connect_timeout = config.connect_timeout;
    return transport;
}

MqttTransport::MqttTransport(const MqttTransportConfig& config)
    : config_(config) {
}

MqttTransport::~MqttTransport() {
    disconnect();

    if (mosq_) {
        mosquitto_destroy(mosq_);
        mosq_ = nullptr;
    }
    if (lib_initialized_) {
        mosquitto_lib_cleanup();
    }
}

bool MqttTransport::ensure_client() {
    if (mosq_) {
        return true;
    }

    if (!lib_initialized_) {
        mosquitto_lib_init();
        lib_initialized_ = true;
    }

    // A NULL id asks libmosquitto for a random one, which requires a clean session
    const char* id = config_.client_id.empty() ? nullptr : config_.client_id.c_str();
    mosq_ = mosquitto_new(id, true, this);
    if (!mosq_) {
        LOG(ERROR) << "Failed to create mosquitto client";
        return false;
    }

    mosquitto_connect_callback_set(mosq_, on_connect);
    mosquitto_disconnect_callback_set(mosq_, on_disconnect);
    return true;
}

bool MqttTransport::connect(std::chrono::milliseconds timeout) {
    if (connected_) {
        return true;
    }
    if (interrupted_ || timeout <= std::chrono::milliseconds::zero() || !ensure_client()) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connect_failures++;
        return false;
    }

    connack_received_ = false;
    connack_rc_ = -1;

    int rc = mosquitto_connect_async(mosq_, config_.broker_host.c_str(),
                                     config_.broker_port, config_.keepalive_sec);
    if (rc != MOSQ_ERR_SUCCESS) {
        LOG(WARNING) << "MQTT connect to " << config_.broker_host << ":" << config_.broker_port
                     << " failed: " << mosquitto_strerror(rc);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connect_failures++;
        return false;
    }

    // Run the network loop until CONNACK arrives, the timeout expires or
    // the attempt is interrupted
    auto budget = std::min(timeout, config_.connect_timeout);
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (!connack_received_) {
        if (interrupted_) {
            LOG(INFO) << "MQTT connect to " << config_.broker_host << ":" << config_.broker_port
                      << " interrupted";
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG(WARNING) << "MQTT connect to " << config_.broker_host << ":" << config_.broker_port
                         << " timed out after " << budget.count() << "ms";
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        rc = mosquitto_loop(mosq_, static_cast<int>(std::min<int64_t>(remaining.count(), 50)), 1);
        if (rc != MOSQ_ERR_SUCCESS) {
            LOG(WARNING) << "MQTT connect to " << config_.broker_host << ":" << config_.broker_port
                         << " failed: " << mosquitto_strerror(rc);
            break;
        }
    }

    if (!connack_received_ || connack_rc_ != 0) {
        mosquitto_disconnect(mosq_);
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connect_failures++;
        return false;
    }

    connected_ = true;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connects++;
    }

    LOG(INFO) << "MqttTransport connected to " << config_.broker_host << ":" << config_.broker_port;
    return true;
}

void MqttTransport::disconnect() {
    if (!mosq_ || !connected_) {
        connected_ = false;
        return;
    }

    // Write out anything still buffered (QoS 1/2 publishes) before leaving
    for (int i = 0; i < 10 && mosquitto_want_write(mosq_); ++i) {
        if (mosquitto_loop(mosq_, 10, 1) != MOSQ_ERR_SUCCESS) {
            break;
        }
    }

    connected_ = false;
    mosquitto_disconnect(mosq_);

    auto totals = stats();
    LOG(INFO) << "MqttTransport disconnected. Stats: sent=" << totals.messages_sent
              << " failed=" << totals.messages_failed
              << " bytes=" << totals.bytes_sent;
}

PublishResult MqttTransport::publish(const EncodedMessage& msg) {
    if (!connected_ || !mosq_) {
        LOG_EVERY_N(WARNING, 100) << "MQTT not connected, cannot publish to topic: " << msg.topic;
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_failed++;
        return PublishResult::Failed;
    }

    int rc = mosquitto_publish(mosq_, nullptr,
                               msg.topic.c_str(),
                               static_cast<int>(msg.payload.size()),
                               msg.payload.data(),
                               msg.qos,
                               msg.retain);

    if (rc != MOSQ_ERR_SUCCESS) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.messages_failed++;
        }

        switch (rc) {
            case MOSQ_ERR_INVAL:
            case MOSQ_ERR_PAYLOAD_SIZE:
            case MOSQ_ERR_MALFORMED_UTF8:
                LOG_EVERY_N(WARNING, 100) << "MQTT broker cannot take message for topic '"
                                          << msg.topic << "': " << mosquitto_strerror(rc);
                return PublishResult::Rejected;
            case MOSQ_ERR_NO_CONN:
            case MOSQ_ERR_CONN_LOST:
                connection_lost(mosquitto_strerror(rc));
                break;
            default:
                break;
        }
        LOG_EVERY_N(WARNING, 100) << "MQTT publish failed: " << mosquitto_strerror(rc);
        return PublishResult::Failed;
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.messages_sent++;
        stats_.bytes_sent += msg.payload.size();
        stats_.last_send_timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    VLOG(2) << "Published to " << msg.topic << " (" << msg.payload.size() << " bytes)";
    return PublishResult::Sent;
}

bool MqttTransport::poll(std::chrono::milliseconds timeout) {
    if (!mosq_ || !connected_) {
        return false;
    }

    int rc = mosquitto_loop(mosq_, static_cast<int>(timeout.count()), 1);
    if (rc != MOSQ_ERR_SUCCESS) {
        connection_lost(mosquitto_strerror(rc));
    }
    return connected_;
}

TransportStats MqttTransport::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void MqttTransport::connection_lost(const char* reason) {
    if (!connected_.exchange(false)) {
        return;
    }

    LOG(WARNING) << "MQTT connection to " << config_.broker_host << ":" << config_.broker_port
                 << " lost: " << reason;
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.connections_lost++;
}

// =============================================================================
// Mosquitto Callbacks
// =============================================================================

void MqttTransport::on_connect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MqttTransport*>(obj);
    self->connack_received_ = true;
    self->connack_rc_ = rc;

    if (rc != 0) {
        LOG(WARNING) << "MQTT connection refused: " << mosquitto_connack_string(rc);
    }
}

void MqttTransport::on_disconnect(struct mosquitto*, void* obj, int rc) {
    auto* self = static_cast<MqttTransport*>(obj);

    if (rc != 0) {
        self->connection_lost(mosquitto_strerror(rc));
    } else {
        self->connected_ = false;
    }
}

}  // namespace mqttlog

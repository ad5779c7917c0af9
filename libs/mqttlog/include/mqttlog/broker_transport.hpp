// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file broker_transport.hpp
/// @brief Abstract interface for the broker connection
///
/// BrokerTransport decouples the connection state machine and delivery
/// worker from the MQTT client library. All methods are called from the
/// owning pipeline's delivery thread only; stats() and connected() may also
/// be read from other threads.

#include "mqttlog/log_record.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace mqttlog {

/// Statistics for broker transports
struct TransportStats {
    uint64_t messages_sent = 0;
    uint64_t messages_failed = 0;
    uint64_t bytes_sent = 0;
    uint64_t connects = 0;
    uint64_t connect_failures = 0;
    uint64_t connections_lost = 0;
    int64_t last_send_timestamp_ns = 0;
};

/// Outcome of publishing one message
enum class PublishResult : uint8_t {
    Sent,      ///< Handed to the broker connection
    Failed,    ///< Not sent, worth retrying (connection trouble)
    Rejected   ///< The message itself can never be sent (bad topic, oversize payload)
};

/// Abstract interface for broker transports.
///
/// The transport receives already-encoded (and optionally compressed)
/// messages. It does not reconnect by itself; ConnectionManager decides
/// when to call connect() again.
class BrokerTransport {
public:
    virtual ~BrokerTransport() = default;

    /// Open a connection and wait for the broker's acknowledgement
    /// @param timeout Upper bound for this attempt; the transport may use less
    /// @return true once the session is established
    virtual bool connect(std::chrono::milliseconds timeout) = 0;

    /// While set, connect() gives up as soon as possible and fails.
    /// May be called from any thread.
    virtual void set_interrupted(bool interrupted) = 0;

    /// Close the connection (no-op when not connected)
    virtual void disconnect() = 0;

    /// Publish one message
    virtual PublishResult publish(const EncodedMessage& msg) = 0;

    /// Service network I/O, acknowledgements and keep-alive pings
    /// @param timeout Maximum time to wait for socket activity
    /// @return false if the connection is (or has just been) lost
    virtual bool poll(std::chrono::milliseconds timeout) = 0;

    /// Check whether a session is currently established
    virtual bool connected() const = 0;

    /// Get statistics
    virtual TransportStats stats() const = 0;

    /// Get transport name for logging
    virtual std::string name() const = 0;
};

}  // namespace mqttlog

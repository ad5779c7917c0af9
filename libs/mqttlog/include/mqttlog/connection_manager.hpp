// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file connection_manager.hpp
/// @brief Broker connection lifecycle with exponential backoff
///
/// State machine:
/// @code
///   Disconnected -> Connecting -> Connected -> Disconnected (error) -> Connecting ...
///   any state    -> Closed (close(), terminal)
/// @endcode
///
/// The manager is driven by explicit calls carrying the current time
/// (connect(), poll()), which keeps the backoff schedule deterministic
/// under test. After N consecutive connect failures the next attempt is
/// scheduled min(base * 2^N, cap) later. The failure count returns to zero
/// once a connection has been held for longer than the backoff interval
/// that preceded it.

#include "mqttlog/broker_transport.hpp"
#include "mqttlog/log_record.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace mqttlog {

/// Connection state
enum class ConnectionState : uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
    Closed = 3
};

const char* to_string(ConnectionState state);

/// Exponential backoff schedule shared by reconnects and publish retries
struct BackoffPolicy {
    std::chrono::milliseconds base{100};
    std::chrono::milliseconds cap{30000};

    /// Delay after `failures` consecutive failures: min(base * 2^failures, cap)
    std::chrono::milliseconds delay(uint32_t failures) const;
};

/// Connection statistics
struct ConnectionStats {
    uint64_t connect_attempts = 0;
    uint64_t connect_failures = 0;
    uint64_t connects = 0;
    uint64_t disconnects = 0;
};

/// Result of publishing the tail of a batch
struct PublishOutcome {
    size_t sent = 0;      ///< Accepted by the transport
    size_t rejected = 0;  ///< Refused by the transport for good and skipped

    /// Messages that need no further attempt
    size_t consumed() const { return sent + rejected; }
};

/// Owns the broker transport and decides when to (re)connect.
///
/// Mutating methods are called from the delivery thread only. state(),
/// connected(), consecutive_failures() and stats() are safe from any thread.
class ConnectionManager {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionManager(std::unique_ptr<BrokerTransport> transport,
                      const BackoffPolicy& backoff);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /// Attempt a connection now, regardless of the backoff schedule
    /// @param timeout Upper bound for the attempt (the transport's own limit still applies)
    /// @return true if connected afterwards
    bool connect(Clock::time_point now = Clock::now(),
                 std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    /// Make a connect() running on another thread give up, and fail any
    /// further attempt until resume(). Safe from any thread.
    void interrupt();
    void resume();

    /// Drive the connection: service I/O and keep-alive while connected,
    /// detect loss, and make the next connect attempt once it is due
    /// @return true if connected afterwards
    bool poll(Clock::time_point now = Clock::now(),
              std::chrono::milliseconds io_timeout = std::chrono::milliseconds(0));

    /// Publish messages batch[offset..] in order. A message the transport
    /// rejects for good is skipped; the first retryable failure stops the pass.
    /// @throws NotConnectedError if the state is not Connected
    PublishOutcome publish(const std::vector<EncodedMessage>& batch, size_t offset = 0);

    /// Disconnect and enter the terminal Closed state
    void close();

    ConnectionState state() const { return state_; }
    bool connected() const { return state_ == ConnectionState::Connected; }

    /// Connect failures since the last connection that was held long enough
    uint32_t consecutive_failures() const { return failures_; }

    /// Delay the current failure count maps to
    std::chrono::milliseconds current_delay() const { return backoff_.delay(failures_); }

    /// When the next connect attempt is due (meaningful while Disconnected)
    Clock::time_point next_attempt() const;

    const BackoffPolicy& backoff() const { return backoff_; }
    const BrokerTransport& transport() const { return *transport_; }
    ConnectionStats stats() const;

private:
    void mark_disconnected(Clock::time_point now);
    void maybe_reset_failures(Clock::time_point now);

    std::unique_ptr<BrokerTransport> transport_;
    const BackoffPolicy backoff_;

    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<uint32_t> failures_{0};

    mutable std::mutex schedule_mutex_;
    Clock::time_point next_attempt_{};
    Clock::time_point connected_since_{};
    std::chrono::milliseconds hold_threshold_{0};

    mutable std::mutex stats_mutex_;
    ConnectionStats stats_;
};

}  // namespace mqttlog

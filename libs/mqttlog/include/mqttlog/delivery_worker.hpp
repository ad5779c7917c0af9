// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file delivery_worker.hpp
/// @brief Background thread that drains the queue and publishes batches
///
/// The worker is the only thread that touches the broker connection. Each
/// iteration it polls the connection and, only when connected, drains up to
/// batch_size messages and publishes them in order. A batch that fails is
/// retried (unsent remainder only) up to max_retries times, waiting
/// min(base * 2^k, cap) after the k-th failed attempt; then it is dropped and
/// counted. A message the transport rejects for good (bad topic, oversize
/// payload) is skipped and counted without holding up the rest of its batch.
/// Messages stay queued while the broker is unreachable.

#include "mqttlog/bounded_queue.hpp"
#include "mqttlog/connection_manager.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace mqttlog {

/// Configuration for the delivery worker
struct DeliveryConfig {
    size_t batch_size = 50;
    std::chrono::milliseconds batch_interval{200};
    int max_retries = 3;
    BackoffPolicy backoff;
};

/// Statistics for the delivery worker
struct DeliveryStats {
    uint64_t messages_published = 0;
    uint64_t batches_published = 0;
    uint64_t publish_attempts = 0;
    uint64_t publish_failures = 0;
    uint64_t retries = 0;
    uint64_t rejected = 0;             ///< Messages the transport refused for good
    uint64_t dropped = 0;              ///< Messages dropped after exhausting retries
    uint64_t batches_dropped = 0;
    uint64_t dropped_on_shutdown = 0;  ///< Messages left undelivered by the final flush
};

class DeliveryWorker {
public:
    using Clock = std::chrono::steady_clock;

    DeliveryWorker(BoundedQueue& queue, ConnectionManager& connection,
                   const DeliveryConfig& config);
    ~DeliveryWorker();

    DeliveryWorker(const DeliveryWorker&) = delete;
    DeliveryWorker& operator=(const DeliveryWorker&) = delete;

    /// Start the delivery thread
    bool start();

    /// Stop the delivery thread, then make one final drain and publish pass.
    /// The whole call, including waiting for a connect attempt in progress,
    /// is bounded by flush_timeout (plus one transport I/O slice). Whatever
    /// is still undelivered is counted in DeliveryStats::dropped_on_shutdown.
    void stop(std::chrono::milliseconds flush_timeout);

    bool running() const { return running_; }

    DeliveryStats stats() const;

    /// True on a delivery thread (or during a final flush).
    /// Used to keep the library's own diagnostics out of forwarded logs.
    static bool on_delivery_thread();

private:
    void run();
    void step(Clock::time_point now);
    void wait_for_work();
    void sleep_unless_stopped(Clock::duration timeout);

    void start_batch();
    void attempt_publish(Clock::time_point now);
    void clear_batch();
    void final_flush(Clock::time_point deadline);

    BoundedQueue& queue_;
    ConnectionManager& connection_;
    const DeliveryConfig config_;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    // Batch in flight; touched by the delivery thread (or final flush) only
    std::vector<EncodedMessage> batch_;
    size_t batch_done_ = 0;  ///< Leading messages sent or rejected
    uint32_t batch_failures_ = 0;
    Clock::time_point retry_at_{};

    mutable std::mutex stats_mutex_;
    DeliveryStats stats_;
};

}  // namespace mqttlog

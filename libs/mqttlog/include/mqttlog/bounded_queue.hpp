// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file bounded_queue.hpp
/// @brief Capacity-limited handoff queue between log producers and the delivery worker
///
/// Producers never block: push() either stores the message or applies the
/// overflow policy. Exactly one consumer drains in FIFO order.

#include "mqttlog/log_record.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mqttlog {

/// What push() does when the queue is full
enum class OverflowPolicy : uint8_t {
    DropNewest,  ///< Reject the incoming message, push() returns false
    DropOldest   ///< Evict the head to make room, push() returns true
};

/// Convert OverflowPolicy to string ("drop_newest", "drop_oldest")
const char* to_string(OverflowPolicy policy);

/// Parse OverflowPolicy from string (case-insensitive)
std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& name);

/// Queue fill level
enum class QueueLevel : uint8_t {
    Empty = 0,     ///< 0%
    Low = 1,       ///< < 25%
    Normal = 2,    ///< 25-50%
    High = 3,      ///< 50-75%
    Critical = 4,  ///< 75-95%
    Full = 5       ///< > 95%
};

/// Queue statistics
struct QueueStats {
    uint64_t pushed = 0;      ///< Messages accepted
    uint64_t overflow = 0;    ///< Messages rejected or evicted on overflow
    uint64_t drained = 0;     ///< Messages handed to the consumer
    size_t high_watermark = 0;
};

/// Bounded FIFO of encoded messages
class BoundedQueue {
public:
    /// @throws std::invalid_argument if capacity is zero
    explicit BoundedQueue(size_t capacity,
                          OverflowPolicy policy = OverflowPolicy::DropOldest);

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Store a message without blocking
    /// @return false only when the policy is DropNewest and the queue is full
    bool push(EncodedMessage msg);

    /// Remove up to max_count messages in FIFO order without blocking
    std::vector<EncodedMessage> drain(size_t max_count);

    /// Block until the queue is non-empty, wake() is called, or timeout expires
    /// @return true if the queue holds data
    bool wait_for_data(std::chrono::milliseconds timeout);

    /// Release a consumer blocked in wait_for_data()
    void wake();

    size_t size() const;
    bool empty() const;
    size_t capacity() const { return capacity_; }
    OverflowPolicy policy() const { return policy_; }
    QueueLevel level() const;
    QueueStats stats() const;

private:
    const size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<EncodedMessage> items_;
    bool wake_pending_ = false;
    QueueStats stats_;
};

}  // namespace mqttlog

// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/bounded_queue.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mqttlog {

const char* to_string(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::DropNewest: return "drop_newest";
        case OverflowPolicy::DropOldest: return "drop_oldest";
    }
    return "unknown";
}

std::optional<OverflowPolicy> overflow_policy_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "drop_newest") return OverflowPolicy::DropNewest;
    if (lower == "drop_oldest") return OverflowPolicy::DropOldest;
    return std::nullopt;
}

BoundedQueue::BoundedQueue(size_t capacity, OverflowPolicy policy)
    : capacity_(capacity)
    , policy_(policy) {
    if (capacity_ == 0) {
        throw std::invalid_argument("BoundedQueue capacity must be positive");
    }
}

bool BoundedQueue::push(EncodedMessage msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (items_.size() >= capacity_) {
            stats_.overflow++;
            if (policy_ == OverflowPolicy::DropNewest) {
                return false;
            }
            items_.pop_front();
        }

        items_.push_back(std::move(msg));
        stats_.pushed++;
        stats_.high_watermark = std::max(stats_.high_watermark, items_.size());
    }

    cv_.notify_one();
    return true;
}

std::vector<EncodedMessage> BoundedQueue::drain(size_t max_count) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t count = std::min(max_count, items_.size());
    std::vector<EncodedMessage> batch;
    batch.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        batch.push_back(std::move(items_.front()));
        items_.pop_front();
    }
    stats_.drained += count;
    return batch;
}

bool BoundedQueue::wait_for_data(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !items_.empty() || wake_pending_; });
    wake_pending_ = false;
    return !items_.empty();
}

void BoundedQueue::wake() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_pending_ = true;
    }
    cv_.notify_all();
}

size_t BoundedQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool BoundedQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
}

QueueLevel BoundedQueue::level() const {
    size_t depth = size();
    if (depth == 0) {
        return QueueLevel::Empty;
    }

    size_t percent = depth * 100 / capacity_;
    if (percent < 25) return QueueLevel::Low;
    if (percent < 50) return QueueLevel::Normal;
    if (percent < 75) return QueueLevel::High;
    if (percent <= 95) return QueueLevel::Critical;
    return QueueLevel::Full;
}

QueueStats BoundedQueue::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace mqttlog

// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/delivery_worker.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace mqttlog {

namespace {

thread_local bool t_delivery_thread = false;

/// Marks the current thread as delivering for the lifetime of the scope
class DeliveryThreadScope {
public:
    DeliveryThreadScope() : previous_(t_delivery_thread) { t_delivery_thread = true; }
    ~DeliveryThreadScope() { t_delivery_thread = previous_; }

private:
    bool previous_;
};

}  // namespace

DeliveryWorker::DeliveryWorker(BoundedQueue& queue, ConnectionManager& connection,
                               const DeliveryConfig& config)
    : queue_(queue)
    , connection_(connection)
    , config_(config) {
}

DeliveryWorker::~DeliveryWorker() {
    stop(std::chrono::milliseconds(0));
}

bool DeliveryWorker::on_delivery_thread() {
    return t_delivery_thread;
}

bool DeliveryWorker::start() {
    if (running_) {
        return true;
    }

    running_ = true;
    thread_ = std::thread(&DeliveryWorker::run, this);

    VLOG(1) << "DeliveryWorker started (batch_size=" << config_.batch_size
            << ", interval=" << config_.batch_interval.count() << "ms"
            << ", max_retries=" << config_.max_retries << ")";
    return true;
}

void DeliveryWorker::stop(std::chrono::milliseconds flush_timeout) {
    auto deadline = Clock::now() + flush_timeout;
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    connection_.interrupt();
    stop_cv_.notify_all();
    queue_.wake();

    if (thread_.joinable()) {
        thread_.join();
    }
    connection_.resume();

    final_flush(deadline);
}

DeliveryStats DeliveryWorker::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void DeliveryWorker::run() {
    t_delivery_thread = true;

    while (running_) {
        step(Clock::now());
        if (!running_) break;
        wait_for_work();
    }
}

void DeliveryWorker::step(Clock::time_point now) {
    if (!connection_.poll(now)) {
        return;
    }

    if (batch_.empty()) {
        start_batch();
    }
    if (!batch_.empty() && now >= retry_at_) {
        attempt_publish(now);
    }
}

void DeliveryWorker::wait_for_work() {
    auto now = Clock::now();
    Clock::duration interval = config_.batch_interval;

    if (!connection_.connected()) {
        // Nothing can be sent; wake for the next connect attempt
        auto until = connection_.next_attempt() - now;
        sleep_unless_stopped(std::min(until, interval));
    } else if (!batch_.empty()) {
        auto until = retry_at_ - now;
        sleep_unless_stopped(std::min(until, interval));
    } else {
        queue_.wait_for_data(config_.batch_interval);
    }
}

void DeliveryWorker::sleep_unless_stopped(Clock::duration timeout) {
    if (timeout <= Clock::duration::zero()) {
        return;
    }
    std::unique_lock<std::mutex> lock(stop_mutex_);
    stop_cv_.wait_for(lock, timeout, [this] { return !running_; });
}

void DeliveryWorker::start_batch() {
    batch_ = queue_.drain(config_.batch_size);
    batch_done_ = 0;
    batch_failures_ = 0;
    retry_at_ = Clock::time_point{};
}

void DeliveryWorker::clear_batch() {
    batch_.clear();
    batch_done_ = 0;
    batch_failures_ = 0;
    retry_at_ = Clock::time_point{};
}

void DeliveryWorker::attempt_publish(Clock::time_point now) {
    PublishOutcome outcome = connection_.publish(batch_, batch_done_);
    batch_done_ += outcome.consumed();

    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.publish_attempts++;
    stats_.messages_published += outcome.sent;
    stats_.rejected += outcome.rejected;

    if (batch_done_ == batch_.size()) {
        stats_.batches_published++;
        VLOG(2) << "Published batch of " << batch_.size() << " message(s)";
        clear_batch();
        return;
    }

    stats_.publish_failures++;
    uint32_t failures = ++batch_failures_;

    if (failures > static_cast<uint32_t>(config_.max_retries)) {
        size_t remaining = batch_.size() - batch_done_;
        stats_.dropped += remaining;
        stats_.batches_dropped++;
        LOG_EVERY_N(WARNING, 10) << "Dropping " << remaining << " message(s) after "
                                 << failures << " failed publish attempt(s)";
        clear_batch();
        return;
    }

    stats_.retries++;
    retry_at_ = now + config_.backoff.delay(failures);
}

void DeliveryWorker::final_flush(Clock::time_point deadline) {
    DeliveryThreadScope scope;

    bool pending = !batch_.empty() || !queue_.empty();
    auto now = Clock::now();
    if (pending && !connection_.connected() && now < deadline) {
        auto budget = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (budget.count() > 0) {
            connection_.connect(now, budget);
        }
    }

    while (connection_.connected() && Clock::now() < deadline) {
        if (batch_.empty()) {
            start_batch();
            if (batch_.empty()) {
                break;
            }
        }

        PublishOutcome outcome = connection_.publish(batch_, batch_done_);
        batch_done_ += outcome.consumed();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.publish_attempts++;
            stats_.messages_published += outcome.sent;
            stats_.rejected += outcome.rejected;
            if (batch_done_ == batch_.size()) {
                stats_.batches_published++;
            } else {
                stats_.publish_failures++;
            }
        }

        if (batch_done_ < batch_.size()) {
            break;
        }
        clear_batch();
    }

    size_t abandoned = (batch_.size() - batch_done_) + queue_.drain(queue_.capacity()).size();
    clear_batch();

    if (abandoned > 0) {
        LOG(WARNING) << "Final flush left " << abandoned << " message(s) undelivered";
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.dropped_on_shutdown += abandoned;
    }
}

}  // namespace mqttlog

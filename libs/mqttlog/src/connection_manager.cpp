// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/connection_manager.hpp"
#include "mqttlog/errors.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace mqttlog {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::Connected: return "CONNECTED";
        case ConnectionState::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

std::chrono::milliseconds BackoffPolicy::delay(uint32_t failures) const {
    // Shift only while the result can still be below the cap
    auto value = base;
    for (uint32_t i = 0; i < failures && value < cap; ++i) {
        value *= 2;
    }
    return std::min(value, cap);
}

ConnectionManager::ConnectionManager(std::unique_ptr<BrokerTransport> transport,
                                     const BackoffPolicy& backoff)
    : transport_(std::move(transport))
    , backoff_(backoff) {
}

ConnectionManager::~ConnectionManager() {
    close();
}

bool ConnectionManager::connect(Clock::time_point now, std::chrono::milliseconds timeout) {
    if (state_ == ConnectionState::Closed) {
        return false;
    }
    if (state_ == ConnectionState::Connected) {
        return true;
    }

    state_ = ConnectionState::Connecting;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connect_attempts++;
    }

    if (transport_->connect(timeout)) {
        {
            std::lock_guard<std::mutex> lock(schedule_mutex_);
            connected_since_ = now;
            hold_threshold_ = backoff_.delay(failures_);
        }
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.connects++;
        }
        state_ = ConnectionState::Connected;
        LOG(INFO) << "Connected via " << transport_->name()
                  << " after " << failures_ << " failed attempt(s)";
        return true;
    }

    uint32_t failures = ++failures_;
    auto delay = backoff_.delay(failures);
    {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        next_attempt_ = now + delay;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.connect_failures++;
    }
    state_ = ConnectionState::Disconnected;

    LOG_EVERY_N(WARNING, 10) << "Broker connect failed (" << failures
                             << " consecutive), next attempt in " << delay.count() << "ms";
    return false;
}

bool ConnectionManager::poll(Clock::time_point now, std::chrono::milliseconds io_timeout) {
    switch (state_.load()) {
        case ConnectionState::Closed:
        case ConnectionState::Connecting:
            return false;

        case ConnectionState::Connected:
            if (!transport_->poll(io_timeout)) {
                mark_disconnected(now);
                return false;
            }
            maybe_reset_failures(now);
            return true;

        case ConnectionState::Disconnected:
            if (now < next_attempt()) {
                return false;
            }
            return connect(now);
    }
    return false;
}

PublishOutcome ConnectionManager::publish(const std::vector<EncodedMessage>& batch,
                                          size_t offset) {
    if (state_ != ConnectionState::Connected) {
        throw NotConnectedError(std::string("publish attempted in state ") +
                                to_string(state_.load()));
    }

    PublishOutcome outcome;
    for (size_t i = offset; i < batch.size(); ++i) {
        PublishResult result = transport_->publish(batch[i]);
        if (result == PublishResult::Sent) {
            outcome.sent++;
            continue;
        }
        if (result == PublishResult::Rejected) {
            outcome.rejected++;
            continue;
        }
        if (!transport_->connected()) {
            mark_disconnected(Clock::now());
        }
        break;
    }
    return outcome;
}

void ConnectionManager::interrupt() {
    transport_->set_interrupted(true);
}

void ConnectionManager::resume() {
    transport_->set_interrupted(false);
}

void ConnectionManager::close() {
    if (state_.exchange(ConnectionState::Closed) == ConnectionState::Closed) {
        return;
    }
    transport_->disconnect();
    LOG(INFO) << "Connection closed (" << transport_->name() << ")";
}

ConnectionManager::Clock::time_point ConnectionManager::next_attempt() const {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    return next_attempt_;
}

ConnectionStats ConnectionManager::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ConnectionManager::mark_disconnected(Clock::time_point now) {
    ConnectionState expected = ConnectionState::Connected;
    if (!state_.compare_exchange_strong(expected, ConnectionState::Disconnected)) {
        return;
    }

    maybe_reset_failures(now);
    auto delay = backoff_.delay(failures_);
    {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        next_attempt_ = now + delay;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.disconnects++;
    }

    LOG(WARNING) << "Broker connection lost, reconnecting in " << delay.count() << "ms";
}

void ConnectionManager::maybe_reset_failures(Clock::time_point now) {
    if (failures_ == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(schedule_mutex_);
    if (now - connected_since_ > hold_threshold_) {
        failures_ = 0;
    }
}

}  // namespace mqttlog

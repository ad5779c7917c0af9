// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/glog_sink.hpp"
#include "mqttlog/delivery_worker.hpp"
#include "mqttlog/errors.hpp"
#include "mqttlog/record_encoder.hpp"

#include <chrono>
#include <ctime>
#include <string>

namespace mqttlog {

namespace {

thread_local bool t_forwarding = false;

class ForwardingGuard {
public:
    ForwardingGuard() { t_forwarding = true; }
    ~ForwardingGuard() { t_forwarding = false; }
};

/// glog passes local broken-down time in whole seconds. The sub-second part
/// comes from the clock while it is still within that second.
std::chrono::system_clock::time_point time_from_glog(const struct ::tm* tm_time) {
    auto now = std::chrono::system_clock::now();
    if (!tm_time) {
        return now;
    }

    std::tm local = *tm_time;
    std::time_t seconds = std::mktime(&local);
    if (seconds == static_cast<std::time_t>(-1)) {
        return now;
    }

    auto logged = std::chrono::system_clock::from_time_t(seconds);
    auto offset = now - logged;
    if (offset >= std::chrono::system_clock::duration::zero() && offset < std::chrono::seconds(1)) {
        return now;
    }
    return logged;
}

}  // namespace

Level level_from_glog(google::LogSeverity severity) {
    switch (severity) {
        case google::GLOG_INFO: return Level::Info;
        case google::GLOG_WARNING: return Level::Warning;
        case google::GLOG_ERROR: return Level::Error;
        default: return Level::Critical;
    }
}

GlogForwardingSink::GlogForwardingSink(std::shared_ptr<Pipeline> pipeline)
    : pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        throw Error("GlogForwardingSink requires a pipeline");
    }
}

GlogForwardingSink::~GlogForwardingSink() {
    detach();
}

void GlogForwardingSink::attach() {
    if (attached_.exchange(true)) {
        return;
    }
    google::AddLogSink(this);
}

void GlogForwardingSink::detach() {
    if (!attached_.exchange(false)) {
        return;
    }
    google::RemoveLogSink(this);
}

void GlogForwardingSink::send(google::LogSeverity severity, const char* /*full_filename*/,
                              const char* base_filename, int line,
                              const struct ::tm* tm_time, const char* message,
                              size_t message_len) {
    if (t_forwarding || DeliveryWorker::on_delivery_thread()) {
        skipped_++;
        return;
    }

    std::string text(message, message_len);
    std::string file = base_filename ? base_filename : "";

    // Must not reach submit(), which would LOG from inside the sink
    if (!is_valid_utf8(text) || !is_valid_utf8(file)) {
        skipped_++;
        return;
    }

    ForwardingGuard guard;
    LogRecord record = make_record(level_from_glog(severity), pipeline_->name(), text,
                                   {{"file", file}, {"line", std::to_string(line)}});
    record.timestamp = time_from_glog(tm_time);
    if (pipeline_->submit(record)) {
        forwarded_++;
    } else {
        skipped_++;
    }
}

}  // namespace mqttlog

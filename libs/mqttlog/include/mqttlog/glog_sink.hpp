// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file glog_sink.hpp
/// @brief Forward glog messages into a pipeline
///
/// Usage:
/// @code
///   auto pipeline = registry.get_or_create("vehicle.gateway", config);
///   mqttlog::GlogForwardingSink sink(pipeline);
///   sink.attach();
///   LOG(WARNING) << "coolant temperature high";   // also published over MQTT
///   sink.detach();
/// @endcode
///
/// Severities map INFO/WARNING/ERROR/FATAL to Info/Warning/Error/Critical.
/// Each record carries "file" and "line" attributes. Messages logged by the
/// delivery thread itself, or while a forward is already in progress on the
/// same thread, are skipped so the library never feeds on its own output.

#include "mqttlog/log_record.hpp"
#include "mqttlog/pipeline.hpp"

#include <glog/logging.h>

#include <atomic>
#include <cstdint>
#include <ctime>
#include <memory>

namespace mqttlog {

/// Map a glog severity to a record level
Level level_from_glog(google::LogSeverity severity);

class GlogForwardingSink : public google::LogSink {
public:
    explicit GlogForwardingSink(std::shared_ptr<Pipeline> pipeline);
    ~GlogForwardingSink() override;

    GlogForwardingSink(const GlogForwardingSink&) = delete;
    GlogForwardingSink& operator=(const GlogForwardingSink&) = delete;

    /// Register with glog
    void attach();

    /// Unregister from glog. Called by the destructor.
    void detach();

    bool attached() const { return attached_; }

    void send(google::LogSeverity severity, const char* full_filename,
              const char* base_filename, int line, const struct ::tm* tm_time,
              const char* message, size_t message_len) override;

    uint64_t forwarded() const { return forwarded_; }
    uint64_t skipped() const { return skipped_; }

private:
    std::shared_ptr<Pipeline> pipeline_;
    std::atomic<bool> attached_{false};
    std::atomic<uint64_t> forwarded_{0};
    std::atomic<uint64_t> skipped_{0};
};

}  // namespace mqttlog

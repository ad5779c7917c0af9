// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file pipeline.hpp
/// @brief One named log forwarding pipeline
///
/// A Pipeline owns a bounded queue, a broker connection and the delivery
/// worker that moves messages from one to the other:
///
/// @code
///   log()/submit() -> [min_level] -> encode -> [compress] -> BoundedQueue
///                                                               |
///                     broker <- ConnectionManager <- DeliveryWorker (thread)
/// @endcode
///
/// log() and submit() never block on the network and never throw for
/// delivery problems; those show up in stats() instead.

#include "mqttlog/bounded_queue.hpp"
#include "mqttlog/broker_transport.hpp"
#include "mqttlog/compressor.hpp"
#include "mqttlog/config.hpp"
#include "mqttlog/connection_manager.hpp"
#include "mqttlog/delivery_worker.hpp"
#include "mqttlog/log_record.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace mqttlog {

/// Aggregated pipeline statistics
struct PipelineStats {
    uint64_t records_submitted = 0;  ///< Records encoded and handed to the queue
    uint64_t records_filtered = 0;   ///< Below min_level
    uint64_t records_rejected = 0;   ///< Submitted after shutdown
    uint64_t encoding_errors = 0;

    // Failure counters
    uint64_t connect_failures = 0;
    uint64_t overflow = 0;
    uint64_t dropped = 0;

    size_t queue_depth = 0;
    QueueStats queue;
    ConnectionStats connection;
    DeliveryStats delivery;
    TransportStats transport;
    CompressionStats compression;
};

class Pipeline {
public:
    /// @throws Error if the configured compressor cannot be initialized
    Pipeline(const std::string& name, const PipelineConfig& config,
             std::unique_ptr<BrokerTransport> transport);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /// Start the delivery worker
    bool start();

    /// Stop accepting records, flush for at most shutdown_timeout, then
    /// close the broker connection. Idempotent.
    void shutdown();

    /// Build a record named after this pipeline and submit it
    bool log(Level level, const std::string& message, const Attributes& attributes = {});

    bool debug(const std::string& message) { return log(Level::Debug, message); }
    bool info(const std::string& message) { return log(Level::Info, message); }
    bool warning(const std::string& message) { return log(Level::Warning, message); }
    bool error(const std::string& message) { return log(Level::Error, message); }
    bool critical(const std::string& message) { return log(Level::Critical, message); }

    /// Filter, encode and enqueue a record
    /// @return true if the record was queued
    bool submit(const LogRecord& record);

    const std::string& name() const { return name_; }
    const PipelineConfig& config() const { return config_; }
    ConnectionState connection_state() const { return connection_.state(); }
    bool accepting() const { return accepting_; }

    /// True while accepting records and connected to the broker
    bool healthy() const;

    PipelineStats stats() const;

private:
    const std::string name_;
    const PipelineConfig config_;

    std::unique_ptr<Compressor> compressor_;
    BoundedQueue queue_;
    ConnectionManager connection_;
    DeliveryWorker worker_;

    std::atomic<bool> accepting_{false};
    // Shared by submit() around its final accepting_ check and push;
    // exclusive while accepting_ changes
    std::shared_mutex admission_mutex_;
    std::mutex lifecycle_mutex_;
    bool stopped_ = false;

    mutable std::mutex stats_mutex_;
    uint64_t records_submitted_ = 0;
    uint64_t records_filtered_ = 0;
    uint64_t records_rejected_ = 0;
    uint64_t encoding_errors_ = 0;
};

}  // namespace mqttlog

// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/pipeline.hpp"
#include "mqttlog/errors.hpp"
#include "mqttlog/record_encoder.hpp"

#include <glog/logging.h>

namespace mqttlog {

namespace {

BackoffPolicy backoff_from(const PipelineConfig& config) {
    BackoffPolicy backoff;
    backoff.base = config.backoff_base;
    backoff.cap = config.backoff_cap;
    return backoff;
}

DeliveryConfig delivery_from(const PipelineConfig& config) {
    DeliveryConfig delivery;
    delivery.batch_size = config.batch_size;
    delivery.batch_interval = config.batch_interval;
    delivery.max_retries = config.max_retries;
    delivery.backoff = backoff_from(config);
    return delivery;
}

std::unique_ptr<Compressor> make_compressor(const PipelineConfig& config) {
    auto compressor = create_compressor(config.compression, config.compression_level);
    if (!compressor) {
        throw Error(std::string("failed to initialize ") + to_string(config.compression) +
                    " compressor");
    }
    return compressor;
}

}  // namespace

Pipeline::Pipeline(const std::string& name, const PipelineConfig& config,
                   std::unique_ptr<BrokerTransport> transport)
    : name_(name)
    , config_(config)
    , compressor_(make_compressor(config))
    , queue_(config.queue_capacity, config.overflow_policy)
    , connection_(std::move(transport), backoff_from(config))
    , worker_(queue_, connection_, delivery_from(config)) {
}

Pipeline::~Pipeline() {
    shutdown();
}

bool Pipeline::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        LOG(WARNING) << "Pipeline '" << name_ << "' cannot be restarted after shutdown";
        return false;
    }
    if (!worker_.start()) {
        return false;
    }
    {
        std::unique_lock<std::shared_mutex> admission(admission_mutex_);
        accepting_ = true;
    }

    LOG(INFO) << "Pipeline '" << name_ << "' started: broker " << config_.hostname << ":"
              << config_.port << ", topic '" << config_.topic_template << "'"
              << ", format " << to_string(config_.payload_format)
              << ", compression " << to_string(config_.compression)
              << ", queue " << config_.queue_capacity
              << " (" << to_string(config_.overflow_policy) << ")";
    return true;
}

void Pipeline::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (stopped_) {
        return;
    }
    stopped_ = true;
    {
        // Waits out producers between their accepting_ check and push, so
        // nothing reaches the queue after the final flush
        std::unique_lock<std::shared_mutex> admission(admission_mutex_);
        accepting_ = false;
    }

    worker_.stop(config_.shutdown_timeout);
    connection_.close();

    auto delivery = worker_.stats();
    LOG(INFO) << "Pipeline '" << name_ << "' shut down: "
              << delivery.messages_published << " published, "
              << delivery.dropped << " dropped, "
              << delivery.rejected << " rejected by the broker client, "
              << delivery.dropped_on_shutdown << " undelivered at shutdown, "
              << queue_.stats().overflow << " overflowed";
}

bool Pipeline::log(Level level, const std::string& message, const Attributes& attributes) {
    return submit(make_record(level, name_, message, attributes));
}

bool Pipeline::submit(const LogRecord& record) {
    if (!accepting_) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        records_rejected_++;
        return false;
    }

    if (record.level < config_.min_level) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        records_filtered_++;
        return false;
    }

    EncodedMessage msg;
    try {
        msg = encode(record, config_);
    } catch (const EncodingError& e) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            encoding_errors_++;
        }
        LOG_EVERY_N(WARNING, 100) << "Pipeline '" << name_
                                  << "' dropped a record that could not be encoded: " << e.what();
        return false;
    }

    if (!compressor_->compress(msg.payload)) {
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            encoding_errors_++;
        }
        LOG_EVERY_N(WARNING, 100) << "Pipeline '" << name_
                                  << "' dropped a record that could not be compressed";
        return false;
    }

    std::shared_lock<std::shared_mutex> admission(admission_mutex_);
    if (!accepting_) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        records_rejected_++;
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        records_submitted_++;
    }
    return queue_.push(std::move(msg));
}

bool Pipeline::healthy() const {
    return accepting_ && connection_.connected();
}

PipelineStats Pipeline::stats() const {
    PipelineStats stats;
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats.records_submitted = records_submitted_;
        stats.records_filtered = records_filtered_;
        stats.records_rejected = records_rejected_;
        stats.encoding_errors = encoding_errors_;
    }

    stats.queue = queue_.stats();
    stats.queue_depth = queue_.size();
    stats.connection = connection_.stats();
    stats.delivery = worker_.stats();
    stats.transport = connection_.transport().stats();
    stats.compression = compressor_->stats();

    stats.connect_failures = stats.connection.connect_failures;
    stats.overflow = stats.queue.overflow;
    stats.dropped = stats.delivery.dropped;
    return stats;
}

}  // namespace mqttlog

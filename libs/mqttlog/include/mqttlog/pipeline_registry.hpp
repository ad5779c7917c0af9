// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file pipeline_registry.hpp
/// @brief Name to pipeline map with get-or-create semantics
///
/// Usage:
/// @code
///   mqttlog::PipelineRegistry registry;
///   auto app = registry.get_or_create("app.db", mqttlog::load_config("mqttlog.yaml"));
///   app->log(mqttlog::Level::Info, "connected to database");
///   ...
///   registry.shutdown_all();
/// @endcode
///
/// At most one pipeline exists per name. The first get_or_create() for a
/// name decides its configuration; later calls return the same pipeline and
/// ignore their configuration argument.

#include "mqttlog/broker_transport.hpp"
#include "mqttlog/config.hpp"
#include "mqttlog/pipeline.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mqttlog {

/// Creates the broker transport for a new pipeline
using TransportFactory = std::function<std::unique_ptr<BrokerTransport>(
    const std::string& name, const PipelineConfig& config)>;

/// Factory producing an MqttTransport for the configured broker
TransportFactory default_transport_factory();

class PipelineRegistry {
public:
    explicit PipelineRegistry(TransportFactory factory = default_transport_factory());
    ~PipelineRegistry();

    PipelineRegistry(const PipelineRegistry&) = delete;
    PipelineRegistry& operator=(const PipelineRegistry&) = delete;

    /// Return the pipeline registered under name, creating and starting it
    /// from config if there is none
    /// @throws ConfigError if a new pipeline's config is invalid
    /// @throws Error if the transport or pipeline cannot be created
    std::shared_ptr<Pipeline> get_or_create(const std::string& name,
                                            const PipelineConfig& config = {});

    /// @return The pipeline registered under name, or nullptr
    std::shared_ptr<Pipeline> find(const std::string& name) const;

    /// Flush, close and unregister one pipeline
    /// @return false if no pipeline is registered under name
    bool shutdown(const std::string& name);

    /// Flush, close and unregister every pipeline
    void shutdown_all();

    std::vector<std::string> names() const;
    size_t size() const;

private:
    TransportFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Pipeline>> pipelines_;
};

}  // namespace mqttlog

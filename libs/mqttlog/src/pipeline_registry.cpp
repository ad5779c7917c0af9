// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "mqttlog/pipeline_registry.hpp"
#include "mqttlog/errors.hpp"
#include "mqttlog/mqtt_transport.hpp"

#include <glog/logging.h>

namespace mqttlog {

TransportFactory default_transport_factory() {
    return [](const std::string& /*name*/,
              const PipelineConfig& config) -> std::unique_ptr<BrokerTransport> {
        return std::make_unique<MqttTransport>(transport_config_from(config));
    };
}

PipelineRegistry::PipelineRegistry(TransportFactory factory)
    : factory_(std::move(factory)) {
    if (!factory_) {
        throw Error("PipelineRegistry requires a transport factory");
    }
}

PipelineRegistry::~PipelineRegistry() {
    shutdown_all();
}

std::shared_ptr<Pipeline> PipelineRegistry::get_or_create(const std::string& name,
                                                          const PipelineConfig& config) {
    // Held through construction so concurrent callers see one pipeline
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = pipelines_.find(name);
    if (it != pipelines_.end()) {
        VLOG(1) << "Reusing pipeline '" << name << "'";
        return it->second;
    }

    validate(config);

    auto transport = factory_(name, config);
    if (!transport) {
        throw Error("transport factory returned no transport for pipeline '" + name + "'");
    }

    auto pipeline = std::make_shared<Pipeline>(name, config, std::move(transport));
    if (!pipeline->start()) {
        throw Error("failed to start pipeline '" + name + "'");
    }

    pipelines_.emplace(name, pipeline);
    LOG(INFO) << "Registered pipeline '" << name << "' (" << pipelines_.size() << " total)";
    return pipeline;
}

std::shared_ptr<Pipeline> PipelineRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(name);
    if (it == pipelines_.end()) {
        return nullptr;
    }
    return it->second;
}

bool PipelineRegistry::shutdown(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pipelines_.find(name);
    if (it == pipelines_.end()) {
        return false;
    }

    it->second->shutdown();
    pipelines_.erase(it);
    return true;
}

void PipelineRegistry::shutdown_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pipelines_.empty()) {
        return;
    }

    for (auto& entry : pipelines_) {
        entry.second->shutdown();
    }
    LOG(INFO) << "Shut down " << pipelines_.size() << " pipeline(s)";
    pipelines_.clear();
}

std::vector<std::string> PipelineRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(pipelines_.size());
    for (const auto& entry : pipelines_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t PipelineRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pipelines_.size();
}

}  // namespace mqttlog

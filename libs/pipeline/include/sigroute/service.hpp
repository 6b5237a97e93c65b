// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file service.hpp
/// @brief Builds every pipeline and receiver from the configuration and runs them
///
/// Start order: pipelines (and with them the exporters), then receivers, then
/// the self-telemetry endpoint. Shutdown runs in reverse: receivers stop
/// first, then all pipelines drain in parallel, then the exporters are shut
/// down.

#include "sigroute/component_registry.hpp"
#include "sigroute/config.hpp"
#include "sigroute/pipeline.hpp"
#include "sigroute/receiver.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sigroute {

class HttpServer;

/// Routes decoded signals from one receiver to every pipeline of the
/// matching type bound to it
class PipelineRouter : public SignalConsumer {
public:
    void add(Pipeline* pipeline);

    ConsumeStatus consume(SignalType type, std::vector<Signal>&& signals) override;

private:
    std::map<SignalType, std::vector<Pipeline*>> pipelines_;
};

class Service {
public:
    /// Build all components
    /// @throws ConfigError on unknown types, invalid settings, unsupported
    ///         signal types or a misplaced batch processor
    Service(const Config& config, const ComponentRegistry& registry);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    /// @return false if a pipeline or receiver failed to start; everything
    ///         already started has been stopped again
    bool start();

    /// Stop receivers, drain pipelines, shut exporters down. Idempotent.
    void shutdown();

    bool healthy() const;

    /// Pipeline by id, nullptr if unknown
    Pipeline* pipeline(const std::string& id) const;

    const std::vector<std::unique_ptr<Pipeline>>& pipelines() const { return pipelines_; }

    /// Own counters in the Prometheus text format
    std::string render_metrics() const;

private:
    void stop_components();

    ServiceConfig config_;
    std::map<std::string, std::shared_ptr<Exporter>> exporters_;
    std::vector<std::unique_ptr<Pipeline>> pipelines_;
    std::vector<std::shared_ptr<PipelineRouter>> routers_;
    std::vector<std::shared_ptr<Receiver>> receivers_;
    std::unique_ptr<HttpServer> telemetry_server_;

    std::mutex lifecycle_mutex_;
    bool started_ = false;
};

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file component_registry.hpp
/// @brief Factories of receivers, processors and exporters by component type

#include "sigroute/batch_processor.hpp"
#include "sigroute/config.hpp"
#include "sigroute/exporter_fanout.hpp"
#include "sigroute/processor.hpp"
#include "sigroute/receiver.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sigroute {

/// What a processor factory produces: a transforming processor, or batch
/// settings for the pipeline's batching stage
struct ProcessorBuild {
    std::shared_ptr<const Processor> processor;
    std::optional<BatchSettings> batching;
};

/// Factories throw ConfigError on invalid settings
using ReceiverFactory = std::function<std::shared_ptr<Receiver>(
    const ComponentConfig&, std::shared_ptr<SignalConsumer>)>;
using ProcessorFactory = std::function<ProcessorBuild(const ComponentConfig&)>;
using ExporterFactory = std::function<ExporterBinding(const ComponentConfig&)>;

class ComponentRegistry {
public:
    void register_receiver(const std::string& type, ReceiverFactory factory);
    void register_processor(const std::string& type, ProcessorFactory factory);
    void register_exporter(const std::string& type, ExporterFactory factory);

    /// @throws ConfigError on an unknown type or invalid settings
    std::shared_ptr<Receiver> build_receiver(const ComponentConfig& config,
                                             std::shared_ptr<SignalConsumer> consumer) const;
    ProcessorBuild build_processor(const ComponentConfig& config) const;
    ExporterBinding build_exporter(const ComponentConfig& config) const;

    bool has_receiver(const std::string& type) const { return receivers_.count(type) > 0; }
    bool has_processor(const std::string& type) const { return processors_.count(type) > 0; }
    bool has_exporter(const std::string& type) const { return exporters_.count(type) > 0; }

private:
    std::map<std::string, ReceiverFactory> receivers_;
    std::map<std::string, ProcessorFactory> processors_;
    std::map<std::string, ExporterFactory> exporters_;
};

}  // namespace sigroute

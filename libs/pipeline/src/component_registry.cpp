// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/component_registry.hpp"

#include "sigroute/errors.hpp"

namespace sigroute {

namespace {

template <typename Map>
std::string known_types(const Map& factories) {
    std::string out;
    for (const auto& entry : factories) {
        if (!out.empty()) out += ", ";
        out += entry.first;
    }
    return out;
}

template <typename Map>
const typename Map::mapped_type& find_factory(const Map& factories, const ComponentConfig& config,
                                              const char* kind) {
    auto it = factories.find(config.id.type);
    if (it == factories.end()) {
        throw ConfigError(std::string("unknown ") + kind + " type '" + config.id.type + "' for '" +
                          config.id.str() + "' (known: " + known_types(factories) + ")");
    }
    return it->second;
}

}  // namespace

void ComponentRegistry::register_receiver(const std::string& type, ReceiverFactory factory) {
    receivers_[type] = std::move(factory);
}

void ComponentRegistry::register_processor(const std::string& type, ProcessorFactory factory) {
    processors_[type] = std::move(factory);
}

void ComponentRegistry::register_exporter(const std::string& type, ExporterFactory factory) {
    exporters_[type] = std::move(factory);
}

std::shared_ptr<Receiver> ComponentRegistry::build_receiver(
    const ComponentConfig& config, std::shared_ptr<SignalConsumer> consumer) const {
    auto receiver = find_factory(receivers_, config, "receiver")(config, std::move(consumer));
    if (!receiver) {
        throw ConfigError("receiver '" + config.id.str() + "' could not be created");
    }
    return receiver;
}

ProcessorBuild ComponentRegistry::build_processor(const ComponentConfig& config) const {
    ProcessorBuild build = find_factory(processors_, config, "processor")(config);
    if (!build.processor && !build.batching) {
        throw ConfigError("processor '" + config.id.str() + "' could not be created");
    }
    return build;
}

ExporterBinding ComponentRegistry::build_exporter(const ComponentConfig& config) const {
    ExporterBinding binding = find_factory(exporters_, config, "exporter")(config);
    if (!binding.exporter) {
        throw ConfigError("exporter '" + config.id.str() + "' could not be created");
    }
    return binding;
}

}  // namespace sigroute

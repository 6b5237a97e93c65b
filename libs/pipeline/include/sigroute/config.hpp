// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file config.hpp
/// @brief YAML configuration: components, pipelines and service settings
///
/// Layout of the document:
/// @code
///   receivers:  { <id>: <settings>, ... }
///   processors: { <id>: <settings>, ... }
///   exporters:  { <id>: <settings>, ... }
///   service:
///     drain_timeout: 30s
///     delivery_policy: at_least_one
///     max_in_flight_batches: 8
///     telemetry: { logs: { level: info }, metrics: { address: ":8888" } }
///     pipelines:
///       traces:  { receivers: [otlp], processors: [batch], exporters: [logging] }
/// @endcode
///
/// Component ids are "type" or "type/name". Placeholders ${env:NAME} and
/// ${NAME} in any scalar are expanded from the Environment passed to the
/// loader. Every problem is reported as ConfigError.

#include "sigroute/delivery_tracker.hpp"
#include "sigroute/environment.hpp"
#include "sigroute/signal.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sigroute {

/// "type" or "type/name"
struct ComponentId {
    std::string type;
    std::string name;

    /// @throws ConfigError on an empty type or name
    static ComponentId parse(const std::string& id);

    std::string str() const { return name.empty() ? type : type + "/" + name; }
};

/// Typed access to one settings block. Conversion errors are reported as
/// ConfigError naming the full key path.
class Settings {
public:
    Settings() = default;
    Settings(YAML::Node node, std::string path);

    bool has(const std::string& key) const;

    /// Nested block, empty if absent
    Settings child(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& fallback = "") const;
    bool get_bool(const std::string& key, bool fallback) const;
    int64_t get_int(const std::string& key, int64_t fallback) const;
    double get_double(const std::string& key, double fallback) const;
    size_t get_size(const std::string& key, size_t fallback) const;

    /// Go-style duration string ("5s", "200ms")
    std::chrono::milliseconds get_duration(const std::string& key,
                                           std::chrono::milliseconds fallback) const;

    std::map<std::string, std::string> get_string_map(const std::string& key) const;

    const YAML::Node& node() const { return node_; }
    const std::string& path() const { return path_; }

    /// Path of a key below this block, for error messages
    std::string key_path(const std::string& key) const;

private:
    YAML::Node node_;
    std::string path_;
};

struct ComponentConfig {
    ComponentId id;
    Settings settings;
};

struct PipelineConfig {
    /// "traces", "metrics/internal", ...
    std::string id;
    SignalType type = SignalType::Traces;
    std::vector<std::string> receivers;
    std::vector<std::string> processors;
    std::vector<std::string> exporters;
};

struct TelemetryConfig {
    /// debug, info, warn or error
    std::string log_level = "info";
    /// Listen address of the self-telemetry endpoint, empty to disable
    std::string metrics_address;
};

struct ServiceConfig {
    std::vector<PipelineConfig> pipelines;
    std::chrono::milliseconds drain_timeout{30000};
    DeliveryPolicy delivery_policy = DeliveryPolicy::AtLeastOne;
    size_t max_in_flight_batches = 8;
    TelemetryConfig telemetry;
};

struct Config {
    std::map<std::string, ComponentConfig> receivers;
    std::map<std::string, ComponentConfig> processors;
    std::map<std::string, ComponentConfig> exporters;
    ServiceConfig service;
};

/// Parse a configuration document
/// @throws ConfigError
Config parse_config(const std::string& yaml, const Environment& env);

/// Load and parse a configuration file
/// @throws ConfigError
Config load_config(const std::string& path, const Environment& env);

}  // namespace sigroute

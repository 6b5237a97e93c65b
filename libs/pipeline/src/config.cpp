// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/config.hpp"

#include "sigroute/duration.hpp"
#include "sigroute/errors.hpp"

#include <glog/logging.h>

#include <fstream>
#include <set>
#include <sstream>

namespace sigroute {

namespace {

void expand_node(YAML::Node node, const Environment& env, std::map<std::string, int>& missing) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            if (node.Scalar().find('$') != std::string::npos) {
                node = env.expand(node.Scalar(), &missing);
            }
            break;
        case YAML::NodeType::Sequence:
            for (auto child : node) {
                expand_node(child, env, missing);
            }
            break;
        case YAML::NodeType::Map:
            for (auto entry : node) {
                expand_node(entry.second, env, missing);
            }
            break;
        default:
            break;
    }
}

std::map<std::string, ComponentConfig> parse_components(const YAML::Node& root,
                                                        const std::string& section) {
    std::map<std::string, ComponentConfig> out;
    YAML::Node node = root[section];
    if (!node || node.IsNull()) {
        return out;
    }
    if (!node.IsMap()) {
        throw ConfigError("'" + section + "' must be a mapping of component ids");
    }

    for (const auto& entry : node) {
        std::string id = entry.first.as<std::string>();
        YAML::Node settings = entry.second;
        if (!settings.IsNull() && !settings.IsMap()) {
            throw ConfigError(section + "." + id + ": settings must be a mapping");
        }

        ComponentConfig component;
        component.id = ComponentId::parse(id);
        component.settings = Settings(settings, section + "." + id);
        out.emplace(component.id.str(), std::move(component));
    }
    return out;
}

std::vector<std::string> parse_id_list(const YAML::Node& node, const std::string& path) {
    std::vector<std::string> out;
    if (!node || node.IsNull()) {
        return out;
    }
    if (!node.IsSequence()) {
        throw ConfigError(path + ": expected a list of component ids");
    }

    std::set<std::string> seen;
    for (const auto& item : node) {
        std::string id = ComponentId::parse(item.as<std::string>()).str();
        if (!seen.insert(id).second) {
            throw ConfigError(path + ": '" + id + "' listed twice");
        }
        out.push_back(id);
    }
    return out;
}

void check_references(const PipelineConfig& pipeline, const std::vector<std::string>& ids,
                      const std::map<std::string, ComponentConfig>& defined,
                      const std::string& kind) {
    for (const auto& id : ids) {
        if (defined.count(id) == 0) {
            throw ConfigError("pipeline '" + pipeline.id + "' references " + kind + " '" + id +
                              "' which is not defined in '" + kind + "s'");
        }
    }
}

ServiceConfig parse_service(const YAML::Node& root, const Config& config) {
    ServiceConfig service;
    Settings settings(root["service"], "service");
    if (!root["service"] || !root["service"].IsMap()) {
        throw ConfigError("missing 'service' section");
    }

    service.drain_timeout = settings.get_duration("drain_timeout", service.drain_timeout);
    service.max_in_flight_batches =
        settings.get_size("max_in_flight_batches", service.max_in_flight_batches);

    std::string policy = settings.get_string("delivery_policy", "at_least_one");
    auto parsed_policy = delivery_policy_from_string(policy);
    if (!parsed_policy) {
        throw ConfigError(settings.key_path("delivery_policy") + ": unknown policy '" + policy +
                          "', expected at_least_one or all_required");
    }
    service.delivery_policy = *parsed_policy;

    Settings telemetry = settings.child("telemetry");
    service.telemetry.log_level =
        telemetry.child("logs").get_string("level", service.telemetry.log_level);
    service.telemetry.metrics_address = telemetry.child("metrics").get_string("address", "");
    static const std::set<std::string> kLevels = {"debug", "info", "warn", "error"};
    if (kLevels.count(service.telemetry.log_level) == 0) {
        throw ConfigError("service.telemetry.logs.level: unknown level '" +
                          service.telemetry.log_level + "'");
    }

    YAML::Node pipelines = root["service"]["pipelines"];
    if (!pipelines || !pipelines.IsMap() || pipelines.size() == 0) {
        throw ConfigError("service.pipelines: at least one pipeline is required");
    }

    for (const auto& entry : pipelines) {
        PipelineConfig pipeline;
        pipeline.id = entry.first.as<std::string>();
        const std::string path = "service.pipelines." + pipeline.id;

        std::string type_name = pipeline.id.substr(0, pipeline.id.find('/'));
        auto type = signal_type_from_string(type_name);
        if (!type) {
            throw ConfigError(path + ": pipeline type must be traces, metrics or logs");
        }
        if (pipeline.id.find('/') != std::string::npos &&
            pipeline.id.size() == type_name.size() + 1) {
            throw ConfigError(path + ": empty pipeline name");
        }
        pipeline.type = *type;

        const YAML::Node& body = entry.second;
        if (!body.IsMap()) {
            throw ConfigError(path + ": expected a mapping");
        }
        pipeline.receivers = parse_id_list(body["receivers"], path + ".receivers");
        pipeline.processors = parse_id_list(body["processors"], path + ".processors");
        pipeline.exporters = parse_id_list(body["exporters"], path + ".exporters");

        if (pipeline.receivers.empty()) {
            throw ConfigError(path + ": at least one receiver is required");
        }
        if (pipeline.exporters.empty()) {
            throw ConfigError(path + ": at least one exporter is required");
        }

        check_references(pipeline, pipeline.receivers, config.receivers, "receiver");
        check_references(pipeline, pipeline.processors, config.processors, "processor");
        check_references(pipeline, pipeline.exporters, config.exporters, "exporter");

        service.pipelines.push_back(std::move(pipeline));
    }
    return service;
}

}  // namespace

ComponentId ComponentId::parse(const std::string& id) {
    ComponentId out;
    auto slash = id.find('/');
    out.type = id.substr(0, slash);
    if (slash != std::string::npos) {
        out.name = id.substr(slash + 1);
        if (out.name.empty()) {
            throw ConfigError("component id '" + id + "' has an empty name");
        }
    }
    if (out.type.empty()) {
        throw ConfigError("component id '" + id + "' has an empty type");
    }
    return out;
}

Settings::Settings(YAML::Node node, std::string path)
    : node_(std::move(node)), path_(std::move(path)) {}

bool Settings::has(const std::string& key) const {
    return node_.IsMap() && node_[key] && !node_[key].IsNull();
}

std::string Settings::key_path(const std::string& key) const {
    return path_.empty() ? key : path_ + "." + key;
}

Settings Settings::child(const std::string& key) const {
    if (!has(key)) {
        return Settings(YAML::Node(), key_path(key));
    }
    YAML::Node node = node_[key];
    if (!node.IsMap()) {
        throw ConfigError(key_path(key) + ": expected a mapping");
    }
    return Settings(node, key_path(key));
}

std::string Settings::get_string(const std::string& key, const std::string& fallback) const {
    if (!has(key)) {
        return fallback;
    }
    YAML::Node node = node_[key];
    if (!node.IsScalar()) {
        throw ConfigError(key_path(key) + ": expected a string");
    }
    return node.Scalar();
}

bool Settings::get_bool(const std::string& key, bool fallback) const {
    if (!has(key)) {
        return fallback;
    }
    try {
        return node_[key].as<bool>();
    } catch (const YAML::Exception&) {
        throw ConfigError(key_path(key) + ": expected true or false");
    }
}

int64_t Settings::get_int(const std::string& key, int64_t fallback) const {
    if (!has(key)) {
        return fallback;
    }
    try {
        return node_[key].as<int64_t>();
    } catch (const YAML::Exception&) {
        throw ConfigError(key_path(key) + ": expected an integer");
    }
}

double Settings::get_double(const std::string& key, double fallback) const {
    if (!has(key)) {
        return fallback;
    }
    try {
        return node_[key].as<double>();
    } catch (const YAML::Exception&) {
        throw ConfigError(key_path(key) + ": expected a number");
    }
}

size_t Settings::get_size(const std::string& key, size_t fallback) const {
    int64_t value = get_int(key, static_cast<int64_t>(fallback));
    if (value < 0) {
        throw ConfigError(key_path(key) + ": must not be negative");
    }
    return static_cast<size_t>(value);
}

std::chrono::milliseconds Settings::get_duration(const std::string& key,
                                                 std::chrono::milliseconds fallback) const {
    if (!has(key)) {
        return fallback;
    }
    try {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            parse_duration(get_string(key)));
    } catch (const ConfigError& e) {
        throw ConfigError(key_path(key) + ": " + e.what());
    }
}

std::map<std::string, std::string> Settings::get_string_map(const std::string& key) const {
    std::map<std::string, std::string> out;
    if (!has(key)) {
        return out;
    }
    YAML::Node node = node_[key];
    if (!node.IsMap()) {
        throw ConfigError(key_path(key) + ": expected a mapping");
    }
    for (const auto& entry : node) {
        if (!entry.second.IsNull() && !entry.second.IsScalar()) {
            throw ConfigError(key_path(key) + "." + entry.first.as<std::string>() +
                              ": expected a string");
        }
        out[entry.first.as<std::string>()] =
            entry.second.IsNull() ? std::string() : entry.second.Scalar();
    }
    return out;
}

Config parse_config(const std::string& yaml, const Environment& env) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid YAML: ") + e.what());
    }
    if (!root.IsMap()) {
        throw ConfigError("configuration must be a YAML mapping");
    }

    std::map<std::string, int> missing;
    expand_node(root, env, missing);
    for (const auto& [name, count] : missing) {
        LOG(WARNING) << "Environment variable " << name << " is not set (" << count
                     << " references expand to empty)";
    }

    Config config;
    try {
        config.receivers = parse_components(root, "receivers");
        config.processors = parse_components(root, "processors");
        config.exporters = parse_components(root, "exporters");
        config.service = parse_service(root, config);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return config;
}

Config load_config(const std::string& path, const Environment& env) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open configuration file " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    Config config = parse_config(contents.str(), env);
    LOG(INFO) << "Loaded configuration from " << path << ": " << config.receivers.size()
              << " receivers, " << config.processors.size() << " processors, "
              << config.exporters.size() << " exporters, "
              << config.service.pipelines.size() << " pipelines";
    return config;
}

}  // namespace sigroute

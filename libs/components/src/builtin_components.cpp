// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/builtin_components.hpp"

#include "sigroute/errors.hpp"

#include <glog/logging.h>

namespace sigroute {

namespace {

/// Typed scalar: quoted strings stay strings, otherwise bool, int, double
AttributeValue attribute_value_from_yaml(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        throw ConfigError(path + ": expected a scalar value");
    }
    if (node.Tag() == "!") {
        return node.Scalar();
    }
    bool as_bool = false;
    if (YAML::convert<bool>::decode(node, as_bool)) {
        return as_bool;
    }
    int64_t as_int = 0;
    if (YAML::convert<int64_t>::decode(node, as_int)) {
        return as_int;
    }
    double as_double = 0.0;
    if (YAML::convert<double>::decode(node, as_double)) {
        return as_double;
    }
    return node.Scalar();
}

/// Protocol keys are enabled by presence, even with an empty body
bool protocol_enabled(const Settings& protocols, const std::string& key) {
    const YAML::Node& node = protocols.node();
    return node.IsMap() && node[key].IsDefined();
}

std::chrono::milliseconds positive_duration(const Settings& settings, const std::string& key,
                                            std::chrono::milliseconds fallback) {
    auto value = settings.get_duration(key, fallback);
    if (value.count() <= 0) {
        throw ConfigError(settings.key_path(key) + ": must be greater than zero");
    }
    return value;
}

/// Wrap an exporter with the options every exporter type shares
ExporterBinding make_binding(const ComponentConfig& config, std::shared_ptr<Exporter> exporter) {
    ExporterBinding binding;
    binding.exporter = std::move(exporter);
    binding.retry = parse_retry(config.settings.child("retry_on_failure"));

    Settings queue = config.settings.child("sending_queue");
    binding.num_consumers = queue.get_size("num_consumers", binding.num_consumers);
    if (binding.num_consumers == 0) {
        throw ConfigError(queue.key_path("num_consumers") + ": must be at least 1");
    }

    binding.required = config.settings.get_bool("required", binding.required);
    binding.startup_timeout =
        positive_duration(config.settings, "startup_timeout", binding.startup_timeout);
    return binding;
}

void require_endpoint(const Settings& settings, const std::string& endpoint) {
    if (endpoint.empty()) {
        throw ConfigError(settings.key_path("endpoint") + ": must be set");
    }
}

}  // namespace

TlsSettings parse_tls(const Settings& settings) {
    TlsSettings tls;
    tls.insecure = settings.get_bool("insecure", tls.insecure);
    tls.insecure_skip_verify = settings.get_bool("insecure_skip_verify", tls.insecure_skip_verify);
    tls.ca_file = settings.get_string("ca_file");
    tls.cert_file = settings.get_string("cert_file");
    tls.key_file = settings.get_string("key_file");
    tls.server_name_override = settings.get_string("server_name_override");
    if (tls.cert_file.empty() != tls.key_file.empty()) {
        throw ConfigError(settings.path() + ": cert_file and key_file must be set together");
    }
    return tls;
}

RetrySettings parse_retry(const Settings& settings) {
    RetrySettings retry;
    retry.enabled = settings.get_bool("enabled", retry.enabled);
    retry.initial_interval =
        positive_duration(settings, "initial_interval", retry.initial_interval);
    retry.multiplier = settings.get_double("multiplier", retry.multiplier);
    retry.randomization_factor =
        settings.get_double("randomization_factor", retry.randomization_factor);
    retry.max_interval = positive_duration(settings, "max_interval", retry.max_interval);
    retry.max_attempts = settings.get_size("max_attempts", retry.max_attempts);
    retry.max_elapsed_time = settings.get_duration("max_elapsed_time", retry.max_elapsed_time);

    if (retry.multiplier < 1.0) {
        throw ConfigError(settings.key_path("multiplier") + ": must be at least 1");
    }
    if (retry.randomization_factor < 0.0 || retry.randomization_factor > 1.0) {
        throw ConfigError(settings.key_path("randomization_factor") +
                          ": must be between 0 and 1");
    }
    if (retry.max_interval < retry.initial_interval) {
        throw ConfigError(settings.key_path("max_interval") +
                          ": must not be below initial_interval");
    }
    return retry;
}

OtlpReceiverConfig parse_otlp_receiver(const Settings& settings) {
    OtlpReceiverConfig config;
    Settings protocols = settings.child("protocols");

    if (protocol_enabled(protocols, "grpc")) {
        Settings grpc = protocols.child("grpc");
        OtlpGrpcReceiverConfig grpc_config;
        grpc_config.endpoint = grpc.get_string("endpoint", grpc_config.endpoint);
        grpc_config.max_recv_msg_size_mib =
            grpc.get_size("max_recv_msg_size_mib", grpc_config.max_recv_msg_size_mib);
        Settings tls = grpc.child("tls");
        grpc_config.cert_file = tls.get_string("cert_file");
        grpc_config.key_file = tls.get_string("key_file");
        if (grpc_config.cert_file.empty() != grpc_config.key_file.empty()) {
            throw ConfigError(tls.path() + ": cert_file and key_file must be set together");
        }
        if (grpc_config.max_recv_msg_size_mib == 0) {
            throw ConfigError(grpc.key_path("max_recv_msg_size_mib") + ": must be at least 1");
        }
        config.grpc = grpc_config;
    }

    if (protocol_enabled(protocols, "http")) {
        Settings http = protocols.child("http");
        OtlpHttpReceiverConfig http_config;
        http_config.endpoint = http.get_string("endpoint", http_config.endpoint);
        http_config.max_request_body_size =
            http.get_size("max_request_body_size", http_config.max_request_body_size);
        config.http = http_config;
    }

    if (!config.grpc && !config.http) {
        throw ConfigError(protocols.path() + ": at least one of grpc or http must be enabled");
    }
    return config;
}

BatchSettings parse_batch_settings(const Settings& settings) {
    BatchSettings batch;
    batch.send_batch_size = settings.get_size("send_batch_size", batch.send_batch_size);
    batch.timeout = positive_duration(settings, "timeout", batch.timeout);
    batch.send_batch_max_size =
        settings.get_size("send_batch_max_size", batch.send_batch_max_size);
    if (batch.send_batch_max_size != 0 && batch.send_batch_max_size < batch.send_batch_size) {
        throw ConfigError(settings.key_path("send_batch_max_size") +
                          ": must be greater than or equal to send_batch_size");
    }
    return batch;
}

std::vector<AttributeAction> parse_attribute_actions(const Settings& settings) {
    const std::string path = settings.key_path("actions");
    const YAML::Node& node = settings.node();
    if (!node.IsMap() || !node["actions"].IsDefined() || !node["actions"].IsSequence() ||
        node["actions"].size() == 0) {
        throw ConfigError(path + ": expected a non-empty list of actions");
    }

    std::vector<AttributeAction> actions;
    const YAML::Node list = node["actions"];
    for (size_t i = 0; i < list.size(); ++i) {
        if (!list[i].IsMap()) {
            throw ConfigError(path + "[" + std::to_string(i) + "]: expected a mapping");
        }
        Settings entry(list[i], path + "[" + std::to_string(i) + "]");

        AttributeAction action;
        action.key = entry.get_string("key");
        if (action.key.empty()) {
            throw ConfigError(entry.key_path("key") + ": must be set");
        }

        std::string type = entry.get_string("action");
        auto parsed = attribute_action_from_string(type);
        if (!parsed) {
            throw ConfigError(entry.key_path("action") + ": unknown action '" + type +
                              "', expected insert, update, upsert or delete");
        }
        action.type = *parsed;

        action.from_attribute = entry.get_string("from_attribute");
        if (entry.has("value")) {
            action.value = attribute_value_from_yaml(list[i]["value"], entry.key_path("value"));
        }
        if (action.type != AttributeAction::Type::Delete && !action.value &&
            action.from_attribute.empty()) {
            throw ConfigError(entry.path() + ": " + type +
                              " needs either value or from_attribute");
        }
        actions.push_back(std::move(action));
    }
    return actions;
}

LoggingExporterConfig parse_logging_exporter(const Settings& settings) {
    LoggingExporterConfig config;
    std::string verbosity = settings.get_string("verbosity");
    if (!verbosity.empty()) {
        auto parsed = verbosity_from_string(verbosity);
        if (!parsed) {
            throw ConfigError(settings.key_path("verbosity") + ": unknown verbosity '" +
                              verbosity + "', expected basic, normal or detailed");
        }
        config.verbosity = *parsed;
    }
    return config;
}

OtlpGrpcConfig parse_otlp_grpc_exporter(const Settings& settings) {
    OtlpGrpcConfig config;
    config.endpoint = settings.get_string("endpoint");
    require_endpoint(settings, config.endpoint);
    config.tls = parse_tls(settings.child("tls"));
    config.headers = settings.get_string_map("headers");
    config.timeout = positive_duration(settings, "timeout", config.timeout);
    return config;
}

OtlpHttpConfig parse_otlp_http_exporter(const Settings& settings) {
    OtlpHttpConfig config;
    config.endpoint = settings.get_string("endpoint");

    const std::pair<const char*, SignalType> kSignalKeys[] = {
        {"traces_endpoint", SignalType::Traces},
        {"metrics_endpoint", SignalType::Metrics},
        {"logs_endpoint", SignalType::Logs},
    };
    for (const auto& [key, type] : kSignalKeys) {
        std::string url = settings.get_string(key);
        if (!url.empty()) {
            config.signal_endpoints[type] = url;
        }
    }
    if (config.endpoint.empty() && config.signal_endpoints.size() < 3) {
        throw ConfigError(settings.key_path("endpoint") +
                          ": must be set unless every signal endpoint is given");
    }

    config.tls = parse_tls(settings.child("tls"));
    config.headers = settings.get_string_map("headers");
    config.timeout = positive_duration(settings, "timeout", config.timeout);

    std::string compression = settings.get_string("compression", "none");
    auto parsed = compression_from_string(compression);
    if (!parsed) {
        throw ConfigError(settings.key_path("compression") + ": unsupported compression '" +
                          compression + "', expected none or zstd");
    }
    config.compression = *parsed;
    return config;
}

PrometheusConfig parse_prometheus_exporter(const Settings& settings) {
    PrometheusConfig config;
    config.endpoint = settings.get_string("endpoint", config.endpoint);
    config.metric_namespace = settings.get_string("namespace");
    config.const_labels = settings.get_string_map("const_labels");
    config.resource_to_telemetry_conversion =
        settings.child("resource_to_telemetry_conversion")
            .get_bool("enabled", config.resource_to_telemetry_conversion);
    config.metric_expiration =
        positive_duration(settings, "metric_expiration", config.metric_expiration);
    return config;
}

void register_builtin_components(ComponentRegistry& registry) {
    registry.register_receiver(
        "otlp", [](const ComponentConfig& config, std::shared_ptr<SignalConsumer> consumer) {
            return std::make_shared<OtlpReceiver>(config.id.str(),
                                                  parse_otlp_receiver(config.settings),
                                                  std::move(consumer));
        });

    registry.register_processor("batch", [](const ComponentConfig& config) {
        ProcessorBuild build;
        build.batching = parse_batch_settings(config.settings);
        return build;
    });

    registry.register_processor("attributes", [](const ComponentConfig& config) {
        ProcessorBuild build;
        build.processor = std::make_shared<AttributesProcessor>(
            config.id.str(), parse_attribute_actions(config.settings));
        return build;
    });

    auto logging = [](const ComponentConfig& config) {
        return make_binding(config, std::make_shared<LoggingExporter>(
                                        config.id.str(), parse_logging_exporter(config.settings)));
    };
    registry.register_exporter("logging", logging);
    registry.register_exporter("debug", logging);

    registry.register_exporter("otlp", [](const ComponentConfig& config) {
        return make_binding(config, std::make_shared<OtlpGrpcExporter>(
                                        config.id.str(), parse_otlp_grpc_exporter(config.settings)));
    });

    // Jaeger ingests OTLP/gRPC natively; only traces are accepted
    registry.register_exporter("jaeger", [](const ComponentConfig& config) {
        OtlpGrpcConfig grpc = parse_otlp_grpc_exporter(config.settings);
        grpc.signals = {SignalType::Traces};
        return make_binding(config, std::make_shared<OtlpGrpcExporter>(config.id.str(), grpc));
    });

    registry.register_exporter("otlphttp", [](const ComponentConfig& config) {
        return make_binding(config, std::make_shared<OtlpHttpExporter>(
                                        config.id.str(), parse_otlp_http_exporter(config.settings)));
    });

    registry.register_exporter("prometheus", [](const ComponentConfig& config) {
        return make_binding(config,
                            std::make_shared<PrometheusExporter>(
                                config.id.str(), parse_prometheus_exporter(config.settings)));
    });

    VLOG(1) << "registered built-in components";
}

}  // namespace sigroute

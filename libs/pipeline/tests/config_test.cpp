// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/config.hpp"

#include "sigroute/errors.hpp"

#include <gtest/gtest.h>

namespace sigroute::test {

namespace {

const char* kCollectorConfig = R"(
receivers:
  otlp:
    protocols:
      grpc:
        endpoint: 0.0.0.0:4317
      http:
        endpoint: 0.0.0.0:4318

processors:
  batch:

exporters:
  logging:
    verbosity: detailed
  otlp/honeycomb:
    endpoint: api.honeycomb.io:443
    headers:
      x-honeycomb-team: ${env:HONEYCOMB_API_KEY}
  otlp/honeycomb/metrics:
    endpoint: api.honeycomb.io:443
    headers:
      x-honeycomb-team: ${HONEYCOMB_API_KEY}
      x-honeycomb-dataset: ${env:HONEYCOMB_DATASET}
  prometheus:
    endpoint: 0.0.0.0:8889

service:
  drain_timeout: 10s
  delivery_policy: all_required
  telemetry:
    logs:
      level: debug
    metrics:
      address: ":8888"
  pipelines:
    traces:
      receivers: [otlp]
      processors: [batch]
      exporters: [logging, otlp/honeycomb]
    metrics:
      receivers: [otlp]
      processors: [batch]
      exporters: [prometheus, otlp/honeycomb/metrics]
    logs/debug:
      receivers: [otlp]
      exporters: [logging]
)";

std::string with_pipelines(const std::string& pipelines) {
    return R"(
receivers:
  otlp:
exporters:
  logging:
service:
  pipelines:
)" + pipelines;
}

}  // namespace

TEST(ConfigTest, ParsesCollectorLayout) {
    Environment env({{"HONEYCOMB_API_KEY", "hc-key"}, {"HONEYCOMB_DATASET", "metrics"}});
    Config config = parse_config(kCollectorConfig, env);

    EXPECT_EQ(config.receivers.size(), 1u);
    EXPECT_EQ(config.processors.size(), 1u);
    EXPECT_EQ(config.exporters.size(), 4u);

    const auto& honeycomb = config.exporters.at("otlp/honeycomb/metrics");
    EXPECT_EQ(honeycomb.id.type, "otlp");
    EXPECT_EQ(honeycomb.id.name, "honeycomb/metrics");
    auto headers = honeycomb.settings.get_string_map("headers");
    EXPECT_EQ(headers["x-honeycomb-team"], "hc-key");
    EXPECT_EQ(headers["x-honeycomb-dataset"], "metrics");

    EXPECT_EQ(config.receivers.at("otlp").settings.child("protocols").child("grpc").get_string(
                  "endpoint"),
              "0.0.0.0:4317");

    const ServiceConfig& service = config.service;
    EXPECT_EQ(service.drain_timeout, std::chrono::seconds(10));
    EXPECT_EQ(service.delivery_policy, DeliveryPolicy::AllRequired);
    EXPECT_EQ(service.telemetry.log_level, "debug");
    EXPECT_EQ(service.telemetry.metrics_address, ":8888");

    ASSERT_EQ(service.pipelines.size(), 3u);
    std::map<std::string, PipelineConfig> by_id;
    for (const auto& pipeline : service.pipelines) {
        by_id[pipeline.id] = pipeline;
    }
    EXPECT_EQ(by_id.at("traces").type, SignalType::Traces);
    EXPECT_EQ(by_id.at("traces").exporters,
              (std::vector<std::string>{"logging", "otlp/honeycomb"}));
    EXPECT_EQ(by_id.at("metrics").type, SignalType::Metrics);
    EXPECT_EQ(by_id.at("logs/debug").type, SignalType::Logs);
    EXPECT_TRUE(by_id.at("logs/debug").processors.empty());
}

TEST(ConfigTest, MissingVariableExpandsToEmpty) {
    Config config = parse_config(kCollectorConfig, Environment());
    auto headers = config.exporters.at("otlp/honeycomb").settings.get_string_map("headers");
    EXPECT_EQ(headers["x-honeycomb-team"], "");
}

TEST(ConfigTest, Defaults) {
    Config config = parse_config(with_pipelines(R"(
    traces:
      receivers: [otlp]
      exporters: [logging]
)"), Environment());
    EXPECT_EQ(config.service.drain_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.service.delivery_policy, DeliveryPolicy::AtLeastOne);
    EXPECT_EQ(config.service.max_in_flight_batches, 8u);
    EXPECT_EQ(config.service.telemetry.log_level, "info");
    EXPECT_TRUE(config.service.telemetry.metrics_address.empty());
}

TEST(ConfigTest, UndefinedExporterIsRejected) {
    try {
        parse_config(with_pipelines(R"(
    traces:
      receivers: [otlp]
      exporters: [logging, jaeger]
)"), Environment());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(std::string(e.what()),
                  "pipeline 'traces' references exporter 'jaeger' which is not defined in "
                  "'exporters'");
        EXPECT_EQ(e.kind(), ErrorKind::Config);
    }
}

TEST(ConfigTest, InvalidDocumentsAreRejected) {
    const std::vector<std::string> documents = {
        "receivers: [unclosed",
        "- just\n- a\n- list\n",
        "receivers:\n  otlp:\nexporters:\n  logging:\n",
        with_pipelines("    profiles:\n      receivers: [otlp]\n      exporters: [logging]\n"),
        with_pipelines("    traces:\n      receivers: [otlp]\n"),
        with_pipelines("    traces:\n      exporters: [logging]\n"),
        with_pipelines("    traces:\n      receivers: [otlp]\n      exporters: [logging, logging]\n"),
        with_pipelines("    traces:\n      receivers: [otlp]\n      processors: [batch]\n"
                       "      exporters: [logging]\n"),
        with_pipelines("    traces/:\n      receivers: [otlp]\n      exporters: [logging]\n"),
        "exporters:\n  /name:\nreceivers:\n  otlp:\nservice:\n  pipelines:\n"
        "    traces:\n      receivers: [otlp]\n      exporters: [logging]\n",
    };
    for (const auto& document : documents) {
        EXPECT_THROW(parse_config(document, Environment()), ConfigError) << document;
    }
}

TEST(ConfigTest, InvalidServiceSettingsAreRejected) {
    const std::string pipelines = "  pipelines:\n    traces:\n      receivers: [otlp]\n"
                                  "      exporters: [logging]\n";
    const std::string head = "receivers:\n  otlp:\nexporters:\n  logging:\nservice:\n";

    EXPECT_THROW(parse_config(head + "  delivery_policy: best_effort\n" + pipelines,
                              Environment()),
                 ConfigError);
    EXPECT_THROW(parse_config(head + "  drain_timeout: forever\n" + pipelines, Environment()),
                 ConfigError);
    EXPECT_THROW(parse_config(head + "  drain_timeout: 10\n" + pipelines, Environment()),
                 ConfigError);
    EXPECT_THROW(parse_config(head + "  max_in_flight_batches: -1\n" + pipelines,
                              Environment()),
                 ConfigError);
    EXPECT_THROW(parse_config(head + "  telemetry:\n    logs:\n      level: trace\n" + pipelines,
                              Environment()),
                 ConfigError);
}

TEST(ConfigTest, SettingsAccessors) {
    YAML::Node node = YAML::Load(R"(
timeout: 1500ms
enabled: true
count: 3
ratio: 0.25
name: sigroute
nested:
  inner: x
)");
    Settings settings(node, "exporters.otlp");
    EXPECT_EQ(settings.get_duration("timeout", std::chrono::seconds(1)),
              std::chrono::milliseconds(1500));
    EXPECT_EQ(settings.get_duration("missing", std::chrono::seconds(1)), std::chrono::seconds(1));
    EXPECT_TRUE(settings.get_bool("enabled", false));
    EXPECT_EQ(settings.get_int("count", 0), 3);
    EXPECT_DOUBLE_EQ(settings.get_double("ratio", 0.0), 0.25);
    EXPECT_EQ(settings.get_string("name"), "sigroute");
    EXPECT_EQ(settings.child("nested").get_string("inner"), "x");
    EXPECT_FALSE(settings.child("absent").has("inner"));

    try {
        settings.get_int("name", 0);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("exporters.otlp.name"), std::string::npos);
    }
    EXPECT_THROW(settings.get_bool("count", false), ConfigError);
    EXPECT_THROW(settings.child("name"), ConfigError);
}

TEST(ConfigTest, ComponentIds) {
    EXPECT_EQ(ComponentId::parse("otlp").str(), "otlp");
    EXPECT_EQ(ComponentId::parse("otlp/elastic").name, "elastic");
    EXPECT_THROW(ComponentId::parse(""), ConfigError);
    EXPECT_THROW(ComponentId::parse("otlp/"), ConfigError);
}

TEST(ConfigTest, LoadMissingFile) {
    EXPECT_THROW(load_config("/nonexistent/sigroute.yaml", Environment()), ConfigError);
}

}  // namespace sigroute::test

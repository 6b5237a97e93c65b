// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/builtin_components.hpp"

#include "sigroute/errors.hpp"
#include "sigroute/service.hpp"

#include <gtest/gtest.h>

namespace sigroute::test {

namespace {

Settings settings_of(const std::string& yaml) {
    return Settings(YAML::Load(yaml), "component");
}

ComponentConfig component(const std::string& id, const std::string& yaml) {
    return ComponentConfig{ComponentId::parse(id), settings_of(yaml)};
}

}  // namespace

TEST(BuiltinComponentsTest, RegistersEveryType) {
    ComponentRegistry registry;
    register_builtin_components(registry);

    EXPECT_TRUE(registry.has_receiver("otlp"));
    for (const char* type : {"batch", "attributes"}) {
        EXPECT_TRUE(registry.has_processor(type)) << type;
    }
    for (const char* type : {"logging", "debug", "otlp", "jaeger", "otlphttp", "prometheus"}) {
        EXPECT_TRUE(registry.has_exporter(type)) << type;
    }
}

TEST(BuiltinComponentsTest, OtlpReceiverProtocols) {
    auto both = parse_otlp_receiver(settings_of(R"(
protocols:
  grpc:
  http:
    endpoint: 127.0.0.1:14318
)"));
    ASSERT_TRUE(both.grpc);
    ASSERT_TRUE(both.http);
    EXPECT_EQ(both.grpc->endpoint, "0.0.0.0:4317");
    EXPECT_EQ(both.grpc->max_recv_msg_size_mib, 4u);
    EXPECT_EQ(both.http->endpoint, "127.0.0.1:14318");

    auto grpc_only = parse_otlp_receiver(settings_of(R"(
protocols:
  grpc:
    endpoint: 0.0.0.0:5317
    max_recv_msg_size_mib: 16
)"));
    ASSERT_TRUE(grpc_only.grpc);
    EXPECT_FALSE(grpc_only.http);
    EXPECT_EQ(grpc_only.grpc->max_recv_msg_size_mib, 16u);

    EXPECT_THROW(parse_otlp_receiver(settings_of("protocols: {}")), ConfigError);
    EXPECT_THROW(parse_otlp_receiver(settings_of(R"(
protocols:
  grpc:
    tls:
      cert_file: /etc/server.pem
)")),
                 ConfigError);
}

TEST(BuiltinComponentsTest, BatchSettings) {
    auto batch = parse_batch_settings(settings_of(R"(
send_batch_size: 512
timeout: 5s
send_batch_max_size: 1024
)"));
    EXPECT_EQ(batch.send_batch_size, 512u);
    EXPECT_EQ(batch.timeout, std::chrono::seconds(5));
    EXPECT_EQ(batch.send_batch_max_size, 1024u);

    auto defaults = parse_batch_settings(Settings());
    EXPECT_EQ(defaults.send_batch_size, 8192u);
    EXPECT_EQ(defaults.timeout, std::chrono::milliseconds(200));

    EXPECT_THROW(parse_batch_settings(settings_of("timeout: 0s")), ConfigError);
    EXPECT_THROW(parse_batch_settings(settings_of("send_batch_size: 100\nsend_batch_max_size: 10")),
                 ConfigError);
}

TEST(BuiltinComponentsTest, AttributeActions) {
    auto actions = parse_attribute_actions(settings_of(R"(
actions:
  - key: environment
    action: upsert
    value: production
  - key: retries
    action: insert
    value: 3
  - key: sampled
    action: insert
    value: true
  - key: version
    action: insert
    value: "2"
  - key: peer
    action: update
    from_attribute: net.peer.name
  - key: password
    action: delete
)"));
    ASSERT_EQ(actions.size(), 6u);
    EXPECT_EQ(actions[0].type, AttributeAction::Type::Upsert);
    EXPECT_EQ(*actions[0].value, AttributeValue(std::string("production")));
    EXPECT_EQ(*actions[1].value, AttributeValue(int64_t{3}));
    EXPECT_EQ(*actions[2].value, AttributeValue(true));
    EXPECT_EQ(*actions[3].value, AttributeValue(std::string("2")));
    EXPECT_EQ(actions[4].from_attribute, "net.peer.name");
    EXPECT_FALSE(actions[4].value);
    EXPECT_EQ(actions[5].type, AttributeAction::Type::Delete);

    EXPECT_THROW(parse_attribute_actions(settings_of("actions: []")), ConfigError);
    EXPECT_THROW(parse_attribute_actions(settings_of("actions:\n  - key: a\n    action: hash\n")),
                 ConfigError);
    EXPECT_THROW(parse_attribute_actions(settings_of("actions:\n  - key: a\n    action: insert\n")),
                 ConfigError);
}

TEST(BuiltinComponentsTest, RetryOptions) {
    auto retry = parse_retry(settings_of(R"(
enabled: true
initial_interval: 1s
multiplier: 2
randomization_factor: 0
max_interval: 10s
max_attempts: 4
max_elapsed_time: 1m
)"));
    EXPECT_TRUE(retry.enabled);
    EXPECT_EQ(retry.initial_interval, std::chrono::seconds(1));
    EXPECT_DOUBLE_EQ(retry.multiplier, 2.0);
    EXPECT_DOUBLE_EQ(retry.randomization_factor, 0.0);
    EXPECT_EQ(retry.max_interval, std::chrono::seconds(10));
    EXPECT_EQ(retry.max_attempts, 4u);
    EXPECT_EQ(retry.max_elapsed_time, std::chrono::minutes(1));

    EXPECT_THROW(parse_retry(settings_of("multiplier: 0.5")), ConfigError);
    EXPECT_THROW(parse_retry(settings_of("randomization_factor: 1.5")), ConfigError);
    EXPECT_THROW(parse_retry(settings_of("initial_interval: 10s\nmax_interval: 1s")), ConfigError);
}

TEST(BuiltinComponentsTest, OtlpGrpcExporterSettings) {
    auto config = parse_otlp_grpc_exporter(settings_of(R"(
endpoint: api.honeycomb.io:443
headers:
  x-honeycomb-team: abc123
  x-honeycomb-dataset: traces
tls:
  ca_file: /etc/ssl/ca.pem
  server_name_override: api.honeycomb.io
timeout: 3s
)"));
    EXPECT_EQ(config.endpoint, "api.honeycomb.io:443");
    EXPECT_EQ(config.headers.at("x-honeycomb-team"), "abc123");
    EXPECT_FALSE(config.tls.insecure);
    EXPECT_EQ(config.tls.ca_file, "/etc/ssl/ca.pem");
    EXPECT_EQ(config.tls.server_name_override, "api.honeycomb.io");
    EXPECT_EQ(config.timeout, std::chrono::seconds(3));

    EXPECT_THROW(parse_otlp_grpc_exporter(settings_of("timeout: 1s")), ConfigError);
    EXPECT_THROW(parse_otlp_grpc_exporter(settings_of(R"(
endpoint: localhost:4317
tls:
  key_file: /etc/client.key
)")),
                 ConfigError);
}

TEST(BuiltinComponentsTest, JaegerOnlyExportsTraces) {
    ComponentRegistry registry;
    register_builtin_components(registry);

    auto binding = registry.build_exporter(component("jaeger", R"(
endpoint: jaeger-all-in-one:4317
tls:
  insecure: true
)"));
    ASSERT_TRUE(binding.exporter);
    EXPECT_TRUE(binding.exporter->supports(SignalType::Traces));
    EXPECT_FALSE(binding.exporter->supports(SignalType::Metrics));
    EXPECT_FALSE(binding.exporter->supports(SignalType::Logs));
    EXPECT_EQ(binding.exporter->name(), "jaeger");
}

TEST(BuiltinComponentsTest, OtlpHttpExporterSettings) {
    auto config = parse_otlp_http_exporter(settings_of(R"(
endpoint: http://openobserve:5080/api/default
traces_endpoint: http://tempo:4318/v1/traces
compression: zstd
headers:
  Authorization: Basic cm9vdA==
  stream-name: default
)"));
    EXPECT_EQ(config.endpoint, "http://openobserve:5080/api/default");
    ASSERT_EQ(config.signal_endpoints.size(), 1u);
    EXPECT_EQ(config.signal_endpoints.at(SignalType::Traces), "http://tempo:4318/v1/traces");
    EXPECT_EQ(config.compression, Compression::Zstd);
    EXPECT_EQ(config.headers.at("stream-name"), "default");

    EXPECT_THROW(parse_otlp_http_exporter(settings_of("compression: gzip\nendpoint: http://a")),
                 ConfigError);
    EXPECT_THROW(parse_otlp_http_exporter(settings_of("traces_endpoint: http://a/v1/traces")),
                 ConfigError);
}

TEST(BuiltinComponentsTest, PrometheusExporterSettings) {
    auto config = parse_prometheus_exporter(settings_of(R"(
endpoint: 0.0.0.0:9464
namespace: sigroute
const_labels:
  cluster: edge
resource_to_telemetry_conversion:
  enabled: true
metric_expiration: 10m
)"));
    EXPECT_EQ(config.endpoint, "0.0.0.0:9464");
    EXPECT_EQ(config.metric_namespace, "sigroute");
    EXPECT_EQ(config.const_labels.at("cluster"), "edge");
    EXPECT_TRUE(config.resource_to_telemetry_conversion);
    EXPECT_EQ(config.metric_expiration, std::chrono::minutes(10));
}

TEST(BuiltinComponentsTest, LoggingVerbosity) {
    EXPECT_EQ(parse_logging_exporter(Settings()).verbosity, Verbosity::Basic);
    EXPECT_EQ(parse_logging_exporter(settings_of("verbosity: detailed")).verbosity,
              Verbosity::Detailed);
    EXPECT_THROW(parse_logging_exporter(settings_of("verbosity: loud")), ConfigError);
}

TEST(BuiltinComponentsTest, CommonExporterOptions) {
    ComponentRegistry registry;
    register_builtin_components(registry);

    auto binding = registry.build_exporter(component("logging/verbose", R"(
verbosity: normal
required: true
startup_timeout: 2s
sending_queue:
  num_consumers: 4
retry_on_failure:
  enabled: false
)"));
    EXPECT_TRUE(binding.required);
    EXPECT_EQ(binding.startup_timeout, std::chrono::seconds(2));
    EXPECT_EQ(binding.num_consumers, 4u);
    EXPECT_FALSE(binding.retry.enabled);
    EXPECT_EQ(binding.exporter->name(), "logging/verbose");

    EXPECT_THROW(registry.build_exporter(component("debug", "sending_queue:\n  num_consumers: 0")),
                 ConfigError);
}

TEST(BuiltinComponentsTest, ServiceRunsLoopbackPipeline) {
    ComponentRegistry registry;
    register_builtin_components(registry);

    Service service(parse_config(R"(
receivers:
  otlp:
    protocols:
      http:
        endpoint: 127.0.0.1:0
processors:
  attributes:
    actions:
      - key: environment
        action: insert
        value: test
  batch:
    timeout: 50ms
exporters:
  logging:
    verbosity: basic
service:
  drain_timeout: 2s
  pipelines:
    traces:
      receivers: [otlp]
      processors: [attributes, batch]
      exporters: [logging]
)",
                                 Environment()),
                    registry);
    ASSERT_TRUE(service.start());
    EXPECT_TRUE(service.healthy());
    service.shutdown();
    EXPECT_FALSE(service.healthy());
}

TEST(BuiltinComponentsTest, UndefinedJaegerExporterFailsConfiguration) {
    EXPECT_THROW(parse_config(R"(
receivers:
  otlp:
    protocols:
      grpc:
exporters:
  logging:
service:
  pipelines:
    traces:
      receivers: [otlp]
      exporters: [logging, jaeger]
)",
                              Environment()),
                 ConfigError);
}

}  // namespace sigroute::test

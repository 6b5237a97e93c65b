// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/prometheus_exporter.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include <gtest/gtest.h>

namespace sigroute::test {

namespace {

Signal point_signal(MetricPoint point, std::shared_ptr<const Resource> resource = nullptr) {
    return make_signal(std::move(point), 1, std::move(resource));
}

MetricPoint gauge(const std::string& name, double value) {
    MetricPoint point;
    point.name = name;
    point.kind = MetricKind::Gauge;
    point.value = value;
    return point;
}

MetricPoint counter(const std::string& name, double value, Temporality temporality) {
    MetricPoint point;
    point.name = name;
    point.kind = MetricKind::Sum;
    point.monotonic = true;
    point.temporality = temporality;
    point.value = value;
    return point;
}

Batch metrics_batch(std::vector<Signal> signals) {
    Batch batch;
    batch.type = SignalType::Metrics;
    batch.signals = std::move(signals);
    return batch;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

}  // namespace

TEST(MetricStoreTest, RendersGaugesAndCounters) {
    MetricStore store({});
    MetricPoint temperature = gauge("room.temperature", 21.5);
    temperature.description = "Room temperature";
    temperature.attributes["room"] = std::string("kitchen");
    store.update(metrics_batch({point_signal(temperature),
                                point_signal(counter("http.requests", 42, Temporality::Cumulative))}));

    std::string text = store.render();
    EXPECT_TRUE(contains(text, "# HELP room_temperature Room temperature\n"));
    EXPECT_TRUE(contains(text, "# TYPE room_temperature gauge\n"));
    EXPECT_TRUE(contains(text, "room_temperature{room=\"kitchen\"} 21.5\n"));
    EXPECT_TRUE(contains(text, "# TYPE http_requests_total counter\n"));
    EXPECT_TRUE(contains(text, "http_requests_total 42\n"));
    EXPECT_EQ(store.size(), 2u);
}

TEST(MetricStoreTest, CumulativeReplacesAndDeltaAccumulates) {
    MetricStore store({});
    store.update(metrics_batch({point_signal(counter("jobs", 5, Temporality::Cumulative))}));
    store.update(metrics_batch({point_signal(counter("jobs", 8, Temporality::Cumulative))}));
    store.update(metrics_batch({point_signal(counter("errors_total", 2, Temporality::Delta))}));
    store.update(metrics_batch({point_signal(counter("errors_total", 3, Temporality::Delta))}));

    std::string text = store.render();
    EXPECT_TRUE(contains(text, "jobs_total 8\n"));
    EXPECT_TRUE(contains(text, "errors_total 5\n"));
    EXPECT_FALSE(contains(text, "errors_total_total"));
}

TEST(MetricStoreTest, RendersHistogramBucketsCumulatively) {
    MetricStore store({});
    MetricPoint hist;
    hist.name = "http.server.duration";
    hist.kind = MetricKind::Histogram;
    hist.temporality = Temporality::Cumulative;
    hist.bounds = {0.1, 1};
    hist.bucket_counts = {3, 2, 1};
    hist.count = 6;
    hist.sum = 4.25;
    store.update(metrics_batch({point_signal(hist)}));

    std::string text = store.render();
    EXPECT_TRUE(contains(text, "# TYPE http_server_duration histogram\n"));
    EXPECT_TRUE(contains(text, "http_server_duration_bucket{le=\"0.1\"} 3\n"));
    EXPECT_TRUE(contains(text, "http_server_duration_bucket{le=\"1\"} 5\n"));
    EXPECT_TRUE(contains(text, "http_server_duration_bucket{le=\"+Inf\"} 6\n"));
    EXPECT_TRUE(contains(text, "http_server_duration_sum 4.25\n"));
    EXPECT_TRUE(contains(text, "http_server_duration_count 6\n"));
}

TEST(MetricStoreTest, RendersSummaryQuantiles) {
    MetricStore store({});
    MetricPoint summary;
    summary.name = "rpc_latency";
    summary.kind = MetricKind::Summary;
    summary.count = 10;
    summary.sum = 2;
    summary.quantiles = {{0.5, 0.1}, {0.99, 0.9}};
    store.update(metrics_batch({point_signal(summary)}));

    std::string text = store.render();
    EXPECT_TRUE(contains(text, "rpc_latency{quantile=\"0.5\"} 0.1\n"));
    EXPECT_TRUE(contains(text, "rpc_latency{quantile=\"0.99\"} 0.9\n"));
    EXPECT_TRUE(contains(text, "rpc_latency_count 10\n"));
}

TEST(MetricStoreTest, NamespaceLabelsAndResourceConversion) {
    PrometheusConfig config;
    config.metric_namespace = "otel";
    config.const_labels = {{"cluster", "edge-1"}};
    config.resource_to_telemetry_conversion = true;
    MetricStore store(config);

    auto resource = std::make_shared<Resource>();
    resource->attributes["service.name"] = std::string("checkout");
    resource->attributes["service.namespace"] = std::string("shop");
    resource->attributes["service.instance.id"] = std::string("pod-7");
    resource->attributes["host.name"] = std::string("node-3");

    store.update(metrics_batch({point_signal(gauge("queue.depth", 4), resource)}));
    std::string text = store.render();
    EXPECT_TRUE(contains(text,
                         "otel_queue_depth{cluster=\"edge-1\",host_name=\"node-3\",instance=\"pod-7\","
                         "job=\"shop/checkout\",service_instance_id=\"pod-7\",service_name=\"checkout\","
                         "service_namespace=\"shop\"} 4\n"))
        << text;
}

TEST(MetricStoreTest, TypeConflictIsDropped) {
    MetricStore store({});
    store.update(metrics_batch({point_signal(gauge("load", 1))}));
    MetricPoint hist;
    hist.name = "load";
    hist.kind = MetricKind::Histogram;
    store.update(metrics_batch({point_signal(hist)}));

    std::string text = store.render();
    EXPECT_TRUE(contains(text, "# TYPE load gauge\n"));
    EXPECT_FALSE(contains(text, "load_bucket"));
}

TEST(MetricStoreTest, StaleSeriesExpire) {
    PrometheusConfig config;
    config.metric_expiration = std::chrono::minutes(5);
    MetricStore store(config);

    auto start = MetricStore::Clock::now();
    store.update(metrics_batch({point_signal(gauge("old", 1))}), start);
    store.update(metrics_batch({point_signal(gauge("fresh", 1))}), start + std::chrono::minutes(4));

    std::string text = store.render(start + std::chrono::minutes(6));
    EXPECT_FALSE(contains(text, "old"));
    EXPECT_TRUE(contains(text, "fresh 1\n"));
    EXPECT_EQ(store.size(), 1u);
}

TEST(PrometheusExporterTest, ServesScrapes) {
    PrometheusConfig config;
    config.endpoint = "127.0.0.1:0";
    PrometheusExporter exporter("prometheus", config);
    ASSERT_TRUE(exporter.start());
    EXPECT_TRUE(exporter.healthy());
    EXPECT_FALSE(exporter.supports(SignalType::Traces));

    ASSERT_TRUE(exporter.export_batch(metrics_batch({point_signal(gauge("up", 1))})).ok());

    namespace beast = boost::beast;
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(exporter.port())));

    http::request<http::empty_body> request{http::verb::get, "/metrics", 11};
    request.set(http::field::host, "127.0.0.1");
    http::write(stream, request);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(stream, buffer, response);

    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response[http::field::content_type], kPrometheusContentType);
    EXPECT_TRUE(contains(response.body(), "up 1\n"));

    exporter.shutdown();
    EXPECT_FALSE(exporter.healthy());
}

TEST(PrometheusExporterTest, InvalidEndpointFailsStart) {
    PrometheusConfig config;
    config.endpoint = "8889";
    PrometheusExporter exporter("prometheus", config);
    EXPECT_FALSE(exporter.start());
}

}  // namespace sigroute::test

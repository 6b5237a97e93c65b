// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file prometheus_exporter.hpp
/// @brief Prometheus pull endpoint for the metrics pipeline
///
/// Received metric points are folded into a store keyed by metric family and
/// label set; a scrape of GET /metrics renders the store in the text
/// exposition format.
///
/// Mapping:
/// - gauge and non-monotonic sum: gauge
/// - monotonic sum: counter, "_total" suffix; delta points are accumulated
/// - histogram: _bucket{le=...}, _sum, _count; delta points are accumulated
/// - summary: {quantile=...}, _sum, _count
///
/// Series not updated within metric_expiration are dropped.

#include "sigroute/exporter.hpp"
#include "sigroute/http_server.hpp"
#include "sigroute/prometheus_text.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sigroute {

struct PrometheusConfig {
    /// Listen address of the scrape endpoint
    std::string endpoint = "0.0.0.0:8889";
    /// Prefix of every metric name ("<namespace>_<name>")
    std::string metric_namespace;
    std::map<std::string, std::string> const_labels;
    /// Add all resource attributes as labels
    bool resource_to_telemetry_conversion = false;
    std::chrono::milliseconds metric_expiration{300000};
};

/// Accumulated metric series
class MetricStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit MetricStore(PrometheusConfig config);

    /// Fold every point of a metrics batch into the store
    void update(const Batch& batch, Clock::time_point now = Clock::now());

    /// Text exposition of all live series
    std::string render(Clock::time_point now = Clock::now());

    /// Number of live series
    size_t size() const;

private:
    struct Series {
        Labels labels;
        double value = 0.0;
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<double> bounds;
        std::vector<uint64_t> buckets;
        std::vector<Quantile> quantiles;
        Clock::time_point updated;
    };

    struct Family {
        std::string type;  ///< gauge, counter, histogram or summary
        std::string help;
        std::map<std::string, Series> series;  ///< Keyed by rendered labels
    };

    std::string family_name(const MetricPoint& point, bool counter) const;
    Labels labels_for(const Signal& signal) const;
    void expire_locked(Clock::time_point now);

    PrometheusConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, Family> families_;
};

class PrometheusExporter : public Exporter {
public:
    PrometheusExporter(std::string name, PrometheusConfig config);
    ~PrometheusExporter() override;

    /// Bind the scrape endpoint
    bool start() override;
    void shutdown() override;
    ExportResult export_batch(const Batch& batch) override;
    bool supports(SignalType type) const override { return type == SignalType::Metrics; }
    bool healthy() const override;
    std::string name() const override { return name_; }

    /// Port of the scrape endpoint, valid after start()
    uint16_t port() const;

    MetricStore& store() { return store_; }

private:
    HttpResponse handle(const HttpRequest& request);

    std::string name_;
    PrometheusConfig config_;
    MetricStore store_;
    std::mutex start_mutex_;
    std::unique_ptr<HttpServer> server_;
};

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/prometheus_exporter.hpp"

#include <glog/logging.h>

namespace sigroute {

namespace {

const char* family_type(const MetricPoint& point) {
    switch (point.kind) {
        case MetricKind::Gauge: return "gauge";
        case MetricKind::Sum: return point.monotonic ? "counter" : "gauge";
        case MetricKind::Histogram: return "histogram";
        case MetricKind::Summary: return "summary";
    }
    return "untyped";
}

std::string series_key(const Labels& labels) {
    std::string key;
    for (const auto& [name, value] : labels) {
        key += name;
        key += '=';
        key += value;
        key += '\x1f';
    }
    return key;
}

Labels with_label(Labels labels, const std::string& name, const std::string& value) {
    labels.emplace_back(name, value);
    return labels;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

MetricStore::MetricStore(PrometheusConfig config) : config_(std::move(config)) {}

std::string MetricStore::family_name(const MetricPoint& point, bool counter) const {
    std::string name = config_.metric_namespace.empty()
                           ? point.name
                           : config_.metric_namespace + "_" + point.name;
    name = sanitize_metric_name(name);
    if (counter && !ends_with(name, "_total")) {
        name += "_total";
    }
    return name;
}

Labels MetricStore::labels_for(const Signal& signal) const {
    std::map<std::string, std::string> merged;

    if (signal.resource) {
        const Attributes& resource = signal.resource->attributes;
        if (config_.resource_to_telemetry_conversion) {
            for (const auto& [key, value] : resource) {
                merged[sanitize_label_name(key)] = attribute_to_string(value);
            }
        }
    }

    for (const auto& [key, value] : signal.attributes()) {
        std::string name = sanitize_label_name(key);
        if (name == "le" || name == "quantile") {
            continue;
        }
        merged[name] = attribute_to_string(value);
    }

    if (signal.resource) {
        const Attributes& resource = signal.resource->attributes;
        auto service = resource.find("service.name");
        if (service != resource.end()) {
            std::string job = attribute_to_string(service->second);
            auto ns = resource.find("service.namespace");
            if (ns != resource.end()) {
                job = attribute_to_string(ns->second) + "/" + job;
            }
            merged["job"] = job;
        }
        auto instance = resource.find("service.instance.id");
        if (instance != resource.end()) {
            merged["instance"] = attribute_to_string(instance->second);
        }
    }

    for (const auto& [key, value] : config_.const_labels) {
        merged[sanitize_label_name(key)] = value;
    }

    return Labels(merged.begin(), merged.end());
}

void MetricStore::update(const Batch& batch, Clock::time_point now) {
    if (batch.type != SignalType::Metrics) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& signal : batch.signals) {
        const MetricPoint& point = signal.metric();
        const char* type = family_type(point);
        const std::string name = family_name(point, std::string(type) == "counter");

        Family& family = families_[name];
        if (family.type.empty()) {
            family.type = type;
            family.help = point.description;
        } else if (family.type != type) {
            LOG_EVERY_N(WARNING, 100) << "Metric " << name << " received as " << type
                                      << " but registered as " << family.type << ", dropped";
            continue;
        }

        Labels labels = labels_for(signal);
        Series& series = family.series[series_key(labels)];
        series.labels = std::move(labels);
        series.updated = now;

        const bool delta = point.temporality == Temporality::Delta;
        switch (point.kind) {
            case MetricKind::Gauge:
                series.value = point.value;
                break;

            case MetricKind::Sum:
                series.value = delta ? series.value + point.value : point.value;
                break;

            case MetricKind::Histogram:
                if (delta && series.bounds == point.bounds &&
                    series.buckets.size() == point.bucket_counts.size()) {
                    series.count += point.count;
                    series.sum += point.sum;
                    for (size_t i = 0; i < series.buckets.size(); ++i) {
                        series.buckets[i] += point.bucket_counts[i];
                    }
                } else {
                    series.count = point.count;
                    series.sum = point.sum;
                    series.bounds = point.bounds;
                    series.buckets = point.bucket_counts;
                }
                break;

            case MetricKind::Summary:
                series.count = point.count;
                series.sum = point.sum;
                series.quantiles = point.quantiles;
                break;
        }
    }
}

void MetricStore::expire_locked(Clock::time_point now) {
    if (config_.metric_expiration.count() <= 0) {
        return;
    }
    for (auto family = families_.begin(); family != families_.end();) {
        auto& series = family->second.series;
        for (auto it = series.begin(); it != series.end();) {
            if (now - it->second.updated > config_.metric_expiration) {
                it = series.erase(it);
            } else {
                ++it;
            }
        }
        if (series.empty()) {
            family = families_.erase(family);
        } else {
            ++family;
        }
    }
}

std::string MetricStore::render(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    expire_locked(now);

    PrometheusTextWriter writer;
    for (const auto& [name, family] : families_) {
        writer.family(name, family.type, family.help);

        for (const auto& entry : family.series) {
            const Series& series = entry.second;

            if (family.type == "histogram") {
                uint64_t cumulative = 0;
                for (size_t i = 0; i < series.bounds.size() && i < series.buckets.size(); ++i) {
                    cumulative += series.buckets[i];
                    writer.sample(name + "_bucket",
                                  with_label(series.labels, "le", format_value(series.bounds[i])),
                                  static_cast<double>(cumulative));
                }
                writer.sample(name + "_bucket", with_label(series.labels, "le", "+Inf"),
                              static_cast<double>(series.count));
                writer.sample(name + "_sum", series.labels, series.sum);
                writer.sample(name + "_count", series.labels, static_cast<double>(series.count));
            } else if (family.type == "summary") {
                for (const auto& q : series.quantiles) {
                    writer.sample(name, with_label(series.labels, "quantile",
                                                   format_value(q.quantile)),
                                  q.value);
                }
                writer.sample(name + "_sum", series.labels, series.sum);
                writer.sample(name + "_count", series.labels, static_cast<double>(series.count));
            } else {
                writer.sample(name, series.labels, series.value);
            }
        }
    }
    return writer.str();
}

size_t MetricStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : families_) {
        total += entry.second.series.size();
    }
    return total;
}

PrometheusExporter::PrometheusExporter(std::string name, PrometheusConfig config)
    : name_(std::move(name)), config_(config), store_(std::move(config)) {}

PrometheusExporter::~PrometheusExporter() {
    shutdown();
}

bool PrometheusExporter::start() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (server_ && server_->running()) {
        return true;
    }

    HttpServer::Settings settings;
    if (!split_host_port(config_.endpoint, settings.address, settings.port)) {
        LOG(ERROR) << name_ << ": invalid endpoint '" << config_.endpoint << "'";
        return false;
    }
    settings.threads = 1;

    server_ = std::make_unique<HttpServer>(
        name_, settings, [this](const HttpRequest& request) { return handle(request); });
    if (!server_->start()) {
        server_.reset();
        return false;
    }
    return true;
}

void PrometheusExporter::shutdown() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (server_) {
        server_->stop();
    }
}

bool PrometheusExporter::healthy() const {
    return server_ && server_->running();
}

uint16_t PrometheusExporter::port() const {
    return server_ ? server_->port() : 0;
}

ExportResult PrometheusExporter::export_batch(const Batch& batch) {
    if (batch.type != SignalType::Metrics) {
        return ExportResult::terminal(std::string("signal type ") + to_string(batch.type) +
                                      " not supported");
    }
    store_.update(batch);
    return ExportResult::success();
}

HttpResponse PrometheusExporter::handle(const HttpRequest& request) {
    std::string target(request.target());
    target = target.substr(0, target.find('?'));
    if (target != "/metrics") {
        return make_response(request, http::status::not_found, "not found\n", "text/plain");
    }
    if (request.method() != http::verb::get) {
        return make_response(request, http::status::method_not_allowed, "", "text/plain");
    }
    return make_response(request, http::status::ok, store_.render(), kPrometheusContentType);
}

}  // namespace sigroute

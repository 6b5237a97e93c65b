// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/logging_exporter.hpp"

#include <glog/logging.h>

#include <sstream>

namespace sigroute {

using json = nlohmann::json;

namespace {

const char* kind_name(MetricKind kind) {
    switch (kind) {
        case MetricKind::Gauge: return "gauge";
        case MetricKind::Sum: return "sum";
        case MetricKind::Histogram: return "histogram";
        case MetricKind::Summary: return "summary";
    }
    return "unknown";
}

json attributes_to_json(const Attributes& attributes) {
    json j = json::object();
    for (const auto& [key, value] : attributes) {
        j[key] = std::visit([](auto&& v) -> json { return v; }, value);
    }
    return j;
}

std::string summary_line(const Signal& signal) {
    std::ostringstream oss;
    switch (signal.type) {
        case SignalType::Traces: {
            const Span& span = signal.span();
            oss << "span " << span.name << " trace_id=" << to_hex(span.trace_id)
                << " span_id=" << to_hex(span.span_id) << " duration_ns="
                << (span.end_time_ns - span.start_time_ns);
            break;
        }
        case SignalType::Metrics: {
            const MetricPoint& point = signal.metric();
            oss << "metric " << point.name << " " << kind_name(point.kind);
            if (point.kind == MetricKind::Gauge || point.kind == MetricKind::Sum) {
                oss << " value=" << point.value;
            } else {
                oss << " count=" << point.count << " sum=" << point.sum;
            }
            break;
        }
        case SignalType::Logs: {
            const LogRecord& record = signal.log();
            oss << "log " << (record.severity_text.empty() ? "-" : record.severity_text) << " "
                << record.body;
            break;
        }
    }
    if (signal.resource) {
        std::string service = signal.resource->service_name();
        if (!service.empty()) {
            oss << " service=" << service;
        }
    }
    return oss.str();
}

}  // namespace

std::optional<Verbosity> verbosity_from_string(const std::string& name) {
    if (name == "basic") return Verbosity::Basic;
    if (name == "normal") return Verbosity::Normal;
    if (name == "detailed") return Verbosity::Detailed;
    return std::nullopt;
}

LoggingExporter::LoggingExporter(std::string name, LoggingExporterConfig config)
    : name_(std::move(name)), config_(config) {}

void LoggingExporter::shutdown() {
    LOG(INFO) << name_ << ": logged " << signals_logged_.load() << " signals";
}

json LoggingExporter::to_json(const Signal& signal) {
    json j;
    j["type"] = to_string(signal.type);
    j["timestamp_ns"] = signal.timestamp_ns;
    if (signal.resource) {
        j["resource"] = attributes_to_json(signal.resource->attributes);
    }
    if (signal.scope) {
        j["scope"] = {{"name", signal.scope->name}, {"version", signal.scope->version}};
    }

    switch (signal.type) {
        case SignalType::Traces: {
            const Span& span = signal.span();
            j["trace_id"] = to_hex(span.trace_id);
            j["span_id"] = to_hex(span.span_id);
            if (!span.parent_span_id.empty()) {
                j["parent_span_id"] = to_hex(span.parent_span_id);
            }
            j["name"] = span.name;
            j["kind"] = static_cast<int>(span.kind);
            j["start_time_ns"] = span.start_time_ns;
            j["end_time_ns"] = span.end_time_ns;
            j["status"] = {{"code", static_cast<int>(span.status_code)},
                           {"message", span.status_message}};
            break;
        }
        case SignalType::Metrics: {
            const MetricPoint& point = signal.metric();
            j["name"] = point.name;
            j["description"] = point.description;
            j["unit"] = point.unit;
            j["kind"] = kind_name(point.kind);
            if (point.kind == MetricKind::Gauge || point.kind == MetricKind::Sum) {
                if (point.is_int) {
                    j["value"] = static_cast<int64_t>(point.value);
                } else {
                    j["value"] = point.value;
                }
            }
            if (point.kind == MetricKind::Sum) {
                j["monotonic"] = point.monotonic;
                j["temporality"] = static_cast<int>(point.temporality);
            }
            if (point.kind == MetricKind::Histogram || point.kind == MetricKind::Summary) {
                j["count"] = point.count;
                j["sum"] = point.sum;
            }
            if (point.kind == MetricKind::Histogram) {
                j["bounds"] = point.bounds;
                j["bucket_counts"] = point.bucket_counts;
            }
            if (point.kind == MetricKind::Summary) {
                json quantiles = json::array();
                for (const auto& q : point.quantiles) {
                    quantiles.push_back({{"quantile", q.quantile}, {"value", q.value}});
                }
                j["quantiles"] = quantiles;
            }
            break;
        }
        case SignalType::Logs: {
            const LogRecord& record = signal.log();
            j["severity_number"] = record.severity_number;
            j["severity_text"] = record.severity_text;
            j["body"] = record.body;
            if (!record.trace_id.empty()) {
                j["trace_id"] = to_hex(record.trace_id);
                j["span_id"] = to_hex(record.span_id);
            }
            break;
        }
    }
    j["attributes"] = attributes_to_json(signal.attributes());
    return j;
}

std::vector<std::string> LoggingExporter::format(const Batch& batch) const {
    std::vector<std::string> lines;
    std::ostringstream head;
    head << to_string(batch.type) << " batch #" << batch.sequence << ": " << batch.size()
         << " signals (" << to_string(batch.reason) << ")";
    lines.push_back(head.str());

    if (config_.verbosity == Verbosity::Basic) {
        return lines;
    }
    for (const auto& signal : batch.signals) {
        if (config_.verbosity == Verbosity::Detailed) {
            lines.push_back(to_json(signal).dump());
        } else {
            lines.push_back(summary_line(signal));
        }
    }
    return lines;
}

ExportResult LoggingExporter::export_batch(const Batch& batch) {
    for (const auto& line : format(batch)) {
        LOG(INFO) << name_ << ": " << line;
    }
    signals_logged_ += batch.size();
    return ExportResult::success();
}

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/otlp_decoder.hpp"
#include "sigroute/errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace sigroute::otlp {

namespace metrics_pb = opentelemetry::proto::metrics::v1;

namespace {

constexpr size_t kTraceIdSize = 16;
constexpr size_t kSpanIdSize = 8;

std::string any_value_text(const common::AnyValue& value);

std::string array_text(const common::ArrayValue& array) {
    std::ostringstream oss;
    oss << "[";
    for (int i = 0; i < array.values_size(); ++i) {
        if (i > 0) oss << ",";
        oss << any_value_text(array.values(i));
    }
    oss << "]";
    return oss.str();
}

std::string kvlist_text(const common::KeyValueList& list) {
    std::ostringstream oss;
    oss << "{";
    for (int i = 0; i < list.values_size(); ++i) {
        if (i > 0) oss << ",";
        oss << list.values(i).key() << ":" << any_value_text(list.values(i).value());
    }
    oss << "}";
    return oss.str();
}

std::string any_value_text(const common::AnyValue& value) {
    return attribute_to_string(decode_any_value(value));
}

std::shared_ptr<const Resource> decode_resource(
    const opentelemetry::proto::resource::v1::Resource& pb_resource,
    const std::string& schema_url) {
    auto resource = std::make_shared<Resource>();
    resource->attributes = decode_attributes(pb_resource.attributes());
    resource->schema_url = schema_url;
    return resource;
}

std::shared_ptr<const Scope> decode_scope(const common::InstrumentationScope& pb_scope) {
    auto scope = std::make_shared<Scope>();
    scope->name = pb_scope.name();
    scope->version = pb_scope.version();
    return scope;
}

void check_id(const std::string& id, size_t expected, bool allow_empty, const char* what) {
    if (id.empty() && allow_empty) {
        return;
    }
    if (id.size() != expected) {
        throw DecodeError(std::string("invalid ") + what + " length " +
                          std::to_string(id.size()) + ", expected " +
                          std::to_string(expected));
    }
}

MetricPoint metric_descriptor(const metrics_pb::Metric& metric, MetricKind kind) {
    MetricPoint point;
    point.name = metric.name();
    point.description = metric.description();
    point.unit = metric.unit();
    point.kind = kind;
    return point;
}

void fill_number(MetricPoint& point, const metrics_pb::NumberDataPoint& dp) {
    switch (dp.value_case()) {
        case metrics_pb::NumberDataPoint::kAsDouble:
            point.value = dp.as_double();
            break;
        case metrics_pb::NumberDataPoint::kAsInt:
            point.value = static_cast<double>(dp.as_int());
            point.is_int = true;
            break;
        default:
            throw DecodeError("metric '" + point.name + "' has a data point without value");
    }
    point.start_time_ns = dp.start_time_unix_nano();
    point.attributes = decode_attributes(dp.attributes());
}

void decode_metric(const metrics_pb::Metric& metric,
                   const std::shared_ptr<const Resource>& resource,
                   const std::shared_ptr<const Scope>& scope,
                   std::vector<Signal>& out) {
    if (metric.name().empty()) {
        throw DecodeError("metric without name");
    }

    switch (metric.data_case()) {
        case metrics_pb::Metric::kGauge:
            for (const auto& dp : metric.gauge().data_points()) {
                MetricPoint point = metric_descriptor(metric, MetricKind::Gauge);
                fill_number(point, dp);
                out.push_back(make_signal(std::move(point), dp.time_unix_nano(), resource, scope));
            }
            break;

        case metrics_pb::Metric::kSum:
            for (const auto& dp : metric.sum().data_points()) {
                MetricPoint point = metric_descriptor(metric, MetricKind::Sum);
                point.monotonic = metric.sum().is_monotonic();
                point.temporality = static_cast<Temporality>(metric.sum().aggregation_temporality());
                fill_number(point, dp);
                out.push_back(make_signal(std::move(point), dp.time_unix_nano(), resource, scope));
            }
            break;

        case metrics_pb::Metric::kHistogram:
            for (const auto& dp : metric.histogram().data_points()) {
                if (dp.bucket_counts_size() != 0 &&
                    dp.bucket_counts_size() != dp.explicit_bounds_size() + 1) {
                    throw DecodeError("histogram '" + metric.name() + "' has " +
                                      std::to_string(dp.bucket_counts_size()) +
                                      " buckets for " +
                                      std::to_string(dp.explicit_bounds_size()) + " bounds");
                }
                MetricPoint point = metric_descriptor(metric, MetricKind::Histogram);
                point.temporality =
                    static_cast<Temporality>(metric.histogram().aggregation_temporality());
                point.count = dp.count();
                point.sum = dp.sum();
                point.bounds.assign(dp.explicit_bounds().begin(), dp.explicit_bounds().end());
                point.bucket_counts.assign(dp.bucket_counts().begin(), dp.bucket_counts().end());
                point.start_time_ns = dp.start_time_unix_nano();
                point.attributes = decode_attributes(dp.attributes());
                out.push_back(make_signal(std::move(point), dp.time_unix_nano(), resource, scope));
            }
            break;

        case metrics_pb::Metric::kSummary:
            for (const auto& dp : metric.summary().data_points()) {
                MetricPoint point = metric_descriptor(metric, MetricKind::Summary);
                point.count = dp.count();
                point.sum = dp.sum();
                for (const auto& q : dp.quantile_values()) {
                    point.quantiles.push_back({q.quantile(), q.value()});
                }
                point.start_time_ns = dp.start_time_unix_nano();
                point.attributes = decode_attributes(dp.attributes());
                out.push_back(make_signal(std::move(point), dp.time_unix_nano(), resource, scope));
            }
            break;

        case metrics_pb::Metric::kExponentialHistogram:
            LOG_EVERY_N(WARNING, 100) << "Skipping exponential histogram '" << metric.name()
                                      << "' (unsupported)";
            break;

        default:
            throw DecodeError("metric '" + metric.name() + "' has no data");
    }
}

}  // namespace

AttributeValue decode_any_value(const common::AnyValue& value) {
    switch (value.value_case()) {
        case common::AnyValue::kStringValue:
            return value.string_value();
        case common::AnyValue::kBoolValue:
            return value.bool_value();
        case common::AnyValue::kIntValue:
            return static_cast<int64_t>(value.int_value());
        case common::AnyValue::kDoubleValue:
            return value.double_value();
        case common::AnyValue::kArrayValue:
            return array_text(value.array_value());
        case common::AnyValue::kKvlistValue:
            return kvlist_text(value.kvlist_value());
        case common::AnyValue::kBytesValue:
            return to_hex(value.bytes_value());
        default:
            return std::string();
    }
}

Attributes decode_attributes(
    const google::protobuf::RepeatedPtrField<common::KeyValue>& attributes) {
    Attributes result;
    for (const auto& kv : attributes) {
        result[kv.key()] = decode_any_value(kv.value());
    }
    return result;
}

std::vector<Signal> decode_traces(const collector_trace::ExportTraceServiceRequest& request) {
    std::vector<Signal> signals;

    for (const auto& resource_spans : request.resource_spans()) {
        auto resource = decode_resource(resource_spans.resource(), resource_spans.schema_url());

        for (const auto& scope_spans : resource_spans.scope_spans()) {
            auto scope = decode_scope(scope_spans.scope());

            for (const auto& pb_span : scope_spans.spans()) {
                check_id(pb_span.trace_id(), kTraceIdSize, false, "trace_id");
                check_id(pb_span.span_id(), kSpanIdSize, false, "span_id");
                check_id(pb_span.parent_span_id(), kSpanIdSize, true, "parent_span_id");

                Span span;
                span.trace_id = pb_span.trace_id();
                span.span_id = pb_span.span_id();
                span.parent_span_id = pb_span.parent_span_id();
                span.trace_state = pb_span.trace_state();
                span.name = pb_span.name();
                span.kind = static_cast<SpanKind>(pb_span.kind());
                span.start_time_ns = pb_span.start_time_unix_nano();
                span.end_time_ns = pb_span.end_time_unix_nano();
                span.status_code = static_cast<StatusCode>(pb_span.status().code());
                span.status_message = pb_span.status().message();
                span.attributes = decode_attributes(pb_span.attributes());

                uint64_t ts = span.start_time_ns;
                signals.push_back(make_signal(std::move(span), ts, resource, scope));
            }
        }
    }

    return signals;
}

std::vector<Signal> decode_metrics(const collector_metrics::ExportMetricsServiceRequest& request) {
    std::vector<Signal> signals;

    for (const auto& resource_metrics : request.resource_metrics()) {
        auto resource =
            decode_resource(resource_metrics.resource(), resource_metrics.schema_url());

        for (const auto& scope_metrics : resource_metrics.scope_metrics()) {
            auto scope = decode_scope(scope_metrics.scope());
            for (const auto& metric : scope_metrics.metrics()) {
                decode_metric(metric, resource, scope, signals);
            }
        }
    }

    return signals;
}

std::vector<Signal> decode_logs(const collector_logs::ExportLogsServiceRequest& request) {
    std::vector<Signal> signals;

    for (const auto& resource_logs : request.resource_logs()) {
        auto resource = decode_resource(resource_logs.resource(), resource_logs.schema_url());

        for (const auto& scope_logs : resource_logs.scope_logs()) {
            auto scope = decode_scope(scope_logs.scope());

            for (const auto& pb_log : scope_logs.log_records()) {
                check_id(pb_log.trace_id(), kTraceIdSize, true, "trace_id");
                check_id(pb_log.span_id(), kSpanIdSize, true, "span_id");

                LogRecord record;
                record.severity_number = static_cast<int>(pb_log.severity_number());
                record.severity_text = pb_log.severity_text();
                record.body = any_value_text(pb_log.body());
                record.trace_id = pb_log.trace_id();
                record.span_id = pb_log.span_id();
                record.observed_time_ns = pb_log.observed_time_unix_nano();
                record.attributes = decode_attributes(pb_log.attributes());

                uint64_t ts = pb_log.time_unix_nano() != 0 ? pb_log.time_unix_nano()
                                                           : pb_log.observed_time_unix_nano();
                signals.push_back(make_signal(std::move(record), ts, resource, scope));
            }
        }
    }

    return signals;
}

std::vector<Signal> decode(SignalType type, const std::string& bytes) {
    switch (type) {
        case SignalType::Traces: {
            collector_trace::ExportTraceServiceRequest request;
            if (!request.ParseFromString(bytes)) {
                throw DecodeError("malformed ExportTraceServiceRequest");
            }
            return decode_traces(request);
        }
        case SignalType::Metrics: {
            collector_metrics::ExportMetricsServiceRequest request;
            if (!request.ParseFromString(bytes)) {
                throw DecodeError("malformed ExportMetricsServiceRequest");
            }
            return decode_metrics(request);
        }
        case SignalType::Logs: {
            collector_logs::ExportLogsServiceRequest request;
            if (!request.ParseFromString(bytes)) {
                throw DecodeError("malformed ExportLogsServiceRequest");
            }
            return decode_logs(request);
        }
    }
    throw DecodeError("unknown signal type");
}

}  // namespace sigroute::otlp

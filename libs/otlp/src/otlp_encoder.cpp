// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/otlp_encoder.hpp"

#include <map>
#include <tuple>
#include <utility>

namespace sigroute::otlp {

namespace collector_trace = opentelemetry::proto::collector::trace::v1;
namespace collector_metrics = opentelemetry::proto::collector::metrics::v1;
namespace collector_logs = opentelemetry::proto::collector::logs::v1;
namespace common_pb = opentelemetry::proto::common::v1;
namespace trace_pb = opentelemetry::proto::trace::v1;
namespace metrics_pb = opentelemetry::proto::metrics::v1;
namespace logs_pb = opentelemetry::proto::logs::v1;

namespace {

void encode_attributes(const Attributes& attributes,
                       google::protobuf::RepeatedPtrField<common_pb::KeyValue>* out) {
    for (const auto& [key, value] : attributes) {
        auto* kv = out->Add();
        kv->set_key(key);
        encode_any_value(value, kv->mutable_value());
    }
}

template <typename ResourceBlock>
void fill_resource(const Signal& signal, ResourceBlock* block) {
    if (!signal.resource) {
        return;
    }
    encode_attributes(signal.resource->attributes,
                      block->mutable_resource()->mutable_attributes());
    block->set_schema_url(signal.resource->schema_url);
}

template <typename ScopeBlock>
void fill_scope(const Signal& signal, ScopeBlock* block) {
    if (!signal.scope) {
        return;
    }
    block->mutable_scope()->set_name(signal.scope->name);
    block->mutable_scope()->set_version(signal.scope->version);
}

/// Finds or creates the resource and scope block for each signal, keyed by
/// the identity of the shared Resource and Scope instances.
template <typename ResourceBlock, typename ScopeBlock, typename AddResource, typename AddScope>
class BlockIndex {
public:
    BlockIndex(AddResource add_resource, AddScope add_scope)
        : add_resource_(add_resource), add_scope_(add_scope) {}

    ScopeBlock* scope_for(const Signal& signal) {
        const Resource* resource_key = signal.resource.get();
        const Scope* scope_key = signal.scope.get();

        auto scope_it = scopes_.find({resource_key, scope_key});
        if (scope_it != scopes_.end()) {
            return scope_it->second;
        }

        ResourceBlock* resource_block = nullptr;
        auto res_it = resources_.find(resource_key);
        if (res_it != resources_.end()) {
            resource_block = res_it->second;
        } else {
            resource_block = add_resource_();
            fill_resource(signal, resource_block);
            resources_.emplace(resource_key, resource_block);
        }

        ScopeBlock* scope_block = add_scope_(resource_block);
        fill_scope(signal, scope_block);
        scopes_.emplace(std::make_pair(resource_key, scope_key), scope_block);
        return scope_block;
    }

private:
    AddResource add_resource_;
    AddScope add_scope_;
    std::map<const Resource*, ResourceBlock*> resources_;
    std::map<std::pair<const Resource*, const Scope*>, ScopeBlock*> scopes_;
};

template <typename ResourceBlock, typename ScopeBlock, typename AddResource, typename AddScope>
BlockIndex<ResourceBlock, ScopeBlock, AddResource, AddScope>
make_index(AddResource add_resource, AddScope add_scope) {
    return BlockIndex<ResourceBlock, ScopeBlock, AddResource, AddScope>(add_resource, add_scope);
}

void fill_number_point(const MetricPoint& point, uint64_t timestamp_ns,
                       metrics_pb::NumberDataPoint* dp) {
    dp->set_start_time_unix_nano(point.start_time_ns);
    dp->set_time_unix_nano(timestamp_ns);
    if (point.is_int) {
        dp->set_as_int(static_cast<int64_t>(point.value));
    } else {
        dp->set_as_double(point.value);
    }
    encode_attributes(point.attributes, dp->mutable_attributes());
}

void add_data_point(const MetricPoint& point, uint64_t timestamp_ns, metrics_pb::Metric* metric) {
    switch (point.kind) {
        case MetricKind::Gauge:
            fill_number_point(point, timestamp_ns, metric->mutable_gauge()->add_data_points());
            break;

        case MetricKind::Sum: {
            auto* sum = metric->mutable_sum();
            sum->set_is_monotonic(point.monotonic);
            sum->set_aggregation_temporality(
                static_cast<metrics_pb::AggregationTemporality>(point.temporality));
            fill_number_point(point, timestamp_ns, sum->add_data_points());
            break;
        }

        case MetricKind::Histogram: {
            auto* hist = metric->mutable_histogram();
            hist->set_aggregation_temporality(
                static_cast<metrics_pb::AggregationTemporality>(point.temporality));
            auto* dp = hist->add_data_points();
            dp->set_start_time_unix_nano(point.start_time_ns);
            dp->set_time_unix_nano(timestamp_ns);
            dp->set_count(point.count);
            dp->set_sum(point.sum);
            for (double bound : point.bounds) {
                dp->add_explicit_bounds(bound);
            }
            for (uint64_t count : point.bucket_counts) {
                dp->add_bucket_counts(count);
            }
            encode_attributes(point.attributes, dp->mutable_attributes());
            break;
        }

        case MetricKind::Summary: {
            auto* dp = metric->mutable_summary()->add_data_points();
            dp->set_start_time_unix_nano(point.start_time_ns);
            dp->set_time_unix_nano(timestamp_ns);
            dp->set_count(point.count);
            dp->set_sum(point.sum);
            for (const auto& q : point.quantiles) {
                auto* qv = dp->add_quantile_values();
                qv->set_quantile(q.quantile);
                qv->set_value(q.value);
            }
            encode_attributes(point.attributes, dp->mutable_attributes());
            break;
        }
    }
}

}  // namespace

void encode_any_value(const AttributeValue& value, common_pb::AnyValue* out) {
    struct Visitor {
        common_pb::AnyValue* out;
        void operator()(const std::string& v) const { out->set_string_value(v); }
        void operator()(bool v) const { out->set_bool_value(v); }
        void operator()(int64_t v) const { out->set_int_value(v); }
        void operator()(double v) const { out->set_double_value(v); }
    };
    std::visit(Visitor{out}, value);
}

collector_trace::ExportTraceServiceRequest encode_traces(const Batch& batch) {
    collector_trace::ExportTraceServiceRequest request;

    auto index = make_index<trace_pb::ResourceSpans, trace_pb::ScopeSpans>(
        [&request] { return request.add_resource_spans(); },
        [](trace_pb::ResourceSpans* rs) { return rs->add_scope_spans(); });

    for (const auto& signal : batch.signals) {
        const Span& span = signal.span();
        auto* pb_span = index.scope_for(signal)->add_spans();

        pb_span->set_trace_id(span.trace_id);
        pb_span->set_span_id(span.span_id);
        pb_span->set_parent_span_id(span.parent_span_id);
        pb_span->set_trace_state(span.trace_state);
        pb_span->set_name(span.name);
        pb_span->set_kind(static_cast<trace_pb::Span_SpanKind>(span.kind));
        pb_span->set_start_time_unix_nano(span.start_time_ns);
        pb_span->set_end_time_unix_nano(span.end_time_ns);
        pb_span->mutable_status()->set_code(
            static_cast<trace_pb::Status_StatusCode>(span.status_code));
        pb_span->mutable_status()->set_message(span.status_message);
        encode_attributes(span.attributes, pb_span->mutable_attributes());
    }

    return request;
}

collector_metrics::ExportMetricsServiceRequest encode_metrics(const Batch& batch) {
    collector_metrics::ExportMetricsServiceRequest request;

    auto index = make_index<metrics_pb::ResourceMetrics, metrics_pb::ScopeMetrics>(
        [&request] { return request.add_resource_metrics(); },
        [](metrics_pb::ResourceMetrics* rm) { return rm->add_scope_metrics(); });

    using MetricKey = std::tuple<metrics_pb::ScopeMetrics*, std::string, int, std::string,
                                 std::string, bool, int>;
    std::map<MetricKey, metrics_pb::Metric*> metrics;

    for (const auto& signal : batch.signals) {
        const MetricPoint& point = signal.metric();
        auto* scope_block = index.scope_for(signal);

        MetricKey key{scope_block, point.name, static_cast<int>(point.kind), point.unit,
                      point.description, point.monotonic, static_cast<int>(point.temporality)};

        metrics_pb::Metric* metric = nullptr;
        auto it = metrics.find(key);
        if (it != metrics.end()) {
            metric = it->second;
        } else {
            metric = scope_block->add_metrics();
            metric->set_name(point.name);
            metric->set_description(point.description);
            metric->set_unit(point.unit);
            metrics.emplace(key, metric);
        }

        add_data_point(point, signal.timestamp_ns, metric);
    }

    return request;
}

collector_logs::ExportLogsServiceRequest encode_logs(const Batch& batch) {
    collector_logs::ExportLogsServiceRequest request;

    auto index = make_index<logs_pb::ResourceLogs, logs_pb::ScopeLogs>(
        [&request] { return request.add_resource_logs(); },
        [](logs_pb::ResourceLogs* rl) { return rl->add_scope_logs(); });

    for (const auto& signal : batch.signals) {
        const LogRecord& record = signal.log();
        auto* pb_log = index.scope_for(signal)->add_log_records();

        pb_log->set_time_unix_nano(signal.timestamp_ns);
        pb_log->set_observed_time_unix_nano(record.observed_time_ns);
        pb_log->set_severity_number(static_cast<logs_pb::SeverityNumber>(record.severity_number));
        pb_log->set_severity_text(record.severity_text);
        pb_log->mutable_body()->set_string_value(record.body);
        pb_log->set_trace_id(record.trace_id);
        pb_log->set_span_id(record.span_id);
        encode_attributes(record.attributes, pb_log->mutable_attributes());
    }

    return request;
}

std::string encode(const Batch& batch) {
    std::string out;
    switch (batch.type) {
        case SignalType::Traces:
            encode_traces(batch).SerializeToString(&out);
            break;
        case SignalType::Metrics:
            encode_metrics(batch).SerializeToString(&out);
            break;
        case SignalType::Logs:
            encode_logs(batch).SerializeToString(&out);
            break;
    }
    return out;
}

}  // namespace sigroute::otlp

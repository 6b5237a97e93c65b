// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file signal.hpp
/// @brief In-memory representation of received observability signals
///
/// A Signal is one trace span, metric point or log record. Signals own their
/// memory and are never modified after they enter a batch. The resource
/// attributes of all signals decoded from the same OTLP resource block are
/// shared through a single immutable Resource instance.

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sigroute {

/// Signal type handled by a pipeline
enum class SignalType {
    Traces,
    Metrics,
    Logs
};

/// @return "traces", "metrics" or "logs"
const char* to_string(SignalType type);

/// Parse a signal type name ("traces", "metrics", "logs")
std::optional<SignalType> signal_type_from_string(const std::string& name);

/// Scalar attribute value
using AttributeValue = std::variant<std::string, bool, int64_t, double>;

/// Attribute mapping (sorted by key)
using Attributes = std::map<std::string, AttributeValue>;

/// Render an attribute value as text (strings unquoted)
std::string attribute_to_string(const AttributeValue& value);

/// Resource the signals were produced by (service.name, host.name, ...)
struct Resource {
    Attributes attributes;
    std::string schema_url;

    /// Value of the service.name attribute, empty if absent
    std::string service_name() const;
};

/// Instrumentation scope that produced the signals
struct Scope {
    std::string name;
    std::string version;
};

/// Span kind, values match OTLP
enum class SpanKind : int {
    Unspecified = 0,
    Internal = 1,
    Server = 2,
    Client = 3,
    Producer = 4,
    Consumer = 5
};

/// Span status code, values match OTLP
enum class StatusCode : int {
    Unset = 0,
    Ok = 1,
    Error = 2
};

/// A trace span
struct Span {
    std::string trace_id;        // 16 raw bytes
    std::string span_id;         // 8 raw bytes
    std::string parent_span_id;  // 8 raw bytes or empty for root spans
    std::string trace_state;
    std::string name;
    SpanKind kind = SpanKind::Unspecified;
    uint64_t start_time_ns = 0;
    uint64_t end_time_ns = 0;
    StatusCode status_code = StatusCode::Unset;
    std::string status_message;
    Attributes attributes;
};

/// Kind of metric point
enum class MetricKind {
    Gauge,
    Sum,
    Histogram,
    Summary
};

/// Aggregation temporality of sums and histograms, values match OTLP
enum class Temporality : int {
    Unspecified = 0,
    Delta = 1,
    Cumulative = 2
};

/// Quantile of a summary point
struct Quantile {
    double quantile = 0.0;
    double value = 0.0;
};

/// A single metric data point together with its metric descriptor
struct MetricPoint {
    std::string name;
    std::string description;
    std::string unit;
    MetricKind kind = MetricKind::Gauge;

    // Gauge and Sum
    double value = 0.0;
    bool is_int = false;

    // Sum and Histogram
    bool monotonic = false;
    Temporality temporality = Temporality::Unspecified;

    // Histogram and Summary
    uint64_t count = 0;
    double sum = 0.0;
    std::vector<double> bounds;
    std::vector<uint64_t> bucket_counts;
    std::vector<Quantile> quantiles;

    uint64_t start_time_ns = 0;
    Attributes attributes;
};

/// A log record
struct LogRecord {
    int severity_number = 0;
    std::string severity_text;
    std::string body;
    std::string trace_id;
    std::string span_id;
    uint64_t observed_time_ns = 0;
    Attributes attributes;
};

/// One received observability record
struct Signal {
    SignalType type = SignalType::Traces;
    uint64_t timestamp_ns = 0;
    std::shared_ptr<const Resource> resource;
    std::shared_ptr<const Scope> scope;
    std::variant<Span, MetricPoint, LogRecord> payload;

    /// Typed payload accessors, undefined behaviour on type mismatch
    const Span& span() const { return std::get<Span>(payload); }
    const MetricPoint& metric() const { return std::get<MetricPoint>(payload); }
    const LogRecord& log() const { return std::get<LogRecord>(payload); }

    /// Attributes of the payload (span, point or log attributes)
    const Attributes& attributes() const;
    Attributes& mutable_attributes();
};

/// Construct a signal of the matching type from a payload
Signal make_signal(Span span, uint64_t timestamp_ns,
                   std::shared_ptr<const Resource> resource = nullptr,
                   std::shared_ptr<const Scope> scope = nullptr);
Signal make_signal(MetricPoint point, uint64_t timestamp_ns,
                   std::shared_ptr<const Resource> resource = nullptr,
                   std::shared_ptr<const Scope> scope = nullptr);
Signal make_signal(LogRecord record, uint64_t timestamp_ns,
                   std::shared_ptr<const Resource> resource = nullptr,
                   std::shared_ptr<const Scope> scope = nullptr);

/// Hex encoding of raw id bytes (trace and span ids)
std::string to_hex(const std::string& bytes);

}  // namespace sigroute

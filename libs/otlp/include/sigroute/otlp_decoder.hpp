// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file otlp_decoder.hpp
/// @brief OTLP protobuf requests to in-memory signals
///
/// Each resource block of a request becomes one shared Resource, each scope
/// block one shared Scope. Signals are produced in request order.
///
/// Validation follows the OTLP data model: trace ids must be 16 bytes, span
/// ids 8 bytes, metrics must be named and histogram bucket counts must match
/// the explicit bounds. Any violation rejects the whole request with a
/// DecodeError.

#include "sigroute/signal.hpp"

#include "opentelemetry/proto/collector/logs/v1/logs_service.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.pb.h"

#include <string>
#include <vector>

namespace sigroute::otlp {

namespace collector_trace = opentelemetry::proto::collector::trace::v1;
namespace collector_metrics = opentelemetry::proto::collector::metrics::v1;
namespace collector_logs = opentelemetry::proto::collector::logs::v1;
namespace common = opentelemetry::proto::common::v1;

/// Decode a traces export request
/// @throws DecodeError on malformed spans
std::vector<Signal> decode_traces(const collector_trace::ExportTraceServiceRequest& request);

/// Decode a metrics export request. Exponential histogram points are not
/// supported and are skipped with a warning.
/// @throws DecodeError on malformed metrics
std::vector<Signal> decode_metrics(const collector_metrics::ExportMetricsServiceRequest& request);

/// Decode a logs export request
/// @throws DecodeError on malformed log records
std::vector<Signal> decode_logs(const collector_logs::ExportLogsServiceRequest& request);

/// Parse a serialized export request of the given type and decode it
/// @throws DecodeError if the bytes are not a valid request
std::vector<Signal> decode(SignalType type, const std::string& bytes);

/// Convert an OTLP AnyValue to a scalar attribute value. Arrays, key-value
/// lists and bytes are rendered to a string.
AttributeValue decode_any_value(const common::AnyValue& value);

/// Convert OTLP key-values to an attribute map (last key wins)
Attributes decode_attributes(
    const google::protobuf::RepeatedPtrField<common::KeyValue>& attributes);

}  // namespace sigroute::otlp

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file otlp_encoder.hpp
/// @brief Batch to OTLP protobuf request conversion
///
/// Signals sharing a Resource (by identity) are grouped into one resource
/// block, and within it signals sharing a Scope into one scope block. Group
/// order is the order of first appearance, so signal order is preserved
/// within each scope. Metric points with an identical descriptor in the same
/// scope are merged into one Metric.

#include "sigroute/batch.hpp"

#include "opentelemetry/proto/collector/logs/v1/logs_service.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.pb.h"

#include <string>

namespace sigroute::otlp {

opentelemetry::proto::collector::trace::v1::ExportTraceServiceRequest
encode_traces(const Batch& batch);

opentelemetry::proto::collector::metrics::v1::ExportMetricsServiceRequest
encode_metrics(const Batch& batch);

opentelemetry::proto::collector::logs::v1::ExportLogsServiceRequest
encode_logs(const Batch& batch);

/// Serialize the batch as the export request matching batch.type
std::string encode(const Batch& batch);

/// Convert a scalar attribute to an OTLP AnyValue
void encode_any_value(const AttributeValue& value, opentelemetry::proto::common::v1::AnyValue* out);

}  // namespace sigroute::otlp

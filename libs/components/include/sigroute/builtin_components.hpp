// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file builtin_components.hpp
/// @brief Factories of every component type shipped with sigroute
///
/// | Kind      | Types                                           |
/// |-----------|-------------------------------------------------|
/// | receiver  | otlp                                            |
/// | processor | batch, attributes                               |
/// | exporter  | logging, debug, otlp, jaeger, otlphttp, prometheus |
///
/// Every exporter additionally accepts:
/// @code
///   retry_on_failure: { enabled, initial_interval, multiplier,
///                       randomization_factor, max_interval,
///                       max_attempts, max_elapsed_time }
///   sending_queue:    { num_consumers }
///   required: false
///   startup_timeout: 5s
/// @endcode

#include "sigroute/attributes_processor.hpp"
#include "sigroute/component_registry.hpp"
#include "sigroute/logging_exporter.hpp"
#include "sigroute/otlp_grpc_exporter.hpp"
#include "sigroute/otlp_http_exporter.hpp"
#include "sigroute/otlp_receiver.hpp"
#include "sigroute/prometheus_exporter.hpp"

namespace sigroute {

void register_builtin_components(ComponentRegistry& registry);

/// Settings parsers, exposed for tests. All throw ConfigError.
OtlpReceiverConfig parse_otlp_receiver(const Settings& settings);
BatchSettings parse_batch_settings(const Settings& settings);
std::vector<AttributeAction> parse_attribute_actions(const Settings& settings);
LoggingExporterConfig parse_logging_exporter(const Settings& settings);
OtlpGrpcConfig parse_otlp_grpc_exporter(const Settings& settings);
OtlpHttpConfig parse_otlp_http_exporter(const Settings& settings);
PrometheusConfig parse_prometheus_exporter(const Settings& settings);
TlsSettings parse_tls(const Settings& settings);
RetrySettings parse_retry(const Settings& settings);

}  // namespace sigroute

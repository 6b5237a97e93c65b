// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file prometheus_text.hpp
/// @brief Writer for the Prometheus text exposition format (version 0.0.4)
///
/// Used by the prometheus exporter and by the self-telemetry endpoint.
///
/// Example:
/// @code
///   PrometheusTextWriter writer;
///   writer.family("http_requests_total", "counter", "Requests served");
///   writer.sample("http_requests_total", {{"code", "200"}}, 42);
///   std::string body = writer.str();
/// @endcode

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace sigroute {

using Labels = std::vector<std::pair<std::string, std::string>>;

/// Content-Type of the exposition format
constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";

/// Replace characters outside [a-zA-Z0-9_:] with '_' and prefix a leading digit
std::string sanitize_metric_name(const std::string& name);

/// Replace characters outside [a-zA-Z0-9_] with '_' and prefix a leading digit
std::string sanitize_label_name(const std::string& name);

/// Escape backslash, double quote and newline
std::string escape_label_value(const std::string& value);

/// Shortest text that parses back to the same double; +Inf, -Inf, NaN
std::string format_value(double value);

class PrometheusTextWriter {
public:
    /// Start a metric family. Writes the HELP and TYPE lines.
    void family(const std::string& name, const std::string& type, const std::string& help);

    /// Write one sample line. Names and labels are written as given, callers
    /// sanitize them.
    void sample(const std::string& name, const Labels& labels, double value);

    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
};

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file otlp_http_exporter.hpp
/// @brief OTLP/HTTP protobuf push exporter
///
/// POSTs each batch to <endpoint>/v1/traces, /v1/metrics or /v1/logs with
/// Content-Type application/x-protobuf. Status mapping:
///
/// | Response                      | Outcome                       |
/// |-------------------------------|-------------------------------|
/// | 2xx                           | success                       |
/// | 429, 502, 503, 504            | transient, Retry-After honoured |
/// | other 4xx and 5xx             | terminal                      |
/// | no response (connect, TLS)    | transient                     |

#include "sigroute/compression.hpp"
#include "sigroute/exporter.hpp"
#include "sigroute/http_client.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace sigroute {

struct OtlpHttpConfig {
    /// Base URL, e.g. "https://otlp.example.com:4318"
    std::string endpoint;
    /// Per-signal URL overriding endpoint + "/v1/<signal>"
    std::map<SignalType, std::string> signal_endpoints;
    TlsSettings tls;
    std::map<std::string, std::string> headers;
    std::chrono::milliseconds timeout{10000};
    Compression compression = Compression::None;
    std::set<SignalType> signals = {SignalType::Traces, SignalType::Metrics, SignalType::Logs};
};

/// Longest Retry-After honoured, larger values saturate
constexpr std::chrono::milliseconds kMaxRetryAfter = std::chrono::hours(1);

/// Parse a Retry-After header given in seconds
/// @return Zero if absent or not a number of seconds, at most kMaxRetryAfter
std::chrono::milliseconds parse_retry_after(const std::string& value);

class OtlpHttpExporter : public Exporter {
public:
    OtlpHttpExporter(std::string name, OtlpHttpConfig config);

    bool start() override;
    void shutdown() override;
    ExportResult export_batch(const Batch& batch) override;
    bool supports(SignalType type) const override { return config_.signals.count(type) > 0; }
    bool healthy() const override { return started_; }
    std::string name() const override { return name_; }

    /// URL the batches of a signal type are posted to
    std::string url_for(SignalType type) const;

    /// Map a response to a retry decision
    static ExportResult classify(const HttpResult& result);

private:
    std::string name_;
    OtlpHttpConfig config_;

    std::mutex start_mutex_;
    bool started_ = false;
    std::map<SignalType, HttpUrl> urls_;
    std::unique_ptr<HttpClient> client_;
};

}  // namespace sigroute

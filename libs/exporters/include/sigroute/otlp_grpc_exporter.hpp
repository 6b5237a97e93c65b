// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file otlp_grpc_exporter.hpp
/// @brief OTLP/gRPC push exporter
///
/// One channel per exporter, shared by every delivery task. Configured
/// headers are sent as call metadata (API keys, organization, stream-name,
/// dataset routing). The "jaeger" component is this exporter restricted to
/// traces.

#include "sigroute/exporter.hpp"
#include "sigroute/tls_settings.hpp"

#include <grpcpp/grpcpp.h>
#include "opentelemetry/proto/collector/logs/v1/logs_service.grpc.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.grpc.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.grpc.pb.h"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace sigroute {

struct OtlpGrpcConfig {
    /// "host:port"; an http:// prefix implies insecure, https:// implies TLS
    std::string endpoint = "localhost:4317";
    TlsSettings tls;
    std::map<std::string, std::string> headers;
    /// Deadline of one Export call
    std::chrono::milliseconds timeout{10000};
    std::set<SignalType> signals = {SignalType::Traces, SignalType::Metrics, SignalType::Logs};
};

class OtlpGrpcExporter : public Exporter {
public:
    OtlpGrpcExporter(std::string name, OtlpGrpcConfig config);

    bool start() override;
    bool wait_until_ready(std::chrono::milliseconds timeout) override;
    void shutdown() override;
    ExportResult export_batch(const Batch& batch) override;
    bool supports(SignalType type) const override { return config_.signals.count(type) > 0; }
    bool healthy() const override;
    std::string name() const override { return name_; }

    /// Map a failed call to a retry decision
    static ExportStatus classify(grpc::StatusCode code);

private:
    template <typename Stub, typename Request, typename Response>
    ExportResult call(Stub& stub, const Request& request, Response& response);

    std::string name_;
    OtlpGrpcConfig config_;

    std::mutex start_mutex_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<opentelemetry::proto::collector::trace::v1::TraceService::Stub> trace_stub_;
    std::unique_ptr<opentelemetry::proto::collector::metrics::v1::MetricsService::Stub> metrics_stub_;
    std::unique_ptr<opentelemetry::proto::collector::logs::v1::LogsService::Stub> logs_stub_;

    std::atomic<bool> was_connected_{true};
};

}  // namespace sigroute

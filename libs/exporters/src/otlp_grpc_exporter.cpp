// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/otlp_grpc_exporter.hpp"

#include "sigroute/otlp_encoder.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace sigroute {

namespace collector_trace = opentelemetry::proto::collector::trace::v1;
namespace collector_metrics = opentelemetry::proto::collector::metrics::v1;
namespace collector_logs = opentelemetry::proto::collector::logs::v1;

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

uint64_t rejected(const collector_trace::ExportTraceServiceResponse& response) {
    return response.has_partial_success() ? response.partial_success().rejected_spans() : 0;
}

uint64_t rejected(const collector_metrics::ExportMetricsServiceResponse& response) {
    return response.has_partial_success() ? response.partial_success().rejected_data_points() : 0;
}

uint64_t rejected(const collector_logs::ExportLogsServiceResponse& response) {
    return response.has_partial_success() ? response.partial_success().rejected_log_records() : 0;
}

}  // namespace

OtlpGrpcExporter::OtlpGrpcExporter(std::string name, OtlpGrpcConfig config)
    : name_(std::move(name)), config_(std::move(config)) {
    if (config_.endpoint.rfind("http://", 0) == 0) {
        config_.endpoint = config_.endpoint.substr(7);
        config_.tls.insecure = true;
    } else if (config_.endpoint.rfind("https://", 0) == 0) {
        config_.endpoint = config_.endpoint.substr(8);
        config_.tls.insecure = false;
    }
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }
}

bool OtlpGrpcExporter::start() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (channel_) {
        return true;
    }

    std::shared_ptr<grpc::ChannelCredentials> credentials;
    grpc::ChannelArguments args;
    if (config_.tls.insecure) {
        credentials = grpc::InsecureChannelCredentials();
    } else {
        grpc::SslCredentialsOptions options;
        if (!config_.tls.ca_file.empty()) {
            auto pem = read_pem_file(config_.tls.ca_file);
            if (!pem) {
                return false;
            }
            options.pem_root_certs = *pem;
        }
        if (!config_.tls.cert_file.empty() || !config_.tls.key_file.empty()) {
            auto cert = read_pem_file(config_.tls.cert_file);
            auto key = read_pem_file(config_.tls.key_file);
            if (!cert || !key) {
                return false;
            }
            options.pem_cert_chain = *cert;
            options.pem_private_key = *key;
        }
        if (!config_.tls.server_name_override.empty()) {
            args.SetSslTargetNameOverride(config_.tls.server_name_override);
        }
        credentials = grpc::SslCredentials(options);
    }

    channel_ = grpc::CreateCustomChannel(config_.endpoint, credentials, args);
    trace_stub_ = collector_trace::TraceService::NewStub(channel_);
    metrics_stub_ = collector_metrics::MetricsService::NewStub(channel_);
    logs_stub_ = collector_logs::LogsService::NewStub(channel_);

    LOG(INFO) << name_ << ": OTLP/gRPC exporter initialized, endpoint: " << config_.endpoint
              << (config_.tls.insecure ? " (insecure)" : " (TLS)");
    return true;
}

bool OtlpGrpcExporter::wait_until_ready(std::chrono::milliseconds timeout) {
    if (!channel_) {
        return false;
    }
    LOG(INFO) << name_ << ": waiting for " << config_.endpoint << "...";

    auto deadline = std::chrono::system_clock::now() + timeout;
    while (std::chrono::system_clock::now() < deadline) {
        auto state = channel_->GetState(true);
        if (state == GRPC_CHANNEL_READY) {
            LOG(INFO) << name_ << ": connected to " << config_.endpoint;
            return true;
        }
        channel_->WaitForStateChange(
            state, std::min(deadline, std::chrono::system_clock::now() + std::chrono::seconds(1)));
    }

    LOG(WARNING) << name_ << ": timeout waiting for " << config_.endpoint;
    return false;
}

void OtlpGrpcExporter::shutdown() {
    LOG(INFO) << name_ << ": shut down";
}

bool OtlpGrpcExporter::healthy() const {
    if (!channel_) {
        return false;
    }
    return channel_->GetState(false) != GRPC_CHANNEL_SHUTDOWN;
}

ExportStatus OtlpGrpcExporter::classify(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::OK:
            return ExportStatus::Success;
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::CANCELLED:
        case grpc::StatusCode::OUT_OF_RANGE:
        case grpc::StatusCode::DATA_LOSS:
            return ExportStatus::Transient;
        default:
            return ExportStatus::Terminal;
    }
}

template <typename Stub, typename Request, typename Response>
ExportResult OtlpGrpcExporter::call(Stub& stub, const Request& request, Response& response) {
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + config_.timeout);
    for (const auto& [key, value] : config_.headers) {
        // gRPC rejects upper-case metadata keys
        context.AddMetadata(lowercase(key), value);
    }

    grpc::Status status = stub.Export(&context, request, &response);
    if (status.ok()) {
        if (!was_connected_.exchange(true)) {
            LOG(INFO) << name_ << ": connected to " << config_.endpoint;
        }
        uint64_t dropped = rejected(response);
        if (dropped > 0) {
            LOG_EVERY_N(WARNING, 10) << name_ << ": endpoint rejected " << dropped
                                     << " items: " << response.partial_success().error_message();
        }
        return ExportResult::success();
    }

    std::string message = "gRPC " + std::to_string(static_cast<int>(status.error_code())) + ": " +
                          status.error_message();
    if (classify(status.error_code()) == ExportStatus::Transient) {
        // Only log on state transition
        if (was_connected_.exchange(false)) {
            LOG(WARNING) << name_ << ": lost connection to " << config_.endpoint << ": "
                         << status.error_message();
        }
        return ExportResult::transient(message);
    }
    return ExportResult::terminal(message);
}

ExportResult OtlpGrpcExporter::export_batch(const Batch& batch) {
    if (!channel_) {
        return ExportResult::transient("exporter not started");
    }
    if (!supports(batch.type)) {
        return ExportResult::terminal(std::string("signal type ") + to_string(batch.type) +
                                      " not supported");
    }

    switch (batch.type) {
        case SignalType::Traces: {
            collector_trace::ExportTraceServiceResponse response;
            return call(*trace_stub_, otlp::encode_traces(batch), response);
        }
        case SignalType::Metrics: {
            collector_metrics::ExportMetricsServiceResponse response;
            return call(*metrics_stub_, otlp::encode_metrics(batch), response);
        }
        case SignalType::Logs: {
            collector_logs::ExportLogsServiceResponse response;
            return call(*logs_stub_, otlp::encode_logs(batch), response);
        }
    }
    return ExportResult::terminal("unknown signal type");
}

}  // namespace sigroute

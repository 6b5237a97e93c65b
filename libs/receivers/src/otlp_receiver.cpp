// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/otlp_receiver.hpp"

#include "sigroute/compression.hpp"
#include "sigroute/errors.hpp"
#include "sigroute/otlp_decoder.hpp"
#include "sigroute/tls_settings.hpp"

#include "opentelemetry/proto/collector/logs/v1/logs_service.grpc.pb.h"
#include "opentelemetry/proto/collector/metrics/v1/metrics_service.grpc.pb.h"
#include "opentelemetry/proto/collector/trace/v1/trace_service.grpc.pb.h"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace sigroute {

namespace collector_trace = opentelemetry::proto::collector::trace::v1;
namespace collector_metrics = opentelemetry::proto::collector::metrics::v1;
namespace collector_logs = opentelemetry::proto::collector::logs::v1;

namespace {

std::vector<Signal> decode_request(const collector_trace::ExportTraceServiceRequest& request) {
    return otlp::decode_traces(request);
}

std::vector<Signal> decode_request(const collector_metrics::ExportMetricsServiceRequest& request) {
    return otlp::decode_metrics(request);
}

std::vector<Signal> decode_request(const collector_logs::ExportLogsServiceRequest& request) {
    return otlp::decode_logs(request);
}

/// Export RPC of one signal type
template <typename TService, typename TRequest, typename TResponse>
class ExportService final : public TService::Service {
public:
    ExportService(OtlpReceiver& receiver, SignalType type) : receiver_(receiver), type_(type) {}

    grpc::Status Export(grpc::ServerContext* /*context*/, const TRequest* request,
                        TResponse* /*response*/) override {
        auto& counters = receiver_.grpc_counters();
        counters.requests++;

        std::vector<Signal> signals;
        try {
            signals = decode_request(*request);
        } catch (const DecodeError& e) {
            counters.decode_errors++;
            LOG_EVERY_N(WARNING, 100) << receiver_.name() << ": rejected gRPC "
                                      << to_string(type_) << " request: " << e.what();
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
        }

        switch (receiver_.deliver(counters, type_, std::move(signals))) {
            case ConsumeStatus::Accepted:
                return grpc::Status::OK;
            case ConsumeStatus::Refused:
                return grpc::Status(grpc::StatusCode::UNAVAILABLE, "pipeline is not running");
            case ConsumeStatus::NoPipeline:
                break;
        }
        return grpc::Status(grpc::StatusCode::UNIMPLEMENTED,
                            std::string("no ") + to_string(type_) + " pipeline");
    }

private:
    OtlpReceiver& receiver_;
    SignalType type_;
};

using TraceExportService =
    ExportService<collector_trace::TraceService, collector_trace::ExportTraceServiceRequest,
                  collector_trace::ExportTraceServiceResponse>;
using MetricsExportService =
    ExportService<collector_metrics::MetricsService,
                  collector_metrics::ExportMetricsServiceRequest,
                  collector_metrics::ExportMetricsServiceResponse>;
using LogsExportService =
    ExportService<collector_logs::LogsService, collector_logs::ExportLogsServiceRequest,
                  collector_logs::ExportLogsServiceResponse>;

std::string empty_response(SignalType type) {
    std::string out;
    switch (type) {
        case SignalType::Traces:
            collector_trace::ExportTraceServiceResponse().SerializeToString(&out);
            break;
        case SignalType::Metrics:
            collector_metrics::ExportMetricsServiceResponse().SerializeToString(&out);
            break;
        case SignalType::Logs:
            collector_logs::ExportLogsServiceResponse().SerializeToString(&out);
            break;
    }
    return out;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

}  // namespace

OtlpReceiver::OtlpReceiver(std::string name, OtlpReceiverConfig config,
                           std::shared_ptr<SignalConsumer> consumer)
    : name_(std::move(name)), config_(std::move(config)), consumer_(std::move(consumer)) {}

OtlpReceiver::~OtlpReceiver() {
    shutdown();
}

bool OtlpReceiver::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
        return true;
    }

    if (config_.grpc && !start_grpc()) {
        return false;
    }
    if (config_.http && !start_http()) {
        if (grpc_server_) {
            grpc_server_->Shutdown();
            grpc_server_.reset();
        }
        return false;
    }

    running_ = true;
    return true;
}

bool OtlpReceiver::start_grpc() {
    const auto& cfg = *config_.grpc;

    std::shared_ptr<grpc::ServerCredentials> credentials;
    if (!cfg.cert_file.empty() || !cfg.key_file.empty()) {
        auto cert = read_pem_file(cfg.cert_file);
        auto key = read_pem_file(cfg.key_file);
        if (!cert || !key) {
            LOG(ERROR) << name_ << ": cannot load server certificate";
            return false;
        }
        grpc::SslServerCredentialsOptions options;
        options.pem_key_cert_pairs.push_back({*key, *cert});
        credentials = grpc::SslServerCredentials(options);
    } else {
        credentials = grpc::InsecureServerCredentials();
    }

    grpc_services_.clear();
    grpc_services_.push_back(std::make_unique<TraceExportService>(*this, SignalType::Traces));
    grpc_services_.push_back(std::make_unique<MetricsExportService>(*this, SignalType::Metrics));
    grpc_services_.push_back(std::make_unique<LogsExportService>(*this, SignalType::Logs));

    grpc::ServerBuilder builder;
    builder.AddListeningPort(cfg.endpoint, credentials, &grpc_port_);
    for (auto& service : grpc_services_) {
        builder.RegisterService(service.get());
    }
    builder.SetMaxReceiveMessageSize(static_cast<int>(cfg.max_recv_msg_size_mib * 1024 * 1024));

    grpc_server_ = builder.BuildAndStart();
    if (!grpc_server_ || grpc_port_ == 0) {
        LOG(ERROR) << name_ << ": cannot start gRPC server on " << cfg.endpoint;
        grpc_server_.reset();
        return false;
    }

    LOG(INFO) << name_ << ": OTLP/gRPC listening on " << cfg.endpoint << " (port " << grpc_port_
              << ")";
    return true;
}

bool OtlpReceiver::start_http() {
    const auto& cfg = *config_.http;

    HttpServer::Settings settings;
    if (!split_host_port(cfg.endpoint, settings.address, settings.port)) {
        LOG(ERROR) << name_ << ": invalid HTTP endpoint '" << cfg.endpoint << "'";
        return false;
    }
    settings.max_body_size = cfg.max_request_body_size;

    http_server_ = std::make_unique<HttpServer>(
        name_ + "/http", settings,
        [this](const HttpRequest& request) { return handle_http(request); });
    if (!http_server_->start()) {
        http_server_.reset();
        return false;
    }
    return true;
}

void OtlpReceiver::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    if (http_server_) {
        http_server_->stop();
    }
    if (grpc_server_) {
        // In-progress calls get a short grace period
        grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
        grpc_server_->Wait();
    }
    LOG(INFO) << name_ << ": stopped";
}

bool OtlpReceiver::healthy() const {
    if (!running_) {
        return false;
    }
    return !http_server_ || http_server_->running();
}

std::vector<TransportStats> OtlpReceiver::stats() const {
    std::vector<TransportStats> out;
    auto collect = [&out](const char* transport, const Counters& counters) {
        TransportStats stats;
        stats.transport = transport;
        stats.requests = counters.requests.load();
        stats.accepted_signals = counters.accepted_signals.load();
        stats.refused_signals = counters.refused_signals.load();
        stats.decode_errors = counters.decode_errors.load();
        out.push_back(stats);
    };
    if (config_.grpc) {
        collect("grpc", grpc_counters_);
    }
    if (config_.http) {
        collect("http", http_counters_);
    }
    return out;
}

ConsumeStatus OtlpReceiver::deliver(Counters& counters, SignalType type,
                                    std::vector<Signal>&& signals) {
    const size_t count = signals.size();
    if (count == 0) {
        return ConsumeStatus::Accepted;
    }

    ConsumeStatus status = consumer_->consume(type, std::move(signals));
    if (status == ConsumeStatus::Accepted) {
        counters.accepted_signals += count;
    } else {
        counters.refused_signals += count;
        LOG_EVERY_N(WARNING, 100) << name_ << ": refused " << count << " " << to_string(type)
                                  << (status == ConsumeStatus::NoPipeline
                                          ? " signals, no pipeline bound"
                                          : " signals, pipelines not running");
    }
    return status;
}

HttpResponse OtlpReceiver::handle_http(const HttpRequest& request) {
    http_counters_.requests++;

    std::string target(request.target());
    target = target.substr(0, target.find('?'));
    std::optional<SignalType> type;
    if (target == "/v1/traces") {
        type = SignalType::Traces;
    } else if (target == "/v1/metrics") {
        type = SignalType::Metrics;
    } else if (target == "/v1/logs") {
        type = SignalType::Logs;
    }
    if (!type) {
        return make_response(request, http::status::not_found, "not found\n", "text/plain");
    }
    if (request.method() != http::verb::post) {
        auto response = make_response(request, http::status::method_not_allowed,
                                      "method not allowed\n", "text/plain");
        response.set(http::field::allow, "POST");
        return response;
    }

    std::string content_type = lowercase(std::string(request[http::field::content_type]));
    if (content_type.rfind("application/x-protobuf", 0) != 0) {
        return make_response(request, http::status::unsupported_media_type,
                             "only application/x-protobuf is supported\n", "text/plain");
    }

    std::string encoding = lowercase(std::string(request[http::field::content_encoding]));
    std::string decompressed;
    const std::string* body = &request.body();
    if (!encoding.empty() && encoding != "identity") {
        auto compression = compression_from_string(encoding);
        if (!compression || *compression == Compression::None) {
            return make_response(request, http::status::unsupported_media_type,
                                 "unsupported content encoding '" + encoding + "'\n",
                                 "text/plain");
        }
        auto decompressor = create_decompressor(*compression);
        auto data = decompressor->decompress(request.body(),
                                             config_.http->max_request_body_size);
        if (!data) {
            http_counters_.decode_errors++;
            return make_response(request, http::status::bad_request,
                                 "cannot decompress request body\n", "text/plain");
        }
        decompressed = std::move(*data);
        body = &decompressed;
    }

    std::vector<Signal> signals;
    try {
        signals = otlp::decode(*type, *body);
    } catch (const DecodeError& e) {
        http_counters_.decode_errors++;
        LOG_EVERY_N(WARNING, 100) << name_ << ": rejected HTTP " << to_string(*type)
                                  << " request: " << e.what();
        return make_response(request, http::status::bad_request,
                             std::string(e.what()) + "\n", "text/plain");
    }

    switch (deliver(http_counters_, *type, std::move(signals))) {
        case ConsumeStatus::Accepted:
            return make_response(request, http::status::ok, empty_response(*type),
                                 "application/x-protobuf");
        case ConsumeStatus::Refused:
            return make_response(request, http::status::service_unavailable,
                                 "pipeline is not running\n", "text/plain");
        case ConsumeStatus::NoPipeline:
            break;
    }
    return make_response(request, http::status::not_found,
                         std::string("no ") + to_string(*type) + " pipeline\n", "text/plain");
}

}  // namespace sigroute

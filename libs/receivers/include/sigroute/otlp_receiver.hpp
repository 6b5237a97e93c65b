// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file otlp_receiver.hpp
/// @brief OTLP receiver with a gRPC and an HTTP transport
///
/// Both transports decode into the same SignalConsumer. A DecodeError only
/// fails the request it came with.
///
/// | Outcome             | gRPC status       | HTTP status |
/// |---------------------|-------------------|-------------|
/// | accepted            | OK                | 200         |
/// | malformed payload   | INVALID_ARGUMENT  | 400         |
/// | pipelines refused   | UNAVAILABLE       | 503         |
/// | no pipeline bound   | UNIMPLEMENTED     | 404         |
///
/// HTTP additionally answers 404 for unknown paths, 405 for methods other
/// than POST, 413 for bodies over the limit and 415 for payloads that are not
/// application/x-protobuf or use an encoding other than zstd.

#include "sigroute/http_server.hpp"
#include "sigroute/receiver.hpp"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sigroute {

struct OtlpGrpcReceiverConfig {
    std::string endpoint = "0.0.0.0:4317";
    size_t max_recv_msg_size_mib = 4;
    /// Server TLS when both are set
    std::string cert_file;
    std::string key_file;
};

struct OtlpHttpReceiverConfig {
    std::string endpoint = "0.0.0.0:4318";
    size_t max_request_body_size = 20 * 1024 * 1024;
};

struct OtlpReceiverConfig {
    /// A transport is enabled when present
    std::optional<OtlpGrpcReceiverConfig> grpc;
    std::optional<OtlpHttpReceiverConfig> http;
};

class OtlpReceiver : public Receiver {
public:
    OtlpReceiver(std::string name, OtlpReceiverConfig config,
                 std::shared_ptr<SignalConsumer> consumer);
    ~OtlpReceiver() override;

    OtlpReceiver(const OtlpReceiver&) = delete;
    OtlpReceiver& operator=(const OtlpReceiver&) = delete;

    bool start() override;
    void shutdown() override;
    bool healthy() const override;
    std::string name() const override { return name_; }
    std::vector<TransportStats> stats() const override;

    /// Bound ports, valid after start(); 0 if the transport is disabled
    int grpc_port() const { return grpc_port_; }
    uint16_t http_port() const { return http_server_ ? http_server_->port() : 0; }

    /// Counters of one transport
    struct Counters {
        std::atomic<uint64_t> requests{0};
        std::atomic<uint64_t> accepted_signals{0};
        std::atomic<uint64_t> refused_signals{0};
        std::atomic<uint64_t> decode_errors{0};
    };

    /// Hand decoded signals to the pipelines and count the result
    ConsumeStatus deliver(Counters& counters, SignalType type, std::vector<Signal>&& signals);

    Counters& grpc_counters() { return grpc_counters_; }

private:
    bool start_grpc();
    bool start_http();
    HttpResponse handle_http(const HttpRequest& request);

    std::string name_;
    OtlpReceiverConfig config_;
    std::shared_ptr<SignalConsumer> consumer_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};

    std::vector<std::unique_ptr<grpc::Service>> grpc_services_;
    std::unique_ptr<grpc::Server> grpc_server_;
    int grpc_port_ = 0;
    std::unique_ptr<HttpServer> http_server_;

    Counters grpc_counters_;
    Counters http_counters_;
};

}  // namespace sigroute

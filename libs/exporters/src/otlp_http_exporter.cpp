// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/otlp_http_exporter.hpp"

#include "sigroute/otlp_encoder.hpp"

#include <glog/logging.h>

#include <cctype>

namespace sigroute {

std::chrono::milliseconds parse_retry_after(const std::string& value) {
    if (value.empty()) {
        return std::chrono::milliseconds(0);
    }
    for (unsigned char c : value) {
        if (!std::isdigit(c)) {
            return std::chrono::milliseconds(0);
        }
    }
    // Saturate before converting, the value comes from the server
    const auto limit = std::chrono::duration_cast<std::chrono::seconds>(kMaxRetryAfter).count();
    size_t digits = value.find_first_not_of('0');
    if (digits == std::string::npos) {
        return std::chrono::milliseconds(0);
    }
    if (value.size() - digits > 18 || std::stoll(value.substr(digits)) > limit) {
        return kMaxRetryAfter;
    }
    return std::chrono::seconds(std::stoll(value.substr(digits)));
}

OtlpHttpExporter::OtlpHttpExporter(std::string name, OtlpHttpConfig config)
    : name_(std::move(name)), config_(std::move(config)) {
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }
}

std::string OtlpHttpExporter::url_for(SignalType type) const {
    auto it = config_.signal_endpoints.find(type);
    if (it != config_.signal_endpoints.end()) {
        return it->second;
    }
    return config_.endpoint + "/v1/" + to_string(type);
}

bool OtlpHttpExporter::start() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (started_) {
        return true;
    }

    for (SignalType type : config_.signals) {
        std::string url = url_for(type);
        auto parsed = HttpUrl::parse(url);
        if (!parsed) {
            LOG(ERROR) << name_ << ": invalid URL '" << url << "'";
            return false;
        }
        urls_[type] = *parsed;
    }

    client_ = std::make_unique<HttpClient>(config_.tls, config_.timeout);
    if (!client_->init()) {
        client_.reset();
        return false;
    }

    started_ = true;
    LOG(INFO) << name_ << ": OTLP/HTTP exporter initialized, endpoint: " << config_.endpoint
              << ", compression: " << to_string(config_.compression);
    return true;
}

void OtlpHttpExporter::shutdown() {
    LOG(INFO) << name_ << ": shut down";
}

ExportResult OtlpHttpExporter::classify(const HttpResult& result) {
    if (!result.transport_ok) {
        return ExportResult::transient("transport error: " + result.error);
    }
    if (result.status >= 200 && result.status < 300) {
        return ExportResult::success();
    }

    std::string message = "HTTP " + std::to_string(result.status);
    if (!result.body.empty() && result.body.size() < 512) {
        message += ": " + result.body;
    }
    switch (result.status) {
        case 429:
        case 502:
        case 503:
        case 504:
            return ExportResult::transient(message, parse_retry_after(result.retry_after));
        default:
            return ExportResult::terminal(message);
    }
}

ExportResult OtlpHttpExporter::export_batch(const Batch& batch) {
    if (!started_) {
        return ExportResult::transient("exporter not started");
    }
    auto url = urls_.find(batch.type);
    if (url == urls_.end()) {
        return ExportResult::terminal(std::string("signal type ") + to_string(batch.type) +
                                      " not supported");
    }

    std::string body = otlp::encode(batch);

    HttpHeaders headers;
    headers.emplace_back("Content-Type", "application/x-protobuf");
    auto compressor = create_compressor(config_.compression);
    if (compressor) {
        auto compressed = compressor->compress(body);
        if (!compressed) {
            return ExportResult::terminal("compression failed");
        }
        body = std::move(*compressed);
        headers.emplace_back("Content-Encoding", content_encoding(config_.compression));
    }
    for (const auto& header : config_.headers) {
        headers.push_back(header);
    }

    HttpResult result = client_->post(url->second, body, headers);
    ExportResult outcome = classify(result);
    if (!outcome.ok()) {
        VLOG(1) << name_ << ": POST " << url_for(batch.type) << " failed: " << outcome.message;
    }
    return outcome;
}

}  // namespace sigroute

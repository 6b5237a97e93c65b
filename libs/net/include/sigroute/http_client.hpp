// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file http_client.hpp
/// @brief Blocking HTTP/1.1 client for OTLP/HTTP push
///
/// One connection per request. TLS through OpenSSL when the URL scheme is
/// https. Every operation is bounded by the configured timeout.

#include "sigroute/tls_settings.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sigroute {

struct HttpUrl {
    bool https = false;
    std::string host;
    std::string port;
    /// Path and query, always starts with '/'
    std::string target;

    /// Parse "http[s]://host[:port][/path]"
    static std::optional<HttpUrl> parse(const std::string& url);
};

struct HttpResult {
    /// False when no response was received (connect, TLS or I/O failure)
    bool transport_ok = false;
    int status = 0;
    std::string body;
    std::string retry_after;
    std::string error;
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

class HttpClient {
public:
    HttpClient(TlsSettings tls, std::chrono::milliseconds timeout);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Prepare the TLS context (CA bundle, client certificate)
    /// @return false on unreadable certificate files
    bool init();

    /// POST a body and wait for the response
    HttpResult post(const HttpUrl& url, const std::string& body, const HttpHeaders& headers);

private:
    TlsSettings tls_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<boost::asio::ssl::context> ssl_ctx_;
};

}  // namespace sigroute

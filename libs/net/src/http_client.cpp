// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/http_client.hpp"

#include <glog/logging.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>

namespace sigroute {

namespace asio = boost::asio;
namespace ssl = asio::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

std::optional<HttpUrl> HttpUrl::parse(const std::string& url) {
    HttpUrl out;
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        out.https = true;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);
    if (authority.empty()) {
        return std::nullopt;
    }

    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            out.port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            out.port = authority.substr(colon + 1);
        }
    }

    if (out.host.empty()) {
        return std::nullopt;
    }
    if (out.port.empty()) {
        out.port = out.https ? "443" : "80";
    }
    return out;
}

HttpClient::HttpClient(TlsSettings tls, std::chrono::milliseconds timeout)
    : tls_(std::move(tls)), timeout_(timeout) {}

HttpClient::~HttpClient() = default;

bool HttpClient::init() {
    ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);

    beast::error_code ec;
    if (tls_.insecure_skip_verify) {
        ssl_ctx_->set_verify_mode(ssl::verify_none);
    } else {
        ssl_ctx_->set_verify_mode(ssl::verify_peer);
        if (!tls_.ca_file.empty()) {
            ssl_ctx_->load_verify_file(tls_.ca_file, ec);
            if (ec) {
                LOG(ERROR) << "Cannot load CA file " << tls_.ca_file << ": " << ec.message();
                return false;
            }
        } else {
            ssl_ctx_->set_default_verify_paths(ec);
            if (ec) {
                LOG(WARNING) << "No system CA store: " << ec.message();
            }
        }
    }

    if (!tls_.cert_file.empty() || !tls_.key_file.empty()) {
        ssl_ctx_->use_certificate_chain_file(tls_.cert_file, ec);
        if (!ec) {
            ssl_ctx_->use_private_key_file(tls_.key_file, ssl::context::pem, ec);
        }
        if (ec) {
            LOG(ERROR) << "Cannot load client certificate " << tls_.cert_file << ": "
                       << ec.message();
            return false;
        }
    }
    return true;
}

namespace {

template <typename Stream>
HttpResult exchange(Stream& stream, const HttpUrl& url, const std::string& body,
                    const HttpHeaders& headers) {
    http::request<http::string_body> request{http::verb::post, url.target, 11};
    request.set(http::field::host, url.host);
    request.set(http::field::user_agent, "sigroute/" BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : headers) {
        request.set(name, value);
    }
    request.body() = body;
    request.prepare_payload();

    http::write(stream, request);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(stream, buffer, response);

    HttpResult result;
    result.transport_ok = true;
    result.status = static_cast<int>(response.result_int());
    result.body = std::move(response.body());
    auto it = response.find(http::field::retry_after);
    if (it != response.end()) {
        result.retry_after = std::string(it->value());
    }
    return result;
}

}  // namespace

HttpResult HttpClient::post(const HttpUrl& url, const std::string& body,
                            const HttpHeaders& headers) {
    HttpResult result;
    if (url.https && !ssl_ctx_) {
        result.error = "TLS context not initialised";
        return result;
    }

    asio::io_context ioc;
    try {
        tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(url.host, url.port);

        if (!url.https) {
            beast::tcp_stream stream(ioc);
            stream.expires_after(timeout_);
            stream.connect(endpoints);
            stream.expires_after(timeout_);
            result = exchange(stream, url, body, headers);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            return result;
        }

        beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_ctx_);
        const std::string& server_name =
            tls_.server_name_override.empty() ? url.host : tls_.server_name_override;
        if (!SSL_set_tlsext_host_name(stream.native_handle(), server_name.c_str())) {
            result.error = "SNI setup failed";
            return result;
        }
        if (!tls_.insecure_skip_verify) {
            stream.set_verify_callback(ssl::host_name_verification(server_name));
        }

        beast::get_lowest_layer(stream).expires_after(timeout_);
        beast::get_lowest_layer(stream).connect(endpoints);
        stream.handshake(ssl::stream_base::client);
        result = exchange(stream, url, body, headers);

        // Servers often drop the connection without close_notify
        beast::error_code ec;
        stream.shutdown(ec);
        return result;
    } catch (const beast::system_error& e) {
        result.transport_ok = false;
        result.error = e.code().message();
        return result;
    }
}

}  // namespace sigroute

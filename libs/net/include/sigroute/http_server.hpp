// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file http_server.hpp
/// @brief Small asynchronous HTTP/1.1 server on Boost.Beast
///
/// Serves the OTLP/HTTP receiver, the Prometheus scrape endpoint and the
/// self-telemetry endpoint. Requests are read on an io_context run by a
/// fixed number of threads; the handler runs on those threads and may block.
///
/// Example:
/// @code
///   HttpServer::Settings settings;
///   settings.port = 8889;
///   HttpServer server("prometheus", settings, [](const HttpRequest& req) {
///       return make_response(req, http::status::ok, "up 1\n", "text/plain");
///   });
///   if (!server.start()) { ... }
/// @endcode

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace sigroute {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;
using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

/// Build a response matching the request's HTTP version
HttpResponse make_response(const HttpRequest& request, http::status status,
                           std::string body, const std::string& content_type);

/// Split "host:port" into its parts. Accepts ":port" for all interfaces.
/// @return false if the port is missing or not a number
bool split_host_port(const std::string& endpoint, std::string& host, uint16_t& port);

class HttpServer {
public:
    struct Settings {
        std::string address = "0.0.0.0";
        /// 0 picks an ephemeral port, see port()
        uint16_t port = 0;
        size_t max_body_size = 20 * 1024 * 1024;
        size_t threads = 2;
        std::chrono::seconds read_timeout{30};
    };

    HttpServer(std::string name, Settings settings, HttpHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start the io threads
    /// @return false if the address cannot be bound
    bool start();

    /// Stop accepting and join the io threads. Idempotent.
    void stop();

    bool running() const { return running_.load(); }

    /// Port actually bound, valid after start()
    uint16_t port() const { return bound_port_; }

    const std::string& name() const { return name_; }

private:
    void do_accept();

    std::string name_;
    Settings settings_;
    std::shared_ptr<const HttpHandler> handler_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    uint16_t bound_port_ = 0;
};

}  // namespace sigroute

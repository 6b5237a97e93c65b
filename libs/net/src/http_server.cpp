// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/http_server.hpp"

#include <glog/logging.h>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include <array>
#include <optional>

namespace sigroute {

namespace asio = boost::asio;
namespace beast = boost::beast;
using tcp = asio::ip::tcp;

namespace {

/// One keep-alive connection. Owns itself through shared_from_this while an
/// operation is pending.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, std::shared_ptr<const HttpHandler> handler,
            size_t max_body_size, std::chrono::seconds read_timeout)
        : stream_(std::move(socket)),
          handler_(std::move(handler)),
          max_body_size_(max_body_size),
          read_timeout_(read_timeout) {}

    void run() {
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(max_body_size_);
        stream_.expires_after(read_timeout_);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, size_t /*bytes*/) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }

        if (ec == http::error::body_limit) {
            HttpRequest head(parser_->get().method(), parser_->get().target(),
                             parser_->get().version());
            response_ = make_response(head, http::status::payload_too_large,
                                      "request body too large\n", "text/plain");
            response_.keep_alive(false);
            do_write();
            return;
        }

        if (ec) {
            VLOG(1) << "HTTP read failed: " << ec.message();
            return;
        }

        HttpRequest request = parser_->release();
        try {
            response_ = (*handler_)(request);
        } catch (const std::exception& e) {
            LOG(ERROR) << "HTTP handler failed for " << request.target() << ": " << e.what();
            response_ = make_response(request, http::status::internal_server_error,
                                      "internal error\n", "text/plain");
        }
        response_.keep_alive(request.keep_alive());
        response_.prepare_payload();
        do_write();
    }

    void do_write() {
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&Session::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, size_t /*bytes*/) {
        if (ec) {
            VLOG(1) << "HTTP write failed: " << ec.message();
            return;
        }
        if (!response_.keep_alive()) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);

        // Lingering close: consume what the peer still sends so the response
        // is not reset by unread data.
        stream_.expires_after(std::chrono::seconds(1));
        do_drain();
    }

    void do_drain() {
        stream_.async_read_some(asio::buffer(drain_),
                                [self = shared_from_this()](beast::error_code ec, size_t) {
                                    if (!ec) {
                                        self->do_drain();
                                    }
                                });
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    HttpResponse response_;
    std::array<char, 4096> drain_;
    std::shared_ptr<const HttpHandler> handler_;
    size_t max_body_size_;
    std::chrono::seconds read_timeout_;
};

}  // namespace

HttpResponse make_response(const HttpRequest& request, http::status status,
                           std::string body, const std::string& content_type) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, "sigroute");
    if (!content_type.empty()) {
        response.set(http::field::content_type, content_type);
    }
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

bool split_host_port(const std::string& endpoint, std::string& host, uint16_t& port) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon + 1 == endpoint.size()) {
        return false;
    }

    unsigned long value = 0;
    try {
        size_t used = 0;
        value = std::stoul(endpoint.substr(colon + 1), &used);
        if (used != endpoint.size() - colon - 1 || value > 65535) {
            return false;
        }
    } catch (const std::exception&) {
        return false;
    }

    host = endpoint.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        host = "0.0.0.0";
    }
    port = static_cast<uint16_t>(value);
    return true;
}

HttpServer::HttpServer(std::string name, Settings settings, HttpHandler handler)
    : name_(std::move(name)),
      settings_(std::move(settings)),
      handler_(std::make_shared<const HttpHandler>(std::move(handler))),
      acceptor_(asio::make_strand(ioc_)) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_) {
        return true;
    }

    beast::error_code ec;
    auto address = asio::ip::make_address(settings_.address, ec);
    if (ec) {
        LOG(ERROR) << name_ << ": invalid listen address '" << settings_.address << "'";
        return false;
    }
    tcp::endpoint endpoint{address, settings_.port};

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG(ERROR) << name_ << ": cannot listen on " << settings_.address << ":"
                   << settings_.port << ": " << ec.message();
        acceptor_.close(ec);
        return false;
    }
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    do_accept();

    size_t threads = settings_.threads > 0 ? settings_.threads : 1;
    for (size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { ioc_.run(); });
    }

    LOG(INFO) << name_ << ": listening on " << settings_.address << ":" << bound_port_;
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::dispatch(acceptor_.get_executor(), [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });
    ioc_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LOG(INFO) << name_ << ": stopped";
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        asio::make_strand(ioc_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    LOG_EVERY_N(WARNING, 100) << name_ << ": accept failed: " << ec.message();
                }
            } else {
                std::make_shared<Session>(std::move(socket), handler_,
                                          settings_.max_body_size,
                                          settings_.read_timeout)->run();
            }
            if (running_ && acceptor_.is_open()) {
                do_accept();
            }
        });
}

}  // namespace sigroute

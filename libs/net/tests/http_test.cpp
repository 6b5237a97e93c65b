// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/http_client.hpp"
#include "sigroute/http_server.hpp"

#include <gtest/gtest.h>

#include <atomic>

namespace sigroute::test {

TEST(HttpUrlTest, ParsesSchemeHostPortAndPath) {
    auto url = HttpUrl::parse("https://api.honeycomb.io:8443/v1/traces");
    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->https);
    EXPECT_EQ(url->host, "api.honeycomb.io");
    EXPECT_EQ(url->port, "8443");
    EXPECT_EQ(url->target, "/v1/traces");
}

TEST(HttpUrlTest, DefaultsPortAndTarget) {
    auto plain = HttpUrl::parse("http://collector");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->port, "80");
    EXPECT_EQ(plain->target, "/");

    auto secure = HttpUrl::parse("https://collector/api");
    ASSERT_TRUE(secure.has_value());
    EXPECT_EQ(secure->port, "443");
}

TEST(HttpUrlTest, ParsesBracketedIpv6) {
    auto url = HttpUrl::parse("http://[::1]:4318/v1/logs");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->host, "::1");
    EXPECT_EQ(url->port, "4318");
}

TEST(HttpUrlTest, RejectsInvalid) {
    EXPECT_FALSE(HttpUrl::parse("collector:4318").has_value());
    EXPECT_FALSE(HttpUrl::parse("ftp://collector").has_value());
    EXPECT_FALSE(HttpUrl::parse("http://").has_value());
}

TEST(SplitHostPortTest, Variants) {
    std::string host;
    uint16_t port = 0;

    ASSERT_TRUE(split_host_port("0.0.0.0:4318", host, port));
    EXPECT_EQ(host, "0.0.0.0");
    EXPECT_EQ(port, 4318);

    ASSERT_TRUE(split_host_port(":8889", host, port));
    EXPECT_EQ(host, "0.0.0.0");
    EXPECT_EQ(port, 8889);

    EXPECT_FALSE(split_host_port("localhost", host, port));
    EXPECT_FALSE(split_host_port("localhost:http", host, port));
    EXPECT_FALSE(split_host_port("localhost:70000", host, port));
}

class HttpLoopbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        HttpServer::Settings settings;
        settings.address = "127.0.0.1";
        settings.port = 0;
        settings.max_body_size = 1024;

        server_ = std::make_unique<HttpServer>("test", settings, [this](const HttpRequest& req) {
            ++requests_;
            if (req.target() == "/boom") {
                throw std::runtime_error("boom");
            }
            if (req.target() == "/busy") {
                auto response = make_response(req, http::status::service_unavailable, "", "");
                response.set(http::field::retry_after, "7");
                return response;
            }
            return make_response(req, http::status::ok, "echo:" + req.body(), "text/plain");
        });
        ASSERT_TRUE(server_->start());

        client_ = std::make_unique<HttpClient>(TlsSettings{}, std::chrono::milliseconds(2000));
        ASSERT_TRUE(client_->init());
    }

    void TearDown() override {
        server_->stop();
    }

    HttpUrl url(const std::string& path) {
        return *HttpUrl::parse("http://127.0.0.1:" + std::to_string(server_->port()) + path);
    }

    std::unique_ptr<HttpServer> server_;
    std::unique_ptr<HttpClient> client_;
    std::atomic<int> requests_{0};
};

TEST_F(HttpLoopbackTest, PostReachesHandler) {
    auto result = client_->post(url("/v1/traces"), "payload", {{"X-Test", "1"}});
    ASSERT_TRUE(result.transport_ok) << result.error;
    EXPECT_EQ(result.status, 200);
    EXPECT_EQ(result.body, "echo:payload");
    EXPECT_EQ(requests_.load(), 1);
}

TEST_F(HttpLoopbackTest, RetryAfterIsReported) {
    auto result = client_->post(url("/busy"), "", {});
    ASSERT_TRUE(result.transport_ok);
    EXPECT_EQ(result.status, 503);
    EXPECT_EQ(result.retry_after, "7");
}

TEST_F(HttpLoopbackTest, OversizedBodyIs413) {
    auto result = client_->post(url("/v1/traces"), std::string(4096, 'x'), {});
    ASSERT_TRUE(result.transport_ok) << result.error;
    EXPECT_EQ(result.status, 413);
    EXPECT_EQ(requests_.load(), 0);
}

TEST_F(HttpLoopbackTest, HandlerExceptionIs500AndServerSurvives) {
    auto failed = client_->post(url("/boom"), "", {});
    ASSERT_TRUE(failed.transport_ok);
    EXPECT_EQ(failed.status, 500);

    auto ok = client_->post(url("/v1/logs"), "again", {});
    ASSERT_TRUE(ok.transport_ok);
    EXPECT_EQ(ok.status, 200);
}

TEST_F(HttpLoopbackTest, ClosedPortIsTransportFailure) {
    auto result = client_->post(*HttpUrl::parse("http://127.0.0.1:1/v1/traces"), "", {});
    EXPECT_FALSE(result.transport_ok);
    EXPECT_FALSE(result.error.empty());
}

TEST(HttpServerTest, StopIsIdempotent) {
    HttpServer::Settings settings;
    settings.address = "127.0.0.1";
    HttpServer server("idle", settings, [](const HttpRequest& req) {
        return make_response(req, http::status::ok, "", "");
    });
    ASSERT_TRUE(server.start());
    EXPECT_TRUE(server.running());
    EXPECT_GT(server.port(), 0);
    server.stop();
    server.stop();
    EXPECT_FALSE(server.running());
}

TEST(HttpServerTest, InvalidAddressFailsToStart) {
    HttpServer::Settings settings;
    settings.address = "not-an-address";
    HttpServer server("bad", settings, [](const HttpRequest& req) {
        return make_response(req, http::status::ok, "", "");
    });
    EXPECT_FALSE(server.start());
}

}  // namespace sigroute::test

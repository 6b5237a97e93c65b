// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/batch.hpp"
#include "sigroute/cancellation.hpp"
#include "sigroute/errors.hpp"
#include "sigroute/signal.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace sigroute::test {

TEST(SignalTest, TypeNames) {
    for (auto type : {SignalType::Traces, SignalType::Metrics, SignalType::Logs}) {
        EXPECT_EQ(signal_type_from_string(to_string(type)), type);
    }
    EXPECT_FALSE(signal_type_from_string("profiles").has_value());
    EXPECT_FALSE(signal_type_from_string("Traces").has_value());
}

TEST(SignalTest, MakeSignalSetsTypeAndSharedResource) {
    auto resource = std::make_shared<Resource>();
    resource->attributes["service.name"] = std::string("checkout");

    MetricPoint point;
    point.name = "http.server.duration";
    point.attributes["route"] = std::string("/cart");
    Signal metric = make_signal(point, 42, resource);
    Signal copy = metric;

    EXPECT_EQ(metric.type, SignalType::Metrics);
    EXPECT_EQ(metric.timestamp_ns, 42u);
    EXPECT_EQ(metric.metric().name, "http.server.duration");
    EXPECT_EQ(metric.resource->service_name(), "checkout");
    EXPECT_EQ(copy.resource.get(), metric.resource.get());

    copy.mutable_attributes()["route"] = std::string("/pay");
    EXPECT_EQ(attribute_to_string(metric.attributes().at("route")), "/cart");

    LogRecord record;
    record.body = "disk full";
    EXPECT_EQ(make_signal(record, 1).log().body, "disk full");
    EXPECT_EQ(make_signal(record, 1).type, SignalType::Logs);
}

TEST(SignalTest, AttributeRendering) {
    EXPECT_EQ(attribute_to_string(std::string("text")), "text");
    EXPECT_EQ(attribute_to_string(true), "true");
    EXPECT_EQ(attribute_to_string(int64_t{-7}), "-7");
    EXPECT_EQ(attribute_to_string(0.5), "0.5");
    EXPECT_TRUE(Resource().service_name().empty());
}

TEST(SignalTest, HexIds) {
    EXPECT_EQ(to_hex(std::string("\x00\x01\xab\xff", 4)), "0001abff");
    EXPECT_EQ(to_hex(""), "");
}

TEST(SignalTest, BatchBasics) {
    Batch batch;
    EXPECT_TRUE(batch.empty());
    batch.signals.push_back(make_signal(Span{}, 1));
    EXPECT_EQ(batch.size(), 1u);
    EXPECT_STREQ(to_string(FlushReason::Timeout), "timeout");
}

TEST(SignalTest, ErrorKinds) {
    DecodeError decode("bad span id");
    ConfigError config("bad config");
    EXPECT_EQ(decode.kind(), ErrorKind::Decode);
    EXPECT_EQ(config.kind(), ErrorKind::Config);
    EXPECT_STREQ(to_string(ErrorKind::DrainTimeout), "drain_timeout_error");

    const Error& base = decode;
    EXPECT_STREQ(base.what(), "bad span id");
}

TEST(CancellationTokenTest, SleepIsInterruptedByCancel) {
    CancellationToken token;
    EXPECT_TRUE(token.sleep_for(std::chrono::milliseconds(1)));

    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.sleep_for(std::chrono::seconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    canceller.join();

    EXPECT_TRUE(token.cancelled());
    EXPECT_FALSE(token.sleep_for(std::chrono::milliseconds(1)));
}

}  // namespace sigroute::test

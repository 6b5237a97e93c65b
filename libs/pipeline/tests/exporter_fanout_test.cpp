// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/exporter_fanout.hpp"

#include "fake_components.hpp"

#include <gtest/gtest.h>

#include <thread>

namespace sigroute::test {

using std::chrono::milliseconds;

namespace {

RetrySettings fast_retry(size_t max_attempts) {
    RetrySettings retry;
    retry.initial_interval = milliseconds(1);
    retry.max_interval = milliseconds(5);
    retry.randomization_factor = 0.0;
    retry.max_attempts = max_attempts;
    return retry;
}

ExporterBinding make_binding(std::shared_ptr<Exporter> exporter,
                             RetrySettings retry = fast_retry(3), size_t consumers = 1) {
    ExporterBinding binding;
    binding.exporter = std::move(exporter);
    binding.retry = retry;
    binding.num_consumers = consumers;
    return binding;
}

std::shared_ptr<const Batch> make_batch(uint64_t sequence, size_t signals = 5) {
    auto batch = std::make_shared<Batch>();
    batch->type = SignalType::Traces;
    batch->sequence = sequence;
    batch->signals = make_test_spans(signals);
    return batch;
}

}  // namespace

TEST(ExporterFanoutTest, SlowExporterDoesNotDelaySibling) {
    auto slow = std::make_shared<FakeExporter>("slow", [](const Batch&) {
        std::this_thread::sleep_for(milliseconds(300));
        return ExportResult::success();
    });
    auto fast = std::make_shared<FakeExporter>("fast");

    OutcomeCollector collector;
    ExporterFanout fanout("traces", {make_binding(slow), make_binding(fast)},
                          DeliveryPolicy::AtLeastOne);

    auto started = std::chrono::steady_clock::now();
    for (uint64_t i = 0; i < 3; ++i) {
        fanout.dispatch(make_batch(i), std::ref(collector));
    }

    // The fast exporter finishes all three while the slow one is still on the first
    while (fast->batches().size() < 3 &&
           std::chrono::steady_clock::now() - started < std::chrono::seconds(2)) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    EXPECT_EQ(fast->batches().size(), 3u);
    EXPECT_LT(slow->batches().size(), 3u);

    ASSERT_TRUE(collector.wait_for(3));
    for (const auto& outcome : collector.outcomes()) {
        EXPECT_TRUE(outcome.delivered);
    }
    fanout.join();
}

TEST(ExporterFanoutTest, TransientFailuresAreRetried) {
    std::atomic<int> calls{0};
    auto flaky = std::make_shared<FakeExporter>("flaky", [&calls](const Batch&) {
        return ++calls < 3 ? ExportResult::transient("unavailable") : ExportResult::success();
    });

    OutcomeCollector collector;
    ExporterFanout fanout("traces", {make_binding(flaky, fast_retry(5))},
                          DeliveryPolicy::AtLeastOne);
    fanout.dispatch(make_batch(0), std::ref(collector));
    ASSERT_TRUE(collector.wait_for(1));

    auto outcome = collector.outcomes()[0];
    EXPECT_TRUE(outcome.delivered);
    EXPECT_TRUE(outcome.exporters[0].ok());
    EXPECT_EQ(outcome.exporters[0].attempts, 3u);

    fanout.join();
    auto stats = fanout.stats();
    EXPECT_EQ(stats[0].retries, 2u);
    EXPECT_EQ(stats[0].batches_sent, 1u);
    EXPECT_EQ(stats[0].signals_sent, 5u);
}

TEST(ExporterFanoutTest, TerminalFailureIsNotRetried) {
    auto rejecting = std::make_shared<FakeExporter>("rejecting", [](const Batch&) {
        return ExportResult::terminal("unauthenticated");
    });

    OutcomeCollector collector;
    ExporterFanout fanout("logs", {make_binding(rejecting)}, DeliveryPolicy::AtLeastOne);
    fanout.dispatch(make_batch(0), std::ref(collector));
    ASSERT_TRUE(collector.wait_for(1));

    auto outcome = collector.outcomes()[0];
    EXPECT_FALSE(outcome.delivered);
    EXPECT_EQ(outcome.exporters[0].error, ErrorKind::ExportTerminal);
    EXPECT_EQ(outcome.exporters[0].attempts, 1u);
    EXPECT_EQ(rejecting->attempts.load(), 1);
}

TEST(ExporterFanoutTest, ExhaustedRetryBudgetIsTerminal) {
    auto down = std::make_shared<FakeExporter>("down", [](const Batch&) {
        return ExportResult::transient("connection refused");
    });

    OutcomeCollector collector;
    ExporterFanout fanout("traces", {make_binding(down, fast_retry(3))},
                          DeliveryPolicy::AtLeastOne);
    fanout.dispatch(make_batch(0), std::ref(collector));
    ASSERT_TRUE(collector.wait_for(1));

    auto outcome = collector.outcomes()[0];
    EXPECT_EQ(outcome.exporters[0].error, ErrorKind::ExportTerminal);
    EXPECT_EQ(outcome.exporters[0].attempts, 3u);
    EXPECT_NE(outcome.exporters[0].message.find("retry budget exhausted"), std::string::npos);
    EXPECT_EQ(down->attempts.load(), 3);
}

TEST(ExporterFanoutTest, ThrowingExporterIsTerminal) {
    auto broken = std::make_shared<FakeExporter>("broken", [](const Batch&) -> ExportResult {
        throw std::runtime_error("serializer exploded");
    });

    OutcomeCollector collector;
    ExporterFanout fanout("traces", {make_binding(broken)}, DeliveryPolicy::AtLeastOne);
    fanout.dispatch(make_batch(0), std::ref(collector));
    ASSERT_TRUE(collector.wait_for(1));
    EXPECT_EQ(collector.outcomes()[0].exporters[0].error, ErrorKind::ExportTerminal);
}

TEST(ExporterFanoutTest, CancelInterruptsBackoff) {
    auto down = std::make_shared<FakeExporter>("down", [](const Batch&) {
        return ExportResult::transient("unavailable");
    });
    RetrySettings slow_retry;
    slow_retry.initial_interval = std::chrono::seconds(30);
    slow_retry.randomization_factor = 0.0;

    OutcomeCollector collector;
    ExporterFanout fanout("traces", {make_binding(down, slow_retry)},
                          DeliveryPolicy::AtLeastOne);
    fanout.dispatch(make_batch(0), std::ref(collector));

    while (down->attempts.load() == 0) {
        std::this_thread::sleep_for(milliseconds(1));
    }
    auto cancelled_at = std::chrono::steady_clock::now();
    fanout.cancel();
    ASSERT_TRUE(collector.wait_for(1, std::chrono::seconds(2)));
    EXPECT_LT(std::chrono::steady_clock::now() - cancelled_at, std::chrono::seconds(2));

    auto outcome = collector.outcomes()[0];
    EXPECT_EQ(outcome.exporters[0].error, ErrorKind::DrainTimeout);
    fanout.join();
    EXPECT_EQ(fanout.stats()[0].drain_timeouts, 1u);
}

}  // namespace sigroute::test

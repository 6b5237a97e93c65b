// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/delivery_tracker.hpp"

#include <gtest/gtest.h>

namespace sigroute::test {

namespace {

ExportOutcome success() {
    return ExportOutcome{};
}

ExportOutcome failure(ErrorKind kind) {
    ExportOutcome outcome;
    outcome.error = kind;
    outcome.message = "failed";
    return outcome;
}

}  // namespace

class DeliveryTrackerTest : public ::testing::Test {
protected:
    std::unique_ptr<DeliveryTracker> make(DeliveryPolicy policy, size_t exporters = 2) {
        std::vector<std::string> names;
        for (size_t i = 0; i < exporters; ++i) {
            names.push_back("exporter" + std::to_string(i));
        }
        return std::make_unique<DeliveryTracker>(11, 5, names, policy,
                                                 [this](const BatchOutcome& outcome) {
                                                     completions_++;
                                                     last_ = outcome;
                                                 });
    }

    int completions_ = 0;
    BatchOutcome last_;
};

TEST_F(DeliveryTrackerTest, AtLeastOneDeliveredWhenAnySucceeds) {
    auto tracker = make(DeliveryPolicy::AtLeastOne);
    EXPECT_TRUE(tracker->report(0, success()));
    EXPECT_EQ(completions_, 0);
    EXPECT_TRUE(tracker->report(1, failure(ErrorKind::ExportTerminal)));

    EXPECT_EQ(completions_, 1);
    EXPECT_TRUE(last_.delivered);
    EXPECT_EQ(last_.sequence, 11u);
    EXPECT_EQ(last_.signals, 5u);
    ASSERT_EQ(last_.exporters.size(), 2u);
    EXPECT_EQ(last_.exporters[0].exporter, "exporter0");
    EXPECT_EQ(last_.exporters[1].error, ErrorKind::ExportTerminal);
}

TEST_F(DeliveryTrackerTest, AtLeastOneFailsWhenAllFail) {
    auto tracker = make(DeliveryPolicy::AtLeastOne);
    tracker->report(0, failure(ErrorKind::ExportTerminal));
    tracker->report(1, failure(ErrorKind::ExportTerminal));
    EXPECT_EQ(completions_, 1);
    EXPECT_FALSE(last_.delivered);
}

TEST_F(DeliveryTrackerTest, AllRequiredFailsWhenAnyFails) {
    auto tracker = make(DeliveryPolicy::AllRequired);
    tracker->report(0, success());
    tracker->report(1, failure(ErrorKind::ExportTerminal));
    EXPECT_FALSE(last_.delivered);

    auto all_ok = make(DeliveryPolicy::AllRequired);
    all_ok->report(0, success());
    all_ok->report(1, success());
    EXPECT_TRUE(last_.delivered);
}

TEST_F(DeliveryTrackerTest, FirstReportWins) {
    auto tracker = make(DeliveryPolicy::AtLeastOne);
    EXPECT_TRUE(tracker->report(0, failure(ErrorKind::ExportTerminal)));
    EXPECT_FALSE(tracker->report(0, success()));
    EXPECT_FALSE(tracker->report(5, success()));
    EXPECT_FALSE(tracker->complete());
}

TEST_F(DeliveryTrackerTest, AbandonMarksMissingAsDrainTimeout) {
    auto tracker = make(DeliveryPolicy::AtLeastOne, 3);
    tracker->report(1, success());
    tracker->abandon();

    EXPECT_TRUE(tracker->complete());
    EXPECT_EQ(completions_, 1);
    EXPECT_TRUE(last_.delivered);
    EXPECT_EQ(last_.exporters[0].error, ErrorKind::DrainTimeout);
    EXPECT_TRUE(last_.exporters[1].ok());
    EXPECT_EQ(last_.exporters[2].error, ErrorKind::DrainTimeout);

    // Late reports and repeated abandon are ignored
    EXPECT_FALSE(tracker->report(0, success()));
    tracker->abandon();
    EXPECT_EQ(completions_, 1);
}

TEST_F(DeliveryTrackerTest, NoExportersCompletesImmediatelyUndelivered) {
    auto tracker = make(DeliveryPolicy::AtLeastOne, 0);
    EXPECT_TRUE(tracker->complete());
    EXPECT_EQ(completions_, 1);
    EXPECT_FALSE(last_.delivered);
}

TEST(DeliveryPolicyTest, Names) {
    EXPECT_STREQ(to_string(DeliveryPolicy::AtLeastOne), "at_least_one");
    EXPECT_EQ(delivery_policy_from_string("all_required"), DeliveryPolicy::AllRequired);
    EXPECT_FALSE(delivery_policy_from_string("majority").has_value());
}

}  // namespace sigroute::test

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file delivery_tracker.hpp
/// @brief Per-batch aggregation of exporter outcomes
///
/// Every exporter task of a batch reports exactly one outcome into the
/// batch's tracker. Once all exporters have reported (or the tracker is
/// abandoned at the drain deadline) the batch verdict is computed under the
/// delivery policy and the completion callback runs once.

#include "sigroute/errors.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sigroute {

enum class DeliveryPolicy {
    AtLeastOne,   ///< Delivered if any exporter succeeds
    AllRequired   ///< Delivered only if every exporter succeeds
};

/// @return "at_least_one" or "all_required"
const char* to_string(DeliveryPolicy policy);

/// Parse "at_least_one" / "all_required"
std::optional<DeliveryPolicy> delivery_policy_from_string(const std::string& name);

/// Final outcome of one exporter for one batch
struct ExportOutcome {
    std::string exporter;
    ErrorKind error = ErrorKind::None;
    std::string message;
    size_t attempts = 0;
    std::chrono::milliseconds latency{0};

    bool ok() const { return error == ErrorKind::None; }
};

/// Verdict for a whole batch
struct BatchOutcome {
    uint64_t sequence = 0;
    size_t signals = 0;
    bool delivered = false;
    std::vector<ExportOutcome> exporters;
};

class DeliveryTracker {
public:
    using Completion = std::function<void(const BatchOutcome&)>;

    DeliveryTracker(uint64_t sequence, size_t signals, std::vector<std::string> exporters,
                    DeliveryPolicy policy, Completion completion);

    DeliveryTracker(const DeliveryTracker&) = delete;
    DeliveryTracker& operator=(const DeliveryTracker&) = delete;

    /// Report the outcome of exporter at index. Only the first report per
    /// exporter counts.
    /// @return true if the report was recorded
    bool report(size_t index, ExportOutcome outcome);

    /// Mark every exporter that has not reported as DrainTimeout
    void abandon();

    bool complete() const;

    uint64_t sequence() const { return outcome_.sequence; }

private:
    /// Evaluate the verdict and run the completion. Requires mutex_ held,
    /// releases it before the callback.
    void finish(std::unique_lock<std::mutex>& lock);

    DeliveryPolicy policy_;
    Completion completion_;

    mutable std::mutex mutex_;
    BatchOutcome outcome_;
    std::vector<bool> reported_;
    size_t pending_;
    bool complete_ = false;
};

}  // namespace sigroute

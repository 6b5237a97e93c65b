// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file retry_policy.hpp
/// @brief Bounded exponential backoff for export retries

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace sigroute {

/// retry_on_failure settings of an exporter
struct RetrySettings {
    bool enabled = true;
    std::chrono::milliseconds initial_interval{5000};
    double multiplier = 1.5;
    /// Each interval is scaled by a random factor in [1 - r, 1 + r]
    double randomization_factor = 0.5;
    std::chrono::milliseconds max_interval{30000};
    /// Total attempts including the first one, 0 for no limit
    size_t max_attempts = 0;
    /// Give up once this much time has passed since the first attempt, 0 for no limit
    std::chrono::milliseconds max_elapsed_time{300000};
};

/// Backoff state of one delivery. Not thread-safe, each delivery task owns one.
class Backoff {
public:
    using Clock = std::chrono::steady_clock;

    explicit Backoff(const RetrySettings& settings, uint64_t seed = std::random_device{}());

    /// Record a failed attempt and compute the delay before the next one.
    /// @param retry_after Server-requested minimum delay, zero if none
    /// @return nullopt when the attempt or elapsed-time budget is exhausted
    std::optional<std::chrono::milliseconds> next(
        std::chrono::milliseconds retry_after = std::chrono::milliseconds(0));

    /// Attempts recorded so far
    size_t attempts() const { return attempts_; }

private:
    RetrySettings settings_;
    std::mt19937_64 rng_;
    std::chrono::milliseconds current_;
    size_t attempts_ = 0;
    Clock::time_point started_;
};

}  // namespace sigroute

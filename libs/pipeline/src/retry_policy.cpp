// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/retry_policy.hpp"

#include <algorithm>

namespace sigroute {

Backoff::Backoff(const RetrySettings& settings, uint64_t seed)
    : settings_(settings),
      rng_(seed),
      current_(settings.initial_interval),
      started_(Clock::now()) {}

std::optional<std::chrono::milliseconds> Backoff::next(std::chrono::milliseconds retry_after) {
    ++attempts_;

    if (!settings_.enabled) {
        return std::nullopt;
    }
    if (settings_.max_attempts > 0 && attempts_ >= settings_.max_attempts) {
        return std::nullopt;
    }

    double factor = 1.0;
    double r = std::clamp(settings_.randomization_factor, 0.0, 1.0);
    if (r > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - r, 1.0 + r);
        factor = dist(rng_);
    }
    auto delay = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(current_.count()) * factor));
    // A server hint may lengthen the wait, up to the elapsed-time limit or
    // max_interval when there is none
    const auto hint_limit = settings_.max_elapsed_time.count() > 0
                                ? std::max(settings_.max_elapsed_time, settings_.max_interval)
                                : settings_.max_interval;
    delay = std::max(delay, std::min(retry_after, hint_limit));

    auto grown = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(current_.count()) * settings_.multiplier));
    current_ = std::min(grown, settings_.max_interval);

    if (settings_.max_elapsed_time.count() > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
        if (elapsed + delay > settings_.max_elapsed_time) {
            return std::nullopt;
        }
    }
    return delay;
}

}  // namespace sigroute

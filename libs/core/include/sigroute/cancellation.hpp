// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file cancellation.hpp
/// @brief Cooperative cancellation flag with interruptible sleep

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace sigroute {

/// Shared by everything that must stop waiting once a drain deadline passes.
/// Cancellation is one-way.
class CancellationToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const { return cancelled_; }

    /// Sleep for the given duration unless cancelled first.
    /// @return false if the token was cancelled
    template <typename Rep, typename Period>
    bool sleep_for(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch.hpp
/// @brief Ordered group of same-type signals flushed together

#include "sigroute/signal.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace sigroute {

/// Why a batch was cut
enum class FlushReason {
    Size,         ///< send_batch_size reached
    Timeout,      ///< Oldest item waited longer than the batch timeout
    Forced,       ///< Explicit flush() call
    Shutdown,     ///< Final flush while draining
    Passthrough   ///< Pipeline has no batch processor
};

/// @return "size", "timeout", "forced", "shutdown" or "passthrough"
const char* to_string(FlushReason reason);

/// A flushed batch. Signals keep receipt order.
struct Batch {
    SignalType type = SignalType::Traces;
    uint64_t sequence = 0;
    FlushReason reason = FlushReason::Forced;
    std::chrono::steady_clock::time_point created_at;
    std::vector<Signal> signals;

    size_t size() const { return signals.size(); }
    bool empty() const { return signals.empty(); }
};

}  // namespace sigroute

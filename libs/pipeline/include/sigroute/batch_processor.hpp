// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file batch_processor.hpp
/// @brief Size-or-timeout batching of signals
///
/// Signals accumulate until send_batch_size is reached or the oldest pending
/// signal has waited for the timeout, whichever comes first. The cut batch is
/// moved to the sink. With send_batch_max_size set, no batch is larger than
/// the cap; a large request is split into consecutive batches in receipt
/// order.
///
/// Example:
/// @code
///   BatchSettings settings;
///   settings.send_batch_size = 512;
///   settings.timeout = std::chrono::milliseconds(200);
///   BatchProcessor batcher(SignalType::Traces, settings,
///                          [](Batch&& batch) { dispatch(std::move(batch)); });
///   batcher.start();
///   batcher.add(std::move(spans));
///   ...
///   batcher.shutdown();  // flushes the remainder exactly once
/// @endcode

#include "sigroute/batch.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sigroute {

struct BatchSettings {
    /// Cut a batch once this many signals are pending, 0 cuts on timeout only
    size_t send_batch_size = 8192;
    /// Maximum age of the oldest pending signal
    std::chrono::milliseconds timeout{200};
    /// Upper bound on the batch size, 0 for no bound
    size_t send_batch_max_size = 0;
};

/// Receives every cut batch. Called with the emit lock held, so batches
/// arrive in cut order; may block to apply backpressure.
using BatchSink = std::function<void(Batch&&)>;

struct BatchProcessorStats {
    uint64_t signals_in = 0;
    uint64_t signals_out = 0;
    uint64_t batches_by_size = 0;
    uint64_t batches_by_timeout = 0;
    uint64_t batches_forced = 0;
    uint64_t batches_at_shutdown = 0;
};

class BatchProcessor {
public:
    BatchProcessor(SignalType type, BatchSettings settings, BatchSink sink);
    ~BatchProcessor();

    BatchProcessor(const BatchProcessor&) = delete;
    BatchProcessor& operator=(const BatchProcessor&) = delete;

    /// Start the timeout thread
    bool start();

    /// Append signals in order. May emit one or more size-triggered batches
    /// on the calling thread.
    /// @return false after shutdown(), the signals are not taken
    bool add(std::vector<Signal>&& signals);

    /// Emit whatever is pending
    /// @return false if nothing was pending
    bool flush();

    /// Stop the timer and emit the remainder. Runs once, later calls are no-ops.
    void shutdown();

    size_t pending() const;

    BatchProcessorStats stats() const;

private:
    void timer_loop();

    /// Take up to max signals off the accumulator. Requires mutex_.
    std::vector<Signal> take_locked(size_t max);

    /// Cut and emit pending signals. Requires emit_mutex_, takes mutex_.
    /// @param only_full Stop once fewer than send_batch_size remain
    bool emit(FlushReason reason, bool only_full);

    size_t cap() const;

    SignalType type_;
    BatchSettings settings_;
    BatchSink sink_;

    // Lock order: emit_mutex_ before mutex_
    std::mutex emit_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Signal> pending_;
    std::chrono::steady_clock::time_point oldest_;
    uint64_t next_sequence_ = 0;
    bool stopping_ = false;
    bool shut_down_ = false;
    BatchProcessorStats stats_;

    std::thread timer_thread_;
};

}  // namespace sigroute

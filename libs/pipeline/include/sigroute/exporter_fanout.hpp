// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file exporter_fanout.hpp
/// @brief Concurrent delivery of a batch to every exporter of a pipeline
///
/// Each exporter gets its own worker pool, so a slow or failing exporter only
/// ever occupies its own threads. One delivery task per exporter per batch
/// retries transient failures with bounded exponential backoff and reports a
/// single outcome into the batch's DeliveryTracker.

#include "sigroute/cancellation.hpp"
#include "sigroute/delivery_tracker.hpp"
#include "sigroute/exporter.hpp"
#include "sigroute/retry_policy.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sigroute {

/// An exporter as used by one pipeline
struct ExporterBinding {
    std::shared_ptr<Exporter> exporter;
    RetrySettings retry;
    /// Worker threads of this exporter in this pipeline
    size_t num_consumers = 2;
    /// Startup fails if this exporter cannot be started or reached
    bool required = false;
    std::chrono::milliseconds startup_timeout{5000};
};

/// Delivery metrics of one exporter within one pipeline
struct ExporterStats {
    uint64_t batches_sent = 0;
    uint64_t batches_failed = 0;
    uint64_t signals_sent = 0;
    uint64_t signals_failed = 0;
    uint64_t retries = 0;
    uint64_t drain_timeouts = 0;
    uint64_t latency_ms_total = 0;
    uint64_t last_latency_ms = 0;
};

class ExporterFanout {
public:
    ExporterFanout(std::string pipeline, std::vector<ExporterBinding> bindings,
                   DeliveryPolicy policy);
    ~ExporterFanout();

    ExporterFanout(const ExporterFanout&) = delete;
    ExporterFanout& operator=(const ExporterFanout&) = delete;

    /// Queue one delivery task per exporter.
    /// @return Tracker of the batch, completion runs when all exporters reported
    std::shared_ptr<DeliveryTracker> dispatch(std::shared_ptr<const Batch> batch,
                                              DeliveryTracker::Completion completion);

    /// Interrupt backoff sleeps and stop retrying. Pending tasks report
    /// DrainTimeout.
    void cancel();

    /// Wait for every queued task to finish. Idempotent.
    void join();

    const std::vector<ExporterBinding>& bindings() const { return bindings_; }

    /// Stats indexed like bindings()
    std::vector<ExporterStats> stats() const;

private:
    struct Lane {
        std::unique_ptr<boost::asio::thread_pool> pool;
        mutable std::mutex stats_mutex;
        ExporterStats stats;
    };

    void deliver(size_t index, const std::shared_ptr<const Batch>& batch,
                 const std::shared_ptr<DeliveryTracker>& tracker);

    std::string pipeline_;
    std::vector<ExporterBinding> bindings_;
    DeliveryPolicy policy_;
    std::vector<std::unique_ptr<Lane>> lanes_;
    CancellationToken cancel_;
    std::once_flag joined_;
};

}  // namespace sigroute

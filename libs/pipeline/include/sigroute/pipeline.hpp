// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file pipeline.hpp
/// @brief One signal type's path from receivers through processors to exporters
///
/// State machine: Stopped -> Starting -> Running -> Draining -> Stopped.
///
/// - start() moves to Starting, starts the exporters and fails back to
///   Stopped if a required exporter cannot be started or reached.
/// - consume() is accepted only while Running.
/// - shutdown() moves to Draining: new signals are refused, the batch
///   processor flushes its remainder, and in-flight batches are awaited up to
///   drain_timeout. Deliveries still outstanding at the deadline are
///   abandoned and recorded as DrainTimeout.

#include "sigroute/batch_processor.hpp"
#include "sigroute/exporter_fanout.hpp"
#include "sigroute/processor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sigroute {

enum class PipelineState {
    Stopped,
    Starting,
    Running,
    Draining
};

/// @return "stopped", "starting", "running" or "draining"
const char* to_string(PipelineState state);

struct PipelineSettings {
    /// Pipeline id, e.g. "traces" or "metrics/internal"
    std::string id;
    SignalType type = SignalType::Traces;
    DeliveryPolicy policy = DeliveryPolicy::AtLeastOne;
    /// Batches dispatched but not yet complete, 0 for no limit
    size_t max_in_flight_batches = 8;
    std::chrono::milliseconds drain_timeout{30000};
};

struct PipelineStats {
    uint64_t signals_received = 0;
    uint64_t signals_refused = 0;
    uint64_t signals_dropped = 0;  ///< Removed by processors
    uint64_t batches_dispatched = 0;
    uint64_t batches_delivered = 0;
    uint64_t batches_failed = 0;
    uint64_t batches_abandoned = 0;
    uint64_t in_flight = 0;
};

class Pipeline {
public:
    using OutcomeListener = std::function<void(const BatchOutcome&)>;

    /// @param batching Batch processor settings, nullopt forwards every
    ///        consume() call as its own batch
    Pipeline(PipelineSettings settings,
             std::vector<std::shared_ptr<const Processor>> processors,
             std::optional<BatchSettings> batching,
             std::vector<ExporterBinding> exporters);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    /// @return false if a required exporter failed, the pipeline stays Stopped
    bool start();

    /// Feed signals into the pipeline
    /// @return false if the pipeline is not Running (signals refused)
    bool consume(std::vector<Signal>&& signals);

    /// Drain and stop. Blocks for at most drain_timeout plus the time the
    /// exporters need to return from calls already in progress.
    void shutdown();

    PipelineState state() const { return state_.load(); }

    const PipelineSettings& settings() const { return settings_; }

    PipelineStats stats() const;

    /// Per-exporter stats keyed by exporter name
    std::map<std::string, ExporterStats> exporter_stats() const;

    /// Observe every batch verdict. Set before start().
    void set_outcome_listener(OutcomeListener listener) { listener_ = std::move(listener); }

private:
    /// Hand a batch to the fanout. Passthrough batches are refused once the
    /// pipeline drains.
    /// @return false if the batch was refused
    bool dispatch(Batch&& batch, bool passthrough);
    void on_batch_complete(const BatchOutcome& outcome);

    PipelineSettings settings_;
    std::vector<std::shared_ptr<const Processor>> processors_;
    std::unique_ptr<ExporterFanout> fanout_;
    std::unique_ptr<BatchProcessor> batcher_;
    OutcomeListener listener_;

    std::atomic<PipelineState> state_{PipelineState::Stopped};
    std::atomic<uint64_t> next_sequence_{0};

    // In-flight batches keyed by sequence. The tracker is null while its
    // dispatch is still in progress.
    mutable std::mutex flight_mutex_;
    std::condition_variable flight_cv_;
    std::map<uint64_t, std::shared_ptr<DeliveryTracker>> in_flight_;
    std::chrono::steady_clock::time_point drain_deadline_;
    bool draining_ = false;
    /// Dispatches between the in_flight_ entry and the queued fanout tasks
    size_t pending_dispatches_ = 0;
    PipelineStats stats_;
};

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/pipeline.hpp"

#include <glog/logging.h>

namespace sigroute {

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Stopped: return "stopped";
        case PipelineState::Starting: return "starting";
        case PipelineState::Running: return "running";
        case PipelineState::Draining: return "draining";
    }
    return "unknown";
}

Pipeline::Pipeline(PipelineSettings settings,
                   std::vector<std::shared_ptr<const Processor>> processors,
                   std::optional<BatchSettings> batching,
                   std::vector<ExporterBinding> exporters)
    : settings_(std::move(settings)),
      processors_(std::move(processors)),
      fanout_(std::make_unique<ExporterFanout>(settings_.id, std::move(exporters),
                                               settings_.policy)) {
    if (batching) {
        batcher_ = std::make_unique<BatchProcessor>(
            settings_.type, *batching,
            [this](Batch&& batch) { dispatch(std::move(batch), false); });
    }
}

Pipeline::~Pipeline() {
    shutdown();
    batcher_.reset();
    fanout_->cancel();
    fanout_->join();
}

bool Pipeline::start() {
    PipelineState expected = PipelineState::Stopped;
    if (!state_.compare_exchange_strong(expected, PipelineState::Starting)) {
        return expected == PipelineState::Running;
    }

    for (const auto& binding : fanout_->bindings()) {
        const std::string name = binding.exporter->name();
        bool ok = binding.exporter->start();
        if (ok && binding.required) {
            ok = binding.exporter->wait_until_ready(binding.startup_timeout);
        }
        if (ok) {
            continue;
        }

        if (binding.required) {
            LOG(ERROR) << "Pipeline " << settings_.id << ": required exporter " << name
                       << " could not be started within "
                       << binding.startup_timeout.count() << "ms";
            state_ = PipelineState::Stopped;
            return false;
        }
        LOG(WARNING) << "Pipeline " << settings_.id << ": exporter " << name
                     << " is not ready, deliveries will be retried";
    }

    if (batcher_ && !batcher_->start()) {
        LOG(ERROR) << "Pipeline " << settings_.id << ": batch processor failed to start";
        state_ = PipelineState::Stopped;
        return false;
    }

    state_ = PipelineState::Running;
    LOG(INFO) << "Pipeline " << settings_.id << " running with "
              << fanout_->bindings().size() << " exporters, " << processors_.size()
              << " processors" << (batcher_ ? " and batching" : "")
              << ", policy " << to_string(settings_.policy);
    return true;
}

bool Pipeline::consume(std::vector<Signal>&& signals) {
    const size_t received = signals.size();
    if (state_ != PipelineState::Running) {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        stats_.signals_refused += received;
        return false;
    }

    for (const auto& processor : processors_) {
        processor->process(signals);
    }

    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        stats_.signals_received += received;
        stats_.signals_dropped += received - signals.size();
    }
    if (signals.empty()) {
        return true;
    }

    if (batcher_) {
        const size_t count = signals.size();
        if (!batcher_->add(std::move(signals))) {
            std::lock_guard<std::mutex> lock(flight_mutex_);
            stats_.signals_refused += count;
            return false;
        }
        return true;
    }

    Batch batch;
    batch.type = settings_.type;
    batch.reason = FlushReason::Passthrough;
    batch.created_at = std::chrono::steady_clock::now();
    batch.signals = std::move(signals);
    return dispatch(std::move(batch), true);
}

bool Pipeline::dispatch(Batch&& batch, bool passthrough) {
    const uint64_t sequence = passthrough ? next_sequence_++ : batch.sequence;
    if (passthrough) {
        batch.sequence = sequence;
    }

    {
        std::unique_lock<std::mutex> lock(flight_mutex_);
        auto has_room = [this] {
            return settings_.max_in_flight_batches == 0 ||
                   in_flight_.size() < settings_.max_in_flight_batches;
        };

        while (true) {
            // A consume() that passed the state check before shutdown began
            if (passthrough && draining_) {
                stats_.signals_refused += batch.size();
                VLOG(1) << "Pipeline " << settings_.id << ": refused " << batch.size()
                        << " signals, pipeline is draining";
                return false;
            }
            if (has_room()) {
                break;
            }
            if (!draining_) {
                flight_cv_.wait(lock);
                continue;
            }
            if (flight_cv_.wait_until(lock, drain_deadline_) == std::cv_status::timeout &&
                !has_room()) {
                stats_.batches_abandoned++;
                stats_.batches_failed++;
                lock.unlock();

                LOG(WARNING) << "Pipeline " << settings_.id << ": batch " << sequence << " with "
                             << batch.size() << " signals abandoned at drain deadline";
                if (listener_) {
                    BatchOutcome outcome;
                    outcome.sequence = sequence;
                    outcome.signals = batch.size();
                    for (const auto& binding : fanout_->bindings()) {
                        ExportOutcome abandoned;
                        abandoned.exporter = binding.exporter->name();
                        abandoned.error = ErrorKind::DrainTimeout;
                        outcome.exporters.push_back(std::move(abandoned));
                    }
                    listener_(outcome);
                }
                return true;
            }
        }

        in_flight_.emplace(sequence, nullptr);
        stats_.batches_dispatched++;
        pending_dispatches_++;
    }

    auto shared = std::make_shared<const Batch>(std::move(batch));
    auto tracker = fanout_->dispatch(shared, [this](const BatchOutcome& outcome) {
        on_batch_complete(outcome);
    });

    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        auto it = in_flight_.find(sequence);
        if (it != in_flight_.end()) {
            it->second = tracker;
        }
        pending_dispatches_--;
    }
    flight_cv_.notify_all();
    return true;
}

void Pipeline::on_batch_complete(const BatchOutcome& outcome) {
    bool abandoned = false;
    for (const auto& exporter : outcome.exporters) {
        if (exporter.error == ErrorKind::DrainTimeout) {
            abandoned = true;
        }
    }

    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        in_flight_.erase(outcome.sequence);
        if (outcome.delivered) {
            stats_.batches_delivered++;
        } else {
            stats_.batches_failed++;
        }
        if (abandoned) {
            stats_.batches_abandoned++;
        }
    }
    flight_cv_.notify_all();

    if (!outcome.delivered) {
        LOG_EVERY_N(WARNING, 10) << "Pipeline " << settings_.id << ": batch " << outcome.sequence
                                 << " with " << outcome.signals << " signals not delivered ("
                                 << to_string(settings_.policy) << ")";
    }

    if (listener_) {
        listener_(outcome);
    }
}

void Pipeline::shutdown() {
    PipelineState expected = PipelineState::Running;
    if (!state_.compare_exchange_strong(expected, PipelineState::Draining)) {
        return;
    }

    auto started = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(flight_mutex_);
        draining_ = true;
        drain_deadline_ = started + settings_.drain_timeout;
    }
    flight_cv_.notify_all();

    LOG(INFO) << "Pipeline " << settings_.id << " draining";

    if (batcher_) {
        batcher_->shutdown();
    }

    std::vector<std::shared_ptr<DeliveryTracker>> outstanding;
    {
        std::unique_lock<std::mutex> lock(flight_mutex_);
        bool drained = flight_cv_.wait_until(lock, drain_deadline_,
                                             [this] { return in_flight_.empty(); });
        if (!drained) {
            for (const auto& entry : in_flight_) {
                if (entry.second) {
                    outstanding.push_back(entry.second);
                }
            }
            LOG(WARNING) << "Pipeline " << settings_.id << ": drain timeout after "
                         << settings_.drain_timeout.count() << "ms, abandoning "
                         << in_flight_.size() << " in-flight batches ("
                         << to_string(ErrorKind::DrainTimeout) << ")";
        }
        // Tasks must be queued before the worker pools are joined
        flight_cv_.wait(lock, [this] { return pending_dispatches_ == 0; });
    }

    // Stop backoff sleeps, then settle what is still outstanding
    fanout_->cancel();
    for (const auto& tracker : outstanding) {
        tracker->abandon();
    }
    fanout_->join();

    state_ = PipelineState::Stopped;

    PipelineStats s = stats();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    LOG(INFO) << "Pipeline " << settings_.id << " stopped in " << elapsed.count()
              << "ms. Stats: received=" << s.signals_received
              << " refused=" << s.signals_refused
              << " batches=" << s.batches_dispatched
              << " delivered=" << s.batches_delivered
              << " failed=" << s.batches_failed
              << " abandoned=" << s.batches_abandoned;
}

PipelineStats Pipeline::stats() const {
    std::lock_guard<std::mutex> lock(flight_mutex_);
    PipelineStats out = stats_;
    out.in_flight = in_flight_.size();
    return out;
}

std::map<std::string, ExporterStats> Pipeline::exporter_stats() const {
    std::map<std::string, ExporterStats> out;
    auto stats = fanout_->stats();
    const auto& bindings = fanout_->bindings();
    for (size_t i = 0; i < bindings.size(); ++i) {
        out[bindings[i].exporter->name()] = stats[i];
    }
    return out;
}

}  // namespace sigroute

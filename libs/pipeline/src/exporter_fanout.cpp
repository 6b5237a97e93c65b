// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/exporter_fanout.hpp"

#include <glog/logging.h>

#include <boost/asio/post.hpp>

namespace sigroute {

ExporterFanout::ExporterFanout(std::string pipeline, std::vector<ExporterBinding> bindings,
                               DeliveryPolicy policy)
    : pipeline_(std::move(pipeline)),
      bindings_(std::move(bindings)),
      policy_(policy) {
    for (const auto& binding : bindings_) {
        auto lane = std::make_unique<Lane>();
        size_t threads = binding.num_consumers > 0 ? binding.num_consumers : 1;
        lane->pool = std::make_unique<boost::asio::thread_pool>(threads);
        lanes_.push_back(std::move(lane));
    }
}

ExporterFanout::~ExporterFanout() {
    cancel();
    join();
}

std::shared_ptr<DeliveryTracker> ExporterFanout::dispatch(std::shared_ptr<const Batch> batch,
                                                          DeliveryTracker::Completion completion) {
    std::vector<std::string> names;
    names.reserve(bindings_.size());
    for (const auto& binding : bindings_) {
        names.push_back(binding.exporter->name());
    }

    auto tracker = std::make_shared<DeliveryTracker>(batch->sequence, batch->size(),
                                                     std::move(names), policy_,
                                                     std::move(completion));

    for (size_t i = 0; i < lanes_.size(); ++i) {
        boost::asio::post(*lanes_[i]->pool, [this, i, batch, tracker] {
            deliver(i, batch, tracker);
        });
    }
    return tracker;
}

void ExporterFanout::deliver(size_t index, const std::shared_ptr<const Batch>& batch,
                             const std::shared_ptr<DeliveryTracker>& tracker) {
    const ExporterBinding& binding = bindings_[index];
    Lane& lane = *lanes_[index];
    const std::string name = binding.exporter->name();

    auto started = std::chrono::steady_clock::now();
    Backoff backoff(binding.retry);
    ExportOutcome outcome;

    while (true) {
        if (cancel_.cancelled() || tracker->complete()) {
            outcome.error = ErrorKind::DrainTimeout;
            outcome.message = "cancelled before delivery";
            break;
        }

        ExportResult result;
        try {
            result = binding.exporter->export_batch(*batch);
        } catch (const std::exception& e) {
            result = ExportResult::terminal(std::string("exporter threw: ") + e.what());
        }
        outcome.attempts++;

        if (result.ok()) {
            outcome.error = ErrorKind::None;
            outcome.message.clear();
            break;
        }

        if (result.status == ExportStatus::Terminal) {
            outcome.error = ErrorKind::ExportTerminal;
            outcome.message = result.message;
            break;
        }

        auto delay = backoff.next(result.retry_after);
        if (!delay) {
            outcome.error = ErrorKind::ExportTerminal;
            outcome.message = "retry budget exhausted after " + std::to_string(outcome.attempts) +
                              " attempts: " + result.message;
            break;
        }

        VLOG(1) << pipeline_ << "/" << name << ": batch " << batch->sequence
                << " attempt " << outcome.attempts << " failed (" << result.message
                << "), retrying in " << delay->count() << "ms";
        {
            std::lock_guard<std::mutex> lock(lane.stats_mutex);
            lane.stats.retries++;
        }

        if (!cancel_.sleep_for(*delay)) {
            outcome.error = ErrorKind::DrainTimeout;
            outcome.message = "cancelled during backoff: " + result.message;
            break;
        }
    }

    outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    {
        std::lock_guard<std::mutex> lock(lane.stats_mutex);
        auto latency_ms = static_cast<uint64_t>(outcome.latency.count());
        lane.stats.last_latency_ms = latency_ms;
        lane.stats.latency_ms_total += latency_ms;
        if (outcome.ok()) {
            lane.stats.batches_sent++;
            lane.stats.signals_sent += batch->size();
        } else {
            lane.stats.batches_failed++;
            lane.stats.signals_failed += batch->size();
            if (outcome.error == ErrorKind::DrainTimeout) {
                lane.stats.drain_timeouts++;
            }
        }
    }

    if (!outcome.ok()) {
        LOG_EVERY_N(WARNING, 10) << pipeline_ << "/" << name << ": batch " << batch->sequence
                                 << " failed with " << to_string(outcome.error) << ": "
                                 << outcome.message;
    }

    tracker->report(index, std::move(outcome));
}

void ExporterFanout::cancel() {
    cancel_.cancel();
}

void ExporterFanout::join() {
    std::call_once(joined_, [this] {
        for (auto& lane : lanes_) {
            lane->pool->join();
        }
    });
}

std::vector<ExporterStats> ExporterFanout::stats() const {
    std::vector<ExporterStats> out;
    out.reserve(lanes_.size());
    for (const auto& lane : lanes_) {
        std::lock_guard<std::mutex> lock(lane->stats_mutex);
        out.push_back(lane->stats);
    }
    return out;
}

}  // namespace sigroute

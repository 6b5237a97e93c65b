// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/batch_processor.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <iterator>
#include <limits>

namespace sigroute {

BatchProcessor::BatchProcessor(SignalType type, BatchSettings settings, BatchSink sink)
    : type_(type), settings_(settings), sink_(std::move(sink)) {}

BatchProcessor::~BatchProcessor() {
    shutdown();
}

bool BatchProcessor::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timer_thread_.joinable() || shut_down_) {
        return !shut_down_;
    }
    timer_thread_ = std::thread(&BatchProcessor::timer_loop, this);
    return true;
}

size_t BatchProcessor::cap() const {
    return settings_.send_batch_max_size > 0 ? settings_.send_batch_max_size
                                             : std::numeric_limits<size_t>::max();
}

bool BatchProcessor::add(std::vector<Signal>&& signals) {
    if (signals.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        return !shut_down_;
    }

    std::lock_guard<std::mutex> emit_lock(emit_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shut_down_) {
            return false;
        }
        if (pending_.empty()) {
            oldest_ = std::chrono::steady_clock::now();
            cv_.notify_all();
        }
        stats_.signals_in += signals.size();
        pending_.insert(pending_.end(), std::make_move_iterator(signals.begin()),
                        std::make_move_iterator(signals.end()));
        signals.clear();
    }

    emit(FlushReason::Size, true);
    return true;
}

bool BatchProcessor::flush() {
    std::lock_guard<std::mutex> emit_lock(emit_mutex_);
    return emit(FlushReason::Forced, false);
}

void BatchProcessor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }

    std::lock_guard<std::mutex> emit_lock(emit_mutex_);
    emit(FlushReason::Shutdown, false);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
    }

    BatchProcessorStats s = stats();
    VLOG(1) << "BatchProcessor(" << to_string(type_) << ") stopped. in=" << s.signals_in
            << " out=" << s.signals_out << " size=" << s.batches_by_size
            << " timeout=" << s.batches_by_timeout << " shutdown=" << s.batches_at_shutdown;
}

size_t BatchProcessor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

BatchProcessorStats BatchProcessor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<Signal> BatchProcessor::take_locked(size_t max) {
    std::vector<Signal> out;
    if (pending_.size() <= max) {
        out.swap(pending_);
    } else {
        auto split = pending_.begin() + static_cast<std::ptrdiff_t>(max);
        out.assign(std::make_move_iterator(pending_.begin()), std::make_move_iterator(split));
        pending_.erase(pending_.begin(), split);
    }

    // Remaining signals start a new wait
    if (!pending_.empty()) {
        oldest_ = std::chrono::steady_clock::now();
    }
    return out;
}

bool BatchProcessor::emit(FlushReason reason, bool only_full) {
    bool emitted = false;

    while (true) {
        Batch batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                break;
            }
            if (only_full) {
                // send_batch_size 0 means timeout-only batching, but the cap
                // still applies
                size_t trigger = settings_.send_batch_size > 0 ? settings_.send_batch_size : cap();
                if (pending_.size() < trigger) {
                    break;
                }
            }

            batch.type = type_;
            batch.reason = reason;
            batch.sequence = next_sequence_++;
            batch.created_at = std::chrono::steady_clock::now();
            batch.signals = take_locked(cap());

            stats_.signals_out += batch.size();
            switch (reason) {
                case FlushReason::Size: stats_.batches_by_size++; break;
                case FlushReason::Timeout: stats_.batches_by_timeout++; break;
                case FlushReason::Shutdown: stats_.batches_at_shutdown++; break;
                default: stats_.batches_forced++; break;
            }
        }

        VLOG(2) << "Batch " << batch.sequence << " (" << to_string(type_) << ") cut by "
                << to_string(reason) << " with " << batch.size() << " signals";
        sink_(std::move(batch));
        emitted = true;
    }

    return emitted;
}

void BatchProcessor::timer_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (pending_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
            continue;
        }

        auto deadline = oldest_ + settings_.timeout;
        if (std::chrono::steady_clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        lock.unlock();
        {
            std::lock_guard<std::mutex> emit_lock(emit_mutex_);
            // A size cut may have taken the signals while unlocked
            bool due = false;
            {
                std::lock_guard<std::mutex> inner(mutex_);
                due = !pending_.empty() &&
                      std::chrono::steady_clock::now() >= oldest_ + settings_.timeout;
            }
            if (due) {
                emit(FlushReason::Timeout, false);
            }
        }
        lock.lock();
    }
}

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/delivery_tracker.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace sigroute {

const char* to_string(DeliveryPolicy policy) {
    switch (policy) {
        case DeliveryPolicy::AtLeastOne: return "at_least_one";
        case DeliveryPolicy::AllRequired: return "all_required";
    }
    return "unknown";
}

std::optional<DeliveryPolicy> delivery_policy_from_string(const std::string& name) {
    if (name == "at_least_one") return DeliveryPolicy::AtLeastOne;
    if (name == "all_required") return DeliveryPolicy::AllRequired;
    return std::nullopt;
}

DeliveryTracker::DeliveryTracker(uint64_t sequence, size_t signals,
                                 std::vector<std::string> exporters,
                                 DeliveryPolicy policy, Completion completion)
    : policy_(policy),
      completion_(std::move(completion)),
      reported_(exporters.size(), false),
      pending_(exporters.size()) {
    outcome_.sequence = sequence;
    outcome_.signals = signals;
    outcome_.exporters.resize(exporters.size());
    for (size_t i = 0; i < exporters.size(); ++i) {
        outcome_.exporters[i].exporter = std::move(exporters[i]);
    }

    if (pending_ == 0) {
        std::unique_lock<std::mutex> lock(mutex_);
        finish(lock);
    }
}

bool DeliveryTracker::report(size_t index, ExportOutcome outcome) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (complete_ || index >= reported_.size() || reported_[index]) {
        return false;
    }

    outcome.exporter = outcome_.exporters[index].exporter;
    outcome_.exporters[index] = std::move(outcome);
    reported_[index] = true;

    if (--pending_ == 0) {
        finish(lock);
    }
    return true;
}

void DeliveryTracker::abandon() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (complete_) {
        return;
    }

    for (size_t i = 0; i < reported_.size(); ++i) {
        if (reported_[i]) continue;
        reported_[i] = true;
        outcome_.exporters[i].error = ErrorKind::DrainTimeout;
        outcome_.exporters[i].message = "abandoned at drain deadline";
    }
    pending_ = 0;
    finish(lock);
}

bool DeliveryTracker::complete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return complete_;
}

void DeliveryTracker::finish(std::unique_lock<std::mutex>& lock) {
    complete_ = true;

    const auto& results = outcome_.exporters;
    if (policy_ == DeliveryPolicy::AllRequired) {
        outcome_.delivered = !results.empty() &&
            std::all_of(results.begin(), results.end(), [](const ExportOutcome& o) { return o.ok(); });
    } else {
        outcome_.delivered =
            std::any_of(results.begin(), results.end(), [](const ExportOutcome& o) { return o.ok(); });
    }

    BatchOutcome outcome = outcome_;
    lock.unlock();

    if (completion_) {
        completion_(outcome);
    }
}

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file processor.hpp
/// @brief Signal transformation stage run before batching

#include "sigroute/signal.hpp"

#include <string>
#include <vector>

namespace sigroute {

/// A processor rewrites signals before they are batched. Runs on the
/// receiving thread, must be thread-safe.
class Processor {
public:
    virtual ~Processor() = default;

    /// Transform the signals in place. May remove signals.
    virtual void process(std::vector<Signal>& signals) const = 0;

    virtual std::string name() const = 0;
};

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file receiver.hpp
/// @brief Receiver interface and the consumer it feeds

#include "sigroute/signal.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sigroute {

enum class ConsumeStatus {
    Accepted,   ///< At least one pipeline took the signals
    Refused,    ///< Every bound pipeline is draining or stopped
    NoPipeline  ///< No pipeline of this signal type is bound to the receiver
};

/// Entry point of the pipelines bound to one receiver
class SignalConsumer {
public:
    virtual ~SignalConsumer() = default;

    /// Hand decoded signals of one type to the pipelines. May block while
    /// pipelines apply backpressure.
    virtual ConsumeStatus consume(SignalType type, std::vector<Signal>&& signals) = 0;
};

/// Counters of one inbound transport
struct TransportStats {
    std::string transport;  ///< "grpc" or "http"
    uint64_t requests = 0;
    uint64_t accepted_signals = 0;
    uint64_t refused_signals = 0;
    uint64_t decode_errors = 0;
};

class Receiver {
public:
    virtual ~Receiver() = default;

    /// Start listening
    /// @return false if a transport cannot be started
    virtual bool start() = 0;

    /// Stop accepting requests. In-progress requests complete.
    virtual void shutdown() = 0;

    virtual bool healthy() const = 0;

    virtual std::string name() const = 0;

    virtual std::vector<TransportStats> stats() const = 0;
};

}  // namespace sigroute

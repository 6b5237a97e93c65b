// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file exporter.hpp
/// @brief Abstract interface for exporters (OTLP/gRPC, OTLP/HTTP, Prometheus, logging)
///
/// An Exporter serializes a batch into its endpoint's wire format and
/// transmits it. One exporter instance is shared by every pipeline that lists
/// it, and export_batch() is called concurrently from the worker pool of each
/// of those pipelines.

#include "sigroute/batch.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace sigroute {

enum class ExportStatus {
    Success,
    Transient,  ///< Worth retrying (unavailable, throttled, timed out)
    Terminal    ///< Retrying cannot help (rejected, unauthenticated, bad data)
};

/// Result of a single export attempt
struct ExportResult {
    ExportStatus status = ExportStatus::Success;
    std::string message;
    /// Server-requested delay before the next attempt, zero if none
    std::chrono::milliseconds retry_after{0};

    bool ok() const { return status == ExportStatus::Success; }

    static ExportResult success() { return {}; }

    static ExportResult transient(std::string message,
                                  std::chrono::milliseconds retry_after = std::chrono::milliseconds(0)) {
        return {ExportStatus::Transient, std::move(message), retry_after};
    }

    static ExportResult terminal(std::string message) {
        return {ExportStatus::Terminal, std::move(message), std::chrono::milliseconds(0)};
    }
};

class Exporter {
public:
    virtual ~Exporter() = default;

    /// Start the exporter (connect, bind, allocate resources).
    /// Must be idempotent, an exporter shared by several pipelines is
    /// started by each of them.
    /// @return true on success
    virtual bool start() = 0;

    /// Block until the endpoint is reachable or the timeout expires.
    /// Called at startup for exporters marked required.
    virtual bool wait_until_ready(std::chrono::milliseconds /*timeout*/) { return true; }

    /// Release resources. Called once, after every pipeline has drained.
    virtual void shutdown() = 0;

    /// Deliver one batch. Thread-safe.
    virtual ExportResult export_batch(const Batch& batch) = 0;

    /// Whether this exporter can handle the signal type
    virtual bool supports(SignalType type) const = 0;

    virtual bool healthy() const = 0;

    /// Component id used in logs and metrics, e.g. "otlp/elastic"
    virtual std::string name() const = 0;
};

}  // namespace sigroute

// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file logging_exporter.hpp
/// @brief Exporter writing batches to the process log
///
/// - basic: one summary line per batch
/// - normal: one line per signal
/// - detailed: one JSON document per signal, all fields included

#include "sigroute/exporter.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace sigroute {

enum class Verbosity {
    Basic,
    Normal,
    Detailed
};

std::optional<Verbosity> verbosity_from_string(const std::string& name);

struct LoggingExporterConfig {
    Verbosity verbosity = Verbosity::Basic;
};

class LoggingExporter : public Exporter {
public:
    LoggingExporter(std::string name, LoggingExporterConfig config);

    bool start() override { return true; }
    void shutdown() override;
    ExportResult export_batch(const Batch& batch) override;
    bool supports(SignalType) const override { return true; }
    bool healthy() const override { return true; }
    std::string name() const override { return name_; }

    /// Lines export_batch() writes for a batch
    std::vector<std::string> format(const Batch& batch) const;

    /// Full JSON rendering of one signal (detailed verbosity)
    static nlohmann::json to_json(const Signal& signal);

private:
    std::string name_;
    LoggingExporterConfig config_;
    std::atomic<uint64_t> signals_logged_{0};
};

}  // namespace sigroute

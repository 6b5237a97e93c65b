// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0
//
// sigroute - telemetry pipeline router
//
// Receives traces, metrics and logs over OTLP (gRPC and HTTP), batches them
// per pipeline and fans every batch out to the pipeline's exporters.
//
// Usage:
//   sigroute --config /etc/sigroute/sigroute.yaml
//   sigroute --config sigroute.yaml --validate

#include "sigroute/builtin_components.hpp"
#include "sigroute/errors.hpp"
#include "sigroute/service.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>

DEFINE_string(config, "", "Path to the YAML configuration file");
DEFINE_bool(validate, false, "Load and build the configuration, then exit");
DEFINE_int64(drain_timeout_ms, -1,
             "Override service.drain_timeout in milliseconds (-1 keeps the configured value)");

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    LOG(INFO) << "Received signal " << signum << ", shutting down...";
    g_running = false;
}

/// Apply service.telemetry.logs.level unless -v or --minloglevel was given
void apply_log_level(const std::string& level) {
    gflags::CommandLineFlagInfo info;
    if (gflags::GetCommandLineFlagInfo("minloglevel", &info) && !info.is_default) {
        return;
    }
    if (level == "debug") {
        FLAGS_minloglevel = google::INFO;
        if (FLAGS_v < 1) {
            FLAGS_v = 1;
        }
    } else if (level == "warn") {
        FLAGS_minloglevel = google::WARNING;
    } else if (level == "error") {
        FLAGS_minloglevel = google::ERROR;
    } else {
        FLAGS_minloglevel = google::INFO;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::SetStderrLogging(google::INFO);
    FLAGS_colorlogtostderr = true;

    gflags::SetUsageMessage(
        "Telemetry pipeline router\n\n"
        "Receives OTLP traces, metrics and logs and routes them through\n"
        "batching pipelines to one or more exporters.\n\n"
        "Example:\n"
        "  sigroute --config sigroute.yaml");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    if (FLAGS_config.empty()) {
        LOG(ERROR) << "Missing required flag: --config";
        LOG(ERROR) << "Usage: sigroute --config /path/to/sigroute.yaml [--validate]";
        return 1;
    }

    sigroute::ComponentRegistry registry;
    sigroute::register_builtin_components(registry);

    std::unique_ptr<sigroute::Service> service;
    try {
        sigroute::Config config =
            sigroute::load_config(FLAGS_config, sigroute::Environment::from_process());
        if (FLAGS_drain_timeout_ms >= 0) {
            config.service.drain_timeout = std::chrono::milliseconds(FLAGS_drain_timeout_ms);
        }
        apply_log_level(config.service.telemetry.log_level);

        LOG(INFO) << "sigroute starting...";
        LOG(INFO) << "  Config: " << FLAGS_config;
        LOG(INFO) << "  Pipelines: " << config.service.pipelines.size();
        for (const auto& pipeline : config.service.pipelines) {
            LOG(INFO) << "  - " << pipeline.id << " (" << pipeline.receivers.size()
                      << " receivers, " << pipeline.exporters.size() << " exporters)";
        }
        LOG(INFO) << "  Drain timeout: " << config.service.drain_timeout.count() << "ms";

        service = std::make_unique<sigroute::Service>(config, registry);
    } catch (const sigroute::ConfigError& e) {
        LOG(ERROR) << "Invalid configuration: " << e.what();
        return 1;
    }

    if (FLAGS_validate) {
        LOG(INFO) << "Configuration is valid";
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!service->start()) {
        LOG(ERROR) << "Startup failed";
        return 1;
    }

    LOG(INFO) << "sigroute ready. Press Ctrl+C to stop.";

    auto last_report = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_report >= std::chrono::seconds(60)) {
            last_report = now;
            if (!service->healthy()) {
                LOG(WARNING) << "One or more components are unhealthy";
            }
            VLOG(1) << service->render_metrics();
        }
    }

    service->shutdown();
    LOG(INFO) << "sigroute stopped";

    google::ShutdownGoogleLogging();
    return 0;
}

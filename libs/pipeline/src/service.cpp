// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/service.hpp"

#include "sigroute/errors.hpp"
#include "sigroute/http_server.hpp"
#include "sigroute/prometheus_text.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <set>
#include <thread>

namespace sigroute {

void PipelineRouter::add(Pipeline* pipeline) {
    pipelines_[pipeline->settings().type].push_back(pipeline);
}

ConsumeStatus PipelineRouter::consume(SignalType type, std::vector<Signal>&& signals) {
    auto it = pipelines_.find(type);
    if (it == pipelines_.end() || it->second.empty()) {
        return ConsumeStatus::NoPipeline;
    }

    const auto& targets = it->second;
    bool accepted = false;
    for (size_t i = 0; i < targets.size(); ++i) {
        // The last pipeline takes the original, the others get copies
        if (i + 1 == targets.size()) {
            accepted = targets[i]->consume(std::move(signals)) || accepted;
        } else {
            std::vector<Signal> copy = signals;
            accepted = targets[i]->consume(std::move(copy)) || accepted;
        }
    }
    return accepted ? ConsumeStatus::Accepted : ConsumeStatus::Refused;
}

Service::Service(const Config& config, const ComponentRegistry& registry)
    : config_(config.service) {
    std::map<std::string, ExporterBinding> bindings;
    std::set<std::string> used_receivers;
    std::set<std::string> used_processors;

    for (const auto& pipeline_config : config_.pipelines) {
        for (const auto& id : pipeline_config.exporters) {
            if (bindings.count(id) == 0) {
                ExporterBinding binding = registry.build_exporter(config.exporters.at(id));
                exporters_[id] = binding.exporter;
                bindings.emplace(id, std::move(binding));
            }
        }
    }

    for (const auto& pipeline_config : config_.pipelines) {
        std::vector<std::shared_ptr<const Processor>> processors;
        std::optional<BatchSettings> batching;

        for (size_t i = 0; i < pipeline_config.processors.size(); ++i) {
            const std::string& id = pipeline_config.processors[i];
            used_processors.insert(id);

            ProcessorBuild build = registry.build_processor(config.processors.at(id));
            if (build.batching) {
                if (i + 1 != pipeline_config.processors.size()) {
                    throw ConfigError("pipeline '" + pipeline_config.id + "': batch processor '" +
                                      id + "' must be the last processor");
                }
                batching = build.batching;
            } else {
                processors.push_back(build.processor);
            }
        }

        std::vector<ExporterBinding> exporters;
        for (const auto& id : pipeline_config.exporters) {
            const ExporterBinding& binding = bindings.at(id);
            if (!binding.exporter->supports(pipeline_config.type)) {
                throw ConfigError("pipeline '" + pipeline_config.id + "': exporter '" + id +
                                  "' does not support " + to_string(pipeline_config.type));
            }
            exporters.push_back(binding);
        }

        PipelineSettings settings;
        settings.id = pipeline_config.id;
        settings.type = pipeline_config.type;
        settings.policy = config_.delivery_policy;
        settings.max_in_flight_batches = config_.max_in_flight_batches;
        settings.drain_timeout = config_.drain_timeout;

        pipelines_.push_back(std::make_unique<Pipeline>(
            settings, std::move(processors), batching, std::move(exporters)));
    }

    for (const auto& [id, receiver_config] : config.receivers) {
        auto router = std::make_shared<PipelineRouter>();
        bool used = false;
        for (size_t i = 0; i < config_.pipelines.size(); ++i) {
            const auto& ids = config_.pipelines[i].receivers;
            if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
                router->add(pipelines_[i].get());
                used = true;
            }
        }
        if (!used) {
            LOG(WARNING) << "Receiver " << id << " is not used by any pipeline";
            continue;
        }
        used_receivers.insert(id);
        receivers_.push_back(registry.build_receiver(receiver_config, router));
        routers_.push_back(std::move(router));
    }

    for (const auto& entry : config.processors) {
        if (used_processors.count(entry.first) == 0) {
            LOG(WARNING) << "Processor " << entry.first << " is not used by any pipeline";
        }
    }
    for (const auto& entry : config.exporters) {
        if (exporters_.count(entry.first) == 0) {
            LOG(WARNING) << "Exporter " << entry.first << " is not used by any pipeline";
        }
    }

    if (!config_.telemetry.metrics_address.empty()) {
        HttpServer::Settings settings;
        if (!split_host_port(config_.telemetry.metrics_address, settings.address, settings.port)) {
            throw ConfigError("service.telemetry.metrics.address: invalid address '" +
                              config_.telemetry.metrics_address + "'");
        }
        settings.threads = 1;
        telemetry_server_ = std::make_unique<HttpServer>(
            "telemetry", settings, [this](const HttpRequest& request) {
                if (request.target() != "/metrics") {
                    return make_response(request, http::status::not_found, "not found\n",
                                         "text/plain");
                }
                if (request.method() != http::verb::get) {
                    return make_response(request, http::status::method_not_allowed, "",
                                         "text/plain");
                }
                return make_response(request, http::status::ok, render_metrics(),
                                     kPrometheusContentType);
            });
    }
}

Service::~Service() {
    shutdown();
}

bool Service::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_) {
        return true;
    }

    for (auto& pipeline : pipelines_) {
        if (!pipeline->start()) {
            LOG(ERROR) << "Pipeline " << pipeline->settings().id << " failed to start";
            stop_components();
            return false;
        }
    }

    for (auto& receiver : receivers_) {
        if (!receiver->start()) {
            LOG(ERROR) << "Receiver " << receiver->name() << " failed to start";
            stop_components();
            return false;
        }
    }

    if (telemetry_server_ && !telemetry_server_->start()) {
        LOG(ERROR) << "Self-telemetry endpoint failed to start";
        stop_components();
        return false;
    }

    started_ = true;
    LOG(INFO) << "Service running: " << pipelines_.size() << " pipelines, "
              << receivers_.size() << " receivers, " << exporters_.size() << " exporters";
    return true;
}

void Service::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_) {
        return;
    }
    started_ = false;
    stop_components();
}

void Service::stop_components() {
    if (telemetry_server_) {
        telemetry_server_->stop();
    }

    for (auto& receiver : receivers_) {
        receiver->shutdown();
    }

    std::vector<std::thread> drains;
    for (auto& pipeline : pipelines_) {
        drains.emplace_back([&pipeline] { pipeline->shutdown(); });
    }
    for (auto& drain : drains) {
        drain.join();
    }

    for (auto& [id, exporter] : exporters_) {
        exporter->shutdown();
    }
    LOG(INFO) << "Service stopped";
}

bool Service::healthy() const {
    for (const auto& pipeline : pipelines_) {
        if (pipeline->state() != PipelineState::Running) {
            return false;
        }
    }
    for (const auto& receiver : receivers_) {
        if (!receiver->healthy()) {
            return false;
        }
    }
    return true;
}

Pipeline* Service::pipeline(const std::string& id) const {
    for (const auto& pipeline : pipelines_) {
        if (pipeline->settings().id == id) {
            return pipeline.get();
        }
    }
    return nullptr;
}

std::string Service::render_metrics() const {
    PrometheusTextWriter writer;

    struct ReceiverRow {
        Labels labels;
        TransportStats stats;
    };
    std::vector<ReceiverRow> receiver_rows;
    for (const auto& receiver : receivers_) {
        for (const auto& transport : receiver->stats()) {
            receiver_rows.push_back(
                {{{"receiver", receiver->name()}, {"transport", transport.transport}}, transport});
        }
    }

    auto receiver_family = [&](const std::string& name, const std::string& help,
                               uint64_t TransportStats::*field) {
        writer.family(name, "counter", help);
        for (const auto& row : receiver_rows) {
            writer.sample(name, row.labels, static_cast<double>(row.stats.*field));
        }
    };
    receiver_family("sigroute_receiver_requests_total", "Export requests received",
                    &TransportStats::requests);
    receiver_family("sigroute_receiver_accepted_signals_total",
                    "Signals accepted into a pipeline", &TransportStats::accepted_signals);
    receiver_family("sigroute_receiver_refused_signals_total",
                    "Signals refused because no pipeline was running",
                    &TransportStats::refused_signals);
    receiver_family("sigroute_receiver_decode_errors_total", "Malformed export requests",
                    &TransportStats::decode_errors);

    std::vector<std::pair<Labels, PipelineStats>> pipeline_rows;
    for (const auto& pipeline : pipelines_) {
        pipeline_rows.emplace_back(Labels{{"pipeline", pipeline->settings().id}},
                                   pipeline->stats());
    }

    auto pipeline_family = [&](const std::string& name, const std::string& type,
                               const std::string& help, uint64_t PipelineStats::*field) {
        writer.family(name, type, help);
        for (const auto& row : pipeline_rows) {
            writer.sample(name, row.first, static_cast<double>(row.second.*field));
        }
    };
    pipeline_family("sigroute_pipeline_signals_received_total", "counter",
                    "Signals entering the pipeline", &PipelineStats::signals_received);
    pipeline_family("sigroute_pipeline_signals_refused_total", "counter",
                    "Signals refused while not running", &PipelineStats::signals_refused);
    pipeline_family("sigroute_pipeline_signals_dropped_total", "counter",
                    "Signals removed by processors", &PipelineStats::signals_dropped);
    pipeline_family("sigroute_pipeline_batches_dispatched_total", "counter",
                    "Batches handed to the exporters", &PipelineStats::batches_dispatched);
    pipeline_family("sigroute_pipeline_batches_delivered_total", "counter",
                    "Batches delivered under the delivery policy",
                    &PipelineStats::batches_delivered);
    pipeline_family("sigroute_pipeline_batches_failed_total", "counter",
                    "Batches not delivered", &PipelineStats::batches_failed);
    pipeline_family("sigroute_pipeline_batches_abandoned_total", "counter",
                    "Batches with deliveries abandoned at the drain deadline",
                    &PipelineStats::batches_abandoned);
    pipeline_family("sigroute_pipeline_batches_in_flight", "gauge",
                    "Batches awaiting exporter outcomes", &PipelineStats::in_flight);

    std::vector<std::pair<Labels, ExporterStats>> exporter_rows;
    for (const auto& pipeline : pipelines_) {
        for (const auto& [exporter, stats] : pipeline->exporter_stats()) {
            exporter_rows.emplace_back(
                Labels{{"pipeline", pipeline->settings().id}, {"exporter", exporter}}, stats);
        }
    }

    auto exporter_family = [&](const std::string& name, const std::string& type,
                               const std::string& help, uint64_t ExporterStats::*field) {
        writer.family(name, type, help);
        for (const auto& row : exporter_rows) {
            writer.sample(name, row.first, static_cast<double>(row.second.*field));
        }
    };
    exporter_family("sigroute_exporter_batches_sent_total", "counter",
                    "Batches delivered by the exporter", &ExporterStats::batches_sent);
    exporter_family("sigroute_exporter_batches_failed_total", "counter",
                    "Batches the exporter failed to deliver", &ExporterStats::batches_failed);
    exporter_family("sigroute_exporter_signals_sent_total", "counter",
                    "Signals delivered by the exporter", &ExporterStats::signals_sent);
    exporter_family("sigroute_exporter_signals_failed_total", "counter",
                    "Signals the exporter failed to deliver", &ExporterStats::signals_failed);
    exporter_family("sigroute_exporter_retries_total", "counter", "Retried export attempts",
                    &ExporterStats::retries);
    exporter_family("sigroute_exporter_drain_timeouts_total", "counter",
                    "Deliveries abandoned at the drain deadline", &ExporterStats::drain_timeouts);
    exporter_family("sigroute_exporter_latency_milliseconds_total", "counter",
                    "Time spent delivering batches, retries included",
                    &ExporterStats::latency_ms_total);
    exporter_family("sigroute_exporter_last_latency_milliseconds", "gauge",
                    "Delivery time of the most recent batch", &ExporterStats::last_latency_ms);

    return writer.str();
}

}  // namespace sigroute

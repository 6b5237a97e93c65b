// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/signal.hpp"

#include <sstream>

namespace sigroute {

const char* to_string(SignalType type) {
    switch (type) {
        case SignalType::Traces: return "traces";
        case SignalType::Metrics: return "metrics";
        case SignalType::Logs: return "logs";
    }
    return "unknown";
}

std::optional<SignalType> signal_type_from_string(const std::string& name) {
    if (name == "traces") return SignalType::Traces;
    if (name == "metrics") return SignalType::Metrics;
    if (name == "logs") return SignalType::Logs;
    return std::nullopt;
}

std::string attribute_to_string(const AttributeValue& value) {
    struct Visitor {
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(int64_t v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
    };
    return std::visit(Visitor{}, value);
}

std::string Resource::service_name() const {
    auto it = attributes.find("service.name");
    if (it == attributes.end()) {
        return {};
    }
    return attribute_to_string(it->second);
}

const Attributes& Signal::attributes() const {
    switch (type) {
        case SignalType::Traces: return span().attributes;
        case SignalType::Metrics: return metric().attributes;
        case SignalType::Logs: return log().attributes;
    }
    return span().attributes;
}

Attributes& Signal::mutable_attributes() {
    switch (type) {
        case SignalType::Traces: return std::get<Span>(payload).attributes;
        case SignalType::Metrics: return std::get<MetricPoint>(payload).attributes;
        case SignalType::Logs: return std::get<LogRecord>(payload).attributes;
    }
    return std::get<Span>(payload).attributes;
}

Signal make_signal(Span span, uint64_t timestamp_ns,
                   std::shared_ptr<const Resource> resource,
                   std::shared_ptr<const Scope> scope) {
    Signal signal;
    signal.type = SignalType::Traces;
    signal.timestamp_ns = timestamp_ns;
    signal.resource = std::move(resource);
    signal.scope = std::move(scope);
    signal.payload = std::move(span);
    return signal;
}

Signal make_signal(MetricPoint point, uint64_t timestamp_ns,
                   std::shared_ptr<const Resource> resource,
                   std::shared_ptr<const Scope> scope) {
    Signal signal;
    signal.type = SignalType::Metrics;
    signal.timestamp_ns = timestamp_ns;
    signal.resource = std::move(resource);
    signal.scope = std::move(scope);
    signal.payload = std::move(point);
    return signal;
}

Signal make_signal(LogRecord record, uint64_t timestamp_ns,
                   std::shared_ptr<const Resource> resource,
                   std::shared_ptr<const Scope> scope) {
    Signal signal;
    signal.type = SignalType::Logs;
    signal.timestamp_ns = timestamp_ns;
    signal.resource = std::move(resource);
    signal.scope = std::move(scope);
    signal.payload = std::move(record);
    return signal;
}

std::string to_hex(const std::string& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0f]);
    }
    return out;
}

}  // namespace sigroute

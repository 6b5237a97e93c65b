// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/prometheus_text.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace sigroute {

namespace {

std::string sanitize(const std::string& name, bool allow_colon) {
    std::string out;
    out.reserve(name.size() + 4);
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '_' || (allow_colon && c == ':')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('_');
        }
    }
    if (out.empty()) {
        return "_";
    }
    if (std::isdigit(static_cast<unsigned char>(out[0]))) {
        out = "key_" + out;
    }
    return out;
}

std::string escape_help(const std::string& help) {
    std::string out;
    for (char c : help) {
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '\n') {
            out += "\\n";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace

std::string sanitize_metric_name(const std::string& name) {
    return sanitize(name, true);
}

std::string sanitize_label_name(const std::string& name) {
    return sanitize(name, false);
}

std::string escape_label_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

std::string format_value(double value) {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "+Inf" : "-Inf";

    char buf[32];
    for (int precision = 15; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) {
            break;
        }
    }
    return buf;
}

void PrometheusTextWriter::family(const std::string& name, const std::string& type,
                                  const std::string& help) {
    if (!help.empty()) {
        out_ << "# HELP " << name << " " << escape_help(help) << "\n";
    }
    out_ << "# TYPE " << name << " " << type << "\n";
}

void PrometheusTextWriter::sample(const std::string& name, const Labels& labels, double value) {
    out_ << name;
    if (!labels.empty()) {
        out_ << "{";
        for (size_t i = 0; i < labels.size(); ++i) {
            if (i > 0) out_ << ",";
            out_ << labels[i].first << "=\"" << escape_label_value(labels[i].second) << "\"";
        }
        out_ << "}";
    }
    out_ << " " << format_value(value) << "\n";
}

}  // namespace sigroute

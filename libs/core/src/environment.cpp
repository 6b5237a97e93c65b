// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/environment.hpp"
#include "sigroute/errors.hpp"

extern char** environ;

namespace sigroute {

Environment::Environment(std::map<std::string, std::string> variables)
    : variables_(std::move(variables)) {
}

Environment Environment::from_process() {
    std::map<std::string, std::string> vars;
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        vars.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return Environment(std::move(vars));
}

std::optional<std::string> Environment::get(const std::string& name) const {
    auto it = variables_.find(name);
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Environment::expand(const std::string& text,
                                std::map<std::string, int>* missing) const {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c != '$') {
            out.push_back(c);
            ++i;
            continue;
        }

        if (i + 1 < text.size() && text[i + 1] == '$') {
            out.push_back('$');
            i += 2;
            continue;
        }

        if (i + 1 < text.size() && text[i + 1] == '{') {
            auto close = text.find('}', i + 2);
            if (close == std::string::npos) {
                throw ConfigError("unterminated placeholder in '" + text + "'");
            }
            std::string name = text.substr(i + 2, close - i - 2);
            if (name.rfind("env:", 0) == 0) {
                name = name.substr(4);
            }
            if (name.empty()) {
                throw ConfigError("empty placeholder in '" + text + "'");
            }

            auto value = get(name);
            if (value) {
                out += *value;
            } else if (missing) {
                (*missing)[name]++;
            }
            i = close + 1;
            continue;
        }

        out.push_back(c);
        ++i;
    }
    return out;
}

}  // namespace sigroute

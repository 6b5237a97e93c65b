// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file environment.hpp
/// @brief Immutable snapshot of environment variables
///
/// Credentials are injected into the configuration through ${env:NAME}
/// placeholders. The snapshot is taken once at startup and handed to the
/// config loader explicitly; nothing reads the process environment later.

#include <map>
#include <optional>
#include <string>

namespace sigroute {

class Environment {
public:
    Environment() = default;
    explicit Environment(std::map<std::string, std::string> variables);

    /// Snapshot of the current process environment
    static Environment from_process();

    std::optional<std::string> get(const std::string& name) const;

    /// Expand ${env:NAME} and ${NAME} placeholders; "$$" yields a literal "$".
    /// Undefined variables expand to the empty string and are reported
    /// through the optional missing list.
    std::string expand(const std::string& text,
                       std::map<std::string, int>* missing = nullptr) const;

private:
    std::map<std::string, std::string> variables_;
};

}  // namespace sigroute

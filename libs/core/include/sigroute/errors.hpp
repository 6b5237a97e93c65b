// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Error taxonomy
///
/// DecodeError and ConfigError are thrown: a decode error unwinds to the
/// receiver handling the request, a config error unwinds to main.
/// Export failures cross thread boundaries and are reported as values
/// carrying an ErrorKind (see ExportOutcome).

#include <stdexcept>
#include <string>

namespace sigroute {

enum class ErrorKind {
    None,
    Decode,
    Config,
    ExportTransient,
    ExportTerminal,
    DrainTimeout
};

/// @return Stable name used in logs and metric labels
const char* to_string(ErrorKind kind);

/// Base class of all thrown sigroute errors
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/// Malformed inbound payload. Scoped to one request.
class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& message)
        : Error(ErrorKind::Decode, message) {}
};

/// Invalid or incomplete configuration. Fatal at startup.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorKind::Config, message) {}
};

}  // namespace sigroute

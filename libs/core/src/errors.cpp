// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/errors.hpp"

namespace sigroute {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Decode: return "decode_error";
        case ErrorKind::Config: return "config_error";
        case ErrorKind::ExportTransient: return "export_transient_error";
        case ErrorKind::ExportTerminal: return "export_terminal_error";
        case ErrorKind::DrainTimeout: return "drain_timeout_error";
    }
    return "unknown";
}

}  // namespace sigroute

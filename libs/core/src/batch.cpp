// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/batch.hpp"

namespace sigroute {

const char* to_string(FlushReason reason) {
    switch (reason) {
        case FlushReason::Size: return "size";
        case FlushReason::Timeout: return "timeout";
        case FlushReason::Forced: return "forced";
        case FlushReason::Shutdown: return "shutdown";
        case FlushReason::Passthrough: return "passthrough";
    }
    return "unknown";
}

}  // namespace sigroute

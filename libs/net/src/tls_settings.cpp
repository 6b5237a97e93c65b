// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sigroute/tls_settings.hpp"

#include <glog/logging.h>

#include <fstream>
#include <sstream>

namespace sigroute {

std::optional<std::string> read_pem_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG(ERROR) << "Cannot open " << path;
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (contents.str().empty()) {
        LOG(ERROR) << "Empty PEM file " << path;
        return std::nullopt;
    }
    return contents.str();
}

}  // namespace sigroute

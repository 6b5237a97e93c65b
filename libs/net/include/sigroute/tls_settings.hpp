// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file tls_settings.hpp
/// @brief Transport security settings shared by the gRPC and HTTP exporters

#include <optional>
#include <string>

namespace sigroute {

struct TlsSettings {
    /// Plaintext transport when true
    bool insecure = false;
    /// Accept any server certificate (HTTP client only)
    bool insecure_skip_verify = false;
    /// PEM bundle used to verify the server, system roots when empty
    std::string ca_file;
    /// Client certificate and key for mutual TLS
    std::string cert_file;
    std::string key_file;
    /// Override for SNI and certificate host name checks
    std::string server_name_override;
};

/// Read a PEM file into memory
/// @return File contents, nullopt if it cannot be read (logged)
std::optional<std::string> read_pem_file(const std::string& path);

}  // namespace sigroute

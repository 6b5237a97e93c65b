// Copyright 2025 sigroute Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file duration.hpp
/// @brief Parsing of Go-style duration strings ("200ms", "5s", "1m30s")

#include <chrono>
#include <string>

namespace sigroute {

/// Parse a duration string.
///
/// Accepts a sequence of <number><unit> pairs where unit is one of
/// ns, us, ms, s, m, h. Fractions are allowed ("1.5s"). The bare string "0"
/// is zero.
///
/// @throws ConfigError on empty input, missing unit or unknown unit
std::chrono::nanoseconds parse_duration(const std::string& text);

/// Format a duration with the largest unit that divides it exactly
std::string format_duration(std::chrono::nanoseconds duration);

}  // namespace sigroute

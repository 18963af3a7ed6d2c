// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file line_stamper.hpp
/// @brief Timestamp prefixing for logstamp

#include "logship/filters.hpp"

#include <cstddef>
#include <istream>
#include <ostream>

namespace logship::cli {

/// Copy input to output, prefixing each line with clock() and a space.
/// Line endings are kept as they were: a final line without a newline is
/// written without one. Output is flushed after every line.
/// @return Number of lines written
size_t stamp_lines(std::istream& input, std::ostream& output, const Clock& clock = now_timestamp);

}  // namespace logship::cli

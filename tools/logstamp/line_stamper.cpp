// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "line_stamper.hpp"

#include <string>

namespace logship::cli {

size_t stamp_lines(std::istream& input, std::ostream& output, const Clock& clock) {
    size_t lines = 0;
    std::string line;
    while (std::getline(input, line)) {
        output << clock() << ' ' << line;
        // getline only hits EOF when the last line had no terminator
        if (!input.eof()) {
            output << '\n';
        }
        output.flush();
        ++lines;
    }
    return lines;
}

}  // namespace logship::cli

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief logstamp - prefixes every stdin line with the current UTC timestamp
///
/// Usage:
///   some_command | logstamp
///   2025-05-13T10:37:56.766743Z some output

#include "line_stamper.hpp"

#include <glog/logging.h>

#include <iostream>

int main(int argc, char* argv[]) {
    (void)argc;
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    size_t lines = logship::cli::stamp_lines(std::cin, std::cout);
    VLOG(1) << "Stamped " << lines << " lines";
    return 0;
}

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief logtag - runs stdin through a filter pipeline and prints each event
///        as one JSON document per line
///
/// Usage:
///   echo 'status=200 path=/x' | logtag --filters_append=parse_lograge

#include "logship_config.hpp"

#include "logship/errors.hpp"
#include "logship/filter_registry.hpp"
#include "logship/filters.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <iostream>

DEFINE_string(filters, logship::cli::kDefaultFilters, "Filter chain description");
DEFINE_string(filters_append, "",
              "Whitespace separated filter descriptions appended to --filters, "
              "e.g. \"parse_lograge add_tags:web\"");

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Filter log lines from stdin and print them as JSON events");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    logship::Pipeline pipeline;
    try {
        logship::FilterRegistry registry;
        logship::register_builtin_filters(registry);
        pipeline = registry.build(
            logship::cli::filter_description(
                FLAGS_filters, logship::cli::split_description_list(FLAGS_filters_append)));
    } catch (const logship::ConfigError& e) {
        LOG(ERROR) << "Configuration error: " << e.what();
        return 1;
    }

    pipeline.run(std::cin, [](logship::Event event) {
        std::cout << logship::dump_event(event) << std::endl;
    });

    gflags::ShutDownCommandLineFlags();
    return 0;
}

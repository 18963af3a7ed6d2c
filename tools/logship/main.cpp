// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief logship - reads log lines on stdin, filters them into events and
///        ships every event to the configured sinks
///
/// Architecture:
///   stdin -> filter pipeline -> Fanout -> redis / statsd / stdout / null
///
/// Usage:
///   tail -F access.log | logship --filters_append=parse_lograge \
///       --sinks="redis,redis://queue-a:6379,redis://queue-b:6379 statsd,metric=%{@fields.status}"
///   logship --config=/etc/logship.yaml

#include "logship_config.hpp"

#include "logship/errors.hpp"
#include "logship/filter_registry.hpp"
#include "logship/filters.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <iostream>
#include <optional>
#include <string>

DEFINE_string(config, "", "YAML configuration file");
DEFINE_string(filters, logship::cli::kDefaultFilters, "Filter chain description");
DEFINE_string(filters_append, "",
              "Whitespace separated filter descriptions appended to --filters, "
              "e.g. \"parse_lograge add_tags:web\"");
DEFINE_string(sinks, logship::cli::kDefaultSink,
              "Whitespace separated sink descriptions, e.g. \"redis,redis://host:6379 null\"");

namespace {

// Only flags given on the command line override the config file
std::optional<std::string> explicit_flag(const char* name, const std::string& value) {
    if (gflags::GetCommandLineFlagInfoOrDie(name).is_default) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("Ship log lines from stdin to Redis, statsd and other sinks");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    logship::cli::FlagOverrides overrides;
    overrides.filters = explicit_flag("filters", FLAGS_filters);
    overrides.filters_append = explicit_flag("filters_append", FLAGS_filters_append);
    overrides.sinks = explicit_flag("sinks", FLAGS_sinks);

    std::optional<std::string> config_path;
    if (!FLAGS_config.empty()) {
        config_path = FLAGS_config;
    }

    logship::Pipeline pipeline;
    logship::sinks::Fanout fanout;
    try {
        logship::cli::ShipperConfig config = logship::cli::resolve_config(config_path, overrides);
        logship::cli::log_config(config);

        logship::FilterRegistry filter_registry;
        logship::register_builtin_filters(filter_registry);
        pipeline = filter_registry.build(logship::cli::filter_description(config));

        logship::sinks::SinkRegistry sink_registry;
        logship::sinks::register_builtin_sinks(sink_registry);
        fanout = logship::cli::build_fanout(sink_registry, config.sinks);
    } catch (const logship::ConfigError& e) {
        LOG(ERROR) << "Configuration error: " << e.what();
        return 1;
    }

    LOG(INFO) << "logship running with " << pipeline.size() << " filters and " << fanout.size()
              << " sinks";

    size_t lines = pipeline.run(std::cin, [&fanout](logship::Event event) {
        fanout.ship(event);
    });

    LOG(INFO) << "Input closed after " << lines << " lines";
    fanout.log_stats();

    gflags::ShutDownCommandLineFlags();
    return 0;
}

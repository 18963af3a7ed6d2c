// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file logship_config.hpp
/// @brief logship driver configuration: YAML file plus command line overrides
///
/// Example config file:
///   filters: init_txt,add_timestamp,add_source_host
///   filters_append:
///     - parse_lograge
///   sinks:
///     - redis,redis://queue-a:6379/0,redis://queue-b:6379/0,bulk=true
///     - statsd,metric=%{@source_host}.nginx.%{@fields.status}

#include "fanout.hpp"
#include "sink_registry.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace logship::cli {

constexpr const char* kDefaultFilters = "init_txt,add_timestamp,add_source_host";
constexpr const char* kDefaultSink = "redis,redis://localhost:6379";

struct ShipperConfig {
    std::string filters = kDefaultFilters;
    std::vector<std::string> filters_append;
    std::vector<std::string> sinks = {kDefaultSink};
};

/// Values given explicitly on the command line; they win over the file
struct FlagOverrides {
    std::optional<std::string> filters;
    std::optional<std::string> filters_append;  ///< Whitespace separated descriptions
    std::optional<std::string> sinks;           ///< Whitespace separated descriptions
};

/// Apply the keys present in a YAML document
/// @throws ConfigError for unknown keys or wrongly typed values
void apply_yaml(const YAML::Node& yaml, ShipperConfig& config);

/// Load a YAML file on top of the defaults
/// @throws ConfigError if the file cannot be read or parsed
ShipperConfig load_config_file(const std::string& path);

/// Defaults, then the config file (if any), then explicit flags
/// @throws ConfigError
ShipperConfig resolve_config(const std::optional<std::string>& config_path,
                             const FlagOverrides& overrides);

/// Filters plus every appended description, comma joined
std::string filter_description(const std::string& filters,
                               const std::vector<std::string>& filters_append);
std::string filter_description(const ShipperConfig& config);

/// Split a whitespace separated list of filter or sink descriptions
std::vector<std::string> split_description_list(const std::string& text);

/// Build every sink, in order
/// @throws ConfigError naming the first bad sink description
sinks::Fanout build_fanout(const sinks::SinkRegistry& registry,
                           const std::vector<std::string>& descriptions);

/// Log the effective configuration at INFO
void log_config(const ShipperConfig& config);

}  // namespace logship::cli

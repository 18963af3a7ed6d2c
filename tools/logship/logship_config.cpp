// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship_config.hpp"

#include "logship/errors.hpp"

#include <glog/logging.h>

#include <sstream>

namespace logship::cli {

namespace {

// A scalar or a sequence of scalars
std::vector<std::string> as_string_list(const YAML::Node& node, const char* key) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw ConfigError(std::string("Config key \"") + key + "\" must list strings");
            }
            out.push_back(item.as<std::string>());
        }
    } else if (!node.IsNull()) {
        throw ConfigError(std::string("Config key \"") + key +
                          "\" must be a string or a list of strings");
    }
    return out;
}

}  // namespace

void apply_yaml(const YAML::Node& yaml, ShipperConfig& config) {
    if (!yaml || yaml.IsNull()) {
        return;
    }
    if (!yaml.IsMap()) {
        throw ConfigError("Config file must be a mapping");
    }

    for (const auto& kv : yaml) {
        std::string key = kv.first.as<std::string>();
        const YAML::Node& value = kv.second;

        if (key == "filters") {
            if (!value.IsScalar()) {
                throw ConfigError("Config key \"filters\" must be a string");
            }
            config.filters = value.as<std::string>();
        } else if (key == "filters_append") {
            config.filters_append = as_string_list(value, "filters_append");
        } else if (key == "sinks") {
            config.sinks = as_string_list(value, "sinks");
        } else {
            throw ConfigError("Unknown config key \"" + key + "\"");
        }
    }
}

ShipperConfig load_config_file(const std::string& path) {
    ShipperConfig config;
    try {
        apply_yaml(YAML::LoadFile(path), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to load config file " + path + ": " + e.what());
    }
    LOG(INFO) << "Loaded configuration from " << path;
    return config;
}

ShipperConfig resolve_config(const std::optional<std::string>& config_path,
                             const FlagOverrides& overrides) {
    ShipperConfig config = config_path ? load_config_file(*config_path) : ShipperConfig{};

    if (overrides.filters) {
        config.filters = *overrides.filters;
    }
    if (overrides.filters_append) {
        config.filters_append = split_description_list(*overrides.filters_append);
    }
    if (overrides.sinks) {
        config.sinks = split_description_list(*overrides.sinks);
    }
    return config;
}

std::string filter_description(const std::string& filters,
                               const std::vector<std::string>& filters_append) {
    std::string out = filters;
    for (const auto& extra : filters_append) {
        if (extra.empty()) {
            continue;
        }
        out += out.empty() ? extra : "," + extra;
    }
    return out;
}

std::string filter_description(const ShipperConfig& config) {
    return filter_description(config.filters, config.filters_append);
}

std::vector<std::string> split_description_list(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string description;
    while (in >> description) {
        out.push_back(description);
    }
    return out;
}

sinks::Fanout build_fanout(const sinks::SinkRegistry& registry,
                           const std::vector<std::string>& descriptions) {
    if (descriptions.empty()) {
        throw ConfigError("No sinks configured");
    }

    sinks::Fanout fanout;
    for (const auto& description : descriptions) {
        fanout.add(registry.build(description));
    }
    return fanout;
}

void log_config(const ShipperConfig& config) {
    LOG(INFO) << "=== logship Configuration ===";
    LOG(INFO) << "Filters: " << filter_description(config);
    for (const auto& sink : config.sinks) {
        LOG(INFO) << "Sink: " << sink;
    }
}

}  // namespace logship::cli

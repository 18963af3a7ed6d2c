// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file filters.hpp
/// @brief Built-in filters
///
/// Init filters (init_txt, init_json) take raw lines and produce events.
/// Every other built-in takes an event and emits it, enriched, exactly once.
/// Items of the wrong kind are logged and dropped.

#include "logship/filter_registry.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace logship {

/// Source of @timestamp values, replaceable in tests
using Clock = std::function<std::string()>;

/// Install init_txt, init_json, add_timestamp, add_source_host, add_fields,
/// add_tags and parse_lograge
/// @throws DuplicateFilterError if any of them is already registered
void register_builtin_filters(FilterRegistry& registry);

namespace filters {

/// {@message: line} with trailing newlines stripped
Filter init_txt();

/// Parse the line as a JSON object
Filter init_json();

/// Set @timestamp from clock unless present (or override)
Filter add_timestamp(bool override_existing, Clock clock = now_timestamp);

/// Set @source_host to host unless present (or override)
Filter add_source_host(bool override_existing, std::string host);

/// Merge fields into @fields
Filter add_fields(std::vector<std::pair<std::string, std::string>> fields);

/// Append tags to @tags
Filter add_tags(std::vector<std::string> tags);

/// Split @message into key=value pairs merged into @fields
Filter parse_lograge();

}  // namespace filters

}  // namespace logship

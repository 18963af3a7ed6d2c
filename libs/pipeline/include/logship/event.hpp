// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file event.hpp
/// @brief Structured log event and helpers shared by filters and sinks
///
/// An Event is an ordered JSON mapping. Raw input lines travel through the
/// pipeline as JSON strings until an init filter turns them into objects.

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace logship {

/// Ordered so that output keeps the order fields were added in
using Event = nlohmann::ordered_json;

/// Downstream callback receiving each item a stage produces
using Emit = std::function<void(Event)>;

/// Reserved event keys
namespace keys {
constexpr const char* kMessage = "@message";
constexpr const char* kTimestamp = "@timestamp";
constexpr const char* kSourceHost = "@source_host";
constexpr const char* kFields = "@fields";
constexpr const char* kTags = "@tags";
}  // namespace keys

/// Look up a field by path.
///
/// The literal key is tried first ("@fields.status" as one key), then the
/// path is split on '.' and each component descends one nested mapping.
/// @return Pointer into event, or nullptr if any component is missing
const Event* lookup_field(const Event& event, const std::string& path);

/// Render a value the way it appears in metric names and log text:
/// strings raw, everything else as compact JSON
std::string to_plain_string(const Event& value);

/// Serialize as one compact JSON document. Invalid UTF-8 is replaced.
std::string dump_event(const Event& event);

/// Format a time point as YYYY-MM-DDTHH:MM:SS.ffffffZ (UTC)
std::string format_timestamp(std::chrono::system_clock::time_point tp);

/// Current UTC time in the @timestamp format
std::string now_timestamp();

/// Fully qualified domain name of this host, falling back to the hostname
std::string source_host_fqdn();

}  // namespace logship

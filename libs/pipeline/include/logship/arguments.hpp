// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file arguments.hpp
/// @brief Description grammar and typed argument bundles
///
/// Filter and sink descriptions are short strings such as
///   "init_txt,add_tags:web:prod,add_fields:env=prod"
///   "redis,redis://a:6379,redis://b:6379,bulk=true"
/// Each argument containing '=' is a keyword argument (split on the first
/// '='), anything else is positional. Clauses follow CSV quoting rules.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace logship {

/// Positional and keyword arguments parsed from a description clause
struct Arguments {
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> keywords;

    /// Classify a raw argument as keyword (contains '=') or positional
    void add(const std::string& raw);

    /// Set a keyword, replacing an earlier value for the same key
    void set_keyword(const std::string& key, const std::string& value);

    bool has(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;

    /// Parse a "true"/"false" keyword
    /// @throws ConfigError if the value is anything else
    bool get_bool(const std::string& key, bool fallback) const;

    /// Parse a non-negative integer keyword
    /// @throws ConfigError if the value is not a number
    uint64_t get_uint(const std::string& key, uint64_t fallback) const;

    bool empty() const { return positional.empty() && keywords.empty(); }
};

/// Declared parameter shape of a filter or sink
struct ParameterShape {
    static constexpr size_t kUnbounded = std::numeric_limits<size_t>::max();

    std::vector<std::string> keywords;  ///< Accepted keyword names
    std::vector<std::string> required;  ///< Keywords that must be supplied
    size_t min_positional = 0;
    size_t max_positional = 0;
    bool any_keyword = false;           ///< Accept keywords not listed above
};

/// Check arguments against a shape
/// @param owner Filter or sink name, used in the error message
/// @throws ConfigError naming every unknown or missing parameter
void validate_arguments(const std::string& owner,
                        const ParameterShape& shape,
                        const Arguments& args);

/// Split text on a delimiter following CSV quoting rules.
///
/// A field starting with '"' runs to the matching quote; "" inside a quoted
/// field is a literal quote. An empty input yields no fields.
std::vector<std::string> split_clauses(const std::string& text, char delimiter);

/// Parse "true" or "false"
/// @throws ConfigError for any other value
bool parse_bool(const std::string& key, const std::string& value);

}  // namespace logship

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/arguments.hpp"
#include "logship/errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace logship {

void Arguments::add(const std::string& raw) {
    size_t eq = raw.find('=');
    if (eq == std::string::npos) {
        positional.push_back(raw);
    } else {
        set_keyword(raw.substr(0, eq), raw.substr(eq + 1));
    }
}

void Arguments::set_keyword(const std::string& key, const std::string& value) {
    for (auto& kv : keywords) {
        if (kv.first == key) {
            kv.second = value;
            return;
        }
    }
    keywords.emplace_back(key, value);
}

bool Arguments::has(const std::string& key) const {
    return get(key).has_value();
}

std::optional<std::string> Arguments::get(const std::string& key) const {
    for (const auto& kv : keywords) {
        if (kv.first == key) {
            return kv.second;
        }
    }
    return std::nullopt;
}

std::string Arguments::get_or(const std::string& key, const std::string& fallback) const {
    auto value = get(key);
    return value ? *value : fallback;
}

bool Arguments::get_bool(const std::string& key, bool fallback) const {
    auto value = get(key);
    if (!value) {
        return fallback;
    }
    return parse_bool(key, *value);
}

uint64_t Arguments::get_uint(const std::string& key, uint64_t fallback) const {
    auto value = get(key);
    if (!value) {
        return fallback;
    }
    if (value->empty() || !std::all_of(value->begin(), value->end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        throw ConfigError("Invalid value for " + key + ": \"" + *value +
                          "\" (expected a non-negative integer)");
    }
    try {
        return std::stoull(*value);
    } catch (const std::out_of_range&) {
        throw ConfigError("Value for " + key + " out of range: " + *value);
    }
}

void validate_arguments(const std::string& owner,
                        const ParameterShape& shape,
                        const Arguments& args) {
    std::vector<std::string> problems;

    if (args.positional.size() > shape.max_positional) {
        if (shape.max_positional == 0) {
            problems.push_back("unexpected positional arguments");
        } else {
            problems.push_back("at most " + std::to_string(shape.max_positional) +
                               " positional arguments allowed, got " +
                               std::to_string(args.positional.size()));
        }
    }
    if (args.positional.size() < shape.min_positional) {
        problems.push_back("at least " + std::to_string(shape.min_positional) +
                           " positional arguments required, got " +
                           std::to_string(args.positional.size()));
    }

    if (!shape.any_keyword) {
        for (const auto& kv : args.keywords) {
            if (std::find(shape.keywords.begin(), shape.keywords.end(), kv.first) ==
                shape.keywords.end()) {
                problems.push_back("unknown parameter \"" + kv.first + "\"");
            }
        }
    }

    for (const auto& key : shape.required) {
        if (!args.has(key)) {
            problems.push_back("missing required parameter \"" + key + "\"");
        }
    }

    if (problems.empty()) {
        return;
    }

    std::ostringstream msg;
    msg << "Invalid arguments to " << owner << ": ";
    for (size_t i = 0; i < problems.size(); ++i) {
        msg << (i ? "; " : "") << problems[i];
    }
    throw ConfigError(msg.str());
}

std::vector<std::string> split_clauses(const std::string& text, char delimiter) {
    std::vector<std::string> out;
    if (text.empty()) {
        return out;
    }

    std::string field;
    bool in_quotes = false;
    bool at_field_start = true;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                // "" inside a quoted field is a literal quote
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }

        if (c == '"' && at_field_start) {
            in_quotes = true;
            at_field_start = false;
            continue;
        }

        if (c == delimiter) {
            out.push_back(field);
            field.clear();
            at_field_start = true;
            continue;
        }

        field.push_back(c);
        at_field_start = false;
    }

    out.push_back(field);
    return out;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw ConfigError("Invalid value for " + key + ": \"" + value + "\" (expected true or false)");
}

}  // namespace logship

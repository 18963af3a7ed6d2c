// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file filter_registry.hpp
/// @brief Named filters and their composition into a streaming pipeline
///
/// A filter consumes one item and emits zero or more items downstream.
/// A Pipeline chains filters depth-first: every item produced by stage N is
/// pushed through stage N+1 before stage N sees its next input, so exactly
/// one input item is in flight at a time and nothing is buffered.
///
/// Usage:
///   FilterRegistry registry;
///   register_builtin_filters(registry);
///   Pipeline pipeline = registry.build("init_txt,add_timestamp");
///   pipeline.run(std::cin, [](Event event) { ... });

#include "logship/arguments.hpp"
#include "logship/event.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace logship {

/// Transformation of one item into zero or more items
using Filter = std::function<void(Event item, const Emit& emit)>;

/// Builds a filter bound to its (already validated) arguments
using FilterFactory = std::function<Filter(const Arguments& args)>;

/// A filter name plus its unparsed-then-classified arguments
struct FilterSpec {
    std::string name;
    Arguments args;
};

/// Parse a filter description into specs.
///
/// "a:x:k=v,b" -> [{a, positional [x], keywords {k: v}}, {b}]
/// @throws ConfigError if the description is empty
std::vector<FilterSpec> parse_filter_description(const std::string& description);

/// One bound filter in a pipeline
struct PipelineStage {
    std::string name;
    Filter filter;
};

/// Ordered composition of bound filters
class Pipeline {
public:
    Pipeline() = default;
    explicit Pipeline(std::vector<PipelineStage> stages);

    /// Feed one item through every stage, emitting each final result in order
    void push(Event item, const Emit& emit) const;

    /// Feed one raw input line
    void push_line(const std::string& line, const Emit& emit) const;

    /// Stream lines from input until EOF
    /// @return Number of lines read
    size_t run(std::istream& input, const Emit& emit) const;

    /// Names of the stages, in order
    std::vector<std::string> stage_names() const;

    size_t size() const { return stages_.size(); }
    bool empty() const { return stages_.empty(); }

private:
    void feed(size_t index, Event item, const Emit& emit) const;

    std::vector<PipelineStage> stages_;
};

/// Name -> filter factory table.
///
/// Registries are plain objects: the driver builds one at startup and tests
/// build a fresh one each.
class FilterRegistry {
public:
    /// Register a filter with a declared parameter shape
    /// @throws DuplicateFilterError if the name is taken
    void add(const std::string& name, ParameterShape shape, FilterFactory factory);

    /// Register a filter that takes no arguments
    /// @throws DuplicateFilterError if the name is taken
    void add(const std::string& name, Filter filter);

    bool contains(const std::string& name) const;

    /// Registered filter names, sorted
    std::vector<std::string> names() const;

    /// Resolve and bind one filter clause
    /// @throws UnknownFilterError, ConfigError
    Filter get(const FilterSpec& spec) const;

    /// Resolve a description into a pipeline. Every clause is resolved and
    /// validated before the pipeline is returned.
    /// @throws UnknownFilterError naming the first unresolvable filter
    /// @throws ConfigError for bad arguments or an empty description
    Pipeline build(const std::string& description) const;

private:
    struct Entry {
        ParameterShape shape;
        FilterFactory factory;
    };

    std::map<std::string, Entry> filters_;
};

}  // namespace logship

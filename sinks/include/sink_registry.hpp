// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file sink_registry.hpp
/// @brief Name -> sink factory table and sink description parsing
///
/// A sink description is a comma separated list whose first clause names the
/// sink; later clauses are key=value keywords or positional arguments:
///   redis,redis://queue-a:6379/0,redis://queue-b:6379/0,bulk=true
///   statsd,metric=%{@source_host}.nginx.%{@fields.status}

#include "sink.hpp"

#include "logship/arguments.hpp"
#include "logship/redis_connection.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace logship::sinks {

/// Builds a sink from validated arguments
using SinkFactory = std::function<std::unique_ptr<Sink>(const Arguments& args)>;

struct SinkSpec {
    std::string name;
    Arguments args;
};

class SinkRegistry {
public:
    /// @throws DuplicateSinkError if the name is taken
    void add(const std::string& name, ParameterShape shape, SinkFactory factory);

    /// @return false if no such sink was registered
    bool remove(const std::string& name);

    bool contains(const std::string& name) const;

    /// Registered sink names, sorted
    std::vector<std::string> names() const;

    /// Split a description into name and arguments
    /// @throws ConfigError if the description is empty
    SinkSpec parse(const std::string& description) const;

    /// Resolve, validate and construct a sink
    /// @throws UnknownSinkError, ConfigError
    std::unique_ptr<Sink> build(const std::string& description) const;

private:
    struct Entry {
        ParameterShape shape;
        SinkFactory factory;
    };

    std::map<std::string, Entry> sinks_;
};

/// Install redis, stdout, statsd, statsd_counter, statsd_timer and null
/// @param connection_factory Connections used by redis sinks
void register_builtin_sinks(SinkRegistry& registry,
                            ConnectionFactory connection_factory = make_redis_connection_factory());

}  // namespace logship::sinks

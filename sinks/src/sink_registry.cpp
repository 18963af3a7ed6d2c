// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sink_registry.hpp"

#include "console_sink.hpp"
#include "metrics_sink.hpp"
#include "null_sink.hpp"
#include "queue_sink.hpp"

#include "logship/endpoint.hpp"
#include "logship/errors.hpp"

#include <glog/logging.h>

#include <limits>

namespace logship::sinks {

void SinkRegistry::add(const std::string& name, ParameterShape shape, SinkFactory factory) {
    if (sinks_.count(name)) {
        throw DuplicateSinkError(name);
    }
    sinks_.emplace(name, Entry{std::move(shape), std::move(factory)});
}

bool SinkRegistry::remove(const std::string& name) {
    return sinks_.erase(name) > 0;
}

bool SinkRegistry::contains(const std::string& name) const {
    return sinks_.count(name) > 0;
}

std::vector<std::string> SinkRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(sinks_.size());
    for (const auto& kv : sinks_) {
        out.push_back(kv.first);
    }
    return out;
}

SinkSpec SinkRegistry::parse(const std::string& description) const {
    std::vector<std::string> clauses = split_clauses(description, ',');
    if (clauses.empty()) {
        throw ConfigError("Empty sink description");
    }

    SinkSpec spec;
    spec.name = clauses[0];
    for (size_t i = 1; i < clauses.size(); ++i) {
        spec.args.add(clauses[i]);
    }
    return spec;
}

std::unique_ptr<Sink> SinkRegistry::build(const std::string& description) const {
    SinkSpec spec = parse(description);

    auto it = sinks_.find(spec.name);
    if (it == sinks_.end()) {
        throw UnknownSinkError(spec.name);
    }

    validate_arguments(spec.name, it->second.shape, spec.args);
    return it->second.factory(spec.args);
}

namespace {

MetricsConfig metrics_config_from(const Arguments& args) {
    MetricsConfig config;
    config.metric = args.get_or("metric", "");
    config.host = args.get_or("host", config.host);
    uint64_t port = args.get_uint("port", config.port);
    if (port == 0 || port > 65535) {
        throw ConfigError("Invalid statsd port: " + std::to_string(port));
    }
    config.port = static_cast<uint16_t>(port);
    return config;
}

}  // namespace

void register_builtin_sinks(SinkRegistry& registry, ConnectionFactory connection_factory) {
    ParameterShape redis_shape;
    redis_shape.keywords = {"key", "bulk", "bulk_index", "bulk_type", "max_connections",
                            "timeout_ms"};
    redis_shape.min_positional = 1;
    redis_shape.max_positional = ParameterShape::kUnbounded;

    registry.add("redis", redis_shape, [connection_factory](const Arguments& args) {
        QueueSinkConfig config;
        config.key = args.get_or("key", config.key);
        config.encoder = encoder_config_from(args);
        config.max_connections_per_endpoint =
            args.get_uint("max_connections", std::numeric_limits<size_t>::max());
        if (config.max_connections_per_endpoint == 0) {
            throw ConfigError("max_connections must be at least 1");
        }

        uint64_t timeout_ms = args.get_uint("timeout_ms", 0);
        if (timeout_ms > std::numeric_limits<uint32_t>::max()) {
            throw ConfigError("timeout_ms out of range: " + std::to_string(timeout_ms));
        }
        for (const auto& url : args.positional) {
            Endpoint endpoint = parse_endpoint_url(url);
            endpoint.timeout_ms = static_cast<uint32_t>(timeout_ms);
            config.endpoints.push_back(std::move(endpoint));
        }
        return std::make_unique<QueueSink>(std::move(config), connection_factory);
    });

    ParameterShape stdout_shape;
    stdout_shape.keywords = {"bulk", "bulk_index", "bulk_type"};

    registry.add("stdout", stdout_shape, [](const Arguments& args) {
        return std::make_unique<ConsoleSink>(encoder_config_from(args));
    });

    ParameterShape counter_shape;
    counter_shape.keywords = {"metric", "host", "port"};
    counter_shape.required = {"metric"};

    auto counter_factory = [](const Arguments& args) -> std::unique_ptr<Sink> {
        return std::make_unique<MetricsCounterSink>(metrics_config_from(args));
    };
    registry.add("statsd", counter_shape, counter_factory);
    registry.add("statsd_counter", counter_shape, counter_factory);

    ParameterShape timer_shape;
    timer_shape.keywords = {"metric", "host", "port", "timed_field"};
    timer_shape.required = {"metric", "timed_field"};

    registry.add("statsd_timer", timer_shape, [](const Arguments& args) {
        return std::make_unique<MetricsTimerSink>(metrics_config_from(args),
                                                  args.get_or("timed_field", ""));
    });

    ParameterShape null_shape;
    null_shape.max_positional = ParameterShape::kUnbounded;
    null_shape.any_keyword = true;

    registry.add("null", null_shape, [](const Arguments&) {
        return std::make_unique<NullSink>();
    });

    VLOG(1) << "Registered " << registry.names().size() << " built-in sinks";
}

}  // namespace logship::sinks

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file metrics_sink.hpp
/// @brief statsd counter and timer sinks
///
/// The metric name is a template whose %{field.path} placeholders are filled
/// from each event, e.g. "%{@source_host}.nginx.%{@fields.status}".
/// Datagrams:
///   counter: <name>:1|c
///   timer:   <name>:<value>|ms

#include "sink.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace logship::sinks {

/// Metric name template, parsed once
class MetricTemplate {
public:
    explicit MetricTemplate(const std::string& pattern);

    /// Fill placeholders from an event
    /// @param missing Set to the first unresolved field path on failure
    /// @return Rendered name, or nullopt if a field is missing
    std::optional<std::string> render(const Event& event, std::string* missing = nullptr) const;

    const std::string& pattern() const { return pattern_; }

    /// Field paths referenced by the template, in order
    std::vector<std::string> fields() const;

private:
    struct Segment {
        bool is_field;
        std::string text;  ///< Literal text or field path
    };

    std::string pattern_;
    std::vector<Segment> segments_;
};

/// Configuration for metrics sinks
struct MetricsConfig {
    std::string metric;
    std::string host = "127.0.0.1";
    uint16_t port = 8125;
};

/// Shared UDP transport and templating for counter and timer sinks
class MetricsSink : public Sink {
public:
    ~MetricsSink() override;

    MetricsSink(const MetricsSink&) = delete;
    MetricsSink& operator=(const MetricsSink&) = delete;

    const MetricTemplate& metric() const { return metric_; }

protected:
    /// @throws ConfigError if the host cannot be resolved or the socket
    ///         cannot be created
    explicit MetricsSink(const MetricsConfig& config);

    std::optional<size_t> write(const Event& event) override;

    /// Value part of the datagram ("1|c"), or nullopt to drop the event
    virtual std::optional<std::string> value_for(const Event& event) = 0;

private:
    MetricsConfig config_;
    MetricTemplate metric_;
    int fd_ = -1;
};

/// Counts events: <name>:1|c
class MetricsCounterSink : public MetricsSink {
public:
    explicit MetricsCounterSink(const MetricsConfig& config);

    std::string name() const override { return "statsd_counter"; }

protected:
    std::optional<std::string> value_for(const Event& event) override;
};

/// Reports a numeric event field as a timing: <name>:<value>|ms
class MetricsTimerSink : public MetricsSink {
public:
    MetricsTimerSink(const MetricsConfig& config, std::string timed_field);

    std::string name() const override { return "statsd_timer"; }

protected:
    std::optional<std::string> value_for(const Event& event) override;

private:
    std::string timed_field_;
};

}  // namespace logship::sinks

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file queue_sink.hpp
/// @brief Sink pushing encoded events onto a Redis list
///
/// Each event becomes one LPUSH <key> <payload>, sent through a
/// ResilientClient so a failing endpoint is skipped in favour of the next.

#include "event_encoder.hpp"
#include "sink.hpp"

#include "logship/connection_pool.hpp"
#include "logship/resilient_client.hpp"

#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace logship::sinks {

/// Configuration for queue sink
struct QueueSinkConfig {
    std::vector<Endpoint> endpoints;
    std::string key = "logs";
    EncoderConfig encoder;
    size_t max_connections_per_endpoint = std::numeric_limits<size_t>::max();
};

class QueueSink : public Sink {
public:
    explicit QueueSink(QueueSinkConfig config,
                       ConnectionFactory factory = make_redis_connection_factory());

    QueueSink(const QueueSink&) = delete;
    QueueSink& operator=(const QueueSink&) = delete;

    std::string name() const override { return "redis"; }

    const QueueSinkConfig& config() const { return config_; }
    ConnectionPool& pool() { return *pool_; }

protected:
    std::optional<size_t> write(const Event& event) override;

private:
    QueueSinkConfig config_;
    EventEncoder encoder_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<ResilientClient> client_;
};

}  // namespace logship::sinks

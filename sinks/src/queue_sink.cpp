// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "queue_sink.hpp"

#include <glog/logging.h>

namespace logship::sinks {

QueueSink::QueueSink(QueueSinkConfig config, ConnectionFactory factory)
    : config_(std::move(config))
    , encoder_(config_.encoder) {
    PoolConfig pool_config;
    pool_config.max_connections_per_endpoint = config_.max_connections_per_endpoint;
    pool_ = std::make_unique<ConnectionPool>(config_.endpoints, std::move(factory), pool_config);
    client_ = std::make_unique<ResilientClient>(*pool_);

    LOG(INFO) << "[redis] Shipping to key \"" << config_.key << "\" on "
              << config_.endpoints.size() << " endpoint(s)"
              << (config_.encoder.bulk ? " (bulk)" : "");
    for (const auto& endpoint : config_.endpoints) {
        VLOG(1) << "[redis]   " << endpoint.to_string();
    }
}

std::optional<size_t> QueueSink::write(const Event& event) {
    std::string payload = encoder_.encode(event);
    client_->lpush(config_.key, payload);
    return payload.size();
}

}  // namespace logship::sinks

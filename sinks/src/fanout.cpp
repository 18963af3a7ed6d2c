// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "fanout.hpp"

#include <glog/logging.h>

namespace logship::sinks {

void Fanout::add(std::unique_ptr<Sink> sink) {
    sinks_.push_back(std::move(sink));
}

void Fanout::ship(const Event& event) {
    for (auto& sink : sinks_) {
        sink->ship(event);
    }
}

void Fanout::log_stats() const {
    for (const auto& sink : sinks_) {
        SinkStats stats = sink->stats();
        LOG(INFO) << "[" << sink->name() << "] sent=" << stats.messages_sent
                  << " failed=" << stats.messages_failed
                  << " dropped=" << stats.messages_dropped
                  << " bytes=" << stats.bytes_sent;
    }
}

}  // namespace logship::sinks

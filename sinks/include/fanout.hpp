// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file fanout.hpp
/// @brief Ordered set of sinks receiving every event

#include "sink.hpp"

#include <memory>
#include <vector>

namespace logship::sinks {

class Fanout {
public:
    void add(std::unique_ptr<Sink> sink);

    /// Ship the event to every sink in the order they were added
    void ship(const Event& event);

    /// Log per-sink statistics at INFO
    void log_stats() const;

    size_t size() const { return sinks_.size(); }
    bool empty() const { return sinks_.empty(); }
    const std::vector<std::unique_ptr<Sink>>& sinks() const { return sinks_; }

private:
    std::vector<std::unique_ptr<Sink>> sinks_;
};

}  // namespace logship::sinks

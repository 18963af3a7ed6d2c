// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file sink.hpp
/// @brief Output destination for pipeline events
///
/// Sinks never let a std::exception escape ship(): transport failures are
/// logged, counted and the event is dropped, so one bad destination cannot
/// stop the stream or starve the other sinks.

#include "logship/event.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace logship::sinks {

/// Statistics for sinks
struct SinkStats {
    uint64_t messages_sent = 0;
    uint64_t messages_failed = 0;   ///< Transport failures
    uint64_t messages_dropped = 0;  ///< Events the sink could not render
    uint64_t bytes_sent = 0;
};

/// Abstract interface for sinks
class Sink {
public:
    virtual ~Sink() = default;

    /// Deliver one event. Failures are logged and counted, never thrown.
    void ship(const Event& event);

    /// Get sink name for logging
    virtual std::string name() const = 0;

    SinkStats stats() const { return stats_; }

protected:
    /// Deliver one event
    /// @return Bytes written, or nullopt if the event was dropped
    /// @throws std::exception on transport failure
    virtual std::optional<size_t> write(const Event& event) = 0;

private:
    SinkStats stats_;
};

}  // namespace logship::sinks

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file event_encoder.hpp
/// @brief Event to wire payload encoding for the queue and console sinks
///
/// Plain mode: one compact JSON document per event, newline terminated.
/// Bulk mode: a search index action line followed by the document:
///   {"index":{"_index":"logs","_type":"message"}}
///   {"@message":"..."}

#include "logship/arguments.hpp"
#include "logship/event.hpp"

#include <string>

namespace logship::sinks {

struct EncoderConfig {
    bool bulk = false;
    std::string bulk_index = "logs";
    std::string bulk_type = "message";
};

/// Read bulk, bulk_index and bulk_type keywords
/// @throws ConfigError if bulk is not true/false
EncoderConfig encoder_config_from(const Arguments& args);

class EventEncoder {
public:
    explicit EventEncoder(EncoderConfig config = {});

    /// Encode one event, including the trailing newline
    std::string encode(const Event& event) const;

    const EncoderConfig& config() const { return config_; }

private:
    EncoderConfig config_;
    std::string action_line_;  ///< Bulk action line, built once
};

}  // namespace logship::sinks

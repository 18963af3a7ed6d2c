// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "event_encoder.hpp"

namespace logship::sinks {

EncoderConfig encoder_config_from(const Arguments& args) {
    EncoderConfig config;
    config.bulk = args.get_bool("bulk", config.bulk);
    config.bulk_index = args.get_or("bulk_index", config.bulk_index);
    config.bulk_type = args.get_or("bulk_type", config.bulk_type);
    return config;
}

EventEncoder::EventEncoder(EncoderConfig config)
    : config_(std::move(config)) {
    if (config_.bulk) {
        Event action = {{"index", {{"_index", config_.bulk_index}, {"_type", config_.bulk_type}}}};
        action_line_ = dump_event(action) + "\n";
    }
}

std::string EventEncoder::encode(const Event& event) const {
    std::string doc = dump_event(event);
    if (!config_.bulk) {
        return doc + "\n";
    }
    return action_line_ + doc + "\n";
}

}  // namespace logship::sinks

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "console_sink.hpp"

#include "logship/errors.hpp"

#include <iostream>

namespace logship::sinks {

ConsoleSink::ConsoleSink(EncoderConfig config, std::ostream* out)
    : encoder_(std::move(config))
    , out_(out ? *out : std::cout) {
}

std::optional<size_t> ConsoleSink::write(const Event& event) {
    std::string payload = encoder_.encode(event);
    out_ << payload;
    out_.flush();
    if (!out_) {
        // Leave the stream usable for the next event
        out_.clear();
        throw TransportError(TransportError::Cause::Io, "Write to console failed");
    }
    return payload.size();
}

}  // namespace logship::sinks

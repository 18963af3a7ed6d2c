// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file console_sink.hpp
/// @brief Sink printing encoded events to a stream (stdout by default)

#include "event_encoder.hpp"
#include "sink.hpp"

#include <ostream>

namespace logship::sinks {

class ConsoleSink : public Sink {
public:
    /// @param out Must outlive the sink
    explicit ConsoleSink(EncoderConfig config = {}, std::ostream* out = nullptr);

    std::string name() const override { return "stdout"; }

protected:
    /// @throws TransportError if the stream rejects the write
    std::optional<size_t> write(const Event& event) override;

private:
    EventEncoder encoder_;
    std::ostream& out_;
};

}  // namespace logship::sinks

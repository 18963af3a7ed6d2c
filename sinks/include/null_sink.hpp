// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file null_sink.hpp
/// @brief Sink that discards every event

#include "sink.hpp"

namespace logship::sinks {

class NullSink : public Sink {
public:
    std::string name() const override { return "null"; }

protected:
    std::optional<size_t> write(const Event&) override { return 0; }
};

}  // namespace logship::sinks

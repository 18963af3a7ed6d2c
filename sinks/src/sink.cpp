// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "sink.hpp"

#include <glog/logging.h>

#include <exception>

namespace logship::sinks {

void Sink::ship(const Event& event) {
    try {
        std::optional<size_t> bytes = write(event);
        if (!bytes) {
            ++stats_.messages_dropped;
            return;
        }
        ++stats_.messages_sent;
        stats_.bytes_sent += *bytes;
    } catch (const std::exception& e) {
        ++stats_.messages_failed;
        LOG(WARNING) << "[" << name() << "] Could not ship message: " << e.what();
    }
}

}  // namespace logship::sinks

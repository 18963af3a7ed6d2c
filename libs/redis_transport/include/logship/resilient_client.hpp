// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file resilient_client.hpp
/// @brief Redis command execution with retry across pool endpoints
///
/// Each attempt leases a connection (moving the pool cursor to the next
/// endpoint), sends the command and reads the reply. A TransportError purges
/// the connection and the next attempt goes to the next endpoint. After the
/// last attempt the final error is rethrown.

#include "logship/connection_pool.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace logship {

class ResilientClient {
public:
    /// @param pool Must outlive the client
    explicit ResilientClient(ConnectionPool& pool);

    /// Run one command
    /// @throws TransportError from the final attempt
    RedisReply execute(const std::vector<std::string>& args);

    /// LPUSH key value
    /// @return New length of the list
    int64_t lpush(const std::string& key, const std::string& value);

    /// Fix the attempt budget. Unset: one attempt per configured endpoint,
    /// counted at call time.
    void set_execution_attempts(size_t attempts) { attempts_ = attempts; }
    size_t execution_attempts() const;

private:
    ConnectionPool& pool_;
    std::optional<size_t> attempts_;
};

}  // namespace logship

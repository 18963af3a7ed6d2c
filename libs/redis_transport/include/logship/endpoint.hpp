// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file endpoint.hpp
/// @brief Redis endpoint addresses

#include <cstdint>
#include <string>

namespace logship {

/// One configured Redis server
struct Endpoint {
    static constexpr uint16_t kDefaultPort = 6379;

    std::string host = "localhost";
    uint16_t port = kDefaultPort;
    uint32_t db = 0;
    std::string password;     ///< Empty: no AUTH
    uint32_t timeout_ms = 0;  ///< Socket send/receive timeout, 0 = blocking

    /// host:port/db, never includes the password
    std::string to_string() const;

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port && db == other.db &&
               password == other.password && timeout_ms == other.timeout_ms;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }
};

/// Parse scheme://[user[:password]@][host][:port][/db]
///
/// Missing host defaults to localhost, missing port to 6379, missing or
/// empty db to 0. IPv6 hosts are written in brackets: redis://[::1]:6379
/// @throws ConfigError for a missing "://", a non-numeric port or db, or a
///         port outside 1-65535
Endpoint parse_endpoint_url(const std::string& url);

}  // namespace logship

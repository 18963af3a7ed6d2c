// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file connection_pool.hpp
/// @brief Round-robin connection pool over several Redis endpoints
///
/// Each lease() targets the endpoint under the cursor and then moves the
/// cursor on, whatever the outcome, so consecutive leases rotate through the
/// endpoints in configured order.
///
/// Connection states: available <-> in-use -> purged. The number of
/// connections ever created to an endpoint is capped by
/// max_connections_per_endpoint; purging a connection does not give its
/// slot back. The count restarts only on reset(), fork or endpoint removal.
///
/// Fork safety: the pool remembers the process id it was created in. If a
/// later call runs in a different process, every inherited connection is
/// abandoned (the descriptor belongs to the parent and is left untouched),
/// the pool starts empty and its generation increments. Leases from an older
/// generation are ignored by release() and purge().
///
/// Not thread-safe: a pool belongs to one sink on one thread.

#include "logship/endpoint.hpp"
#include "logship/redis_connection.hpp"

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <unordered_map>
#include <vector>

namespace logship {

struct PoolConfig {
    /// Connections that may ever be created per endpoint and generation
    size_t max_connections_per_endpoint = std::numeric_limits<size_t>::max();

    /// Current process id; getpid() when unset
    std::function<pid_t()> process_id;
};

/// Caller's handle to a leased connection. Must be given back with
/// release() or purge().
class ConnectionLease {
public:
    Connection& connection() const { return *connection_; }
    Connection* operator->() const { return connection_; }

    /// Endpoint index at the time of the lease
    size_t endpoint_index() const { return endpoint_index_; }
    uint64_t generation() const { return generation_; }

private:
    friend class ConnectionPool;

    ConnectionLease(Connection* connection, size_t endpoint_index, uint64_t generation,
                    uint64_t id)
        : connection_(connection)
        , endpoint_index_(endpoint_index)
        , generation_(generation)
        , id_(id) {}

    Connection* connection_;
    size_t endpoint_index_;
    uint64_t generation_;
    uint64_t id_;
};

class ConnectionPool {
public:
    ConnectionPool(std::vector<Endpoint> endpoints, ConnectionFactory factory,
                   PoolConfig config = {});
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// Take a connection to the endpoint under the cursor, reusing the most
    /// recently released one or creating a new one below the cap
    /// @throws PoolExhaustedError if the endpoint is at its cap
    /// @throws TransportError (NoEndpoints) if no endpoint is configured
    /// @throws whatever the factory throws
    ConnectionLease lease();

    /// Return a leased connection for reuse. No-op for stale leases.
    void release(const ConnectionLease& lease);

    /// Close a connection and take it out of rotation. Its endpoint's created
    /// count is unchanged. No-op for stale leases.
    void purge(const ConnectionLease& lease);

    /// Close every connection and start a new generation
    void reset();

    void add_endpoint(Endpoint endpoint);

    /// Close all connections of an endpoint and stop using it
    /// @return false if the endpoint is not configured
    bool remove_endpoint(const Endpoint& endpoint);

    size_t endpoint_count() const { return slots_.size(); }
    std::vector<Endpoint> endpoints() const;
    size_t cursor() const { return cursor_; }
    uint64_t generation() const { return generation_; }

    size_t available_count(size_t index) const;
    size_t in_use_count(size_t index) const;
    size_t created_count(size_t index) const;

    /// Available plus in-use connections
    size_t live_count(size_t index) const;

private:
    struct Slot {
        Endpoint endpoint;
        size_t created = 0;  ///< Connections created this generation
        std::vector<std::unique_ptr<Connection>> available;
        std::unordered_map<uint64_t, std::unique_ptr<Connection>> in_use;
    };

    pid_t current_pid() const;
    void check_process();
    void drop_connections(Slot& slot, bool abandon);
    bool is_stale(const ConnectionLease& lease) const;

    std::vector<Slot> slots_;
    ConnectionFactory factory_;
    PoolConfig config_;
    pid_t pid_;
    size_t cursor_ = 0;
    uint64_t generation_ = 0;
    uint64_t next_lease_id_ = 1;
};

}  // namespace logship

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file redis_connection.hpp
/// @brief Connection interface and the RESP-over-TCP implementation
///
/// A Connection is bound to one Endpoint for its whole life. The pool owns
/// connections; callers only see them through a ConnectionLease.

#include "logship/endpoint.hpp"
#include "logship/errors.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace logship {

/// One parsed RESP reply
struct RedisReply {
    enum class Type : uint8_t {
        Status,   ///< +OK
        Error,    ///< -ERR ...
        Integer,  ///< :1
        Bulk,     ///< $3 foo
        Nil,      ///< $-1 or *-1
        Array     ///< *2 ...
    };

    Type type = Type::Nil;
    std::string str;       ///< Status, Error and Bulk payload
    int64_t integer = 0;   ///< Integer payload
    std::vector<RedisReply> elements;

    static RedisReply status(std::string s) { return {Type::Status, std::move(s), 0, {}}; }
    static RedisReply error(std::string s) { return {Type::Error, std::move(s), 0, {}}; }
    static RedisReply from_integer(int64_t v) { return {Type::Integer, {}, v, {}}; }
    static RedisReply bulk(std::string s) { return {Type::Bulk, std::move(s), 0, {}}; }
    static RedisReply nil() { return {}; }
};

/// Transport to one endpoint
class Connection {
public:
    virtual ~Connection() = default;

    virtual const Endpoint& endpoint() const = 0;

    /// Write one command
    /// @throws TransportError
    virtual void send_command(const std::vector<std::string>& args) = 0;

    /// Read the reply to the oldest outstanding command
    /// @throws TransportError (cause ServerError for error replies)
    virtual RedisReply read_response() = 0;

    /// Close the transport. Safe to call repeatedly.
    virtual void disconnect() = 0;

    /// Forget the transport without closing it. Used after fork(), where the
    /// descriptor is shared with the parent process.
    virtual void abandon() = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<Connection>(const Endpoint&)>;

/// Blocking TCP connection speaking RESP2
class RedisConnection : public Connection {
public:
    explicit RedisConnection(Endpoint endpoint);
    ~RedisConnection() override;

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    const Endpoint& endpoint() const override { return endpoint_; }

    /// Connects on first use (AUTH and SELECT as configured)
    void send_command(const std::vector<std::string>& args) override;
    RedisReply read_response() override;
    void disconnect() override;
    void abandon() override;

    bool is_connected() const { return fd_ >= 0; }

    /// Encode a command as a RESP array of bulk strings
    static std::string encode_command(const std::vector<std::string>& args);

private:
    void connect();
    void write_all(const std::string& data);
    RedisReply read_reply();
    std::string read_line();
    std::string read_exact(size_t count);
    void fill_buffer();
    [[noreturn]] void fail(TransportError::Cause cause, const std::string& what);

    Endpoint endpoint_;
    int fd_ = -1;
    std::string buffer_;
    size_t buffer_pos_ = 0;
};

/// Factory producing RedisConnection instances, for ConnectionPool
ConnectionFactory make_redis_connection_factory();

}  // namespace logship

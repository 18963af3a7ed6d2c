// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Error taxonomy shared by the pipeline, transport and sinks
///
/// Two families:
/// - ConfigError: raised while building filters, sinks or endpoints, always
///   before any input is consumed. Fatal for the driver.
/// - TransportError: raised by network I/O. Retried by the resilient client
///   and finally absorbed (logged, event dropped) at the sink boundary.

#include <cstdint>
#include <stdexcept>
#include <string>

namespace logship {

/// Base class for all logship errors
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// =============================================================================
// Configuration errors
// =============================================================================

/// Invalid configuration: bad arguments, malformed address, bad YAML
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

/// A filter description names a filter that is not registered
class UnknownFilterError : public ConfigError {
public:
    explicit UnknownFilterError(const std::string& name)
        : ConfigError("No such filter: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// A filter name was registered twice
class DuplicateFilterError : public ConfigError {
public:
    explicit DuplicateFilterError(const std::string& name)
        : ConfigError("Filter \"" + name + "\" already defined"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// A sink description names a sink that is not registered
class UnknownSinkError : public ConfigError {
public:
    explicit UnknownSinkError(const std::string& name)
        : ConfigError("No such sink: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/// A sink name was registered twice
class DuplicateSinkError : public ConfigError {
public:
    explicit DuplicateSinkError(const std::string& name)
        : ConfigError("Sink \"" + name + "\" already defined"), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// =============================================================================
// Transport errors
// =============================================================================

/// Failure talking to a backend. The cause tells the retry loop what happened.
class TransportError : public Error {
public:
    enum class Cause : uint8_t {
        ConnectFailed = 0,  ///< Could not resolve or connect
        Io = 1,             ///< Send/receive failed or peer closed
        Timeout = 2,        ///< Socket timeout expired
        Protocol = 3,       ///< Unparseable reply
        ServerError = 4,    ///< Backend answered with an error reply
        PoolExhausted = 5,  ///< Endpoint at its connection cap
        NoEndpoints = 6     ///< Nothing configured to talk to
    };

    TransportError(Cause cause, const std::string& what)
        : Error(what), cause_(cause) {}

    Cause cause() const { return cause_; }

    /// Whether another endpoint is worth trying
    bool retryable() const { return cause_ != Cause::NoEndpoints; }

private:
    Cause cause_;
};

/// Pool has no available connection and may not create another one
class PoolExhaustedError : public TransportError {
public:
    explicit PoolExhaustedError(const std::string& what)
        : TransportError(Cause::PoolExhausted, what) {}
};

/// Convert a TransportError cause to string
const char* to_string(TransportError::Cause cause);

}  // namespace logship

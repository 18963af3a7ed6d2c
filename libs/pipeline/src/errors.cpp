// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/errors.hpp"

namespace logship {

const char* to_string(TransportError::Cause cause) {
    switch (cause) {
        case TransportError::Cause::ConnectFailed: return "connect_failed";
        case TransportError::Cause::Io: return "io";
        case TransportError::Cause::Timeout: return "timeout";
        case TransportError::Cause::Protocol: return "protocol";
        case TransportError::Cause::ServerError: return "server_error";
        case TransportError::Cause::PoolExhausted: return "pool_exhausted";
        case TransportError::Cause::NoEndpoints: return "no_endpoints";
    }
    return "unknown";
}

}  // namespace logship

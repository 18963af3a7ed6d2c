// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/resilient_client.hpp"
#include "logship/errors.hpp"

#include <glog/logging.h>

namespace logship {

ResilientClient::ResilientClient(ConnectionPool& pool)
    : pool_(pool) {
}

size_t ResilientClient::execution_attempts() const {
    return attempts_ ? *attempts_ : pool_.endpoint_count();
}

RedisReply ResilientClient::execute(const std::vector<std::string>& args) {
    size_t attempts = execution_attempts();
    if (attempts == 0) {
        throw TransportError(TransportError::Cause::NoEndpoints,
                             "No endpoints configured for " +
                                 (args.empty() ? std::string("command") : args[0]));
    }

    for (size_t attempt = 1;; ++attempt) {
        std::optional<ConnectionLease> lease;
        try {
            lease = pool_.lease();
            (*lease)->send_command(args);
            RedisReply reply = (*lease)->read_response();
            pool_.release(*lease);
            return reply;
        } catch (const TransportError& e) {
            if (lease) {
                pool_.purge(*lease);
            }
            if (attempt >= attempts || !e.retryable()) {
                throw;
            }
            LOG_EVERY_N(WARNING, 100) << "Attempt " << attempt << "/" << attempts << " failed ("
                                      << to_string(e.cause()) << "): " << e.what() << " ["
                                      << google::COUNTER << " retries so far]";
        } catch (...) {
            if (lease) {
                pool_.purge(*lease);
            }
            throw;
        }
    }
}

int64_t ResilientClient::lpush(const std::string& key, const std::string& value) {
    RedisReply reply = execute({"LPUSH", key, value});
    if (reply.type != RedisReply::Type::Integer) {
        throw TransportError(TransportError::Cause::Protocol,
                             "Unexpected reply to LPUSH " + key);
    }
    return reply.integer;
}

}  // namespace logship

// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/connection_pool.hpp"
#include "logship/errors.hpp"

#include <glog/logging.h>

#include <unistd.h>

#include <algorithm>

namespace logship {

ConnectionPool::ConnectionPool(std::vector<Endpoint> endpoints, ConnectionFactory factory,
                               PoolConfig config)
    : factory_(std::move(factory))
    , config_(std::move(config)) {
    pid_ = current_pid();
    for (auto& endpoint : endpoints) {
        add_endpoint(std::move(endpoint));
    }
}

ConnectionPool::~ConnectionPool() {
    bool forked = current_pid() != pid_;
    for (auto& slot : slots_) {
        drop_connections(slot, forked);
    }
}

pid_t ConnectionPool::current_pid() const {
    return config_.process_id ? config_.process_id() : ::getpid();
}

void ConnectionPool::check_process() {
    pid_t pid = current_pid();
    if (pid == pid_) {
        return;
    }

    size_t dropped = 0;
    for (auto& slot : slots_) {
        dropped += slot.available.size() + slot.in_use.size();
        drop_connections(slot, true);
    }
    LOG(WARNING) << "Process id changed from " << pid_ << " to " << pid
                 << ", abandoning " << dropped << " inherited connections";

    pid_ = pid;
    cursor_ = 0;
    ++generation_;
}

void ConnectionPool::drop_connections(Slot& slot, bool abandon) {
    auto drop = [abandon](Connection& conn) {
        if (abandon) {
            conn.abandon();
        } else {
            conn.disconnect();
        }
    };
    for (auto& conn : slot.available) {
        drop(*conn);
    }
    for (auto& kv : slot.in_use) {
        drop(*kv.second);
    }
    slot.available.clear();
    slot.in_use.clear();
    slot.created = 0;
}

bool ConnectionPool::is_stale(const ConnectionLease& lease) const {
    if (lease.generation_ != generation_) {
        VLOG(1) << "Ignoring lease from generation " << lease.generation_
                << " (current " << generation_ << ")";
        return true;
    }
    return false;
}

ConnectionLease ConnectionPool::lease() {
    check_process();

    if (slots_.empty()) {
        throw TransportError(TransportError::Cause::NoEndpoints,
                             "Connection pool has no endpoints");
    }

    size_t index = cursor_;
    cursor_ = (cursor_ + 1) % slots_.size();
    Slot& slot = slots_[index];

    std::unique_ptr<Connection> conn;
    if (!slot.available.empty()) {
        conn = std::move(slot.available.back());
        slot.available.pop_back();
    } else if (slot.created < config_.max_connections_per_endpoint) {
        conn = factory_(slot.endpoint);
        if (!conn) {
            throw TransportError(TransportError::Cause::ConnectFailed,
                                 "No connection created for " + slot.endpoint.to_string());
        }
        ++slot.created;
        VLOG(1) << "Created connection " << slot.created << " to " << slot.endpoint.to_string();
    } else {
        throw PoolExhaustedError("Too many connections to " + slot.endpoint.to_string() +
                                 " (limit " +
                                 std::to_string(config_.max_connections_per_endpoint) + ")");
    }

    uint64_t id = next_lease_id_++;
    Connection* raw = conn.get();
    slot.in_use.emplace(id, std::move(conn));
    return ConnectionLease(raw, index, generation_, id);
}

void ConnectionPool::release(const ConnectionLease& lease) {
    check_process();
    if (is_stale(lease)) {
        return;
    }

    for (auto& slot : slots_) {
        auto it = slot.in_use.find(lease.id_);
        if (it != slot.in_use.end()) {
            slot.available.push_back(std::move(it->second));
            slot.in_use.erase(it);
            return;
        }
    }
    VLOG(1) << "Released connection is no longer tracked";
}

void ConnectionPool::purge(const ConnectionLease& lease) {
    check_process();
    if (is_stale(lease)) {
        return;
    }

    for (auto& slot : slots_) {
        auto it = slot.in_use.find(lease.id_);
        if (it != slot.in_use.end()) {
            it->second->disconnect();
            slot.in_use.erase(it);
            VLOG(1) << "Purged connection to " << slot.endpoint.to_string();
            return;
        }

        auto avail = std::find_if(slot.available.begin(), slot.available.end(),
                                  [&lease](const std::unique_ptr<Connection>& c) {
                                      return c.get() == lease.connection_;
                                  });
        if (avail != slot.available.end()) {
            (*avail)->disconnect();
            slot.available.erase(avail);
            return;
        }
    }
}

void ConnectionPool::reset() {
    for (auto& slot : slots_) {
        drop_connections(slot, false);
    }
    pid_ = current_pid();
    cursor_ = 0;
    ++generation_;
    LOG(INFO) << "Connection pool reset, generation " << generation_;
}

void ConnectionPool::add_endpoint(Endpoint endpoint) {
    Slot slot;
    slot.endpoint = std::move(endpoint);
    slots_.push_back(std::move(slot));
}

bool ConnectionPool::remove_endpoint(const Endpoint& endpoint) {
    check_process();

    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&endpoint](const Slot& s) { return s.endpoint == endpoint; });
    if (it == slots_.end()) {
        return false;
    }

    size_t index = static_cast<size_t>(it - slots_.begin());
    drop_connections(*it, false);
    slots_.erase(it);

    if (index < cursor_) {
        --cursor_;
    }
    if (cursor_ >= slots_.size()) {
        cursor_ = 0;
    }
    LOG(INFO) << "Removed endpoint " << endpoint.to_string() << ", " << slots_.size()
              << " remaining";
    return true;
}

std::vector<Endpoint> ConnectionPool::endpoints() const {
    std::vector<Endpoint> out;
    out.reserve(slots_.size());
    for (const auto& slot : slots_) {
        out.push_back(slot.endpoint);
    }
    return out;
}

size_t ConnectionPool::available_count(size_t index) const {
    return index < slots_.size() ? slots_[index].available.size() : 0;
}

size_t ConnectionPool::in_use_count(size_t index) const {
    return index < slots_.size() ? slots_[index].in_use.size() : 0;
}

size_t ConnectionPool::created_count(size_t index) const {
    return index < slots_.size() ? slots_[index].created : 0;
}

size_t ConnectionPool::live_count(size_t index) const {
    return available_count(index) + in_use_count(index);
}

}  // namespace logship

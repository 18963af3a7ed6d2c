// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/event.hpp"

#include <glog/logging.h>

#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdio>
#include <ctime>

namespace logship {

const Event* lookup_field(const Event& event, const std::string& path) {
    if (!event.is_object()) {
        return nullptr;
    }

    auto it = event.find(path);
    if (it != event.end()) {
        return &*it;
    }

    const Event* node = &event;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        std::string component = path.substr(start, dot == std::string::npos ? std::string::npos
                                                                              : dot - start);
        if (!node->is_object()) {
            return nullptr;
        }
        auto child = node->find(component);
        if (child == node->end()) {
            return nullptr;
        }
        node = &*child;

        if (dot == std::string::npos) {
            return node;
        }
        start = dot + 1;
    }
}

std::string to_plain_string(const Event& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return dump_event(value);
}

std::string dump_event(const Event& event) {
    return event.dump(-1, ' ', false, Event::error_handler_t::replace);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - secs);
    if (micros.count() < 0) {
        secs -= std::chrono::seconds(1);
        micros += std::chrono::seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec,
                  static_cast<long>(micros.count()));
    return buf;
}

std::string now_timestamp() {
    return format_timestamp(std::chrono::system_clock::now());
}

std::string source_host_fqdn() {
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        LOG(WARNING) << "gethostname failed, using localhost";
        return "localhost";
    }

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_flags = AI_CANONNAME;

    struct addrinfo* result = nullptr;
    std::string fqdn = hostname;
    if (getaddrinfo(hostname, nullptr, &hints, &result) == 0 && result) {
        if (result->ai_canonname && std::string(result->ai_canonname).find('.') != std::string::npos) {
            fqdn = result->ai_canonname;
        }
        freeaddrinfo(result);
    } else {
        VLOG(1) << "Could not canonicalize hostname " << hostname;
    }
    return fqdn;
}

}  // namespace logship

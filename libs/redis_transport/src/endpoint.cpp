// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/endpoint.hpp"
#include "logship/errors.hpp"

#include <algorithm>
#include <cctype>

namespace logship {

namespace {

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

uint64_t parse_number(const std::string& url, const char* what, const std::string& text,
                      uint64_t max) {
    if (!all_digits(text) || text.size() > 10) {
        throw ConfigError(std::string("Invalid ") + what + " \"" + text + "\" in endpoint " + url);
    }
    uint64_t value = std::stoull(text);
    if (value > max) {
        throw ConfigError(std::string("Invalid ") + what + " \"" + text + "\" in endpoint " + url);
    }
    return value;
}

}  // namespace

std::string Endpoint::to_string() const {
    bool v6 = host.find(':') != std::string::npos;
    std::string out = v6 ? "[" + host + "]" : host;
    return out + ":" + std::to_string(port) + "/" + std::to_string(db);
}

Endpoint parse_endpoint_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("Invalid endpoint \"" + url + "\": expected scheme://host:port/db");
    }

    Endpoint endpoint;
    std::string rest = url.substr(scheme_end + 3);

    // Path: /db
    std::string authority = rest;
    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        authority = rest.substr(0, slash);
        std::string db = rest.substr(slash + 1);
        if (!db.empty()) {
            endpoint.db = static_cast<uint32_t>(parse_number(url, "db", db, UINT32_MAX));
        }
    }

    // Userinfo: user[:password]@
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        size_t colon = userinfo.find(':');
        if (colon != std::string::npos) {
            endpoint.password = userinfo.substr(colon + 1);
        }
    }

    // Host and port
    std::string host;
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw ConfigError("Invalid endpoint \"" + url + "\": unterminated [ in host");
        }
        host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                throw ConfigError("Invalid endpoint \"" + url + "\": unexpected text after ]");
            }
            port = after.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        } else {
            host = authority;
        }
    }

    if (!host.empty()) {
        endpoint.host = host;
    }
    if (!port.empty()) {
        uint64_t value = parse_number(url, "port", port, 65535);
        if (value == 0) {
            throw ConfigError("Invalid port \"" + port + "\" in endpoint " + url);
        }
        endpoint.port = static_cast<uint16_t>(value);
    }

    return endpoint;
}

}  // namespace logship

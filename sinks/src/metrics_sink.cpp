// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "metrics_sink.hpp"

#include "logship/errors.hpp"

#include <glog/logging.h>

#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace logship::sinks {

// =============================================================================
// MetricTemplate
// =============================================================================

MetricTemplate::MetricTemplate(const std::string& pattern)
    : pattern_(pattern) {
    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t open = pattern.find("%{", pos);
        size_t close = open == std::string::npos ? std::string::npos : pattern.find('}', open + 2);
        if (close == std::string::npos) {
            segments_.push_back(Segment{false, pattern.substr(pos)});
            break;
        }
        if (open > pos) {
            segments_.push_back(Segment{false, pattern.substr(pos, open - pos)});
        }
        segments_.push_back(Segment{true, pattern.substr(open + 2, close - open - 2)});
        pos = close + 1;
    }
}

std::optional<std::string> MetricTemplate::render(const Event& event, std::string* missing) const {
    std::string out;
    for (const auto& segment : segments_) {
        if (!segment.is_field) {
            out += segment.text;
            continue;
        }
        const Event* value = lookup_field(event, segment.text);
        if (!value) {
            if (missing) {
                *missing = segment.text;
            }
            return std::nullopt;
        }
        out += to_plain_string(*value);
    }
    return out;
}

std::vector<std::string> MetricTemplate::fields() const {
    std::vector<std::string> out;
    for (const auto& segment : segments_) {
        if (segment.is_field) {
            out.push_back(segment.text);
        }
    }
    return out;
}

// =============================================================================
// MetricsSink
// =============================================================================

MetricsSink::MetricsSink(const MetricsConfig& config)
    : config_(config)
    , metric_(config.metric) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(config_.port);
    int rc = getaddrinfo(config_.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw ConfigError("Cannot resolve statsd host " + config_.host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = result; ai; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = strerror(errno);
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        last_error = strerror(errno);
        close(fd);
    }
    freeaddrinfo(result);

    if (fd_ < 0) {
        throw ConfigError("Cannot open statsd socket to " + config_.host + ":" + port + ": " +
                          last_error);
    }

    LOG(INFO) << "[statsd] Sending \"" << config_.metric << "\" to " << config_.host << ":"
              << config_.port;
}

MetricsSink::~MetricsSink() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

std::optional<size_t> MetricsSink::write(const Event& event) {
    std::string missing;
    std::optional<std::string> metric = metric_.render(event, &missing);
    if (!metric) {
        LOG(WARNING) << "[" << name() << "] Dropping event: field \"" << missing
                     << "\" required by metric \"" << metric_.pattern() << "\" is missing";
        return std::nullopt;
    }

    std::optional<std::string> value = value_for(event);
    if (!value) {
        return std::nullopt;
    }

    std::string datagram = *metric + ":" + *value;
    VLOG(2) << "[" << name() << "] " << datagram;

    ssize_t n = ::send(fd_, datagram.data(), datagram.size(), 0);
    if (n < 0) {
        throw TransportError(TransportError::Cause::Io,
                             std::string("statsd send failed: ") + strerror(errno));
    }
    return static_cast<size_t>(n);
}

// =============================================================================
// Counter and timer
// =============================================================================

MetricsCounterSink::MetricsCounterSink(const MetricsConfig& config)
    : MetricsSink(config) {
}

std::optional<std::string> MetricsCounterSink::value_for(const Event&) {
    return std::string("1|c");
}

MetricsTimerSink::MetricsTimerSink(const MetricsConfig& config, std::string timed_field)
    : MetricsSink(config)
    , timed_field_(std::move(timed_field)) {
}

std::optional<std::string> MetricsTimerSink::value_for(const Event& event) {
    const Event* field = lookup_field(event, timed_field_);
    if (!field) {
        LOG(WARNING) << "[" << name() << "] Dropping event: timed field \"" << timed_field_
                     << "\" is missing";
        return std::nullopt;
    }

    double value = 0.0;
    if (field->is_number()) {
        value = field->get<double>();
    } else if (field->is_string()) {
        const std::string& text = field->get_ref<const std::string&>();
        char* end = nullptr;
        errno = 0;
        value = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
            LOG(WARNING) << "[" << name() << "] Dropping event: timed field \"" << timed_field_
                         << "\" is not numeric: \"" << text << "\"";
            return std::nullopt;
        }
    } else {
        LOG(WARNING) << "[" << name() << "] Dropping event: timed field \"" << timed_field_
                     << "\" is not numeric: " << dump_event(*field);
        return std::nullopt;
    }

    // %f of the largest double needs over 300 characters
    char buf[512];
    std::snprintf(buf, sizeof(buf), "%f|ms", value);
    return std::string(buf);
}

}  // namespace logship::sinks

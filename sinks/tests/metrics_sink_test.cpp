// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file metrics_sink_test.cpp
/// @brief statsd datagrams received on a loopback UDP socket

#include "metrics_sink.hpp"

#include "logship/errors.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace logship::sinks {
namespace {

class MetricsSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        fd_ = socket(AF_INET, SOCK_DGRAM, 0);
        ASSERT_GE(fd_, 0);

        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ASSERT_EQ(bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)), 0);

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        struct timeval tv{};
        tv.tv_usec = 200 * 1000;
        setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    void TearDown() override {
        close(fd_);
    }

    MetricsConfig config(const std::string& metric) const {
        MetricsConfig c;
        c.metric = metric;
        c.host = "127.0.0.1";
        c.port = port_;
        return c;
    }

    /// Next datagram, or "" if none arrives in time
    std::string receive() {
        char buf[1024];
        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        return n > 0 ? std::string(buf, static_cast<size_t>(n)) : std::string();
    }

    int fd_ = -1;
    uint16_t port_ = 0;
};

TEST_F(MetricsSinkTest, CounterResolvesPlaceholders) {
    MetricsCounterSink sink(config("%{@source_host}.nginx.%{@fields.status}"));

    sink.ship(Event({{"@source_host", "web-1"}, {"@fields", {{"status", "200"}}}}));
    EXPECT_EQ(receive(), "web-1.nginx.200:1|c");
    EXPECT_EQ(sink.stats().messages_sent, 1u);
}

TEST_F(MetricsSinkTest, LiteralKeyWinsOverNestedPath) {
    MetricsCounterSink sink(config("m.%{@fields.status}"));

    sink.ship(Event({{"@fields.status", "literal"}, {"@fields", {{"status", "nested"}}}}));
    EXPECT_EQ(receive(), "m.literal:1|c");
}

TEST_F(MetricsSinkTest, NonStringValuesRenderAsJson) {
    MetricsCounterSink sink(config("status.%{code}"));
    sink.ship(Event({{"code", 503}}));
    EXPECT_EQ(receive(), "status.503:1|c");
}

TEST_F(MetricsSinkTest, MissingFieldDropsEvent) {
    MetricsCounterSink sink(config("%{@fields.status}"));

    sink.ship(Event({{"@message", "no fields"}}));
    EXPECT_EQ(receive(), "");
    EXPECT_EQ(sink.stats().messages_dropped, 1u);
    EXPECT_EQ(sink.stats().messages_sent, 0u);
    EXPECT_EQ(sink.stats().messages_failed, 0u);
}

TEST_F(MetricsSinkTest, TimerFormatsValue) {
    MetricsTimerSink sink(config("rails.%{@fields.path}"), "@fields.time");

    sink.ship(Event({{"@fields", {{"path", "/x"}, {"time", "0.05"}}}}));
    EXPECT_EQ(receive(), "rails./x:0.050000|ms");

    sink.ship(Event({{"@fields", {{"path", "/y"}, {"time", 12}}}}));
    EXPECT_EQ(receive(), "rails./y:12.000000|ms");
}

TEST_F(MetricsSinkTest, TimerDropsNonNumericValue) {
    MetricsTimerSink sink(config("t"), "time");

    sink.ship(Event({{"time", "fast"}}));
    sink.ship(Event({{"time", "12ms"}}));
    sink.ship(Event({{"time", true}}));
    sink.ship(Event({{"other", 1}}));
    EXPECT_EQ(receive(), "");
    EXPECT_EQ(sink.stats().messages_dropped, 4u);
}

TEST_F(MetricsSinkTest, UnresolvableHostIsConfigError) {
    MetricsConfig c = config("m");
    c.host = "no-such-host.invalid";
    EXPECT_THROW(MetricsCounterSink sink(c), ConfigError);
}

TEST(MetricTemplateTest, ParsesSegments) {
    MetricTemplate tpl("a.%{x}.b.%{y.z}");
    std::vector<std::string> expected = {"x", "y.z"};
    EXPECT_EQ(tpl.fields(), expected);

    std::string missing;
    EXPECT_FALSE(tpl.render(Event({{"x", "1"}}), &missing).has_value());
    EXPECT_EQ(missing, "y.z");
    EXPECT_EQ(*tpl.render(Event({{"x", "1"}, {"y", {{"z", "2"}}}})), "a.1.b.2");
}

TEST(MetricTemplateTest, UnterminatedPlaceholderIsLiteral) {
    MetricTemplate tpl("a.%{x");
    EXPECT_TRUE(tpl.fields().empty());
    EXPECT_EQ(*tpl.render(Event::object()), "a.%{x");
}

}  // namespace
}  // namespace logship::sinks

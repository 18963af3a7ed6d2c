// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file queue_sink_test.cpp
/// @brief LPUSH delivery through the pool, with failing endpoints

#include "queue_sink.hpp"
#include "fake_connection.hpp"

#include <gtest/gtest.h>

namespace logship::sinks {
namespace {

using logship::test::endpoint_named;
using logship::test::fake_factory;
using logship::test::FakeNetwork;

class QueueSinkTest : public ::testing::Test {
protected:
    QueueSinkConfig config(std::vector<std::string> hosts) {
        QueueSinkConfig c;
        for (const auto& h : hosts) {
            c.endpoints.push_back(endpoint_named(h));
        }
        return c;
    }

    FakeNetwork network_;
};

TEST_F(QueueSinkTest, PushesEncodedEvent) {
    QueueSinkConfig c = config({"e1"});
    c.key = "nginx";
    QueueSink sink(c, fake_factory(network_));

    sink.ship(Event({{"@message", "hello"}}));

    ASSERT_EQ(network_.records.size(), 1u);
    ASSERT_EQ(network_.records[0]->commands.size(), 1u);
    std::vector<std::string> expected = {"LPUSH", "nginx", "{\"@message\":\"hello\"}\n"};
    EXPECT_EQ(network_.records[0]->commands[0], expected);
    EXPECT_EQ(sink.stats().messages_sent, 1u);
    EXPECT_EQ(sink.stats().bytes_sent, expected[2].size());
}

TEST_F(QueueSinkTest, BulkPayload) {
    QueueSinkConfig c = config({"e1"});
    c.encoder.bulk = true;
    QueueSink sink(c, fake_factory(network_));

    sink.ship(Event({{"a", 1}}));
    ASSERT_EQ(network_.records[0]->commands.size(), 1u);
    EXPECT_EQ(network_.records[0]->commands[0][2],
              "{\"index\":{\"_index\":\"logs\",\"_type\":\"message\"}}\n{\"a\":1}\n");
}

TEST_F(QueueSinkTest, SpreadsEventsAcrossEndpoints) {
    QueueSink sink(config({"e1", "e2"}), fake_factory(network_));

    for (int i = 0; i < 4; ++i) {
        sink.ship(Event({{"i", i}}));
    }
    EXPECT_EQ(network_.connections_to("e1"), 1u);
    EXPECT_EQ(network_.connections_to("e2"), 1u);
    EXPECT_EQ(sink.pool().available_count(0), 1u);
    EXPECT_EQ(sink.pool().available_count(1), 1u);
}

TEST_F(QueueSinkTest, FailingEndpointIsSkipped) {
    network_.failing_hosts.insert("e1");
    QueueSink sink(config({"e1", "e2"}), fake_factory(network_));

    sink.ship(Event({{"@message", "x"}}));
    EXPECT_EQ(sink.stats().messages_sent, 1u);
    EXPECT_EQ(sink.stats().messages_failed, 0u);
}

TEST_F(QueueSinkTest, TotalOutageDropsEventWithoutThrowing) {
    network_.failing_hosts = {"e1", "e2"};
    QueueSink sink(config({"e1", "e2"}), fake_factory(network_));

    EXPECT_NO_THROW(sink.ship(Event({{"@message", "x"}})));
    EXPECT_EQ(sink.stats().messages_failed, 1u);
    EXPECT_EQ(sink.pool().in_use_count(0), 0u);
    EXPECT_EQ(sink.pool().in_use_count(1), 0u);

    // Recovery: the next event goes through once the backend is back
    network_.failing_hosts.clear();
    sink.ship(Event({{"@message", "y"}}));
    EXPECT_EQ(sink.stats().messages_sent, 1u);
}

}  // namespace
}  // namespace logship::sinks

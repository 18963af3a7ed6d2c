// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file resilient_client_test.cpp
/// @brief Retry across endpoints and purging of failed connections

#include "logship/resilient_client.hpp"
#include "logship/errors.hpp"
#include "fake_connection.hpp"

#include <gtest/gtest.h>

namespace logship {
namespace {

using test::endpoint_named;
using test::fake_factory;
using test::FakeNetwork;

class ResilientClientTest : public ::testing::Test {
protected:
    void make_pool(std::vector<std::string> hosts, size_t max_per_endpoint = SIZE_MAX) {
        std::vector<Endpoint> endpoints;
        for (const auto& h : hosts) {
            endpoints.push_back(endpoint_named(h));
        }
        PoolConfig config;
        config.max_connections_per_endpoint = max_per_endpoint;
        pool_ = std::make_unique<ConnectionPool>(std::move(endpoints), fake_factory(network_),
                                                 config);
        client_ = std::make_unique<ResilientClient>(*pool_);
    }

    FakeNetwork network_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<ResilientClient> client_;
};

TEST_F(ResilientClientTest, SucceedsOnFirstHealthyEndpoint) {
    make_pool({"e1", "e2"});

    RedisReply reply = client_->execute({"LPUSH", "logs", "x"});
    EXPECT_EQ(reply.type, RedisReply::Type::Integer);
    EXPECT_EQ(network_.connections_to("e1"), 1u);
    EXPECT_EQ(pool_->available_count(0), 1u);
    EXPECT_EQ(pool_->in_use_count(0), 0u);

    std::vector<std::string> expected = {"LPUSH", "logs", "x"};
    ASSERT_EQ(network_.records[0]->commands.size(), 1u);
    EXPECT_EQ(network_.records[0]->commands[0], expected);
}

TEST_F(ResilientClientTest, RetriesOnNextEndpoint) {
    network_.failing_hosts.insert("e1");
    make_pool({"e1", "e2"});

    EXPECT_NO_THROW(client_->execute({"PING"}));

    // e1's connection was purged and never returned to rotation
    ASSERT_EQ(network_.records.size(), 2u);
    EXPECT_TRUE(network_.records[0]->disconnected);
    EXPECT_EQ(pool_->available_count(0), 0u);
    EXPECT_EQ(pool_->in_use_count(0), 0u);
    EXPECT_EQ(pool_->live_count(0), 0u);
    EXPECT_EQ(pool_->created_count(0), 1u);
    EXPECT_EQ(pool_->available_count(1), 1u);
}

TEST_F(ResilientClientTest, CapBoundsConnectionsCreatedAcrossPurges) {
    network_.failing_hosts.insert("e1");
    make_pool({"e1"}, 1);

    for (int i = 0; i < 5; ++i) {
        EXPECT_THROW(client_->execute({"PING"}), TransportError);
    }

    // Only the first call reached e1; every later one found the endpoint exhausted
    EXPECT_EQ(network_.connections_to("e1"), 1u);
    EXPECT_EQ(pool_->created_count(0), 1u);
    EXPECT_EQ(pool_->live_count(0), 0u);
    EXPECT_THROW(pool_->lease(), PoolExhaustedError);
}

TEST_F(ResilientClientTest, ExhaustionRaisesAfterOneAttemptPerEndpoint) {
    network_.failing_hosts = {"e1", "e2", "e3"};
    make_pool({"e1", "e2", "e3"});

    EXPECT_THROW(client_->execute({"PING"}), TransportError);

    EXPECT_EQ(network_.records.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(pool_->in_use_count(i), 0u) << i;
        EXPECT_EQ(pool_->available_count(i), 0u) << i;
        EXPECT_TRUE(network_.records[i]->disconnected) << i;
    }
}

TEST_F(ResilientClientTest, FinalErrorPropagates) {
    network_.failing_hosts = {"e1"};
    make_pool({"e1"});

    try {
        client_->execute({"PING"});
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.cause(), TransportError::Cause::Io);
        EXPECT_NE(std::string(e.what()).find("e1"), std::string::npos);
    }
}

TEST_F(ResilientClientTest, PoolExhaustionIsRetried) {
    make_pool({"e1", "e2"}, 1);

    // Hold e1's only connection; the client must move on to e2
    auto held = pool_->lease();
    EXPECT_NO_THROW(client_->execute({"PING"}));
    EXPECT_EQ(network_.connections_to("e2"), 1u);

    // Cursor is back on e1, which is full: the first attempt is exhausted, the second succeeds
    EXPECT_NO_THROW(client_->execute({"PING"}));
    EXPECT_EQ(network_.connections_to("e2"), 1u);
}

TEST_F(ResilientClientTest, UnreachableEndpointIsSkipped) {
    network_.unreachable_hosts.insert("e1");
    make_pool({"e1", "e2"});

    EXPECT_NO_THROW(client_->execute({"PING"}));
    EXPECT_EQ(pool_->created_count(0), 0u);
}

TEST_F(ResilientClientTest, NoEndpoints) {
    make_pool({});
    try {
        client_->execute({"PING"});
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.cause(), TransportError::Cause::NoEndpoints);
    }
}

TEST_F(ResilientClientTest, AttemptBudgetFollowsEndpointCount) {
    make_pool({"e1"});
    EXPECT_EQ(client_->execution_attempts(), 1u);
    pool_->add_endpoint(endpoint_named("e2"));
    EXPECT_EQ(client_->execution_attempts(), 2u);

    client_->set_execution_attempts(5);
    EXPECT_EQ(client_->execution_attempts(), 5u);
}

TEST_F(ResilientClientTest, ExplicitAttemptBudgetRevisitsEndpoints) {
    network_.failing_hosts.insert("e1");
    make_pool({"e1"});
    client_->set_execution_attempts(3);

    EXPECT_THROW(client_->execute({"PING"}), TransportError);
    EXPECT_EQ(network_.connections_to("e1"), 3u);
}

TEST_F(ResilientClientTest, LpushReturnsListLength) {
    make_pool({"e1"});
    network_.next_reply = 42;
    EXPECT_EQ(client_->lpush("logs", "{}"), 42);
}

}  // namespace
}  // namespace logship

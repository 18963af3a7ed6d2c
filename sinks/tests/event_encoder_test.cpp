// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

#include "event_encoder.hpp"

#include "logship/errors.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace logship::sinks {
namespace {

TEST(EventEncoderTest, PlainIsOneLine) {
    EventEncoder encoder;
    Event event = {{"@message", "hello"}, {"n", 1}};
    EXPECT_EQ(encoder.encode(event), "{\"@message\":\"hello\",\"n\":1}\n");
}

TEST(EventEncoderTest, BulkRoundTrip) {
    EncoderConfig config;
    config.bulk = true;
    config.bulk_index = "nginx-2025";
    config.bulk_type = "access";
    EventEncoder encoder(config);

    Event event = {{"@message", "GET /"}, {"@fields", {{"status", "200"}}}};
    std::string payload = encoder.encode(event);
    ASSERT_EQ(payload.back(), '\n');

    std::istringstream lines(payload);
    std::string action_line;
    std::string doc_line;
    std::string extra;
    ASSERT_TRUE(std::getline(lines, action_line));
    ASSERT_TRUE(std::getline(lines, doc_line));
    EXPECT_FALSE(std::getline(lines, extra));

    Event action = Event::parse(action_line);
    EXPECT_EQ(action["index"]["_index"], "nginx-2025");
    EXPECT_EQ(action["index"]["_type"], "access");
    EXPECT_EQ(Event::parse(doc_line), event);
}

TEST(EventEncoderTest, BulkDefaults) {
    EncoderConfig config;
    config.bulk = true;
    EventEncoder encoder(config);
    EXPECT_EQ(encoder.encode(Event::object()),
              "{\"index\":{\"_index\":\"logs\",\"_type\":\"message\"}}\n{}\n");
}

TEST(EventEncoderTest, InvalidUtf8IsReplaced) {
    EventEncoder encoder;
    Event event = {{"@message", std::string("caf\xc3")}};
    std::string payload;
    EXPECT_NO_THROW(payload = encoder.encode(event));
    EXPECT_NE(payload.find("caf"), std::string::npos);
}

TEST(EventEncoderTest, ConfigFromArguments) {
    Arguments args;
    args.add("bulk=true");
    args.add("bulk_index=idx");
    EncoderConfig config = encoder_config_from(args);
    EXPECT_TRUE(config.bulk);
    EXPECT_EQ(config.bulk_index, "idx");
    EXPECT_EQ(config.bulk_type, "message");

    Arguments bad;
    bad.add("bulk=1");
    EXPECT_THROW(encoder_config_from(bad), ConfigError);
}

}  // namespace
}  // namespace logship::sinks

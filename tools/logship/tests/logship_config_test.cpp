// Copyright 2025 Logship Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file logship_config_test.cpp
/// @brief Config file loading, flag precedence and sink list handling

#include "logship_config.hpp"
#include "null_sink.hpp"

#include "logship/errors.hpp"
#include "logship/filters.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

namespace logship::cli {
namespace {

class LogshipConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) {
            std::remove(path_.c_str());
        }
    }

    std::string write_file(const std::string& content) {
        path_ = ::testing::TempDir() + "logship_config_test.yaml";
        std::ofstream out(path_);
        out << content;
        return path_;
    }

    std::string path_;
};

TEST_F(LogshipConfigTest, Defaults) {
    ShipperConfig config = resolve_config(std::nullopt, {});
    EXPECT_EQ(config.filters, "init_txt,add_timestamp,add_source_host");
    EXPECT_TRUE(config.filters_append.empty());
    EXPECT_EQ(config.sinks, std::vector<std::string>{"redis,redis://localhost:6379"});
}

TEST_F(LogshipConfigTest, LoadsFile) {
    std::string path = write_file(
        "filters: init_json\n"
        "filters_append:\n"
        "  - parse_lograge\n"
        "  - add_tags:web\n"
        "sinks:\n"
        "  - redis,redis://queue-a:6379/0,bulk=true\n"
        "  - statsd,metric=%{@fields.status}\n");

    ShipperConfig config = load_config_file(path);
    EXPECT_EQ(config.filters, "init_json");
    EXPECT_EQ(filter_description(config), "init_json,parse_lograge,add_tags:web");
    ASSERT_EQ(config.sinks.size(), 2u);
    EXPECT_EQ(config.sinks[1], "statsd,metric=%{@fields.status}");
}

TEST_F(LogshipConfigTest, ScalarListsAccepted) {
    YAML::Node yaml = YAML::Load("filters_append: parse_lograge\nsinks: null_sink_placeholder\n");
    ShipperConfig config;
    apply_yaml(yaml, config);
    EXPECT_EQ(config.filters_append, std::vector<std::string>{"parse_lograge"});
    EXPECT_EQ(config.sinks, std::vector<std::string>{"null_sink_placeholder"});
}

TEST_F(LogshipConfigTest, FlagsOverrideFile) {
    std::string path = write_file("filters: init_json\nsinks: [stdout]\n");

    FlagOverrides overrides;
    overrides.sinks = "null  stdout,bulk=true";
    ShipperConfig config = resolve_config(path, overrides);

    EXPECT_EQ(config.filters, "init_json");
    std::vector<std::string> expected = {"null", "stdout,bulk=true"};
    EXPECT_EQ(config.sinks, expected);

    overrides.filters = "init_txt";
    overrides.filters_append = "add_tags:x";
    config = resolve_config(path, overrides);
    EXPECT_EQ(filter_description(config), "init_txt,add_tags:x");
}

TEST_F(LogshipConfigTest, SeveralAppendedFiltersFromOneFlag) {
    std::string path = write_file("filters_append:\n  - add_fields:env=prod\n");

    FlagOverrides overrides;
    overrides.filters_append = "parse_lograge  add_tags:web,add_tags:prod";
    ShipperConfig config = resolve_config(path, overrides);

    std::vector<std::string> expected = {"parse_lograge", "add_tags:web,add_tags:prod"};
    EXPECT_EQ(config.filters_append, expected);
    EXPECT_EQ(filter_description(config),
              std::string(kDefaultFilters) + ",parse_lograge,add_tags:web,add_tags:prod");

    FilterRegistry registry;
    register_builtin_filters(registry);
    EXPECT_EQ(registry.build(filter_description(config)).size(), 6u);
}

TEST_F(LogshipConfigTest, UnknownKeyRejected) {
    std::string path = write_file("filterz: init_txt\n");
    EXPECT_THROW(load_config_file(path), ConfigError);
}

TEST_F(LogshipConfigTest, MalformedYamlRejected) {
    std::string path = write_file("filters: [unterminated\n");
    EXPECT_THROW(load_config_file(path), ConfigError);
}

TEST_F(LogshipConfigTest, MissingFileRejected) {
    EXPECT_THROW(load_config_file("/nonexistent/logship.yaml"), ConfigError);
}

TEST_F(LogshipConfigTest, WrongTypeRejected) {
    ShipperConfig config;
    EXPECT_THROW(apply_yaml(YAML::Load("filters: [a, b]"), config), ConfigError);
    EXPECT_THROW(apply_yaml(YAML::Load("sinks: {a: b}"), config), ConfigError);
    EXPECT_THROW(apply_yaml(YAML::Load("- just a list"), config), ConfigError);
}

TEST(FilterDescriptionTest, SkipsEmptyAppends) {
    EXPECT_EQ(filter_description("init_txt", {""}), "init_txt");
    EXPECT_EQ(filter_description("init_txt", {"a", "b:c"}), "init_txt,a,b:c");
}

TEST(SplitSinkListTest, Whitespace) {
    std::vector<std::string> expected = {"a,b", "c"};
    EXPECT_EQ(split_description_list("  a,b \t c\n"), expected);
    EXPECT_TRUE(split_description_list("   ").empty());
}

TEST(BuildFanoutTest, BuildsInOrder) {
    sinks::SinkRegistry registry;
    sinks::register_builtin_sinks(registry);

    sinks::Fanout fanout = build_fanout(registry, {"null", "stdout"});
    ASSERT_EQ(fanout.size(), 2u);
    EXPECT_EQ(fanout.sinks()[0]->name(), "null");
    EXPECT_EQ(fanout.sinks()[1]->name(), "stdout");
}

TEST(BuildFanoutTest, FirstBadSinkAborts) {
    sinks::SinkRegistry registry;
    sinks::register_builtin_sinks(registry);

    EXPECT_THROW(build_fanout(registry, {"null", "bogus"}), UnknownSinkError);
    EXPECT_THROW(build_fanout(registry, {}), ConfigError);
}

}  // namespace
}  // namespace logship::cli

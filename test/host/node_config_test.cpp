/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <gossipnet/host/node_config.hpp>

using gossipnet::host::ConfigError;
using gossipnet::host::NodeConfig;
using gossipnet::host::parseCommandLine;

namespace {
  outcome::result<NodeConfig> parse(std::vector<std::string_view> args) {
    return parseCommandLine(args);
  }

  std::error_code error(std::vector<std::string_view> args) {
    auto r = parse(std::move(args));
    EXPECT_FALSE(r.has_value());
    return r.has_value() ? std::error_code{} : r.error();
  }
}  // namespace

TEST(NodeConfigTest, RequiredFlags) {
  auto r = parse({"--period", "2", "--port", "9000"});
  ASSERT_TRUE(r.has_value()) << r.error().message();
  EXPECT_EQ(r.value().period, std::chrono::seconds{2});
  EXPECT_EQ(r.value().port, 9000);
  EXPECT_FALSE(r.value().connect.has_value());
  EXPECT_EQ(r.value().log_level, gossipnet::log::Level::INFO);
  EXPECT_EQ(r.value().relay_capacity, 16);
  EXPECT_EQ(r.value().recency_window, std::chrono::seconds{10});
  EXPECT_EQ(r.value().localAddress().toString(), "127.0.0.1:9000");
}

TEST(NodeConfigTest, OptionalFlagsAndEqualsSyntax) {
  auto r = parse({"--port=9001",
                  "--period=5",
                  "--connect",
                  "127.0.0.1:9000",
                  "--log-level=debug",
                  "--threads",
                  "4"});
  ASSERT_TRUE(r.has_value()) << r.error().message();
  EXPECT_EQ(r.value().period, std::chrono::seconds{5});
  EXPECT_EQ(r.value().port, 9001);
  ASSERT_TRUE(r.value().connect.has_value());
  EXPECT_EQ(r.value().connect->toString(), "127.0.0.1:9000");
  EXPECT_EQ(r.value().log_level, gossipnet::log::Level::DEBUG);
  EXPECT_EQ(r.value().threads, 4);
}

TEST(NodeConfigTest, Argv) {
  const char *argv[] = {"gossipnet_node", "--period", "1", "--port", "1"};
  auto r = parseCommandLine(5, argv);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r.value().port, 1);
}

/**
 * @given invalid command lines
 * @when parsing them
 * @then configuration error is returned
 */
TEST(NodeConfigTest, Errors) {
  auto make = [](ConfigError e) { return make_error_code(e); };
  EXPECT_EQ(error({"--port", "9000"}), make(ConfigError::MISSING_PERIOD));
  EXPECT_EQ(error({"--period", "1"}), make(ConfigError::MISSING_PORT));
  EXPECT_EQ(error({"--period", "0", "--port", "1"}),
            make(ConfigError::INVALID_PERIOD));
  EXPECT_EQ(error({"--period", "-3", "--port", "1"}),
            make(ConfigError::INVALID_PERIOD));
  EXPECT_EQ(error({"--period", "1s", "--port", "1"}),
            make(ConfigError::INVALID_PERIOD));
  EXPECT_EQ(error({"--period", "1", "--port", "0"}),
            make(ConfigError::INVALID_PORT));
  EXPECT_EQ(error({"--period", "1", "--port", "70000"}),
            make(ConfigError::INVALID_PORT));
  EXPECT_EQ(error({"--period", "1", "--port", "1", "--connect", "x"}),
            make(ConfigError::INVALID_CONNECT));
  EXPECT_EQ(error({"--period", "1", "--port", "1", "--log-level", "loud"}),
            make(ConfigError::INVALID_LOG_LEVEL));
  EXPECT_EQ(error({"--period", "1", "--port", "1", "--threads", "0"}),
            make(ConfigError::INVALID_THREADS));
  EXPECT_EQ(error({"--period"}), make(ConfigError::MISSING_VALUE));
  EXPECT_EQ(error({"--verbose"}), make(ConfigError::UNKNOWN_FLAG));
  EXPECT_EQ(error({"--period", "1", "--help"}),
            make(ConfigError::HELP_REQUESTED));
}

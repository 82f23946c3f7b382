/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/log/configure.hpp>

#include <cstdio>
#include <cstdlib>

#include <fmt/format.h>
#include <soralog/impl/configurator_from_yaml.hpp>

namespace gossipnet::log {
  std::optional<Level> parseLevel(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "info") {
      return Level::INFO;
    }
    if (str == "warn" or str == "warning") {
      return Level::WARN;
    }
    if (str == "error") {
      return Level::ERROR;
    }
    return std::nullopt;
  }

  void configureConsoleLogging(Level level) {
    std::string yaml = R"(
    sinks:
      - name: console
        type: console
        color: false
        thread: none
        capacity: 64
        latency: 0
    groups:
      - name: main
        sink: console
        level: info
        is_fallback: true
        children:
          - name: gossipnet
    )";
    auto logsys = std::make_shared<soralog::LoggingSystem>(
        std::make_shared<soralog::ConfiguratorFromYAML>(yaml));
    auto r = logsys->configure();
    if (not r.message.empty()) {
      fmt::print(stderr, "soralog error: {}\n", r.message);
    }
    if (r.has_error) {
      exit(EXIT_FAILURE);
    }
    setLoggingSystem(logsys);
    setLevelOfGroup(kDefaultGroup, level);
  }
}  // namespace gossipnet::log

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <gossipnet/log/logger.hpp>
#include <gossipnet/peer/address.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace gossipnet::host {
  enum class ConfigError {
    HELP_REQUESTED,
    UNKNOWN_FLAG,
    MISSING_VALUE,
    MISSING_PERIOD,
    MISSING_PORT,
    INVALID_PERIOD,
    INVALID_PORT,
    INVALID_CONNECT,
    INVALID_LOG_LEVEL,
    INVALID_THREADS,
  };
  Q_ENUM_ERROR_CODE(ConfigError) {
    using E = decltype(e);
    switch (e) {
      case E::HELP_REQUESTED:
        return "Help requested";
      case E::UNKNOWN_FLAG:
        return "Unknown flag";
      case E::MISSING_VALUE:
        return "Flag requires a value";
      case E::MISSING_PERIOD:
        return "--period is required";
      case E::MISSING_PORT:
        return "--port is required";
      case E::INVALID_PERIOD:
        return "--period must be a positive number of seconds";
      case E::INVALID_PORT:
        return "--port must be in range 1..65535";
      case E::INVALID_CONNECT:
        return "--connect must be ip:port";
      case E::INVALID_LOG_LEVEL:
        return "--log-level must be one of trace, debug, info, warn, error";
      case E::INVALID_THREADS:
        return "--threads must be a positive number";
    }
    abort();
  }

  /// Default capacity of relay subscriber queue.
  constexpr size_t kDefaultRelayCapacity = 16;

  /// Messages older than this are not surfaced.
  constexpr std::chrono::seconds kDefaultRecencyWindow{10};

  struct NodeConfig {
    /// Interval between own gossip messages.
    std::chrono::seconds period{1};
    /// Listening port on loopback.
    uint16_t port = 0;
    /// Seed peer dialed once at startup.
    std::optional<peer::Address> connect;
    log::Level log_level = log::Level::INFO;
    size_t threads = 2;
    size_t relay_capacity = kDefaultRelayCapacity;
    std::chrono::seconds recency_window = kDefaultRecencyWindow;
    std::chrono::milliseconds handshake_timeout{5000};
    size_t max_line_length = 64 * 1024;

    /// Address peers use to reach this node.
    peer::Address localAddress() const;
  };

  /**
   * Parses `--period <s> --port <p> [--connect <ip:port>]
   * [--log-level <level>] [--threads <n>]`, `--flag=value` is accepted too.
   * `--help` fails with `HELP_REQUESTED`.
   */
  outcome::result<NodeConfig> parseCommandLine(
      std::span<const std::string_view> args);

  outcome::result<NodeConfig> parseCommandLine(int argc,
                                               const char *const *argv);

  /// Usage text printed for `--help` and configuration errors.
  std::string usage(std::string_view program);
}  // namespace gossipnet::host

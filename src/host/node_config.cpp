/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/host/node_config.hpp>

#include <charconv>
#include <vector>

#include <fmt/format.h>
#include <gossipnet/log/configure.hpp>

namespace gossipnet::host {
  namespace {
    template <typename T>
    std::optional<T> parseInt(std::string_view str) {
      T num;
      auto r = std::from_chars(str.data(), str.data() + str.size(), num);
      if (r.ec != std::errc{} or r.ptr != str.data() + str.size()) {
        return std::nullopt;
      }
      return num;
    }
  }  // namespace

  peer::Address NodeConfig::localAddress() const {
    return {boost::asio::ip::address_v4::loopback(), port};
  }

  outcome::result<NodeConfig> parseCommandLine(
      std::span<const std::string_view> args) {
    NodeConfig config;
    bool has_period = false;
    bool has_port = false;
    for (size_t i = 0; i < args.size(); ++i) {
      auto arg = args[i];
      if (arg == "--help" or arg == "-h") {
        return ConfigError::HELP_REQUESTED;
      }
      std::string_view flag = arg;
      std::optional<std::string_view> value;
      if (auto eq = arg.find('='); eq != std::string_view::npos) {
        flag = arg.substr(0, eq);
        value = arg.substr(eq + 1);
      }
      if (flag != "--period" and flag != "--port" and flag != "--connect"
          and flag != "--log-level" and flag != "--threads") {
        return ConfigError::UNKNOWN_FLAG;
      }
      if (not value) {
        if (i + 1 == args.size()) {
          return ConfigError::MISSING_VALUE;
        }
        value = args[++i];
      }

      if (flag == "--period") {
        auto period = parseInt<uint32_t>(*value);
        if (not period or *period == 0) {
          return ConfigError::INVALID_PERIOD;
        }
        config.period = std::chrono::seconds{*period};
        has_period = true;
      } else if (flag == "--port") {
        auto port = parseInt<uint16_t>(*value);
        if (not port or *port == 0) {
          return ConfigError::INVALID_PORT;
        }
        config.port = *port;
        has_port = true;
      } else if (flag == "--connect") {
        auto address = peer::Address::parse(*value);
        if (not address.has_value()) {
          return ConfigError::INVALID_CONNECT;
        }
        config.connect = address.value();
      } else if (flag == "--log-level") {
        auto level = log::parseLevel(*value);
        if (not level) {
          return ConfigError::INVALID_LOG_LEVEL;
        }
        config.log_level = *level;
      } else {
        auto threads = parseInt<size_t>(*value);
        if (not threads or *threads == 0) {
          return ConfigError::INVALID_THREADS;
        }
        config.threads = *threads;
      }
    }
    if (not has_period) {
      return ConfigError::MISSING_PERIOD;
    }
    if (not has_port) {
      return ConfigError::MISSING_PORT;
    }
    return config;
  }

  outcome::result<NodeConfig> parseCommandLine(int argc,
                                               const char *const *argv) {
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }
    return parseCommandLine(args);
  }

  std::string usage(std::string_view program) {
    return fmt::format(
        "usage: {} --period <seconds> --port <port> [--connect <ip:port>]\n"
        "       [--log-level trace|debug|info|warn|error] [--threads <n>]\n",
        program);
  }
}  // namespace gossipnet::host

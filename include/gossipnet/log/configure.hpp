/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include <gossipnet/log/logger.hpp>

namespace gossipnet::log {
  /// Parses "trace", "debug", "info", "warn" (or "warning"), "error".
  std::optional<Level> parseLevel(std::string_view str);

  /**
   * Configures console logging system with the `gossipnet` group at `level`.
   * Prints configurator messages to stderr and exits on configuration error.
   */
  void configureConsoleLogging(Level level = Level::INFO);
}  // namespace gossipnet::log

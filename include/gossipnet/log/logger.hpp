/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace gossipnet::log {
  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  /// Group of all loggers created by `createLogger(tag)`.
  inline const std::string kDefaultGroup = "gossipnet";

  /**
   * Sets logging system used by `createLogger`.
   * Must be called once before any component is constructed.
   */
  void setLoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

  /// True when `setLoggingSystem` was called.
  bool isLoggingSystemSet();

  void setLevelOfGroup(const std::string &group_name, Level level);

  Logger createLogger(const std::string &tag);

  Logger createLogger(const std::string &tag, const std::string &group);
}  // namespace gossipnet::log

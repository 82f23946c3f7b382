/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/log/logger.hpp>

#include <stdexcept>

namespace gossipnet::log {
  namespace {
    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  }  // namespace

  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  bool isLoggingSystemSet() {
    return logging_system_ != nullptr;
  }

  void setLevelOfGroup(const std::string &group_name, Level level) {
    if (not logging_system_) {
      throw std::logic_error{
          "Logging system is not ready. "
          "gossipnet::log::setLoggingSystem() must be executed once before"};
    }
    logging_system_->setLevelOfGroup(group_name, level);
  }

  Logger createLogger(const std::string &tag) {
    return createLogger(tag, kDefaultGroup);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    if (not logging_system_) {
      throw std::logic_error{
          "Logging system is not ready. "
          "gossipnet::log::setLoggingSystem() must be executed once before"};
    }
    return logging_system_->getLogger(tag, group);
  }
}  // namespace gossipnet::log

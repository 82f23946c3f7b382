/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/common/uptime.hpp>

namespace gossipnet {
  Uptime::Uptime() : start_{Clock::now()} {}

  Uptime::Uptime(Clock::time_point start) : start_{start} {}

  std::chrono::seconds Uptime::elapsed() const {
    return std::chrono::duration_cast<std::chrono::seconds>(Clock::now()
                                                            - start_);
  }

  std::string Uptime::toString() const {
    return format(elapsed());
  }

  std::string Uptime::format(std::chrono::seconds elapsed) {
    auto total = elapsed.count() < 0 ? 0 : elapsed.count();
    return fmt::format(
        "{:02}:{:02}:{:02}", total / 3600 % 24, total / 60 % 60, total % 60);
  }

  uint64_t unixSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
}  // namespace gossipnet

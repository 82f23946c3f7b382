/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

namespace gossipnet {
  /**
   * Time elapsed since node start, printed as "HH:MM:SS" in front of
   * user-facing log lines.
   */
  class Uptime {
   public:
    using Clock = std::chrono::steady_clock;

    Uptime();

    explicit Uptime(Clock::time_point start);

    std::chrono::seconds elapsed() const;

    std::string toString() const;

    /// Formats `elapsed` as hours, minutes and seconds, hours wrap at 24.
    static std::string format(std::chrono::seconds elapsed);

   private:
    Clock::time_point start_;
  };

  /// Wall clock in seconds since unix epoch, used for message timestamps.
  uint64_t unixSeconds();
}  // namespace gossipnet

template <>
struct fmt::formatter<gossipnet::Uptime> : fmt::formatter<std::string_view> {
  auto format(const gossipnet::Uptime &uptime, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(uptime.toString(), ctx);
  }
};

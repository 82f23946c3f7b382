/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <gossipnet/common/uptime.hpp>

using gossipnet::Uptime;

/**
 * @given elapsed durations
 * @when formatting them
 * @then "HH:MM:SS" with zero padding is produced
 */
TEST(UptimeTest, Format) {
  EXPECT_EQ(Uptime::format(std::chrono::seconds{0}), "00:00:00");
  EXPECT_EQ(Uptime::format(std::chrono::seconds{7}), "00:00:07");
  EXPECT_EQ(Uptime::format(std::chrono::seconds{61}), "00:01:01");
  EXPECT_EQ(Uptime::format(std::chrono::seconds{3 * 3600 + 25 * 60 + 9}),
            "03:25:09");
  EXPECT_EQ(Uptime::format(std::chrono::seconds{23 * 3600 + 59 * 60 + 59}),
            "23:59:59");
  EXPECT_EQ(Uptime::format(std::chrono::seconds{25 * 3600 + 2}), "01:00:02");
}

/**
 * @given uptime started 65 seconds ago
 * @when formatting it with fmt
 * @then elapsed time is printed
 */
TEST(UptimeTest, FormatsElapsedSinceStart) {
  Uptime uptime{Uptime::Clock::now() - std::chrono::seconds{65}};
  EXPECT_GE(uptime.elapsed(), std::chrono::seconds{65});
  EXPECT_EQ(fmt::format("{} - x", uptime), "00:01:05 - x");
}

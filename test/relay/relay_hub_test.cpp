/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include <gtest/gtest.h>

#include <gossipnet/coro/spawn.hpp>
#include <gossipnet/relay/relay_hub.hpp>

#include "testutil/io.hpp"

using gossipnet::Coro;
using gossipnet::coroSpawn;
using gossipnet::peer::Address;
using gossipnet::relay::RelayHub;
using gossipnet::relay::RelayItem;

namespace {
  Address addr(uint16_t port) {
    return {boost::asio::ip::address_v4::loopback(), port};
  }

  RelayItem item(std::string line, uint16_t origin = 1) {
    return {std::move(line) + "\n", addr(origin)};
  }
}  // namespace

class RelayHubTest : public ::testing::Test {
 public:
  /// Receives items of `subscription` until it is closed.
  void collect(std::shared_ptr<RelayHub::Subscription> subscription,
               std::vector<std::string> &lines,
               std::error_code &end) {
    coroSpawn(io, [subscription, &lines, &end]() -> Coro<void> {
      while (true) {
        auto r = co_await subscription->receive();
        if (not r.has_value()) {
          end = r.error();
          break;
        }
        lines.emplace_back(r.value().line);
      }
    });
  }

  boost::asio::io_context io;
  std::shared_ptr<RelayHub> hub = std::make_shared<RelayHub>(16);
};

/**
 * @given two subscribers
 * @when items are published
 * @then each subscriber receives all items in publication order
 */
TEST_F(RelayHubTest, FanOutInOrder) {
  std::vector<std::string> a, b;
  std::error_code a_end, b_end;
  collect(hub->subscribe(io.get_executor()), a, a_end);
  collect(hub->subscribe(io.get_executor()), b, b_end);
  EXPECT_EQ(hub->subscriberCount(), 2);

  EXPECT_EQ(hub->publish(item("1")), 2);
  EXPECT_EQ(hub->publish(item("2")), 2);
  EXPECT_EQ(hub->publish(item("3")), 2);
  EXPECT_TRUE(testutil::runUntil(io, std::chrono::seconds{1}, [&] {
    return a.size() == 3 and b.size() == 3;
  }));
  std::vector<std::string> expected{"1\n", "2\n", "3\n"};
  EXPECT_EQ(a, expected);
  EXPECT_EQ(b, expected);
}

/**
 * @given two subscribers and several threads publishing at the same time
 * @when all items are received
 * @then both subscribers observe the same sequence
 */
TEST_F(RelayHubTest, SameOrderForConcurrentPublishers) {
  constexpr size_t kThreads = 4;
  constexpr size_t kItems = 250;
  hub = std::make_shared<RelayHub>(kThreads * kItems);
  std::vector<std::string> a, b;
  std::error_code a_end, b_end;
  collect(hub->subscribe(io.get_executor()), a, a_end);
  collect(hub->subscribe(io.get_executor()), b, b_end);

  std::vector<std::thread> publishers;
  for (size_t t = 0; t < kThreads; ++t) {
    publishers.emplace_back([this, t] {
      for (size_t i = 0; i < kItems; ++i) {
        hub->publish(item(std::to_string(t) + "-" + std::to_string(i)));
      }
    });
  }
  for (auto &publisher : publishers) {
    publisher.join();
  }
  ASSERT_TRUE(testutil::runUntil(io, std::chrono::seconds{2}, [&] {
    return a.size() == kThreads * kItems and b.size() == kThreads * kItems;
  }));
  EXPECT_EQ(a, b);
}

/**
 * @given item published before subscription
 * @when subscribing afterwards
 * @then the item is not replayed
 */
TEST_F(RelayHubTest, NoReplay) {
  EXPECT_EQ(hub->publish(item("early")), 0);
  std::vector<std::string> lines;
  std::error_code end;
  collect(hub->subscribe(io.get_executor()), lines, end);
  hub->publish(item("late"));
  EXPECT_TRUE(testutil::runUntil(
      io, std::chrono::seconds{1}, [&] { return lines.size() == 1; }));
  testutil::runFor(io, std::chrono::milliseconds{50});
  EXPECT_EQ(lines, std::vector<std::string>{"late\n"});
}

/**
 * @given subscriber which doesn't receive and capacity 2
 * @when 5 items are published
 * @then publisher isn't blocked, only 2 items are queued, 3 dropped
 */
TEST(RelayHubCapacityTest, LossyWhenFull) {
  boost::asio::io_context io;
  auto hub = std::make_shared<RelayHub>(2);
  auto slow = hub->subscribe(io.get_executor());
  size_t accepted = 0;
  for (auto i = 0; i < 5; ++i) {
    accepted += hub->publish(item(std::to_string(i)));
  }
  EXPECT_EQ(accepted, 2);
  EXPECT_EQ(slow->dropped(), 3);

  std::vector<std::string> lines;
  coroSpawn(io, [slow, &lines]() -> Coro<void> {
    for (auto i = 0; i < 2; ++i) {
      auto r = co_await slow->receive();
      if (r.has_value()) {
        lines.emplace_back(r.value().line);
      }
    }
  });
  EXPECT_TRUE(testutil::runUntil(
      io, std::chrono::seconds{1}, [&] { return lines.size() == 2; }));
  EXPECT_EQ(lines, (std::vector<std::string>{"0\n", "1\n"}));
}

/**
 * @given subscriber
 * @when subscription is closed or destroyed
 * @then it no longer counts and receive fails
 */
TEST_F(RelayHubTest, UnsubscribeOnCloseAndDestroy) {
  std::vector<std::string> lines;
  std::error_code end;
  auto subscription = hub->subscribe(io.get_executor());
  collect(subscription, lines, end);
  {
    auto temporary = hub->subscribe(io.get_executor());
    EXPECT_EQ(hub->subscriberCount(), 2);
  }
  EXPECT_EQ(hub->subscriberCount(), 1);

  subscription->close();
  EXPECT_EQ(hub->subscriberCount(), 0);
  EXPECT_EQ(hub->publish(item("x")), 0);
  EXPECT_TRUE(testutil::runUntil(
      io, std::chrono::seconds{1}, [&] { return bool(end); }));
  EXPECT_EQ(end, make_error_code(RelayHub::Error::SUBSCRIPTION_CLOSED));
  EXPECT_TRUE(lines.empty());
}

/**
 * @given subscriber waiting for items
 * @when hub is closed
 * @then receive fails with HUB_CLOSED and later subscriptions are closed
 */
TEST_F(RelayHubTest, CloseHub) {
  std::vector<std::string> lines;
  std::error_code end;
  collect(hub->subscribe(io.get_executor()), lines, end);
  testutil::runFor(io, std::chrono::milliseconds{20});
  hub->close();
  EXPECT_TRUE(testutil::runUntil(
      io, std::chrono::seconds{1}, [&] { return bool(end); }));
  EXPECT_EQ(end, make_error_code(RelayHub::Error::HUB_CLOSED));

  std::error_code late_end;
  collect(hub->subscribe(io.get_executor()), lines, late_end);
  EXPECT_TRUE(testutil::runUntil(
      io, std::chrono::seconds{1}, [&] { return bool(late_end); }));
  EXPECT_EQ(late_end, make_error_code(RelayHub::Error::HUB_CLOSED));
  EXPECT_EQ(hub->subscriberCount(), 0);
}

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/relay/relay_hub.hpp>

#include <algorithm>

#include <gossipnet/common/weak_macro.hpp>
#include <gossipnet/coro/asio.hpp>

namespace gossipnet::relay {
  RelayHub::Subscription::Subscription(
      std::weak_ptr<RelayHub> hub,
      const boost::asio::any_io_executor &executor,
      size_t capacity)
      : hub_{std::move(hub)}, channel_{executor, capacity} {}

  RelayHub::Subscription::~Subscription() {
    auto weak_hub = hub_;
    IF_WEAK_LOCK(hub) {
      hub->unsubscribe(this);
    }
  }

  CoroOutcome<RelayItem> RelayHub::Subscription::receive() {
    auto [ec, item] = co_await channel_.async_receive(useCoroOutcome);
    if (ec) {
      co_return hub_closed_ ? Error::HUB_CLOSED : Error::SUBSCRIPTION_CLOSED;
    }
    co_return std::move(item);
  }

  void RelayHub::Subscription::close() {
    closeChannel(false);
    auto weak_hub = hub_;
    IF_WEAK_LOCK(hub) {
      hub->unsubscribe(this);
    }
  }

  bool RelayHub::Subscription::offer(const RelayItem &item) {
    if (channel_.try_send(boost::system::error_code{}, item)) {
      return true;
    }
    ++dropped_;
    return false;
  }

  void RelayHub::Subscription::closeChannel(bool hub_closed) {
    if (hub_closed) {
      hub_closed_ = true;
    }
    channel_.close();
  }

  RelayHub::RelayHub(size_t capacity) : capacity_{capacity} {
    BOOST_ASSERT(capacity_ != 0);
  }

  std::shared_ptr<RelayHub::Subscription> RelayHub::subscribe(
      const boost::asio::any_io_executor &executor) {
    auto subscription =
        std::make_shared<Subscription>(weak_from_this(), executor, capacity_);
    std::lock_guard lock{mutex_};
    if (closed_) {
      subscription->closeChannel(true);
      return subscription;
    }
    subscribers_.emplace_back(Subscriber{subscription.get(), subscription});
    return subscription;
  }

  size_t RelayHub::publish(const RelayItem &item) {
    // released after unlock, last reference unsubscribes
    std::vector<std::shared_ptr<Subscription>> subscribers;
    size_t accepted = 0;
    std::lock_guard lock{mutex_};
    subscribers.reserve(subscribers_.size());
    for (auto &entry : subscribers_) {
      auto subscriber = entry.weak.lock();
      if (subscriber == nullptr) {
        continue;
      }
      // offered under lock, all subscribers observe one publication order
      if (subscriber->offer(item)) {
        ++accepted;
      }
      subscribers.emplace_back(std::move(subscriber));
    }
    return accepted;
  }

  void RelayHub::close() {
    std::vector<Subscriber> subscribers;
    {
      std::lock_guard lock{mutex_};
      closed_ = true;
      subscribers.swap(subscribers_);
    }
    for (auto &entry : subscribers) {
      if (auto subscriber = entry.weak.lock()) {
        subscriber->closeChannel(true);
      }
    }
  }

  size_t RelayHub::subscriberCount() const {
    std::lock_guard lock{mutex_};
    return std::ranges::count_if(
        subscribers_, [](auto &entry) { return not entry.weak.expired(); });
  }

  void RelayHub::unsubscribe(const Subscription *subscription) {
    std::lock_guard lock{mutex_};
    // entries are compared by key, locking here could run a destructor
    std::erase_if(subscribers_, [&](auto &entry) {
      return entry.key == subscription or entry.weak.expired();
    });
  }
}  // namespace gossipnet::relay

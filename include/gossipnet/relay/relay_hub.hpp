/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <gossipnet/coro/coro.hpp>
#include <gossipnet/peer/address.hpp>
#include <qtils/enum_error_code.hpp>

namespace gossipnet::relay {
  /// Serialized envelope and the peer it came from.
  struct RelayItem {
    /// Newline terminated envelope.
    std::string line;
    /// Local address for own items, link peer for relayed ones.
    peer::Address origin;
  };

  /**
   * Fan-out of relay items to every subscriber.
   * Each subscriber has bounded queue, `publish` never blocks and drops
   * item for subscribers whose queue is full.
   * Subscribers receive items in publication order, there is no replay of
   * items published before `subscribe`.
   */
  class RelayHub : public std::enable_shared_from_this<RelayHub> {
   public:
    enum class Error {
      HUB_CLOSED,
      SUBSCRIPTION_CLOSED,
    };
    Q_ENUM_ERROR_CODE_FRIEND(Error) {
      using E = decltype(e);
      switch (e) {
        case E::HUB_CLOSED:
          return "Relay hub is closed";
        case E::SUBSCRIPTION_CLOSED:
          return "Relay subscription is closed";
      }
      abort();
    }

    class Subscription {
     public:
      using Channel = boost::asio::experimental::concurrent_channel<void(
          boost::system::error_code, RelayItem)>;

      Subscription(std::weak_ptr<RelayHub> hub,
                   const boost::asio::any_io_executor &executor,
                   size_t capacity);
      ~Subscription();

      Subscription(const Subscription &) = delete;
      Subscription &operator=(const Subscription &) = delete;

      /// Waits for next item, fails once subscription or hub is closed.
      CoroOutcome<RelayItem> receive();

      /// Unsubscribes, pending `receive` completes with error.
      void close();

      /// Number of items dropped because queue was full.
      size_t dropped() const {
        return dropped_;
      }

     private:
      friend class RelayHub;

      bool offer(const RelayItem &item);
      void closeChannel(bool hub_closed);

      std::weak_ptr<RelayHub> hub_;
      Channel channel_;
      std::atomic_bool hub_closed_ = false;
      std::atomic_size_t dropped_ = 0;
    };

    explicit RelayHub(size_t capacity);

    /// Subscribe, `receive` completes on `executor`.
    std::shared_ptr<Subscription> subscribe(
        const boost::asio::any_io_executor &executor);

    /**
     * Offers item to every subscriber, concurrent calls are serialized.
     * @return number of subscribers which accepted item
     */
    size_t publish(const RelayItem &item);

    /// Closes all subscriptions, later subscriptions are closed immediately.
    void close();

    size_t subscriberCount() const;

    size_t capacity() const {
      return capacity_;
    }

   private:
    struct Subscriber {
      const Subscription *key;
      std::weak_ptr<Subscription> weak;
    };

    void unsubscribe(const Subscription *subscription);

    size_t capacity_;
    mutable std::mutex mutex_;
    bool closed_ = false;
    std::vector<Subscriber> subscribers_;
  };
}  // namespace gossipnet::relay

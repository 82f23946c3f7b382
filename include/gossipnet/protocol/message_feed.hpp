/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <gossipnet/common/uptime.hpp>
#include <gossipnet/host/node_config.hpp>
#include <gossipnet/peer/peer_directory.hpp>
#include <gossipnet/protocol/seen_cache.hpp>
#include <gossipnet/relay/relay_hub.hpp>
#include <gossipnet/wire/envelope.hpp>

namespace gossipnet::protocol {
  /**
   * Visible feed of messages originated by other nodes.
   * Consumes relay hub and surfaces each message at most once:
   * own messages, stale messages and duplicates are dropped.
   */
  class MessageFeed : public std::enable_shared_from_this<MessageFeed> {
   public:
    using Observer = std::function<void(const wire::Message &)>;

    MessageFeed(std::shared_ptr<boost::asio::io_context> io_context,
                const host::NodeConfig &config,
                std::shared_ptr<peer::PeerDirectory> directory,
                std::shared_ptr<relay::RelayHub> hub,
                std::shared_ptr<Uptime> uptime);

    /// Called for every surfaced message, set before `start`.
    void setObserver(Observer observer) {
      observer_ = std::move(observer);
    }

    void start();

    void stop();

    /**
     * Applies filters and surfaces message if it passes.
     * Not thread safe, called from feed strand.
     * @return true if message was surfaced
     */
    bool accept(const wire::Message &message, uint64_t now);

    size_t seenCount() const {
      return seen_.size();
    }

   private:
    Coro<void> receiveLoop();

    host::NodeConfig config_;
    std::shared_ptr<peer::PeerDirectory> directory_;
    std::shared_ptr<relay::RelayHub> hub_;
    std::shared_ptr<Uptime> uptime_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::shared_ptr<relay::RelayHub::Subscription> subscription_;
    SeenCache seen_;
    Observer observer_;
    log::Logger log_;
  };
}  // namespace gossipnet::protocol

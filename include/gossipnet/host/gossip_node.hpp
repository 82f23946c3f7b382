/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include <gossipnet/network/connection_manager.hpp>
#include <gossipnet/network/dialer.hpp>
#include <gossipnet/network/listener.hpp>
#include <gossipnet/protocol/gossip_emitter.hpp>
#include <gossipnet/protocol/message_feed.hpp>

namespace gossipnet::host {
  /**
   * Single node of the gossip overlay.
   *
   * It:
   * - listens on loopback for inbound links
   * - dials the seed peer once, if configured
   * - periodically originates messages and re-announces known peers
   * - surfaces messages of other nodes through the message feed
   */
  class GossipNode {
   public:
    GossipNode(std::shared_ptr<boost::asio::io_context> io_context,
               const NodeConfig &config,
               std::shared_ptr<peer::PeerDirectory> directory,
               std::shared_ptr<relay::RelayHub> hub,
               std::shared_ptr<network::ConnectionManager> connections,
               std::shared_ptr<network::Listener> listener,
               std::shared_ptr<network::Dialer> dialer,
               std::shared_ptr<protocol::GossipEmitter> emitter,
               std::shared_ptr<protocol::MessageFeed> feed,
               std::shared_ptr<Uptime> uptime);

    /**
     * Binds listener and starts all tasks.
     * Bind error is returned, dial error is only logged.
     */
    outcome::result<void> start();

    /**
     * Stops accepting, stops gossip, closes relay hub and every link.
     * Tasks finish on the io_context, it may be stopped afterwards.
     */
    void stop();

    const peer::Address &address() const {
      return directory_->self();
    }

    const std::shared_ptr<peer::PeerDirectory> &directory() const {
      return directory_;
    }

    const std::shared_ptr<protocol::MessageFeed> &feed() const {
      return feed_;
    }

    const std::shared_ptr<network::ConnectionManager> &connections() const {
      return connections_;
    }

   private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    NodeConfig config_;
    std::shared_ptr<peer::PeerDirectory> directory_;
    std::shared_ptr<relay::RelayHub> hub_;
    std::shared_ptr<network::ConnectionManager> connections_;
    std::shared_ptr<network::Listener> listener_;
    std::shared_ptr<network::Dialer> dialer_;
    std::shared_ptr<protocol::GossipEmitter> emitter_;
    std::shared_ptr<protocol::MessageFeed> feed_;
    std::shared_ptr<Uptime> uptime_;
    std::atomic_bool started_ = false;
    std::atomic_bool stopped_ = false;
    log::Logger log_;
  };
}  // namespace gossipnet::host

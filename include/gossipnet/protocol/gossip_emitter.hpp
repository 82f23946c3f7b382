/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <random>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <gossipnet/common/uptime.hpp>
#include <gossipnet/host/node_config.hpp>
#include <gossipnet/peer/peer_directory.hpp>
#include <gossipnet/relay/relay_hub.hpp>
#include <gossipnet/wire/envelope.hpp>

namespace gossipnet::protocol {
  /**
   * Periodically originates a message and re-announces known peers.
   * Each tick publishes:
   * - Message with random content, origin is the local address,
   *   so every link forwards it;
   * - PeerInfo once per known peer with that peer as origin,
   *   so each link receives the digest from the copies of other peers.
   */
  class GossipEmitter : public std::enable_shared_from_this<GossipEmitter> {
   public:
    GossipEmitter(std::shared_ptr<boost::asio::io_context> io_context,
                  const host::NodeConfig &config,
                  std::shared_ptr<peer::PeerDirectory> directory,
                  std::shared_ptr<relay::RelayHub> hub,
                  std::shared_ptr<Uptime> uptime);

    /// First tick runs immediately, next ones every `period`.
    void start();

    void stop();

    /// One tick, returns originated message.
    wire::Message emit();

   private:
    host::NodeConfig config_;
    std::shared_ptr<peer::PeerDirectory> directory_;
    std::shared_ptr<relay::RelayHub> hub_;
    std::shared_ptr<Uptime> uptime_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::shared_ptr<boost::asio::steady_timer> timer_;
    std::atomic_bool stopped_ = false;
    std::mt19937 random_;
    log::Logger log_;
  };
}  // namespace gossipnet::protocol

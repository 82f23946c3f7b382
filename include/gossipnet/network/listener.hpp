/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <gossipnet/common/uptime.hpp>
#include <gossipnet/host/node_config.hpp>
#include <gossipnet/network/connection_manager.hpp>

namespace gossipnet::network {
  /**
   * Accepts inbound links on loopback.
   * First line of each link must be PeerInfo, otherwise link is dropped
   * without touching the directory.
   */
  class Listener : public std::enable_shared_from_this<Listener> {
   public:
    Listener(std::shared_ptr<boost::asio::io_context> io_context,
             const host::NodeConfig &config,
             std::shared_ptr<peer::PeerDirectory> directory,
             std::shared_ptr<ConnectionManager> connections,
             std::shared_ptr<Uptime> uptime);

    /// Binds and listens on configured port, errors are fatal for the node.
    outcome::result<void> listen();

    /// Starts accept loop, requires successful `listen`.
    void start();

    /// Closes acceptor, established links are not affected.
    void stop();

   private:
    Coro<void> acceptLoop();
    Coro<void> onAccepted(std::shared_ptr<connection::LineStream> stream);

    std::shared_ptr<boost::asio::io_context> io_context_;
    host::NodeConfig config_;
    std::shared_ptr<peer::PeerDirectory> directory_;
    std::shared_ptr<ConnectionManager> connections_;
    std::shared_ptr<Uptime> uptime_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::acceptor acceptor_;
    log::Logger log_;
  };
}  // namespace gossipnet::network

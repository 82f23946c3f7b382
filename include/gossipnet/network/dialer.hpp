/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <gossipnet/common/uptime.hpp>
#include <gossipnet/host/node_config.hpp>
#include <gossipnet/network/connection_manager.hpp>

namespace gossipnet::network {
  /**
   * Opens outbound link to seed peer and performs handshake.
   */
  class Dialer {
   public:
    Dialer(std::shared_ptr<boost::asio::io_context> io_context,
           const host::NodeConfig &config,
           std::shared_ptr<peer::PeerDirectory> directory,
           std::shared_ptr<ConnectionManager> connections,
           std::shared_ptr<Uptime> uptime);

    /**
     * Connects to `seed` and sends PeerInfo.
     * On success seed is inserted into directory and link is handed to
     * connection manager.
     */
    CoroOutcome<std::shared_ptr<ConnectionHandler>> dial(peer::Address seed);

   private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    host::NodeConfig config_;
    std::shared_ptr<peer::PeerDirectory> directory_;
    std::shared_ptr<ConnectionManager> connections_;
    std::shared_ptr<Uptime> uptime_;
    log::Logger log_;
  };
}  // namespace gossipnet::network

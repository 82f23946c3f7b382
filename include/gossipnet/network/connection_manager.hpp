/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <gossipnet/network/connection_handler.hpp>

namespace gossipnet::network {
  /**
   * Creates connection handlers for established links and keeps track of
   * live ones, so they can be closed on shutdown.
   */
  class ConnectionManager
      : public std::enable_shared_from_this<ConnectionManager> {
   public:
    ConnectionManager(std::shared_ptr<peer::PeerDirectory> directory,
                      std::shared_ptr<relay::RelayHub> hub);

    /// Starts handler for `stream` after handshake with `peer`.
    std::shared_ptr<ConnectionHandler> open(
        std::shared_ptr<connection::LineStream> stream, peer::Address peer);

    /// Closes all live links.
    void closeAll();

    size_t size() const;

    /// Peers of live links.
    std::vector<peer::Address> peers() const;

   private:
    void onClosed(const ConnectionHandler &handler);

    std::shared_ptr<peer::PeerDirectory> directory_;
    std::shared_ptr<relay::RelayHub> hub_;
    mutable std::mutex mutex_;
    std::unordered_map<const ConnectionHandler *,
                       std::shared_ptr<ConnectionHandler>>
        handlers_;
  };
}  // namespace gossipnet::network

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>

#include <gossipnet/connection/line_stream.hpp>
#include <gossipnet/log/logger.hpp>
#include <gossipnet/peer/peer_directory.hpp>
#include <gossipnet/relay/relay_hub.hpp>

namespace gossipnet::network {
  /**
   * Established link to one peer.
   * Reader publishes incoming messages to relay hub and updates directory,
   * writer forwards relay items not originated by this peer.
   * When reader ends, peer is removed from directory and link is closed.
   */
  class ConnectionHandler
      : public std::enable_shared_from_this<ConnectionHandler> {
   public:
    using OnClosed = std::function<void(const ConnectionHandler &)>;

    ConnectionHandler(std::shared_ptr<connection::LineStream> stream,
                      peer::Address peer,
                      std::shared_ptr<peer::PeerDirectory> directory,
                      std::shared_ptr<relay::RelayHub> hub,
                      OnClosed on_closed);

    /// Subscribes to relay hub and spawns reader and writer.
    void start();

    /// Closes link, safe to call more than once and from any thread.
    void close();

    const peer::Address &peer() const {
      return peer_;
    }

    bool isClosed() const {
      return closed_;
    }

   private:
    Coro<void> readLoop();
    Coro<void> writeLoop();

    /// Returns false when line is a protocol error.
    bool onLine(std::string line);

    std::shared_ptr<connection::LineStream> stream_;
    peer::Address peer_;
    std::shared_ptr<peer::PeerDirectory> directory_;
    std::shared_ptr<relay::RelayHub> hub_;
    OnClosed on_closed_;
    std::shared_ptr<relay::RelayHub::Subscription> subscription_;
    std::atomic_bool closed_ = false;
    log::Logger log_;
  };
}  // namespace gossipnet::network

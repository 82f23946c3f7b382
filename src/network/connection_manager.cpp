/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/network/connection_manager.hpp>

#include <ranges>

#include <gossipnet/common/weak_macro.hpp>

namespace gossipnet::network {
  ConnectionManager::ConnectionManager(
      std::shared_ptr<peer::PeerDirectory> directory,
      std::shared_ptr<relay::RelayHub> hub)
      : directory_{std::move(directory)}, hub_{std::move(hub)} {
    BOOST_ASSERT(directory_ != nullptr);
    BOOST_ASSERT(hub_ != nullptr);
  }

  std::shared_ptr<ConnectionHandler> ConnectionManager::open(
      std::shared_ptr<connection::LineStream> stream, peer::Address peer) {
    auto handler = std::make_shared<ConnectionHandler>(
        std::move(stream),
        std::move(peer),
        directory_,
        hub_,
        [WEAK_SELF](const ConnectionHandler &closed) {
          WEAK_LOCK(self);
          self->onClosed(closed);
        });
    {
      std::lock_guard lock{mutex_};
      handlers_.emplace(handler.get(), handler);
    }
    handler->start();
    return handler;
  }

  void ConnectionManager::closeAll() {
    decltype(handlers_) handlers;
    {
      std::lock_guard lock{mutex_};
      handlers.swap(handlers_);
    }
    for (auto &handler : handlers | std::views::values) {
      handler->close();
    }
  }

  size_t ConnectionManager::size() const {
    std::lock_guard lock{mutex_};
    return handlers_.size();
  }

  std::vector<peer::Address> ConnectionManager::peers() const {
    std::vector<peer::Address> peers;
    std::lock_guard lock{mutex_};
    for (auto &handler : handlers_ | std::views::values) {
      peers.emplace_back(handler->peer());
    }
    return peers;
  }

  void ConnectionManager::onClosed(const ConnectionHandler &handler) {
    std::shared_ptr<ConnectionHandler> removed;
    std::lock_guard lock{mutex_};
    auto it = handlers_.find(&handler);
    if (it != handlers_.end()) {
      removed = std::move(it->second);
      handlers_.erase(it);
    }
  }
}  // namespace gossipnet::network

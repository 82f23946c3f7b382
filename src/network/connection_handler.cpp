/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/network/connection_handler.hpp>

#include <gossipnet/coro/spawn.hpp>
#include <gossipnet/wire/codec.hpp>

namespace gossipnet::network {
  ConnectionHandler::ConnectionHandler(
      std::shared_ptr<connection::LineStream> stream,
      peer::Address peer,
      std::shared_ptr<peer::PeerDirectory> directory,
      std::shared_ptr<relay::RelayHub> hub,
      OnClosed on_closed)
      : stream_{std::move(stream)},
        peer_{std::move(peer)},
        directory_{std::move(directory)},
        hub_{std::move(hub)},
        on_closed_{std::move(on_closed)},
        log_{log::createLogger("Connection")} {
    BOOST_ASSERT(stream_ != nullptr);
    BOOST_ASSERT(directory_ != nullptr);
    BOOST_ASSERT(hub_ != nullptr);
  }

  void ConnectionHandler::start() {
    subscription_ = hub_->subscribe(stream_->executor());
    coroSpawn(stream_->executor(),
              [self{shared_from_this()}]() -> Coro<void> {
                co_await self->readLoop();
              });
    coroSpawn(stream_->executor(),
              [self{shared_from_this()}]() -> Coro<void> {
                co_await self->writeLoop();
              });
  }

  void ConnectionHandler::close() {
    if (closed_.exchange(true)) {
      return;
    }
    if (subscription_ != nullptr) {
      subscription_->close();
    }
    stream_->close();
    if (on_closed_) {
      on_closed_(*this);
    }
  }

  Coro<void> ConnectionHandler::readLoop() {
    while (true) {
      auto line = co_await stream_->readLine();
      if (not line.has_value()) {
        SL_DEBUG(log_, "Link to {} ended: {}", peer_, line.error());
        break;
      }
      if (not onLine(std::move(line.value()))) {
        break;
      }
    }
    if (directory_->remove(peer_)) {
      SL_DEBUG(log_, "Removed peer {}", peer_);
    }
    close();
  }

  bool ConnectionHandler::onLine(std::string line) {
    if (line.empty()) {
      return true;
    }
    auto envelope = wire::decode(line);
    if (not envelope.has_value()) {
      SL_WARN(log_, "Malformed line from {}: {}", peer_, envelope.error());
      return false;
    }
    if (auto *message = std::get_if<wire::Message>(&envelope.value())) {
      directory_->insert(message->from);
      line.push_back('\n');
      hub_->publish({std::move(line), peer_});
    } else {
      auto &peer_info = std::get<wire::PeerInfo>(envelope.value());
      directory_->merge(peer_info.known_peers);
    }
    return true;
  }

  Coro<void> ConnectionHandler::writeLoop() {
    while (true) {
      auto item = co_await subscription_->receive();
      if (not item.has_value()) {
        break;
      }
      if (item.value().origin == peer_) {
        continue;
      }
      auto written = co_await stream_->writeLine(std::move(item.value().line));
      if (not written.has_value()) {
        SL_DEBUG(log_, "Write to {} failed: {}", peer_, written.error());
        break;
      }
    }
    subscription_->close();
  }
}  // namespace gossipnet::network

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/protocol/message_feed.hpp>

#include <gossipnet/coro/spawn.hpp>
#include <gossipnet/wire/codec.hpp>

namespace gossipnet::protocol {
  MessageFeed::MessageFeed(std::shared_ptr<boost::asio::io_context> io_context,
                           const host::NodeConfig &config,
                           std::shared_ptr<peer::PeerDirectory> directory,
                           std::shared_ptr<relay::RelayHub> hub,
                           std::shared_ptr<Uptime> uptime)
      : config_{config},
        directory_{std::move(directory)},
        hub_{std::move(hub)},
        uptime_{std::move(uptime)},
        strand_{boost::asio::make_strand(*io_context)},
        seen_{config_.recency_window},
        log_{log::createLogger("Feed")} {
    BOOST_ASSERT(directory_ != nullptr);
    BOOST_ASSERT(hub_ != nullptr);
    BOOST_ASSERT(uptime_ != nullptr);
  }

  void MessageFeed::start() {
    subscription_ = hub_->subscribe(strand_);
    coroSpawn(strand_, [self{shared_from_this()}]() -> Coro<void> {
      co_await self->receiveLoop();
    });
  }

  void MessageFeed::stop() {
    if (subscription_ != nullptr) {
      subscription_->close();
    }
  }

  bool MessageFeed::accept(const wire::Message &message, uint64_t now) {
    if (message.from == directory_->self()) {
      return false;
    }
    if (not isRecent(message.timestamp, now, config_.recency_window)) {
      SL_TRACE(
          log_, "Stale message [{}] from {}", message.content, message.from);
      return false;
    }
    if (not seen_.insert(message.content, message.timestamp, now)) {
      return false;
    }
    log_->info("{} - Received message [{}] from \"{}\"",
               *uptime_,
               message.content,
               message.from);
    if (observer_) {
      observer_(message);
    }
    return true;
  }

  Coro<void> MessageFeed::receiveLoop() {
    while (true) {
      auto item = co_await subscription_->receive();
      if (not item.has_value()) {
        SL_DEBUG(log_, "Feed stopped: {}", item.error());
        break;
      }
      auto envelope = wire::decode(item.value().line);
      if (not envelope.has_value()) {
        continue;
      }
      if (auto *message = std::get_if<wire::Message>(&envelope.value())) {
        accept(*message, unixSeconds());
      }
    }
  }
}  // namespace gossipnet::protocol

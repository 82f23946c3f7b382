/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/protocol/gossip_emitter.hpp>

#include <boost/asio/post.hpp>
#include <fmt/ranges.h>
#include <gossipnet/common/weak_macro.hpp>
#include <gossipnet/coro/timer_loop.hpp>
#include <gossipnet/wire/codec.hpp>

namespace gossipnet::protocol {
  GossipEmitter::GossipEmitter(
      std::shared_ptr<boost::asio::io_context> io_context,
      const host::NodeConfig &config,
      std::shared_ptr<peer::PeerDirectory> directory,
      std::shared_ptr<relay::RelayHub> hub,
      std::shared_ptr<Uptime> uptime)
      : config_{config},
        directory_{std::move(directory)},
        hub_{std::move(hub)},
        uptime_{std::move(uptime)},
        strand_{boost::asio::make_strand(*io_context)},
        random_{std::random_device{}()},
        log_{log::createLogger("Emitter")} {
    BOOST_ASSERT(directory_ != nullptr);
    BOOST_ASSERT(hub_ != nullptr);
    BOOST_ASSERT(uptime_ != nullptr);
  }

  void GossipEmitter::start() {
    timer_ = timerLoop(strand_, config_.period, [WEAK_SELF] {
      auto self = weak_self.lock();
      if (not self or self->stopped_) {
        return false;
      }
      self->emit();
      return true;
    });
  }

  void GossipEmitter::stop() {
    stopped_ = true;
    boost::asio::post(strand_, [timer{timer_}] {
      if (timer != nullptr) {
        timer->cancel();
      }
    });
  }

  wire::Message GossipEmitter::emit() {
    auto &local = directory_->self();
    wire::Message message{
        .content = fmt::format(
            "{}", std::uniform_int_distribution<uint32_t>{}(random_)),
        .from = local,
        .timestamp = unixSeconds(),
    };
    auto peers = directory_->sortedSnapshot();
    log_->info("{} - Sending message [{}] to {{{}}}",
               *uptime_,
               message.content,
               fmt::join(peers, ", "));
    hub_->publish({wire::encode(message), local});

    auto peer_info = wire::encode(wire::PeerInfo{
        .port = local.port,
        .known_peers = peers,
    });
    for (auto &peer : peers) {
      hub_->publish({peer_info, peer});
    }
    return message;
  }
}  // namespace gossipnet::protocol

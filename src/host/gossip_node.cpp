/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/host/gossip_node.hpp>

#include <gossipnet/coro/spawn.hpp>

namespace gossipnet::host {
  GossipNode::GossipNode(
      std::shared_ptr<boost::asio::io_context> io_context,
      const NodeConfig &config,
      std::shared_ptr<peer::PeerDirectory> directory,
      std::shared_ptr<relay::RelayHub> hub,
      std::shared_ptr<network::ConnectionManager> connections,
      std::shared_ptr<network::Listener> listener,
      std::shared_ptr<network::Dialer> dialer,
      std::shared_ptr<protocol::GossipEmitter> emitter,
      std::shared_ptr<protocol::MessageFeed> feed,
      std::shared_ptr<Uptime> uptime)
      : io_context_{std::move(io_context)},
        config_{config},
        directory_{std::move(directory)},
        hub_{std::move(hub)},
        connections_{std::move(connections)},
        listener_{std::move(listener)},
        dialer_{std::move(dialer)},
        emitter_{std::move(emitter)},
        feed_{std::move(feed)},
        uptime_{std::move(uptime)},
        log_{log::createLogger("Node")} {
    BOOST_ASSERT(io_context_ != nullptr);
    BOOST_ASSERT(directory_ != nullptr);
    BOOST_ASSERT(hub_ != nullptr);
    BOOST_ASSERT(connections_ != nullptr);
    BOOST_ASSERT(listener_ != nullptr);
    BOOST_ASSERT(dialer_ != nullptr);
    BOOST_ASSERT(emitter_ != nullptr);
    BOOST_ASSERT(feed_ != nullptr);
    BOOST_ASSERT(uptime_ != nullptr);
    BOOST_ASSERT(directory_->self() == config_.localAddress());
  }

  outcome::result<void> GossipNode::start() {
    BOOST_ASSERT(not started_);
    BOOST_OUTCOME_TRY(listener_->listen());
    started_ = true;
    log_->info("{} - My address is \"{}\"", *uptime_, address());

    feed_->start();
    listener_->start();
    if (config_.connect) {
      coroSpawn(*io_context_,
                [dialer{dialer_}, seed{*config_.connect}, log{log_}]()
                    -> Coro<void> {
                  auto r = co_await dialer->dial(seed);
                  if (not r.has_value()) {
                    log->warn(
                        "Cannot connect to the peer at {}: {}", seed, r.error());
                  }
                });
    }
    emitter_->start();
    return outcome::success();
  }

  void GossipNode::stop() {
    if (stopped_.exchange(true)) {
      return;
    }
    SL_DEBUG(log_, "Stopping");
    listener_->stop();
    emitter_->stop();
    feed_->stop();
    hub_->close();
    connections_->closeAll();
  }
}  // namespace gossipnet::host

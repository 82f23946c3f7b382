/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/network/listener.hpp>

#include <boost/asio/post.hpp>
#include <fmt/ranges.h>
#include <gossipnet/coro/asio.hpp>
#include <gossipnet/coro/spawn.hpp>
#include <gossipnet/network/handshake.hpp>

namespace gossipnet::network {
  Listener::Listener(std::shared_ptr<boost::asio::io_context> io_context,
                     const host::NodeConfig &config,
                     std::shared_ptr<peer::PeerDirectory> directory,
                     std::shared_ptr<ConnectionManager> connections,
                     std::shared_ptr<Uptime> uptime)
      : io_context_{std::move(io_context)},
        config_{config},
        directory_{std::move(directory)},
        connections_{std::move(connections)},
        uptime_{std::move(uptime)},
        strand_{boost::asio::make_strand(*io_context_)},
        acceptor_{strand_},
        log_{log::createLogger("Listener")} {
    BOOST_ASSERT(directory_ != nullptr);
    BOOST_ASSERT(connections_ != nullptr);
    BOOST_ASSERT(uptime_ != nullptr);
  }

  outcome::result<void> Listener::listen() {
    auto endpoint = config_.localAddress().endpoint();
    boost::system::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (not ec) {
      acceptor_.set_option(boost::asio::socket_base::reuse_address{true}, ec);
    }
    if (not ec) {
      acceptor_.bind(endpoint, ec);
    }
    if (not ec) {
      acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      log_->error(
          "Cannot listen on {}: {}", config_.localAddress(), ec.message());
      return std::error_code{ec};
    }
    return outcome::success();
  }

  void Listener::start() {
    BOOST_ASSERT(acceptor_.is_open());
    coroSpawn(strand_, [self{shared_from_this()}]() -> Coro<void> {
      co_await self->acceptLoop();
    });
  }

  void Listener::stop() {
    boost::asio::post(strand_, [self{shared_from_this()}] {
      boost::system::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  Coro<void> Listener::acceptLoop() {
    while (true) {
      boost::asio::ip::tcp::socket socket{
          boost::asio::make_strand(*io_context_)};
      auto accepted =
          coroOutcome(co_await acceptor_.async_accept(socket, useCoroOutcome));
      if (not accepted.has_value()) {
        if (not acceptor_.is_open()) {
          break;
        }
        SL_DEBUG(log_, "Accept failed: {}", accepted.error());
        continue;
      }
      auto stream = std::make_shared<connection::LineStream>(
          std::move(socket), config_.max_line_length);
      coroSpawn(stream->executor(),
                [self{shared_from_this()}, stream]() -> Coro<void> {
                  co_await self->onAccepted(stream);
                });
    }
  }

  Coro<void> Listener::onAccepted(
      std::shared_ptr<connection::LineStream> stream) {
    auto peer_info =
        co_await receiveHandshake(*stream, config_.handshake_timeout);
    if (not peer_info.has_value()) {
      SL_DEBUG(log_,
               "Dropped connection from {}: {}",
               stream->remoteAddress(),
               peer_info.error());
      stream->close();
      co_return;
    }
    auto peer = handshakeAddress(*stream, peer_info.value());
    directory_->insert(peer);
    directory_->merge(peer_info.value().known_peers);
    log_->info("{} - Connected to the peer at \"{}\"", *uptime_, peer);
    log_->info("{} - {{{}}}",
               *uptime_,
               fmt::join(directory_->sortedSnapshot(), ", "));
    connections_->open(std::move(stream), peer);
  }
}  // namespace gossipnet::network

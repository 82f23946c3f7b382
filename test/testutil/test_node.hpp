/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <gossipnet/coro/asio.hpp>
#include <gossipnet/network/dialer.hpp>
#include <gossipnet/network/listener.hpp>

#include "testutil/io.hpp"

namespace testutil {
  inline gossipnet::peer::Address loopback(uint16_t port) {
    return {boost::asio::ip::address_v4::loopback(), port};
  }

  /**
   * Network parts of one node without gossip tasks:
   * directory, relay hub, connections, listener and dialer.
   */
  struct TestNode {
    TestNode(std::shared_ptr<boost::asio::io_context> io,
             gossipnet::host::NodeConfig node_config)
        : config{std::move(node_config)},
          directory{std::make_shared<gossipnet::peer::PeerDirectory>(
              config.localAddress())},
          hub{std::make_shared<gossipnet::relay::RelayHub>(
              config.relay_capacity)},
          connections{std::make_shared<gossipnet::network::ConnectionManager>(
              directory, hub)},
          listener{std::make_shared<gossipnet::network::Listener>(
              io, config, directory, connections, uptime)},
          dialer{std::make_shared<gossipnet::network::Dialer>(
              io, config, directory, connections, uptime)} {}

    static gossipnet::host::NodeConfig defaultConfig() {
      gossipnet::host::NodeConfig config;
      config.port = freePort();
      config.handshake_timeout = std::chrono::milliseconds{200};
      return config;
    }

    const gossipnet::peer::Address &address() const {
      return directory->self();
    }

    gossipnet::host::NodeConfig config;
    std::shared_ptr<gossipnet::Uptime> uptime =
        std::make_shared<gossipnet::Uptime>();
    std::shared_ptr<gossipnet::peer::PeerDirectory> directory;
    std::shared_ptr<gossipnet::relay::RelayHub> hub;
    std::shared_ptr<gossipnet::network::ConnectionManager> connections;
    std::shared_ptr<gossipnet::network::Listener> listener;
    std::shared_ptr<gossipnet::network::Dialer> dialer;
  };

  /// Plain tcp client speaking the line protocol.
  class RawClient {
   public:
    explicit RawClient(boost::asio::io_context &io) : socket_{io} {}

    gossipnet::CoroOutcome<void> connect(gossipnet::peer::Address address) {
      BOOST_OUTCOME_CO_TRY(
          gossipnet::coroOutcome(co_await socket_.async_connect(
              address.endpoint(), gossipnet::useCoroOutcome)));
      co_return outcome::success();
    }

    gossipnet::CoroOutcome<void> send(std::string line) {
      BOOST_OUTCOME_CO_TRY(gossipnet::coroOutcome(
          co_await boost::asio::async_write(socket_,
                                            boost::asio::buffer(line),
                                            gossipnet::useCoroOutcome)));
      co_return outcome::success();
    }

    gossipnet::CoroOutcome<std::string> readLine() {
      BOOST_OUTCOME_CO_TRY(auto size,
                           gossipnet::coroOutcome(
                               co_await boost::asio::async_read_until(
                                   socket_,
                                   boost::asio::dynamic_buffer(buffer_),
                                   '\n',
                                   gossipnet::useCoroOutcome)));
      auto line = buffer_.substr(0, size);
      buffer_.erase(0, size);
      co_return line;
    }

    void close() {
      boost::system::error_code ec;
      socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
      socket_.close(ec);
    }

   private:
    boost::asio::ip::tcp::socket socket_;
    std::string buffer_;
  };
}  // namespace testutil

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/network/dialer.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/strand.hpp>
#include <gossipnet/coro/asio.hpp>
#include <gossipnet/network/handshake.hpp>

namespace gossipnet::network {
  Dialer::Dialer(std::shared_ptr<boost::asio::io_context> io_context,
                 const host::NodeConfig &config,
                 std::shared_ptr<peer::PeerDirectory> directory,
                 std::shared_ptr<ConnectionManager> connections,
                 std::shared_ptr<Uptime> uptime)
      : io_context_{std::move(io_context)},
        config_{config},
        directory_{std::move(directory)},
        connections_{std::move(connections)},
        uptime_{std::move(uptime)},
        log_{log::createLogger("Dialer")} {
    BOOST_ASSERT(directory_ != nullptr);
    BOOST_ASSERT(connections_ != nullptr);
    BOOST_ASSERT(uptime_ != nullptr);
  }

  CoroOutcome<std::shared_ptr<ConnectionHandler>> Dialer::dial(
      peer::Address seed) {
    SL_DEBUG(log_, "Dialing {}", seed);
    boost::asio::ip::tcp::socket socket{
        boost::asio::make_strand(*io_context_)};
    BOOST_OUTCOME_CO_TRY(coroOutcome(
        co_await socket.async_connect(seed.endpoint(), useCoroOutcome)));
    auto stream = std::make_shared<connection::LineStream>(
        std::move(socket), config_.max_line_length);

    // handshake is written on the link strand like every later write
    auto sent = co_await boost::asio::co_spawn(
        stream->executor(),
        sendHandshake(*stream, makePeerInfo(*directory_)),
        boost::asio::use_awaitable);
    if (not sent.has_value()) {
      stream->close();
      co_return sent.error();
    }

    directory_->insert(seed);
    log_->info("{} - Connected to the peer at \"{}\"", *uptime_, seed);
    co_return connections_->open(std::move(stream), seed);
  }
}  // namespace gossipnet::network

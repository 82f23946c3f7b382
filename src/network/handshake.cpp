/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/network/handshake.hpp>

#include <gossipnet/wire/codec.hpp>

namespace gossipnet::network {
  wire::PeerInfo makePeerInfo(const peer::PeerDirectory &directory) {
    return wire::PeerInfo{
        .port = directory.self().port,
        .known_peers = directory.sortedSnapshot(),
    };
  }

  CoroOutcome<void> sendHandshake(connection::LineStream &stream,
                                  wire::PeerInfo peer_info) {
    BOOST_OUTCOME_CO_TRY(co_await stream.writeLine(wire::encode(peer_info)));
    co_return outcome::success();
  }

  CoroOutcome<wire::PeerInfo> receiveHandshake(
      connection::LineStream &stream, std::chrono::milliseconds timeout) {
    BOOST_OUTCOME_CO_TRY(auto line, co_await stream.readLine(timeout));
    BOOST_OUTCOME_CO_TRY(auto envelope, wire::decode(line));
    auto *peer_info = std::get_if<wire::PeerInfo>(&envelope);
    if (peer_info == nullptr) {
      co_return HandshakeError::NOT_PEER_INFO;
    }
    co_return std::move(*peer_info);
  }

  peer::Address handshakeAddress(const connection::LineStream &stream,
                                 const wire::PeerInfo &peer_info) {
    return {stream.remoteAddress().ip, peer_info.port};
  }
}  // namespace gossipnet::network

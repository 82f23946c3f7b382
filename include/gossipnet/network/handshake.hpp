/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include <gossipnet/connection/line_stream.hpp>
#include <gossipnet/peer/peer_directory.hpp>
#include <gossipnet/wire/envelope.hpp>
#include <qtils/enum_error_code.hpp>

namespace gossipnet::network {
  enum class HandshakeError {
    NOT_PEER_INFO,
  };
  Q_ENUM_ERROR_CODE(HandshakeError) {
    using E = decltype(e);
    switch (e) {
      case E::NOT_PEER_INFO:
        return "First line of connection is not PeerInfo";
    }
    abort();
  }

  /// PeerInfo of local node: listening port and known peers without self.
  wire::PeerInfo makePeerInfo(const peer::PeerDirectory &directory);

  /// Sends PeerInfo as the first line of outbound connection.
  CoroOutcome<void> sendHandshake(connection::LineStream &stream,
                                  wire::PeerInfo peer_info);

  /// Reads first line of inbound connection, which must be PeerInfo.
  CoroOutcome<wire::PeerInfo> receiveHandshake(
      connection::LineStream &stream, std::chrono::milliseconds timeout);

  /// Address of the remote node: observed ip with declared listening port.
  peer::Address handshakeAddress(const connection::LineStream &stream,
                                 const wire::PeerInfo &peer_info);
}  // namespace gossipnet::network

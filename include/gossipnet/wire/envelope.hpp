/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <gossipnet/peer/address.hpp>

namespace gossipnet::wire {
  /// Gossip payload originated by `from`.
  struct Message {
    std::string content;
    peer::Address from;
    /// Seconds since unix epoch at origin.
    uint64_t timestamp = 0;

    bool operator==(const Message &) const = default;
  };

  /// Listening port of the sender and the peers it knows.
  struct PeerInfo {
    uint16_t port = 0;
    std::vector<peer::Address> known_peers;

    bool operator==(const PeerInfo &) const = default;
  };

  using WireEnvelope = std::variant<Message, PeerInfo>;
}  // namespace gossipnet::wire

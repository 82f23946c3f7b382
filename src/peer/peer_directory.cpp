/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/peer/peer_directory.hpp>

#include <algorithm>

namespace gossipnet::peer {
  PeerDirectory::PeerDirectory(Address self) : self_{std::move(self)} {}

  bool PeerDirectory::insert(const Address &address) {
    if (address == self_) {
      return false;
    }
    std::lock_guard lock{mutex_};
    return peers_.emplace(address).second;
  }

  bool PeerDirectory::remove(const Address &address) {
    std::lock_guard lock{mutex_};
    return peers_.erase(address) != 0;
  }

  size_t PeerDirectory::merge(std::span<const Address> addresses,
                              const Address &exclude) {
    size_t added = 0;
    std::lock_guard lock{mutex_};
    for (auto &address : addresses) {
      if (address == exclude or address == self_) {
        continue;
      }
      if (peers_.emplace(address).second) {
        ++added;
      }
    }
    return added;
  }

  bool PeerDirectory::contains(const Address &address) const {
    std::lock_guard lock{mutex_};
    return peers_.contains(address);
  }

  size_t PeerDirectory::size() const {
    std::lock_guard lock{mutex_};
    return peers_.size();
  }

  PeerDirectory::Set PeerDirectory::snapshot() const {
    std::lock_guard lock{mutex_};
    return peers_;
  }

  std::vector<Address> PeerDirectory::sortedSnapshot() const {
    std::vector<Address> peers;
    {
      std::lock_guard lock{mutex_};
      peers.assign(peers_.begin(), peers_.end());
    }
    std::sort(peers.begin(), peers.end());
    return peers;
  }
}  // namespace gossipnet::peer

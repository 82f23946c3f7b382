/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <span>
#include <unordered_set>
#include <vector>

#include <gossipnet/peer/address.hpp>

namespace gossipnet::peer {
  /**
   * Set of known peer addresses shared by all links of the node.
   * Never contains the local address.
   * All methods are thread safe.
   */
  class PeerDirectory {
   public:
    using Set = std::unordered_set<Address>;

    explicit PeerDirectory(Address self);

    const Address &self() const {
      return self_;
    }

    /// Returns true if `address` was added.
    bool insert(const Address &address);

    /// Returns true if `address` was removed.
    bool remove(const Address &address);

    /**
     * Inserts each address except `exclude` and the local address.
     * @return number of newly added addresses
     */
    size_t merge(std::span<const Address> addresses, const Address &exclude);

    size_t merge(std::span<const Address> addresses) {
      return merge(addresses, self_);
    }

    bool contains(const Address &address) const;

    size_t size() const;

    Set snapshot() const;

    /// Snapshot ordered by address, used for log output and PeerInfo.
    std::vector<Address> sortedSnapshot() const;

   private:
    Address self_;
    mutable std::mutex mutex_;
    Set peers_;
  };
}  // namespace gossipnet::peer

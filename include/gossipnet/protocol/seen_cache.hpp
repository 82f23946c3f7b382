/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

namespace gossipnet::protocol {
  /// Message is recent while `now <= timestamp + window`.
  bool isRecent(uint64_t timestamp, uint64_t now, std::chrono::seconds window);

  /**
   * Duplicate check for messages keyed by (content, timestamp).
   * Entry expires when its message stops being recent, expired entries can't
   * match anyway because stale messages are rejected before lookup.
   */
  class SeenCache {
   public:
    explicit SeenCache(std::chrono::seconds window) : window_{window} {}

    /// Inserts key if absent; returns false if duplicate.
    bool insert(const std::string &content, uint64_t timestamp, uint64_t now);

    bool contains(const std::string &content, uint64_t timestamp) const {
      return entries_.contains({timestamp, content});
    }

    /// Remove all entries that are not recent at `now`.
    void clearExpired(uint64_t now);

    [[nodiscard]] size_t size() const {
      return entries_.size();
    }

   private:
    std::chrono::seconds window_;
    // ordered by timestamp first, so expired entries are at the front
    std::set<std::pair<uint64_t, std::string>> entries_;
  };
}  // namespace gossipnet::protocol

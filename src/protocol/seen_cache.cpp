/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gossipnet/protocol/seen_cache.hpp>

namespace gossipnet::protocol {
  bool isRecent(uint64_t timestamp,
                uint64_t now,
                std::chrono::seconds window) {
    if (timestamp >= now) {
      return true;
    }
    return now - timestamp <= static_cast<uint64_t>(window.count());
  }

  bool SeenCache::insert(const std::string &content,
                         uint64_t timestamp,
                         uint64_t now) {
    clearExpired(now);
    return entries_.emplace(timestamp, content).second;
  }

  void SeenCache::clearExpired(uint64_t now) {
    while (not entries_.empty()
           and not isRecent(entries_.begin()->first, now, window_)) {
      entries_.erase(entries_.begin());
    }
  }
}  // namespace gossipnet::protocol

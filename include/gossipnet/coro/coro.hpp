/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/awaitable.hpp>
#include <qtils/outcome.hpp>

namespace gossipnet {
  /**
   * Return type for coroutine.
   *
   * Does not resume when called directly outside executor, returns coroutine.
   * Resumes when:
   * - `coroSpawn` when running inside specified executor (strand included),
   *   may complete before `coroSpawn` returns.
   * - `co_await`, may complete before next statement.
   *
   * Coroutines of one link are spawned on the strand of its socket,
   * so reads and writes of the same link never run in parallel.
   */
  template <typename T>
  using Coro = boost::asio::awaitable<T>;

  /**
   * Return type for coroutine returning outcome.
   */
  template <typename T>
  using CoroOutcome = Coro<outcome::result<T>>;
}  // namespace gossipnet

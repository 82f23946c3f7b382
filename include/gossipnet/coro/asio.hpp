/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <tuple>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <qtils/outcome.hpp>

namespace gossipnet {
  /**
   * Completion token which returns `error_code` instead of throwing.
   * Result is converted with `coroOutcome`:
   *   auto r = coroOutcome(co_await socket.async_connect(ep, useCoroOutcome));
   */
  constexpr auto useCoroOutcome =
      boost::asio::as_tuple(boost::asio::use_awaitable);

  inline outcome::result<void> coroOutcome(
      std::tuple<boost::system::error_code> t) {
    auto &[ec] = t;
    if (ec) {
      return std::error_code{ec};
    }
    return outcome::success();
  }

  template <typename T>
  outcome::result<T> coroOutcome(std::tuple<boost::system::error_code, T> t) {
    auto &[ec, value] = t;
    if (ec) {
      return std::error_code{ec};
    }
    return std::move(value);
  }
}  // namespace gossipnet

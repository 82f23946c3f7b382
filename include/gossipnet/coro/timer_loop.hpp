/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/steady_timer.hpp>
#include <gossipnet/coro/asio.hpp>
#include <gossipnet/coro/spawn.hpp>

namespace gossipnet {
  /**
   * Calls `f` immediately and then at fixed rate `period`.
   * Ticks missed while `f` or the executor were busy are skipped,
   * there is no catch-up burst.
   * Loop ends when `f` returns false or the returned timer is cancelled
   * (cancel from the timer's executor).
   */
  std::shared_ptr<boost::asio::steady_timer> timerLoop(
      const boost::asio::any_io_executor &executor,
      std::chrono::milliseconds period,
      auto f) {
    auto timer = std::make_shared<boost::asio::steady_timer>(executor);
    coroSpawn(executor, [timer, period, f{std::move(f)}]() -> Coro<void> {
      using Clock = boost::asio::steady_timer::clock_type;
      auto next = Clock::now();
      while (true) {
        if constexpr (std::is_void_v<decltype(f())>) {
          f();
        } else if (not f()) {
          break;
        }
        next += period;
        auto now = Clock::now();
        while (next <= now) {
          next += period;
        }
        timer->expires_at(next);
        auto waited = coroOutcome(co_await timer->async_wait(useCoroOutcome));
        if (not waited.has_value()) {
          break;
        }
      }
    });
    return timer;
  }
}  // namespace gossipnet

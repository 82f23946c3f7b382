/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/co_spawn.hpp>
#include <gossipnet/coro/coro.hpp>

namespace gossipnet {
  template <typename T>
  concept CoroSpawnExecutor =
      boost::asio::is_executor<T>::value
      || boost::asio::execution::is_executor<T>::value
      || std::is_convertible_v<T, boost::asio::execution_context &>;

  void coroSpawn(CoroSpawnExecutor auto &&executor, Coro<void> &&coro) {
    boost::asio::co_spawn(std::forward<decltype(executor)>(executor),
                          std::move(coro),
                          [](std::exception_ptr e) {
                            if (e != nullptr) {
                              std::rethrow_exception(e);
                            }
                          });
  }

  /**
   * Start coroutine on specified executor.
   * Arguments of the coroutine lambda are stored in coroutine state,
   * so captures of `f` outlive the lambda object itself.
   */
  void coroSpawn(CoroSpawnExecutor auto &&executor, auto &&f) {
    coroSpawn(std::forward<decltype(executor)>(executor),
              [](std::remove_cvref_t<decltype(f)> f) -> Coro<void> {
                if constexpr (std::is_void_v<decltype(f().await_resume())>) {
                  co_await f();
                } else {
                  std::ignore = co_await f();
                }
              }(std::forward<decltype(f)>(f)));
  }
}  // namespace gossipnet

/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * Weak self capture for callbacks of objects owned by `shared_ptr`.
 *
 *   // inside class deriving from std::enable_shared_from_this<LineStream>
 *   timer.async_wait([WEAK_SELF](boost::system::error_code ec) {
 *     WEAK_LOCK(self);  // returns if object is already destroyed
 *     self->cancel();
 *   });
 *
 *   IF_WEAK_LOCK(hub) {  // for `std::weak_ptr<RelayHub> weak_hub`
 *     hub->unsubscribe(this);
 *   }
 */
#define WEAK_SELF          \
  weak_self {              \
    this->weak_from_this() \
  }

#define WEAK_LOCK(name)           \
  auto name = weak_##name.lock(); \
  if (not name) return;

#define IF_WEAK_LOCK(name) if (auto name = weak_##name.lock())

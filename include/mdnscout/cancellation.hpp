/**
 * mdnscout - mDNS network device discovery
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */
#pragma once

#include "utils.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace mdnscout {

struct cancel_state_t {
  std::mutex mutex;
  std::condition_variable cv;
  bool cancelled = false;
  std::vector<std::weak_ptr<cancel_state_t>> children;

  void cancel();
};

/**
 * @short Read side of a cancellation. Cheap to copy.
 *
 * A default constructed token is never cancelled.
 */
class cancel_token_t {
  std::shared_ptr<cancel_state_t> state;

public:
  cancel_token_t() {}
  explicit cancel_token_t(std::shared_ptr<cancel_state_t> state)
      : state(std::move(state)) {}

  bool is_cancelled() const;
  /// Interruptible sleep. Returns true if cancelled, at once or while waiting.
  bool wait_for(std::chrono::milliseconds timeout) const;

  friend class cancel_source_t;
};

/**
 * @short Write side of a cancellation.
 *
 * Sources can be linked to a parent token, so cancelling the parent cancels
 * every child. The session token tree is built this way.
 */
class cancel_source_t {
  std::shared_ptr<cancel_state_t> state;

public:
  cancel_source_t() : state(std::make_shared<cancel_state_t>()) {}
  explicit cancel_source_t(const cancel_token_t &parent);
  NON_COPYABLE(cancel_source_t);

  void cancel() { state->cancel(); }
  bool is_cancelled() const;
  cancel_token_t token() const { return cancel_token_t(state); }
};

} // namespace mdnscout

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
#include <mdnscout/cancellation.hpp>
#include <thread>

namespace mdnscout {

void cancel_state_t::cancel() {
  std::vector<std::weak_ptr<cancel_state_t>> to_cancel;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (cancelled) {
      return;
    }
    cancelled = true;
    to_cancel.swap(children);
  }
  cv.notify_all();
  for (auto &weak_child : to_cancel) {
    auto child = weak_child.lock();
    if (child) {
      child->cancel();
    }
  }
}

bool cancel_token_t::is_cancelled() const {
  if (!state) {
    return false;
  }
  std::lock_guard<std::mutex> lock(state->mutex);
  return state->cancelled;
}

bool cancel_token_t::wait_for(std::chrono::milliseconds timeout) const {
  if (!state) {
    std::this_thread::sleep_for(timeout);
    return false;
  }
  std::unique_lock<std::mutex> lock(state->mutex);
  return state->cv.wait_for(lock, timeout, [this] { return state->cancelled; });
}

cancel_source_t::cancel_source_t(const cancel_token_t &parent)
    : state(std::make_shared<cancel_state_t>()) {
  if (!parent.state) {
    return;
  }
  bool parent_cancelled = false;
  {
    std::lock_guard<std::mutex> lock(parent.state->mutex);
    parent_cancelled = parent.state->cancelled;
    if (!parent_cancelled) {
      // drop children already gone, so long lived parents do not grow
      auto &children = parent.state->children;
      std::erase_if(children, [](auto &weak) { return weak.expired(); });
      children.push_back(state);
    }
  }
  if (parent_cancelled) {
    state->cancel();
  }
}

bool cancel_source_t::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state->mutex);
  return state->cancelled;
}

} // namespace mdnscout

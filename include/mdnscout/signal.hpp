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
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace mdnscout {

template <typename... Args> class connection_t;

/**
 * @short Observer list. Subscribers keep a connection_t; when it is
 * destroyed the callback is removed.
 *
 * Signals may be raised from any receive loop thread, so the slot table is
 * copy on write and guarded by a mutex. The mutex is never held while a
 * callback runs, so callbacks can connect and disconnect freely.
 */
template <typename... Args> class signal_t {
  typedef std::map<int, std::function<void(Args...)>> VT;

public:
  signal_t() : slots(std::make_shared<VT>()) {}
  NON_COPYABLE_NOR_MOVABLE(signal_t);

  ~signal_t() { disconnect_all(); }

  // Must keep the connection, when deleted will be disconnected
  [[nodiscard]] connection_t<Args...>
  connect(std::function<void(Args...)> const &&f) {
    int cid = 0;
    {
      std::lock_guard<std::mutex> lock(mutex);
      cid = max_id++;
      // Copy to next slots current slots, as if in use will still be valid,
      // and later will be replaced.
      auto next = std::make_shared<VT>(*slots);
      next->insert(std::make_pair(cid, f));
      slots = next;
      connections[cid] = nullptr;
    }
    return connection_t(this, cid);
  }

  void disconnect(int id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto next = std::make_shared<VT>(*slots);
    next->erase(id);
    slots = next;
    connections.erase(id);
  }

  void disconnect_all() {
    for (;;) {
      connection_t<Args...> *conn = nullptr;
      int id = 0;
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (connections.empty()) {
          break;
        }
        id = connections.begin()->first;
        conn = connections.begin()->second;
      }
      if (conn) {
        conn->disconnect();
      } else {
        disconnect(id);
      }
    }
  }

  /**
   * @short Calls the callback
   *
   * It has to be carefull to call all callbacks that are at call moment, if
   * they are still valid at call moment.
   *
   * This is as new callbacks can be added, or removed, and we should absolutely
   * not call a not valid callback anymore.
   */
  void operator()(Args... args) {
    std::shared_ptr<VT> current;
    {
      std::lock_guard<std::mutex> lock(mutex);
      current = slots;
    }
    for (auto const &f : *current) {
      if (!is_connected(f.first))
        continue; // this element was removed while looping, do not call
      f.second(args...);
    }
  }

  void replace_connection_ptr(int id, connection_t<Args...> *ptr) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = connections.find(id);
    if (it != connections.end()) {
      it->second = ptr;
    }
  }

  size_t count() {
    std::lock_guard<std::mutex> lock(mutex);
    return slots->size();
  }

private:
  bool is_connected(int id) {
    std::lock_guard<std::mutex> lock(mutex);
    return slots->find(id) != slots->end();
  }

  std::mutex mutex;
  int max_id = 1;
  std::shared_ptr<VT> slots;

  std::map<int, connection_t<Args...> *> connections{};
};

template <typename... Args> class connection_t {
  signal_t<Args...> *signal;
  int id;

public:
  connection_t() : signal(nullptr), id(0) {}
  connection_t(signal_t<Args...> *signal_, int id_) : signal(signal_), id(id_) {
    signal->replace_connection_ptr(id, this);
  }
  connection_t(connection_t<Args...> &&other) noexcept
      : signal(other.signal), id(other.id) {
    if (signal)
      signal->replace_connection_ptr(id, this);

    other.signal = nullptr;
    other.id = 0;
  }

  ~connection_t() { disconnect(); }
  connection_t(const connection_t<Args...> &) = delete;
  connection_t<Args...> &operator=(const connection_t<Args...> &) = delete;

  connection_t &operator=(connection_t<Args...> &&other) noexcept {
    disconnect();
    signal = other.signal;
    id = other.id;
    if (signal)
      signal->replace_connection_ptr(id, this);

    other.signal = nullptr;
    other.id = 0;

    return *this;
  }

  void disconnect() {
    if (id && signal)
      signal->disconnect(id);
    signal = nullptr;
    id = 0;
  }

  bool is_connected() const { return signal != nullptr; }
};
} // namespace mdnscout

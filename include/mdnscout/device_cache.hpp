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

#include "device.hpp"
#include "logger.hpp"
#include "signal.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace mdnscout {

struct cache_entry_t {
  discovered_device_t device;
  std::chrono::system_clock::time_point last_seen;
  std::chrono::system_clock::time_point expires;
};

/**
 * @short Devices seen recently, across sessions.
 *
 * Every upsert pushes the expiry to now + ttl. This is unrelated to the TTL
 * of the DNS records, it only means "seen in the last few minutes".
 *
 * A background thread sweeps expired entries every sweep interval and
 * raises device_expired for each. One lock covers the store for the sweep
 * and all public operations.
 */
class device_cache_t {
  NON_COPYABLE_NOR_MOVABLE(device_cache_t);

public:
  using clock_fn_t = std::function<std::chrono::system_clock::time_point()>;

  /// display name, address
  signal_t<const std::string &, const std::string &> device_expired;

  device_cache_t(std::chrono::milliseconds ttl = std::chrono::minutes(5),
                 clock_fn_t clock = std::chrono::system_clock::now,
                 logger_t &logger = logger2);
  ~device_cache_t();

  /// Starts the periodic sweep. Does nothing if already running.
  void start_sweeper(std::chrono::milliseconds interval);

  void upsert(const discovered_device_t &device);
  std::vector<discovered_device_t> list_valid() const;
  std::optional<discovered_device_t> get_device(const std::string &ip) const;
  /// Stored entries, expired or not
  size_t size() const;
  /// Removes expired entries now. Returns how many.
  size_t sweep();

  /// Stops the sweeper and clears the store. Can be called many times.
  void dispose();

  logger_t &mdnscout_logger() const { return logger; }

private:
  logger_t &logger;
  std::chrono::milliseconds ttl;
  clock_fn_t clock;

  mutable std::mutex mutex;
  std::map<std::string, cache_entry_t> entries;

  std::mutex sweeper_mutex;
  std::condition_variable sweeper_cv;
  bool sweeper_stop = false;
  std::thread sweeper;
};

} // namespace mdnscout

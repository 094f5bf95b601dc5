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
#include <mdnscout/device_cache.hpp>
#include <mdnscout/logger.hpp>

namespace mdnscout {

device_cache_t::device_cache_t(std::chrono::milliseconds ttl, clock_fn_t clock,
                               logger_t &logger)
    : logger(logger), ttl(ttl), clock(std::move(clock)) {}

device_cache_t::~device_cache_t() { dispose(); }

void device_cache_t::start_sweeper(std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(sweeper_mutex);
  if (sweeper.joinable() || sweeper_stop) {
    return;
  }
  sweeper = std::thread([this, interval] {
    logger_t::set_thread_name("cache-sweep");
    std::unique_lock<std::mutex> lock(sweeper_mutex);
    while (!sweeper_cv.wait_for(lock, interval,
                                [this] { return sweeper_stop; })) {
      lock.unlock();
      auto removed = sweep();
      if (removed > 0) {
        DEBUG("Cache sweep removed {} devices", removed);
      }
      lock.lock();
    }
  });
}

void device_cache_t::upsert(const discovered_device_t &device) {
  auto now = clock();
  std::lock_guard<std::mutex> lock(mutex);
  auto it = entries.find(device.key());
  if (it == entries.end()) {
    entries.emplace(device.key(), cache_entry_t{device, now, now + ttl});
    return;
  }
  it->second.device.update_from(device);
  it->second.last_seen = now;
  it->second.expires = now + ttl;
}

std::vector<discovered_device_t> device_cache_t::list_valid() const {
  auto now = clock();
  std::vector<discovered_device_t> ret;
  std::lock_guard<std::mutex> lock(mutex);
  for (auto &[key, entry] : entries) {
    if (entry.expires > now) {
      ret.push_back(entry.device);
    }
  }
  return ret;
}

std::optional<discovered_device_t>
device_cache_t::get_device(const std::string &ip) const {
  auto now = clock();
  std::lock_guard<std::mutex> lock(mutex);
  auto it = entries.find(ip);
  if (it == entries.end() || it->second.expires <= now) {
    return std::nullopt;
  }
  return it->second.device;
}

size_t device_cache_t::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return entries.size();
}

size_t device_cache_t::sweep() {
  auto now = clock();
  std::vector<discovered_device_t> expired;
  {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = entries.begin(); it != entries.end();) {
      if (it->second.expires <= now) {
        expired.push_back(std::move(it->second.device));
        it = entries.erase(it);
      } else {
        ++it;
      }
    }
  }
  // Signals are raised without the lock, so handlers may use the cache
  for (auto &device : expired) {
    DEBUG("Device expired from cache: {}", device.display_name());
    device_expired(device.display_name(), device.ip_address);
  }
  return expired.size();
}

void device_cache_t::dispose() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex);
    sweeper_stop = true;
  }
  sweeper_cv.notify_all();
  if (sweeper.joinable() && sweeper.get_id() != std::this_thread::get_id()) {
    sweeper.join();
  }
  std::lock_guard<std::mutex> lock(mutex);
  entries.clear();
}

} // namespace mdnscout

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
#include <mdnscout/device_map.hpp>

namespace mdnscout {

device_map_t::upsert_result_t
device_map_t::upsert(const discovered_device_t &observation) {
  std::shared_ptr<entry_t> entry;
  bool is_new = false;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto &slot = devices[observation.key()];
    if (!slot) {
      slot = std::make_shared<entry_t>();
      is_new = true;
    }
    entry = slot;
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (is_new) {
    // Plain copy, so unique_id and ip_address stay as observed
    entry->device = observation;
  } else {
    entry->device.update_from(observation);
  }
  return upsert_result_t{entry->device, is_new};
}

std::optional<discovered_device_t>
device_map_t::get(const std::string &key) const {
  std::shared_ptr<entry_t> entry;
  {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = devices.find(key);
    if (it == devices.end())
      return std::nullopt;
    entry = it->second;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  return entry->device;
}

std::vector<discovered_device_t> device_map_t::snapshot() const {
  std::vector<std::shared_ptr<entry_t>> entries;
  {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto &[key, entry] : devices)
      entries.push_back(entry);
  }
  std::vector<discovered_device_t> ret;
  ret.reserve(entries.size());
  for (auto &entry : entries) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    ret.push_back(entry->device);
  }
  return ret;
}

size_t device_map_t::count() const {
  std::lock_guard<std::mutex> lock(mutex);
  return devices.size();
}

size_t
device_map_t::count_excluding(const std::set<std::string> &excluded) const {
  std::lock_guard<std::mutex> lock(mutex);
  size_t ret = 0;
  for (auto &[key, entry] : devices) {
    if (excluded.count(key) == 0)
      ret++;
  }
  return ret;
}

} // namespace mdnscout

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
#include "utils.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mdnscout {

/**
 * @short Devices found in one session, shared by all the receive loops.
 *
 * Insertion is test and set under the map lock: the first observer of a key
 * creates the entry, later ones merge into it. Merges take the entry's own
 * lock, so loops updating different devices do not wait on each other.
 */
class device_map_t {
  NON_COPYABLE_NOR_MOVABLE(device_map_t);

  struct entry_t {
    std::mutex mutex;
    discovered_device_t device;
  };

  mutable std::mutex mutex;
  std::map<std::string, std::shared_ptr<entry_t>> devices;

public:
  device_map_t() {}

  struct upsert_result_t {
    discovered_device_t device;
    bool is_new;
  };
  /// Merged state after the upsert, and whether the key was new
  upsert_result_t upsert(const discovered_device_t &observation);

  std::optional<discovered_device_t> get(const std::string &key) const;
  std::vector<discovered_device_t> snapshot() const;
  size_t count() const;
  /// Devices whose key is not in excluded, as the local addresses
  size_t count_excluding(const std::set<std::string> &excluded) const;
};

} // namespace mdnscout

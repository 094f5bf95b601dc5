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

#include "formatterhelper.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace mdnscout {

struct local_interface_t {
  std::string name;
  uint32_t address = 0; // host order
  uint32_t netmask = 0; // host order

  std::string address_string() const;
  std::string netmask_string() const;
  bool same_subnet(uint32_t ip) const {
    return (ip & netmask) == (address & netmask);
  }
};

/**
 * @short IPv4 addresses usable for mDNS: interface up, not loopback and
 * multicast capable. One entry per address, so an interface with two
 * addresses appears twice.
 */
std::vector<local_interface_t> list_local_interfaces();

} // namespace mdnscout

BASIC_FORMATTER(mdnscout::local_interface_t, "{}[{}/{}]", v.name,
                v.address_string(), v.netmask_string());

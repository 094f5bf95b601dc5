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
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <mdnscout/logger.hpp>
#include <mdnscout/network_interfaces.hpp>
#include <mdnscout/networkaddress.hpp>
#include <net/if.h>
#include <netinet/in.h>

namespace mdnscout {

static constexpr uint32_t LOOPBACK_NETWORK = 0x7F000000;
static constexpr uint32_t LOOPBACK_MASK = 0xFF000000;

std::string local_interface_t::address_string() const {
  return ipv4_to_string(address);
}
std::string local_interface_t::netmask_string() const {
  return ipv4_to_string(netmask);
}

std::vector<local_interface_t> list_local_interfaces() {
  std::vector<local_interface_t> ret;
  ifaddrs *ifap = nullptr;
  if (getifaddrs(&ifap) != 0) {
    ERROR("Could not list network interfaces: {}", strerror(errno));
    return ret;
  }

  for (const ifaddrs *ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_name == nullptr || ifa->ifa_addr == nullptr) {
      continue;
    }
    if (ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
      continue;
    }
    if (!(ifa->ifa_flags & IFF_MULTICAST)) {
      DEBUG("Skipping {}, no multicast support", ifa->ifa_name);
      continue;
    }

    local_interface_t iface;
    iface.name = ifa->ifa_name;
    iface.address = ntohl(
        reinterpret_cast<const sockaddr_in *>(ifa->ifa_addr)->sin_addr.s_addr);
    if (ifa->ifa_netmask) {
      iface.netmask =
          ntohl(reinterpret_cast<const sockaddr_in *>(ifa->ifa_netmask)
                    ->sin_addr.s_addr);
    }
    if ((iface.address & LOOPBACK_MASK) == LOOPBACK_NETWORK) {
      continue;
    }
    DEBUG("Usable interface {}", iface);
    ret.push_back(std::move(iface));
  }

  freeifaddrs(ifap);
  return ret;
}

} // namespace mdnscout

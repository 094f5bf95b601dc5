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
#include <netinet/in.h>
#include <optional>
#include <string>
#include <sys/socket.h>

namespace mdnscout {

/// Parses a dotted quad into a host order integer
std::optional<uint32_t> parse_ipv4(const std::string &ip);
std::string ipv4_to_string(uint32_t ip);
/// Numeric order of dotted quads. Unparsable addresses sort last, by text.
bool ipv4_less(const std::string &a, const std::string &b);

/**
 * @short An IPv4 address and port, as used by the UDP sockets.
 */
class network_address_t {
  sockaddr_in addr{};

public:
  network_address_t() {}
  network_address_t(const sockaddr_in &addr) : addr(addr) {}
  network_address_t(uint32_t ip, uint16_t port);

  /// nullopt if ip is not a valid dotted quad
  static std::optional<network_address_t> parse(const std::string &ip,
                                                uint16_t port = 0);
  /// Local address a socket is bound to
  static network_address_t from_fd(int fd);

  uint16_t port() const { return ntohs(addr.sin_port); }
  void set_port(uint16_t port) { addr.sin_port = htons(port); }
  std::string ip() const;
  uint32_t ip_uint32() const { return ntohl(addr.sin_addr.s_addr); }
  in_addr get_in_addr() const { return addr.sin_addr; }
  /// Reverse lookup. Empty if the address has no name.
  std::string hostname() const;
  std::string to_string() const;

  const sockaddr *get_sockaddr() const {
    return reinterpret_cast<const sockaddr *>(&addr);
  }
  socklen_t get_socklen() const { return sizeof(addr); }
  bool is_valid() const { return addr.sin_family == AF_INET; }
};

/**
 * @short An IPv4 network in CIDR notation, as 192.168.1.0/24.
 *
 * A bare address is a /32.
 */
class network_segment_t {
  uint32_t network = 0;
  uint32_t mask = 0;
  int prefix = 0;

public:
  network_segment_t() {}
  network_segment_t(uint32_t address, int prefix);

  static std::optional<network_segment_t> parse(const std::string &cidr);

  bool contains(uint32_t ip) const { return (ip & mask) == network; }
  bool contains(const std::string &ip) const;
  int get_prefix() const { return prefix; }
  std::string to_string() const;
};

} // namespace mdnscout

BASIC_FORMATTER(mdnscout::network_address_t, "{}", v.to_string());
BASIC_FORMATTER(mdnscout::network_segment_t, "{}", v.to_string());

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
#include <algorithm>
#include <arpa/inet.h>
#include <array>
#include <mdnscout/exceptions.hpp>
#include <mdnscout/logger.hpp>
#include <mdnscout/networkaddress.hpp>
#include <mdnscout/stringpp.hpp>
#include <netdb.h>

namespace mdnscout {

std::optional<uint32_t> parse_ipv4(const std::string &ip) {
  in_addr addr{};
  if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
    return std::nullopt;
  }
  return ntohl(addr.s_addr);
}

std::string ipv4_to_string(uint32_t ip) {
  return FMT::format("{}.{}.{}.{}", (ip >> 24) & 0xFF, (ip >> 16) & 0xFF,
                     (ip >> 8) & 0xFF, ip & 0xFF);
}

bool ipv4_less(const std::string &a, const std::string &b) {
  auto ia = parse_ipv4(a);
  auto ib = parse_ipv4(b);
  if (ia && ib)
    return *ia < *ib;
  if (ia != ib)
    return ia.has_value(); // valid addresses first
  return a < b;
}

network_address_t::network_address_t(uint32_t ip, uint16_t port) {
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(ip);
  addr.sin_port = htons(port);
}

std::optional<network_address_t>
network_address_t::parse(const std::string &ip, uint16_t port) {
  auto parsed = parse_ipv4(ip);
  if (!parsed) {
    return std::nullopt;
  }
  return network_address_t(*parsed, port);
}

network_address_t network_address_t::from_fd(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
    throw network_exception(errno);
  }
  return network_address_t(addr);
}

std::string network_address_t::ip() const {
  std::array<char, INET_ADDRSTRLEN> name{};
  inet_ntop(AF_INET, &addr.sin_addr, name.data(), name.size());
  return name.data();
}

std::string network_address_t::hostname() const {
  std::array<char, NI_MAXHOST> name{};
  if (getnameinfo(get_sockaddr(), get_socklen(), name.data(), NI_MAXHOST,
                  nullptr, 0, NI_NAMEREQD) != 0) {
    return "";
  }
  return name.data();
}

std::string network_address_t::to_string() const {
  if (!is_valid()) {
    return "null";
  }
  return FMT::format("{}:{}", ip(), port());
}

network_segment_t::network_segment_t(uint32_t address, int prefix_)
    : prefix(std::clamp(prefix_, 0, 32)) {
  mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
  network = address & mask;
}

std::optional<network_segment_t>
network_segment_t::parse(const std::string &cidr) {
  auto text = trim_copy(cidr);
  auto slash = text.find('/');
  auto address = parse_ipv4(text.substr(0, slash));
  if (!address) {
    return std::nullopt;
  }
  if (slash == std::string::npos) {
    return network_segment_t(*address, 32);
  }
  auto prefix_str = text.substr(slash + 1);
  if (prefix_str.empty() || prefix_str.size() > 2 ||
      !std::all_of(prefix_str.begin(), prefix_str.end(), ::isdigit)) {
    return std::nullopt;
  }
  auto prefix = std::stoi(prefix_str);
  if (prefix > 32) {
    return std::nullopt;
  }
  return network_segment_t(*address, prefix);
}

bool network_segment_t::contains(const std::string &ip) const {
  auto parsed = parse_ipv4(ip);
  return parsed && contains(*parsed);
}

std::string network_segment_t::to_string() const {
  return FMT::format("{}/{}", ipv4_to_string(network), prefix);
}

} // namespace mdnscout

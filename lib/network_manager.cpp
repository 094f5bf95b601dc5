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
#include <mdnscout/dns_message.hpp>
#include <mdnscout/logger.hpp>
#include <mdnscout/network_manager.hpp>

namespace mdnscout {

network_manager_t::network_manager_t() {
  auto group = network_address_t::parse(MDNS_ADDRESS, MDNS_PORT);
  if (group) {
    destination = *group;
  }
}

network_manager_t::~network_manager_t() { dispose(); }

bool network_manager_t::initialize() {
  std::lock_guard<std::mutex> lock(mutex);
  if (disposed) {
    WARNING("Network manager already disposed, can not initialize");
    return false;
  }
  release_sockets();
  open_sockets();
  local_ips = compute_local_addresses();

  INFO("Network ready: {} sending sockets, {} listening sockets, {} local "
       "addresses",
       senders.size(), listeners.size(), local_ips.size());
  if (listeners.empty()) {
    ERROR("No listening socket could be opened");
    return false;
  }
  return true;
}

std::set<std::string> network_manager_t::compute_local_addresses() const {
  std::set<std::string> ret;
  for (auto &iface : interfaces) {
    ret.insert(iface.address_string());
  }
  ret.insert("127.0.0.1");
  ret.insert("0.0.0.0");
  return ret;
}

udp_socket_list_t network_manager_t::sending_sockets() const {
  std::lock_guard<std::mutex> lock(mutex);
  return senders;
}

udp_socket_list_t network_manager_t::listening_sockets() const {
  std::lock_guard<std::mutex> lock(mutex);
  return listeners;
}

std::vector<local_interface_t> network_manager_t::local_interfaces() const {
  std::lock_guard<std::mutex> lock(mutex);
  return interfaces;
}

std::set<std::string> network_manager_t::local_addresses() const {
  std::lock_guard<std::mutex> lock(mutex);
  return local_ips;
}

bool network_manager_t::is_local_address(const std::string &ip) const {
  std::lock_guard<std::mutex> lock(mutex);
  return local_ips.count(ip) > 0;
}

bool network_manager_t::is_local_subnet(const std::string &ip) const {
  auto parsed = parse_ipv4(ip);
  if (!parsed) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex);
  for (auto &iface : interfaces) {
    if (iface.same_subnet(*parsed)) {
      return true;
    }
  }
  return false;
}

void network_manager_t::release_sockets() {
  int failed = 0;
  for (auto *list : {&senders, &listeners}) {
    for (auto &socket : *list) {
      if (!socket->shutdown()) {
        failed++;
      }
    }
  }
  for (auto *list : {&senders, &listeners}) {
    for (auto &socket : *list) {
      if (!socket->close()) {
        failed++;
      }
    }
  }
  if (failed) {
    DEBUG("{} socket release steps failed, ignored", failed);
  }
  senders.clear();
  listeners.clear();
}

void network_manager_t::dispose() {
  std::lock_guard<std::mutex> lock(mutex);
  if (disposed.exchange(true)) {
    return;
  }
  DEBUG("Disposing network manager, {} sockets",
        senders.size() + listeners.size());
  release_sockets();
}

void mdns_network_manager_t::open_sockets() {
  interfaces = list_local_interfaces();
  if (interfaces.empty()) {
    WARNING("No usable network interfaces for mDNS");
    return;
  }

  for (auto &iface : interfaces) {
    network_address_t local(iface.address, 0);
    auto sender = std::make_shared<udp_socket_t>(
        FMT::format("mdns-send-{}", iface.address_string()));
    if (!sender->open(local, true)) {
      continue;
    }
    // Queries never leave the local subnet
    sender->set_multicast_ttl(1);
    sender->set_multicast_interface(local);
    sender->set_multicast_loop(false);
    sender->join_group(destination, local);
    senders.push_back(std::move(sender));
  }

  auto nlisteners = std::min(interfaces.size(), max_listening_sockets);
  network_address_t any(INADDR_ANY, MDNS_PORT);
  for (size_t i = 0; i < nlisteners; i++) {
    auto listener =
        std::make_shared<udp_socket_t>(FMT::format("mdns-listen-{}", i));
    if (!listener->open(any, true)) {
      continue;
    }
    // Interfaces are spread round robin over the listeners
    int joined = 0;
    for (size_t j = i; j < interfaces.size(); j += nlisteners) {
      if (listener->join_group(destination,
                               network_address_t(interfaces[j].address, 0))) {
        joined++;
      }
    }
    if (joined == 0) {
      WARNING("Listener {} could not join the mDNS group on any interface",
              i);
      listener->close();
      continue;
    }
    listeners.push_back(std::move(listener));
  }
}

} // namespace mdnscout

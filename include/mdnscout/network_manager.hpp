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

#include "network_interfaces.hpp"
#include "networkaddress.hpp"
#include "udp_socket.hpp"
#include "utils.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace mdnscout {

using udp_socket_list_t = std::vector<std::shared_ptr<udp_socket_t>>;

/**
 * @short Owns every socket of one discovery session.
 *
 * Subclasses decide which sockets to open. The base class keeps them, gives
 * read only copies of the lists, and releases them on dispose().
 */
class network_manager_t {
  NON_COPYABLE_NOR_MOVABLE(network_manager_t);

protected:
  mutable std::mutex mutex;
  udp_socket_list_t senders;
  udp_socket_list_t listeners;
  std::vector<local_interface_t> interfaces;
  std::set<std::string> local_ips;
  network_address_t destination;
  std::atomic<bool> disposed{false};

  /// Fills senders, listeners and interfaces. Called with the mutex held.
  virtual void open_sockets() = 0;
  /// Addresses that are this host, to ignore our own traffic.
  virtual std::set<std::string> compute_local_addresses() const;

  void release_sockets();

public:
  network_manager_t();
  virtual ~network_manager_t();

  /// Opens the sockets. False if there is nothing to listen on, or the
  /// manager was already disposed.
  bool initialize();

  udp_socket_list_t sending_sockets() const;
  udp_socket_list_t listening_sockets() const;
  std::vector<local_interface_t> local_interfaces() const;
  std::set<std::string> local_addresses() const;
  bool is_local_address(const std::string &ip) const;
  /// True if ip is in the subnet of any local interface
  bool is_local_subnet(const std::string &ip) const;
  network_address_t query_destination() const { return destination; }

  bool is_disposed() const { return disposed; }
  /// Idempotent. Each socket is shut down and then closed, each step guarded
  /// on its own so one faulted socket does not keep others open.
  void dispose();
};

/**
 * @short Real mDNS sockets: one sender per local address, and a few
 * wildcard listeners on port 5353.
 */
class mdns_network_manager_t : public network_manager_t {
  size_t max_listening_sockets;

protected:
  void open_sockets() override;

public:
  mdns_network_manager_t(size_t max_listening_sockets = 4)
      : max_listening_sockets(max_listening_sockets) {}
  ~mdns_network_manager_t() override { dispose(); }
};

} // namespace mdnscout

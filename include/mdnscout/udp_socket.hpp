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

#include "networkaddress.hpp"
#include "utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace mdnscout {

static constexpr size_t MAX_DATAGRAM_SIZE = 9000;

enum class recv_status_e { DATA, TIMEOUT, CLOSED, FAILED };
enum class send_status_e { SENT, TIMEOUT, CLOSED, FAILED };

struct datagram_t {
  std::vector<uint8_t> data;
  network_address_t from;
  /// Label of the socket it arrived on
  std::string origin;
};

/**
 * @short Blocking IPv4 UDP socket with bounded waits.
 *
 * Every receive and send waits at most the given timeout, so loops built on
 * top can check their cancellation token between calls. shutdown() wakes any
 * pending wait; close() releases the descriptor. They are separate so a
 * teardown can first stop every socket and only then release them.
 *
 * The descriptor number is only released when no send or receive is using
 * it, so a late poll never watches a number the kernel already reused.
 */
class udp_socket_t {
  NON_COPYABLE_NOR_MOVABLE(udp_socket_t);

private:
  std::atomic<int> fd{-1};
  std::atomic<bool> shut_down{false};
  std::atomic<int> users{0};
  // Closed descriptor waiting for the last user to leave
  std::atomic<int> release_fd{-1};
  std::string label;

  struct user_guard_t {
    udp_socket_t &socket;
    int fd;
    explicit user_guard_t(udp_socket_t &socket);
    ~user_guard_t();
  };
  bool release();

public:
  udp_socket_t(const std::string &label = "udp") : label(label) {}
  ~udp_socket_t() { close(); }

  /// Creates and binds. Logs and returns false on error.
  bool open(const network_address_t &address, bool reuse_address = false);

  bool set_multicast_ttl(int ttl);
  bool set_multicast_loop(bool enabled);
  bool set_multicast_interface(const network_address_t &iface);
  bool join_group(const network_address_t &group,
                  const network_address_t &iface);

  send_status_e sendto(const std::vector<uint8_t> &data,
                       const network_address_t &to,
                       std::chrono::milliseconds timeout);
  recv_status_e recvfrom(datagram_t &datagram,
                         std::chrono::milliseconds timeout);

  /// Stops any further IO. Returns false if the socket was already faulted.
  bool shutdown();
  /// Releases the descriptor. Returns false if close failed.
  bool close();

  bool is_open() const { return fd >= 0 && !shut_down; }
  /// Sends and receives in progress
  int user_count() const { return users; }
  int get_fd() const { return fd; }
  const std::string &get_label() const { return label; }
  network_address_t get_address() const;
};

} // namespace mdnscout

ENUM_FORMATTER_BEGIN(mdnscout::recv_status_e);
ENUM_FORMATTER_ELEMENT(mdnscout::recv_status_e::DATA, "DATA");
ENUM_FORMATTER_ELEMENT(mdnscout::recv_status_e::TIMEOUT, "TIMEOUT");
ENUM_FORMATTER_ELEMENT(mdnscout::recv_status_e::CLOSED, "CLOSED");
ENUM_FORMATTER_ELEMENT(mdnscout::recv_status_e::FAILED, "FAILED");
ENUM_FORMATTER_END();

ENUM_FORMATTER_BEGIN(mdnscout::send_status_e);
ENUM_FORMATTER_ELEMENT(mdnscout::send_status_e::SENT, "SENT");
ENUM_FORMATTER_ELEMENT(mdnscout::send_status_e::TIMEOUT, "TIMEOUT");
ENUM_FORMATTER_ELEMENT(mdnscout::send_status_e::CLOSED, "CLOSED");
ENUM_FORMATTER_ELEMENT(mdnscout::send_status_e::FAILED, "FAILED");
ENUM_FORMATTER_END();

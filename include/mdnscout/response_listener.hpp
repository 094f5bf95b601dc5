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

#include "cancellation.hpp"
#include "device_cache.hpp"
#include "device_map.hpp"
#include "logger.hpp"
#include "network_manager.hpp"
#include "networkaddress.hpp"
#include "response_processor.hpp"
#include "settings.hpp"
#include "signal.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace mdnscout {

/**
 * @short One receive loop per listening socket.
 *
 * Each loop receives with a short timeout, so it sees the cancellation
 * promptly even on a silent socket. Datagrams from this host or out of the
 * target segment are dropped before decoding. Everything else becomes
 * device observations, merged into the session map and the cache.
 *
 * Errors on one datagram are logged and the loop goes on.
 */
class response_listener_t {
  NON_COPYABLE_NOR_MOVABLE(response_listener_t);

  logger_t &logger;
  network_manager_t &network;
  const settings_t &settings;
  response_processor_t processor;
  device_map_t &devices;
  device_cache_t *cache;
  std::optional<network_segment_t> segment;
  cancel_token_t token;

  std::vector<std::thread> threads;
  std::mutex running_mutex;
  std::condition_variable running_cv;
  size_t running = 0;
  std::atomic<size_t> datagrams{0};

public:
  /// device, discovery method
  signal_t<const discovered_device_t &, const std::string &> device_discovered;
  signal_t<const discovered_device_t &, const std::string &> device_updated;

  response_listener_t(network_manager_t &network, const settings_t &settings,
                      device_map_t &devices, device_cache_t *cache,
                      std::optional<network_segment_t> segment,
                      cancel_token_t token, logger_t &logger = logger2);
  ~response_listener_t();

  /// Starts one loop per listening socket of the network manager
  void start();
  /// Waits until every loop has returned, at most timeout. True if all did.
  bool wait_exit(std::chrono::milliseconds timeout);
  void join();

  /// Filters, decodes, processes and merges one datagram
  void handle_datagram(const datagram_t &datagram);

  size_t loop_count() const { return threads.size(); }
  size_t datagram_count() const { return datagrams; }
  logger_t &mdnscout_logger() const { return logger; }

private:
  void receive_loop(std::shared_ptr<udp_socket_t> socket);
};

} // namespace mdnscout

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
#include "logger.hpp"
#include "network_manager.hpp"
#include "services.hpp"
#include "settings.hpp"
#include "signal.hpp"
#include <string>
#include <vector>

namespace mdnscout {

struct send_stats_t {
  size_t batches = 0;
  size_t sent = 0;
  size_t failed = 0;
};

/**
 * @short Writes the phased service queries to every sending socket.
 *
 * Phases go in order, each split in small batches with a short delay after
 * each, and each phase repeated a few times. After all phases a broad sweep
 * and a few follow up queries catch hosts that did not answer the specific
 * ones.
 *
 * Failed or timed out sends are counted and logged, never fatal. A
 * cancelled token stops at the next send or delay.
 */
class query_sender_t {
  logger_t &logger;
  network_manager_t &network;
  const settings_t &settings;
  cancel_token_t token;
  std::vector<service_phase_t> phases;
  send_stats_t stats;

public:
  /// Index, total and name of the phase about to be sent
  signal_t<size_t, size_t, const std::string &> phase_started;

  query_sender_t(network_manager_t &network, const settings_t &settings,
                 cancel_token_t token, logger_t &logger = logger2);
  query_sender_t(network_manager_t &network, const settings_t &settings,
                 cancel_token_t token, std::vector<service_phase_t> phases,
                 logger_t &logger = logger2);

  /// Full schedule: initial delay, every phase, final sweep, follow ups.
  send_stats_t run();

  /// False if cancelled while sending
  bool send_phase(const service_phase_t &phase);
  bool send_final_sweep();
  /// One query with all the given names, to every sending socket. Returns
  /// the number of sockets it was written to.
  size_t send_batch(const std::vector<std::string> &services);

  const send_stats_t &get_stats() const { return stats; }
  logger_t &mdnscout_logger() const { return logger; }

private:
  bool sleep(std::chrono::milliseconds ms) { return !token.wait_for(ms); }
};

} // namespace mdnscout

BASIC_FORMATTER(mdnscout::send_stats_t, "{} batches, {} sent, {} failed",
                v.batches, v.sent, v.failed);

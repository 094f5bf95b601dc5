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
#include <chrono>
#include <cstddef>
#include <string>

namespace mdnscout {

using namespace std::chrono_literals;

enum class service_set_e { FULL, SECURITY_FOCUSED, LIGHTWEIGHT };

/**
 * @short Everything a discovery session can be tuned with.
 *
 * Passed by value at construction. The defaults are the ones used by the
 * command line tool.
 */
struct settings_t {
  // Hard ceiling of one session
  std::chrono::milliseconds session_timeout = 5min;

  std::chrono::milliseconds cache_ttl = 5min;
  std::chrono::milliseconds cache_sweep_interval = 30s;

  // Collection phase: device count polling and early termination
  std::chrono::milliseconds poll_interval = 1s;
  std::chrono::milliseconds plateau_min_elapsed = 20s;
  int plateau_stable_polls = 8;

  std::chrono::milliseconds receive_timeout = 500ms;
  std::chrono::milliseconds receive_error_backoff = 100ms;
  std::chrono::milliseconds send_timeout = 2s;

  // Teardown
  std::chrono::milliseconds listener_exit_timeout = 2s;
  std::chrono::milliseconds teardown_grace = 1s;

  // Query sender
  int phase_bursts = 2;
  std::chrono::milliseconds burst_interval = 150ms;
  service_set_e service_set = service_set_e::FULL;

  size_t max_listening_sockets = 4;

  // Empty for no filter. CIDR or a single IPv4 address.
  std::string network_segment;
  bool resolve_hostnames = false;
};

} // namespace mdnscout

ENUM_FORMATTER_BEGIN(mdnscout::service_set_e);
ENUM_FORMATTER_ELEMENT(mdnscout::service_set_e::FULL, "full");
ENUM_FORMATTER_ELEMENT(mdnscout::service_set_e::SECURITY_FOCUSED, "security");
ENUM_FORMATTER_ELEMENT(mdnscout::service_set_e::LIGHTWEIGHT, "lightweight");
ENUM_FORMATTER_END();

BASIC_FORMATTER(mdnscout::settings_t,
                "settings_t[session_timeout={}ms, cache_ttl={}ms, "
                "sweep={}ms, poll={}ms, plateau={}ms/{} polls, "
                "receive_timeout={}ms, send_timeout={}ms, bursts={}, "
                "services={}, listeners={}, segment=\"{}\", resolve={}]",
                v.session_timeout.count(), v.cache_ttl.count(),
                v.cache_sweep_interval.count(), v.poll_interval.count(),
                v.plateau_min_elapsed.count(), v.plateau_stable_polls,
                v.receive_timeout.count(), v.send_timeout.count(),
                v.phase_bursts, v.service_set, v.max_listening_sockets,
                v.network_segment, v.resolve_hostnames);

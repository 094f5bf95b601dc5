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

#include "settings.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace mdnscout {

/// A group of DNS-SD service types queried together, in priority order.
struct service_phase_t {
  std::string name;
  std::vector<std::string> services;
  std::chrono::milliseconds base_delay;
};

std::vector<service_phase_t> service_phases(service_set_e set);
/// Wildcard types sent after all phases
const std::vector<std::string> &final_sweep_services();
/// Sent once after the final sweep, for hosts that only answer direct asks
const std::vector<std::string> &follow_up_services();
/// Services per query, depending on how many the phase has
size_t batch_size_for(size_t service_count);

} // namespace mdnscout

BASIC_FORMATTER(mdnscout::service_phase_t, "{}[{} services, {}ms]", v.name,
                v.services.size(), v.base_delay.count());

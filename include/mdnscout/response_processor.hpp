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

#include "device.hpp"
#include "dns_message.hpp"
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace mdnscout {

/// Device type implied by a service name, NETWORK_DEVICE if nothing matches
device_type_e classify_service(const std::string &service);
/// Device type of a host that asks for these services
device_type_e classify_queries(const std::vector<std::string> &services);
/// The instance part of a PTR target, without the service suffix
std::string instance_name(const std::string &instance,
                          const std::string &service);

/**
 * @short Turns one decoded message into device observations.
 *
 * Stateless apart from the set of local addresses, so it can be shared by
 * every receive loop. All the records of a message are folded into one
 * observation per identity key; merging with what is already known is done
 * by the caller.
 */
class response_processor_t {
  std::set<std::string> local_addresses;

public:
  explicit response_processor_t(std::set<std::string> local_addresses)
      : local_addresses(std::move(local_addresses)) {}

  bool is_local(const std::string &ip) const {
    return local_addresses.count(ip) > 0;
  }

  /// message is nullopt if the datagram could not be decoded. Replies from a
  /// local address give no devices. If source_ip is empty the service records
  /// are keyed by instance name and origin (the receiving socket).
  std::vector<discovered_device_t>
  process(const std::optional<dns_message_t> &message,
          const std::string &source_ip, const std::string &origin = {},
          std::chrono::system_clock::time_point now =
              std::chrono::system_clock::now()) const;

  std::vector<discovered_device_t>
  process_datagram(const uint8_t *data, size_t size,
                   const std::string &source_ip) const {
    return process(dns_message_t::decode(data, size), source_ip);
  }

  /// Device known only because something answered from this address
  static discovered_device_t
  basic_device(const std::string &ip,
               std::chrono::system_clock::time_point now);
};

} // namespace mdnscout

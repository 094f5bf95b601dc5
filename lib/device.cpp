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
#include <mdnscout/device.hpp>

namespace mdnscout {

const char *device_type_description(device_type_e type) {
  switch (type) {
  case device_type_e::UNKNOWN:
    return "Unknown device";
  case device_type_e::ROUTER:
    return "Network router";
  case device_type_e::SWITCH:
    return "Network switch";
  case device_type_e::ACCESS_POINT:
    return "Wireless access point";
  case device_type_e::FIREWALL:
    return "Firewall";
  case device_type_e::MODEM:
    return "Modem";
  case device_type_e::CAMERA:
    return "IP camera";
  case device_type_e::NVR:
    return "Network video recorder";
  case device_type_e::DVR:
    return "Digital video recorder";
  case device_type_e::INTERCOM:
    return "Intercom or doorbell";
  case device_type_e::SERVER:
    return "Server";
  case device_type_e::WORKSTATION:
    return "Workstation";
  case device_type_e::MOBILE_DEVICE:
    return "Mobile device";
  case device_type_e::SMART_TV:
    return "Smart TV";
  case device_type_e::MEDIA_SERVER:
    return "Media server";
  case device_type_e::STREAMING_DEVICE:
    return "Streaming device";
  case device_type_e::GAME_CONSOLE:
    return "Game console";
  case device_type_e::PRINTER:
    return "Printer";
  case device_type_e::SCANNER:
    return "Scanner";
  case device_type_e::NAS:
    return "Network attached storage";
  case device_type_e::PLC_CONTROLLER:
    return "PLC controller";
  case device_type_e::NETWORK_DEVICE:
    return "Network device";
  }
  return "Unknown device";
}

device_category_e device_type_category(device_type_e type) {
  switch (type) {
  case device_type_e::ROUTER:
  case device_type_e::SWITCH:
  case device_type_e::ACCESS_POINT:
  case device_type_e::FIREWALL:
  case device_type_e::MODEM:
  case device_type_e::NETWORK_DEVICE:
    return device_category_e::NETWORK_INFRASTRUCTURE;
  case device_type_e::CAMERA:
  case device_type_e::NVR:
  case device_type_e::DVR:
  case device_type_e::INTERCOM:
    return device_category_e::SECURITY;
  case device_type_e::SERVER:
  case device_type_e::WORKSTATION:
  case device_type_e::MOBILE_DEVICE:
    return device_category_e::COMPUTING;
  case device_type_e::SMART_TV:
  case device_type_e::MEDIA_SERVER:
  case device_type_e::STREAMING_DEVICE:
  case device_type_e::GAME_CONSOLE:
    return device_category_e::MEDIA;
  case device_type_e::PRINTER:
  case device_type_e::SCANNER:
    return device_category_e::PRINTING;
  case device_type_e::NAS:
    return device_category_e::STORAGE;
  case device_type_e::PLC_CONTROLLER:
    return device_category_e::INDUSTRIAL;
  case device_type_e::UNKNOWN:
    break;
  }
  return device_category_e::OTHER;
}

static void fill_if_empty(std::string &field, const std::string &value) {
  if (field.empty() && !value.empty()) {
    field = value;
  }
}

void discovered_device_t::update_from(const discovered_device_t &other) {
  fill_if_empty(unique_id, other.unique_id);
  fill_if_empty(ip_address, other.ip_address);
  fill_if_empty(name, other.name);
  fill_if_empty(manufacturer, other.manufacturer);
  fill_if_empty(model, other.model);
  fill_if_empty(firmware_version, other.firmware_version);
  fill_if_empty(serial_number, other.serial_number);
  fill_if_empty(mac_address, other.mac_address);
  fill_if_empty(description, other.description);

  if (device_type == device_type_e::UNKNOWN) {
    device_type = other.device_type;
  }
  if (port == 0) {
    port = other.port;
  }

  ip_addresses.insert(other.ip_addresses.begin(), other.ip_addresses.end());
  if (!other.ip_address.empty()) {
    ip_addresses.insert(other.ip_address);
  }
  ports.insert(other.ports.begin(), other.ports.end());
  if (other.port != 0) {
    ports.insert(other.port);
  }
  discovery_methods.insert(other.discovery_methods.begin(),
                           other.discovery_methods.end());
  capabilities.insert(other.capabilities.begin(), other.capabilities.end());

  for (auto &[key, value] : other.discovery_data) {
    if (!value.empty()) {
      discovery_data[key] = value;
    }
  }

  if (other.last_seen > last_seen) {
    last_seen = other.last_seen;
  }
  is_online = is_online || other.is_online;
}

std::string discovered_device_t::display_name() const {
  if (!name.empty())
    return name;
  if (!ip_address.empty())
    return ip_address;
  return unique_id;
}

std::string discovered_device_t::key() const {
  if (!ip_address.empty())
    return ip_address;
  return unique_id;
}

std::string synthetic_device_key(const std::string &service,
                                 const std::string &origin) {
  return FMT::format("mdns:{}@{}", service, origin);
}

} // namespace mdnscout

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
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace mdnscout {

enum class device_type_e {
  UNKNOWN = 0,
  ROUTER = 1,
  SWITCH = 2,
  ACCESS_POINT = 3,
  FIREWALL = 4,
  MODEM = 6,
  CAMERA = 10,
  NVR = 11,
  DVR = 12,
  INTERCOM = 15,
  SERVER = 20,
  WORKSTATION = 21,
  MOBILE_DEVICE = 23,
  SMART_TV = 30,
  MEDIA_SERVER = 40,
  STREAMING_DEVICE = 41,
  GAME_CONSOLE = 43,
  PRINTER = 50,
  SCANNER = 51,
  NAS = 60,
  PLC_CONTROLLER = 70,
  NETWORK_DEVICE = 90,
};

enum class device_category_e {
  NETWORK_INFRASTRUCTURE,
  SECURITY,
  COMPUTING,
  MEDIA,
  PRINTING,
  STORAGE,
  INDUSTRIAL,
  OTHER,
};

enum class discovery_method_e {
  MDNS,
  WS_DISCOVERY,
  SSDP,
  NETBIOS,
  ARP,
  PORT_SCAN,
  MANUAL,
};

const char *device_type_description(device_type_e type);
device_category_e device_type_category(device_type_e type);

/**
 * @short A device as known so far, from one or many observations.
 *
 * Observations of the same device are combined with update_from, which
 * only fills what is missing and unions the collections, so merging is
 * idempotent and never loses data.
 */
struct discovered_device_t {
  std::string unique_id;
  std::string ip_address;
  std::set<std::string> ip_addresses;
  uint16_t port = 0;
  std::set<uint16_t> ports;
  std::string name;
  std::string manufacturer;
  std::string model;
  std::string firmware_version;
  std::string serial_number;
  std::string mac_address;
  std::string description;
  device_type_e device_type = device_type_e::UNKNOWN;
  std::set<discovery_method_e> discovery_methods;
  std::set<std::string> capabilities;
  std::map<std::string, std::string> discovery_data;
  std::chrono::system_clock::time_point last_seen{};
  bool is_online = false;

  void update_from(const discovered_device_t &other);

  /// Name, else IP address, else unique id
  std::string display_name() const;
  /// Identity used for deduplication: the IP address when known, the unique
  /// id otherwise.
  std::string key() const;

  bool operator==(const discovered_device_t &other) const = default;
};

/// Key for devices only known by a service name, seen from origin.
std::string synthetic_device_key(const std::string &service,
                                 const std::string &origin);

} // namespace mdnscout

ENUM_FORMATTER_BEGIN(mdnscout::device_type_e);
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::UNKNOWN, "UNKNOWN");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::ROUTER, "ROUTER");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::SWITCH, "SWITCH");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::ACCESS_POINT, "ACCESS_POINT");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::FIREWALL, "FIREWALL");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::MODEM, "MODEM");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::CAMERA, "CAMERA");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::NVR, "NVR");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::DVR, "DVR");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::INTERCOM, "INTERCOM");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::SERVER, "SERVER");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::WORKSTATION, "WORKSTATION");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::MOBILE_DEVICE,
                       "MOBILE_DEVICE");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::SMART_TV, "SMART_TV");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::MEDIA_SERVER, "MEDIA_SERVER");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::STREAMING_DEVICE,
                       "STREAMING_DEVICE");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::GAME_CONSOLE, "GAME_CONSOLE");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::PRINTER, "PRINTER");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::SCANNER, "SCANNER");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::NAS, "NAS");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::PLC_CONTROLLER,
                       "PLC_CONTROLLER");
ENUM_FORMATTER_ELEMENT(mdnscout::device_type_e::NETWORK_DEVICE,
                       "NETWORK_DEVICE");
ENUM_FORMATTER_END();

ENUM_FORMATTER_BEGIN(mdnscout::device_category_e);
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::NETWORK_INFRASTRUCTURE,
                       "Network Infrastructure");
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::SECURITY, "Security");
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::COMPUTING, "Computing");
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::MEDIA, "Media");
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::PRINTING, "Printing");
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::STORAGE, "Storage");
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::INDUSTRIAL, "Industrial");
ENUM_FORMATTER_ELEMENT(mdnscout::device_category_e::OTHER, "Other");
ENUM_FORMATTER_END();

ENUM_FORMATTER_BEGIN(mdnscout::discovery_method_e);
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_method_e::MDNS, "mDNS");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_method_e::WS_DISCOVERY,
                       "WS-Discovery");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_method_e::SSDP, "SSDP");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_method_e::NETBIOS, "NetBIOS");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_method_e::ARP, "ARP");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_method_e::PORT_SCAN, "Port scan");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_method_e::MANUAL, "Manual");
ENUM_FORMATTER_END();

SET_FORMATTER(std::string);
SET_FORMATTER(uint16_t);
SET_FORMATTER(mdnscout::discovery_method_e);

BASIC_FORMATTER(mdnscout::discovered_device_t,
                "discovered_device_t[{} {} \"{}\" {} {} ports={} caps={}]",
                v.key(), v.device_type, v.name, v.manufacturer, v.model,
                v.ports, v.capabilities);

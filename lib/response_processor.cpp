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
#include <map>
#include <mdnscout/logger.hpp>
#include <mdnscout/response_processor.hpp>
#include <mdnscout/stringpp.hpp>

namespace mdnscout {

static constexpr size_t MAX_TXT_PAIRS = 32;

struct service_rule_t {
  std::vector<const char *> substrings;
  device_type_e type;
};

// First match wins, so the more specific rules go first
static const std::vector<service_rule_t> SERVICE_RULES = {
    {{"camera", "onvif", "rtsp", "psia", "axis-video", "ipcam", "webcam",
      "cctv"},
     device_type_e::CAMERA},
    {{"nvr"}, device_type_e::NVR},
    {{"dvr"}, device_type_e::DVR},
    {{"doorbell", "intercom"}, device_type_e::INTERCOM},
    {{"scanner", "uscan", "escl"}, device_type_e::SCANNER},
    {{"printer", "ipp", "pdl-datastream"}, device_type_e::PRINTER},
    {{"airplay", "raop", "googlecast", "chromecast", "roku", "appletv"},
     device_type_e::STREAMING_DEVICE},
    {{"upnp", "dlna", "plex", "emby", "jellyfin"},
     device_type_e::MEDIA_SERVER},
    {{"router"}, device_type_e::ROUTER},
    {{"switch"}, device_type_e::SWITCH},
    {{"firewall"}, device_type_e::FIREWALL},
    {{"nas", "synology", "qnap", "afp", "adisk", "timemachine"},
     device_type_e::NAS},
    {{"xbox", "playstation", "nintendo"}, device_type_e::GAME_CONSOLE},
    {{"modbus", "bacnet", "opcua", "plc", "scada"},
     device_type_e::PLC_CONTROLLER},
    {{"workstation", "smb"}, device_type_e::WORKSTATION},
    {{"server"}, device_type_e::SERVER},
    {{"smart"}, device_type_e::SMART_TV},
};

static const std::vector<std::pair<const char *, const char *>> SERVICE_TAGS =
    {
        {"_http.", "HTTP"},   {"_https.", "HTTPS"}, {"airplay", "AirPlay"},
        {"onvif", "ONVIF"},   {"rtsp", "RTSP"},     {"_ssh.", "SSH"},
        {"printer", "Printing"}, {"ipp", "Printing"},
};

device_type_e classify_service(const std::string &service) {
  auto lower = to_lower(service);
  for (auto &rule : SERVICE_RULES) {
    for (auto substring : rule.substrings) {
      if (lower.find(substring) != std::string::npos) {
        return rule.type;
      }
    }
  }
  return device_type_e::NETWORK_DEVICE;
}

device_type_e classify_queries(const std::vector<std::string> &services) {
  auto text = to_lower(join(services, " "));
  auto has = [&text](const char *what) {
    return text.find(what) != std::string::npos;
  };

  if (has("_hap.") || has("_homekit.") || has("_companion-link."))
    return device_type_e::MOBILE_DEVICE;
  if (has("camera") || has("onvif"))
    return device_type_e::CAMERA;
  if (has("airplay") || has("googlecast"))
    return device_type_e::SMART_TV;
  if (has("printer"))
    return device_type_e::PRINTER;
  if (has("server"))
    return device_type_e::SERVER;
  return device_type_e::WORKSTATION;
}

std::string instance_name(const std::string &instance,
                          const std::string &service) {
  auto name = normalize_name(instance);
  auto suffix = "." + normalize_name(service);
  if (name.size() > suffix.size() && endswith(name, suffix)) {
    return name.substr(0, name.size() - suffix.size());
  }
  auto dot = name.find('.');
  return dot == std::string::npos ? name : name.substr(0, dot);
}

static std::string first_label(const std::string &name) {
  auto dot = name.find('.');
  return dot == std::string::npos ? name : name.substr(0, dot);
}

discovered_device_t
response_processor_t::basic_device(const std::string &ip,
                                   std::chrono::system_clock::time_point now) {
  discovered_device_t device;
  device.unique_id = ip;
  device.ip_address = ip;
  device.ip_addresses.insert(ip);
  device.discovery_methods.insert(discovery_method_e::MDNS);
  device.last_seen = now;
  device.is_online = true;
  return device;
}

namespace {

/// Observations of one message, one per key
class observation_set_t {
  std::map<std::string, discovered_device_t> devices;
  std::chrono::system_clock::time_point now;

public:
  explicit observation_set_t(std::chrono::system_clock::time_point now)
      : now(now) {}

  discovered_device_t &get(const std::string &ip) {
    auto it = devices.find(ip);
    if (it == devices.end()) {
      it = devices
               .emplace(ip, response_processor_t::basic_device(ip, now))
               .first;
    }
    return it->second;
  }

  /// Device known only by a service instance name
  discovered_device_t &get_synthetic(const std::string &key) {
    auto it = devices.find(key);
    if (it == devices.end()) {
      auto device = response_processor_t::basic_device("", now);
      device.unique_id = key;
      device.ip_addresses.clear();
      it = devices.emplace(key, std::move(device)).first;
    }
    return it->second;
  }

  bool empty() const { return devices.empty(); }

  std::vector<discovered_device_t> to_vector() {
    std::vector<discovered_device_t> ret;
    for (auto &[key, device] : devices) {
      ret.push_back(std::move(device));
    }
    return ret;
  }
};

void process_a(const dns_record_t &record, observation_set_t &found,
               const response_processor_t &processor) {
  if (record.data.empty() || processor.is_local(record.data)) {
    DEBUG("Skip A record for local or empty address {}", record.data);
    return;
  }
  auto &device = found.get(record.data);
  if (!record.name.empty()) {
    if (device.name.empty())
      device.name = first_label(record.name);
    device.discovery_data["Hostname"] = normalize_name(record.name);
  }
}

void process_ptr(const dns_record_t &record, discovered_device_t &device) {
  if (record.data.empty())
    return;
  auto service = normalize_name(record.name);

  auto type = classify_service(service);
  if (device.device_type == device_type_e::UNKNOWN ||
      device.device_type == device_type_e::NETWORK_DEVICE) {
    device.device_type = type;
  }

  device.capabilities.insert(FMT::format("Service: {}", service));
  auto lower = to_lower(service);
  for (auto &[substring, tag] : SERVICE_TAGS) {
    if (lower.find(substring) != std::string::npos)
      device.capabilities.insert(tag);
  }

  auto instance = instance_name(record.data, service);
  if (device.name.empty())
    device.name = instance;

  // Hikvision announces as "HIKVISION DS-2CD2523G0-IS"
  if (icontains(instance, "HIKVISION")) {
    device.manufacturer = "Hikvision";
    device.device_type = device_type_e::CAMERA;
    for (auto &part : split(instance, ' ')) {
      if (startswith(part, "DS-")) {
        device.model = part;
        break;
      }
    }
  }
}

void process_srv(const dns_record_t &record, discovered_device_t &device) {
  auto srv = parse_srv(record.data);
  if (!srv) {
    DEBUG("Invalid SRV payload: {}", record.data);
    return;
  }
  if (device.port == 0)
    device.port = srv->port;
  device.ports.insert(srv->port);
  device.capabilities.insert(FMT::format("Port: {}", srv->port));

  auto target = normalize_name(srv->target);
  if (!target.empty()) {
    device.capabilities.insert(FMT::format("Target: {}", target));
    if (device.name.empty() && target.find(".local") != std::string::npos)
      device.name = first_label(target);
  }
}

void process_txt(const dns_record_t &record, discovered_device_t &device) {
  for (auto &[key, value] : parse_txt(record.data, MAX_TXT_PAIRS)) {
    if (key.empty())
      continue;
    auto lkey = to_lower(key);
    if (lkey == "model" || lkey == "md" || lkey == "ty") {
      device.model = value;
    } else if (lkey == "manufacturer" || lkey == "mf" || lkey == "vendor" ||
               lkey == "manu") {
      device.manufacturer = value;
    } else if (lkey == "version" || lkey == "ver" || lkey == "fw" ||
               lkey == "firmware" || lkey == "fwversion") {
      device.firmware_version = value;
    } else if (lkey == "serial" || lkey == "sn" || lkey == "serialnumber") {
      device.serial_number = value;
    } else if (lkey == "mac" || lkey == "macaddress") {
      device.mac_address = value;
    } else if (lkey == "name" || lkey == "fn") {
      if (device.name.empty())
        device.name = value;
    } else {
      device.capabilities.insert(FMT::format("{}={}", key, value));
      device.discovery_data["txt." + key] = value;
    }
  }
}

} // namespace

std::vector<discovered_device_t>
response_processor_t::process(const std::optional<dns_message_t> &message,
                              const std::string &source_ip,
                              const std::string &origin,
                              std::chrono::system_clock::time_point now) const {
  if (is_local(source_ip)) {
    DEBUG("Ignoring mDNS traffic from local address {}", source_ip);
    return {};
  }
  observation_set_t found(now);

  // Service records belong to the sender. Without one, each instance is its
  // own device.
  auto owner = [&](const std::string &instance) -> discovered_device_t & {
    if (!source_ip.empty())
      return found.get(source_ip);
    return found.get_synthetic(synthetic_device_key(
        normalize_name(instance), origin.empty() ? "unknown" : origin));
  };

  if (message) {
    auto records = message->records();

    // A records first, so the addresses are known before the services
    for (auto &record : records) {
      if (record.type == dns_record_type_e::A)
        process_a(record, found, *this);
    }
    for (auto &record : records) {
      switch (record.type) {
      case dns_record_type_e::PTR:
        process_ptr(record, owner(record.data));
        break;
      case dns_record_type_e::SRV:
        process_srv(record, owner(record.name));
        break;
      case dns_record_type_e::TXT:
        process_txt(record, owner(record.name));
        break;
      default:
        break;
      }
    }

    // Someone else querying is an active mDNS host too
    if (records.empty()) {
      std::vector<std::string> asked;
      for (auto &question : message->questions) {
        if (question.type == dns_record_type_e::PTR)
          asked.push_back(normalize_name(question.name));
      }
      if (!asked.empty() && !source_ip.empty()) {
        auto &device = found.get(source_ip);
        device.device_type = classify_queries(asked);
        device.discovery_data["QueryBased"] = "true";
        device.discovery_data["Queries"] = join(asked, ",");
        device.description = "Active mDNS querier";
      }
    }
  }

  if (found.empty() && !source_ip.empty()) {
    // Even an unparsable reply means something lives at this address
    auto &device = found.get(source_ip);
    device.name = FMT::format("Device-{}", source_ip);
    device.port = 80;
    device.ports.insert(80);
    device.capabilities.insert("mDNS");
    device.description = "mDNS responding device";
    device.discovery_data["Source"] = "Basic detection";
  }
  return found.to_vector();
}

} // namespace mdnscout

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
#include <mdnscout/services.hpp>

namespace mdnscout {

static std::string tcp(const char *name) {
  return FMT::format("_{}._tcp.local.", name);
}
static std::string udp(const char *name) {
  return FMT::format("_{}._udp.local.", name);
}

static std::vector<std::string> tcp_list(std::initializer_list<const char *> names) {
  std::vector<std::string> ret;
  for (auto name : names)
    ret.push_back(tcp(name));
  return ret;
}

static std::vector<std::string> core_services() {
  return {"_services._dns-sd._udp.local.",
          tcp("http"),
          tcp("https"),
          tcp("device-info"),
          tcp("workstation"),
          udp("domain")};
}

static std::vector<std::string> security_services() {
  return tcp_list({"onvif",     "camera",   "rtsp",         "psia",
                   "axis-video", "axis-nvr", "hikvision",    "dahua",
                   "bosch",     "samsung",  "pelco",        "genetec",
                   "milestone", "avigilon", "vivotek",      "acti",
                   "mobotix",   "panasonic", "sony",        "canon",
                   "ipcam",     "webcam",   "nvr",          "dvr",
                   "cctv",      "surveillance", "security", "doorbell",
                   "intercom"});
}

static std::vector<std::string> network_services() {
  return {tcp("ssh"),      tcp("telnet"),   tcp("ftp"),      tcp("sftp"),
          tcp("smb"),      tcp("nfs"),      udp("tftp"),     udp("snmp"),
          udp("syslog"),   udp("dns"),      udp("dhcp"),     udp("ntp"),
          tcp("ldap"),     udp("kerberos"), tcp("router"),   tcp("switch"),
          tcp("firewall"), tcp("proxy"),    tcp("vpn"),      udp("radius"),
          tcp("tacacs")};
}

static std::vector<std::string> storage_services() {
  return tcp_list({"nas", "storage", "iscsi", "afp", "adisk", "timemachine",
                   "synology", "qnap", "drobo", "netgear", "wd", "seagate",
                   "buffalo", "dlink", "asustor"});
}

static std::vector<std::string> media_services() {
  auto ret = tcp_list({"airplay", "raop", "googlecast", "chromecast", "upnp",
                       "dlna", "roku", "appletv", "airserver", "miracast",
                       "plex", "emby", "jellyfin", "kodi", "xbmc", "spotify",
                       "sonos", "homekit", "hap", "matter"});
  ret.push_back(udp("thread"));
  return ret;
}

static std::vector<std::string> printer_services() {
  return {tcp("printer"),        tcp("ipp"),
          tcp("ipps"),           tcp("escl"),
          tcp("uscan"),          tcp("scanner"),
          tcp("pdl-datastream"), tcp("cups"),
          tcp("print-caps"),     "_universal._sub._ipp._tcp.local.",
          tcp("hp-smart"),       udp("canon-bjnp"),
          tcp("epson-escp"),     tcp("brother"),
          tcp("lexmark")};
}

static std::vector<std::string> industrial_services() {
  return {tcp("modbus"),    udp("bacnet"),   tcp("opcua"),    tcp("mqtt"),
          udp("coap"),      udp("zigbee"),   udp("zwave"),    udp("lora"),
          udp("lorawan"),   udp("6lowpan"),  tcp("plc"),      tcp("scada"),
          tcp("hmi"),       tcp("industrial"), tcp("automation"),
          tcp("sensor"),    tcp("actuator"), tcp("controller")};
}

static std::vector<std::string> communication_services() {
  return {tcp("sip"),     udp("sip"),     tcp("h323"),      udp("h323"),
          udp("rtp"),     udp("rtcp"),    tcp("xmpp"),      tcp("jabber"),
          tcp("irc"),     tcp("mumble"),  udp("teamspeak"), tcp("discord"),
          tcp("skype"),   tcp("zoom"),    tcp("teams"),     tcp("webex"),
          tcp("gotomeeting")};
}

static std::vector<std::string> development_services() {
  return tcp_list({"adb", "debug", "gdb", "lldb", "devtools", "livereload",
                   "webpack", "nodejs", "dotnet", "java", "python", "ruby",
                   "php", "mysql", "postgresql", "mongodb", "redis",
                   "elasticsearch", "grafana", "prometheus"});
}

static std::vector<std::string> gaming_services() {
  return tcp_list({"xbox", "playstation", "nintendo", "steam", "gamestream",
                   "nvidia", "parsec", "moonlight", "virtualhere"});
}

static std::vector<std::string> generic_services() {
  auto ret = std::vector<std::string>{"_tcp.local.", "_udp.local."};
  for (auto &service :
       tcp_list({"device", "service", "server", "client", "api", "rest",
                 "soap", "web", "admin", "config", "management", "monitor",
                 "status", "health"})) {
    ret.push_back(service);
  }
  return ret;
}

static std::vector<std::string> first_n(std::vector<std::string> list,
                                        size_t n) {
  if (list.size() > n)
    list.resize(n);
  return list;
}

std::vector<service_phase_t> service_phases(service_set_e set) {
  switch (set) {
  case service_set_e::SECURITY_FOCUSED:
    return {
        {"core", core_services(), 50ms},
        {"security", security_services(), 100ms},
        {"network", first_n(network_services(), 8), 150ms},
    };
  case service_set_e::LIGHTWEIGHT:
    return {
        {"core", core_services(), 50ms},
        {"security", first_n(security_services(), 10), 100ms},
        {"network", first_n(network_services(), 5), 150ms},
    };
  case service_set_e::FULL:
    break;
  }
  return {
      {"core", core_services(), 50ms},
      {"security", security_services(), 100ms},
      {"network", network_services(), 150ms},
      {"storage", storage_services(), 200ms},
      {"media", media_services(), 250ms},
      {"printer", printer_services(), 300ms},
      {"industrial", industrial_services(), 350ms},
      {"communication", communication_services(), 400ms},
      {"development", development_services(), 450ms},
      {"gaming", gaming_services(), 500ms},
      {"generic", generic_services(), 600ms},
  };
}

const std::vector<std::string> &final_sweep_services() {
  static const std::vector<std::string> services = {
      "_services._dns-sd._udp.local.", "_tcp.local.", "_udp.local."};
  return services;
}

const std::vector<std::string> &follow_up_services() {
  static const std::vector<std::string> services = {
      tcp("device-info"), tcp("workstation"), tcp("companion-link"),
      udp("sleep-proxy")};
  return services;
}

size_t batch_size_for(size_t service_count) {
  if (service_count <= 10)
    return 3;
  if (service_count <= 20)
    return 4;
  if (service_count <= 30)
    return 5;
  return 6;
}

} // namespace mdnscout

/**
 * mdnscout - mDNS network device discovery
 * Copyright (C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#include "cli_settings.hpp"
#include <charconv>
#include <mdnscout/exceptions.hpp>
#include <mdnscout/stringpp.hpp>

namespace mdnscout::cli {

int str_to_int(const std::string &value) {
  int ret = 0;
  auto trimmed = trim_copy(value);
  auto end = trimmed.data() + trimmed.size();
  auto res = std::from_chars(trimmed.data(), end, ret);
  if (res.ec != std::errc() || res.ptr != end || trimmed.empty()) {
    throw exception("Invalid integer value: {}", value);
  }
  return ret;
}

std::chrono::milliseconds str_to_duration(const std::string &value) {
  auto lower = to_lower(trim_copy(value));
  // Longest suffixes first, "ms" also ends in "s"
  if (endswith(lower, "ms")) {
    return std::chrono::milliseconds(
        str_to_int(lower.substr(0, lower.size() - 2)));
  }
  if (endswith(lower, "s")) {
    return std::chrono::seconds(str_to_int(lower.substr(0, lower.size() - 1)));
  }
  if (endswith(lower, "m")) {
    return std::chrono::minutes(str_to_int(lower.substr(0, lower.size() - 1)));
  }
  if (endswith(lower, "h")) {
    return std::chrono::hours(str_to_int(lower.substr(0, lower.size() - 1)));
  }
  return std::chrono::seconds(str_to_int(lower));
}

bool str_to_bool(const std::string &value) {
  auto lower = to_lower(trim_copy(value));
  if (lower == "true" || lower == "yes" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "0") {
    return false;
  }
  throw exception("Invalid boolean value: {}", value);
}

service_set_e str_to_service_set(const std::string &value) {
  auto lower = to_lower(trim_copy(value));
  if (lower == "full") {
    return service_set_e::FULL;
  }
  if (lower == "security") {
    return service_set_e::SECURITY_FOCUSED;
  }
  if (lower == "lightweight") {
    return service_set_e::LIGHTWEIGHT;
  }
  throw exception("Invalid service set: {}. Valid: full, security, lightweight",
                  value);
}

static int positive(int value, const std::string &key) {
  if (value <= 0) {
    throw exception("{} must be positive, got {}", key, value);
  }
  return value;
}

bool set_discovery_setting(settings_t &settings, const std::string &key,
                           const std::string &value) {
  if (key == "session_timeout") {
    settings.session_timeout = str_to_duration(value);
  } else if (key == "cache_ttl") {
    settings.cache_ttl = str_to_duration(value);
  } else if (key == "cache_sweep_interval") {
    settings.cache_sweep_interval = str_to_duration(value);
  } else if (key == "poll_interval") {
    settings.poll_interval = str_to_duration(value);
  } else if (key == "plateau_min_elapsed") {
    settings.plateau_min_elapsed = str_to_duration(value);
  } else if (key == "plateau_stable_polls") {
    settings.plateau_stable_polls = positive(str_to_int(value), key);
  } else if (key == "receive_timeout") {
    settings.receive_timeout = str_to_duration(value);
  } else if (key == "receive_error_backoff") {
    settings.receive_error_backoff = str_to_duration(value);
  } else if (key == "send_timeout") {
    settings.send_timeout = str_to_duration(value);
  } else if (key == "listener_exit_timeout") {
    settings.listener_exit_timeout = str_to_duration(value);
  } else if (key == "teardown_grace") {
    settings.teardown_grace = str_to_duration(value);
  } else if (key == "phase_bursts") {
    settings.phase_bursts = positive(str_to_int(value), key);
  } else if (key == "burst_interval") {
    settings.burst_interval = str_to_duration(value);
  } else if (key == "service_set") {
    settings.service_set = str_to_service_set(value);
  } else if (key == "max_listening_sockets") {
    settings.max_listening_sockets = positive(str_to_int(value), key);
  } else if (key == "network_segment") {
    settings.network_segment = value;
  } else if (key == "resolve_hostnames") {
    settings.resolve_hostnames = str_to_bool(value);
  } else {
    return false;
  }
  return true;
}

} // namespace mdnscout::cli

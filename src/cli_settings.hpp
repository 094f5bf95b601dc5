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
#pragma once

#include <chrono>
#include <mdnscout/logger.hpp>
#include <mdnscout/settings.hpp>
#include <string>
#include <vector>

namespace mdnscout::cli {

struct cli_settings_t {
  settings_t discovery;
  bool continuous = false;
  std::chrono::milliseconds continuous_interval = std::chrono::minutes(5);
  logger_level_t log_level = logger_level_t::INFO;
};

/// "30" is seconds. Also accepts the ms, s, m and h suffixes.
std::chrono::milliseconds str_to_duration(const std::string &value);
bool str_to_bool(const std::string &value);
service_set_e str_to_service_set(const std::string &value);
int str_to_int(const std::string &value);

/// Sets a settings_t field by name, as in the INI [discovery] section.
/// Returns false if there is no such field. Throws on invalid values.
bool set_discovery_setting(settings_t &settings, const std::string &key,
                           const std::string &value);

void parse_argv(const std::vector<std::string> &argv,
                cli_settings_t *settings);
void load_ini(const std::string &filename, cli_settings_t *settings);

extern const char *VERSION;

} // namespace mdnscout::cli

BASIC_FORMATTER(mdnscout::cli::cli_settings_t,
                "cli_settings_t[{}, continuous={} every {}ms, log_level={}]",
                v.discovery, v.continuous, v.continuous_interval.count(),
                v.log_level);

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

#include "cli_settings.hpp"
#include <string>

namespace mdnscout::cli {

/**
 * @short Line by line INI parser.
 *
 * [general] has log_level, continuous and continuous_interval. [discovery]
 * has the settings_t fields by name. '#' and ';' start comments.
 */
class IniReader {
  cli_settings_t *settings;
  std::string filename = "<string>";
  std::string section;
  int lineno = 0;

public:
  IniReader(cli_settings_t *settings) : settings(settings) {}

  void set_filename(const std::string &filename);
  void parse_line(const std::string &line);
};

} // namespace mdnscout::cli

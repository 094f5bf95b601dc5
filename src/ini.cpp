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
#include "ini.hpp"
#include <fstream>
#include <mdnscout/exceptions.hpp>
#include <mdnscout/stringpp.hpp>

namespace mdnscout::cli {

// Loads an INI file and sets the data in the cli_settings_t struct
void load_ini(const std::string &filename, cli_settings_t *settings) {
  auto fd = std::ifstream(filename);
  if (!fd.is_open()) {
    throw exception("Cannot open ini file: {}", filename);
  }
  IniReader reader(settings);
  reader.set_filename(filename);

  std::string line;
  while (std::getline(fd, line)) {
    reader.parse_line(line);
  }
  DEBUG("settings after {}: {}", filename, *settings);
}

void IniReader::set_filename(const std::string &filename_) {
  filename = filename_;
  lineno = 0;
  section.clear();
}

void IniReader::parse_line(const std::string &line_) {
  lineno++;
  auto line = line_;
  // Remove comments
  auto comment_pos = line.find_first_of("#;");
  if (comment_pos != std::string::npos) {
    line = line.substr(0, comment_pos);
  }
  trim(line);
  if (line.empty()) {
    return;
  }

  if (line[0] == '[') {
    if (line[line.length() - 1] != ']') {
      throw ini_exception(filename, lineno, "Invalid section: {}", line);
    }
    section = trim_copy(line.substr(1, line.length() - 2));
    if (section != "general" && section != "discovery") {
      throw ini_exception(filename, lineno, "Invalid section: {}", section);
    }
    return;
  }

  auto eq_pos = line.find('=');
  if (eq_pos == std::string::npos) {
    throw ini_exception(filename, lineno, "Invalid line: {}", line);
  }
  auto key = trim_copy(line.substr(0, eq_pos));
  auto value = trim_copy(line.substr(eq_pos + 1));

  try {
    if (section == "general") {
      if (key == "log_level") {
        settings->log_level = str_to_log_level(value);
        logger2.set_log_level(settings->log_level);
      } else if (key == "continuous") {
        settings->continuous = str_to_bool(value);
      } else if (key == "continuous_interval") {
        settings->continuous_interval = str_to_duration(value);
      } else {
        throw ini_exception(filename, lineno, "Invalid key: {}", key);
      }
    } else if (section == "discovery") {
      if (!set_discovery_setting(settings->discovery, key, value)) {
        throw ini_exception(filename, lineno, "Invalid key: {}", key);
      }
    } else {
      throw ini_exception(filename, lineno, "Key outside of a section: {}",
                          key);
    }
  } catch (const ini_exception &) {
    throw;
  } catch (const exception &e) {
    // Bad values get the file position too
    throw ini_exception(filename, lineno, "{}", e.what());
  }
}

} // namespace mdnscout::cli

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
#include "ini.hpp"
#include <functional>
#include <iostream>
#include <mdnscout/exceptions.hpp>
#include <string>
#include <vector>

namespace mdnscout::cli {

#ifndef MDNSCOUT_VERSION
// NOLINTNEXTLINE
#define MDNSCOUT_VERSION "unknown"
#endif

// NOLINTNEXTLINE
const char *VERSION = MDNSCOUT_VERSION;

// NOLINTNEXTLINE (cppcoreguidelines-pro-bounds-pointer-arithmetic)
constexpr const char *const CMDLINE_HELP = &R"(
mdnscout v{}
(C) 2019-2024 David Moreno Montero <dmoreno@coralbits.com>
Finds network devices, mostly cameras and other security and network
equipment, using multicast DNS.

Queries are only sent to the local subnets, but answers seen from any
network are reported. A session ends when no new device appears for a
while, or at the timeout.

Options:
)"[1];

struct argument_t {
  std::string arg;
  std::string comment;
  std::function<void(const std::string &)> fn;
  bool has_second_argument = true;

  // NOLINTNEXTLINE
  argument_t(const std::string &arg, const std::string &comment,
             std::function<void(const std::string &)> fn,
             bool has_second_argument = true)
      : arg(arg), comment(comment), fn(fn),
        has_second_argument(has_second_argument) {}
};

void help(const std::vector<argument_t> &arguments) {
  std::cout << FMT::format(CMDLINE_HELP, VERSION);
  for (auto &argument : arguments) {
    std::cout << FMT::format("  {:<30} {}\n", argument.arg, argument.comment);
  }
}

// Setup the argument options
static std::vector<argument_t> setup_arguments(cli_settings_t *settings) {
  std::vector<argument_t> arguments;

  arguments.emplace_back( //
      "--ini",            //
      "Loads an INI file as default configuration. Depending on order may "
      "overwrite other arguments",
      [settings](const std::string &value) { load_ini(value, settings); });
  arguments.emplace_back( //
      "--timeout",        //
      "Session timeout. Seconds, or with ms/s/m suffix. Default 5m.",
      [settings](const std::string &value) {
        settings->discovery.session_timeout = str_to_duration(value);
      });
  arguments.emplace_back( //
      "--segment",        //
      "Only report devices in this network, as 192.168.1.0/24",
      [settings](const std::string &value) {
        settings->discovery.network_segment = value;
      });
  arguments.emplace_back( //
      "--ttl",            //
      "How long a seen device is remembered. Default 5m.",
      [settings](const std::string &value) {
        settings->discovery.cache_ttl = str_to_duration(value);
      });
  arguments.emplace_back( //
      "--services",       //
      "Services to query: full | security | lightweight. Default full.",
      [settings](const std::string &value) {
        settings->discovery.service_set = str_to_service_set(value);
      });
  arguments.emplace_back(
      "--resolve-hostnames", //
      "Name anonymous devices with their reverse DNS name",
      [settings](const std::string &) {
        settings->discovery.resolve_hostnames = true;
      },
      false);
  arguments.emplace_back(
      "--continuous", //
      "Keep discovering until interrupted",
      [settings](const std::string &) { settings->continuous = true; },
      false);
  arguments.emplace_back( //
      "--interval",       //
      "Time between continuous discoveries. Default 5m.",
      [settings](const std::string &value) {
        settings->continuous_interval = str_to_duration(value);
      });
  arguments.emplace_back( //
      "--log-level",      //
      "debug | info | warning | error. Default info.",
      [settings](const std::string &value) {
        settings->log_level = str_to_log_level(value);
        logger2.set_log_level(settings->log_level);
      });
  arguments.emplace_back(
      "--version", //
      "Show version",
      [](const std::string &) {
        std::cout << FMT::format("mdnscout version {}\n", VERSION);
        exit(0);
      },
      false);
  arguments.emplace_back(
      "--help", //
      "Show this help",
      [settings](const std::string &) {
        help(setup_arguments(settings));
        exit(0);
      },
      false);
  return arguments;
}

// Parses the argv and sets up the cli_settings_t struct. Throws on unknown
// arguments or invalid values.
void parse_argv(const std::vector<std::string> &argv,
                cli_settings_t *settings) {
  std::vector<argument_t> arguments = setup_arguments(settings);
  // Necesary for two part arguments
  argument_t *current_argument = nullptr;

  for (auto &key : argv) {
    auto parsed = false;
    if (current_argument && current_argument->has_second_argument) {
      current_argument->fn(key);
      parsed = true;
      current_argument = nullptr;
    } else {
      // Checks all arguments
      for (auto &argument : arguments) {
        if (argument.has_second_argument) {
          auto keyeq = FMT::format("{}=", argument.arg);
          if (key.substr(0, keyeq.length()) == keyeq) {
            argument.fn(key.substr(keyeq.length()));
            parsed = true;
            break;
          }
        }
        if (key == argument.arg) {
          if (argument.has_second_argument) {
            current_argument = &argument;
          } else {
            argument.fn("");
          }
          parsed = true;
          break;
        }
      }
    }
    if (!parsed) {
      throw exception("Unknown argument: {}. Try help with --help.", key);
    }
  }
  if (current_argument) {
    throw exception("Missing value for {}", current_argument->arg);
  }

  DEBUG("settings after argument parsing: {}", *settings);
}

} // namespace mdnscout::cli

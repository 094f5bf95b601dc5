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
#include <algorithm>
#include <csignal>
#include <iostream>
#include <mdnscout/cancellation.hpp>
#include <mdnscout/discovery.hpp>
#include <mdnscout/logger.hpp>
#include <pthread.h>
#include <thread>

namespace {

constexpr int EXIT_ARGUMENTS_OR_FAILED = 1;
constexpr int EXIT_NO_INTERFACES = 2;

/**
 * SIGINT and SIGTERM are blocked in every thread and received here, so the
 * cancellation runs as normal code and not in a signal handler. A second
 * signal exits at once.
 */
void signal_thread(sigset_t signals, mdnscout::cancel_source_t *cancel) {
  bool exiting = false;
  for (;;) {
    int signum = 0;
    if (sigwait(&signals, &signum) != 0) {
      ERROR("sigwait failed, signals will not be handled");
      return;
    }
    if (exiting) {
      exit(1);
    }
    exiting = true;
    INFO("{} received. Closing.", signum == SIGINT ? "SIGINT" : "SIGTERM");
    cancel->cancel();
  }
}

void print_devices(const std::vector<mdnscout::discovered_device_t> &devices) {
  std::cout << FMT::format("{:<16} {:<18} {:<28} {:<14} {:<20} {}\n",
                           "ADDRESS", "TYPE", "NAME", "MANUFACTURER", "MODEL",
                           "PORTS");
  for (auto &device : devices) {
    std::cout << FMT::format("{:<16} {:<18} {:<28} {:<14} {:<20} {}\n",
                             device.ip_address,
                             FMT::format("{}", device.device_type),
                             device.display_name(), device.manufacturer,
                             device.model, FMT::format("{}", device.ports));
  }
  std::cout << FMT::format("{} devices\n", devices.size());
}

int exit_code(mdnscout::discovery_status_e status) {
  switch (status) {
  case mdnscout::discovery_status_e::OK:
  case mdnscout::discovery_status_e::CANCELLED:
    return 0;
  case mdnscout::discovery_status_e::NO_INTERFACES:
    return EXIT_NO_INTERFACES;
  case mdnscout::discovery_status_e::BUSY:
  case mdnscout::discovery_status_e::FAILED:
    break;
  }
  return EXIT_ARGUMENTS_OR_FAILED;
}

} // namespace

int main(int argc, char **argv) {
  // stdout is for the device list
  mdnscout::logger2.set_output(&std::cerr);

  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    args.push_back(argv[i]);
  }

  mdnscout::cli::cli_settings_t settings;
  try {
    mdnscout::cli::parse_argv(args, &settings);
  } catch (const std::exception &exc) {
    ERROR("{}", exc.what());
    return EXIT_ARGUMENTS_OR_FAILED;
  }
  INFO("mdnscout {} starting: {}", mdnscout::cli::VERSION, settings);

  // Before any thread is created, so all of them inherit the mask
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  mdnscout::cancel_source_t cancel;
  std::thread(signal_thread, signals, &cancel).detach();

  mdnscout::discovery_t discovery(settings.discovery, nullptr,
                                  mdnscout::logger2);
  auto discovered = discovery.device_discovered.connect(
      [](const mdnscout::discovered_device_t &device,
         const std::string &method) {
        std::cout << FMT::format("+ {:<16} {:<18} {} ({})\n",
                                 device.ip_address,
                                 FMT::format("{}", device.device_type),
                                 device.display_name(), method);
      });
  auto expired = discovery.device_expired.connect(
      [](const std::string &name, const std::string &address) {
        std::cout << FMT::format("- {:<16} {}\n", address, name);
      });
  auto progress = discovery.progress.connect(
      [](int percent, const std::string &status) {
        DEBUG("{:>3}% {}", percent, status);
      });

  int ret = 0;
  if (settings.continuous) {
    discovery.start_continuous(settings.continuous_interval);
    auto token = cancel.token();
    while (!token.wait_for(std::chrono::seconds(1))) {
    }
    discovery.stop_continuous();
    auto devices = discovery.cache().list_valid();
    std::sort(devices.begin(), devices.end(),
              [](const mdnscout::discovered_device_t &a,
                 const mdnscout::discovered_device_t &b) {
                return mdnscout::ipv4_less(a.key(), b.key());
              });
    print_devices(devices);
  } else {
    auto result = discovery.discover(cancel.token());
    INFO("Discovery finished: {}", result.status);
    print_devices(result.devices);
    ret = exit_code(result.status);
  }

  discovery.wait_teardown();
  INFO("FIN");
  return ret;
}

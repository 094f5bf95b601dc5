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
#include <algorithm>
#include <map>
#include <mdnscout/device_map.hpp>
#include <mdnscout/discovery.hpp>
#include <mdnscout/logger.hpp>
#include <mdnscout/query_sender.hpp>
#include <mdnscout/response_listener.hpp>

namespace mdnscout {

static const char *CROSS_SUBNET_CAPABILITY = "Cross-subnet (passive)";

bool plateau_detector_t::update(size_t count,
                                std::chrono::milliseconds elapsed) {
  if (count > last_count) {
    last_count = count;
    stable = 0;
  } else {
    stable++;
  }
  return elapsed >= min_elapsed && stable >= stable_polls;
}

collect_end_e collect_until_plateau(
    const std::function<size_t()> &count, const settings_t &settings,
    const cancel_token_t &token,
    const std::function<void(std::chrono::milliseconds, size_t)> &on_poll) {
  plateau_detector_t plateau(settings.plateau_min_elapsed,
                             settings.plateau_stable_polls);
  auto start = std::chrono::steady_clock::now();

  for (;;) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (elapsed >= settings.session_timeout) {
      return collect_end_e::TIMEOUT;
    }
    auto current = count();
    if (on_poll) {
      on_poll(elapsed, current);
    }
    if (plateau.update(current, elapsed)) {
      DEBUG("No new devices for {} polls, {} found after {}ms",
            plateau.get_stable_polls(), current, elapsed.count());
      return collect_end_e::PLATEAU;
    }
    // Never sleep past the hard ceiling
    auto wait = std::min(settings.poll_interval,
                         settings.session_timeout - elapsed);
    if (token.wait_for(wait)) {
      return collect_end_e::CANCELLED;
    }
  }
}

std::vector<discovered_device_t>
filter_results(const std::vector<discovered_device_t> &session_devices,
               const std::vector<discovered_device_t> &cached_devices,
               const std::set<std::string> &local_addresses,
               const std::vector<local_interface_t> &interfaces,
               const std::optional<network_segment_t> &segment) {
  std::map<std::string, discovered_device_t> all;
  for (auto &device : session_devices) {
    all.emplace(device.key(), device);
  }
  for (auto &device : cached_devices) {
    auto it = all.find(device.key());
    if (it == all.end()) {
      all.emplace(device.key(), device);
    } else {
      it->second.update_from(device);
    }
  }

  std::vector<discovered_device_t> ret;
  for (auto &[key, device] : all) {
    if (local_addresses.count(key) || local_addresses.count(device.ip_address)) {
      DEBUG("Filtered local device {}", key);
      continue;
    }
    if (!device.is_online) {
      continue;
    }
    auto ip = parse_ipv4(device.ip_address);
    if (segment && (!ip || !segment->contains(*ip))) {
      continue;
    }
    if (ip && std::none_of(interfaces.begin(), interfaces.end(),
                           [&ip](const local_interface_t &iface) {
                             return iface.same_subnet(*ip);
                           })) {
      device.capabilities.insert(CROSS_SUBNET_CAPABILITY);
    }
    ret.push_back(device);
  }

  std::sort(ret.begin(), ret.end(),
            [](const discovered_device_t &a, const discovered_device_t &b) {
              return ipv4_less(a.key(), b.key());
            });
  return ret;
}

struct discovery_t::session_t {
  std::unique_ptr<network_manager_t> network;
  cancel_source_t cancel;
  device_map_t devices;
  std::unique_ptr<response_listener_t> listener;
  std::unique_ptr<query_sender_t> sender;
  std::thread sender_thread;

  connection_t<const discovered_device_t &, const std::string &>
      discovered_connection;
  connection_t<const discovered_device_t &, const std::string &>
      updated_connection;
  connection_t<size_t, size_t, const std::string &> phase_connection;

  session_t(std::unique_ptr<network_manager_t> network,
            const cancel_token_t &parent)
      : network(std::move(network)), cancel(parent) {}
};

discovery_t::discovery_t(const settings_t &settings,
                         network_factory_t network_factory, logger_t &logger)
    : logger(logger), settings(settings),
      network_factory(std::move(network_factory)),
      device_cache(settings.cache_ttl, std::chrono::system_clock::now,
                   logger) {
  if (!this->network_factory) {
    auto max_listening = settings.max_listening_sockets;
    this->network_factory = [max_listening] {
      return std::make_unique<mdns_network_manager_t>(max_listening);
    };
  }
  cache_connection = device_cache.device_expired.connect(
      [this](const std::string &name, const std::string &address) {
        device_expired(name, address);
      });
  device_cache.start_sweeper(settings.cache_sweep_interval);
}

discovery_t::~discovery_t() {
  stop_continuous();
  wait_teardown();
  device_cache.dispose();
}

void discovery_t::set_state(discovery_state_e state_) {
  state = state_;
  DEBUG("Discovery state {}", state_);
  state_changed(state_);
}

void discovery_t::report(int percent, const std::string &status) {
  DEBUG("Progress {}%: {}", percent, status);
  progress(percent, status);
}

discovery_result_t discovery_t::discover(cancel_token_t token) {
  return discover(std::string(), std::move(token));
}

discovery_result_t discovery_t::discover(const std::string &segment_str,
                                         cancel_token_t token) {
  std::unique_lock<std::mutex> lock(session_mutex, std::try_to_lock);
  if (!lock.owns_lock()) {
    WARNING("Discovery already in progress, request rejected");
    return discovery_result_t{discovery_status_e::BUSY, {}};
  }

  std::optional<network_segment_t> segment;
  auto cidr = segment_str.empty() ? settings.network_segment : segment_str;
  if (!cidr.empty()) {
    segment = network_segment_t::parse(cidr);
    if (!segment) {
      WARNING("Invalid network segment \"{}\", ignored", cidr);
    }
  }

  std::shared_ptr<session_t> session;
  discovery_result_t result;
  try {
    set_state(discovery_state_e::INITIALIZING);
    report(5, "Initializing mDNS discovery");
    session = std::make_shared<session_t>(network_factory(), token);
    result = run_session(*session, token, segment);
  } catch (const std::exception &e) {
    ERROR("Discovery failed: {}", e.what());
    report(100, FMT::format("mDNS discovery failed: {}", e.what()));
    result = discovery_result_t{discovery_status_e::FAILED, {}};
  }

  set_state(result.status == discovery_status_e::CANCELLED
                ? discovery_state_e::CANCELLED
                : discovery_state_e::IDLE);
  lock.unlock();
  if (session) {
    start_teardown(std::move(session));
  }
  return result;
}

discovery_result_t
discovery_t::run_session(session_t &session, const cancel_token_t &token,
                         const std::optional<network_segment_t> &segment) {
  auto &network = *session.network;
  if (!network.initialize()) {
    set_state(discovery_state_e::FILTERING);
    report(100, "No suitable network interfaces found for mDNS");
    return discovery_result_t{discovery_status_e::NO_INTERFACES, {}};
  }
  auto local_addresses = network.local_addresses();
  report(10, FMT::format("Active on {} interfaces",
                         network.local_interfaces().size()));

  // Listen before the first query goes out, so no answer is lost
  session.listener = std::make_unique<response_listener_t>(
      network, settings, session.devices, &device_cache, segment,
      session.cancel.token(), logger);
  session.discovered_connection = session.listener->device_discovered.connect(
      [this](const discovered_device_t &device, const std::string &method) {
        device_discovered(device, method);
      });
  session.updated_connection = session.listener->device_updated.connect(
      [this](const discovered_device_t &device, const std::string &method) {
        device_updated(device, method);
      });
  session.listener->start();

  set_state(discovery_state_e::QUERYING);
  report(20, "Starting local subnet service discovery");
  session.sender = std::make_unique<query_sender_t>(
      network, settings, session.cancel.token(), logger);
  session.phase_connection = session.sender->phase_started.connect(
      [this](size_t index, size_t total, const std::string &name) {
        report(20 + static_cast<int>(10 * index / total),
               FMT::format("Phase {}/{}: {} services", index + 1, total,
                           name));
      });
  auto *sender = session.sender.get();
  session.sender_thread = std::thread([this, sender] {
    logger_t::set_thread_name("sender");
    try {
      sender->run();
    } catch (const std::exception &e) {
      ERROR("Query sender stopped: {}", e.what());
    }
  });

  set_state(discovery_state_e::LISTENING);
  report(30, "Listening for responses");

  set_state(discovery_state_e::COLLECTING);
  auto &devices = session.devices;
  auto end = collect_until_plateau(
      [&devices, &local_addresses] {
        return devices.count_excluding(local_addresses);
      },
      settings, token,
      [this](std::chrono::milliseconds elapsed, size_t count) {
        auto total = std::max<int64_t>(settings.session_timeout.count(), 1);
        auto percent =
            30 + static_cast<int>(60 * int64_t(elapsed.count()) / total);
        report(std::min(percent, 89),
               FMT::format("Listening for devices, {} found", count));
      });
  // Stops the sender and the receive loops
  session.cancel.cancel();
  INFO("Collection ended by {} with {} devices", end, devices.count());

  set_state(discovery_state_e::FILTERING);
  report(90, "Processing discovery results");
  auto results =
      filter_results(devices.snapshot(), device_cache.list_valid(),
                     local_addresses, network.local_interfaces(), segment);
  if (settings.resolve_hostnames && end != collect_end_e::CANCELLED) {
    resolve_hostnames(results);
  }

  if (end == collect_end_e::CANCELLED) {
    report(100, "mDNS discovery cancelled");
    return discovery_result_t{discovery_status_e::CANCELLED,
                              std::move(results)};
  }
  report(100, FMT::format("mDNS discovery complete, {} devices found",
                          results.size()));
  return discovery_result_t{discovery_status_e::OK, std::move(results)};
}

void discovery_t::resolve_hostnames(std::vector<discovered_device_t> &devices) {
  for (auto &device : devices) {
    if (device.name != FMT::format("Device-{}", device.ip_address)) {
      continue;
    }
    auto address = network_address_t::parse(device.ip_address);
    if (!address) {
      continue;
    }
    auto hostname = address->hostname();
    if (!hostname.empty()) {
      DEBUG("{} resolved to {}", device.ip_address, hostname);
      device.name = hostname;
    }
  }
}

void discovery_t::start_teardown(std::shared_ptr<session_t> session) {
  std::lock_guard<std::mutex> lock(teardown_mutex);
  // Forget the ones already done
  std::erase_if(teardowns, [](std::future<void> &f) {
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  });
  // The destructor waits for these, so this outlives them
  teardowns.push_back(std::async(std::launch::async, &discovery_t::teardown,
                                 this, std::move(session)));
}

void discovery_t::teardown(std::shared_ptr<session_t> session) {
  logger_t::set_thread_name("teardown");
  try {
    session->cancel.cancel();
    if (session->listener &&
        !session->listener->wait_exit(settings.listener_exit_timeout)) {
      WARNING("Receive loops did not exit in {}ms",
              settings.listener_exit_timeout.count());
    }
    // In flight socket operations settle before the sockets go away
    std::this_thread::sleep_for(settings.teardown_grace);
    session->network->dispose();

    if (session->listener) {
      session->listener->join();
    }
    if (session->sender_thread.joinable()) {
      session->sender_thread.join();
    }
    DEBUG("Session teardown done");
  } catch (const std::exception &e) {
    ERROR("Error on session teardown: {}", e.what());
  }
}

void discovery_t::wait_teardown() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lock(teardown_mutex);
    pending.swap(teardowns);
  }
  for (auto &f : pending) {
    f.wait();
  }
}

void discovery_t::start_continuous(std::chrono::milliseconds interval) {
  if (continuous_thread.joinable()) {
    WARNING("Continuous discovery already running");
    return;
  }
  continuous_cancel = std::make_unique<cancel_source_t>();
  auto token = continuous_cancel->token();
  INFO("Continuous discovery every {}ms", interval.count());
  continuous_thread = std::thread([this, token, interval] {
    logger_t::set_thread_name("continuous");
    do {
      auto result = discover(token);
      if (result.status == discovery_status_e::BUSY) {
        DEBUG("Engine busy, continuous run skipped");
      } else {
        INFO("Continuous run: {}, {} devices", result.status,
             result.devices.size());
      }
    } while (!token.wait_for(interval));
  });
}

void discovery_t::stop_continuous() {
  if (!continuous_thread.joinable()) {
    return;
  }
  continuous_cancel->cancel();
  continuous_thread.join();
  continuous_cancel.reset();
}

} // namespace mdnscout

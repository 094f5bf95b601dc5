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

#include "cancellation.hpp"
#include "device.hpp"
#include "device_cache.hpp"
#include "logger.hpp"
#include "network_interfaces.hpp"
#include "network_manager.hpp"
#include "networkaddress.hpp"
#include "settings.hpp"
#include "signal.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace mdnscout {

enum class discovery_state_e {
  IDLE,
  INITIALIZING,
  QUERYING,
  LISTENING,
  COLLECTING,
  FILTERING,
  CANCELLED,
};

enum class discovery_status_e {
  OK,
  BUSY,
  NO_INTERFACES,
  CANCELLED,
  FAILED,
};

struct discovery_result_t {
  discovery_status_e status = discovery_status_e::OK;
  std::vector<discovered_device_t> devices;
};

/**
 * @short Detects when a session stops finding new devices.
 *
 * Fed the number of external devices at every poll. Says stop once the
 * minimum time has passed and the count did not grow for stable_polls
 * consecutive polls.
 */
class plateau_detector_t {
  std::chrono::milliseconds min_elapsed;
  int stable_polls;
  size_t last_count = 0;
  int stable = 0;

public:
  plateau_detector_t(std::chrono::milliseconds min_elapsed, int stable_polls)
      : min_elapsed(min_elapsed), stable_polls(stable_polls) {}

  bool update(size_t count, std::chrono::milliseconds elapsed);
  int get_stable_polls() const { return stable; }
};

enum class collect_end_e { PLATEAU, TIMEOUT, CANCELLED };

/**
 * @short Polls count every poll_interval until the plateau, the session
 * timeout or the cancellation, whatever comes first.
 *
 * on_poll gets the elapsed time and the last count, for progress reports.
 */
collect_end_e collect_until_plateau(
    const std::function<size_t()> &count, const settings_t &settings,
    const cancel_token_t &token,
    const std::function<void(std::chrono::milliseconds, size_t)> &on_poll =
        nullptr);

/**
 * @short Merges session and cached devices and keeps only the ones worth
 * reporting: not local, online, in the segment if any. Sorted by address.
 *
 * Devices out of every local subnet get a "Cross-subnet (passive)"
 * capability.
 */
std::vector<discovered_device_t>
filter_results(const std::vector<discovered_device_t> &session_devices,
               const std::vector<discovered_device_t> &cached_devices,
               const std::set<std::string> &local_addresses,
               const std::vector<local_interface_t> &interfaces,
               const std::optional<network_segment_t> &segment);

/**
 * @short mDNS discovery engine. One session at a time.
 *
 * A session opens its own sockets, starts the receive loops, sends the
 * phased queries and polls the device count until it plateaus or times
 * out. The results are filtered and returned, and the sockets are released
 * in the background. wait_teardown() waits for that release.
 *
 * discover() never throws, all failures are in the returned status.
 */
class discovery_t {
  NON_COPYABLE_NOR_MOVABLE(discovery_t);

public:
  using network_factory_t =
      std::function<std::unique_ptr<network_manager_t>()>;

  /// device, discovery method. Raised once per device and session.
  signal_t<const discovered_device_t &, const std::string &> device_discovered;
  /// device, discovery method. New data on an already known device.
  signal_t<const discovered_device_t &, const std::string &> device_updated;
  /// display name, address
  signal_t<const std::string &, const std::string &> device_expired;
  /// percent, status
  signal_t<int, const std::string &> progress;
  signal_t<discovery_state_e> state_changed;

  discovery_t(const settings_t &settings = settings_t{},
              network_factory_t network_factory = nullptr,
              logger_t &logger = logger2);
  ~discovery_t();

  discovery_result_t discover(cancel_token_t token = cancel_token_t{});
  /// segment overrides the settings one. Empty for the settings one.
  discovery_result_t discover(const std::string &segment,
                              cancel_token_t token = cancel_token_t{});

  discovery_state_e get_state() const { return state; }
  const settings_t &get_settings() const { return settings; }
  device_cache_t &cache() { return device_cache; }

  /// Blocks until the teardown of every past session finished
  void wait_teardown();

  /// Runs a session every interval in the background
  void start_continuous(std::chrono::milliseconds interval);
  void stop_continuous();
  bool is_continuous() const { return continuous_thread.joinable(); }

  logger_t &mdnscout_logger() const { return logger; }

private:
  struct session_t;

  logger_t &logger;
  settings_t settings;
  network_factory_t network_factory;
  device_cache_t device_cache;
  connection_t<const std::string &, const std::string &> cache_connection;

  std::atomic<discovery_state_e> state{discovery_state_e::IDLE};
  std::mutex session_mutex;

  std::mutex teardown_mutex;
  std::vector<std::future<void>> teardowns;

  std::unique_ptr<cancel_source_t> continuous_cancel;
  std::thread continuous_thread;

  discovery_result_t
  run_session(session_t &session, const cancel_token_t &token,
              const std::optional<network_segment_t> &segment);
  void set_state(discovery_state_e state);
  void report(int percent, const std::string &status);
  void start_teardown(std::shared_ptr<session_t> session);
  void teardown(std::shared_ptr<session_t> session);
  void resolve_hostnames(std::vector<discovered_device_t> &devices);
};

} // namespace mdnscout

ENUM_FORMATTER_BEGIN(mdnscout::discovery_state_e);
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_state_e::IDLE, "IDLE");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_state_e::INITIALIZING,
                       "INITIALIZING");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_state_e::QUERYING, "QUERYING");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_state_e::LISTENING, "LISTENING");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_state_e::COLLECTING, "COLLECTING");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_state_e::FILTERING, "FILTERING");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_state_e::CANCELLED, "CANCELLED");
ENUM_FORMATTER_END();

ENUM_FORMATTER_BEGIN(mdnscout::discovery_status_e);
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_status_e::OK, "OK");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_status_e::BUSY, "BUSY");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_status_e::NO_INTERFACES,
                       "NO_INTERFACES");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_status_e::CANCELLED, "CANCELLED");
ENUM_FORMATTER_ELEMENT(mdnscout::discovery_status_e::FAILED, "FAILED");
ENUM_FORMATTER_END();

ENUM_FORMATTER_BEGIN(mdnscout::collect_end_e);
ENUM_FORMATTER_ELEMENT(mdnscout::collect_end_e::PLATEAU, "PLATEAU");
ENUM_FORMATTER_ELEMENT(mdnscout::collect_end_e::TIMEOUT, "TIMEOUT");
ENUM_FORMATTER_ELEMENT(mdnscout::collect_end_e::CANCELLED, "CANCELLED");
ENUM_FORMATTER_END();

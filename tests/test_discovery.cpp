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
#include "./test_case.hpp"
#include "./test_utils.hpp"
#include <atomic>
#include <iostream>
#include <mdnscout/discovery.hpp>
#include <mdnscout/response_listener.hpp>
#include <sstream>
#include <thread>

using namespace std::chrono_literals;
using mdnscout::discovered_device_t;
using mdnscout::discovery_state_e;
using mdnscout::discovery_status_e;
using mdnscout::discovery_t;
using mdnscout::network_address_t;

/// Small timings so a session takes about a second
static mdnscout::settings_t fast_settings() {
  mdnscout::settings_t settings;
  settings.session_timeout = 5s;
  settings.poll_interval = 100ms;
  settings.plateau_min_elapsed = 1s;
  settings.plateau_stable_polls = 3;
  settings.receive_timeout = 100ms;
  settings.send_timeout = 100ms;
  settings.listener_exit_timeout = 1s;
  settings.teardown_grace = 100ms;
  settings.phase_bursts = 1;
  settings.burst_interval = 10ms;
  settings.service_set = mdnscout::service_set_e::LIGHTWEIGHT;
  return settings;
}

static discovery_t::network_factory_t
loopback_factory(const test_responder_t &responder,
                 std::set<std::string> local = {"0.0.0.0", "127.0.0.2"}) {
  auto address = responder.address();
  return [address, local] {
    return std::make_unique<loopback_network_manager_t>(address, local);
  };
}

static discovered_device_t online(const std::string &ip) {
  discovered_device_t device;
  device.ip_address = ip;
  device.is_online = true;
  return device;
}

void test_plateau_detector() {
  mdnscout::plateau_detector_t plateau(1s, 3);
  ASSERT_FALSE(plateau.update(1, 100ms));
  ASSERT_FALSE(plateau.update(1, 200ms));
  ASSERT_FALSE(plateau.update(1, 300ms));
  // Stable long enough, but too early
  ASSERT_FALSE(plateau.update(1, 400ms));
  ASSERT_EQUAL(plateau.get_stable_polls(), 3);
  ASSERT_TRUE(plateau.update(1, 1000ms));

  // A new device resets the count
  ASSERT_FALSE(plateau.update(2, 1100ms));
  ASSERT_EQUAL(plateau.get_stable_polls(), 0);
  ASSERT_FALSE(plateau.update(2, 1200ms));
  ASSERT_FALSE(plateau.update(1, 1300ms));
  ASSERT_TRUE(plateau.update(2, 1400ms));
}

void test_collect_until_plateau() {
  auto settings = fast_settings();
  settings.plateau_min_elapsed = 300ms;
  mdnscout::cancel_source_t cancel;

  // Count stops growing: ends early
  size_t polls = 0;
  auto start = std::chrono::steady_clock::now();
  auto end = mdnscout::collect_until_plateau(
      [&polls] { return std::min<size_t>(++polls, 2); }, settings,
      cancel.token());
  ASSERT_EQUAL(end, mdnscout::collect_end_e::PLATEAU);
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 2s);
  ASSERT_GTE(polls, 4);

  // Always growing: hits the ceiling
  settings.session_timeout = 500ms;
  polls = 0;
  std::vector<size_t> seen;
  start = std::chrono::steady_clock::now();
  end = mdnscout::collect_until_plateau(
      [&polls] { return ++polls; }, settings, cancel.token(),
      [&seen](std::chrono::milliseconds, size_t count) {
        seen.push_back(count);
      });
  ASSERT_EQUAL(end, mdnscout::collect_end_e::TIMEOUT);
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1500ms);
  ASSERT_EQUAL(seen.size(), polls);

  // Cancelled
  settings.session_timeout = 10s;
  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(200ms);
    cancel.cancel();
  });
  polls = 0;
  end = mdnscout::collect_until_plateau([&polls] { return ++polls; },
                                        settings, cancel.token());
  canceller.join();
  ASSERT_EQUAL(end, mdnscout::collect_end_e::CANCELLED);
}

void test_filter_results() {
  std::vector<mdnscout::local_interface_t> interfaces = {
      {"eth0", *mdnscout::parse_ipv4("192.168.1.2"), 0xFFFFFF00}};
  std::set<std::string> local = {"192.168.1.2", "0.0.0.0"};

  auto cam = online("192.168.1.64");
  cam.name = "cam1";
  auto remote = online("10.8.0.5");
  auto self = online("192.168.1.2");
  auto offline = online("192.168.1.70");
  offline.is_online = false;
  auto second = online("192.168.1.9");

  auto cached = online("192.168.1.64");
  cached.manufacturer = "Hikvision";
  auto only_cached = online("192.168.1.100");

  auto results =
      mdnscout::filter_results({cam, remote, self, offline, second},
                               {cached, only_cached}, local, interfaces,
                               std::nullopt);
  ASSERT_EQUAL(results.size(), 4);
  ASSERT_EQUAL(results[0].ip_address, "10.8.0.5");
  ASSERT_EQUAL(results[1].ip_address, "192.168.1.9");
  ASSERT_EQUAL(results[2].ip_address, "192.168.1.64");
  ASSERT_EQUAL(results[3].ip_address, "192.168.1.100");

  ASSERT_CONTAINS(results[0].capabilities, "Cross-subnet (passive)");
  ASSERT_EQUAL(results[1].capabilities.count("Cross-subnet (passive)"), 0);
  // Session data wins, cache fills the gaps
  ASSERT_EQUAL(results[2].name, "cam1");
  ASSERT_EQUAL(results[2].manufacturer, "Hikvision");

  auto segment = mdnscout::network_segment_t::parse("192.168.1.0/26");
  results = mdnscout::filter_results({cam, remote, self, second}, {}, local,
                                     interfaces, segment);
  ASSERT_EQUAL(results.size(), 1);
  ASSERT_EQUAL(results[0].ip_address, "192.168.1.9");
}

void test_listener_handle_datagram() {
  loopback_network_manager_t network(
      *network_address_t::parse("127.0.0.1", 9));
  ASSERT_TRUE(network.initialize());
  auto settings = fast_settings();
  mdnscout::device_map_t devices;
  mdnscout::device_cache_t cache;
  mdnscout::cancel_source_t cancel;
  mdnscout::response_listener_t listener(network, settings, devices, &cache,
                                         std::nullopt, cancel.token());

  int discovered = 0, updated = 0;
  auto c1 = listener.device_discovered.connect(
      [&discovered](const discovered_device_t &device,
                    const std::string &method) {
        ASSERT_EQUAL(device.ip_address, "192.168.1.64");
        ASSERT_EQUAL(method, "mDNS");
        discovered++;
      });
  auto c2 = listener.device_updated.connect(
      [&updated](const discovered_device_t &, const std::string &) {
        updated++;
      });

  mdnscout::datagram_t datagram;
  datagram.data = camera_response("192.168.1.64");
  datagram.from = *network_address_t::parse("192.168.1.64", 5353);
  listener.handle_datagram(datagram);
  listener.handle_datagram(datagram);
  ASSERT_EQUAL(discovered, 1);
  ASSERT_EQUAL(updated, 1);
  ASSERT_EQUAL(devices.count(), 1);
  ASSERT_TRUE(cache.get_device("192.168.1.64").has_value());
  ASSERT_EQUAL(cache.get_device("192.168.1.64")->manufacturer, "Hikvision");

  // Our own address
  datagram.from = *network_address_t::parse("127.0.0.2", 5353);
  datagram.data = camera_response("127.0.0.2");
  listener.handle_datagram(datagram);
  ASSERT_EQUAL(devices.count(), 1);
  ASSERT_EQUAL(listener.datagram_count(), 3);
}

void test_listener_segment_filter() {
  loopback_network_manager_t network(
      *network_address_t::parse("127.0.0.1", 9));
  ASSERT_TRUE(network.initialize());
  auto settings = fast_settings();
  mdnscout::device_map_t devices;
  mdnscout::cancel_source_t cancel;
  mdnscout::response_listener_t listener(
      network, settings, devices, nullptr,
      mdnscout::network_segment_t::parse("10.0.0.0/8"), cancel.token());

  mdnscout::datagram_t datagram;
  datagram.data = camera_response("192.168.1.64");
  datagram.from = *network_address_t::parse("192.168.1.64", 5353);
  listener.handle_datagram(datagram);
  ASSERT_EQUAL(devices.count(), 0);

  datagram.data = {0xFF, 0x00};
  datagram.from = *network_address_t::parse("10.1.1.1", 5353);
  listener.handle_datagram(datagram);
  ASSERT_EQUAL(devices.count(), 1);
  ASSERT_EQUAL(devices.get("10.1.1.1")->name, "Device-10.1.1.1");
}

void test_listener_loops_exit() {
  loopback_network_manager_t network(
      *network_address_t::parse("127.0.0.1", 9));
  ASSERT_TRUE(network.initialize());
  auto settings = fast_settings();
  mdnscout::device_map_t devices;
  mdnscout::cancel_source_t cancel;
  mdnscout::response_listener_t listener(network, settings, devices, nullptr,
                                         std::nullopt, cancel.token());
  listener.start();
  ASSERT_EQUAL(listener.loop_count(), 1);
  ASSERT_FALSE(listener.wait_exit(50ms));

  cancel.cancel();
  ASSERT_TRUE(listener.wait_exit(1s));
  listener.join();
}

void test_discover_camera() {
  test_responder_t responder(camera_response("127.0.0.1"));
  discovery_t discovery(fast_settings(), loopback_factory(responder));

  std::vector<discovered_device_t> discovered;
  std::vector<discovery_state_e> states;
  int last_progress = 0;
  auto c1 = discovery.device_discovered.connect(
      [&discovered](const discovered_device_t &device, const std::string &) {
        discovered.push_back(device);
      });
  auto c2 = discovery.state_changed.connect(
      [&states](discovery_state_e state) { states.push_back(state); });
  auto c3 = discovery.progress.connect(
      [&last_progress](int percent, const std::string &) {
        last_progress = percent;
      });

  auto result = discovery.discover();
  ASSERT_EQUAL(result.status, discovery_status_e::OK);
  ASSERT_EQUAL(result.devices.size(), 1);
  auto &device = result.devices[0];
  ASSERT_EQUAL(device.ip_address, "127.0.0.1");
  ASSERT_EQUAL(device.manufacturer, "Hikvision");
  ASSERT_EQUAL(device.model, "DS-2CD2523G0-IS");
  ASSERT_EQUAL(device.device_type, mdnscout::device_type_e::CAMERA);
  ASSERT_EQUAL(device.port, 80);
  ASSERT_EQUAL(device.capabilities.count("Cross-subnet (passive)"), 0);

  ASSERT_EQUAL(discovered.size(), 1);
  ASSERT_GT(responder.queries.load(), 0);
  ASSERT_EQUAL(last_progress, 100);
  ASSERT_EQUAL(states.front(), discovery_state_e::INITIALIZING);
  ASSERT_EQUAL(states.back(), discovery_state_e::IDLE);
  ASSERT_TRUE(std::find(states.begin(), states.end(),
                        discovery_state_e::COLLECTING) != states.end());
  ASSERT_EQUAL(discovery.get_state(), discovery_state_e::IDLE);

  ASSERT_TRUE(discovery.cache().get_device("127.0.0.1").has_value());
  discovery.wait_teardown();

  // A second session works the same, and finds it again
  auto again = discovery.discover();
  ASSERT_EQUAL(again.status, discovery_status_e::OK);
  ASSERT_EQUAL(again.devices.size(), 1);
  ASSERT_EQUAL(discovered.size(), 2);
}

void test_listener_merges_datagrams() {
  loopback_network_manager_t network(
      *network_address_t::parse("127.0.0.1", 9));
  ASSERT_TRUE(network.initialize());
  auto settings = fast_settings();
  mdnscout::device_map_t devices;
  mdnscout::cancel_source_t cancel;
  mdnscout::response_listener_t listener(network, settings, devices, nullptr,
                                         std::nullopt, cancel.token());

  mdnscout::datagram_t datagram;
  datagram.from = *network_address_t::parse("192.168.1.64", 5353);
  for (auto &data : camera_split_response("192.168.1.64")) {
    datagram.data = data;
    listener.handle_datagram(datagram);
  }
  ASSERT_EQUAL(devices.count(), 1);
  auto device = devices.get("192.168.1.64");
  ASSERT_TRUE(device.has_value());
  ASSERT_EQUAL(device->name, "cam1");
  ASSERT_EQUAL(device->discovery_data["Hostname"], "cam1.local");
  ASSERT_EQUAL(device->port, 80);
  ASSERT_EQUAL(device->device_type, mdnscout::device_type_e::CAMERA);
  ASSERT_EQUAL(device->manufacturer, "Hikvision");
}

void test_discover_split_answers() {
  test_responder_t responder(camera_split_response("127.0.0.1"));
  discovery_t discovery(fast_settings(), loopback_factory(responder));

  std::atomic<int> discovered{0}, updated{0};
  auto c1 = discovery.device_discovered.connect(
      [&discovered](const discovered_device_t &, const std::string &) {
        discovered++;
      });
  auto c2 = discovery.device_updated.connect(
      [&updated](const discovered_device_t &, const std::string &) {
        updated++;
      });

  auto result = discovery.discover();
  ASSERT_EQUAL(result.status, discovery_status_e::OK);
  ASSERT_EQUAL(result.devices.size(), 1);
  auto &device = result.devices[0];
  ASSERT_EQUAL(device.ip_address, "127.0.0.1");
  ASSERT_EQUAL(device.name, "cam1");
  ASSERT_EQUAL(device.discovery_data.at("Hostname"), "cam1.local");
  ASSERT_EQUAL(device.port, 80);
  ASSERT_EQUAL(device.device_type, mdnscout::device_type_e::CAMERA);
  ASSERT_EQUAL(discovered.load(), 1);
  ASSERT_GTE(updated.load(), 1);

  auto cached = discovery.cache().get_device("127.0.0.1");
  ASSERT_TRUE(cached.has_value());
  ASSERT_EQUAL(cached->name, "cam1");
}

void test_own_logger() {
  test_responder_t responder(camera_response("127.0.0.1"));
  std::ostringstream engine_out, global_out;
  mdnscout::logger_t engine_log;
  engine_log.set_output(&engine_out);
  mdnscout::logger2.set_output(&global_out);

  mdnscout::discovery_result_t result;
  {
    discovery_t discovery(fast_settings(), loopback_factory(responder),
                          engine_log);
    result = discovery.discover();
    discovery.wait_teardown();
  }
  mdnscout::logger2.set_output(&std::cout);

  ASSERT_EQUAL(result.devices.size(), 1);
  auto engine_text = engine_out.str();
  ASSERT_TRUE(engine_text.find("Discovered") != std::string::npos);
  ASSERT_TRUE(engine_text.find("Collection ended") != std::string::npos);
  ASSERT_TRUE(global_out.str().find("Discovered") == std::string::npos);
  ASSERT_TRUE(global_out.str().find("Collection ended") == std::string::npos);
}

void test_discover_filters_self() {
  test_responder_t responder(camera_response("127.0.0.1"));
  discovery_t discovery(
      fast_settings(),
      loopback_factory(responder, {"0.0.0.0", "127.0.0.1"}));

  auto result = discovery.discover();
  ASSERT_EQUAL(result.status, discovery_status_e::OK);
  ASSERT_TRUE(result.devices.empty());
  ASSERT_GT(responder.queries.load(), 0);
}

void test_discover_segment() {
  test_responder_t responder(camera_response("127.0.0.1"));
  discovery_t discovery(fast_settings(), loopback_factory(responder));

  auto result = discovery.discover("10.0.0.0/8");
  ASSERT_EQUAL(result.status, discovery_status_e::OK);
  ASSERT_TRUE(result.devices.empty());

  // Invalid segments are ignored
  result = discovery.discover("not a segment");
  ASSERT_EQUAL(result.status, discovery_status_e::OK);
  ASSERT_EQUAL(result.devices.size(), 1);

  result = discovery.discover("127.0.0.1");
  ASSERT_EQUAL(result.devices.size(), 1);
}

void test_discover_no_interfaces() {
  discovery_t discovery(fast_settings(), [] {
    return std::make_unique<loopback_network_manager_t>(
        *network_address_t::parse("127.0.0.1", 9),
        std::set<std::string>{}, false);
  });
  auto start = std::chrono::steady_clock::now();
  auto result = discovery.discover();
  ASSERT_EQUAL(result.status, discovery_status_e::NO_INTERFACES);
  ASSERT_TRUE(result.devices.empty());
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1s);
  ASSERT_EQUAL(discovery.get_state(), discovery_state_e::IDLE);
}

void test_discover_busy_and_cancel() {
  test_responder_t responder(camera_response("127.0.0.1"));
  auto settings = fast_settings();
  settings.plateau_min_elapsed = 30s;
  settings.session_timeout = 60s;
  discovery_t discovery(settings, loopback_factory(responder));

  mdnscout::cancel_source_t cancel;
  mdnscout::discovery_result_t first;
  std::thread runner([&discovery, &cancel, &first] {
    first = discovery.discover(cancel.token());
  });

  for (int i = 0; i < 200; i++) {
    if (discovery.get_state() == discovery_state_e::COLLECTING)
      break;
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQUAL(discovery.get_state(), discovery_state_e::COLLECTING);

  auto second = discovery.discover();
  ASSERT_EQUAL(second.status, discovery_status_e::BUSY);
  ASSERT_TRUE(second.devices.empty());

  // Give the camera time to answer, then cancel
  std::this_thread::sleep_for(500ms);
  auto start = std::chrono::steady_clock::now();
  cancel.cancel();
  runner.join();
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 2s);
  ASSERT_EQUAL(first.status, discovery_status_e::CANCELLED);
  // Partial results are kept
  ASSERT_EQUAL(first.devices.size(), 1);
  ASSERT_EQUAL(discovery.get_state(), discovery_state_e::CANCELLED);

  // Not busy anymore
  discovery.wait_teardown();
  mdnscout::cancel_source_t already;
  already.cancel();
  auto third = discovery.discover(already.token());
  ASSERT_EQUAL(third.status, discovery_status_e::CANCELLED);
}

void test_cache_expiry_signal() {
  test_responder_t responder(camera_response("127.0.0.1"));
  auto settings = fast_settings();
  settings.cache_ttl = 300ms;
  settings.cache_sweep_interval = 50ms;
  discovery_t discovery(settings, loopback_factory(responder));

  std::atomic<int> expired{0};
  auto conn = discovery.device_expired.connect(
      [&expired](const std::string &name, const std::string &address) {
        if (address == "127.0.0.1" && name == "cam1")
          expired++;
      });

  auto result = discovery.discover();
  ASSERT_EQUAL(result.devices.size(), 1);
  responder.stop();

  for (int i = 0; i < 300 && expired == 0; i++) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_GTE(expired.load(), 1);
  ASSERT_FALSE(discovery.cache().get_device("127.0.0.1").has_value());
}

void test_continuous() {
  test_responder_t responder(camera_response("127.0.0.1"));
  discovery_t discovery(fast_settings(), loopback_factory(responder));

  std::atomic<int> discovered{0};
  auto conn = discovery.device_discovered.connect(
      [&discovered](const discovered_device_t &, const std::string &) {
        discovered++;
      });

  discovery.start_continuous(100ms);
  ASSERT_TRUE(discovery.is_continuous());
  for (int i = 0; i < 800 && discovered < 2; i++) {
    std::this_thread::sleep_for(10ms);
  }
  discovery.stop_continuous();
  ASSERT_FALSE(discovery.is_continuous());
  // Once per session
  ASSERT_GTE(discovered.load(), 2);
  ASSERT_EQUAL(discovery.cache().list_valid().size(), 1);
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_plateau_detector),
      TEST(test_collect_until_plateau),
      TEST(test_filter_results),
      TEST(test_listener_handle_datagram),
      TEST(test_listener_segment_filter),
      TEST(test_listener_loops_exit),
      TEST(test_listener_merges_datagrams),
      TEST(test_discover_camera),
      TEST(test_discover_split_answers),
      TEST(test_own_logger),
      TEST(test_discover_filters_self),
      TEST(test_discover_segment),
      TEST(test_discover_no_interfaces),
      TEST(test_discover_busy_and_cancel),
      TEST(test_cache_expiry_signal),
      TEST(test_continuous),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}

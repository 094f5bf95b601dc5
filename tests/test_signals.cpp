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
#include <atomic>
#include <mdnscout/device.hpp>
#include <mdnscout/signal.hpp>
#include <memory>
#include <thread>
#include <vector>

using mdnscout::connection_t;
using mdnscout::discovered_device_t;
using mdnscout::signal_t;

void test_connection_lifetime() {
  signal_t<const discovered_device_t &, const std::string &> discovered;
  discovered_device_t device;
  device.ip_address = "192.168.1.10";

  int seen = 0;
  auto count = [&seen](const discovered_device_t &, const std::string &) {
    seen++;
  };

  // Not kept, removed at once
  {
    (void)discovered.connect(count);
    discovered(device, "mDNS");
    ASSERT_EQUAL(seen, 0);
  }

  {
    auto conn = discovered.connect(count);
    discovered(device, "mDNS");
    ASSERT_EQUAL(seen, 1);
  }
  discovered(device, "mDNS");
  ASSERT_EQUAL(seen, 1);
  ASSERT_EQUAL(discovered.count(), 0);

  // Nested scopes
  {
    seen = 0;
    auto a = discovered.connect(count);
    {
      auto b = discovered.connect(count);
      { auto c = discovered.connect(count); }
      discovered(device, "mDNS");
    }
    discovered(device, "mDNS");
    ASSERT_EQUAL(seen, 3);
  }
}

void test_connection_move() {
  signal_t<int> progress;
  int last = -1;

  connection_t<int> kept;
  {
    kept = progress.connect([&last](int value) { last = value; });
  }
  progress(10);
  ASSERT_EQUAL(last, 10);

  connection_t<int> empty;
  connection_t<int> moved(std::move(empty));
  ASSERT_FALSE(moved.is_connected());
  {
    auto conn = progress.connect([&last](int value) { last = value * 2; });
    moved = std::move(conn);
  }
  progress(20);
  ASSERT_EQUAL(last, 40);

  auto heap = std::make_unique<connection_t<int>>(std::move(moved));
  progress(30);
  ASSERT_EQUAL(last, 60);
  heap.reset();
  progress(40);
  ASSERT_EQUAL(last, 40);

  kept.disconnect();
  progress(50);
  ASSERT_EQUAL(last, 40);
}

void test_disconnect_from_callback() {
  signal_t<const std::string &, const std::string &> expired;
  int calls = 0;
  connection_t<const std::string &, const std::string &> conn;
  conn = expired.connect(
      [&calls, &conn](const std::string &, const std::string &) {
        calls++;
        conn.disconnect();
      });

  expired("cam1", "192.168.1.64");
  expired("cam1", "192.168.1.64");
  ASSERT_EQUAL(calls, 1);
}

void test_emit_from_threads() {
  signal_t<int> datagram;
  std::atomic<int> total{0};
  auto conn = datagram.connect([&total](int size) { total += size; });

  std::vector<std::thread> loops;
  for (int i = 0; i < 4; i++) {
    loops.emplace_back([&datagram] {
      for (int j = 0; j < 1000; j++) {
        datagram(1);
      }
    });
  }
  // Connect and disconnect meanwhile
  for (int i = 0; i < 100; i++) {
    auto extra = datagram.connect([](int) {});
  }
  for (auto &loop : loops) {
    loop.join();
  }
  ASSERT_EQUAL(total.load(), 4000);
  ASSERT_EQUAL(datagram.count(), 1);
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_connection_lifetime),
      TEST(test_connection_move),
      TEST(test_disconnect_from_callback),
      TEST(test_emit_from_threads),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}

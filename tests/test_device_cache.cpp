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
#include <mdnscout/device_cache.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using mdnscout::device_cache_t;
using mdnscout::discovered_device_t;

/// A clock the test moves by hand
struct fake_clock_t {
  std::shared_ptr<std::chrono::system_clock::time_point> now =
      std::make_shared<std::chrono::system_clock::time_point>(
          std::chrono::system_clock::now());

  device_cache_t::clock_fn_t fn() const {
    auto now_ = now;
    return [now_] { return *now_; };
  }
  void advance(std::chrono::milliseconds ms) { *now += ms; }
};

static discovered_device_t device(const std::string &ip,
                                  const std::string &name = "") {
  discovered_device_t ret;
  ret.ip_address = ip;
  ret.name = name;
  ret.is_online = true;
  return ret;
}

void test_expiry() {
  fake_clock_t clock;
  device_cache_t cache(5min, clock.fn());

  cache.upsert(device("192.168.1.64", "cam1"));
  ASSERT_EQUAL(cache.list_valid().size(), 1);

  clock.advance(4min);
  ASSERT_EQUAL(cache.list_valid().size(), 1);
  ASSERT_TRUE(cache.get_device("192.168.1.64").has_value());

  clock.advance(2min);
  ASSERT_EQUAL(cache.list_valid().size(), 0);
  ASSERT_FALSE(cache.get_device("192.168.1.64").has_value());
  // Still stored until swept
  ASSERT_EQUAL(cache.size(), 1);
}

void test_upsert_extends_expiry() {
  fake_clock_t clock;
  device_cache_t cache(5min, clock.fn());

  cache.upsert(device("192.168.1.64", "cam1"));
  clock.advance(4min);
  auto update = device("192.168.1.64");
  update.manufacturer = "Hikvision";
  cache.upsert(update);

  clock.advance(4min);
  auto got = cache.get_device("192.168.1.64");
  ASSERT_TRUE(got.has_value());
  ASSERT_EQUAL(got->name, "cam1");
  ASSERT_EQUAL(got->manufacturer, "Hikvision");
  ASSERT_EQUAL(cache.size(), 1);
}

void test_sweep_raises_expired() {
  fake_clock_t clock;
  device_cache_t cache(5min, clock.fn());

  std::vector<std::pair<std::string, std::string>> expired;
  auto conn = cache.device_expired.connect(
      [&expired](const std::string &name, const std::string &ip) {
        expired.emplace_back(name, ip);
      });

  cache.upsert(device("192.168.1.64", "cam1"));
  clock.advance(3min);
  cache.upsert(device("192.168.1.70"));

  ASSERT_EQUAL(cache.sweep(), 0);
  clock.advance(3min);
  ASSERT_EQUAL(cache.sweep(), 1);
  ASSERT_EQUAL(expired.size(), 1);
  ASSERT_EQUAL(expired[0].first, "cam1");
  ASSERT_EQUAL(expired[0].second, "192.168.1.64");
  ASSERT_EQUAL(cache.size(), 1);

  clock.advance(3min);
  ASSERT_EQUAL(cache.sweep(), 1);
  ASSERT_EQUAL(expired[1].first, "192.168.1.70");
  ASSERT_EQUAL(cache.size(), 0);
}

void test_background_sweeper() {
  fake_clock_t clock;
  device_cache_t cache(1s, clock.fn());
  std::atomic<int> expired{0};
  auto conn = cache.device_expired.connect(
      [&expired](const std::string &, const std::string &) { expired++; });

  cache.upsert(device("10.0.0.1"));
  cache.upsert(device("10.0.0.2"));
  clock.advance(2s);
  cache.start_sweeper(20ms);

  for (int i = 0; i < 100 && expired < 2; i++) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQUAL(expired.load(), 2);
  ASSERT_EQUAL(cache.size(), 0);
}

void test_handler_may_use_cache() {
  fake_clock_t clock;
  device_cache_t cache(1s, clock.fn());
  size_t size_in_handler = 99;
  auto conn = cache.device_expired.connect(
      [&cache, &size_in_handler](const std::string &, const std::string &) {
        size_in_handler = cache.size();
      });
  cache.upsert(device("10.0.0.1"));
  clock.advance(2s);
  cache.sweep();
  ASSERT_EQUAL(size_in_handler, 0);
}

void test_dispose() {
  device_cache_t cache;
  cache.start_sweeper(10ms);
  cache.upsert(device("10.0.0.1"));
  ASSERT_EQUAL(cache.size(), 1);

  cache.dispose();
  ASSERT_EQUAL(cache.size(), 0);
  cache.dispose();
  ASSERT_EQUAL(cache.size(), 0);
  // Not restarted after dispose
  cache.start_sweeper(10ms);
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_expiry),
      TEST(test_upsert_extends_expiry),
      TEST(test_sweep_raises_expired),
      TEST(test_background_sweeper),
      TEST(test_handler_may_use_cache),
      TEST(test_dispose),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}

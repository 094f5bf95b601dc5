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
#include "../src/cli_settings.hpp"
#include "../src/ini.hpp"
#include "./test_case.hpp"
#include <cstdio>
#include <fstream>
#include <mdnscout/exceptions.hpp>
#include <mdnscout/utils.hpp>

using namespace std::chrono_literals;
using mdnscout::cli::cli_settings_t;

void test_durations() {
  using mdnscout::cli::str_to_duration;
  ASSERT_EQUAL(str_to_duration("30").count(), 30000);
  ASSERT_EQUAL(str_to_duration("250ms").count(), 250);
  ASSERT_EQUAL(str_to_duration("10s").count(), 10000);
  ASSERT_EQUAL(str_to_duration(" 5m ").count(), 300000);
  ASSERT_EQUAL(str_to_duration("1H").count(), 3600000);

  for (auto bad : {"", "m", "5 minutes", "ten", "1.5s", "-s"}) {
    ASSERT_THROWS(mdnscout::exception, str_to_duration(bad));
  }
}

void test_values() {
  ASSERT_TRUE(mdnscout::cli::str_to_bool("yes"));
  ASSERT_TRUE(mdnscout::cli::str_to_bool("True"));
  ASSERT_FALSE(mdnscout::cli::str_to_bool("0"));
  ASSERT_EQUAL(mdnscout::cli::str_to_service_set("Security"),
               mdnscout::service_set_e::SECURITY_FOCUSED);
  ASSERT_EQUAL(mdnscout::cli::str_to_int(" 42 "), 42);

  mdnscout::settings_t settings;
  ASSERT_TRUE(mdnscout::cli::set_discovery_setting(settings, "phase_bursts",
                                                   "3"));
  ASSERT_EQUAL(settings.phase_bursts, 3);
  ASSERT_FALSE(
      mdnscout::cli::set_discovery_setting(settings, "no_such_key", "1"));
  ASSERT_THROWS(mdnscout::exception,
                mdnscout::cli::set_discovery_setting(
                    settings, "plateau_stable_polls", "0"));
  ASSERT_THROWS(mdnscout::exception, mdnscout::cli::str_to_bool("maybe"));
}

void test_argv() {
  cli_settings_t settings;
  mdnscout::cli::parse_argv({"--timeout", "90", "--segment=192.168.1.0/24",
                             "--services", "lightweight", "--ttl", "2m",
                             "--resolve-hostnames", "--continuous",
                             "--interval=30s"},
                            &settings);
  ASSERT_EQUAL(settings.discovery.session_timeout.count(), 90000);
  ASSERT_EQUAL(settings.discovery.network_segment, "192.168.1.0/24");
  ASSERT_EQUAL(settings.discovery.service_set,
               mdnscout::service_set_e::LIGHTWEIGHT);
  ASSERT_EQUAL(settings.discovery.cache_ttl.count(), 120000);
  ASSERT_TRUE(settings.discovery.resolve_hostnames);
  ASSERT_TRUE(settings.continuous);
  ASSERT_EQUAL(settings.continuous_interval.count(), 30000);

  // Untouched defaults
  ASSERT_EQUAL(settings.discovery.plateau_stable_polls, 8);
}

void test_log_level() {
  ASSERT_EQUAL(mdnscout::str_to_log_level("Debug"),
               mdnscout::logger_level_t::DEBUG);
  ASSERT_EQUAL(mdnscout::str_to_log_level("warn"),
               mdnscout::logger_level_t::WARNING);
  ASSERT_EQUAL(mdnscout::str_to_log_level("3"), mdnscout::logger_level_t::ERROR);
  ASSERT_THROWS(mdnscout::exception, mdnscout::str_to_log_level("verbose"));

  auto previous = mdnscout::logger2.get_log_level();
  cli_settings_t settings;
  mdnscout::cli::parse_argv({"--log-level", "error"}, &settings);
  ASSERT_EQUAL(settings.log_level, mdnscout::logger_level_t::ERROR);
  ASSERT_EQUAL(mdnscout::logger2.get_log_level(),
               mdnscout::logger_level_t::ERROR);
  mdnscout::logger2.set_log_level(previous);
}

void test_argv_errors() {
  cli_settings_t settings;
  ASSERT_THROWS(mdnscout::exception,
                mdnscout::cli::parse_argv({"--what"}, &settings));
  ASSERT_THROWS(mdnscout::exception,
                mdnscout::cli::parse_argv({"--timeout"}, &settings));
  ASSERT_THROWS(mdnscout::exception,
                mdnscout::cli::parse_argv({"--services", "everything"},
                                          &settings));
  ASSERT_THROWS(mdnscout::exception,
                mdnscout::cli::parse_argv({"--log-level=loud"}, &settings));
}

void test_ini_lines() {
  cli_settings_t settings;
  mdnscout::cli::IniReader reader(&settings);
  reader.parse_line("# mdnscout configuration");
  reader.parse_line("");
  reader.parse_line("[general]");
  reader.parse_line("continuous = yes ; comment");
  reader.parse_line("continuous_interval = 10m");
  reader.parse_line("[ discovery ]");
  reader.parse_line("session_timeout = 2m");
  reader.parse_line("service_set = security");
  reader.parse_line("  network_segment=10.0.0.0/8");
  reader.parse_line("max_listening_sockets = 2");

  ASSERT_TRUE(settings.continuous);
  ASSERT_EQUAL(settings.continuous_interval.count(), 600000);
  ASSERT_EQUAL(settings.discovery.session_timeout.count(), 120000);
  ASSERT_EQUAL(settings.discovery.service_set,
               mdnscout::service_set_e::SECURITY_FOCUSED);
  ASSERT_EQUAL(settings.discovery.network_segment, "10.0.0.0/8");
  ASSERT_EQUAL(settings.discovery.max_listening_sockets, 2);
}

void test_ini_errors() {
  cli_settings_t settings;
  mdnscout::cli::IniReader reader(&settings);
  reader.set_filename("test.ini");

  for (auto line : {"key = outside", "[unknown]", "[discovery", "no equal"}) {
    ASSERT_THROWS(mdnscout::ini_exception, reader.parse_line(line));
  }

  reader.parse_line("[discovery]");
  try {
    reader.parse_line("no_such_key = 1");
    FAIL("Invalid key accepted");
  } catch (const mdnscout::ini_exception &e) {
    // Position is in the message
    ASSERT_TRUE(std::string(e.what()).find("test.ini:6") != std::string::npos);
  }
  try {
    reader.parse_line("poll_interval = soon");
    FAIL("Invalid value accepted");
  } catch (const mdnscout::ini_exception &e) {
    ASSERT_TRUE(std::string(e.what()).find("test.ini:7") != std::string::npos);
  }
}

void test_load_ini() {
  auto filename =
      FMT::format("/tmp/mdnscout-test-{}.ini", mdnscout::random_uint32());
  {
    std::ofstream out(filename);
    out << "[general]\n"
        << "continuous = false\n"
        << "[discovery]\n"
        << "plateau_min_elapsed = 15s\n"
        << "resolve_hostnames = true\n";
  }
  cli_settings_t settings;
  mdnscout::cli::parse_argv({"--ini", filename, "--timeout", "1m"}, &settings);
  std::remove(filename.c_str());

  ASSERT_EQUAL(settings.discovery.plateau_min_elapsed.count(), 15000);
  ASSERT_TRUE(settings.discovery.resolve_hostnames);
  ASSERT_EQUAL(settings.discovery.session_timeout.count(), 60000);

  ASSERT_THROWS(mdnscout::exception,
                mdnscout::cli::load_ini("/nonexistent/mdnscout.ini",
                                        &settings));
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_durations),   TEST(test_values),
      TEST(test_argv),        TEST(test_argv_errors),
      TEST(test_ini_lines),   TEST(test_ini_errors),
      TEST(test_load_ini),    TEST(test_log_level),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}

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
#include <mdnscout/exceptions.hpp>
#include <mdnscout/logger.hpp>
#include <mdnscout/stringpp.hpp>
#include <string>

namespace mdnscout {
mdnscout::logger_t logger2;

static thread_local std::string thread_name = "main";

void logger_t::set_thread_name(const std::string &name) { thread_name = name; }
const std::string &logger_t::get_thread_name() { return thread_name; }

static constexpr const char *ansi_color(logger_level_t level) {
  switch (level) {
  case DEBUG:
    return "\033[1;34m";
  case WARNING:
    return "\033[1;33m";
  case ERROR:
    return "\033[1;31m";
  case INFO:
    break;
  }
  return "";
}

static constexpr const char *basename(const char *filename) {
  const char *p = filename;
  for (; *filename; filename++) {
    if (*filename == '/') {
      p = filename + 1;
    }
  }
  return p;
}

logger_t::buffer_t::iterator
logger_t::log_preamble(logger_level_t level, const char *filename, int lineno) {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  auto it = FMT::format_to(buffer.begin(), "{}", ansi_color(level));
  auto text_start = it;
  it = FMT::format_to(it, "{:>5}.{:03} [{}] {:<12.12} {}:{}", elapsed / 1000,
                      elapsed % 1000, level, thread_name, basename(filename),
                      lineno);
  // Align messages, as long as the location is not too long
  for (auto width = it - text_start; width < 56; width++) {
    *it++ = ' ';
  }
  return FMT::format_to(it, " | ");
}

void logger_t::log_postamble(buffer_t::iterator it) {
  it = FMT::format_to(it, "\033[0m");
  *it = '\0';
  *output << buffer.data() << std::endl;
}

logger_level_t str_to_log_level(const std::string &value) {
  auto lower = to_lower(trim_copy(value));
  if (lower == "0" || lower == "debug") {
    return logger_level_t::DEBUG;
  }
  if (lower == "1" || lower == "info") {
    return logger_level_t::INFO;
  }
  if (lower == "2" || lower == "warning" || lower == "warn") {
    return logger_level_t::WARNING;
  }
  if (lower == "3" || lower == "error") {
    return logger_level_t::ERROR;
  }
  throw mdnscout::exception(
      "Invalid log level value: {}. Valid values: debug, info, warning, "
      "error, or 0-3",
      value);
}

} // namespace mdnscout

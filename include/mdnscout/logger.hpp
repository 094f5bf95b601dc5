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
#include "formatterhelper.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace mdnscout {
enum logger_level_t { DEBUG, INFO, WARNING, ERROR };
}

ENUM_FORMATTER_BEGIN(mdnscout::logger_level_t);
ENUM_FORMATTER_ELEMENT(mdnscout::logger_level_t::DEBUG, "DEBUG");
ENUM_FORMATTER_ELEMENT(mdnscout::logger_level_t::INFO, "INFO ");
ENUM_FORMATTER_ELEMENT(mdnscout::logger_level_t::WARNING, "WARN ");
ENUM_FORMATTER_ELEMENT(mdnscout::logger_level_t::ERROR, "ERROR");
ENUM_FORMATTER_END();

namespace mdnscout {

/**
 * @short Line logger.
 *
 * Each line carries the time since start and the name of the thread that
 * logged it, as receive loops, the sender and the cache sweeper all log at
 * once. Threads name themselves with set_thread_name.
 *
 * logger2 is the default instance. The engine classes take a logger_t& at
 * construction and log to it; level and output belong to each instance.
 */
class logger_t {
  using buffer_t = std::array<char, 1024>;
  // we use a preallocated array to avoid any allocation on debug, so lines
  // from different receive loops must take turns on it
  buffer_t buffer;
  std::mutex buffer_mutex;
  std::atomic<logger_level_t> current_log_level{logger_level_t::INFO};
  std::ostream *output = &std::cout;
  std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

  buffer_t::iterator log_preamble(logger_level_t level, const char *filename,
                                  int lineno);
  void log_postamble(buffer_t::iterator it);

public:
  void set_log_level(logger_level_t level) { current_log_level = level; }
  logger_level_t get_log_level() const { return current_log_level; }
  /// stdout by default. The tool logs to stderr, so its table can be piped.
  void set_output(std::ostream *out) {
    std::lock_guard<std::mutex> lock(buffer_mutex);
    output = out;
  }
  static void set_thread_name(const std::string &name);
  static const std::string &get_thread_name();

  template <typename... Args>
  void log(logger_level_t level, const char *filename, int lineno,
           FMT::format_string<Args...> message, Args &&...args) {
    if (level < current_log_level) {
      return;
    }

    std::lock_guard<std::mutex> lock(buffer_mutex);
    auto it = log_preamble(level, filename, lineno);

    auto max_size = buffer.size() - (it - buffer.begin()) - 16;
    auto res =
        FMT::format_to_n(it, max_size, message, std::forward<Args>(args)...);
    it = res.out;

    log_postamble(it);
  }
};

extern mdnscout::logger_t logger2;

/// debug, info, warning or error, any case, or 0 to 3
logger_level_t str_to_log_level(const std::string &value);
} // namespace mdnscout

/**
 * Logger the macros below write to, found by unqualified lookup. A class
 * that keeps an injected logger declares a mdnscout_logger() member
 * returning it, so its member functions log there instead.
 */
inline mdnscout::logger_t &mdnscout_logger() { return mdnscout::logger2; }

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef WARNING
#undef WARNING
#endif

#ifndef LOG_LEVEL
#define LOG_LEVEL 1 // 1: debug, 2: info, 3: warning, 4: error
#endif

#if LOG_LEVEL <= 1
#define DEBUG(...)                                                             \
  mdnscout_logger().log(::mdnscout::logger_level_t::DEBUG, __FILE__, __LINE__, \
                        __VA_ARGS__)
#else
#define DEBUG(...)
#endif
#if LOG_LEVEL <= 2
#define INFO(...)                                                              \
  mdnscout_logger().log(::mdnscout::logger_level_t::INFO, __FILE__, __LINE__,  \
                        __VA_ARGS__)
#else
#define INFO(...)
#endif
#if LOG_LEVEL <= 3
#define WARNING(...)                                                           \
  mdnscout_logger().log(::mdnscout::logger_level_t::WARNING, __FILE__,         \
                        __LINE__, __VA_ARGS__)
#else
#define WARNING(...)
#endif
#if LOG_LEVEL <= 4
#define ERROR(...)                                                             \
  mdnscout_logger().log(::mdnscout::logger_level_t::ERROR, __FILE__, __LINE__, \
                        __VA_ARGS__)
#else
#define ERROR(...)
#endif

#define WARNING_RATE_LIMIT(seconds, ...)                                       \
  {                                                                            \
    static std::atomic<time_t> __warning_skip_until{0};                        \
    time_t __now = time(nullptr);                                              \
    if (__warning_skip_until.load() < __now) {                                 \
      __warning_skip_until = __now + seconds;                                  \
      WARNING(__VA_ARGS__);                                                    \
    }                                                                          \
  }

#define ERROR_ONCE(...)                                                        \
  {                                                                            \
    static std::atomic<bool> __error_once_unseen{true};                        \
    if (__error_once_unseen.exchange(false)) {                                 \
      ERROR(__VA_ARGS__);                                                      \
    }                                                                          \
  }

#define WARNING_ONCE(...)                                                      \
  {                                                                            \
    static std::atomic<bool> __warning_once_unseen{true};                      \
    if (__warning_once_unseen.exchange(false)) {                               \
      WARNING(__VA_ARGS__);                                                    \
    }                                                                          \
  }

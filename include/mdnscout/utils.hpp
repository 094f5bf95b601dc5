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

#include <cstdint>

#define NON_COPYABLE(T)                                                        \
  T(const T &) = delete;                                                       \
  T &operator=(const T &) = delete;

#define NON_MOVABLE(T)                                                         \
  T(T &&) = delete;                                                            \
  T &operator=(T &&) = delete;

#define NON_COPYABLE_NOR_MOVABLE(T)                                            \
  NON_COPYABLE(T)                                                              \
  NON_MOVABLE(T)

namespace mdnscout {
/// Random number from /dev/urandom, falls back to rand() if unavailable
uint32_t random_uint32();
/// Uniform random integer in [min, max]
uint32_t random_between(uint32_t min, uint32_t max);
} // namespace mdnscout

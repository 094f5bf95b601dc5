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
#include <errno.h>
#include <fcntl.h>
#include <mdnscout/logger.hpp>
#include <mdnscout/utils.hpp>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace mdnscout {

uint32_t random_uint32() {
  int fd = open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    WARNING_ONCE("Cannot open /dev/urandom! {}", strerror(errno));
    return rand(); // not good
  }

  uint32_t tgt = 0;
  uint8_t *p = (uint8_t *)&tgt;
  size_t n_left = sizeof tgt;

  while (n_left > 0) {
    auto rc = read(fd, p, n_left);
    if (rc <= 0) {
      ERROR("Cannot read from /dev/urandom! {}", strerror(errno));
      close(fd);
      return rand(); // not good
    }

    p += rc;
    n_left -= rc;
  }

  close(fd);
  return tgt;
}

uint32_t random_between(uint32_t min, uint32_t max) {
  if (max <= min) {
    return min;
  }
  return min + random_uint32() % (max - min + 1);
}

} // namespace mdnscout

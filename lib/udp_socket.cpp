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
#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <mdnscout/exceptions.hpp>
#include <mdnscout/logger.hpp>
#include <mdnscout/udp_socket.hpp>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace mdnscout {

udp_socket_t::user_guard_t::user_guard_t(udp_socket_t &socket)
    : socket(socket), fd(-1) {
  socket.users++;
  // Checked after counting ourselves in, so close() either sees us or we see
  // it shut down.
  if (!socket.shut_down) {
    fd = socket.fd;
  }
}

udp_socket_t::user_guard_t::~user_guard_t() {
  if (--socket.users == 0 && socket.shut_down) {
    socket.release();
  }
}

bool udp_socket_t::open(const network_address_t &address, bool reuse_address) {
  if (users > 0) {
    ERROR("{}: Can not reopen while {} operations are in progress", label,
          users.load());
    return false;
  }
  if (fd >= 0) {
    close();
  }
  shut_down = false;

  int newfd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (newfd < 0) {
    ERROR("{}: Error creating socket: {}", label, strerror(errno));
    return false;
  }

  if (reuse_address) {
    int one = 1;
    if (setsockopt(newfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
      WARNING("{}: Could not set SO_REUSEADDR: {}", label, strerror(errno));
    }
#ifdef SO_REUSEPORT
    if (setsockopt(newfd, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one)) < 0) {
      DEBUG("{}: Could not set SO_REUSEPORT: {}", label, strerror(errno));
    }
#endif
  }

  if (bind(newfd, address.get_sockaddr(), address.get_socklen()) != 0) {
    ERROR("{}: Error binding socket to {}: {}", label, address,
          strerror(errno));
    ::close(newfd);
    return false;
  }

  fd = newfd;
  DEBUG("{}: UDP socket ready at {}, fd {}", label, get_address(), newfd);
  return true;
}

bool udp_socket_t::set_multicast_ttl(int ttl) {
  uint8_t value = ttl;
  if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &value, sizeof(value)) < 0) {
    WARNING("{}: Could not set multicast TTL {}: {}", label, ttl,
            strerror(errno));
    return false;
  }
  return true;
}

bool udp_socket_t::set_multicast_loop(bool enabled) {
  uint8_t value = enabled ? 1 : 0;
  if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &value, sizeof(value)) <
      0) {
    WARNING("{}: Could not set multicast loop: {}", label, strerror(errno));
    return false;
  }
  return true;
}

bool udp_socket_t::set_multicast_interface(const network_address_t &iface) {
  in_addr addr = iface.get_in_addr();
  if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &addr, sizeof(addr)) < 0) {
    WARNING("{}: Could not set multicast interface {}: {}", label, iface.ip(),
            strerror(errno));
    return false;
  }
  return true;
}

bool udp_socket_t::join_group(const network_address_t &group,
                              const network_address_t &iface) {
  ip_mreq mreq{};
  mreq.imr_multiaddr = group.get_in_addr();
  mreq.imr_interface = iface.get_in_addr();
  if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
    WARNING("{}: Could not join {} at {}: {}", label, group.ip(), iface.ip(),
            strerror(errno));
    return false;
  }
  DEBUG("{}: Joined {} at {}", label, group.ip(), iface.ip());
  return true;
}

send_status_e udp_socket_t::sendto(const std::vector<uint8_t> &data,
                                   const network_address_t &to,
                                   std::chrono::milliseconds timeout) {
  user_guard_t guard(*this);
  int sockfd = guard.fd;
  if (sockfd < 0) {
    return send_status_e::CLOSED;
  }

  pollfd pfd{sockfd, POLLOUT, 0};
  auto ready = ::poll(&pfd, 1, timeout.count());
  if (ready == 0) {
    return send_status_e::TIMEOUT;
  }
  if (ready < 0) {
    if (errno == EINTR)
      return send_status_e::TIMEOUT;
    return shut_down ? send_status_e::CLOSED : send_status_e::FAILED;
  }

  auto res = ::sendto(sockfd, data.data(), data.size(),
                      MSG_DONTWAIT | MSG_NOSIGNAL, to.get_sockaddr(),
                      to.get_socklen());
  if (res < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return send_status_e::TIMEOUT;
    }
    if (shut_down) {
      return send_status_e::CLOSED;
    }
    WARNING_RATE_LIMIT(5, "{}: Error sending to {}. This is UDP... so just "
                          "lost! ({})",
                       label, to, strerror(errno));
    return send_status_e::FAILED;
  }
  return send_status_e::SENT;
}

recv_status_e udp_socket_t::recvfrom(datagram_t &datagram,
                                     std::chrono::milliseconds timeout) {
  user_guard_t guard(*this);
  int sockfd = guard.fd;
  if (sockfd < 0) {
    return recv_status_e::CLOSED;
  }

  pollfd pfd{sockfd, POLLIN, 0};
  auto ready = ::poll(&pfd, 1, timeout.count());
  if (ready == 0) {
    return recv_status_e::TIMEOUT;
  }
  if (ready < 0) {
    if (errno == EINTR)
      return recv_status_e::TIMEOUT;
    return shut_down ? recv_status_e::CLOSED : recv_status_e::FAILED;
  }
  if (shut_down) {
    return recv_status_e::CLOSED;
  }
  if (pfd.revents & POLLNVAL) {
    return recv_status_e::CLOSED;
  }

  std::array<uint8_t, MAX_DATAGRAM_SIZE> raw{};
  sockaddr_in cliaddr{};
  socklen_t len = sizeof(cliaddr);
  auto n = ::recvfrom(sockfd, raw.data(), raw.size(), MSG_DONTWAIT,
                      reinterpret_cast<sockaddr *>(&cliaddr), &len);
  if (n < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      return recv_status_e::TIMEOUT;
    }
    return shut_down ? recv_status_e::CLOSED : recv_status_e::FAILED;
  }
  if (shut_down) {
    return recv_status_e::CLOSED;
  }

  datagram.data.assign(raw.begin(), raw.begin() + n);
  datagram.from = network_address_t(cliaddr);
  datagram.origin = label;
  return recv_status_e::DATA;
}

bool udp_socket_t::shutdown() {
  shut_down = true;
  int sockfd = fd;
  if (sockfd < 0) {
    return false;
  }
  // UDP sockets are not connected, so ENOTCONN is expected, but pending
  // polls are woken up anyway.
  if (::shutdown(sockfd, SHUT_RDWR) < 0 && errno != ENOTCONN) {
    DEBUG("{}: shutdown failed: {}", label, strerror(errno));
    return false;
  }
  return true;
}

bool udp_socket_t::close() {
  shut_down = true;
  int sockfd = fd.exchange(-1);
  if (sockfd < 0) {
    return true;
  }
  // Wakes any poll still on it; the last user out does the real close
  if (::shutdown(sockfd, SHUT_RDWR) < 0 && errno != ENOTCONN) {
    DEBUG("{}: shutdown failed: {}", label, strerror(errno));
  }
  release_fd = sockfd;
  if (users > 0) {
    DEBUG("{}: close of fd {} delayed, {} operations in progress", label,
          sockfd, users.load());
    return true;
  }
  return release();
}

bool udp_socket_t::release() {
  int sockfd = release_fd.exchange(-1);
  if (sockfd < 0) {
    return true;
  }
  if (::close(sockfd) < 0) {
    DEBUG("{}: close failed: {}", label, strerror(errno));
    return false;
  }
  return true;
}

network_address_t udp_socket_t::get_address() const {
  int sockfd = fd;
  if (sockfd < 0) {
    return network_address_t();
  }
  try {
    return network_address_t::from_fd(sockfd);
  } catch (const network_exception &e) {
    DEBUG("{}: Can not get socket address: {}", label, e.what());
    return network_address_t();
  }
}

} // namespace mdnscout

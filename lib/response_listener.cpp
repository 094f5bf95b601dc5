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
#include <mdnscout/logger.hpp>
#include <mdnscout/response_listener.hpp>

namespace mdnscout {

static const std::string METHOD_MDNS = "mDNS";

response_listener_t::response_listener_t(
    network_manager_t &network, const settings_t &settings,
    device_map_t &devices, device_cache_t *cache,
    std::optional<network_segment_t> segment, cancel_token_t token,
    logger_t &logger)
    : logger(logger), network(network), settings(settings),
      processor(network.local_addresses()), devices(devices), cache(cache),
      segment(std::move(segment)), token(std::move(token)) {}

response_listener_t::~response_listener_t() { join(); }

void response_listener_t::start() {
  auto sockets = network.listening_sockets();
  {
    std::lock_guard<std::mutex> lock(running_mutex);
    running += sockets.size();
  }
  for (auto &socket : sockets) {
    threads.emplace_back([this, socket] {
      logger_t::set_thread_name(FMT::format("rx:{}", socket->get_label()));
      receive_loop(socket);
      {
        std::lock_guard<std::mutex> lock(running_mutex);
        running--;
      }
      running_cv.notify_all();
    });
  }
  DEBUG("Started {} receive loops", threads.size());
}

bool response_listener_t::wait_exit(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(running_mutex);
  return running_cv.wait_for(lock, timeout, [this] { return running == 0; });
}

void response_listener_t::join() {
  for (auto &thread : threads) {
    if (thread.joinable())
      thread.join();
  }
  threads.clear();
}

void response_listener_t::receive_loop(std::shared_ptr<udp_socket_t> socket) {
  DEBUG("Receive loop on {} started", socket->get_label());
  datagram_t datagram;
  // The disposed flag is checked before each receive, the manager may be
  // closing the sockets under us
  while (!token.is_cancelled() && !network.is_disposed()) {
    auto status = socket->recvfrom(datagram, settings.receive_timeout);
    switch (status) {
    case recv_status_e::DATA:
      try {
        handle_datagram(datagram);
      } catch (const std::exception &e) {
        WARNING_RATE_LIMIT(5, "Error processing datagram from {}: {}",
                           datagram.from, e.what());
      }
      break;
    case recv_status_e::TIMEOUT:
      break;
    case recv_status_e::CLOSED:
      DEBUG("Receive loop on {} ends, socket closed", socket->get_label());
      return;
    case recv_status_e::FAILED:
      if (token.is_cancelled() || network.is_disposed()) {
        return;
      }
      WARNING_RATE_LIMIT(5, "Receive error on {}, retrying",
                         socket->get_label());
      if (token.wait_for(settings.receive_error_backoff)) {
        return;
      }
      break;
    }
  }
  DEBUG("Receive loop on {} ends", socket->get_label());
}

void response_listener_t::handle_datagram(const datagram_t &datagram) {
  datagrams++;
  auto source = datagram.from.ip();
  if (processor.is_local(source)) {
    return;
  }
  if (segment && !segment->contains(datagram.from.ip_uint32())) {
    DEBUG("Ignoring {}, out of segment {}", source, *segment);
    return;
  }

  auto message = dns_message_t::decode(datagram.data);
  if (!message) {
    DEBUG("Undecodable datagram from {}, {} bytes", source,
          datagram.data.size());
  }
  for (auto &observation : processor.process(message, source, datagram.origin)) {
    auto result = devices.upsert(observation);
    if (cache) {
      cache->upsert(result.device);
    }
    if (result.is_new) {
      INFO("Discovered {}", result.device);
      device_discovered(result.device, METHOD_MDNS);
    } else {
      device_updated(result.device, METHOD_MDNS);
    }
  }
}

} // namespace mdnscout

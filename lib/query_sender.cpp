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
#include <algorithm>
#include <mdnscout/dns_message.hpp>
#include <mdnscout/logger.hpp>
#include <mdnscout/query_sender.hpp>
#include <mdnscout/utils.hpp>

namespace mdnscout {

static constexpr auto INTER_PHASE_DELAY = 50ms;
static constexpr auto MIN_BATCH_DELAY = 25ms;
static constexpr auto SWEEP_DELAY = 200ms;
static constexpr auto FOLLOW_UP_DELAY = 1s;

query_sender_t::query_sender_t(network_manager_t &network,
                               const settings_t &settings,
                               cancel_token_t token, logger_t &logger)
    : query_sender_t(network, settings, std::move(token),
                     service_phases(settings.service_set), logger) {}

query_sender_t::query_sender_t(network_manager_t &network,
                               const settings_t &settings,
                               cancel_token_t token,
                               std::vector<service_phase_t> phases,
                               logger_t &logger)
    : logger(logger), network(network), settings(settings),
      token(std::move(token)), phases(std::move(phases)) {}

send_stats_t query_sender_t::run() {
  stats = send_stats_t{};
  // Avoid all hosts on a segment querying at the same instant
  auto initial = std::chrono::milliseconds(random_between(20, 120));
  DEBUG("Query sender starts in {}ms, {} phases", initial.count(),
        phases.size());
  if (!sleep(initial)) {
    return stats;
  }

  for (size_t i = 0; i < phases.size(); i++) {
    phase_started(i, phases.size(), phases[i].name);
    if (!send_phase(phases[i])) {
      DEBUG("Query sender cancelled during phase {}", phases[i].name);
      return stats;
    }
    if (!sleep(INTER_PHASE_DELAY)) {
      return stats;
    }
  }
  send_final_sweep();
  INFO("Queries done: {}", stats);
  return stats;
}

bool query_sender_t::send_phase(const service_phase_t &phase) {
  auto batch_size = batch_size_for(phase.services.size());
  for (int burst = 0; burst < settings.phase_bursts; burst++) {
    if (burst > 0 && !sleep(settings.burst_interval)) {
      return false;
    }
    int batchn = 0;
    for (size_t start = 0; start < phase.services.size();
         start += batch_size, batchn++) {
      if (token.is_cancelled()) {
        return false;
      }
      auto end = std::min(start + batch_size, phase.services.size());
      send_batch(std::vector<std::string>(phase.services.begin() + start,
                                          phase.services.begin() + end));

      auto delay = std::max(phase.base_delay - batchn * 10ms,
                            std::chrono::milliseconds(MIN_BATCH_DELAY));
      if (!sleep(delay)) {
        return false;
      }
    }
  }
  return true;
}

bool query_sender_t::send_final_sweep() {
  for (auto &service : final_sweep_services()) {
    if (token.is_cancelled()) {
      return false;
    }
    send_batch({service});
    if (!sleep(SWEEP_DELAY)) {
      return false;
    }
  }
  if (!sleep(FOLLOW_UP_DELAY)) {
    return false;
  }
  send_batch(follow_up_services());
  return true;
}

size_t query_sender_t::send_batch(const std::vector<std::string> &services) {
  auto packet = dns_message_t::create_query(services).encode();
  auto to = network.query_destination();
  size_t written = 0;

  stats.batches++;
  for (auto &socket : network.sending_sockets()) {
    if (token.is_cancelled() || network.is_disposed()) {
      break;
    }
    auto status = socket->sendto(packet, to, settings.send_timeout);
    if (status == send_status_e::SENT) {
      written++;
      stats.sent++;
      continue;
    }
    stats.failed++;
    // Sockets closed by a teardown are expected, not worth a warning
    if (status == send_status_e::CLOSED || network.is_disposed()) {
      DEBUG("Query not sent on {}: {}", socket->get_label(), status);
    } else {
      WARNING_RATE_LIMIT(5, "Query not sent on {}: {}", socket->get_label(),
                         status);
    }
  }
  DEBUG("Sent query for {} services to {} sockets", services.size(), written);
  return written;
}

} // namespace mdnscout

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
#include "./test_utils.hpp"
#include <mdnscout/cancellation.hpp>
#include <mdnscout/networkaddress.hpp>
#include <mdnscout/query_sender.hpp>
#include <mdnscout/services.hpp>
#include <mdnscout/udp_socket.hpp>
#include <atomic>
#include <fcntl.h>
#include <thread>

using namespace std::chrono_literals;
using mdnscout::cancel_source_t;
using mdnscout::network_address_t;
using mdnscout::network_segment_t;
using mdnscout::udp_socket_t;

void test_ipv4_parse() {
  ASSERT_EQUAL(*mdnscout::parse_ipv4("192.168.1.10"), 0xC0A8010A);
  ASSERT_EQUAL(mdnscout::ipv4_to_string(0xC0A8010A), "192.168.1.10");
  ASSERT_FALSE(mdnscout::parse_ipv4("192.168.1").has_value());
  ASSERT_FALSE(mdnscout::parse_ipv4("192.168.1.256").has_value());
  ASSERT_FALSE(mdnscout::parse_ipv4("cam1.local").has_value());

  ASSERT_TRUE(mdnscout::ipv4_less("192.168.1.9", "192.168.1.10"));
  ASSERT_FALSE(mdnscout::ipv4_less("192.168.1.10", "192.168.1.9"));
  ASSERT_TRUE(mdnscout::ipv4_less("10.0.0.1", "mdns:_hap._tcp@x"));
}

void test_segment_parse() {
  auto segment = network_segment_t::parse("192.168.1.0/24");
  ASSERT_TRUE(segment.has_value());
  ASSERT_TRUE(segment->contains("192.168.1.77"));
  ASSERT_TRUE(segment->contains("192.168.1.255"));
  ASSERT_FALSE(segment->contains("192.168.2.1"));
  ASSERT_FALSE(segment->contains("not an ip"));
  ASSERT_EQUAL(segment->to_string(), "192.168.1.0/24");

  // Host bits are cleared
  segment = network_segment_t::parse(" 10.1.2.3/8 ");
  ASSERT_TRUE(segment.has_value());
  ASSERT_EQUAL(segment->to_string(), "10.0.0.0/8");
  ASSERT_TRUE(segment->contains("10.200.0.1"));

  // Single address
  segment = network_segment_t::parse("192.168.1.64");
  ASSERT_TRUE(segment.has_value());
  ASSERT_EQUAL(segment->get_prefix(), 32);
  ASSERT_TRUE(segment->contains("192.168.1.64"));
  ASSERT_FALSE(segment->contains("192.168.1.65"));

  segment = network_segment_t::parse("0.0.0.0/0");
  ASSERT_TRUE(segment.has_value());
  ASSERT_TRUE(segment->contains("8.8.8.8"));

  ASSERT_FALSE(network_segment_t::parse("192.168.1.0/33").has_value());
  ASSERT_FALSE(network_segment_t::parse("192.168.1.0/").has_value());
  ASSERT_FALSE(network_segment_t::parse("192.168.1.0/2a").has_value());
  ASSERT_FALSE(network_segment_t::parse("300.1.1.0/24").has_value());
  ASSERT_FALSE(network_segment_t::parse("").has_value());
}

void test_udp_send_receive() {
  auto loopback = *network_address_t::parse("127.0.0.1", 0);
  udp_socket_t a("a"), b("b");
  ASSERT_TRUE(a.open(loopback));
  ASSERT_TRUE(b.open(loopback));
  ASSERT_NOT_EQUAL(b.get_address().port(), 0);

  std::vector<uint8_t> data = {1, 2, 3, 4};
  ASSERT_EQUAL(a.sendto(data, b.get_address(), 100ms),
               mdnscout::send_status_e::SENT);

  mdnscout::datagram_t datagram;
  ASSERT_EQUAL(b.recvfrom(datagram, 1s), mdnscout::recv_status_e::DATA);
  ASSERT_TRUE(datagram.data == data);
  ASSERT_EQUAL(datagram.from.ip(), "127.0.0.1");
  ASSERT_EQUAL(datagram.from.port(), a.get_address().port());
}

void test_udp_timeout_and_shutdown() {
  auto loopback = *network_address_t::parse("127.0.0.1", 0);
  udp_socket_t socket("timeout");
  ASSERT_TRUE(socket.open(loopback));

  mdnscout::datagram_t datagram;
  auto start = std::chrono::steady_clock::now();
  ASSERT_EQUAL(socket.recvfrom(datagram, 50ms),
               mdnscout::recv_status_e::TIMEOUT);
  ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 40ms);

  // A shutdown from another thread wakes a pending receive
  std::thread stopper([&socket] {
    std::this_thread::sleep_for(50ms);
    socket.shutdown();
  });
  start = std::chrono::steady_clock::now();
  mdnscout::recv_status_e status = mdnscout::recv_status_e::DATA;
  while (std::chrono::steady_clock::now() - start < 2s) {
    status = socket.recvfrom(datagram, 100ms);
    if (status != mdnscout::recv_status_e::TIMEOUT)
      break;
  }
  stopper.join();
  ASSERT_EQUAL(status, mdnscout::recv_status_e::CLOSED);
  ASSERT_FALSE(socket.is_open());
  ASSERT_EQUAL(socket.sendto({1}, loopback, 10ms),
               mdnscout::send_status_e::CLOSED);

  ASSERT_TRUE(socket.close());
  ASSERT_EQUAL(socket.recvfrom(datagram, 10ms),
               mdnscout::recv_status_e::CLOSED);
}

void test_udp_close_while_receiving() {
  auto loopback = *network_address_t::parse("127.0.0.1", 0);
  udp_socket_t socket("closing");
  ASSERT_TRUE(socket.open(loopback));
  int oldfd = socket.get_fd();

  std::atomic<bool> receiving{false};
  mdnscout::recv_status_e status = mdnscout::recv_status_e::DATA;
  std::thread receiver([&socket, &receiving, &status] {
    mdnscout::datagram_t datagram;
    receiving = true;
    status = socket.recvfrom(datagram, 2s);
  });
  for (int i = 0; i < 100 && socket.user_count() == 0; i++) {
    std::this_thread::sleep_for(5ms);
  }
  ASSERT_EQUAL(socket.user_count(), 1);

  // close() wakes the receive, and the number is released after it leaves
  auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(socket.close());
  receiver.join();
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 1s);
  ASSERT_TRUE(receiving.load());
  ASSERT_EQUAL(status, mdnscout::recv_status_e::CLOSED);
  ASSERT_EQUAL(socket.user_count(), 0);
  ASSERT_EQUAL(socket.get_fd(), -1);
  ASSERT_EQUAL(fcntl(oldfd, F_GETFD), -1);

  // And it can be opened again
  ASSERT_TRUE(socket.open(loopback));
  ASSERT_TRUE(socket.is_open());
}

void test_cancellation_tree() {
  cancel_source_t root;
  cancel_source_t session(root.token());
  cancel_source_t loop(session.token());

  ASSERT_FALSE(loop.token().is_cancelled());
  session.cancel();
  ASSERT_TRUE(session.is_cancelled());
  ASSERT_TRUE(loop.token().is_cancelled());
  ASSERT_FALSE(root.is_cancelled());

  // Children of a cancelled parent start cancelled
  cancel_source_t late(session.token());
  ASSERT_TRUE(late.is_cancelled());

  cancel_source_t other(root.token());
  root.cancel();
  ASSERT_TRUE(other.is_cancelled());

  mdnscout::cancel_token_t never;
  ASSERT_FALSE(never.is_cancelled());
  ASSERT_FALSE(never.wait_for(10ms));
}

void test_cancellation_wakes_wait() {
  cancel_source_t source;
  auto token = source.token();
  ASSERT_FALSE(token.wait_for(10ms));

  std::thread canceller([&source] {
    std::this_thread::sleep_for(50ms);
    source.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(token.wait_for(10s));
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 5s);
  canceller.join();
  ASSERT_TRUE(token.wait_for(10s));
}

void test_network_manager_lifecycle() {
  loopback_network_manager_t network(
      *network_address_t::parse("127.0.0.1", 9));
  ASSERT_TRUE(network.initialize());
  ASSERT_EQUAL(network.sending_sockets().size(), 1);
  ASSERT_EQUAL(network.listening_sockets().size(), 1);
  ASSERT_TRUE(network.is_local_address("127.0.0.2"));
  ASSERT_FALSE(network.is_local_address("127.0.0.1"));
  ASSERT_TRUE(network.is_local_subnet("127.1.2.3"));
  ASSERT_FALSE(network.is_local_subnet("192.168.1.1"));
  ASSERT_EQUAL(network.query_destination().port(), 9);

  auto socket = network.listening_sockets()[0];
  network.dispose();
  ASSERT_TRUE(network.is_disposed());
  ASSERT_FALSE(socket->is_open());
  ASSERT_TRUE(network.sending_sockets().empty());
  network.dispose();
  ASSERT_FALSE(network.initialize());

  loopback_network_manager_t closed(*network_address_t::parse("127.0.0.1", 9),
                                    {}, false);
  ASSERT_FALSE(closed.initialize());
}

void test_query_sender_phase() {
  test_responder_t responder(camera_response("127.0.0.1"));
  loopback_network_manager_t network(responder.address());
  ASSERT_TRUE(network.initialize());

  mdnscout::settings_t settings;
  settings.phase_bursts = 2;
  settings.burst_interval = 10ms;
  settings.send_timeout = 100ms;
  cancel_source_t cancel;

  mdnscout::service_phase_t phase{
      "test",
      {"_http._tcp.local.", "_ipp._tcp.local.", "_onvif._tcp.local.",
       "_rtsp._tcp.local."},
      30ms};
  mdnscout::query_sender_t sender(network, settings, cancel.token(), {phase});

  ASSERT_TRUE(sender.send_phase(phase));
  // 4 services in batches of 3, twice
  ASSERT_EQUAL(sender.get_stats().batches, 4);
  ASSERT_EQUAL(sender.get_stats().sent, 4);
  ASSERT_EQUAL(sender.get_stats().failed, 0);

  for (int i = 0; i < 100 && responder.queries < 4; i++) {
    std::this_thread::sleep_for(10ms);
  }
  ASSERT_EQUAL(responder.queries.load(), 4);
}

void test_query_sender_cancelled() {
  test_responder_t responder(camera_response("127.0.0.1"));
  loopback_network_manager_t network(responder.address());
  ASSERT_TRUE(network.initialize());

  mdnscout::settings_t settings;
  cancel_source_t cancel;
  mdnscout::query_sender_t sender(network, settings, cancel.token());

  size_t phases_started = 0;
  auto conn = sender.phase_started.connect(
      [&phases_started](size_t, size_t, const std::string &) {
        phases_started++;
      });

  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(300ms);
    cancel.cancel();
  });
  auto start = std::chrono::steady_clock::now();
  auto stats = sender.run();
  canceller.join();

  // Full schedule takes many seconds, cancel stops it at the next wait
  ASSERT_TRUE(std::chrono::steady_clock::now() - start < 2s);
  ASSERT_GT(stats.sent, 0);
  ASSERT_GT(phases_started, 0);
  ASSERT_LT(phases_started,
            mdnscout::service_phases(settings.service_set).size());
}

void test_query_sender_after_dispose() {
  loopback_network_manager_t network(
      *network_address_t::parse("127.0.0.1", 9));
  ASSERT_TRUE(network.initialize());
  mdnscout::settings_t settings;
  cancel_source_t cancel;
  mdnscout::query_sender_t sender(network, settings, cancel.token());

  network.dispose();
  ASSERT_EQUAL(sender.send_batch({"_http._tcp.local."}), 0);
  ASSERT_EQUAL(sender.get_stats().failed, 0);
}

void test_service_schedule() {
  auto full = mdnscout::service_phases(mdnscout::service_set_e::FULL);
  ASSERT_EQUAL(full.size(), 11);
  ASSERT_EQUAL(full[0].name, "core");
  ASSERT_EQUAL(full[0].base_delay.count(), 50);
  for (size_t i = 1; i < full.size(); i++) {
    ASSERT_GT(full[i].base_delay.count(), full[i - 1].base_delay.count());
  }

  auto light = mdnscout::service_phases(mdnscout::service_set_e::LIGHTWEIGHT);
  ASSERT_EQUAL(light.size(), 3);
  ASSERT_EQUAL(light[2].services.size(), 5);

  auto security =
      mdnscout::service_phases(mdnscout::service_set_e::SECURITY_FOCUSED);
  ASSERT_EQUAL(security.size(), 3);
  ASSERT_EQUAL(security[2].services.size(), 8);

  ASSERT_EQUAL(mdnscout::batch_size_for(10), 3);
  ASSERT_EQUAL(mdnscout::batch_size_for(11), 4);
  ASSERT_EQUAL(mdnscout::batch_size_for(30), 5);
  ASSERT_EQUAL(mdnscout::batch_size_for(31), 6);
  ASSERT_FALSE(mdnscout::final_sweep_services().empty());
  ASSERT_FALSE(mdnscout::follow_up_services().empty());
}

int main(int argc, char **argv) {
  test_case_t testcase{
      TEST(test_ipv4_parse),
      TEST(test_segment_parse),
      TEST(test_udp_send_receive),
      TEST(test_udp_timeout_and_shutdown),
      TEST(test_udp_close_while_receiving),
      TEST(test_cancellation_tree),
      TEST(test_cancellation_wakes_wait),
      TEST(test_network_manager_lifecycle),
      TEST(test_query_sender_phase),
      TEST(test_query_sender_cancelled),
      TEST(test_query_sender_after_dispose),
      TEST(test_service_schedule),
  };

  testcase.run(argc, argv);
  return testcase.exit_code();
}

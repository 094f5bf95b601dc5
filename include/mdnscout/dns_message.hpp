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
#include "iobytes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mdnscout {

static constexpr const char *MDNS_ADDRESS = "224.0.0.251";
static constexpr uint16_t MDNS_PORT = 5353;

static constexpr size_t DNS_HEADER_SIZE = 12;
static constexpr size_t DNS_MAX_LABEL_LENGTH = 63;
static constexpr size_t DNS_MAX_NAME_LENGTH = 255;
static constexpr int DNS_MAX_COMPRESSION_JUMPS = 16;

static constexpr uint16_t DNS_FLAG_RESPONSE = 0x8000;
static constexpr uint16_t DNS_FLAG_AUTHORITATIVE = 0x0400;
static constexpr uint16_t DNS_FLAG_TRUNCATED = 0x0200;
static constexpr uint16_t DNS_FLAG_RECURSION_DESIRED = 0x0100;
static constexpr uint16_t DNS_FLAG_RECURSION_AVAILABLE = 0x0080;

static constexpr uint16_t DNS_CLASS_IN = 1;
// Top bit of the class. Cache flush on records, unicast response on questions
static constexpr uint16_t DNS_CLASS_TOP_BIT = 0x8000;
static constexpr uint16_t DNS_CLASS_MASK = 0x7FFF;

enum class dns_record_type_e : uint16_t {
  A = 1,
  NS = 2,
  CNAME = 5,
  SOA = 6,
  PTR = 12,
  MX = 15,
  TXT = 16,
  AAAA = 28,
  SRV = 33,
  NSEC = 47,
  ANY = 255,
};

/**
 * @short One question or resource record.
 *
 * Questions only use name, type and class. The payload is already decoded
 * to text, depending on the type:
 *
 *  - A: dotted quad, "192.168.1.10"
 *  - PTR, CNAME, NS: dotted name
 *  - SRV: "priority,weight,port,target"
 *  - TXT: the character strings joined with ';'
 *
 * Other types keep an empty payload.
 */
struct dns_record_t {
  std::string name;
  dns_record_type_e type = dns_record_type_e::A;
  uint16_t rclass = DNS_CLASS_IN;
  bool top_bit = false;
  uint32_t ttl = 0;
  std::string data;
};

struct srv_data_t {
  uint16_t priority = 0;
  uint16_t weight = 0;
  uint16_t port = 0;
  std::string target;
};

struct dns_message_t {
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<dns_record_t> questions;
  std::vector<dns_record_t> answers;
  std::vector<dns_record_t> authorities;
  std::vector<dns_record_t> additionals;

  bool is_response() const { return flags & DNS_FLAG_RESPONSE; }
  bool is_authoritative() const { return flags & DNS_FLAG_AUTHORITATIVE; }
  bool is_truncated() const { return flags & DNS_FLAG_TRUNCATED; }
  bool recursion_desired() const { return flags & DNS_FLAG_RECURSION_DESIRED; }
  bool recursion_available() const {
    return flags & DNS_FLAG_RECURSION_AVAILABLE;
  }
  bool empty() const {
    return questions.empty() && answers.empty() && authorities.empty() &&
           additionals.empty();
  }

  /// Answers, authorities and additionals, in wire order
  std::vector<dns_record_t> records() const;

  std::vector<uint8_t> encode() const;

  /// Returns nullopt on truncated or malformed data. Never throws.
  static std::optional<dns_message_t> decode(const uint8_t *data,
                                             size_t size);
  static std::optional<dns_message_t>
  decode(const std::vector<uint8_t> &data) {
    return decode(data.data(), data.size());
  }

  /// Question only message, id 0, as mDNS queries are.
  static dns_message_t
  create_query(const std::vector<std::string> &service_types,
               dns_record_type_e type = dns_record_type_e::PTR);
  static dns_message_t
  create_query(const std::string &service_type,
               dns_record_type_e type = dns_record_type_e::PTR) {
    return create_query(std::vector<std::string>{service_type}, type);
  }
};

std::vector<uint8_t> encode(uint16_t id, uint16_t flags,
                            const std::vector<dns_record_t> &questions,
                            const std::vector<dns_record_t> &answers);

/// Writes a dotted name as length prefixed labels. Labels longer than 63
/// bytes are dropped. Never compresses.
void write_name(io_bytes_writer &writer, const std::string_view &name);
/// Reads a possibly compressed name. Pointers are resolved against message,
/// and reader is left after the name, or after the first pointer.
std::string read_name(io_bytes_reader &reader, const io_bytes &message);

std::optional<srv_data_t> parse_srv(const std::string &data);
std::string format_srv(const srv_data_t &srv);
/// Splits TXT payload into key, value pairs. Keys without '=' get an empty
/// value.
std::vector<std::pair<std::string, std::string>>
parse_txt(const std::string &data, size_t max_pairs = 32);
/// Removes the trailing dot, if any
std::string normalize_name(const std::string_view &name);
} // namespace mdnscout

ENUM_FORMATTER_BEGIN(mdnscout::dns_record_type_e);
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::A, "A");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::NS, "NS");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::CNAME, "CNAME");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::SOA, "SOA");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::PTR, "PTR");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::MX, "MX");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::TXT, "TXT");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::AAAA, "AAAA");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::SRV, "SRV");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::NSEC, "NSEC");
ENUM_FORMATTER_ELEMENT(mdnscout::dns_record_type_e::ANY, "ANY");
ENUM_FORMATTER_DEFAULT();
ENUM_FORMATTER_END();

BASIC_FORMATTER(mdnscout::dns_record_t, "{} {} ttl={} <{}>", v.name, v.type,
                v.ttl, v.data);
VECTOR_FORMATTER(mdnscout::dns_record_t);
BASIC_FORMATTER(mdnscout::dns_message_t,
                "dns_message_t[id={} flags={:04X} qd={} an={} ns={} ar={}]",
                v.id, v.flags, v.questions.size(), v.answers.size(),
                v.authorities.size(), v.additionals.size());

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
#include <charconv>
#include <mdnscout/dns_message.hpp>
#include <mdnscout/logger.hpp>
#include <mdnscout/stringpp.hpp>

namespace mdnscout {

static constexpr uint8_t LABEL_POINTER_MASK = 0xC0;

std::string normalize_name(const std::string_view &name) {
  if (!name.empty() && name.back() == '.') {
    return std::string(name.substr(0, name.size() - 1));
  }
  return std::string(name);
}

void write_name(io_bytes_writer &writer, const std::string_view &name) {
  size_t strI = 0;
  while (strI <= name.size()) {
    auto endI = name.find('.', strI);
    if (endI == std::string_view::npos)
      endI = name.size();
    auto label = name.substr(strI, endI - strI);
    strI = endI + 1;

    if (label.empty())
      continue;
    if (label.size() > DNS_MAX_LABEL_LENGTH) {
      DEBUG("Label too long ({} bytes), dropped from name {}", label.size(),
            name);
      continue;
    }
    writer.write_uint8(label.size());
    writer.write_bytes(label);
  }
  // end of labels
  writer.write_uint8(0);
}

std::string read_name(io_bytes_reader &reader, const io_bytes &message) {
  std::string name;
  // After the first pointer we keep reading from the pointed position, but
  // the original reader must stay just after the pointer.
  io_bytes_reader jump_reader(message);
  io_bytes_reader *current = &reader;
  int jumps = 0;

  while (true) {
    uint8_t nchars = current->read_uint8();
    if (nchars == 0) {
      break;
    }
    if ((nchars & LABEL_POINTER_MASK) == LABEL_POINTER_MASK) {
      size_t offset = ((nchars & ~LABEL_POINTER_MASK) << 8);
      offset |= current->read_uint8();
      jumps++;
      if (jumps > DNS_MAX_COMPRESSION_JUMPS) {
        throw decode_exception("Too many compression pointers in name");
      }
      if (offset >= message.size()) {
        throw decode_exception("Compression pointer {} out of message ({}B)",
                               offset, message.size());
      }
      jump_reader.seek(offset);
      current = &jump_reader;
      continue;
    }
    if (nchars & LABEL_POINTER_MASK) {
      throw decode_exception("Unsupported label type {:02X}", nchars);
    }

    auto label = current->read_bytes(nchars);
    if (!name.empty())
      name += '.';
    name.append(label);
    if (name.size() > DNS_MAX_NAME_LENGTH) {
      throw decode_exception("Name too long ({}B)", name.size());
    }
  }
  return name;
}

std::optional<srv_data_t> parse_srv(const std::string &data) {
  auto parts = split(data, ',');
  if (parts.size() != 4) {
    return std::nullopt;
  }
  srv_data_t srv;
  std::array<uint16_t *, 3> fields = {&srv.priority, &srv.weight, &srv.port};
  for (size_t i = 0; i < fields.size(); i++) {
    auto &part = parts[i];
    auto res =
        std::from_chars(part.data(), part.data() + part.size(), *fields[i]);
    if (res.ec != std::errc() || res.ptr != part.data() + part.size()) {
      return std::nullopt;
    }
  }
  srv.target = parts[3];
  return srv;
}

std::string format_srv(const srv_data_t &srv) {
  return FMT::format("{},{},{},{}", srv.priority, srv.weight, srv.port,
                     srv.target);
}

std::vector<std::pair<std::string, std::string>>
parse_txt(const std::string &data, size_t max_pairs) {
  std::vector<std::pair<std::string, std::string>> ret;
  for (auto &item : split(data, ';')) {
    if (ret.size() >= max_pairs) {
      break;
    }
    auto eq = item.find('=');
    if (eq == std::string::npos) {
      ret.emplace_back(trim_copy(item), "");
    } else {
      ret.emplace_back(trim_copy(item.substr(0, eq)),
                       trim_copy(item.substr(eq + 1)));
    }
  }
  return ret;
}

static void write_rdata(io_bytes_writer &writer, const dns_record_t &record) {
  switch (record.type) {
  case dns_record_type_e::A: {
    in_addr addr{};
    if (inet_pton(AF_INET, record.data.c_str(), &addr) != 1) {
      DEBUG("Invalid A record address {}, empty payload", record.data);
      return;
    }
    writer.write_bytes(reinterpret_cast<const uint8_t *>(&addr), 4);
  } break;
  case dns_record_type_e::PTR:
  case dns_record_type_e::CNAME:
  case dns_record_type_e::NS:
    write_name(writer, record.data);
    break;
  case dns_record_type_e::SRV: {
    auto srv = parse_srv(record.data);
    if (!srv) {
      DEBUG("Invalid SRV payload {}, empty payload", record.data);
      return;
    }
    writer.write_uint16(srv->priority);
    writer.write_uint16(srv->weight);
    writer.write_uint16(srv->port);
    write_name(writer, srv->target);
  } break;
  case dns_record_type_e::TXT: {
    bool any = false;
    for (auto &item : split(record.data, ';')) {
      if (item.size() > 255) {
        DEBUG("TXT string too long ({}B), dropped", item.size());
        continue;
      }
      writer.write_uint8(item.size());
      writer.write_bytes(item);
      any = true;
    }
    // TXT must contain at least one string, even if empty
    if (!any) {
      writer.write_uint8(0);
    }
  } break;
  default:
    writer.write_bytes(record.data);
    break;
  }
}

static size_t estimate_size(const std::vector<dns_record_t> &records) {
  size_t size = 0;
  for (auto &record : records) {
    size += record.name.size() + 2 + 10 + 2 * record.data.size() + 8;
  }
  return size;
}

static void write_record(io_bytes_writer &writer, const dns_record_t &record,
                         bool is_question) {
  write_name(writer, record.name);
  writer.write_uint16(static_cast<uint16_t>(record.type));
  uint16_t rclass = record.rclass & DNS_CLASS_MASK;
  if (record.top_bit)
    rclass |= DNS_CLASS_TOP_BIT;
  writer.write_uint16(rclass);
  if (is_question)
    return;

  writer.write_uint32(record.ttl);
  auto length_pos = writer.pos();
  writer.write_uint16(0); // patched later
  write_rdata(writer, record);
  writer.write_uint16_at(length_pos, writer.pos() - length_pos - 2);
}

static std::vector<uint8_t>
encode_sections(uint16_t id, uint16_t flags,
                const std::vector<dns_record_t> &questions,
                const std::vector<dns_record_t> &answers,
                const std::vector<dns_record_t> &authorities,
                const std::vector<dns_record_t> &additionals) {
  io_bytes_managed buffer(DNS_HEADER_SIZE + estimate_size(questions) +
                          estimate_size(answers) + estimate_size(authorities) +
                          estimate_size(additionals));
  io_bytes_writer writer(buffer);

  writer.write_uint16(id);
  writer.write_uint16(flags);
  writer.write_uint16(questions.size());
  writer.write_uint16(answers.size());
  writer.write_uint16(authorities.size());
  writer.write_uint16(additionals.size());

  for (auto &question : questions)
    write_record(writer, question, true);
  for (auto &answer : answers)
    write_record(writer, answer, false);
  for (auto &authority : authorities)
    write_record(writer, authority, false);
  for (auto &additional : additionals)
    write_record(writer, additional, false);

  buffer.set_end(writer);
  return std::move(buffer.data);
}

std::vector<uint8_t> encode(uint16_t id, uint16_t flags,
                            const std::vector<dns_record_t> &questions,
                            const std::vector<dns_record_t> &answers) {
  return encode_sections(id, flags, questions, answers, {}, {});
}

std::vector<uint8_t> dns_message_t::encode() const {
  return encode_sections(id, flags, questions, answers, authorities,
                         additionals);
}

static void read_rdata(dns_record_t &record, io_bytes_reader &rdata,
                       const io_bytes &message) {
  switch (record.type) {
  case dns_record_type_e::A:
    if (rdata.remaining() == 4) {
      auto a = rdata.read_uint8();
      auto b = rdata.read_uint8();
      auto c = rdata.read_uint8();
      auto d = rdata.read_uint8();
      record.data = FMT::format("{}.{}.{}.{}", a, b, c, d);
    } else {
      DEBUG("A record for {} with {}B payload, ignored", record.name,
            rdata.remaining());
    }
    break;
  case dns_record_type_e::PTR:
  case dns_record_type_e::CNAME:
  case dns_record_type_e::NS:
    record.data = read_name(rdata, message);
    break;
  case dns_record_type_e::SRV: {
    srv_data_t srv;
    srv.priority = rdata.read_uint16();
    srv.weight = rdata.read_uint16();
    srv.port = rdata.read_uint16();
    srv.target = read_name(rdata, message);
    record.data = format_srv(srv);
  } break;
  case dns_record_type_e::TXT: {
    std::vector<std::string> parts;
    while (!rdata.at_end()) {
      auto length = rdata.read_uint8();
      auto part = rdata.read_bytes(length);
      if (!part.empty())
        parts.emplace_back(part);
    }
    record.data = join(parts, ";");
  } break;
  default:
    break;
  }
}

static dns_record_t read_record(io_bytes_reader &reader,
                                const io_bytes &message, bool is_question) {
  dns_record_t record;
  record.name = read_name(reader, message);
  record.type = static_cast<dns_record_type_e>(reader.read_uint16());
  auto rclass = reader.read_uint16();
  record.rclass = rclass & DNS_CLASS_MASK;
  record.top_bit = rclass & DNS_CLASS_TOP_BIT;
  if (is_question)
    return record;

  record.ttl = reader.read_uint32();
  auto rdlength = reader.read_uint16();
  auto rdata = reader.read_subreader(rdlength);
  // A bad payload only loses this record's data, the rest of the message is
  // still readable as rdlength is known.
  try {
    read_rdata(record, rdata, message);
  } catch (const decode_exception &e) {
    DEBUG("Invalid {} payload for {}: {}", record.type, record.name, e.what());
    record.data.clear();
  }
  return record;
}

std::optional<dns_message_t> dns_message_t::decode(const uint8_t *data,
                                                   size_t size) {
  if (size < DNS_HEADER_SIZE) {
    DEBUG("Packet too small for a DNS message ({}B)", size);
    return std::nullopt;
  }
  io_bytes_reader reader(data, size);
  io_bytes message(reader);

  dns_message_t ret;
  try {
    ret.id = reader.read_uint16();
    ret.flags = reader.read_uint16();
    auto nquestions = reader.read_uint16();
    auto nanswers = reader.read_uint16();
    auto nauthorities = reader.read_uint16();
    auto nadditionals = reader.read_uint16();

    for (int i = 0; i < nquestions; i++)
      ret.questions.push_back(read_record(reader, message, true));
    for (int i = 0; i < nanswers; i++)
      ret.answers.push_back(read_record(reader, message, false));
    for (int i = 0; i < nauthorities; i++)
      ret.authorities.push_back(read_record(reader, message, false));
    for (int i = 0; i < nadditionals; i++)
      ret.additionals.push_back(read_record(reader, message, false));
  } catch (const decode_exception &e) {
    DEBUG("Invalid DNS message: {} [{}]", e.what(), reader.to_hex());
    return std::nullopt;
  }
  return ret;
}

std::vector<dns_record_t> dns_message_t::records() const {
  std::vector<dns_record_t> ret;
  ret.reserve(answers.size() + authorities.size() + additionals.size());
  ret.insert(ret.end(), answers.begin(), answers.end());
  ret.insert(ret.end(), authorities.begin(), authorities.end());
  ret.insert(ret.end(), additionals.begin(), additionals.end());
  return ret;
}

dns_message_t
dns_message_t::create_query(const std::vector<std::string> &service_types,
                            dns_record_type_e type) {
  dns_message_t query;
  query.id = 0;
  query.flags = 0;
  for (auto &service_type : service_types) {
    dns_record_t question;
    question.name = service_type;
    question.type = type;
    question.rclass = DNS_CLASS_IN;
    query.questions.push_back(std::move(question));
  }
  return query;
}

} // namespace mdnscout

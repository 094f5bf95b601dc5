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
#include "./exceptions.hpp"
#include "logger.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic,cppcoreguidelines-pro-avoid-magic-numbers)

namespace mdnscout {
class io_bytes_reader;
class io_bytes_writer;

static constexpr uint32_t BYTE_MASK = 0x0FF;

/**
 * @short iobuffer to read and write bin data.
 *
 * It always references an external buffer, normally stack allocated or an
 * io_bytes_managed, and does NOT manage the buffer.
 *
 * Read is done with a reader, and write with a writer. All multibyte
 * integers are big endian, as in network order. Any access out of the
 * [start, end) range throws a decode_exception, so a malformed datagram can
 * never read past its own bytes.
 */
class io_bytes {
public:
  uint8_t *start = nullptr;
  uint8_t *end = nullptr;
  uint8_t *position = nullptr;

  io_bytes() {}
  ~io_bytes() = default;

  io_bytes(const io_bytes &other)
      : start(other.start), end(other.end), position(other.position) {}

  io_bytes(uint8_t *start, size_t size)
      : start(start), end(start + size), position(start) {}
  io_bytes &operator=(const io_bytes &other) = default;

  void check_enough(size_t nbytes) const {
    if (position > end || nbytes > size_t(end - position))
      throw decode_exception("Try to access end of buffer at {} (size {})",
                             (position - start) + nbytes, size());
  }
  void assert_valid_position() const {
    if (position > end || position < start)
      throw decode_exception("Invalid buffer position {}", position - start);
  }
  void skip(size_t nbytes) {
    check_enough(nbytes);
    position += nbytes;
  }
  void seek(size_t pos) {
    position = start + pos;
    assert_valid_position();
  }
  size_t size() const { return end - start; }
  size_t pos() const { return position - start; }
  size_t remaining() const { return end - position; }
  bool at_end() const { return position >= end; }

  bool compare(const io_bytes &other) const {
    if (size() != other.size())
      return false;
    return memcmp(start, other.start, size()) == 0;
  }

  /// Hex dump for logs, at most max_bytes
  std::string to_hex(size_t max_bytes = 64) const {
    std::string ret;
    auto n = std::min(size(), max_bytes);
    ret.reserve(n * 3 + 4);
    for (size_t i = 0; i < n; i++) {
      ret += FMT::format("{:02X} ", start[i] & BYTE_MASK);
    }
    if (n < size()) {
      ret += "...";
    }
    return ret;
  }
};

class io_bytes_writer : public io_bytes {
public:
  io_bytes_writer(io_bytes &other) {
    start = other.start;
    position = other.position;
    end = other.end;
  }
  io_bytes_writer(uint8_t *data, size_t size) {
    start = data;
    position = data;
    end = start + size;
  }

  void write_uint8(uint8_t n) {
    check_enough(1);
    *position++ = (n & BYTE_MASK);
  }
  void write_uint16(uint16_t n) { // NOLINT
    check_enough(2);
    *position++ = (n >> 8) & BYTE_MASK;
    *position++ = (n & BYTE_MASK);
  }
  void write_uint32(uint32_t n) {
    check_enough(4);
    *position++ = (n >> 24) & BYTE_MASK;
    *position++ = (n >> 16) & BYTE_MASK;
    *position++ = (n >> 8) & BYTE_MASK;
    *position++ = (n & BYTE_MASK);
  }

  /// Overwrites an already written uint16, for lengths only known later
  void write_uint16_at(size_t at, uint16_t n) {
    if (at + 2 > pos())
      throw exception("Can not patch uint16 at {}, only {} bytes written", at,
                      pos());
    start[at] = (n >> 8) & BYTE_MASK;
    start[at + 1] = (n & BYTE_MASK);
  }

  void write_bytes(const uint8_t *data, size_t count) {
    check_enough(count);
    memcpy(position, data, count);
    position += count;
  }
  void write_bytes(const std::string_view &view) {
    write_bytes(reinterpret_cast<const uint8_t *>(view.data()), view.size());
  }
};

class io_bytes_reader : public io_bytes {
public:
  io_bytes_reader(const io_bytes &other) {
    start = other.start;
    end = other.end;
    position = other.position;
  }
  // NOLINTNEXTLINE
  io_bytes_reader(const io_bytes_reader &other) {
    start = other.start;
    end = other.end;
    position = other.position;
  }
  // Convert a writer into a reader, seeks to the start automatically, can read
  // up to the write point.
  io_bytes_reader(const io_bytes_writer &convert) {
    start = convert.start;
    end = convert.position;
    position = convert.start;
  }
  // Readers never write, so it is safe to reference const data
  io_bytes_reader(const uint8_t *data, size_t size) {
    start = const_cast<uint8_t *>(data); // NOLINT
    position = start;
    end = start + size;
  }
  ~io_bytes_reader() = default;

  io_bytes_reader &operator=(const io_bytes_reader &other) = default;

  uint32_t read_uint32() {
    check_enough(4);
    auto data = position;
    position += 4;
    return ((uint32_t)data[0] << 24) + ((uint32_t)data[1] << 16) +
           ((uint32_t)data[2] << 8) + ((uint32_t)data[3]);
  }

  uint16_t read_uint16() {
    check_enough(2);
    auto data = position;
    position += 2;
    return ((uint16_t)data[0] << 8) + ((uint16_t)data[1]);
  }

  uint8_t read_uint8() {
    check_enough(1);
    auto data = position;
    position += 1;
    return data[0];
  }

  // The returned view is the address inside the buffer.
  std::string_view read_bytes(size_t count) {
    check_enough(count);
    std::string_view ret(reinterpret_cast<char *>(position), count);
    position += count;
    return ret;
  }

  /// A reader for the next count bytes, and skips them on this one. The
  /// subreader starts at the current position, so its size() is count.
  io_bytes_reader read_subreader(size_t count) {
    check_enough(count);
    io_bytes_reader ret(position, count);
    position += count;
    return ret;
  }
};

class io_bytes_managed : public io_bytes {
public:
  std::vector<uint8_t> data;

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init)
  io_bytes_managed(size_t size) : data(size) {
    start = data.data();
    end = data.data() + size;
    position = start;
  }
  io_bytes_managed(const io_bytes_managed &) = delete;

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init)
  io_bytes_managed(io_bytes_managed &&other) noexcept
      : data(std::move(other.data)) {
    start = other.start;
    end = other.end;
    position = other.position;
  }
  io_bytes_managed &operator=(io_bytes_managed &&other) noexcept {
    data = std::move(other.data);
    start = other.start;
    end = other.end;
    position = other.position;
    return *this;
  }
  ~io_bytes_managed() = default;

  io_bytes_managed &operator=(const io_bytes_managed &other) = delete;

  /// Shrinks the visible range to what a writer wrote so far
  void set_end(const io_bytes_writer &writer) {
    end = writer.position;
    data.resize(writer.pos());
    start = data.data();
    end = start + data.size();
    position = start;
  }
};

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic,cppcoreguidelines-pro-avoid-magic-numbers)

} // namespace mdnscout

BASIC_FORMATTER(mdnscout::io_bytes_reader,
                "[io_bytes_reader at {} of {}, {}B left]", v.pos(), v.size(),
                v.remaining());

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
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace mdnscout {
inline bool startswith(const std::string_view &str,
                       const std::string_view &maybe_start) {
  if (str.length() < maybe_start.length())
    return false;
  return std::equal(std::begin(maybe_start), std::end(maybe_start),
                    std::begin(str));
}
inline bool endswith(const std::string_view &str,
                     const std::string_view &maybe_end) {
  if (str.length() < maybe_end.length())
    return false;
  auto pos = str.length() - maybe_end.length();
  return std::equal(std::begin(str) + pos, std::end(str),
                    std::begin(maybe_end));
}

std::vector<std::string> split(const std::string &str, char delim = ' ');
std::string join(const std::vector<std::string> &parts,
                 const std::string &delim);
std::string to_lower(std::string str);
/// Case insensitive substring search
bool icontains(const std::string &haystack, const std::string_view &needle);

/// Strips leading and trailing whitespace, in place
void trim(std::string &s);
inline std::string trim_copy(std::string s) {
  trim(s);
  return s;
}
} // namespace mdnscout

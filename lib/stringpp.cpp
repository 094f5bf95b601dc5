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
#include <mdnscout/stringpp.hpp>

namespace mdnscout {
std::vector<std::string> split(std::string const &str, const char delim) {
  std::vector<std::string> ret;
  size_t I;
  size_t endI = 0;

  while ((I = str.find_first_not_of(delim, endI)) != std::string::npos) {
    endI = str.find(delim, I);
    ret.push_back(str.substr(I, endI - I));
  }
  return ret;
}

std::string join(const std::vector<std::string> &parts,
                 const std::string &delim) {
  std::string ret;
  bool first = true;
  for (auto &part : parts) {
    if (!first)
      ret += delim;
    first = false;
    ret += part;
  }
  return ret;
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return str;
}

bool icontains(const std::string &haystack, const std::string_view &needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                        });
  return it != haystack.end();
}

void trim(std::string &s) {
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
  auto first = std::find_if(s.begin(), last, not_space);
  s = std::string(first, last);
}

} // namespace mdnscout

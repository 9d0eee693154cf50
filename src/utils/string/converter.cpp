//  Copyright 2025 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>
#include <string>

#include "utils/string/convert.hpp"

namespace conv {
auto ToValidUtf8(std::string_view str) -> std::string {
  std::string out;
  out.reserve(str.size());
  utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(out));
  return out;
}

auto ToLowerAscii(std::string_view str) -> std::string {
  std::string out(str);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

auto Trim(std::string_view str) -> std::string {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  size_t begin  = 0;
  size_t end    = str.size();
  while (begin < end && is_space(static_cast<unsigned char>(str[begin]))) ++begin;
  while (end > begin && is_space(static_cast<unsigned char>(str[end - 1]))) --end;
  return std::string(str.substr(begin, end - begin));
}

auto ReplaceAll(std::string str, std::string_view from, std::string_view to) -> std::string {
  if (from.empty()) return str;
  size_t pos = 0;
  while ((pos = str.find(from, pos)) != std::string::npos) {
    str.replace(pos, from.size(), to);
    pos += to.size();
  }
  return str;
}

auto Contains(std::string_view haystack, std::string_view needle) -> bool {
  return haystack.find(needle) != std::string_view::npos;
}

auto ContainsNoCase(std::string_view haystack, std::string_view needle) -> bool {
  return ToLowerAscii(haystack).find(ToLowerAscii(needle)) != std::string::npos;
}

namespace {
auto IsDigit(char c) -> bool { return c >= '0' && c <= '9'; }

// Compare two digit runs by numeric value without overflowing on long runs
auto CompareDigitRuns(std::string_view a, std::string_view b) -> int {
  auto strip = [](std::string_view s) {
    size_t i = 0;
    while (i + 1 < s.size() && s[i] == '0') ++i;
    return s.substr(i);
  };
  auto sa = strip(a);
  auto sb = strip(b);
  if (sa.size() != sb.size()) return sa.size() < sb.size() ? -1 : 1;
  int cmp = sa.compare(sb);
  return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
}
}  // namespace

auto NaturalLess(std::string_view lhs, std::string_view rhs) -> bool {
  size_t i = 0;
  size_t j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    if (IsDigit(lhs[i]) && IsDigit(rhs[j])) {
      size_t i_end = i;
      size_t j_end = j;
      while (i_end < lhs.size() && IsDigit(lhs[i_end])) ++i_end;
      while (j_end < rhs.size() && IsDigit(rhs[j_end])) ++j_end;
      int cmp = CompareDigitRuns(lhs.substr(i, i_end - i), rhs.substr(j, j_end - j));
      if (cmp != 0) return cmp < 0;
      i = i_end;
      j = j_end;
      continue;
    }
    auto a = std::tolower(static_cast<unsigned char>(lhs[i]));
    auto b = std::tolower(static_cast<unsigned char>(rhs[j]));
    if (a != b) return a < b;
    ++i;
    ++j;
  }
  if ((lhs.size() - i) != (rhs.size() - j)) return (lhs.size() - i) < (rhs.size() - j);
  // Equal under the natural rules ("a01" vs "a1"), fall back to bytes for a strict order
  return lhs < rhs;
}

void NaturalSort(std::vector<std::string>& names) {
  std::stable_sort(names.begin(), names.end(),
                   [](const std::string& a, const std::string& b) { return NaturalLess(a, b); });
}

auto SanitizeGalleryName(std::string_view name) -> std::string {
  std::string kept;
  kept.reserve(name.size());
  for (char ch : name) {
    auto c = static_cast<unsigned char>(ch);
    if (c >= 0x80) continue;
    if (std::isalnum(c) || ch == ',' || ch == '.' || ch == '-' || ch == '_' || ch == '(' ||
        ch == ')') {
      kept.push_back(ch);
    } else if (std::isspace(c)) {
      if (kept.empty() || kept.back() != ' ') kept.push_back(' ');
    }
  }
  return Trim(kept);
}

auto UrlEncode(std::string_view str) -> std::string {
  std::string out;
  out.reserve(str.size() * 3);
  for (char ch : str) {
    auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      out.push_back(ch);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}
};  // namespace conv

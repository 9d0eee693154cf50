//  Copyright 2026 Yurun Zi
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

#include "network/cookie_file.hpp"

#include <glog/logging.h>

#include <fstream>
#include <sstream>

#include "utils/string/convert.hpp"

namespace imxup {
auto LoadNetscapeCookies(const file_path_t& file, std::string_view domain)
    -> std::vector<Cookie> {
  std::vector<Cookie> cookies;
  std::ifstream       in(file);
  if (!in) return cookies;

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    // "#HttpOnly_" prefixed lines are real cookies
    constexpr std::string_view kHttpOnly = "#HttpOnly_";
    if (line.starts_with(kHttpOnly)) {
      line.erase(0, kHttpOnly.size());
    } else if (line.empty() || line.front() == '#') {
      continue;
    }

    std::vector<std::string> fields;
    std::stringstream        ss(line);
    std::string              field;
    while (std::getline(ss, field, '\t')) fields.push_back(field);
    // domain, subdomains, path, secure, expiry, name, value
    if (fields.size() < 7) {
      VLOG(1) << "[auth] skipping malformed cookie line in " << file.string();
      continue;
    }
    auto host = conv::ToLowerAscii(fields[0]);
    if (!host.ends_with(conv::ToLowerAscii(domain))) continue;
    cookies.push_back(Cookie{fields[0], fields[5], fields[6]});
  }
  return cookies;
}
};  // namespace imxup

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

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "type/type.hpp"

namespace imxup {
struct Cookie {
  std::string domain_;
  std::string name_;
  std::string value_;
};

/**
 * @brief Read a Netscape format cookies.txt and keep the cookies whose domain ends with
 *        `domain`. A missing file gives an empty list; malformed lines are skipped.
 */
auto LoadNetscapeCookies(const file_path_t& file, std::string_view domain) -> std::vector<Cookie>;
};  // namespace imxup

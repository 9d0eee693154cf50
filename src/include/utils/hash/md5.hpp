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

#include "type/type.hpp"

namespace imxup {
/**
 * @brief Lower-case hex MD5 of a file's content. Throws std::runtime_error when the file
 *        cannot be read.
 */
auto Md5FileHex(const file_path_t& file) -> std::string;
};  // namespace imxup

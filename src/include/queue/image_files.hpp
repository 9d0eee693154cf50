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
#include <vector>

#include "queue/gallery.hpp"
#include "type/type.hpp"

namespace imxup {
/**
 * @brief Image files directly inside a folder (.jpg .jpeg .png .gif, any case), by file name in
 *        natural order. Subfolders are not descended.
 */
auto ListImageFiles(const file_path_t& folder) -> std::vector<std::string>;

auto IsImageExtension(const file_path_t& file) -> bool;

/**
 * @brief Check the leading bytes of a file against the JPEG, PNG and GIF signatures
 */
auto HasImageSignature(const file_path_t& file) -> bool;

/**
 * @brief Build unsaved GalleryFile records (sequence, name, size) for the given names
 *
 * @param first_seq sequence number of the first entry
 */
auto DescribeFiles(const file_path_t& folder, const std::vector<std::string>& names,
                   int32_t first_seq = 0) -> std::vector<GalleryFile>;
};  // namespace imxup

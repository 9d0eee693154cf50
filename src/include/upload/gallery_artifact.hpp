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

#include <json.hpp>
#include <string>
#include <vector>

#include "queue/gallery.hpp"
#include "type/type.hpp"

namespace imxup {
/**
 * @brief "<sanitized name>_<primary gallery id>.json"
 */
auto ArtifactFileName(const Gallery& gallery) -> std::string;

/**
 * @brief JSON record of an uploaded gallery: metadata plus one entry per uploaded image in
 *        gallery order
 */
auto BuildGalleryArtifact(const Gallery& gallery, const std::vector<GalleryFile>& files,
                          int32_t thumbnail_size, int32_t thumbnail_format) -> nlohmann::json;

/**
 * @brief Write the artifact into `dir` through a temporary file and a rename.
 *        Throws std::runtime_error when the file cannot be written.
 *
 * @return path of the written file
 */
auto WriteGalleryArtifact(const file_path_t& dir, const Gallery& gallery,
                          const std::vector<GalleryFile>& files, int32_t thumbnail_size,
                          int32_t thumbnail_format) -> file_path_t;
};  // namespace imxup

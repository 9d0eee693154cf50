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
#include "storage/mapper/gallery/gallery_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imxup {
class GalleryService : public ServiceInterface<GalleryService, Gallery, GalleryMapperParams,
                                               GalleryMapper, gallery_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const Gallery& source) -> GalleryMapperParams;
  static auto FromParams(GalleryMapperParams&& param) -> Gallery;

  auto        GetGalleryById(const gallery_id_t id) -> std::vector<Gallery>;
  auto        GetGalleryByPath(const file_path_t& path) -> std::vector<Gallery>;
  auto        GetGalleryByState(const GalleryState state) -> std::vector<Gallery>;
};

class GalleryFileService
    : public ServiceInterface<GalleryFileService, GalleryFile, GalleryFileMapperParams,
                              GalleryFileMapper, gallery_file_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const GalleryFile& source) -> GalleryFileMapperParams;
  static auto FromParams(GalleryFileMapperParams&& param) -> GalleryFile;

  /**
   * @brief Files of a gallery ordered by sequence number
   */
  auto        GetFilesOfGallery(const gallery_id_t gallery_id) -> std::vector<GalleryFile>;
  void        RemoveFilesOfGallery(const gallery_id_t gallery_id);
};
};  // namespace imxup

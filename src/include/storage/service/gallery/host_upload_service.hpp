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
#include "storage/mapper/gallery/host_upload_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imxup {
class HostUploadService
    : public ServiceInterface<HostUploadService, HostUploadJob, HostUploadMapperParams,
                              HostUploadMapper, host_job_id_t> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const HostUploadJob& source) -> HostUploadMapperParams;
  static auto FromParams(HostUploadMapperParams&& param) -> HostUploadJob;

  auto        GetByFilter(const HostUploadFilter& filter) -> std::vector<HostUploadJob>;
};

class UnnamedGalleryService
    : public ServiceInterface<UnnamedGalleryService, UnnamedGallery, UnnamedGalleryMapperParams,
                              UnnamedGalleryMapper, std::string> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const UnnamedGallery& source) -> UnnamedGalleryMapperParams;
  static auto FromParams(UnnamedGalleryMapperParams&& param) -> UnnamedGallery;

  void        RemoveByGalleryId(const std::string& host_gallery_id);
};
};  // namespace imxup

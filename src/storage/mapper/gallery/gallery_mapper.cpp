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

#include "storage/mapper/gallery/gallery_mapper.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <variant>

namespace imxup {
auto GalleryMapper::FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for Gallery");
  }
  RowReader           row{data, "Gallery"};
  GalleryMapperParams params;
  params.id              = row.Next<int64_t>();
  params.path            = row.Next<std::unique_ptr<std::string>>();
  params.name            = row.Next<std::unique_ptr<std::string>>();
  params.template_name   = row.Next<std::unique_ptr<std::string>>();
  params.state           = row.Next<int32_t>();
  params.paused_from     = row.Next<int32_t>();
  params.added_ts        = row.Next<int64_t>();
  params.started_ts      = row.Next<int64_t>();
  params.finished_ts     = row.Next<int64_t>();
  params.total_images    = row.Next<int32_t>();
  params.uploaded_images = row.Next<int32_t>();
  params.total_size      = row.Next<int64_t>();
  params.uploaded_bytes  = row.Next<int64_t>();
  params.final_kibps     = row.Next<double>();
  params.host_gallery_id = row.Next<std::unique_ptr<std::string>>();
  params.gallery_url     = row.Next<std::unique_ptr<std::string>>();
  params.error_kind      = row.Next<int32_t>();
  params.error_message   = row.Next<std::unique_ptr<std::string>>();
  params.ext1            = row.Next<std::unique_ptr<std::string>>();
  params.ext2            = row.Next<std::unique_ptr<std::string>>();
  params.ext3            = row.Next<std::unique_ptr<std::string>>();
  params.ext4            = row.Next<std::unique_ptr<std::string>>();
  params.custom1         = row.Next<std::unique_ptr<std::string>>();
  params.custom2         = row.Next<std::unique_ptr<std::string>>();
  params.custom3         = row.Next<std::unique_ptr<std::string>>();
  params.custom4         = row.Next<std::unique_ptr<std::string>>();
  params.insertion_order = row.Next<int64_t>();
  params.parent_id       = row.Next<int64_t>();
  params.upload_mode     = row.Next<int32_t>();
  params.archived        = row.Next<bool>();
  params.auto_start      = row.Next<bool>();
  params.min_width       = row.Next<double>();
  params.max_width       = row.Next<double>();
  params.avg_width       = row.Next<double>();
  params.min_height      = row.Next<double>();
  params.max_height      = row.Next<double>();
  params.avg_height      = row.Next<double>();
  return params;
}

auto GalleryFileMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> GalleryFileMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for GalleryFile");
  }
  RowReader row{data, "GalleryFile"};
  auto      id          = row.Next<int64_t>();
  auto      gallery_fk  = row.Next<int64_t>();
  auto      seq         = row.Next<int32_t>();
  auto      file_name   = row.Next<std::unique_ptr<std::string>>();
  auto      size_bytes  = row.Next<int64_t>();
  auto      width       = row.Next<int32_t>();
  auto      height      = row.Next<int32_t>();
  auto      uploaded    = row.Next<bool>();
  auto      uploaded_ts = row.Next<int64_t>();
  auto      image_url   = row.Next<std::unique_ptr<std::string>>();
  auto      thumb_url   = row.Next<std::unique_ptr<std::string>>();
  return {id,       gallery_fk,  seq,          std::move(file_name),
          size_bytes, width,     height,       uploaded,
          uploaded_ts, std::move(image_url), std::move(thumb_url)};
}
};  // namespace imxup

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

#include "storage/mapper/gallery/host_upload_mapper.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <variant>

namespace imxup {
auto HostUploadMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> HostUploadMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for HostUpload");
  }
  RowReader              row{data, "HostUpload"};
  HostUploadMapperParams params;
  params.id             = row.Next<int64_t>();
  params.gallery_fk     = row.Next<int64_t>();
  params.host_id        = row.Next<std::unique_ptr<std::string>>();
  params.state          = row.Next<int32_t>();
  params.retry_count    = row.Next<int32_t>();
  params.total_bytes    = row.Next<int64_t>();
  params.uploaded_bytes = row.Next<int64_t>();
  params.download_url   = row.Next<std::unique_ptr<std::string>>();
  params.file_id        = row.Next<std::unique_ptr<std::string>>();
  params.raw_response   = row.Next<std::unique_ptr<std::string>>();
  params.error_kind     = row.Next<int32_t>();
  params.error_message  = row.Next<std::unique_ptr<std::string>>();
  params.created_ts     = row.Next<int64_t>();
  params.finished_ts    = row.Next<int64_t>();
  return params;
}

auto UnnamedGalleryMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> UnnamedGalleryMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for UnnamedGallery");
  }
  auto gallery_id    = std::get_if<std::unique_ptr<std::string>>(&data[0]);
  auto intended_name = std::get_if<std::unique_ptr<std::string>>(&data[1]);
  auto discovered_ts = std::get_if<int64_t>(&data[2]);
  if (gallery_id == nullptr || intended_name == nullptr || discovered_ts == nullptr) {
    throw std::runtime_error("Encounting unmatching types when parsing the data from the DB");
  }
  return {std::move(*gallery_id), std::move(*intended_name), *discovered_ts};
}
};  // namespace imxup

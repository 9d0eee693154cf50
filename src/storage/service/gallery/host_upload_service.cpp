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

#include "storage/service/gallery/host_upload_service.hpp"

#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace imxup {
auto HostUploadService::ToParams(const HostUploadJob& source) -> HostUploadMapperParams {
  HostUploadMapperParams params;
  params.id             = source.id_;
  params.gallery_fk     = source.gallery_id_;
  params.host_id        = MakeStr(source.host_id_);
  params.state          = static_cast<int32_t>(source.state_);
  params.retry_count    = source.retry_count_;
  params.total_bytes    = source.total_bytes_;
  params.uploaded_bytes = source.uploaded_bytes_;
  params.download_url   = MakeStr(source.download_url_);
  params.file_id        = MakeStr(source.file_id_);
  params.raw_response   = MakeStr(source.raw_response_);
  params.error_kind     = static_cast<int32_t>(source.error_kind_);
  params.error_message  = MakeStr(source.error_message_);
  params.created_ts     = source.created_ts_;
  params.finished_ts    = source.finished_ts_;
  return params;
}

auto HostUploadService::FromParams(HostUploadMapperParams&& param) -> HostUploadJob {
  HostUploadJob recovered;
  recovered.id_             = param.id;
  recovered.gallery_id_     = param.gallery_fk;
  recovered.host_id_        = std::move(*param.host_id);
  recovered.state_          = static_cast<HostUploadState>(param.state);
  recovered.retry_count_    = param.retry_count;
  recovered.total_bytes_    = param.total_bytes;
  recovered.uploaded_bytes_ = param.uploaded_bytes;
  recovered.download_url_   = std::move(*param.download_url);
  recovered.file_id_        = std::move(*param.file_id);
  recovered.raw_response_   = std::move(*param.raw_response);
  recovered.error_kind_     = static_cast<ErrorKind>(param.error_kind);
  recovered.error_message_  = std::move(*param.error_message);
  recovered.created_ts_     = param.created_ts;
  recovered.finished_ts_    = param.finished_ts;
  return recovered;
}

auto HostUploadService::GetByFilter(const HostUploadFilter& filter) -> std::vector<HostUploadJob> {
  std::string predicate = "TRUE";
  if (filter.host_id_) {
    predicate += std::format(" AND host_id={}", duckorm::quote(*filter.host_id_));
  }
  if (filter.gallery_id_) {
    predicate += std::format(" AND gallery_fk={}", *filter.gallery_id_);
  }
  if (!filter.states_.empty()) {
    predicate += " AND state IN (";
    for (size_t i = 0; i < filter.states_.size(); ++i) {
      predicate += std::format("{}{}", i == 0 ? "" : ", ", static_cast<int32_t>(filter.states_[i]));
    }
    predicate += ")";
  }
  predicate += " ORDER BY id";
  return GetByPredicate(std::move(predicate));
}

auto UnnamedGalleryService::ToParams(const UnnamedGallery& source) -> UnnamedGalleryMapperParams {
  return {MakeStr(source.host_gallery_id_), MakeStr(source.intended_name_),
          source.discovered_ts_};
}

auto UnnamedGalleryService::FromParams(UnnamedGalleryMapperParams&& param) -> UnnamedGallery {
  return {std::move(*param.gallery_id), std::move(*param.intended_name), param.discovered_ts};
}

void UnnamedGalleryService::RemoveByGalleryId(const std::string& host_gallery_id) {
  RemoveByClause(std::format("gallery_id={}", duckorm::quote(host_gallery_id)));
}
};  // namespace imxup

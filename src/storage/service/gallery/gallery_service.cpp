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

#include "storage/service/gallery/gallery_service.hpp"

#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "utils/string/convert.hpp"

namespace imxup {
namespace {
constexpr int32_t kNotPaused = -1;
};  // namespace

auto GalleryService::ToParams(const Gallery& source) -> GalleryMapperParams {
  GalleryMapperParams params;
  params.id              = source.id_;
  params.path            = MakeStr(conv::ToValidUtf8(source.path_.string()));
  params.name            = MakeStr(conv::ToValidUtf8(source.name_));
  params.template_name   = MakeStr(source.template_name_);
  params.state           = static_cast<int32_t>(source.state_);
  params.paused_from =
      source.paused_from_ ? static_cast<int32_t>(*source.paused_from_) : kNotPaused;
  params.added_ts        = source.added_ts_;
  params.started_ts      = source.started_ts_;
  params.finished_ts     = source.finished_ts_;
  params.total_images    = source.total_images_;
  params.uploaded_images = source.uploaded_images_;
  params.total_size      = source.total_size_;
  params.uploaded_bytes  = source.uploaded_bytes_;
  params.final_kibps     = source.final_kibps_;
  params.host_gallery_id = MakeStr(source.host_gallery_id_);
  params.gallery_url     = MakeStr(source.gallery_url_);
  params.error_kind      = static_cast<int32_t>(source.error_kind_);
  params.error_message   = MakeStr(conv::ToValidUtf8(source.error_message_));
  params.ext1            = MakeStr(source.ext_[0]);
  params.ext2            = MakeStr(source.ext_[1]);
  params.ext3            = MakeStr(source.ext_[2]);
  params.ext4            = MakeStr(source.ext_[3]);
  params.custom1         = MakeStr(source.custom_[0]);
  params.custom2         = MakeStr(source.custom_[1]);
  params.custom3         = MakeStr(source.custom_[2]);
  params.custom4         = MakeStr(source.custom_[3]);
  params.insertion_order = source.insertion_order_;
  params.parent_id       = source.parent_id_;
  params.upload_mode     = static_cast<int32_t>(source.upload_mode_);
  params.archived        = source.archived_;
  params.auto_start      = source.auto_start_;
  params.min_width       = source.dims_.min_width_;
  params.max_width       = source.dims_.max_width_;
  params.avg_width       = source.dims_.avg_width_;
  params.min_height      = source.dims_.min_height_;
  params.max_height      = source.dims_.max_height_;
  params.avg_height      = source.dims_.avg_height_;
  return params;
}

auto GalleryService::FromParams(GalleryMapperParams&& param) -> Gallery {
  Gallery recovered;
  recovered.id_            = param.id;
  recovered.path_          = file_path_t(std::move(*param.path));
  recovered.name_          = std::move(*param.name);
  recovered.template_name_ = std::move(*param.template_name);
  recovered.state_         = static_cast<GalleryState>(param.state);
  if (param.paused_from != kNotPaused) {
    recovered.paused_from_ = static_cast<GalleryState>(param.paused_from);
  }
  recovered.added_ts_        = param.added_ts;
  recovered.started_ts_      = param.started_ts;
  recovered.finished_ts_     = param.finished_ts;
  recovered.total_images_    = param.total_images;
  recovered.uploaded_images_ = param.uploaded_images;
  recovered.total_size_      = param.total_size;
  recovered.uploaded_bytes_  = param.uploaded_bytes;
  recovered.final_kibps_     = param.final_kibps;
  recovered.host_gallery_id_ = std::move(*param.host_gallery_id);
  recovered.gallery_url_     = std::move(*param.gallery_url);
  recovered.error_kind_      = static_cast<ErrorKind>(param.error_kind);
  recovered.error_message_   = std::move(*param.error_message);
  recovered.ext_             = {std::move(*param.ext1), std::move(*param.ext2),
                                std::move(*param.ext3), std::move(*param.ext4)};
  recovered.custom_          = {std::move(*param.custom1), std::move(*param.custom2),
                                std::move(*param.custom3), std::move(*param.custom4)};
  recovered.insertion_order_ = param.insertion_order;
  recovered.parent_id_       = param.parent_id;
  recovered.upload_mode_     = static_cast<UploadMode>(param.upload_mode);
  recovered.archived_        = param.archived;
  recovered.auto_start_      = param.auto_start;
  recovered.dims_            = {param.min_width,  param.max_width,  param.avg_width,
                                param.min_height, param.max_height, param.avg_height};
  return recovered;
}

auto GalleryService::GetGalleryById(const gallery_id_t id) -> std::vector<Gallery> {
  std::string predicate = std::format("id={}", id);
  return GetByPredicate(std::move(predicate));
}

auto GalleryService::GetGalleryByPath(const file_path_t& path) -> std::vector<Gallery> {
  std::string predicate =
      std::format("path={} AND NOT archived", duckorm::quote(conv::ToValidUtf8(path.string())));
  return GetByPredicate(std::move(predicate));
}

auto GalleryService::GetGalleryByState(const GalleryState state) -> std::vector<Gallery> {
  std::string predicate = std::format("state={}", static_cast<int32_t>(state));
  return GetByPredicate(std::move(predicate));
}

auto GalleryFileService::ToParams(const GalleryFile& source) -> GalleryFileMapperParams {
  return {source.id_,
          source.gallery_id_,
          source.seq_,
          MakeStr(conv::ToValidUtf8(source.file_name_)),
          source.size_bytes_,
          source.width_,
          source.height_,
          source.uploaded_,
          source.uploaded_ts_,
          MakeStr(source.image_url_),
          MakeStr(source.thumb_url_)};
}

auto GalleryFileService::FromParams(GalleryFileMapperParams&& param) -> GalleryFile {
  GalleryFile recovered;
  recovered.id_          = param.id;
  recovered.gallery_id_  = param.gallery_fk;
  recovered.seq_         = param.seq;
  recovered.file_name_   = std::move(*param.file_name);
  recovered.size_bytes_  = param.size_bytes;
  recovered.width_       = param.width;
  recovered.height_      = param.height;
  recovered.uploaded_    = param.uploaded;
  recovered.uploaded_ts_ = param.uploaded_ts;
  recovered.image_url_   = std::move(*param.image_url);
  recovered.thumb_url_   = std::move(*param.thumb_url);
  return recovered;
}

auto GalleryFileService::GetFilesOfGallery(const gallery_id_t gallery_id)
    -> std::vector<GalleryFile> {
  std::string predicate = std::format("gallery_fk={} ORDER BY seq", gallery_id);
  return GetByPredicate(std::move(predicate));
}

void GalleryFileService::RemoveFilesOfGallery(const gallery_id_t gallery_id) {
  RemoveByClause(std::format("gallery_fk={}", gallery_id));
}
};  // namespace imxup

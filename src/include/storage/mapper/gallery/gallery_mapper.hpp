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

#include <array>
#include <cstdint>
#include <memory>
#include <string>

#include "storage/mapper/duckorm/duckdb_types.hpp"
#include "storage/mapper/mapper_interface.hpp"
#include "type/type.hpp"

namespace imxup {
struct GalleryMapperParams {
  int64_t                      id;
  std::unique_ptr<std::string> path;
  std::unique_ptr<std::string> name;
  std::unique_ptr<std::string> template_name;
  int32_t                      state;
  // -1 when the gallery is not paused
  int32_t                      paused_from;
  int64_t                      added_ts;
  int64_t                      started_ts;
  int64_t                      finished_ts;
  int32_t                      total_images;
  int32_t                      uploaded_images;
  int64_t                      total_size;
  int64_t                      uploaded_bytes;
  double                       final_kibps;
  std::unique_ptr<std::string> host_gallery_id;
  std::unique_ptr<std::string> gallery_url;
  int32_t                      error_kind;
  std::unique_ptr<std::string> error_message;
  std::unique_ptr<std::string> ext1;
  std::unique_ptr<std::string> ext2;
  std::unique_ptr<std::string> ext3;
  std::unique_ptr<std::string> ext4;
  std::unique_ptr<std::string> custom1;
  std::unique_ptr<std::string> custom2;
  std::unique_ptr<std::string> custom3;
  std::unique_ptr<std::string> custom4;
  int64_t                      insertion_order;
  int64_t                      parent_id;
  int32_t                      upload_mode;
  bool                         archived;
  bool                         auto_start;
  double                       min_width;
  double                       max_width;
  double                       avg_width;
  double                       min_height;
  double                       max_height;
  double                       avg_height;
};

class GalleryMapper : public MapperInterface<GalleryMapper, GalleryMapperParams, gallery_id_t>,
                      public FieldReflectable<GalleryMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 37;
  static constexpr const char*                                      _table_name       = "Gallery";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(GalleryMapperParams, id, INT64),
      FIELD(GalleryMapperParams, path, VARCHAR),
      FIELD(GalleryMapperParams, name, VARCHAR),
      FIELD(GalleryMapperParams, template_name, VARCHAR),
      FIELD(GalleryMapperParams, state, INT32),
      FIELD(GalleryMapperParams, paused_from, INT32),
      FIELD(GalleryMapperParams, added_ts, INT64),
      FIELD(GalleryMapperParams, started_ts, INT64),
      FIELD(GalleryMapperParams, finished_ts, INT64),
      FIELD(GalleryMapperParams, total_images, INT32),
      FIELD(GalleryMapperParams, uploaded_images, INT32),
      FIELD(GalleryMapperParams, total_size, INT64),
      FIELD(GalleryMapperParams, uploaded_bytes, INT64),
      FIELD(GalleryMapperParams, final_kibps, DOUBLE),
      FIELD(GalleryMapperParams, host_gallery_id, VARCHAR),
      FIELD(GalleryMapperParams, gallery_url, VARCHAR),
      FIELD(GalleryMapperParams, error_kind, INT32),
      FIELD(GalleryMapperParams, error_message, VARCHAR),
      FIELD(GalleryMapperParams, ext1, VARCHAR),
      FIELD(GalleryMapperParams, ext2, VARCHAR),
      FIELD(GalleryMapperParams, ext3, VARCHAR),
      FIELD(GalleryMapperParams, ext4, VARCHAR),
      FIELD(GalleryMapperParams, custom1, VARCHAR),
      FIELD(GalleryMapperParams, custom2, VARCHAR),
      FIELD(GalleryMapperParams, custom3, VARCHAR),
      FIELD(GalleryMapperParams, custom4, VARCHAR),
      FIELD(GalleryMapperParams, insertion_order, INT64),
      FIELD(GalleryMapperParams, parent_id, INT64),
      FIELD(GalleryMapperParams, upload_mode, INT32),
      FIELD(GalleryMapperParams, archived, BOOLEAN),
      FIELD(GalleryMapperParams, auto_start, BOOLEAN),
      FIELD(GalleryMapperParams, min_width, DOUBLE),
      FIELD(GalleryMapperParams, max_width, DOUBLE),
      FIELD(GalleryMapperParams, avg_width, DOUBLE),
      FIELD(GalleryMapperParams, min_height, DOUBLE),
      FIELD(GalleryMapperParams, max_height, DOUBLE),
      FIELD(GalleryMapperParams, avg_height, DOUBLE)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryMapperParams;
  friend struct FieldReflectable<GalleryMapper>;
  using MapperInterface::MapperInterface;
};

// CREATE TABLE GalleryFile (id BIGINT PRIMARY KEY, gallery_fk BIGINT, seq INTEGER, file_name TEXT,
// size_bytes BIGINT, width INTEGER, height INTEGER, uploaded BOOLEAN, uploaded_ts BIGINT,
// image_url TEXT, thumb_url TEXT);
struct GalleryFileMapperParams {
  int64_t                      id;
  int64_t                      gallery_fk;
  int32_t                      seq;
  std::unique_ptr<std::string> file_name;
  int64_t                      size_bytes;
  int32_t                      width;
  int32_t                      height;
  bool                         uploaded;
  int64_t                      uploaded_ts;
  std::unique_ptr<std::string> image_url;
  std::unique_ptr<std::string> thumb_url;
};

class GalleryFileMapper
    : public MapperInterface<GalleryFileMapper, GalleryFileMapperParams, gallery_file_id_t>,
      public FieldReflectable<GalleryFileMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 11;
  static constexpr const char*                                      _table_name       = "GalleryFile";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(GalleryFileMapperParams, id, INT64),
      FIELD(GalleryFileMapperParams, gallery_fk, INT64),
      FIELD(GalleryFileMapperParams, seq, INT32),
      FIELD(GalleryFileMapperParams, file_name, VARCHAR),
      FIELD(GalleryFileMapperParams, size_bytes, INT64),
      FIELD(GalleryFileMapperParams, width, INT32),
      FIELD(GalleryFileMapperParams, height, INT32),
      FIELD(GalleryFileMapperParams, uploaded, BOOLEAN),
      FIELD(GalleryFileMapperParams, uploaded_ts, INT64),
      FIELD(GalleryFileMapperParams, image_url, VARCHAR),
      FIELD(GalleryFileMapperParams, thumb_url, VARCHAR)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> GalleryFileMapperParams;
  friend struct FieldReflectable<GalleryFileMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup

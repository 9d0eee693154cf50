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
// CREATE TABLE HostUpload (id BIGINT PRIMARY KEY, gallery_fk BIGINT, host_id TEXT, state INTEGER,
// retry_count INTEGER, total_bytes BIGINT, uploaded_bytes BIGINT, download_url TEXT, file_id TEXT,
// raw_response TEXT, error_kind INTEGER, error_message TEXT, created_ts BIGINT, finished_ts BIGINT);
struct HostUploadMapperParams {
  int64_t                      id;
  int64_t                      gallery_fk;
  std::unique_ptr<std::string> host_id;
  int32_t                      state;
  int32_t                      retry_count;
  int64_t                      total_bytes;
  int64_t                      uploaded_bytes;
  std::unique_ptr<std::string> download_url;
  std::unique_ptr<std::string> file_id;
  std::unique_ptr<std::string> raw_response;
  int32_t                      error_kind;
  std::unique_ptr<std::string> error_message;
  int64_t                      created_ts;
  int64_t                      finished_ts;
};

class HostUploadMapper
    : public MapperInterface<HostUploadMapper, HostUploadMapperParams, host_job_id_t>,
      public FieldReflectable<HostUploadMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 14;
  static constexpr const char*                                      _table_name       = "HostUpload";
  static constexpr const char*                                      _prime_key_clause = "id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(HostUploadMapperParams, id, INT64),
      FIELD(HostUploadMapperParams, gallery_fk, INT64),
      FIELD(HostUploadMapperParams, host_id, VARCHAR),
      FIELD(HostUploadMapperParams, state, INT32),
      FIELD(HostUploadMapperParams, retry_count, INT32),
      FIELD(HostUploadMapperParams, total_bytes, INT64),
      FIELD(HostUploadMapperParams, uploaded_bytes, INT64),
      FIELD(HostUploadMapperParams, download_url, VARCHAR),
      FIELD(HostUploadMapperParams, file_id, VARCHAR),
      FIELD(HostUploadMapperParams, raw_response, VARCHAR),
      FIELD(HostUploadMapperParams, error_kind, INT32),
      FIELD(HostUploadMapperParams, error_message, VARCHAR),
      FIELD(HostUploadMapperParams, created_ts, INT64),
      FIELD(HostUploadMapperParams, finished_ts, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> HostUploadMapperParams;
  friend struct FieldReflectable<HostUploadMapper>;
  using MapperInterface::MapperInterface;
};

// CREATE TABLE UnnamedGallery (gallery_id TEXT PRIMARY KEY, intended_name TEXT,
// discovered_ts BIGINT);
struct UnnamedGalleryMapperParams {
  std::unique_ptr<std::string> gallery_id;
  std::unique_ptr<std::string> intended_name;
  int64_t                      discovered_ts;
};

class UnnamedGalleryMapper
    : public MapperInterface<UnnamedGalleryMapper, UnnamedGalleryMapperParams, std::string>,
      public FieldReflectable<UnnamedGalleryMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 3;
  static constexpr const char*                                      _table_name       = "UnnamedGallery";
  // Callers pass the id through duckorm::quote
  static constexpr const char*                                      _prime_key_clause = "gallery_id={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(UnnamedGalleryMapperParams, gallery_id, VARCHAR),
      FIELD(UnnamedGalleryMapperParams, intended_name, VARCHAR),
      FIELD(UnnamedGalleryMapperParams, discovered_ts, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> UnnamedGalleryMapperParams;
  friend struct FieldReflectable<UnnamedGalleryMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup

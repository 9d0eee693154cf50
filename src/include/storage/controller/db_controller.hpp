//  Copyright 2025 Yurun Zi
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

#include <duckdb.h>

#include <filesystem>
#include <string>

#include "controller_types.hpp"
#include "type/type.hpp"

namespace imxup {
class DBController {
 private:
  duckdb_database              _db = nullptr;

  file_path_t                  _db_path;

  bool                         _initialized;

  constexpr static const char* init_table_query =
      "CREATE SEQUENCE IF NOT EXISTS gallery_id_seq START 1;"
      "CREATE SEQUENCE IF NOT EXISTS gallery_file_id_seq START 1;"
      "CREATE SEQUENCE IF NOT EXISTS host_upload_id_seq START 1;"
      "CREATE TABLE IF NOT EXISTS Gallery (id BIGINT PRIMARY KEY, path TEXT, name TEXT, "
      "template_name TEXT, state INTEGER, paused_from INTEGER, added_ts BIGINT, started_ts BIGINT, "
      "finished_ts BIGINT, total_images INTEGER, uploaded_images INTEGER, total_size BIGINT, "
      "uploaded_bytes BIGINT, final_kibps DOUBLE, host_gallery_id TEXT, gallery_url TEXT, "
      "error_kind INTEGER, error_message TEXT, ext1 TEXT, ext2 TEXT, ext3 TEXT, ext4 TEXT, "
      "custom1 TEXT, custom2 TEXT, custom3 TEXT, custom4 TEXT, insertion_order BIGINT, "
      "parent_id BIGINT, upload_mode INTEGER, archived BOOLEAN, auto_start BOOLEAN, "
      "min_width DOUBLE, max_width DOUBLE, avg_width DOUBLE, min_height DOUBLE, max_height DOUBLE, "
      "avg_height DOUBLE);"
      "CREATE TABLE IF NOT EXISTS GalleryFile (id BIGINT PRIMARY KEY, gallery_fk BIGINT, seq "
      "INTEGER, file_name TEXT, size_bytes BIGINT, width INTEGER, height INTEGER, uploaded "
      "BOOLEAN, uploaded_ts BIGINT, image_url TEXT, thumb_url TEXT);"
      "CREATE TABLE IF NOT EXISTS HostUpload (id BIGINT PRIMARY KEY, gallery_fk BIGINT, host_id "
      "TEXT, state INTEGER, retry_count INTEGER, total_bytes BIGINT, uploaded_bytes BIGINT, "
      "download_url TEXT, file_id TEXT, raw_response TEXT, error_kind INTEGER, error_message TEXT, "
      "created_ts BIGINT, finished_ts BIGINT);"
      "CREATE TABLE IF NOT EXISTS UnnamedGallery (gallery_id TEXT PRIMARY KEY, intended_name TEXT, "
      "discovered_ts BIGINT);"
      "CREATE TABLE IF NOT EXISTS HostMetrics (host_name TEXT, period_type TEXT, period_date TEXT, "
      "bytes_uploaded BIGINT, files_uploaded BIGINT, files_failed BIGINT, transfer_seconds DOUBLE, "
      "peak_speed DOUBLE, updated_ts BIGINT, PRIMARY KEY (host_name, period_type, period_date));";

 public:
  explicit DBController(const file_path_t& db_path);
  ~DBController();

  DBController(const DBController&)            = delete;
  DBController& operator=(const DBController&) = delete;

  void InitializeDB();

  auto GetConnectionGuard() -> ConnectionGuard;
  auto GetDBPath() const -> const file_path_t& { return _db_path; }
};
};  // namespace imxup

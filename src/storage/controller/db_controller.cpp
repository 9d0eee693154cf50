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

#include "storage/controller/db_controller.hpp"

#include <duckdb.h>
#include <glog/logging.h>

#include <filesystem>
#include <stdexcept>

#include "storage/storage_error.hpp"

namespace imxup {
/**
 * @brief Construct a new DBController::DBController object
 *
 * @param db_path
 */
DBController::DBController(const file_path_t& db_path) : _db_path(db_path), _initialized(false) {
  InitializeDB();
}

/**
 * @brief Destroy the DBController::DBController object
 *
 */
DBController::~DBController() {
  if (_db) duckdb_close(&_db);
}

/**
 * @brief Get a connection guard for the database.
 *
 * @return ConnectionGuard
 */
auto DBController::GetConnectionGuard() -> ConnectionGuard {
  duckdb_connection conn = nullptr;
  if (duckdb_connect(_db, &conn) != DuckDBSuccess) {
    throw StorageError("DB cannot be connected");
  }
  return ConnectionGuard{conn};
}

/**
 * @brief Open (or create) the database file and make sure every table exists.
 *
 */
void DBController::InitializeDB() {
  if (_initialized) return;
  if (_db_path.has_parent_path()) {
    std::filesystem::create_directories(_db_path.parent_path());
  }

  char* open_error = nullptr;
  if (duckdb_open_ext(_db_path.string().c_str(), &_db, nullptr, &open_error) != DuckDBSuccess) {
    std::string message = open_error ? open_error : "DB cannot be created";
    if (open_error) duckdb_free(open_error);
    throw StorageError(message);
  }

  auto          guard = GetConnectionGuard();
  duckdb_result result;
  if (duckdb_query(guard._conn, init_table_query, &result) != DuckDBSuccess) {
    std::string error_message = duckdb_result_error(&result);
    duckdb_destroy_result(&result);
    throw StorageError(error_message);
  }
  duckdb_destroy_result(&result);
  _initialized = true;
  VLOG(1) << "[storage] queue store ready at " << _db_path;
}

};  // namespace imxup

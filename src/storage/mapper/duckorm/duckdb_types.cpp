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

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <string>

#include "storage/storage_error.hpp"

namespace duckorm {
void PreparedStatement::RecycleResources() {
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
    _stmt = nullptr;
  }
  if (_result.internal_data) duckdb_destroy_result(&_result);
}

PreparedStatement::PreparedStatement(duckdb_connection& con) : _stmt(nullptr), _con(con) {
  std::memset(&_result, 0, sizeof(_result));
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : _stmt(nullptr), _con(con) {
  std::memset(&_result, 0, sizeof(_result));
  GetStmtGuard(prepare_query);
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

auto PreparedStatement::GetStmtGuard(const std::string& prepare_query)
    -> duckdb_prepared_statement& {
  if (duckdb_prepare(_con, prepare_query.c_str(), &_stmt) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(_stmt);
    std::string msg = "PreparedStatement failed";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw imxup::StorageError(msg);
  }
  _prepared = true;
  return _stmt;
}

void PreparedStatement::Execute() {
  if (duckdb_execute_prepared(_stmt, &_result) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&_result);
    throw imxup::StorageError(err ? err : "duckdb_execute_prepared failed");
  }
}
}  // namespace duckorm

namespace imxup {
auto StorageError::LooksLikeContention(const std::string& message) -> bool {
  // DuckDB reports optimistic concurrency failures as "Conflict" errors and a second process
  // holding the file as "Could not set lock"
  static constexpr const char* kMarkers[] = {"conflict", "Conflict", "Could not set lock",
                                             "database is locked"};
  for (const char* marker : kMarkers) {
    if (message.find(marker) != std::string::npos) return true;
  }
  return false;
}
};  // namespace imxup

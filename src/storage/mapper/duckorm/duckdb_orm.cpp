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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <memory>
#include <span>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

#include "storage/storage_error.hpp"

namespace duckorm {
namespace {
void BindField(duckdb_prepared_statement stmt, idx_t param_idx, const void* obj,
               const DuckFieldDesc& field) {
  const char* ptr = reinterpret_cast<const char*>(obj) + field.offset;
  switch (field.type) {
    case DuckDBType::INT32:
      duckdb_bind_int32(stmt, param_idx, *reinterpret_cast<const int32_t*>(ptr));
      break;
    case DuckDBType::INT64:
      duckdb_bind_int64(stmt, param_idx, *reinterpret_cast<const int64_t*>(ptr));
      break;
    case DuckDBType::DOUBLE:
      duckdb_bind_double(stmt, param_idx, *reinterpret_cast<const double*>(ptr));
      break;
    case DuckDBType::BOOLEAN:
      duckdb_bind_boolean(stmt, param_idx, *reinterpret_cast<const bool*>(ptr));
      break;
    case DuckDBType::JSON:
    case DuckDBType::VARCHAR: {
      auto member_ptr = reinterpret_cast<const std::unique_ptr<std::string>*>(ptr);
      if (*member_ptr) {
        duckdb_bind_varchar_length(stmt, param_idx, (*member_ptr)->data(), (*member_ptr)->size());
      } else {
        duckdb_bind_null(stmt, param_idx);
      }
      break;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in BindField()");
  }
}

void BindParam(duckdb_prepared_statement stmt, idx_t param_idx, const ParamTypes& param) {
  std::visit(
      [&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, int32_t>) {
          duckdb_bind_int32(stmt, param_idx, value);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          duckdb_bind_int64(stmt, param_idx, value);
        } else if constexpr (std::is_same_v<T, double>) {
          duckdb_bind_double(stmt, param_idx, value);
        } else if constexpr (std::is_same_v<T, bool>) {
          duckdb_bind_boolean(stmt, param_idx, value);
        } else {
          duckdb_bind_varchar_length(stmt, param_idx, value.data(), value.size());
        }
      },
      param);
}

auto ReadRows(duckdb_result& result, std::span<const DuckFieldDesc> sample_fields)
    -> std::vector<std::vector<VarTypes>> {
  std::vector<std::vector<VarTypes>> results;
  if (duckdb_column_count(&result) != sample_fields.size()) {
    throw imxup::StorageError("Column count mismatch in select query", false);
  }

  idx_t row_count = duckdb_row_count(&result);
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].resize(sample_fields.size());
    for (idx_t j = 0; j < sample_fields.size(); ++j) {
      switch (sample_fields[j].type) {
        case DuckDBType::INT32:
          results[i][j] = duckdb_value_int32(&result, j, i);
          break;
        case DuckDBType::INT64:
          results[i][j] = duckdb_value_int64(&result, j, i);
          break;
        case DuckDBType::DOUBLE:
          results[i][j] = duckdb_value_double(&result, j, i);
          break;
        case DuckDBType::BOOLEAN:
          results[i][j] = duckdb_value_boolean(&result, j, i);
          break;
        case DuckDBType::VARCHAR:
        case DuckDBType::JSON: {
          // NULL columns read back as empty strings
          char* value   = duckdb_value_varchar(&result, j, i);
          results[i][j] = std::make_unique<std::string>(value ? value : "");
          if (value) duckdb_free(value);
          break;
        }
        default:
          throw std::runtime_error("Unsupported DuckFieldType in select()");
      }
    }
  }
  return results;
}
}  // namespace

void insert(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields) {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name;
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << "?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << ");";

  PreparedStatement insert_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    BindField(insert_pre._stmt, i + 1, obj, fields[i]);
  }
  insert_pre.Execute();
}

void update(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, const char* where_clause) {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  for (size_t i = 0; i < fields.size(); ++i) {
    sql << fields[i].name << " = ?";
    if (i < fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << " WHERE " << where_clause << ";";

  PreparedStatement update_pre(conn, sql.str());
  for (size_t i = 0; i < fields.size(); ++i) {
    BindField(update_pre._stmt, i + 1, obj, fields[i]);
  }
  update_pre.Execute();
}

void remove(duckdb_connection& conn, const char* table, const char* where_clause) {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement delete_pre(conn, sql.str());
  delete_pre.Execute();
}

auto select(duckdb_connection& conn, const std::string& table,
            std::span<const DuckFieldDesc> sample_fields, const char* where_clause)
    -> std::vector<std::vector<VarTypes>> {
  std::ostringstream sql;
  sql << "SELECT ";
  for (size_t i = 0; i < sample_fields.size(); ++i) {
    sql << sample_fields[i].name;
    if (i < sample_fields.size() - 1) {
      sql << ", ";
    }
  }
  sql << " FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement select_pre(conn, sql.str());
  select_pre.Execute();
  return ReadRows(select_pre._result, sample_fields);
}

auto select_by_query(duckdb_connection& conn, std::span<const DuckFieldDesc> sample_fields,
                     const std::string& sql) -> std::vector<std::vector<VarTypes>> {
  PreparedStatement select_pre(conn, sql);
  select_pre.Execute();
  return ReadRows(select_pre._result, sample_fields);
}

void execute(duckdb_connection& conn, const std::string& sql,
             const std::vector<ParamTypes>& params) {
  PreparedStatement stmt(conn, sql);
  for (size_t i = 0; i < params.size(); ++i) {
    BindParam(stmt._stmt, i + 1, params[i]);
  }
  stmt.Execute();
}

auto scalar_int64(duckdb_connection& conn, const std::string& sql,
                  const std::vector<ParamTypes>& params) -> int64_t {
  PreparedStatement stmt(conn, sql);
  for (size_t i = 0; i < params.size(); ++i) {
    BindParam(stmt._stmt, i + 1, params[i]);
  }
  stmt.Execute();
  if (duckdb_row_count(&stmt._result) == 0 || duckdb_value_is_null(&stmt._result, 0, 0)) {
    return 0;
  }
  return duckdb_value_int64(&stmt._result, 0, 0);
}

auto quote(std::string_view value) -> std::string {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (char c : value) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}
};  // namespace duckorm

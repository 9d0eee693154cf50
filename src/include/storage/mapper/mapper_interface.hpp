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

#include <array>
#include <cstdint>
#include <format>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace imxup {
template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection& _conn;

  explicit MapperInterface(duckdb_connection& conn) : _conn(conn) {}

  /**
   * @brief Insert a new record into the table
   *
   * @param obj
   */
  void Insert(const Mappable& obj) {
    duckorm::insert(_conn, Derived::TableName(), &obj, Derived::FieldDesc());
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   */
  void Remove(const ID& remove_id) {
    std::string remove_clause = std::vformat(Derived::PrimeKeyClause(), std::make_format_args(remove_id));
    duckorm::remove(_conn, Derived::TableName(), remove_clause.c_str());
  }

  /**
   * @brief Remove records from the table by a custom SQL predicate
   *
   * @param predicate
   */
  void RemoveByClause(const std::string& predicate) {
    duckorm::remove(_conn, Derived::TableName(), predicate.c_str());
  }

  /**
   * @brief Get records from the table by a custom SQL predicate
   *
   * @param where_clause
   * @return std::vector<Mappable>
   */
  auto Get(const char* where_clause) -> std::vector<Mappable> {
    auto raw = duckorm::select(_conn, Derived::TableName(), Derived::FieldDesc(), where_clause);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  auto GetByQuery(const char* query) -> std::vector<Mappable> {
    auto raw = duckorm::select_by_query(_conn, Derived::FieldDesc(), query);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Update every non-key column of a record. The key is always the first field.
   *
   * @param target_id
   * @param updated
   */
  void Update(const ID& target_id, const Mappable& updated) {
    std::string where_clause = std::vformat(Derived::PrimeKeyClause(), std::make_format_args(target_id));
    duckorm::update(_conn, Derived::TableName(), &updated, Derived::FieldDesc().subspan(1),
                    where_clause.c_str());
  }

  /**
   * @brief Update only the named columns of a record
   */
  void UpdateColumns(const ID& target_id, const Mappable& updated,
                     std::span<const duckorm::DuckFieldDesc> columns) {
    std::string where_clause = std::vformat(Derived::PrimeKeyClause(), std::make_format_args(target_id));
    duckorm::update(_conn, Derived::TableName(), &updated, columns, where_clause.c_str());
  }
};

template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const duckorm::DuckFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::_field_descs; }
  static constexpr uint32_t       FieldCount() { return Derived::_field_count; }
  static constexpr const char*    TableName() { return Derived::_table_name; }
  static constexpr const char*    PrimeKeyClause() { return Derived::_prime_key_clause; }

  /**
   * @brief Look up the descriptor of a column by name, for partial updates
   */
  static auto Column(std::string_view name) -> duckorm::DuckFieldDesc {
    for (const auto& desc : Derived::_field_descs) {
      if (name == desc.name) return desc;
    }
    throw std::runtime_error(std::format("Unknown column {} in {}", name, Derived::_table_name));
  }
};
};  // namespace imxup

namespace imxup {
/**
 * @brief Typed cursor over one row returned by duckorm::select
 */
class RowReader {
 public:
  explicit RowReader(std::vector<duckorm::VarTypes>& row, const char* table)
      : _row(row), _table(table) {}

  template <typename T>
  auto Next() -> T {
    if (_idx >= _row.size()) {
      throw std::runtime_error(std::format("Row of {} is shorter than its field list", _table));
    }
    auto* value = std::get_if<T>(&_row[_idx++]);
    if (value == nullptr) {
      throw std::runtime_error(
          std::format("Encounting unmatching types when parsing the data from {}", _table));
    }
    return std::move(*value);
  }

  auto NextString() -> std::string {
    auto ptr = Next<std::unique_ptr<std::string>>();
    return ptr ? std::move(*ptr) : std::string{};
  }

 private:
  std::vector<duckorm::VarTypes>& _row;
  const char*                     _table;
  size_t                          _idx = 0;
};

inline auto MakeStr(const std::string& value) -> std::unique_ptr<std::string> {
  return std::make_unique<std::string>(value);
}
};  // namespace imxup

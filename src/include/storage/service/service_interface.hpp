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

#include <duckdb.h>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "storage/mapper/mapper_interface.hpp"

namespace imxup {
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 private:
  duckdb_connection& _conn;
  Mapper             _mapper;

 public:
  explicit ServiceInterface(duckdb_connection& conn) : _conn(conn), _mapper(conn) {}
  void InsertParams(const Mappable& param) { _mapper.Insert(param); }
  void Insert(const InternalType& obj) { _mapper.Insert(Derived::ToParams(obj)); }

  /**
   * @brief Get the objects by a SQL predicate (WHERE clause)
   *
   * @param predicate
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(std::string&& predicate) -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = _mapper.Get(predicate.c_str());
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  /**
   * @brief Get the objects by a full SQL query. The query must select the mapper's columns in
   *        declaration order.
   *
   * @param query
   * @return std::vector<InternalType>
   */
  auto GetByQuery(std::string&& query) -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = _mapper.GetByQuery(query.c_str());
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  void RemoveById(const ID& remove_id) { _mapper.Remove(remove_id); }
  void RemoveByClause(const std::string& clause) { _mapper.RemoveByClause(clause); }
  void Update(const InternalType& obj, const ID& update_id) {
    _mapper.Update(update_id, Derived::ToParams(obj));
  }
  void UpdateColumns(const InternalType& obj, const ID& update_id,
                     std::span<const duckorm::DuckFieldDesc> columns) {
    _mapper.UpdateColumns(update_id, Derived::ToParams(obj), columns);
  }

  auto Connection() -> duckdb_connection& { return _conn; }
};
}  // namespace imxup

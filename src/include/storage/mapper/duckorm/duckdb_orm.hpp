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

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "duckdb_types.hpp"

namespace duckorm {
void insert(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields);

void update(duckdb_connection& conn, const char* table, const void* obj,
            std::span<const DuckFieldDesc> fields, const char* where_clause);

void remove(duckdb_connection& conn, const char* table, const char* where_clause);

auto select(duckdb_connection& conn, const std::string& table,
            std::span<const DuckFieldDesc> sample_fields, const char* where_clause)
    -> std::vector<std::vector<VarTypes>>;

auto select_by_query(duckdb_connection& conn, std::span<const DuckFieldDesc> sample_fields,
                     const std::string& sql) -> std::vector<std::vector<VarTypes>>;

/**
 * @brief Run a statement with positional parameters and no result rows
 */
void execute(duckdb_connection& conn, const std::string& sql,
             const std::vector<ParamTypes>& params = {});

/**
 * @brief Run a query returning a single BIGINT (count(*), nextval, max(id)), 0 on NULL
 */
auto scalar_int64(duckdb_connection& conn, const std::string& sql,
                  const std::vector<ParamTypes>& params = {}) -> int64_t;

/**
 * @brief Quote a string literal for use inside a where clause
 */
auto quote(std::string_view value) -> std::string;
}  // namespace duckorm

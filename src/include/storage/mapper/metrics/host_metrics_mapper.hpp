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

namespace imxup {
// CREATE TABLE HostMetrics (host_name TEXT, period_type TEXT, period_date TEXT, bytes_uploaded
// BIGINT, files_uploaded BIGINT, files_failed BIGINT, transfer_seconds DOUBLE, peak_speed DOUBLE,
// updated_ts BIGINT, PRIMARY KEY (host_name, period_type, period_date));
struct HostMetricsMapperParams {
  std::unique_ptr<std::string> host_name;
  std::unique_ptr<std::string> period_type;
  std::unique_ptr<std::string> period_date;
  int64_t                      bytes_uploaded;
  int64_t                      files_uploaded;
  int64_t                      files_failed;
  double                       transfer_seconds;
  double                       peak_speed;
  int64_t                      updated_ts;
};

class HostMetricsMapper
    : public MapperInterface<HostMetricsMapper, HostMetricsMapperParams, std::string>,
      public FieldReflectable<HostMetricsMapper> {
 private:
  static constexpr uint32_t                                         _field_count      = 9;
  static constexpr const char*                                      _table_name       = "HostMetrics";
  // Rows are keyed by (host, period, date); removal by id drops every row of a host.
  // Callers pass the host through duckorm::quote
  static constexpr const char*                                      _prime_key_clause = "host_name={}";
  static constexpr std::array<duckorm::DuckFieldDesc, _field_count> _field_descs      = {
      FIELD(HostMetricsMapperParams, host_name, VARCHAR),
      FIELD(HostMetricsMapperParams, period_type, VARCHAR),
      FIELD(HostMetricsMapperParams, period_date, VARCHAR),
      FIELD(HostMetricsMapperParams, bytes_uploaded, INT64),
      FIELD(HostMetricsMapperParams, files_uploaded, INT64),
      FIELD(HostMetricsMapperParams, files_failed, INT64),
      FIELD(HostMetricsMapperParams, transfer_seconds, DOUBLE),
      FIELD(HostMetricsMapperParams, peak_speed, DOUBLE),
      FIELD(HostMetricsMapperParams, updated_ts, INT64)};

 public:
  static auto FromRawData(std::vector<duckorm::VarTypes>&& data) -> HostMetricsMapperParams;
  friend struct FieldReflectable<HostMetricsMapper>;
  using MapperInterface::MapperInterface;
};
}  // namespace imxup

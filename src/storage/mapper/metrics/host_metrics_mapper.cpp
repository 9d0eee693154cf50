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

#include "storage/mapper/metrics/host_metrics_mapper.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>

namespace imxup {
auto HostMetricsMapper::FromRawData(std::vector<duckorm::VarTypes>&& data)
    -> HostMetricsMapperParams {
  if (data.size() != FieldCount()) {
    throw std::runtime_error("Invalid DuckFieldDesc for HostMetrics");
  }
  RowReader               row{data, "HostMetrics"};
  HostMetricsMapperParams params;
  params.host_name        = row.Next<std::unique_ptr<std::string>>();
  params.period_type      = row.Next<std::unique_ptr<std::string>>();
  params.period_date      = row.Next<std::unique_ptr<std::string>>();
  params.bytes_uploaded   = row.Next<int64_t>();
  params.files_uploaded   = row.Next<int64_t>();
  params.files_failed     = row.Next<int64_t>();
  params.transfer_seconds = row.Next<double>();
  params.peak_speed       = row.Next<double>();
  params.updated_ts       = row.Next<int64_t>();
  return params;
}
};  // namespace imxup

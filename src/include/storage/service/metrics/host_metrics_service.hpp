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

#include <string>
#include <vector>

#include "queue/host_metrics.hpp"
#include "storage/mapper/metrics/host_metrics_mapper.hpp"
#include "storage/service/service_interface.hpp"
#include "type/type.hpp"

namespace imxup {
class HostMetricsService
    : public ServiceInterface<HostMetricsService, HostMetrics, HostMetricsMapperParams,
                              HostMetricsMapper, std::string> {
 public:
  using ServiceInterface::ServiceInterface;

  static auto ToParams(const HostMetrics& source) -> HostMetricsMapperParams;
  static auto FromParams(HostMetricsMapperParams&& param) -> HostMetrics;

  /**
   * @brief Add a sample to one stored row, creating it on first use
   */
  void        Accumulate(const TransferSample& sample, const std::string& period_type,
                         const std::string& period_date, unix_ts_t now);
  /**
   * @brief Sum of the daily rows of a host dated `since_day` or later
   */
  auto        SumDaily(const host_id_t& host, const std::string& since_day) -> HostMetrics;
  auto        AllTime(const host_id_t& host) -> HostMetrics;
  auto        DailyRows(const host_id_t& host, const std::string& since_day)
      -> std::vector<HostMetrics>;
  auto        Hosts() -> std::vector<host_id_t>;
  auto        RemoveDailyBefore(const std::string& day) -> int64_t;
};
};  // namespace imxup

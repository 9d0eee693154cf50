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

#include <chrono>
#include <cstdint>
#include <string>

#include "type/type.hpp"

namespace imxup {
enum class MetricsPeriod : uint8_t {
  TODAY = 0,
  WEEK,
  MONTH,
  ALL_TIME,
};

auto ToString(MetricsPeriod period) -> const char*;

inline constexpr const char* kDailyPeriod   = "daily";
inline constexpr const char* kAllTimePeriod = "all_time";

/**
 * @brief Outcome of one transfer, or of one gallery run on the primary host
 */
struct TransferSample {
  host_id_t host_;
  int64_t   bytes_        = 0;
  double    seconds_      = 0.0;
  int32_t   files_ok_     = 0;
  int32_t   files_failed_ = 0;

  /**
   * @brief Bytes per second, with the duration floored at one millisecond
   */
  auto      Speed() const -> double;
};

/**
 * @brief Transfer totals of one host. Stored rows are either one UTC day ("daily", dated) or
 *        the running total ("all_time", undated); query results sum several of them.
 */
struct HostMetrics {
  host_id_t   host_;
  std::string period_type_;
  std::string period_date_;
  int64_t     bytes_uploaded_   = 0;
  int64_t     files_uploaded_   = 0;
  int64_t     files_failed_     = 0;
  double      transfer_seconds_ = 0.0;
  double      peak_bps_         = 0.0;
  unix_ts_t   updated_ts_       = 0;

  auto        AverageBps() const -> double;
  /**
   * @brief Percentage of files that made it, 100 when nothing was recorded
   */
  auto        SuccessRate() const -> double;
};

/**
 * @brief "YYYY-MM-DD" of the UTC day holding `tp`
 */
auto MetricsDay(std::chrono::system_clock::time_point tp) -> std::string;
};  // namespace imxup

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

#include "queue/host_metrics.hpp"

#include <algorithm>
#include <format>

namespace imxup {
auto ToString(MetricsPeriod period) -> const char* {
  switch (period) {
    case MetricsPeriod::TODAY:
      return "today";
    case MetricsPeriod::WEEK:
      return "week";
    case MetricsPeriod::MONTH:
      return "month";
    case MetricsPeriod::ALL_TIME:
      return "all_time";
  }
  return "unknown";
}

auto TransferSample::Speed() const -> double {
  return static_cast<double>(bytes_) / std::max(seconds_, 0.001);
}

auto HostMetrics::AverageBps() const -> double {
  return static_cast<double>(bytes_uploaded_) / std::max(transfer_seconds_, 0.001);
}

auto HostMetrics::SuccessRate() const -> double {
  auto total = files_uploaded_ + files_failed_;
  if (total == 0) return 100.0;
  return static_cast<double>(files_uploaded_) * 100.0 / static_cast<double>(total);
}

auto MetricsDay(std::chrono::system_clock::time_point tp) -> std::string {
  return std::format("{:%F}", std::chrono::floor<std::chrono::days>(tp));
}
};  // namespace imxup

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

#include "storage/service/metrics/host_metrics_service.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace imxup {
auto HostMetricsService::ToParams(const HostMetrics& source) -> HostMetricsMapperParams {
  HostMetricsMapperParams params;
  params.host_name        = MakeStr(source.host_);
  params.period_type      = MakeStr(source.period_type_);
  params.period_date      = MakeStr(source.period_date_);
  params.bytes_uploaded   = source.bytes_uploaded_;
  params.files_uploaded   = source.files_uploaded_;
  params.files_failed     = source.files_failed_;
  params.transfer_seconds = source.transfer_seconds_;
  params.peak_speed       = source.peak_bps_;
  params.updated_ts       = source.updated_ts_;
  return params;
}

auto HostMetricsService::FromParams(HostMetricsMapperParams&& param) -> HostMetrics {
  HostMetrics recovered;
  recovered.host_             = std::move(*param.host_name);
  recovered.period_type_      = std::move(*param.period_type);
  recovered.period_date_      = std::move(*param.period_date);
  recovered.bytes_uploaded_   = param.bytes_uploaded;
  recovered.files_uploaded_   = param.files_uploaded;
  recovered.files_failed_     = param.files_failed;
  recovered.transfer_seconds_ = param.transfer_seconds;
  recovered.peak_bps_         = param.peak_speed;
  recovered.updated_ts_       = param.updated_ts;
  return recovered;
}

void HostMetricsService::Accumulate(const TransferSample& sample, const std::string& period_type,
                                    const std::string& period_date, unix_ts_t now) {
  auto present = duckorm::scalar_int64(
      Connection(),
      "SELECT count(*) FROM HostMetrics WHERE host_name=? AND period_type=? AND period_date=?;",
      {sample.host_, period_type, period_date});
  if (present > 0) {
    duckorm::execute(Connection(),
                     "UPDATE HostMetrics SET bytes_uploaded = bytes_uploaded + ?, "
                     "files_uploaded = files_uploaded + ?, files_failed = files_failed + ?, "
                     "transfer_seconds = transfer_seconds + ?, "
                     "peak_speed = greatest(peak_speed, ?), updated_ts = ? "
                     "WHERE host_name=? AND period_type=? AND period_date=?;",
                     {sample.bytes_, int64_t{sample.files_ok_}, int64_t{sample.files_failed_},
                      sample.seconds_, sample.Speed(), now, sample.host_, period_type,
                      period_date});
    return;
  }
  HostMetrics row;
  row.host_             = sample.host_;
  row.period_type_      = period_type;
  row.period_date_      = period_date;
  row.bytes_uploaded_   = sample.bytes_;
  row.files_uploaded_   = sample.files_ok_;
  row.files_failed_     = sample.files_failed_;
  row.transfer_seconds_ = sample.seconds_;
  row.peak_bps_         = sample.Speed();
  row.updated_ts_       = now;
  Insert(row);
}

auto HostMetricsService::SumDaily(const host_id_t& host, const std::string& since_day)
    -> HostMetrics {
  auto rows = GetByQuery(std::format(
      "SELECT {0} AS host_name, '{1}' AS period_type, '' AS period_date, "
      "CAST(COALESCE(SUM(bytes_uploaded), 0) AS BIGINT), "
      "CAST(COALESCE(SUM(files_uploaded), 0) AS BIGINT), "
      "CAST(COALESCE(SUM(files_failed), 0) AS BIGINT), "
      "CAST(COALESCE(SUM(transfer_seconds), 0) AS DOUBLE), "
      "CAST(COALESCE(MAX(peak_speed), 0) AS DOUBLE), "
      "CAST(COALESCE(MAX(updated_ts), 0) AS BIGINT) "
      "FROM HostMetrics WHERE host_name={0} AND period_type='{1}' AND period_date >= {2};",
      duckorm::quote(host), kDailyPeriod, duckorm::quote(since_day)));
  if (rows.empty()) {
    HostMetrics empty;
    empty.host_ = host;
    return empty;
  }
  return std::move(rows.front());
}

auto HostMetricsService::AllTime(const host_id_t& host) -> HostMetrics {
  auto rows = GetByPredicate(std::format("host_name={} AND period_type='{}'",
                                         duckorm::quote(host), kAllTimePeriod));
  if (rows.empty()) {
    HostMetrics empty;
    empty.host_        = host;
    empty.period_type_ = kAllTimePeriod;
    return empty;
  }
  return std::move(rows.front());
}

auto HostMetricsService::DailyRows(const host_id_t& host, const std::string& since_day)
    -> std::vector<HostMetrics> {
  return GetByPredicate(std::format(
      "host_name={} AND period_type='{}' AND period_date >= {} ORDER BY period_date DESC",
      duckorm::quote(host), kDailyPeriod, duckorm::quote(since_day)));
}

auto HostMetricsService::Hosts() -> std::vector<host_id_t> {
  std::vector<host_id_t> hosts;
  for (auto& row :
       GetByPredicate(std::format("period_type='{}' ORDER BY host_name", kAllTimePeriod))) {
    hosts.push_back(std::move(row.host_));
  }
  return hosts;
}

auto HostMetricsService::RemoveDailyBefore(const std::string& day) -> int64_t {
  auto clause = std::format("period_type='{}' AND period_date < {}", kDailyPeriod,
                            duckorm::quote(day));
  auto count  = duckorm::scalar_int64(
      Connection(), std::format("SELECT count(*) FROM HostMetrics WHERE {};", clause));
  if (count > 0) RemoveByClause(clause);
  return count;
}
};  // namespace imxup

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

#include "utils/clock/time_provider.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace imxup {
std::atomic<std::chrono::system_clock::time_point> TimeProvider::_cached_sys_time;
std::atomic<std::chrono::steady_clock::time_point> TimeProvider::_cached_steady_time;

namespace {
std::once_flag g_time_provider_init;
}  // namespace

void TimeProvider::Refresh() {
  _cached_sys_time    = std::chrono::system_clock::now();
  _cached_steady_time = std::chrono::steady_clock::now();
}

/**
 * @brief Wall clock derived from the steady clock since the last Refresh(), so that a wall
 *        clock jump during an upload does not turn into a negative elapsed time.
 */
auto TimeProvider::Now() -> std::chrono::system_clock::time_point {
  std::call_once(g_time_provider_init, [] { Refresh(); });
  auto elapsed = std::chrono::steady_clock::now() - _cached_steady_time.load();
  return _cached_sys_time.load() +
         std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed);
}

auto TimeProvider::NowUnix() -> unix_ts_t { return ToUnix(Now()); }

auto TimeProvider::TimePointToString(const std::chrono::system_clock::time_point& tp)
    -> std::string {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm     tm{};
  localtime_r(&t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

auto TimeProvider::SystemClock() -> SystemClockFn {
  return [] { return TimeProvider::Now(); };
}

auto TimeProvider::SteadyClock() -> SteadyClockFn {
  return [] { return std::chrono::steady_clock::now(); };
}
}  // namespace imxup

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

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "type/type.hpp"

namespace imxup {
// Injected into components that reason about TTLs and rate limits, so tests can move time
using SystemClockFn = std::function<std::chrono::system_clock::time_point()>;
using SteadyClockFn = std::function<std::chrono::steady_clock::time_point()>;

class TimeProvider {
 private:
  static std::atomic<std::chrono::system_clock::time_point> _cached_sys_time;
  static std::atomic<std::chrono::steady_clock::time_point> _cached_steady_time;

 public:
  static void Refresh();
  static auto Now() -> std::chrono::system_clock::time_point;
  static auto NowUnix() -> unix_ts_t;
  static auto TimePointToString(const std::chrono::system_clock::time_point& tp) -> std::string;

  static auto SystemClock() -> SystemClockFn;
  static auto SteadyClock() -> SteadyClockFn;
};

inline auto ToUnix(const std::chrono::system_clock::time_point& tp) -> unix_ts_t {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

inline auto FromUnix(unix_ts_t ts) -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point{std::chrono::seconds{ts}};
}
}  // namespace imxup

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

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <json.hpp>
#include <thread>

namespace imxup {
/**
 * @brief Bounded exponential backoff. Attempt n (1-based) waits base * factor^(n-1) before the
 *        next try, capped at max_delay. max_attempts counts the first try.
 */
struct BackoffPolicy {
  uint32_t                  max_attempts_ = 3;
  std::chrono::milliseconds base_delay_{1000};
  double                    factor_ = 2.0;
  std::chrono::milliseconds max_delay_{30000};

  auto DelayAfter(uint32_t attempt) const -> std::chrono::milliseconds {
    double scaled = static_cast<double>(base_delay_.count()) *
                    std::pow(factor_, static_cast<double>(attempt > 0 ? attempt - 1 : 0));
    auto   capped = std::min<double>(scaled, static_cast<double>(max_delay_.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
  }
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

inline auto RealSleep() -> SleepFn {
  return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

inline void to_json(nlohmann::json& j, const BackoffPolicy& p) {
  j = nlohmann::json{{"max_attempts", p.max_attempts_},
                     {"base_delay_ms", p.base_delay_.count()},
                     {"factor", p.factor_},
                     {"max_delay_ms", p.max_delay_.count()}};
}

inline void from_json(const nlohmann::json& j, BackoffPolicy& p) {
  p.max_attempts_ = std::max<uint32_t>(1, j.value("max_attempts", p.max_attempts_));
  p.base_delay_   = std::chrono::milliseconds(j.value("base_delay_ms", p.base_delay_.count()));
  p.factor_       = j.value("factor", p.factor_);
  p.max_delay_    = std::chrono::milliseconds(j.value("max_delay_ms", p.max_delay_.count()));
}
};  // namespace imxup

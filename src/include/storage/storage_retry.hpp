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

#include <glog/logging.h>

#include <chrono>
#include <format>
#include <string_view>

#include "storage/storage_error.hpp"
#include "utils/retry/backoff.hpp"

namespace imxup {
/**
 * @brief Run a storage operation, retrying it while the store reports lock contention.
 *
 * Non-contention errors propagate untouched. When every attempt hit contention a
 * StorageUnavailableError is raised, the operation did not take effect.
 */
template <typename F>
auto RetryOnContention(const BackoffPolicy& policy, const SleepFn& sleep, std::string_view op,
                       F&& fn) -> decltype(fn()) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const StorageError& e) {
      if (!e.IsContention()) throw;
      if (attempt >= policy.max_attempts_) {
        LOG(ERROR) << "[queue] " << op << " gave up after " << attempt
                   << " contended attempts: " << e.what();
        throw StorageUnavailableError(
            std::format("{}: storage unavailable after {} attempts ({})", op, attempt, e.what()));
      }
      auto delay = policy.DelayAfter(attempt);
      LOG(WARNING) << "[queue] " << op << " contended, retrying in " << delay.count() << " ms";
      sleep(delay);
    }
  }
}
};  // namespace imxup

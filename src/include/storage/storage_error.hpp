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

#include <stdexcept>
#include <string>

namespace imxup {
/**
 * @brief Error raised by the queue store. Contention errors (write-write conflicts, file lock)
 *        are retried by the caller, everything else is propagated as is.
 */
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& message)
      : std::runtime_error(message), contention_(LooksLikeContention(message)) {}
  StorageError(const std::string& message, bool contention)
      : std::runtime_error(message), contention_(contention) {}

  auto IsContention() const -> bool { return contention_; }

  static auto LooksLikeContention(const std::string& message) -> bool;

 private:
  bool contention_;
};

/**
 * @brief Raised after the storage retry budget is exhausted. The operation did not happen.
 */
class StorageUnavailableError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
};  // namespace imxup

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

#include "network/file_host_client.hpp"

namespace imxup {
auto ToString(FailureKind kind) -> std::string_view {
  switch (kind) {
    case FailureKind::NONE:
      return "none";
    case FailureKind::NETWORK:
      return "network";
    case FailureKind::AUTH:
      return "auth";
    case FailureKind::QUOTA:
      return "quota";
    case FailureKind::REJECTED:
      return "rejected";
    case FailureKind::CANCELLED:
      return "cancelled";
    case FailureKind::VALIDATION:
      return "validation";
  }
  return "none";
}

auto IsRetryable(FailureKind kind) -> bool {
  switch (kind) {
    case FailureKind::NETWORK:
    case FailureKind::AUTH:
    case FailureKind::QUOTA:
    case FailureKind::CANCELLED:
      return true;
    default:
      return false;
  }
}
};  // namespace imxup

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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "network/http_transport.hpp"
#include "type/type.hpp"

namespace imxup {
enum class FailureKind : uint8_t {
  NONE = 0,
  NETWORK,     // timeout, connection failure, 5xx
  AUTH,        // credentials rejected after one re-authentication
  QUOTA,       // host storage or traffic exhausted
  REJECTED,    // permanent refusal, other 4xx, malformed answer
  CANCELLED,   // should-stop tripped
  VALIDATION,  // local input unusable, nothing was sent
};

auto ToString(FailureKind kind) -> std::string_view;

/**
 * @brief Failures worth another attempt later: the same request may succeed unchanged
 */
auto IsRetryable(FailureKind kind) -> bool;

struct CallOutcome {
  bool        success_     = false;
  FailureKind failure_     = FailureKind::NONE;
  std::string message_;
  long        http_status_ = 0;
};

struct UploadOutcome : CallOutcome {
  std::string url_;
  std::string file_id_;
  std::string upload_id_;
  std::string raw_response_;
  // The host already had the content and returned the existing link
  bool        deduplicated_ = false;
};

struct StorageQuota {
  std::optional<int64_t> total_;
  std::optional<int64_t> left_;
  std::optional<int64_t> used_;
};

/**
 * @brief Upload client of one secondary host, as seen by its worker
 */
class FileHostClient {
 public:
  virtual ~FileHostClient()                                                     = default;

  virtual auto Upload(const file_path_t& file, const TransferControl& control = {})
      -> UploadOutcome                                                          = 0;
  virtual auto TestCredentials() -> CallOutcome                                 = 0;
  virtual auto GetStorageQuota() -> std::optional<StorageQuota>                 = 0;
  virtual auto DeleteFile(const std::string& file_id) -> CallOutcome            = 0;
};
};  // namespace imxup

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
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "auth/token_cache.hpp"
#include "network/file_host_client.hpp"
#include "network/host_config.hpp"
#include "network/http_transport.hpp"
#include "utils/retry/backoff.hpp"

namespace imxup {
/**
 * @brief Failure inside one protocol step. Caught at the client's public boundary and turned
 *        into an outcome value.
 */
class HostError : public std::runtime_error {
 public:
  HostError(FailureKind kind, const std::string& message, long status = 0,
            bool transient = false)
      : std::runtime_error(message), kind_(kind), status_(status), transient_(transient) {}

  auto Kind() const -> FailureKind { return kind_; }
  auto Status() const -> long { return status_; }
  // Sending the same request again may succeed
  auto Transient() const -> bool { return transient_; }

 private:
  FailureKind kind_;
  long        status_;
  bool        transient_;
};

/**
 * @brief Drives uploads against one secondary host described by a HostConfig.
 *
 * Standard hosts take the file in one request. Multi-step hosts hand out an upload slot in an
 * init call, take the data, and may need polling until the link is ready.
 *
 * Credentials are API key, username:password for token login, or username:password for a
 * cookie session. Tokens live in the TokenCache; a token that expires within the refresh
 * margin is renewed before a transfer starts, and a 401/403 or a stale-token answer causes one
 * re-authentication and one retry. Transient network failures are retried with the backoff
 * policy; other 4xx answers are final.
 */
class HostProtocolClient final : public FileHostClient {
 public:
  HostProtocolClient(HostConfig config, std::string credentials, TokenCache& tokens,
                     HttpTransport& transport, BackoffPolicy network_retry = {},
                     std::chrono::seconds refresh_margin = std::chrono::seconds{60},
                     SleepFn sleep = RealSleep());
  /**
   * @brief Client that owns its transport, and with it a cookie jar private to this host
   */
  HostProtocolClient(HostConfig config, std::string credentials, TokenCache& tokens,
                     std::unique_ptr<HttpTransport> transport, BackoffPolicy network_retry = {},
                     std::chrono::seconds refresh_margin = std::chrono::seconds{60},
                     SleepFn sleep = RealSleep());

  auto Upload(const file_path_t& file, const TransferControl& control = {})
      -> UploadOutcome override;
  auto TestCredentials() -> CallOutcome override;
  auto GetStorageQuota() -> std::optional<StorageQuota> override;
  auto DeleteFile(const std::string& file_id) -> CallOutcome override;

  auto Config() const -> const HostConfig& { return config_; }

  /**
   * @brief Remove the internal "imxup_<gallery id>_" prefix of archive names
   */
  static auto CleanFileName(const std::string& name) -> std::string;

 private:
  template <typename F>
  auto WithAuthRetry(F&& op) -> decltype(op());

  auto EnsureAuthenticated() -> std::string;
  void Reauthenticate();
  auto CanReauthenticate() const -> bool;
  auto LoginWithToken() -> std::string;
  void LoginSession();
  auto SplitCredentials() const -> std::pair<std::string, std::string>;
  auto SessionId(const std::string& upload_url) -> std::optional<std::string>;

  auto UploadStandard(const file_path_t& file, const TransferControl& control) -> UploadOutcome;
  auto UploadMultistep(const file_path_t& file, const TransferControl& control) -> UploadOutcome;
  auto PollForLink(const std::string& upload_id, const std::string& token,
                   const TransferControl& control) -> UploadOutcome;
  auto ResolveUploadServer(const std::string& token)
      -> std::pair<std::string, std::optional<std::string>>;
  auto ParseUploadResponse(const HttpResponse& response) -> UploadOutcome;
  auto FetchQuota() -> std::optional<StorageQuota>;

  auto AuthHeaders(const std::string& token) const -> FieldList;
  auto IsStale(const HttpResponse& response) const -> bool;
  auto MatchesStalePattern(const std::string& text) const -> bool;
  /**
   * @brief Throw the HostError matching a response whose status is not in `accepted`, or
   *        which carries a stale-token marker
   */
  void Check(const HttpResponse& response, std::string_view step,
             std::initializer_list<long> accepted) const;
  void Sleep(std::chrono::milliseconds delay, const TransferControl& control);

  HostConfig                  config_;
  std::string                 credentials_;
  TokenCache&                 tokens_;
  std::unique_ptr<HttpTransport> owned_transport_;
  HttpTransport&              transport_;
  BackoffPolicy               network_retry_;
  std::chrono::seconds        refresh_margin_;
  SleepFn                     sleep_;

  std::mutex                  auth_mutex_;
  bool                        session_ready_ = false;
  std::optional<StorageQuota> login_quota_;
};
};  // namespace imxup

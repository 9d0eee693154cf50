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
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "auth/credential_cipher.hpp"
#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"

namespace imxup {
struct Token {
  host_id_t                                            host_;
  std::string                                          value_;
  std::chrono::system_clock::time_point                issued_;
  // Absent means the token never expires on its own
  std::optional<std::chrono::system_clock::time_point> expires_;
};

struct TokenInfo {
  bool                                                 valid_ = false;
  std::chrono::system_clock::time_point                issued_;
  std::optional<std::chrono::system_clock::time_point> expires_;
  std::optional<std::chrono::seconds>                  remaining_;
};

/**
 * @brief Per-host authentication tokens, persisted encrypted in a JSON file.
 *
 * Expiry is enforced when a token is read: an expired entry is dropped and reported as absent.
 * The cache must be Init()-ed before use and is handed to its users by reference.
 */
class TokenCache {
 public:
  TokenCache(file_path_t path, CredentialCipher cipher,
             SystemClockFn clock = TimeProvider::SystemClock());
  ~TokenCache();

  TokenCache(const TokenCache&)            = delete;
  TokenCache& operator=(const TokenCache&) = delete;

  /**
   * @brief Load the persisted tokens. Entries that cannot be decrypted are discarded.
   */
  void Init();
  /**
   * @brief Flush to disk and release the in-memory tokens. Init() may be called again later.
   */
  void Teardown();
  auto Initialized() const -> bool;

  auto Get(const host_id_t& host) -> std::optional<Token>;
  /**
   * @param ttl lifetime from now, nullopt for a token without expiry. A zero ttl stores a token
   *            that is already expired.
   */
  void Put(const host_id_t& host, const std::string& value,
           std::optional<std::chrono::seconds> ttl = std::nullopt);
  void Invalidate(const host_id_t& host);
  auto GetInfo(const host_id_t& host) -> std::optional<TokenInfo>;
  void ClearAll();

  /**
   * @brief True when the token is absent or expires within `margin`
   */
  auto NeedsRefresh(const host_id_t& host, std::chrono::seconds margin) -> bool;

 private:
  void CheckInitialized() const;
  auto IsExpired(const Token& token) const -> bool;
  void Persist();

  file_path_t                 path_;
  CredentialCipher            cipher_;
  SystemClockFn               clock_;

  mutable std::mutex          mutex_;
  std::map<host_id_t, Token>  tokens_;
  bool                        initialized_ = false;
};
};  // namespace imxup

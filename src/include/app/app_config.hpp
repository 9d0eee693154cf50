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
#include <json.hpp>
#include <string>

#include "auth/credential_cipher.hpp"
#include "hooks/hooks_config.hpp"
#include "network/primary_host_client.hpp"
#include "network/proxy_resolver.hpp"
#include "type/type.hpp"
#include "utils/retry/backoff.hpp"
#include "workers/host_settings.hpp"

namespace imxup {
/**
 * @brief Application settings, stored as config.json in the data directory.
 *
 * Relative paths are resolved against the directory holding the config file. Secrets (API key,
 * web login, host credentials) are encrypted in the file and plain in memory.
 */
struct AppConfig {
  file_path_t          data_dir_;
  file_path_t          database_path_;
  file_path_t          token_cache_path_;
  file_path_t          artifact_dir_;
  file_path_t          temp_dir_;
  file_path_t          hosts_dir_;
  // Browser cookies.txt offered to the rename worker, optional
  file_path_t          cookie_file_;
  std::string          tab_name_ = "Main";
  std::string          template_name_ = "default";

  PrimaryHostSettings  primary_;
  BackoffPolicy        storage_retry_;
  BackoffPolicy        network_retry_;
  std::chrono::seconds token_refresh_margin_{60};
  HooksConfig          hooks_;
  HostSettingsMap      hosts_;
  ProxySettings        proxy_;

  /**
   * @brief Defaults with every path inside `data_dir`
   */
  static auto          Defaults(const file_path_t& data_dir) -> AppConfig;
};

/**
 * @brief $IMXUP_HOME, or ~/.imxup
 */
auto DefaultDataDir() -> file_path_t;

auto ParseAppConfig(const nlohmann::json& doc, const file_path_t& data_dir,
                    const CredentialCipher& cipher) -> AppConfig;
auto ToJson(const AppConfig& config, const CredentialCipher& cipher) -> nlohmann::json;

/**
 * @brief Read a config file. A missing file yields the defaults for its directory; a file that
 *        cannot be read or parsed throws std::runtime_error.
 */
auto LoadAppConfig(const file_path_t& file, const CredentialCipher& cipher) -> AppConfig;
void SaveAppConfig(const AppConfig& config, const file_path_t& file,
                   const CredentialCipher& cipher);
};  // namespace imxup

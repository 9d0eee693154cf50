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
#include <json.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "type/type.hpp"

namespace imxup {
/**
 * @brief Lifecycle event of a gallery that creates a job on a secondary host
 */
enum class HostTrigger : uint8_t {
  DISABLED = 0,
  ON_ADDED,
  ON_STARTED,
  ON_COMPLETED,
};

auto ToString(HostTrigger trigger) -> std::string_view;
auto HostTriggerFromString(std::string_view name) -> std::optional<HostTrigger>;

/**
 * @brief User settings of one secondary host. The protocol itself is described by HostConfig.
 */
struct HostSettings {
  bool        enabled_     = false;
  HostTrigger trigger_     = HostTrigger::DISABLED;
  bool        auto_retry_  = true;
  int32_t     max_retries_ = 3;
  // Plain text in memory, encrypted in the config file
  std::string credentials_;
};

using HostSettingsMap = std::map<host_id_t, HostSettings>;

/**
 * @brief Parse one host entry. Credentials are taken as stored; decryption is up to the caller.
 *        Throws std::runtime_error on an unknown trigger.
 */
auto ParseHostSettings(const nlohmann::json& doc) -> HostSettings;
auto ToJson(const HostSettings& settings) -> nlohmann::json;
};  // namespace imxup

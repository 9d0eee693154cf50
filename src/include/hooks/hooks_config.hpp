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

#include <array>
#include <chrono>
#include <cstdint>
#include <json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imxup {
enum class HookEvent : uint8_t {
  ADDED = 0,
  STARTED,
  COMPLETED,
};

auto ToString(HookEvent event) -> std::string_view;
auto HookEventFromString(std::string_view name) -> std::optional<HookEvent>;

struct HookConfig {
  HookEvent                  event_   = HookEvent::COMPLETED;
  bool                       enabled_ = false;
  std::string                command_;
  std::chrono::seconds       timeout_{300};
  // JSON key of the hook's output copied into ext1..ext4. Empty leaves the field alone.
  std::array<std::string, 4> key_mapping_ = {"ext1", "ext2", "ext3", "ext4"};
  // A failing required hook fails the gallery
  bool                       required_    = false;
};

struct HooksConfig {
  bool                    parallel_execution_ = true;
  size_t                  max_parallel_       = 4;
  std::vector<HookConfig> hooks_;

  /**
   * @brief Enabled hooks with a command for `event`, in configuration order
   */
  auto                    ForEvent(HookEvent event) const -> std::vector<HookConfig>;
};

/**
 * @brief Read the "hooks" section of the application config. Missing keys take the defaults,
 *        an unknown event name throws std::runtime_error.
 */
auto ParseHooksConfig(const nlohmann::json& doc) -> HooksConfig;
auto ToJson(const HooksConfig& config) -> nlohmann::json;
};  // namespace imxup

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

#include "hooks/hooks_config.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace imxup {
using json = nlohmann::json;

auto ToString(HookEvent event) -> std::string_view {
  switch (event) {
    case HookEvent::ADDED:
      return "added";
    case HookEvent::STARTED:
      return "started";
    case HookEvent::COMPLETED:
      return "completed";
  }
  return "completed";
}

auto HookEventFromString(std::string_view name) -> std::optional<HookEvent> {
  auto lower = conv::ToLowerAscii(name);
  if (lower == "added") return HookEvent::ADDED;
  if (lower == "started") return HookEvent::STARTED;
  if (lower == "completed") return HookEvent::COMPLETED;
  return std::nullopt;
}

auto HooksConfig::ForEvent(HookEvent event) const -> std::vector<HookConfig> {
  std::vector<HookConfig> selected;
  for (const auto& hook : hooks_) {
    if (hook.event_ == event && hook.enabled_ && !conv::Trim(hook.command_).empty()) {
      selected.push_back(hook);
    }
  }
  return selected;
}

auto ParseHooksConfig(const json& doc) -> HooksConfig {
  HooksConfig config;
  if (!doc.is_object()) return config;
  config.parallel_execution_ = doc.value("parallel_execution", true);
  config.max_parallel_       = std::max<size_t>(doc.value("max_parallel", size_t{4}), 1);

  auto hooks                 = doc.find("hooks");
  if (hooks == doc.end() || !hooks->is_array()) return config;
  for (const auto& item : *hooks) {
    HookConfig hook;
    auto       event_name = item.value("event", std::string{"completed"});
    auto       event      = HookEventFromString(event_name);
    if (!event) {
      throw std::runtime_error(std::format("unknown hook event \"{}\"", event_name));
    }
    hook.event_    = *event;
    hook.enabled_  = item.value("enabled", true);
    hook.command_  = item.value("command", std::string{});
    hook.timeout_  = std::chrono::seconds(item.value("timeout", int64_t{300}));
    hook.required_ = item.value("required", false);
    if (auto mapping = item.find("key_mapping"); mapping != item.end() && mapping->is_object()) {
      for (size_t i = 0; i < hook.key_mapping_.size(); ++i) {
        auto field = std::format("ext{}", i + 1);
        if (mapping->contains(field)) {
          hook.key_mapping_[i] = conv::Trim((*mapping)[field].get<std::string>());
        }
      }
    }
    config.hooks_.push_back(std::move(hook));
  }
  return config;
}

auto ToJson(const HooksConfig& config) -> json {
  json hooks = json::array();
  for (const auto& hook : config.hooks_) {
    json mapping = json::object();
    for (size_t i = 0; i < hook.key_mapping_.size(); ++i) {
      mapping[std::format("ext{}", i + 1)] = hook.key_mapping_[i];
    }
    hooks.push_back({{"event", std::string(ToString(hook.event_))},
                     {"enabled", hook.enabled_},
                     {"command", hook.command_},
                     {"timeout", hook.timeout_.count()},
                     {"required", hook.required_},
                     {"key_mapping", mapping}});
  }
  return json{{"parallel_execution", config.parallel_execution_},
              {"max_parallel", config.max_parallel_},
              {"hooks", hooks}};
}
};  // namespace imxup

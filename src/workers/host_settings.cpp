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

#include "workers/host_settings.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace imxup {
auto ToString(HostTrigger trigger) -> std::string_view {
  switch (trigger) {
    case HostTrigger::DISABLED:
      return "disabled";
    case HostTrigger::ON_ADDED:
      return "on_added";
    case HostTrigger::ON_STARTED:
      return "on_started";
    case HostTrigger::ON_COMPLETED:
      return "on_completed";
  }
  return "disabled";
}

auto HostTriggerFromString(std::string_view name) -> std::optional<HostTrigger> {
  for (auto trigger : {HostTrigger::DISABLED, HostTrigger::ON_ADDED, HostTrigger::ON_STARTED,
                       HostTrigger::ON_COMPLETED}) {
    if (ToString(trigger) == name) return trigger;
  }
  // Older config files stored the bare event name
  if (name == "added") return HostTrigger::ON_ADDED;
  if (name == "started") return HostTrigger::ON_STARTED;
  if (name == "completed") return HostTrigger::ON_COMPLETED;
  return std::nullopt;
}

auto ParseHostSettings(const nlohmann::json& doc) -> HostSettings {
  HostSettings settings;
  if (!doc.is_object()) return settings;

  settings.enabled_ = doc.value("enabled", settings.enabled_);
  if (doc.contains("trigger")) {
    auto name    = doc.at("trigger").get<std::string>();
    auto trigger = HostTriggerFromString(name);
    if (!trigger) throw std::runtime_error("Unknown host trigger: " + name);
    settings.trigger_ = *trigger;
  }
  settings.auto_retry_  = doc.value("auto_retry", settings.auto_retry_);
  settings.max_retries_ = std::max<int32_t>(0, doc.value("max_retries", settings.max_retries_));
  settings.credentials_ = doc.value("credentials", std::string{});
  return settings;
}

auto ToJson(const HostSettings& settings) -> nlohmann::json {
  return nlohmann::json{{"enabled", settings.enabled_},
                        {"trigger", std::string(ToString(settings.trigger_))},
                        {"auto_retry", settings.auto_retry_},
                        {"max_retries", settings.max_retries_},
                        {"credentials", settings.credentials_}};
}
};  // namespace imxup

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

#include "network/json_path.hpp"

#include <charconv>
#include <cmath>

namespace imxup {
namespace {
auto AsIndex(const std::string& segment) -> std::optional<size_t> {
  size_t index = 0;
  auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), index);
  if (ec != std::errc() || ptr != segment.data() + segment.size()) return std::nullopt;
  return index;
}
}  // namespace

auto JsonPath::Parse(std::string_view dotted) -> JsonPath {
  std::vector<std::string> segments;
  size_t                   start = 0;
  while (start <= dotted.size()) {
    auto dot = dotted.find('.', start);
    if (dot == std::string_view::npos) dot = dotted.size();
    if (dot > start) segments.emplace_back(dotted.substr(start, dot - start));
    start = dot + 1;
  }
  return JsonPath{std::move(segments)};
}

auto JsonPath::FromJson(const nlohmann::json& value) -> JsonPath {
  if (value.is_string()) return Parse(value.get<std::string>());
  if (!value.is_array()) return {};
  std::vector<std::string> segments;
  for (const auto& segment : value) {
    if (segment.is_string()) {
      segments.push_back(segment.get<std::string>());
    } else if (segment.is_number_integer()) {
      segments.push_back(std::to_string(segment.get<int64_t>()));
    }
  }
  return JsonPath{std::move(segments)};
}

auto JsonPath::ToString() const -> std::string {
  std::string out;
  for (const auto& segment : segments_) {
    if (!out.empty()) out.push_back('.');
    out += segment;
  }
  return out;
}

auto JsonPath::Find(const nlohmann::json& doc) const -> const nlohmann::json* {
  if (segments_.empty()) return nullptr;
  const nlohmann::json* node = &doc;
  for (const auto& segment : segments_) {
    if (node->is_object()) {
      auto it = node->find(segment);
      if (it == node->end()) return nullptr;
      node = &*it;
    } else if (node->is_array()) {
      auto index = AsIndex(segment);
      if (!index || *index >= node->size()) return nullptr;
      node = &(*node)[*index];
    } else {
      return nullptr;
    }
    if (node->is_null()) return nullptr;
  }
  return node;
}

auto JsonPath::FindString(const nlohmann::json& doc) const -> std::optional<std::string> {
  const auto* node = Find(doc);
  if (node == nullptr) return std::nullopt;
  if (node->is_string()) {
    auto value = node->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
  }
  if (node->is_number_integer()) return std::to_string(node->get<int64_t>());
  if (node->is_number()) return node->dump();
  if (node->is_boolean()) return node->get<bool>() ? "true" : "false";
  return std::nullopt;
}

auto JsonPath::FindInt(const nlohmann::json& doc) const -> std::optional<int64_t> {
  const auto* node = Find(doc);
  if (node == nullptr) return std::nullopt;
  if (node->is_number_integer()) return node->get<int64_t>();
  if (node->is_number()) return static_cast<int64_t>(std::llround(node->get<double>()));
  if (node->is_string()) {
    const auto& text  = node->get_ref<const std::string&>();
    int64_t     value = 0;
    auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc() && ptr == text.data() + text.size()) return value;
  }
  return std::nullopt;
}
};  // namespace imxup

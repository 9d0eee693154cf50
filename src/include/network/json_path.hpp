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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imxup {
/**
 * @brief Path into a JSON document, written "data.files.0.url" or as a JSON array
 *        ["data", "files", 0, "url"]. A numeric segment indexes an array and is an ordinary
 *        key on an object.
 */
class JsonPath {
 public:
  JsonPath() = default;
  explicit JsonPath(std::vector<std::string> segments) : segments_(std::move(segments)) {}

  static auto Parse(std::string_view dotted) -> JsonPath;
  /**
   * @brief Accepts a dotted string, an array of keys and indices, or null (empty path)
   */
  static auto FromJson(const nlohmann::json& value) -> JsonPath;

  auto        Empty() const -> bool { return segments_.empty(); }
  auto        ToString() const -> std::string;

  /**
   * @return the addressed node, nullptr when any segment is missing or the node is null
   */
  auto        Find(const nlohmann::json& doc) const -> const nlohmann::json*;

  /**
   * @brief Scalar value as text. Numbers and booleans are printed, objects and arrays yield
   *        nullopt as do missing nodes and empty strings.
   */
  auto        FindString(const nlohmann::json& doc) const -> std::optional<std::string>;
  auto        FindInt(const nlohmann::json& doc) const -> std::optional<int64_t>;

 private:
  std::vector<std::string> segments_;
};
};  // namespace imxup

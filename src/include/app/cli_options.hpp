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

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "app/app_config.hpp"
#include "type/type.hpp"

namespace imxup {
inline constexpr std::string_view kImxupVersion = "1.0.0";

inline constexpr int              kExitOk       = 0;
inline constexpr int              kExitFailure  = 1;
inline constexpr int              kExitUsage    = 2;

class CliError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct CliGallery {
  file_path_t path_;
  std::string name_;
};

struct CliOptions {
  std::vector<CliGallery> galleries_;
  std::optional<int32_t>  thumb_size_;
  std::optional<int32_t>  content_type_;
  file_path_t             config_;
  bool                    debug_   = false;
  bool                    help_    = false;
  bool                    version_ = false;
  bool                    gui_     = false;
};

/**
 * @brief Parse the arguments after the program name. `--name` names the folder given just
 *        before it, or the next one when no folder came yet. Throws CliError on bad usage.
 */
auto ParseCliArgs(const std::vector<std::string>& args) -> CliOptions;
auto CliUsage() -> std::string;

/**
 * @brief 0 keeps proportional thumbnails, 1 asks for square ones
 */
auto ThumbnailFormatForContentType(int32_t content_type) -> int32_t;
void ApplyCliOverrides(const CliOptions& options, AppConfig& config);
};  // namespace imxup

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
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "concurrency/thread_pool.hpp"
#include "hooks/hooks_config.hpp"
#include "hooks/process_runner.hpp"
#include "queue/gallery.hpp"
#include "type/type.hpp"

namespace imxup {
/**
 * @brief Values available to hook command templates
 *
 * | token | value                  | token     | value            |
 * |-------|------------------------|-----------|------------------|
 * | %N    | gallery name           | %g        | primary gallery id |
 * | %T    | tab name               | %j        | JSON artifact    |
 * | %p    | gallery folder         | %b        | BBCode artifact  |
 * | %C    | image count            | %z        | zip archive      |
 * | %s    | size in bytes          | %e1..%e4  | ext fields       |
 * | %t    | template name          | %c1..%c4  | custom fields    |
 */
struct HookContext {
  std::string                gallery_name_;
  std::string                tab_name_ = "Main";
  file_path_t                gallery_path_;
  int32_t                    image_count_ = 0;
  int64_t                    size_bytes_  = 0;
  std::string                template_name_;
  std::string                gallery_id_;
  file_path_t                json_path_;
  file_path_t                bbcode_path_;
  // An empty path makes %z build a temporary archive of gallery_path_
  file_path_t                zip_path_;
  std::array<std::string, 4> ext_;
  std::array<std::string, 4> custom_;

  static auto                FromGallery(const Gallery& gallery) -> HookContext;
};

struct HookOutcome {
  // False only when a required hook failed
  bool                                      success_ = true;
  // Fields produced by the hooks' JSON output
  std::array<std::optional<std::string>, 4> ext_;
  std::vector<std::string>                  failures_;
  size_t                                    executed_ = 0;

  auto                                      AnyExt() const -> bool;
};

using CommandRunner =
    std::function<ProcessResult(const std::string& command, std::chrono::milliseconds timeout)>;

/**
 * @brief Runs the external programs configured for gallery lifecycle events.
 *
 * Hooks of one event run on the hook pool when parallel execution is enabled and more than one
 * is configured, otherwise one after another with the ext values of each hook visible to the
 * next. A hook failure is logged and reported in the outcome; it fails the gallery only when
 * the hook is marked required.
 */
class HooksExecutor {
 public:
  HooksExecutor(HooksConfig config, file_path_t temp_dir, CommandRunner runner = RunShellCommand);

  HooksExecutor(const HooksExecutor&)            = delete;
  HooksExecutor& operator=(const HooksExecutor&) = delete;

  auto        Execute(HookEvent event, const HookContext& context) -> HookOutcome;

  void        UpdateConfig(HooksConfig config);
  auto        Config() const -> HooksConfig;

  /**
   * @brief Expand the tokens of `templ` in one left-to-right pass. Two-character tokens are
   *        matched before one-character ones; unknown tokens are kept verbatim and substituted
   *        values are never expanded again.
   */
  static auto Substitute(const std::string& templ, const HookContext& context) -> std::string;

 private:
  struct SingleResult {
    bool                          ok_ = false;
    std::string                   message_;
    std::optional<nlohmann::json> output_;
  };

  auto RunOne(const HookConfig& hook, HookContext context) -> SingleResult;

  mutable std::mutex    config_mutex_;
  HooksConfig           config_;
  file_path_t           temp_dir_;
  CommandRunner         runner_;
  std::atomic<uint64_t> archive_counter_{0};
  ThreadPool            pool_;
};
};  // namespace imxup

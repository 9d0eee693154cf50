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

#include "hooks/hooks_executor.hpp"

#include <easy/profiler.h>
#include <glog/logging.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <future>
#include <string_view>
#include <utility>

#include "utils/archive/zip_writer.hpp"
#include "utils/string/convert.hpp"

namespace imxup {
using json = nlohmann::json;

namespace {
constexpr size_t kLogSnippet = 500;

auto JsonValueText(const json& value) -> std::string {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

/**
 * @brief Folder that only exists for the duration of one hook run
 */
class ScratchDir {
 public:
  explicit ScratchDir(file_path_t path) : path_(std::move(path)) {
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScratchDir(const ScratchDir&)            = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  auto Path() const -> const file_path_t& { return path_; }

 private:
  file_path_t path_;
};
}  // namespace

auto HookContext::FromGallery(const Gallery& gallery) -> HookContext {
  HookContext context;
  context.gallery_name_  = gallery.name_.empty() ? gallery.path_.filename().string() : gallery.name_;
  context.gallery_path_  = gallery.path_;
  context.image_count_   = gallery.total_images_;
  context.size_bytes_    = gallery.total_size_;
  context.template_name_ = gallery.template_name_;
  context.gallery_id_    = gallery.host_gallery_id_;
  context.ext_           = gallery.ext_;
  context.custom_        = gallery.custom_;
  return context;
}

auto HookOutcome::AnyExt() const -> bool {
  return std::any_of(ext_.begin(), ext_.end(), [](const auto& v) { return v.has_value(); });
}

HooksExecutor::HooksExecutor(HooksConfig config, file_path_t temp_dir, CommandRunner runner)
    : config_(std::move(config)),
      temp_dir_(std::move(temp_dir)),
      runner_(std::move(runner)),
      pool_(config_.max_parallel_) {}

void HooksExecutor::UpdateConfig(HooksConfig config) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  config_ = std::move(config);
}

auto HooksExecutor::Config() const -> HooksConfig {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return config_;
}

auto HooksExecutor::Substitute(const std::string& templ, const HookContext& context)
    -> std::string {
  auto        text = [](std::string_view v) { return conv::ToValidUtf8(v); };
  std::string out;
  out.reserve(templ.size());
  for (size_t i = 0; i < templ.size(); ++i) {
    if (templ[i] != '%' || i + 1 >= templ.size()) {
      out.push_back(templ[i]);
      continue;
    }
    const char key = templ[i + 1];
    // Two-character tokens first: %e1 must never read as %e followed by "1"
    if ((key == 'e' || key == 'c') && i + 2 < templ.size() && templ[i + 2] >= '1' &&
        templ[i + 2] <= '4') {
      size_t slot = static_cast<size_t>(templ[i + 2] - '1');
      out += text(key == 'e' ? context.ext_[slot] : context.custom_[slot]);
      i += 2;
      continue;
    }
    std::optional<std::string> value;
    switch (key) {
      case 'N':
        value = text(context.gallery_name_);
        break;
      case 'T':
        value = text(context.tab_name_);
        break;
      case 'p':
        value = text(context.gallery_path_.string());
        break;
      case 'C':
        value = std::to_string(context.image_count_);
        break;
      case 's':
        value = std::to_string(context.size_bytes_);
        break;
      case 't':
        value = text(context.template_name_);
        break;
      case 'g':
        value = text(context.gallery_id_);
        break;
      case 'j':
        value = text(context.json_path_.string());
        break;
      case 'b':
        value = text(context.bbcode_path_.string());
        break;
      case 'z':
        value = text(context.zip_path_.string());
        break;
      default:
        break;
    }
    if (!value) {
      out.push_back('%');
      continue;
    }
    out += *value;
    ++i;
  }
  return out;
}

auto HooksExecutor::RunOne(const HookConfig& hook, HookContext context) -> SingleResult {
  SingleResult                 result;
  const auto                   event = ToString(hook.event_);

  std::unique_ptr<ScratchDir>    scratch;
  std::unique_ptr<ScopedArchive> archive;
  if (conv::Contains(hook.command_, "%z") && context.zip_path_.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(context.gallery_path_, ec)) {
      result.message_ = std::format("{} hook needs an archive but {} is not a folder", event,
                                    context.gallery_path_.string());
      return result;
    }
    try {
      scratch = std::make_unique<ScratchDir>(
          temp_dir_ / std::format("hook_{}", archive_counter_.fetch_add(1)));
      archive = std::make_unique<ScopedArchive>(
          context.gallery_path_,
          scratch->Path() / (context.gallery_path_.filename().string() + ".zip"));
    } catch (const std::exception& e) {
      result.message_ = std::format("{} hook: temporary archive failed: {}", event, e.what());
      return result;
    }
    context.zip_path_ = archive->Path();
    LOG(INFO) << "[hooks] created temporary archive " << archive->Path().string();
  }

  auto command = Substitute(hook.command_, context);
  LOG(INFO) << "[hooks] running " << event << " hook: " << command;

  ProcessResult process;
  try {
    process = runner_(command, std::chrono::duration_cast<std::chrono::milliseconds>(hook.timeout_));
  } catch (const std::exception& e) {
    result.message_ = std::format("{} hook could not start: {}", event, e.what());
    return result;
  }

  if (!process.stderr_.empty()) {
    LOG(INFO) << "[hooks] " << event << " stderr: " << process.stderr_.substr(0, kLogSnippet);
  }
  if (process.timed_out_) {
    result.message_ = std::format("{} hook timed out after {} s and was killed", event,
                                  hook.timeout_.count());
    return result;
  }
  if (process.exit_code_ != 0) {
    result.message_ = std::format("{} hook failed with exit code {}", event, process.exit_code_);
    return result;
  }

  result.ok_ = true;
  auto body  = conv::Trim(process.stdout_);
  if (!body.empty()) {
    VLOG(1) << "[hooks] " << event << " stdout: " << body.substr(0, kLogSnippet);
    auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      LOG(WARNING) << "[hooks] " << event << " hook output is not a JSON object, ignoring it";
    } else {
      result.output_ = std::move(doc);
    }
  }
  return result;
}

auto HooksExecutor::Execute(HookEvent event, const HookContext& context) -> HookOutcome {
  EASY_BLOCK("HooksExecutor::Execute");
  HookOutcome outcome;
  auto        config = Config();
  auto        hooks  = config.ForEvent(event);
  if (hooks.empty()) {
    VLOG(1) << "[hooks] nothing configured for " << ToString(event);
    return outcome;
  }

  auto record = [&](const HookConfig& hook, const SingleResult& result, HookContext* next) {
    ++outcome.executed_;
    if (!result.ok_) {
      LOG(ERROR) << "[hooks] " << result.message_;
      outcome.failures_.push_back(result.message_);
      if (hook.required_) outcome.success_ = false;
      return;
    }
    if (!result.output_) return;
    for (size_t i = 0; i < hook.key_mapping_.size(); ++i) {
      const auto& key = hook.key_mapping_[i];
      if (key.empty()) continue;
      auto it = result.output_->find(key);
      if (it == result.output_->end() || it->is_null()) continue;
      auto value = conv::ToValidUtf8(JsonValueText(*it));
      // In sequential mode later hooks overwrite, in parallel mode the first hook wins
      if (next != nullptr) {
        outcome.ext_[i] = value;
        next->ext_[i]   = value;
      } else if (!outcome.ext_[i]) {
        outcome.ext_[i] = value;
      }
      VLOG(1) << "[hooks] " << key << " -> ext" << (i + 1) << ": " << value;
    }
  };

  if (config.parallel_execution_ && hooks.size() > 1) {
    LOG(INFO) << "[hooks] running " << hooks.size() << " " << ToString(event)
              << " hooks in parallel";
    std::vector<std::future<SingleResult>> futures;
    futures.reserve(hooks.size());
    for (const auto& hook : hooks) {
      futures.push_back(pool_.SubmitWithResult([this, hook, context] { return RunOne(hook, context); }));
    }
    for (size_t i = 0; i < hooks.size(); ++i) {
      SingleResult result;
      try {
        result = futures[i].get();
      } catch (const std::exception& e) {
        result.message_ = std::format("{} hook raised: {}", ToString(event), e.what());
      }
      record(hooks[i], result, nullptr);
    }
  } else {
    HookContext running = context;
    for (const auto& hook : hooks) {
      record(hook, RunOne(hook, running), &running);
    }
  }

  LOG(INFO) << "[hooks] " << ToString(event) << " done: " << outcome.executed_ << " run, "
            << outcome.failures_.size() << " failed";
  return outcome;
}
};  // namespace imxup

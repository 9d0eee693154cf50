#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "network/file_host_client.hpp"

namespace imxup::test {
/**
 * @brief State shared between a test and the FakeFileHostClient it handed to a worker
 */
struct FakeHostState {
  using UploadFn = std::function<UploadOutcome(const file_path_t&, const TransferControl&)>;

  std::mutex                  mutex_;
  // Answers used in order, then fallback_
  std::deque<UploadFn>        script_;
  UploadFn                    fallback_;
  std::vector<std::string>    uploaded_names_;
  std::vector<int64_t>        uploaded_sizes_;
  CallOutcome                 credentials_{true};
  std::optional<StorageQuota> quota_;

  std::atomic<int>            uploads_{0};
  std::atomic<int>            credential_checks_{0};
  std::atomic<int>            quota_calls_{0};

  static auto Succeed(const std::string& url) -> UploadFn {
    return [url](const file_path_t& file, const TransferControl& control) {
      auto size = static_cast<int64_t>(std::filesystem::file_size(file));
      if (control.progress_) {
        control.progress_({size / 2, size, 1000.0});
        control.progress_({size, size, 1000.0});
      }
      UploadOutcome outcome;
      outcome.success_      = true;
      outcome.url_          = url;
      outcome.file_id_      = "fid-" + file.filename().string();
      outcome.raw_response_ = R"({"status":"ok"})";
      return outcome;
    };
  }

  static auto Failure(FailureKind kind, const std::string& message) -> UploadFn {
    return [kind, message](const file_path_t&, const TransferControl&) {
      UploadOutcome outcome;
      outcome.failure_ = kind;
      outcome.message_ = message;
      return outcome;
    };
  }

  void Then(UploadFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(std::move(fn));
  }
};

class FakeFileHostClient : public FileHostClient {
 public:
  explicit FakeFileHostClient(std::shared_ptr<FakeHostState> state) : state_(std::move(state)) {}

  auto Upload(const file_path_t& file, const TransferControl& control) -> UploadOutcome override {
    FakeHostState::UploadFn fn;
    {
      std::lock_guard<std::mutex> lock(state_->mutex_);
      state_->uploaded_names_.push_back(file.filename().string());
      std::error_code ec;
      auto            size = std::filesystem::file_size(file, ec);
      state_->uploaded_sizes_.push_back(ec ? -1 : static_cast<int64_t>(size));
      if (!state_->script_.empty()) {
        fn = std::move(state_->script_.front());
        state_->script_.pop_front();
      } else {
        fn = state_->fallback_ ? state_->fallback_
                               : FakeHostState::Succeed("https://files.test/" +
                                                        file.filename().string());
      }
    }
    ++state_->uploads_;
    return fn(file, control);
  }

  auto TestCredentials() -> CallOutcome override {
    ++state_->credential_checks_;
    std::lock_guard<std::mutex> lock(state_->mutex_);
    return state_->credentials_;
  }

  auto GetStorageQuota() -> std::optional<StorageQuota> override {
    ++state_->quota_calls_;
    std::lock_guard<std::mutex> lock(state_->mutex_);
    return state_->quota_;
  }

  auto DeleteFile(const std::string&) -> CallOutcome override { return CallOutcome{true}; }

 private:
  std::shared_ptr<FakeHostState> state_;
};
}  // namespace imxup::test

#pragma once

#include <atomic>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "network/primary_host_client.hpp"

namespace imxup::test {
/**
 * @brief Primary host stand-in. Every image succeeds unless a failure was scripted for its
 *        file name; the first image sent with create_gallery opens gallery "G<n>".
 */
class FakePrimaryHostClient : public PrimaryHostClient {
 public:
  using HookFn = std::function<void(const std::string& file_name)>;

  auto UploadImage(const ImageUploadRequest& request, const TransferControl& control)
      -> ImageUploadResult override {
    auto              name = request.file_.filename().string();
    ImageUploadResult result;
    FailureKind       scripted = FailureKind::NONE;
    HookFn            hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      attempts_.push_back(name);
      requests_.push_back(request);
      auto it = failures_.find(name);
      if (it != failures_.end() && !it->second.empty()) {
        scripted = it->second.front();
        it->second.pop_front();
      }
      hook = before_return_;
    }

    auto size = static_cast<int64_t>(std::filesystem::file_size(request.file_));
    if (control.progress_) control.progress_({size / 2, size, 1000.0});
    if (control.should_stop_ && control.should_stop_()) {
      result.failure_ = FailureKind::CANCELLED;
      result.message_ = "cancelled";
      return result;
    }
    if (control.progress_) control.progress_({size, size, 1000.0});

    if (scripted != FailureKind::NONE) {
      result.failure_ = scripted;
      result.message_ = "scripted " + std::string(ToString(scripted));
    } else {
      std::lock_guard<std::mutex> lock(mutex_);
      result.success_    = true;
      result.gallery_id_ = request.create_gallery_ ? "G" + std::to_string(++galleries_created_)
                                                   : request.gallery_id_;
      result.image_url_  = "https://imx.test/i/" + name;
      result.thumb_url_  = "https://imx.test/u/t/" + name;
      uploaded_.push_back(name);
    }
    if (hook) hook(name);
    return result;
  }

  auto GalleryUrl(const std::string& gallery_id) const -> std::string override {
    return "https://imx.test/g/" + gallery_id;
  }

  void FailNext(const std::string& file_name, FailureKind kind, int times = 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < times; ++i) failures_[file_name].push_back(kind);
  }

  void OnUpload(HookFn hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    before_return_ = std::move(hook);
  }

  auto Uploaded() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploaded_;
  }

  auto Attempts() -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
  }

  auto Requests() -> std::vector<ImageUploadRequest> {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  std::mutex                                          mutex_;
  std::map<std::string, std::deque<FailureKind>>      failures_;
  std::vector<std::string>                            attempts_;
  std::vector<std::string>                            uploaded_;
  std::vector<ImageUploadRequest>                     requests_;
  HookFn                                              before_return_;
  int                                                 galleries_created_ = 0;
};
}  // namespace imxup::test

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

#include "queue/gallery_scanner.hpp"

#include <exiv2/exiv2.hpp>
#include <glog/logging.h>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "queue/image_files.hpp"

namespace imxup {
auto SampleDimensions(const file_path_t& folder, std::vector<GalleryFile>& files)
    -> ImageDimensions {
  ImageDimensions dims;
  if (files.empty()) return dims;

  size_t           n       = files.size();
  std::set<size_t> indices = {0, n / 3, (2 * n) / 3, n - 1};

  double           min_w = std::numeric_limits<double>::max(), max_w = 0.0, sum_w = 0.0;
  double           min_h = std::numeric_limits<double>::max(), max_h = 0.0, sum_h = 0.0;
  size_t           sampled = 0;
  for (auto idx : indices) {
    auto& file = files[idx];
    try {
      Exiv2::Image::UniquePtr image = Exiv2::ImageFactory::open((folder / file.file_name_).string());
      image->readMetadata();
      file.width_  = static_cast<int32_t>(image->pixelWidth());
      file.height_ = static_cast<int32_t>(image->pixelHeight());
    } catch (const Exiv2::Error& e) {
      LOG(WARNING) << "[scan] cannot read dimensions of " << file.file_name_ << ": " << e.what();
      continue;
    }
    if (file.width_ <= 0 || file.height_ <= 0) continue;
    double w = file.width_, h = file.height_;
    min_w = std::min(min_w, w);
    max_w = std::max(max_w, w);
    min_h = std::min(min_h, h);
    max_h = std::max(max_h, h);
    sum_w += w;
    sum_h += h;
    ++sampled;
  }
  if (sampled == 0) return dims;
  dims.min_width_  = min_w;
  dims.max_width_  = max_w;
  dims.avg_width_  = sum_w / static_cast<double>(sampled);
  dims.min_height_ = min_h;
  dims.max_height_ = max_h;
  dims.avg_height_ = sum_h / static_cast<double>(sampled);
  return dims;
}

GalleryScanner::GalleryScanner(QueueManager& queue) : queue_(queue) {}

GalleryScanner::~GalleryScanner() { Stop(); }

void GalleryScanner::Start() {
  if (running_.exchange(true)) return;
  worker_ = std::thread([this] { Run(); });
}

void GalleryScanner::Stop() {
  if (!running_.exchange(false)) return;
  requests_.close();
  if (worker_.joinable()) worker_.join();
}

void GalleryScanner::Submit(gallery_id_t id) {
  if (!requests_.push(id)) {
    LOG(WARNING) << "[scan] scanner stopped, gallery " << id << " not scanned";
  }
}

void GalleryScanner::Run() {
  while (auto id = requests_.pop()) {
    try {
      ScanNow(*id);
    } catch (const StorageUnavailableError& e) {
      LOG(ERROR) << "[scan] gallery " << *id << " left unscanned: " << e.what();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[scan] gallery " << *id << " scan aborted: " << e.what();
    }
  }
}

void GalleryScanner::RejectValidation(gallery_id_t id, const std::string& message) {
  LOG(WARNING) << "[scan] gallery " << id << " rejected: " << message;
  GalleryPatch patch;
  patch.error_kind_    = ErrorKind::VALIDATION;
  patch.error_message_ = message;
  if (!queue_.UpdateFields(id, patch)) {
    LOG(WARNING) << "[scan] gallery " << id << " vanished before it could be rejected";
  }
}

auto GalleryScanner::ScanNow(gallery_id_t id) -> bool {
  auto gallery = queue_.Get(id);
  if (!gallery || gallery->state_ != GalleryState::VALIDATING) return false;
  // A rejected gallery stays in Validating, it is not scanned again
  if (gallery->error_kind_ == ErrorKind::VALIDATION) return false;

  const auto&     folder = gallery->path_;
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    RejectValidation(id, "Folder not found: " + folder.string());
    return false;
  }

  std::vector<std::string> names;
  auto                     recorded = queue_.GetFiles(id);
  if (recorded.empty()) {
    names = ListImageFiles(folder);
  } else {
    for (const auto& file : recorded) names.push_back(file.file_name_);
  }
  if (names.empty()) {
    RejectValidation(id, "No images found in " + folder.string());
    return false;
  }
  for (const auto& name : names) {
    if (!HasImageSignature(folder / name)) {
      RejectValidation(id, "Not a valid image file: " + name);
      return false;
    }
  }

  if (queue_.Transition(id, {GalleryState::VALIDATING}, GalleryState::SCANNING) !=
      TransitionStatus::OK) {
    return false;
  }

  GalleryPatch patch;
  try {
    auto files = DescribeFiles(folder, names);
    patch.dims_ = SampleDimensions(folder, files);
    queue_.SetFiles(id, files);
  } catch (const std::filesystem::filesystem_error& e) {
    GalleryPatch failed;
    failed.error_kind_    = ErrorKind::VALIDATION;
    failed.error_message_ = e.what();
    auto status = queue_.Transition(id, {GalleryState::SCANNING}, GalleryState::FAILED, failed);
    LOG(ERROR) << "[scan] gallery " << id << " failed while scanning (" << ToString(status)
               << "): " << e.what();
    return false;
  }

  patch.error_kind_    = ErrorKind::NONE;
  patch.error_message_ = "";
  if (queue_.Transition(id, {GalleryState::SCANNING}, GalleryState::READY, patch) !=
      TransitionStatus::OK) {
    return false;
  }
  LOG(INFO) << "[scan] gallery " << id << " ready with " << names.size() << " images";
  if (gallery->auto_start_) {
    auto status = queue_.Transition(id, {GalleryState::READY}, GalleryState::QUEUED);
    if (status != TransitionStatus::OK) {
      LOG(WARNING) << "[scan] auto-start of gallery " << id << ": " << ToString(status);
    }
  }
  return true;
}
};  // namespace imxup

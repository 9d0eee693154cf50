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

#include "queue/gallery.hpp"

#include <algorithm>

namespace imxup {
auto ToString(GalleryState state) -> std::string_view {
  switch (state) {
    case GalleryState::VALIDATING:
      return "validating";
    case GalleryState::SCANNING:
      return "scanning";
    case GalleryState::READY:
      return "ready";
    case GalleryState::QUEUED:
      return "queued";
    case GalleryState::UPLOADING:
      return "uploading";
    case GalleryState::PAUSED:
      return "paused";
    case GalleryState::COMPLETED:
      return "completed";
    case GalleryState::FAILED:
      return "failed";
    case GalleryState::INCOMPLETE:
      return "incomplete";
  }
  return "unknown";
}

auto ToString(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::NONE:
      return "none";
    case ErrorKind::NETWORK:
      return "network";
    case ErrorKind::AUTH:
      return "auth";
    case ErrorKind::QUOTA:
      return "quota";
    case ErrorKind::REJECTED:
      return "rejected";
    case ErrorKind::VALIDATION:
      return "validation";
    case ErrorKind::STORAGE:
      return "storage";
    case ErrorKind::CANCELLED:
      return "cancelled";
    case ErrorKind::HOOK:
      return "hook";
  }
  return "unknown";
}

auto ToString(TransitionStatus status) -> std::string_view {
  switch (status) {
    case TransitionStatus::OK:
      return "ok";
    case TransitionStatus::CONFLICT:
      return "conflict";
    case TransitionStatus::INVALID_TRANSITION:
      return "invalid transition";
    case TransitionStatus::NOT_FOUND:
      return "not found";
  }
  return "unknown";
}

auto ToString(HostUploadState state) -> std::string_view {
  switch (state) {
    case HostUploadState::PENDING:
      return "pending";
    case HostUploadState::UPLOADING:
      return "uploading";
    case HostUploadState::COMPLETED:
      return "completed";
    case HostUploadState::FAILED:
      return "failed";
    case HostUploadState::CANCELLED:
      return "cancelled";
  }
  return "unknown";
}

auto GalleryStateFromString(std::string_view name) -> std::optional<GalleryState> {
  for (uint8_t i = 0; i <= static_cast<uint8_t>(GalleryState::INCOMPLETE); ++i) {
    auto state = static_cast<GalleryState>(i);
    if (ToString(state) == name) return state;
  }
  return std::nullopt;
}

auto IsValidTransition(GalleryState from, GalleryState to) -> bool {
  using S = GalleryState;
  switch (from) {
    case S::VALIDATING:
      return to == S::SCANNING;
    case S::SCANNING:
      return to == S::READY || to == S::FAILED;
    case S::READY:
      return to == S::QUEUED;
    case S::QUEUED:
      return to == S::UPLOADING || to == S::PAUSED || to == S::READY;
    case S::UPLOADING:
      return to == S::COMPLETED || to == S::FAILED || to == S::INCOMPLETE || to == S::PAUSED;
    case S::PAUSED:
      return to == S::QUEUED || to == S::UPLOADING;
    case S::COMPLETED:
    case S::FAILED:
    case S::INCOMPLETE:
      return false;
  }
  return false;
}

auto IsTerminal(GalleryState state) -> bool {
  return state == GalleryState::COMPLETED || state == GalleryState::FAILED ||
         state == GalleryState::INCOMPLETE;
}

auto GalleryPatch::Empty() const -> bool {
  auto any_set = [](const auto& arr) {
    return std::any_of(arr.begin(), arr.end(), [](const auto& v) { return v.has_value(); });
  };
  return !name_ && !template_name_ && !started_ts_ && !finished_ts_ && !total_images_ &&
         !uploaded_images_ && !total_size_ && !uploaded_bytes_ && !final_kibps_ &&
         !host_gallery_id_ && !gallery_url_ && !error_kind_ && !error_message_ && !any_set(ext_) &&
         !any_set(custom_) && !dims_ && !auto_start_;
}
};  // namespace imxup

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
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "type/type.hpp"

namespace imxup {
enum class GalleryState : uint8_t {
  VALIDATING = 0,
  SCANNING   = 1,
  READY      = 2,
  QUEUED     = 3,
  UPLOADING  = 4,
  PAUSED     = 5,
  COMPLETED  = 6,
  FAILED     = 7,
  INCOMPLETE = 8,
};

enum class ErrorKind : uint8_t {
  NONE = 0,
  NETWORK,
  AUTH,
  QUOTA,
  REJECTED,
  VALIDATION,
  STORAGE,
  CANCELLED,
  HOOK,
};

enum class UploadMode : uint8_t {
  NEW = 0,  // DEFAULT
  RESUME,
  APPEND,
};

enum class TransitionStatus : uint8_t {
  OK = 0,
  CONFLICT,            // current state not in the caller's expected set
  INVALID_TRANSITION,  // edge does not exist in the state machine
  NOT_FOUND,
};

auto ToString(GalleryState state) -> std::string_view;
auto ToString(ErrorKind kind) -> std::string_view;
auto ToString(TransitionStatus status) -> std::string_view;
auto GalleryStateFromString(std::string_view name) -> std::optional<GalleryState>;

/**
 * @brief Edges of the gallery lifecycle. Paused may only return to the state it paused from,
 *        which the queue manager checks against the stored record.
 */
auto IsValidTransition(GalleryState from, GalleryState to) -> bool;
auto IsTerminal(GalleryState state) -> bool;

struct ImageDimensions {
  double min_width_  = 0.0;
  double max_width_  = 0.0;
  double avg_width_  = 0.0;
  double min_height_ = 0.0;
  double max_height_ = 0.0;
  double avg_height_ = 0.0;
};

struct Gallery {
  gallery_id_t                id_ = 0;
  file_path_t                 path_;
  std::string                 name_;
  std::string                 template_name_ = "default";
  GalleryState                state_         = GalleryState::VALIDATING;
  std::optional<GalleryState> paused_from_;

  unix_ts_t                   added_ts_        = 0;
  unix_ts_t                   started_ts_      = 0;
  unix_ts_t                   finished_ts_     = 0;

  int32_t                     total_images_    = 0;
  int32_t                     uploaded_images_ = 0;
  int64_t                     total_size_      = 0;
  int64_t                     uploaded_bytes_  = 0;
  double                      final_kibps_     = 0.0;

  // Identity on the primary host
  std::string                 host_gallery_id_;
  std::string                 gallery_url_;

  ErrorKind                   error_kind_ = ErrorKind::NONE;
  std::string                 error_message_;

  std::array<std::string, 4>  ext_;
  std::array<std::string, 4>  custom_;

  int64_t                     insertion_order_ = 0;
  gallery_id_t                parent_id_       = 0;
  UploadMode                  upload_mode_     = UploadMode::NEW;
  bool                        archived_        = false;
  bool                        auto_start_      = false;

  ImageDimensions             dims_;
};

struct GalleryFile {
  gallery_file_id_t id_         = 0;
  gallery_id_t      gallery_id_ = 0;
  int32_t           seq_        = 0;
  std::string       file_name_;
  int64_t           size_bytes_ = 0;
  int32_t           width_      = 0;
  int32_t           height_     = 0;
  bool              uploaded_   = false;
  unix_ts_t         uploaded_ts_ = 0;
  std::string       image_url_;
  std::string       thumb_url_;
};

/**
 * @brief Input of QueueManager::Enqueue
 */
struct NewGallery {
  file_path_t              path_;
  std::string              name_;
  std::string              template_name_ = "default";
  // Optional pre-scanned file list; empty means the scanner discovers it
  std::vector<GalleryFile> files_;
  bool                     auto_start_ = false;
};

struct GalleryFilter {
  std::vector<GalleryState>   states_;
  bool                        include_archived_ = false;
  std::optional<file_path_t>  path_;
  std::optional<gallery_id_t> parent_id_;
  size_t                      limit_ = 0;
};

/**
 * @brief Partial update. Unset members are left untouched. State is not part of a patch, it only
 *        moves through QueueManager::Transition.
 */
struct GalleryPatch {
  std::optional<std::string>                name_;
  std::optional<std::string>                template_name_;
  std::optional<unix_ts_t>                  started_ts_;
  std::optional<unix_ts_t>                  finished_ts_;
  std::optional<int32_t>                    total_images_;
  std::optional<int32_t>                    uploaded_images_;
  std::optional<int64_t>                    total_size_;
  std::optional<int64_t>                    uploaded_bytes_;
  std::optional<double>                     final_kibps_;
  std::optional<std::string>                host_gallery_id_;
  std::optional<std::string>                gallery_url_;
  std::optional<ErrorKind>                  error_kind_;
  std::optional<std::string>                error_message_;
  std::array<std::optional<std::string>, 4> ext_;
  std::array<std::optional<std::string>, 4> custom_;
  std::optional<ImageDimensions>            dims_;
  std::optional<bool>                       auto_start_;

  auto Empty() const -> bool;
};

enum class HostUploadState : uint8_t {
  PENDING = 0,
  UPLOADING,
  COMPLETED,
  FAILED,
  CANCELLED,
};

auto ToString(HostUploadState state) -> std::string_view;

struct HostUploadJob {
  host_job_id_t   id_          = 0;
  gallery_id_t    gallery_id_  = 0;
  host_id_t       host_id_;
  HostUploadState state_       = HostUploadState::PENDING;
  int32_t         retry_count_ = 0;
  int64_t         total_bytes_    = 0;
  int64_t         uploaded_bytes_ = 0;
  std::string     download_url_;
  std::string     file_id_;
  std::string     raw_response_;
  ErrorKind       error_kind_ = ErrorKind::NONE;
  std::string     error_message_;
  unix_ts_t       created_ts_  = 0;
  unix_ts_t       finished_ts_ = 0;
};

struct HostUploadFilter {
  std::optional<host_id_t>       host_id_;
  std::optional<gallery_id_t>    gallery_id_;
  std::vector<HostUploadState>   states_;
};

struct UnnamedGallery {
  std::string host_gallery_id_;
  std::string intended_name_;
  unix_ts_t   discovered_ts_ = 0;
};

/**
 * @brief Emitted on every successful state change
 */
struct GalleryEvent {
  gallery_id_t id_;
  GalleryState from_;
  GalleryState to_;
};
};  // namespace imxup

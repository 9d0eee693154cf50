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

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "network/primary_host_client.hpp"
#include "queue/gallery.hpp"
#include "queue/queue_manager.hpp"
#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"
#include "workers/worker_status_table.hpp"

namespace imxup {
inline const worker_id_t kPrimaryWorkerId = "primary";
// Name the primary host's transfers are recorded under in the host metrics
inline const host_id_t   kPrimaryMetricsHost = "imx.to";

/**
 * @brief Byte counter shared by the transfer tasks of one gallery. Only grows.
 */
class TransferCounter {
 public:
  /**
   * @brief Add a non-negative amount. Negative amounts are ignored.
   *
   * @return the value after the increment
   */
  auto Add(int64_t bytes) -> int64_t;
  auto Value() const -> int64_t { return value_.load(std::memory_order_acquire); }

 private:
  std::atomic<int64_t> value_{0};
};

/**
 * @brief Lifecycle callbacks of a gallery upload, invoked on the uploading thread
 */
class UploadListener {
 public:
  virtual ~UploadListener() = default;

  virtual void OnGalleryStarted(const Gallery& gallery) {}
  virtual void OnGalleryCreated(const Gallery& gallery, const std::string& host_gallery_id) {}
  virtual void OnGalleryFinished(const Gallery& gallery, GalleryState state,
                                 const std::optional<file_path_t>& artifact) {}
};

struct GalleryUploadReport {
  gallery_id_t               gallery_id_     = 0;
  GalleryState               state_          = GalleryState::FAILED;
  int32_t                    files_total_    = 0;
  int32_t                    files_uploaded_ = 0;
  // Files of this run that never succeeded
  int32_t                    files_failed_   = 0;
  int64_t                    bytes_sent_     = 0;
  double                     kibps_          = 0.0;
  std::string                host_gallery_id_;
  ErrorKind                  error_kind_ = ErrorKind::NONE;
  std::string                error_message_;
  std::optional<file_path_t> artifact_;
};

/**
 * @brief Uploads the images of claimed galleries to the primary host.
 *
 * A new gallery is created by its first successful image, the remaining images go through a
 * pool of `parallel_batch_size` tasks. Images already marked uploaded are skipped, so a resumed
 * or requeued gallery only sends what is missing. A stop request lets running transfers abort
 * at the next progress tick and starts no new ones.
 */
class UploadEngine {
 public:
  UploadEngine(PrimaryHostSettings settings, PrimaryHostClient& client, QueueManager& queue,
               WorkerStatusTable& status, file_path_t artifact_dir,
               SystemClockFn clock = TimeProvider::SystemClock(),
               SteadyClockFn steady = TimeProvider::SteadyClock());

  UploadEngine(const UploadEngine&)            = delete;
  UploadEngine& operator=(const UploadEngine&) = delete;

  void SetListener(UploadListener* listener) { listener_ = listener; }

  /**
   * @brief Take ownership of the oldest queued gallery by moving it to Uploading. Galleries
   *        claimed by someone else in the meantime are skipped.
   */
  auto ClaimNext() -> std::optional<Gallery>;

  /**
   * @brief Upload a gallery this caller owns. Returns nullopt when the gallery is not in
   *        Uploading or is already being uploaded.
   */
  auto UploadGallery(gallery_id_t id) -> std::optional<GalleryUploadReport>;

  /**
   * @brief ClaimNext followed by UploadGallery
   */
  auto RunNext() -> std::optional<GalleryUploadReport>;

  /**
   * @brief User stop: the gallery ends in Paused unless every image already made it
   */
  auto RequestStop(gallery_id_t id) -> bool;
  void RequestStopAll();
  /**
   * @brief Stop a gallery because of an error outside the transfers. It ends Failed, or
   *        Incomplete when images already made it.
   */
  auto Abort(gallery_id_t id, ErrorKind kind, const std::string& message) -> bool;

  auto ActiveGalleries() const -> std::vector<gallery_id_t>;

 private:
  struct ActiveUpload {
    gallery_id_t                          id_ = 0;
    std::atomic<bool>                     user_stop_{false};
    std::atomic<bool>                     fatal_stop_{false};
    TransferCounter                       sent_;
    std::atomic<int64_t>                  committed_bytes_{0};
    std::atomic<int32_t>                  files_done_{0};
    // Files already on the host when this run began
    int32_t                               files_at_start_ = 0;
    int64_t                               bytes_total_ = 0;
    uint64_t                              job_         = 0;
    std::chrono::steady_clock::time_point started_;

    std::mutex                            failure_mutex_;
    ErrorKind                             failure_ = ErrorKind::NONE;
    std::string                           failure_message_;

    auto Stopping() const -> bool { return user_stop_.load() || fatal_stop_.load(); }
  };

  auto UploadPass(ActiveUpload& active, const Gallery& gallery, std::vector<GalleryFile> files,
                  std::string& host_gallery_id) -> std::vector<GalleryFile>;
  auto UploadBatch(ActiveUpload& active, const Gallery& gallery, std::vector<GalleryFile> files,
                   const std::string& host_gallery_id) -> std::vector<GalleryFile>;
  auto UploadOne(ActiveUpload& active, const Gallery& gallery, const GalleryFile& file,
                 const std::string& host_gallery_id) -> ImageUploadResult;
  void RecordFailure(ActiveUpload& active, ErrorKind kind, const std::string& message);
  void ReportProgress(ActiveUpload& active);
  auto Finish(ActiveUpload& active, const Gallery& gallery, int32_t files_total,
              int32_t files_failed, const std::string& host_gallery_id) -> GalleryUploadReport;
  auto FailOnStorage(ActiveUpload& active, const Gallery& gallery, int32_t files_total,
                     const std::string& message) -> GalleryUploadReport;
  void ReleaseActive(gallery_id_t id);
  auto ElapsedSeconds(const ActiveUpload& active) const -> double;

  PrimaryHostSettings                                  settings_;
  PrimaryHostClient&                                   client_;
  QueueManager&                                        queue_;
  WorkerStatusTable&                                   status_;
  file_path_t                                          artifact_dir_;
  SystemClockFn                                        clock_;
  SteadyClockFn                                        steady_;
  UploadListener*                                      listener_ = nullptr;

  mutable std::mutex                                   active_mutex_;
  std::map<gallery_id_t, std::shared_ptr<ActiveUpload>> active_;
};
};  // namespace imxup

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

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "queue/gallery.hpp"
#include "queue/host_metrics.hpp"
#include "storage/controller/controller_types.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/storage_retry.hpp"
#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/queue/queue.hpp"
#include "utils/retry/backoff.hpp"

namespace imxup {
/**
 * @brief Result of the operations that create a follow-up record (requeue, append, rescan)
 */
struct FollowUpResult {
  TransitionStatus status_      = TransitionStatus::OK;
  // Id of the fresh record, 0 when nothing was created
  gallery_id_t     new_id_      = 0;
  size_t           file_count_  = 0;
};

/**
 * @brief System of record for galleries, their files and the secondary host jobs.
 *
 * Every mutation runs inside one transaction on a single writer connection guarded by one
 * mutex. Reads open their own connection. Contended writes are retried with the storage
 * backoff policy and end in StorageUnavailableError.
 */
class QueueManager {
 public:
  QueueManager(std::shared_ptr<DBController> db, BackoffPolicy storage_retry = {},
               SystemClockFn clock = TimeProvider::SystemClock(), SleepFn sleep = RealSleep());

  QueueManager(const QueueManager&)            = delete;
  QueueManager& operator=(const QueueManager&) = delete;

  /**
   * @brief Add a gallery in Validating state.
   *
   * @return the new id, or nullopt when a live record for the same folder already exists
   */
  auto Enqueue(const NewGallery& gallery) -> std::optional<gallery_id_t>;

  /**
   * @brief Move a gallery to `to` if its current state is one of `from` and the edge exists.
   *        The optional patch is written in the same transaction.
   */
  auto Transition(gallery_id_t id, const std::vector<GalleryState>& from, GalleryState to,
                  const GalleryPatch& patch = {}) -> TransitionStatus;

  auto Query(const GalleryFilter& filter = {}) -> std::vector<Gallery>;
  auto Get(gallery_id_t id) -> std::optional<Gallery>;
  auto UpdateFields(gallery_id_t id, const GalleryPatch& patch) -> bool;
  auto Remove(gallery_id_t id) -> bool;

  void SetFiles(gallery_id_t id, const std::vector<GalleryFile>& files);
  auto GetFiles(gallery_id_t id) -> std::vector<GalleryFile>;
  auto MarkFileUploaded(gallery_id_t id, gallery_file_id_t file_id, const std::string& image_url,
                        const std::string& thumb_url) -> bool;

  auto Resume(gallery_id_t id) -> TransitionStatus;
  auto Requeue(gallery_id_t id) -> FollowUpResult;
  auto AppendFiles(gallery_id_t id, const std::vector<std::string>& file_names) -> FollowUpResult;
  auto RescanAdditive(gallery_id_t id) -> FollowUpResult;

  /**
   * @brief Startup recovery: interrupted uploads become Incomplete, claimed host jobs go back
   *        to pending
   */
  void RecoverInterrupted();

  auto EnqueueHostUpload(gallery_id_t gallery_id, const host_id_t& host_id) -> host_job_id_t;
  auto GetHostUploads(const HostUploadFilter& filter) -> std::vector<HostUploadJob>;
  auto GetHostUpload(host_job_id_t job_id) -> std::optional<HostUploadJob>;
  auto UpdateHostUpload(const HostUploadJob& job) -> bool;
  auto ClaimHostUpload(host_job_id_t job_id) -> TransitionStatus;
  auto PendingHostUploads(const host_id_t& host_id) -> std::vector<HostUploadJob>;

  void AddUnnamed(const std::string& host_gallery_id, const std::string& intended_name);
  void RemoveUnnamed(const std::string& host_gallery_id);
  auto GetUnnamed() -> std::vector<UnnamedGallery>;

  /**
   * @brief Add a transfer outcome to the host's row for today and to its running total
   */
  void RecordTransfer(const TransferSample& sample);
  auto GetHostMetrics(const host_id_t& host, MetricsPeriod period) -> HostMetrics;
  /**
   * @brief Daily rows of the last `days` days, newest first
   */
  auto GetDailyMetrics(const host_id_t& host, int32_t days = 7) -> std::vector<HostMetrics>;
  auto MetricsHosts() -> std::vector<host_id_t>;
  /**
   * @brief Drop daily rows older than `days_to_keep` days. Running totals are kept.
   *
   * @return number of rows removed
   */
  auto PruneMetrics(int32_t days_to_keep = 90) -> int64_t;

  auto Events() -> EventChannel<GalleryEvent>& { return events_; }

 private:
  template <typename F>
  auto Write(const char* op, F&& fn) -> decltype(fn(std::declval<duckdb_connection&>()));
  template <typename F>
  auto Read(const char* op, F&& fn) -> decltype(fn(std::declval<duckdb_connection&>()));

  auto CreateFollowUp(duckdb_connection& conn, Gallery& source, std::vector<GalleryFile> files,
                      UploadMode mode) -> gallery_id_t;
  void InsertFiles(duckdb_connection& conn, gallery_id_t id, std::vector<GalleryFile> files);
  auto NowUnix() const -> unix_ts_t;
  // First day of a window of `days` days ending today
  auto MetricsSince(int32_t days) const -> std::string;

  std::shared_ptr<DBController> db_;
  ConnectionGuard               write_conn_;
  std::mutex                    write_mutex_;
  BackoffPolicy                 storage_retry_;
  SystemClockFn                 clock_;
  SleepFn                       sleep_;
  EventChannel<GalleryEvent>    events_;
};
};  // namespace imxup

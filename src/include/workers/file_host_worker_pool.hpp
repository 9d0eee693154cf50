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
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "network/file_host_client.hpp"
#include "network/host_config.hpp"
#include "queue/gallery.hpp"
#include "queue/queue_manager.hpp"
#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/queue/queue.hpp"
#include "workers/host_settings.hpp"
#include "workers/worker_status_table.hpp"

namespace imxup {
/**
 * @brief Builds the protocol client of one host. Called once per worker when the pool starts.
 */
using FileHostClientFactory = std::function<std::unique_ptr<FileHostClient>(
    const HostConfig& config, const HostSettings& settings)>;

auto ToErrorKind(FailureKind kind) -> ErrorKind;

/**
 * @brief Name of the archive uploaded for a gallery, "imxup_<id>_<name>.zip"
 */
auto HostArchiveName(const Gallery& gallery) -> std::string;

/**
 * @brief Long-lived uploader of one secondary host.
 *
 * Jobs are host upload ids taken in FIFO order. Each job is claimed in the queue store, the
 * gallery folder is packed into a store-mode archive in the temp directory, uploaded, and the
 * outcome is written back to the job. Live progress goes to the worker status table.
 */
class FileHostWorker {
 public:
  FileHostWorker(HostConfig config, HostSettings settings, std::unique_ptr<FileHostClient> client,
                 QueueManager& queue, WorkerStatusTable& status, file_path_t temp_dir,
                 SystemClockFn clock = TimeProvider::SystemClock());
  ~FileHostWorker();

  FileHostWorker(const FileHostWorker&)            = delete;
  FileHostWorker& operator=(const FileHostWorker&) = delete;

  /**
   * @brief Load the pending jobs of this host and start the worker thread
   */
  void Start();
  /**
   * @brief Stop after the current job. An interrupted transfer goes back to pending.
   */
  void Stop();
  auto Submit(host_job_id_t job_id) -> bool;

  void Pause();
  void Resume();
  auto Paused() const -> bool { return paused_.load(); }
  /**
   * @brief Abort the transfer in progress, the job ends Cancelled
   */
  void CancelCurrent();

  /**
   * @brief Test the credentials and refresh the storage quota unless a fresh one is cached
   */
  void SpinUp();
  void RefreshStorage(bool force = false);

  /**
   * @brief Run one job on the calling thread
   *
   * @return the state the job was left in, nullopt when it could not be claimed
   */
  auto ProcessNow(host_job_id_t job_id) -> std::optional<HostUploadState>;

  auto Id() const -> const worker_id_t& { return worker_id_; }
  auto HostId() const -> const host_id_t& { return config_.id_; }
  auto QueuedJobs() const -> size_t { return jobs_.size(); }

 private:
  void Run();
  void WaitWhilePaused();
  auto Finish(HostUploadJob job, HostUploadState state) -> HostUploadState;
  auto Fail(HostUploadJob job, FailureKind kind, const std::string& message) -> HostUploadState;
  void RecordTransfer(const TransferSample& sample);

  HostConfig                             config_;
  HostSettings                           settings_;
  std::unique_ptr<FileHostClient>        client_;
  QueueManager&                          queue_;
  WorkerStatusTable&                     status_;
  file_path_t                            temp_dir_;
  SystemClockFn                          clock_;
  worker_id_t                            worker_id_;

  ConcurrentBlockingQueue<host_job_id_t> jobs_;
  std::thread                            thread_;
  std::atomic<bool>                      running_{false};
  std::atomic<bool>                      stopping_{false};
  std::atomic<bool>                      cancel_current_{false};
  std::atomic<bool>                      paused_{false};
  std::mutex                             pause_mutex_;
  std::condition_variable                pause_cv_;
};

/**
 * @brief One FileHostWorker per enabled secondary host.
 *
 * Every configured host owns an entry in the worker status table: an active worker when the
 * host is enabled, a placeholder otherwise, so a lookup by host never misses.
 */
class FileHostWorkerPool {
 public:
  FileHostWorkerPool(QueueManager& queue, WorkerStatusTable& status,
                     FileHostClientFactory factory, file_path_t temp_dir,
                     SystemClockFn clock = TimeProvider::SystemClock());
  ~FileHostWorkerPool();

  FileHostWorkerPool(const FileHostWorkerPool&)            = delete;
  FileHostWorkerPool& operator=(const FileHostWorkerPool&) = delete;

  /**
   * @brief Replace the host set. Running workers are stopped, status entries rebuilt, and workers
   *        for the enabled hosts created (not started).
   */
  void Configure(const std::vector<HostConfig>& hosts, const HostSettingsMap& settings);
  void Start();
  void Stop();

  /**
   * @brief Queue a job on every enabled host whose trigger matches `event`. Hosts that already
   *        have a live or completed job for the gallery are skipped.
   *
   * @return ids of the jobs created
   */
  auto DispatchGallery(HostTrigger event, const Gallery& gallery) -> std::vector<host_job_id_t>;
  /**
   * @brief Manual upload of a gallery to one host, regardless of its trigger
   */
  auto Enqueue(gallery_id_t gallery_id, const host_id_t& host) -> std::optional<host_job_id_t>;
  /**
   * @brief Put a failed or cancelled job back to pending with a clean retry counter
   */
  auto Retry(host_job_id_t job_id) -> bool;

  /**
   * @return false when the host has no enabled worker
   */
  auto Pause(const host_id_t& host) -> bool;
  auto Resume(const host_id_t& host) -> bool;
  auto CancelCurrent(const host_id_t& host) -> bool;

  /**
   * @brief Direct access for driving a worker synchronously. The pointer is only valid until
   *        the next Configure.
   */
  auto Worker(const host_id_t& host) -> FileHostWorker*;
  auto EnabledHosts() const -> std::vector<host_id_t>;

 private:
  auto WithWorker(const host_id_t& host, const std::function<void(FileHostWorker&)>& fn) -> bool;

  QueueManager&                                      queue_;
  WorkerStatusTable&                                 status_;
  FileHostClientFactory                              factory_;
  file_path_t                                        temp_dir_;
  SystemClockFn                                      clock_;

  mutable std::mutex                                 mutex_;
  HostSettingsMap                                    settings_;
  std::vector<worker_id_t>                           entry_ids_;
  std::map<host_id_t, std::unique_ptr<FileHostWorker>> workers_;
  bool                                               started_ = false;
};
};  // namespace imxup

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

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/queue/queue.hpp"

namespace imxup {
enum class WorkerKind : uint8_t {
  PRIMARY = 0,
  FILE_HOST,
  RENAME,
};

auto ToString(WorkerKind kind) -> std::string_view;

auto FileHostWorkerId(const host_id_t& host) -> worker_id_t;

struct StorageSnapshot {
  std::optional<int64_t>                total_;
  std::optional<int64_t>                left_;
  std::chrono::system_clock::time_point fetched_;

  auto Fresh(std::chrono::system_clock::time_point now,
             std::chrono::minutes ttl = std::chrono::minutes{30}) const -> bool {
    return now - fetched_ < ttl;
  }
};

struct ActiveWorker {
  worker_id_t                    id_;
  WorkerKind                     kind_ = WorkerKind::FILE_HOST;
  std::string                    host_name_;
  std::string                    state_ = "idle";
  double                         speed_bps_ = 0.0;
  // Progress of the current job. job_ tells jobs apart so late updates of a finished job are
  // dropped instead of moving the new job's counters.
  uint64_t                       job_         = 0;
  int64_t                        bytes_done_  = 0;
  int64_t                        bytes_total_ = 0;
  int32_t                        files_done_  = 0;
  int32_t                        files_total_ = 0;
  std::string                    last_error_;
  std::optional<StorageSnapshot> storage_;
};

/**
 * @brief Stand-in for a configured host that has no running worker
 */
struct PlaceholderWorker {
  worker_id_t id_;
  WorkerKind  kind_ = WorkerKind::FILE_HOST;
  std::string host_name_;
  std::string reason_ = "disabled";
};

using WorkerEntry = std::variant<ActiveWorker, PlaceholderWorker>;

auto IdOf(const WorkerEntry& entry) -> const worker_id_t&;
auto IsPlaceholder(const WorkerEntry& entry) -> bool;

/**
 * @brief Live status of every worker, keyed by worker id and shared by the worker threads and
 *        the presentation layer.
 *
 * Every read and write takes the same mutex. Readers get copies, never references into the
 * table. Each mutation publishes a fresh snapshot on Channel().
 */
class WorkerStatusTable {
 public:
  using Snapshot = std::vector<WorkerEntry>;

  explicit WorkerStatusTable(SystemClockFn clock = TimeProvider::SystemClock());

  WorkerStatusTable(const WorkerStatusTable&)            = delete;
  WorkerStatusTable& operator=(const WorkerStatusTable&) = delete;

  void Put(WorkerEntry entry);
  void Remove(const worker_id_t& id);
  /**
   * @brief Replace the whole table, used when the configured host set changes
   */
  void Reset(std::vector<WorkerEntry> entries);

  auto Get(const worker_id_t& id) const -> std::optional<WorkerEntry>;
  auto Contains(const worker_id_t& id) const -> bool;
  auto TakeSnapshot() const -> Snapshot;

  /**
   * @brief Start a new job on an active worker: counters reset, error cleared
   *
   * @return the job number to pass to UpdateProgress
   */
  auto BeginJob(const worker_id_t& id, int64_t bytes_total, int32_t files_total = 0)
      -> std::optional<uint64_t>;
  /**
   * @brief Accept the counters only if they belong to the current job and do not go backwards.
   *
   * @return false when the update was dropped
   */
  auto UpdateProgress(const worker_id_t& id, uint64_t job, int64_t bytes_done,
                      int32_t files_done = -1, std::optional<double> speed_bps = std::nullopt)
      -> bool;
  void SetState(const worker_id_t& id, std::string state);
  void SetError(const worker_id_t& id, std::string error);
  void SetStorage(const worker_id_t& id, StorageSnapshot storage);
  /**
   * @brief Storage snapshot of a worker if one younger than `ttl` exists
   */
  auto FreshStorage(const worker_id_t& id, std::chrono::minutes ttl = std::chrono::minutes{30})
      const -> std::optional<StorageSnapshot>;

  /**
   * @brief Run `fn` on an active worker under the table lock. False when the id is unknown or
   *        a placeholder.
   */
  auto Modify(const worker_id_t& id, const std::function<void(ActiveWorker&)>& fn) -> bool;

  auto Channel() -> SnapshotChannel<Snapshot>& { return channel_; }

 private:
  void                                 PublishLocked();

  mutable std::mutex                   mutex_;
  std::map<worker_id_t, WorkerEntry>   entries_;
  uint64_t                             next_job_ = 1;
  SystemClockFn                        clock_;
  SnapshotChannel<Snapshot>            channel_;
};
};  // namespace imxup

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

#include "workers/worker_status_table.hpp"

#include <glog/logging.h>

#include <utility>

namespace imxup {
namespace {
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;
}  // namespace

auto ToString(WorkerKind kind) -> std::string_view {
  switch (kind) {
    case WorkerKind::PRIMARY:
      return "primary";
    case WorkerKind::FILE_HOST:
      return "filehost";
    case WorkerKind::RENAME:
      return "rename";
  }
  return "filehost";
}

auto FileHostWorkerId(const host_id_t& host) -> worker_id_t { return "filehost:" + host; }

auto IdOf(const WorkerEntry& entry) -> const worker_id_t& {
  return std::visit(
      Overloaded{[](const ActiveWorker& w) -> const worker_id_t& { return w.id_; },
                 [](const PlaceholderWorker& w) -> const worker_id_t& { return w.id_; }},
      entry);
}

auto IsPlaceholder(const WorkerEntry& entry) -> bool {
  return std::holds_alternative<PlaceholderWorker>(entry);
}

WorkerStatusTable::WorkerStatusTable(SystemClockFn clock) : clock_(std::move(clock)) {}

void WorkerStatusTable::Put(WorkerEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        id = IdOf(entry);
  entries_.insert_or_assign(id, std::move(entry));
  PublishLocked();
}

void WorkerStatusTable::Remove(const worker_id_t& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.erase(id) > 0) PublishLocked();
}

void WorkerStatusTable::Reset(std::vector<WorkerEntry> entries) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  for (auto& entry : entries) {
    auto id = IdOf(entry);
    entries_.insert_or_assign(id, std::move(entry));
  }
  PublishLocked();
}

auto WorkerStatusTable::Get(const worker_id_t& id) const -> std::optional<WorkerEntry> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

auto WorkerStatusTable::Contains(const worker_id_t& id) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.contains(id);
}

auto WorkerStatusTable::TakeSnapshot() const -> Snapshot {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot                    snapshot;
  snapshot.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) snapshot.push_back(entry);
  return snapshot;
}

auto WorkerStatusTable::BeginJob(const worker_id_t& id, int64_t bytes_total, int32_t files_total)
    -> std::optional<uint64_t> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  auto* worker = std::get_if<ActiveWorker>(&it->second);
  if (worker == nullptr) return std::nullopt;

  worker->job_         = next_job_++;
  worker->bytes_done_  = 0;
  worker->bytes_total_ = bytes_total;
  worker->files_done_  = 0;
  worker->files_total_ = files_total;
  worker->speed_bps_   = 0.0;
  worker->last_error_.clear();
  PublishLocked();
  return worker->job_;
}

auto WorkerStatusTable::UpdateProgress(const worker_id_t& id, uint64_t job, int64_t bytes_done,
                                       int32_t files_done, std::optional<double> speed_bps)
    -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = entries_.find(id);
  if (it == entries_.end()) return false;
  auto* worker = std::get_if<ActiveWorker>(&it->second);
  if (worker == nullptr || worker->job_ != job) return false;
  if (bytes_done < worker->bytes_done_ || (files_done >= 0 && files_done < worker->files_done_)) {
    return false;
  }
  worker->bytes_done_ = bytes_done;
  if (files_done >= 0) worker->files_done_ = files_done;
  if (speed_bps) worker->speed_bps_ = *speed_bps;
  PublishLocked();
  return true;
}

void WorkerStatusTable::SetState(const worker_id_t& id, std::string state) {
  Modify(id, [&](ActiveWorker& w) {
    w.state_ = std::move(state);
    if (w.state_ == "idle" || w.state_ == "paused") w.speed_bps_ = 0.0;
  });
}

void WorkerStatusTable::SetError(const worker_id_t& id, std::string error) {
  Modify(id, [&](ActiveWorker& w) { w.last_error_ = std::move(error); });
}

void WorkerStatusTable::SetStorage(const worker_id_t& id, StorageSnapshot storage) {
  Modify(id, [&](ActiveWorker& w) { w.storage_ = std::move(storage); });
}

auto WorkerStatusTable::FreshStorage(const worker_id_t& id, std::chrono::minutes ttl) const
    -> std::optional<StorageSnapshot> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  const auto* worker = std::get_if<ActiveWorker>(&it->second);
  if (worker == nullptr || !worker->storage_ || !worker->storage_->Fresh(clock_(), ttl)) {
    return std::nullopt;
  }
  return worker->storage_;
}

auto WorkerStatusTable::Modify(const worker_id_t& id, const std::function<void(ActiveWorker&)>& fn)
    -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = entries_.find(id);
  if (it == entries_.end()) {
    VLOG(1) << "[status] update for unknown worker " << id;
    return false;
  }
  auto* worker = std::get_if<ActiveWorker>(&it->second);
  if (worker == nullptr) return false;
  fn(*worker);
  PublishLocked();
  return true;
}

void WorkerStatusTable::PublishLocked() {
  Snapshot snapshot;
  snapshot.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) snapshot.push_back(entry);
  channel_.Publish(std::move(snapshot));
}
};  // namespace imxup

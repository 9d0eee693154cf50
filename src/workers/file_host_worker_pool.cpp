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

#include "workers/file_host_worker_pool.hpp"

#include <easy/profiler.h>
#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "storage/storage_error.hpp"
#include "utils/archive/zip_writer.hpp"

namespace imxup {
namespace {
// Status table updates per transfer, at most 4 per second
constexpr auto kProgressInterval = std::chrono::milliseconds{250};

auto IsFinal(HostUploadState state) -> bool {
  return state == HostUploadState::COMPLETED || state == HostUploadState::FAILED ||
         state == HostUploadState::CANCELLED;
}
}  // namespace

auto ToErrorKind(FailureKind kind) -> ErrorKind {
  switch (kind) {
    case FailureKind::NONE:
      return ErrorKind::NONE;
    case FailureKind::NETWORK:
      return ErrorKind::NETWORK;
    case FailureKind::AUTH:
      return ErrorKind::AUTH;
    case FailureKind::QUOTA:
      return ErrorKind::QUOTA;
    case FailureKind::REJECTED:
      return ErrorKind::REJECTED;
    case FailureKind::CANCELLED:
      return ErrorKind::CANCELLED;
    case FailureKind::VALIDATION:
      return ErrorKind::VALIDATION;
  }
  return ErrorKind::NONE;
}

auto HostArchiveName(const Gallery& gallery) -> std::string {
  std::string name = gallery.name_.empty() ? gallery.path_.filename().string() : gallery.name_;
  for (auto& c : name) {
    if (c == '/' || c == '\\' || c == ':') c = '_';
  }
  return "imxup_" + std::to_string(gallery.id_) + "_" + name + ".zip";
}

FileHostWorker::FileHostWorker(HostConfig config, HostSettings settings,
                               std::unique_ptr<FileHostClient> client, QueueManager& queue,
                               WorkerStatusTable& status, file_path_t temp_dir,
                               SystemClockFn clock)
    : config_(std::move(config)),
      settings_(std::move(settings)),
      client_(std::move(client)),
      queue_(queue),
      status_(status),
      temp_dir_(std::move(temp_dir)),
      clock_(std::move(clock)),
      worker_id_(FileHostWorkerId(config_.id_)) {
  if (!client_) throw std::runtime_error("No upload client for host " + config_.id_);
}

FileHostWorker::~FileHostWorker() { Stop(); }

void FileHostWorker::Start() {
  if (running_.exchange(true)) return;
  stopping_ = false;
  jobs_.reopen();
  for (const auto& job : queue_.PendingHostUploads(config_.id_)) jobs_.push(job.id_);
  LOG(INFO) << "[filehost:" << config_.id_ << "] worker started, " << jobs_.size()
            << " pending job(s)";
  thread_ = std::thread([this] { Run(); });
}

void FileHostWorker::Stop() {
  if (!running_.exchange(false)) return;
  stopping_ = true;
  jobs_.close();
  pause_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  LOG(INFO) << "[filehost:" << config_.id_ << "] worker stopped";
}

auto FileHostWorker::Submit(host_job_id_t job_id) -> bool { return jobs_.push(job_id); }

void FileHostWorker::Pause() {
  paused_ = true;
  status_.SetState(worker_id_, "paused");
}

void FileHostWorker::Resume() {
  {
    std::lock_guard<std::mutex> lock(pause_mutex_);
    paused_ = false;
  }
  pause_cv_.notify_all();
  status_.SetState(worker_id_, "idle");
}

void FileHostWorker::CancelCurrent() { cancel_current_ = true; }

void FileHostWorker::WaitWhilePaused() {
  std::unique_lock<std::mutex> lock(pause_mutex_);
  pause_cv_.wait(lock, [this] { return !paused_.load() || stopping_.load(); });
}

void FileHostWorker::Run() {
  try {
    SpinUp();
  } catch (const std::exception& e) {
    LOG(ERROR) << "[filehost:" << config_.id_ << "] spin-up failed: " << e.what();
  }

  while (auto job_id = jobs_.pop()) {
    WaitWhilePaused();
    if (stopping_) break;
    try {
      ProcessNow(*job_id);
    } catch (const StorageUnavailableError& e) {
      // The claimed row stays Uploading and is put back to pending by startup recovery
      LOG(ERROR) << "[filehost:" << config_.id_ << "] job " << *job_id
                 << " not recorded: " << e.what();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[filehost:" << config_.id_ << "] job " << *job_id
                 << " aborted: " << e.what();
    }
  }
}

void FileHostWorker::SpinUp() {
  status_.SetState(worker_id_, "authenticating");
  auto result = client_->TestCredentials();
  if (result.success_) {
    VLOG(1) << "[filehost:" << config_.id_ << "] credentials accepted";
  } else {
    LOG(WARNING) << "[filehost:" << config_.id_ << "] credential check failed: "
                 << result.message_;
    status_.SetError(worker_id_, result.message_);
  }
  RefreshStorage();
  status_.SetState(worker_id_, paused_ ? "paused" : "idle");
}

void FileHostWorker::RefreshStorage(bool force) {
  if (!force) {
    if (auto cached = status_.FreshStorage(worker_id_)) {
      VLOG(1) << "[filehost:" << config_.id_ << "] using cached storage";
      return;
    }
  }
  auto quota = client_->GetStorageQuota();
  if (!quota) return;
  if (!quota->left_ && quota->total_ && quota->used_) {
    quota->left_ = *quota->total_ - *quota->used_;
  }
  if (!quota->total_ || !quota->left_) {
    LOG(WARNING) << "[filehost:" << config_.id_ << "] incomplete storage data, keeping cache";
    return;
  }
  status_.SetStorage(worker_id_, StorageSnapshot{quota->total_, quota->left_, clock_()});
}

auto FileHostWorker::ProcessNow(host_job_id_t job_id) -> std::optional<HostUploadState> {
  auto claim = queue_.ClaimHostUpload(job_id);
  if (claim != TransitionStatus::OK) {
    VLOG(1) << "[filehost:" << config_.id_ << "] job " << job_id
            << " not claimed: " << ToString(claim);
    return std::nullopt;
  }
  auto job = queue_.GetHostUpload(job_id);
  if (!job) return std::nullopt;

  auto gallery = queue_.Get(job->gallery_id_);
  if (!gallery) {
    return Fail(std::move(*job), FailureKind::VALIDATION, "Gallery no longer exists");
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(gallery->path_, ec)) {
    return Fail(std::move(*job), FailureKind::VALIDATION,
                "Folder not found: " + gallery->path_.string());
  }

  EASY_BLOCK("FileHostWorker::ProcessNow");
  cancel_current_ = false;
  status_.SetState(worker_id_, "uploading");
  LOG(INFO) << "[filehost:" << config_.id_ << "] uploading '" << gallery->name_ << "' (job "
            << job_id << ")";

  auto                           dir = temp_dir_ / config_.id_;
  std::unique_ptr<ScopedArchive> archive;
  try {
    std::filesystem::create_directories(dir);
    archive = std::make_unique<ScopedArchive>(gallery->path_, dir / HostArchiveName(*gallery));
  } catch (const std::exception& e) {
    return Fail(std::move(*job), FailureKind::VALIDATION,
                std::string("Cannot build archive: ") + e.what());
  }

  auto size         = static_cast<int64_t>(archive->Size());
  job->total_bytes_ = size;
  auto status_job   = status_.BeginJob(worker_id_, size, 1).value_or(0);

  auto            last_report = std::chrono::steady_clock::time_point{};
  TransferControl control;
  control.progress_ = [&](const TransferProgress& progress) {
    auto now = std::chrono::steady_clock::now();
    if (now - last_report < kProgressInterval && progress.sent_ < progress.total_) return;
    last_report = now;
    status_.UpdateProgress(worker_id_, status_job, progress.sent_, -1, progress.speed_bps_);
  };
  control.should_stop_ = [this] { return cancel_current_.load() || stopping_.load(); };

  auto transfer_started = std::chrono::steady_clock::now();
  auto outcome          = client_->Upload(archive->Path(), control);
  auto transfer_seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - transfer_started).count();
  if (outcome.success_) {
    RecordTransfer(TransferSample{config_.id_, size, transfer_seconds, 1, 0});
    status_.UpdateProgress(worker_id_, status_job, size, 1, 0.0);
    job->uploaded_bytes_ = size;
    job->download_url_   = outcome.url_;
    job->file_id_        = outcome.file_id_;
    job->raw_response_   = outcome.raw_response_;
    job->error_kind_     = ErrorKind::NONE;
    job->error_message_.clear();
    LOG(INFO) << "[filehost:" << config_.id_ << "] '" << gallery->name_ << "' uploaded"
              << (outcome.deduplicated_ ? " (already on host)" : "") << ": " << outcome.url_;
    return Finish(std::move(*job), HostUploadState::COMPLETED);
  }

  if (outcome.failure_ == FailureKind::CANCELLED && stopping_ && !cancel_current_) {
    LOG(INFO) << "[filehost:" << config_.id_ << "] job " << job_id
              << " interrupted by shutdown, left pending";
    return Finish(std::move(*job), HostUploadState::PENDING);
  }
  if (outcome.failure_ != FailureKind::CANCELLED) {
    RecordTransfer(TransferSample{config_.id_, 0, transfer_seconds, 0, 1});
  }
  return Fail(std::move(*job), outcome.failure_, outcome.message_);
}

void FileHostWorker::RecordTransfer(const TransferSample& sample) {
  try {
    queue_.RecordTransfer(sample);
  } catch (const StorageUnavailableError& e) {
    LOG(WARNING) << "[filehost:" << config_.id_ << "] transfer metrics not recorded: " << e.what();
  }
}

auto FileHostWorker::Fail(HostUploadJob job, FailureKind kind, const std::string& message)
    -> HostUploadState {
  job.error_kind_    = ToErrorKind(kind);
  job.error_message_ = message;
  status_.SetError(worker_id_, message);

  if (kind == FailureKind::CANCELLED) {
    LOG(INFO) << "[filehost:" << config_.id_ << "] job " << job.id_ << " cancelled";
    return Finish(std::move(job), HostUploadState::CANCELLED);
  }

  bool retry = settings_.auto_retry_ && IsRetryable(kind) &&
               job.retry_count_ < settings_.max_retries_;
  if (retry) {
    ++job.retry_count_;
    LOG(WARNING) << "[filehost:" << config_.id_ << "] job " << job.id_ << " failed ("
                 << ToString(kind) << "): " << message << ", retrying (attempt "
                 << job.retry_count_ << "/" << settings_.max_retries_ << ")";
    auto id    = job.id_;
    auto state = Finish(std::move(job), HostUploadState::PENDING);
    if (running_) jobs_.push(id);
    return state;
  }

  LOG(ERROR) << "[filehost:" << config_.id_ << "] job " << job.id_ << " failed ("
             << ToString(kind) << "): " << message;
  return Finish(std::move(job), HostUploadState::FAILED);
}

auto FileHostWorker::Finish(HostUploadJob job, HostUploadState state) -> HostUploadState {
  job.state_       = state;
  job.finished_ts_ = IsFinal(state) ? ToUnix(clock_()) : 0;
  if (!queue_.UpdateHostUpload(job)) {
    LOG(WARNING) << "[filehost:" << config_.id_ << "] job " << job.id_
                 << " vanished before its result was recorded";
  }
  cancel_current_ = false;
  status_.SetState(worker_id_, paused_ ? "paused" : "idle");
  return state;
}

FileHostWorkerPool::FileHostWorkerPool(QueueManager& queue, WorkerStatusTable& status,
                                       FileHostClientFactory factory, file_path_t temp_dir,
                                       SystemClockFn clock)
    : queue_(queue),
      status_(status),
      factory_(std::move(factory)),
      temp_dir_(std::move(temp_dir)),
      clock_(std::move(clock)) {}

FileHostWorkerPool::~FileHostWorkerPool() { Stop(); }

void FileHostWorkerPool::Configure(const std::vector<HostConfig>& hosts,
                                   const HostSettingsMap& settings) {
  std::map<host_id_t, std::unique_ptr<FileHostWorker>> retired;
  bool                                                 restart = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    retired.swap(workers_);
    restart = started_;
  }
  for (auto& [host, worker] : retired) worker->Stop();
  retired.clear();

  std::lock_guard<std::mutex> lock(mutex_);
  // New entries overwrite the old ones in place, only hosts that left are removed afterwards,
  // so a host that stays configured is never missing from the table
  std::vector<worker_id_t> previous;
  previous.swap(entry_ids_);
  settings_ = settings;

  for (const auto& config : hosts) {
    auto        found     = settings.find(config.id_);
    auto        host      = found == settings.end() ? HostSettings{} : found->second;
    auto        worker_id = FileHostWorkerId(config.id_);
    std::string name      = config.name_.empty() ? config.id_ : config.name_;
    entry_ids_.push_back(worker_id);

    if (!host.enabled_) {
      status_.Put(PlaceholderWorker{worker_id, WorkerKind::FILE_HOST, name, "disabled"});
      continue;
    }
    std::unique_ptr<FileHostClient> client;
    try {
      client = factory_(config, host);
    } catch (const std::exception& e) {
      LOG(ERROR) << "[filehost:" << config.id_ << "] cannot create client: " << e.what();
    }
    if (!client) {
      status_.Put(PlaceholderWorker{worker_id, WorkerKind::FILE_HOST, name, "unavailable"});
      continue;
    }
    ActiveWorker entry;
    entry.id_        = worker_id;
    entry.kind_      = WorkerKind::FILE_HOST;
    entry.host_name_ = name;
    status_.Put(std::move(entry));
    workers_.emplace(config.id_,
                     std::make_unique<FileHostWorker>(config, host, std::move(client), queue_,
                                                      status_, temp_dir_, clock_));
  }
  for (const auto& id : previous) {
    if (std::find(entry_ids_.begin(), entry_ids_.end(), id) == entry_ids_.end()) {
      status_.Remove(id);
    }
  }
  LOG(INFO) << "[filehost] " << hosts.size() << " host(s) configured, " << workers_.size()
            << " enabled";
  if (restart) {
    for (auto& [host, worker] : workers_) worker->Start();
  }
}

void FileHostWorkerPool::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  started_ = true;
  for (auto& [host, worker] : workers_) worker->Start();
}

void FileHostWorkerPool::Stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  started_ = false;
  for (auto& [host, worker] : workers_) worker->Stop();
}

auto FileHostWorkerPool::DispatchGallery(HostTrigger event, const Gallery& gallery)
    -> std::vector<host_job_id_t> {
  std::vector<host_job_id_t>  created;
  if (event == HostTrigger::DISABLED) return created;

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [host, worker] : workers_) {
    const auto& settings = settings_.at(host);
    if (settings.trigger_ != event) continue;

    HostUploadFilter existing{host, gallery.id_,
                              {HostUploadState::PENDING, HostUploadState::UPLOADING,
                               HostUploadState::COMPLETED}};
    if (!queue_.GetHostUploads(existing).empty()) {
      VLOG(1) << "[filehost:" << host << "] gallery " << gallery.id_ << " already handled";
      continue;
    }
    auto job_id = queue_.EnqueueHostUpload(gallery.id_, host);
    worker->Submit(job_id);
    created.push_back(job_id);
    VLOG(1) << "[filehost:" << host << "] job " << job_id << " queued for gallery "
            << gallery.id_ << " (" << ToString(event) << ")";
  }
  return created;
}

auto FileHostWorkerPool::Enqueue(gallery_id_t gallery_id, const host_id_t& host)
    -> std::optional<host_job_id_t> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        found = workers_.find(host);
  if (found == workers_.end()) {
    LOG(WARNING) << "[filehost:" << host << "] host not enabled, gallery " << gallery_id
                 << " not queued";
    return std::nullopt;
  }
  auto job_id = queue_.EnqueueHostUpload(gallery_id, host);
  found->second->Submit(job_id);
  return job_id;
}

auto FileHostWorkerPool::Retry(host_job_id_t job_id) -> bool {
  auto job = queue_.GetHostUpload(job_id);
  if (!job) return false;
  if (job->state_ != HostUploadState::FAILED && job->state_ != HostUploadState::CANCELLED) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        found = workers_.find(job->host_id_);
  if (found == workers_.end()) return false;

  job->state_       = HostUploadState::PENDING;
  job->retry_count_ = 0;
  job->error_kind_  = ErrorKind::NONE;
  job->error_message_.clear();
  job->finished_ts_ = 0;
  if (!queue_.UpdateHostUpload(*job)) return false;
  found->second->Submit(job_id);
  return true;
}

auto FileHostWorkerPool::Pause(const host_id_t& host) -> bool {
  return WithWorker(host, [](FileHostWorker& worker) { worker.Pause(); });
}

auto FileHostWorkerPool::Resume(const host_id_t& host) -> bool {
  return WithWorker(host, [](FileHostWorker& worker) { worker.Resume(); });
}

auto FileHostWorkerPool::CancelCurrent(const host_id_t& host) -> bool {
  return WithWorker(host, [](FileHostWorker& worker) { worker.CancelCurrent(); });
}

auto FileHostWorkerPool::WithWorker(const host_id_t&                           host,
                                    const std::function<void(FileHostWorker&)>& fn) -> bool {
  // Held for the call: Configure cannot retire the worker underneath it
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        found = workers_.find(host);
  if (found == workers_.end()) return false;
  fn(*found->second);
  return true;
}

auto FileHostWorkerPool::Worker(const host_id_t& host) -> FileHostWorker* {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        found = workers_.find(host);
  return found == workers_.end() ? nullptr : found->second.get();
}

auto FileHostWorkerPool::EnabledHosts() const -> std::vector<host_id_t> {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<host_id_t>      hosts;
  for (const auto& [host, worker] : workers_) hosts.push_back(host);
  return hosts;
}
};  // namespace imxup

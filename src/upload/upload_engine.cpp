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

#include "upload/upload_engine.hpp"

#include <easy/profiler.h>
#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

#include "concurrency/thread_pool.hpp"
#include "storage/storage_error.hpp"
#include "upload/gallery_artifact.hpp"
#include "workers/file_host_worker_pool.hpp"

namespace imxup {
auto TransferCounter::Add(int64_t bytes) -> int64_t {
  if (bytes <= 0) return Value();
  return value_.fetch_add(bytes, std::memory_order_acq_rel) + bytes;
}

UploadEngine::UploadEngine(PrimaryHostSettings settings, PrimaryHostClient& client,
                           QueueManager& queue, WorkerStatusTable& status,
                           file_path_t artifact_dir, SystemClockFn clock, SteadyClockFn steady)
    : settings_(std::move(settings)),
      client_(client),
      queue_(queue),
      status_(status),
      artifact_dir_(std::move(artifact_dir)),
      clock_(std::move(clock)),
      steady_(std::move(steady)) {
  if (settings_.parallel_batch_size_ == 0) settings_.parallel_batch_size_ = 1;
  ActiveWorker entry;
  entry.id_        = kPrimaryWorkerId;
  entry.kind_      = WorkerKind::PRIMARY;
  entry.host_name_ = "imx.to";
  status_.Put(std::move(entry));
}

auto UploadEngine::ClaimNext() -> std::optional<Gallery> {
  GalleryFilter filter;
  filter.states_ = {GalleryState::QUEUED};
  for (auto& gallery : queue_.Query(filter)) {
    GalleryPatch patch;
    patch.started_ts_ = ToUnix(clock_());
    auto status = queue_.Transition(gallery.id_, {GalleryState::QUEUED}, GalleryState::UPLOADING,
                                    patch);
    if (status == TransitionStatus::OK) {
      gallery.state_      = GalleryState::UPLOADING;
      gallery.started_ts_ = *patch.started_ts_;
      return gallery;
    }
    VLOG(1) << "[upload] gallery " << gallery.id_ << " claim skipped: " << ToString(status);
  }
  return std::nullopt;
}

auto UploadEngine::RunNext() -> std::optional<GalleryUploadReport> {
  auto gallery = ClaimNext();
  if (!gallery) return std::nullopt;
  return UploadGallery(gallery->id_);
}

auto UploadEngine::RequestStop(gallery_id_t id) -> bool {
  std::lock_guard<std::mutex> lock(active_mutex_);
  auto it = active_.find(id);
  if (it == active_.end()) return false;
  it->second->user_stop_.store(true);
  LOG(INFO) << "[upload] stop requested for gallery " << id;
  return true;
}

auto UploadEngine::Abort(gallery_id_t id, ErrorKind kind, const std::string& message) -> bool {
  std::shared_ptr<ActiveUpload> active;
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    auto                        it = active_.find(id);
    if (it == active_.end()) return false;
    active = it->second;
  }
  LOG(WARNING) << "[upload] gallery " << id << " aborted: " << message;
  active->fatal_stop_.store(true);
  RecordFailure(*active, kind, message);
  return true;
}

void UploadEngine::RequestStopAll() {
  std::lock_guard<std::mutex> lock(active_mutex_);
  for (auto& [id, active] : active_) active->user_stop_.store(true);
}

auto UploadEngine::ActiveGalleries() const -> std::vector<gallery_id_t> {
  std::lock_guard<std::mutex> lock(active_mutex_);
  std::vector<gallery_id_t>   ids;
  for (const auto& [id, active] : active_) ids.push_back(id);
  return ids;
}

auto UploadEngine::UploadGallery(gallery_id_t id) -> std::optional<GalleryUploadReport> {
  EASY_BLOCK("UploadEngine::UploadGallery");
  auto gallery = queue_.Get(id);
  if (!gallery || gallery->state_ != GalleryState::UPLOADING) {
    LOG(WARNING) << "[upload] gallery " << id << " is not in uploading state";
    return std::nullopt;
  }

  auto active = std::make_shared<ActiveUpload>();
  {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_.contains(id)) return std::nullopt;
    active_[id] = active;
  }
  // Drops the entry on every way out, a storage error included
  struct ActiveRelease {
    UploadEngine* engine_;
    gallery_id_t  id_;
    ~ActiveRelease() { engine_->ReleaseActive(id_); }
  } release{this, id};

  int32_t files_total = 0;
  try {
    auto files      = queue_.GetFiles(id);
    files_total     = static_cast<int32_t>(files.size());
    active->id_     = id;
    active->started_ = steady_();
    std::vector<GalleryFile> pending;
    for (const auto& file : files) {
      active->bytes_total_ += file.size_bytes_;
      if (file.uploaded_) {
        active->committed_bytes_ += file.size_bytes_;
        active->files_done_ += 1;
      } else {
        pending.push_back(file);
      }
    }
    active->files_at_start_ = active->files_done_.load();
    auto job                = status_.BeginJob(kPrimaryWorkerId, active->bytes_total_, files_total);
    active->job_            = job.value_or(0);
    status_.SetState(kPrimaryWorkerId, "uploading");

    LOG(INFO) << "[upload] gallery " << id << " '" << gallery->name_ << "': " << pending.size()
              << " of " << files.size() << " images to send";
    if (listener_) listener_->OnGalleryStarted(*gallery);

    std::string host_gallery_id = gallery->host_gallery_id_;
    auto failed = UploadPass(*active, *gallery, std::move(pending), host_gallery_id);
    for (uint32_t pass = 0; pass < settings_.retry_passes_ && !failed.empty(); ++pass) {
      if (active->Stopping()) break;
      LOG(INFO) << "[upload] gallery " << id << " retry pass " << pass + 1 << " for "
                << failed.size() << " images";
      failed = UploadPass(*active, *gallery, std::move(failed), host_gallery_id);
    }

    return Finish(*active, *gallery, files_total, static_cast<int32_t>(failed.size()),
                  host_gallery_id);
  } catch (const StorageUnavailableError& e) {
    return FailOnStorage(*active, *gallery, files_total, e.what());
  }
}

void UploadEngine::ReleaseActive(gallery_id_t id) {
  std::lock_guard<std::mutex> lock(active_mutex_);
  active_.erase(id);
}

auto UploadEngine::FailOnStorage(ActiveUpload& active, const Gallery& gallery, int32_t files_total,
                                 const std::string& message) -> GalleryUploadReport {
  LOG(ERROR) << "[upload] gallery " << gallery.id_ << " stopped, queue store unavailable: "
             << message;
  active.fatal_stop_.store(true);

  GalleryUploadReport report;
  report.gallery_id_     = gallery.id_;
  report.files_total_    = files_total;
  report.files_uploaded_ = active.files_done_.load();
  report.files_failed_   = files_total - report.files_uploaded_;
  report.bytes_sent_     = active.sent_.Value();
  report.state_ = report.files_uploaded_ > 0 ? GalleryState::INCOMPLETE : GalleryState::FAILED;
  report.error_kind_    = ErrorKind::STORAGE;
  report.error_message_ = message;

  // The store may be back by now; if not, recovery at the next start handles the gallery
  GalleryPatch patch;
  patch.error_kind_    = ErrorKind::STORAGE;
  patch.error_message_ = message;
  patch.finished_ts_   = ToUnix(clock_());
  try {
    auto status = queue_.Transition(gallery.id_, {GalleryState::UPLOADING}, report.state_, patch);
    if (status != TransitionStatus::OK) {
      LOG(WARNING) << "[upload] gallery " << gallery.id_ << " could not move to "
                   << ToString(report.state_) << ": " << ToString(status);
    }
  } catch (const StorageUnavailableError& again) {
    LOG(ERROR) << "[upload] gallery " << gallery.id_ << " left in uploading: " << again.what();
  }

  status_.SetState(kPrimaryWorkerId, "idle");
  status_.SetError(kPrimaryWorkerId, message);
  if (listener_) listener_->OnGalleryFinished(gallery, report.state_, std::nullopt);
  return report;
}

auto UploadEngine::UploadPass(ActiveUpload& active, const Gallery& gallery,
                              std::vector<GalleryFile> files, std::string& host_gallery_id)
    -> std::vector<GalleryFile> {
  std::vector<GalleryFile> failed;
  size_t                   next = 0;
  // The gallery does not exist on the host yet: send images one at a time until one creates it
  while (host_gallery_id.empty() && next < files.size() && !active.Stopping()) {
    const auto& file   = files[next++];
    auto        result = UploadOne(active, gallery, file, host_gallery_id);
    if (!result.success_) {
      failed.push_back(file);
      continue;
    }
    if (result.gallery_id_.empty()) {
      LOG(WARNING) << "[upload] gallery " << gallery.id_ << ": host answered without gallery id";
      continue;
    }
    host_gallery_id = result.gallery_id_;
    GalleryPatch patch;
    patch.host_gallery_id_ = host_gallery_id;
    patch.gallery_url_     = client_.GalleryUrl(host_gallery_id);
    queue_.UpdateFields(gallery.id_, patch);
    LOG(INFO) << "[upload] gallery " << gallery.id_ << " created on host as " << host_gallery_id;
    if (listener_) listener_->OnGalleryCreated(gallery, host_gallery_id);
  }

  std::vector<GalleryFile> rest(files.begin() + static_cast<std::ptrdiff_t>(next), files.end());
  if (!rest.empty() && !host_gallery_id.empty()) {
    auto batch_failed = UploadBatch(active, gallery, std::move(rest), host_gallery_id);
    failed.insert(failed.end(), batch_failed.begin(), batch_failed.end());
  } else {
    failed.insert(failed.end(), rest.begin(), rest.end());
  }
  std::sort(failed.begin(), failed.end(),
            [](const GalleryFile& a, const GalleryFile& b) { return a.seq_ < b.seq_; });
  return failed;
}

auto UploadEngine::UploadBatch(ActiveUpload& active, const Gallery& gallery,
                               std::vector<GalleryFile> files, const std::string& host_gallery_id)
    -> std::vector<GalleryFile> {
  EASY_BLOCK("UploadEngine::UploadBatch");
  ThreadPool pool(std::min<size_t>(settings_.parallel_batch_size_, files.size()));
  std::vector<std::future<ImageUploadResult>> results;
  results.reserve(files.size());
  for (const auto& file : files) {
    results.push_back(pool.SubmitWithResult([this, &active, &gallery, &file, &host_gallery_id]() {
      return UploadOne(active, gallery, file, host_gallery_id);
    }));
  }

  std::vector<GalleryFile> failed;
  for (size_t i = 0; i < results.size(); ++i) {
    try {
      if (!results[i].get().success_) failed.push_back(files[i]);
    } catch (const StorageUnavailableError& e) {
      LOG(ERROR) << "[upload] gallery " << gallery.id_ << " image " << files[i].file_name_
                 << " sent but not recorded: " << e.what();
      RecordFailure(active, ErrorKind::STORAGE, e.what());
      active.fatal_stop_.store(true);
      failed.push_back(files[i]);
    } catch (const std::exception& e) {
      LOG(ERROR) << "[upload] gallery " << gallery.id_ << " image " << files[i].file_name_
                 << ": " << e.what();
      RecordFailure(active, ErrorKind::NETWORK, e.what());
      failed.push_back(files[i]);
    }
  }
  return failed;
}

auto UploadEngine::UploadOne(ActiveUpload& active, const Gallery& gallery, const GalleryFile& file,
                             const std::string& host_gallery_id) -> ImageUploadResult {
  if (active.Stopping()) {
    ImageUploadResult skipped;
    skipped.failure_ = FailureKind::CANCELLED;
    skipped.message_ = "Stopped before transfer";
    return skipped;
  }

  ImageUploadRequest request;
  request.file_             = gallery.path_ / file.file_name_;
  request.create_gallery_   = host_gallery_id.empty();
  request.gallery_id_       = host_gallery_id;
  request.thumbnail_size_   = settings_.thumbnail_size_;
  request.thumbnail_format_ = settings_.thumbnail_format_;

  int64_t         counted = 0;
  TransferControl control;
  control.progress_ = [this, &active, &counted](const TransferProgress& progress) {
    if (progress.sent_ > counted) {
      active.sent_.Add(progress.sent_ - counted);
      counted = progress.sent_;
    }
    ReportProgress(active);
  };
  control.should_stop_ = [&active]() { return active.Stopping(); };

  VLOG(1) << "[upload] gallery " << gallery.id_ << " sending " << file.file_name_;
  auto result = client_.UploadImage(request, control);
  if (!result.success_) {
    if (result.failure_ != FailureKind::CANCELLED) {
      LOG(WARNING) << "[upload] gallery " << gallery.id_ << " image " << file.file_name_ << ": "
                   << ToString(result.failure_) << " " << result.message_;
      RecordFailure(active, ToErrorKind(result.failure_), result.message_);
    }
    return result;
  }

  if (counted < file.size_bytes_) active.sent_.Add(file.size_bytes_ - counted);
  if (!queue_.MarkFileUploaded(gallery.id_, file.id_, result.image_url_, result.thumb_url_)) {
    LOG(WARNING) << "[upload] gallery " << gallery.id_ << " has no file record for "
                 << file.file_name_;
  }
  auto committed = active.committed_bytes_.fetch_add(file.size_bytes_) + file.size_bytes_;
  auto done      = active.files_done_.fetch_add(1) + 1;

  GalleryPatch patch;
  patch.uploaded_images_ = done;
  patch.uploaded_bytes_  = committed;
  queue_.UpdateFields(gallery.id_, patch);
  ReportProgress(active);
  return result;
}

void UploadEngine::RecordFailure(ActiveUpload& active, ErrorKind kind,
                                 const std::string& message) {
  // Credentials or quota will not fix themselves within this run
  if (kind == ErrorKind::AUTH || kind == ErrorKind::QUOTA) active.fatal_stop_.store(true);
  std::lock_guard<std::mutex> lock(active.failure_mutex_);
  if (active.failure_ == ErrorKind::NONE) {
    active.failure_         = kind;
    active.failure_message_ = message;
  }
}

void UploadEngine::ReportProgress(ActiveUpload& active) {
  auto   sent    = std::min(active.sent_.Value(), active.bytes_total_);
  double elapsed = ElapsedSeconds(active);
  double speed   = elapsed > 0.0 ? static_cast<double>(active.sent_.Value()) / elapsed : 0.0;
  status_.UpdateProgress(kPrimaryWorkerId, active.job_, sent, active.files_done_.load(), speed);
}

auto UploadEngine::ElapsedSeconds(const ActiveUpload& active) const -> double {
  return std::chrono::duration<double>(steady_() - active.started_).count();
}

auto UploadEngine::Finish(ActiveUpload& active, const Gallery& gallery, int32_t files_total,
                          int32_t files_failed, const std::string& host_gallery_id)
    -> GalleryUploadReport {
  GalleryUploadReport report;
  report.gallery_id_      = gallery.id_;
  report.files_total_     = files_total;
  report.files_uploaded_  = active.files_done_.load();
  report.files_failed_    = files_failed;
  report.bytes_sent_      = active.sent_.Value();
  report.host_gallery_id_ = host_gallery_id;
  double elapsed          = ElapsedSeconds(active);
  if (elapsed > 0.0) {
    report.kibps_ = static_cast<double>(report.bytes_sent_) / 1024.0 / elapsed;
  }

  if (report.files_uploaded_ == files_total) {
    report.state_ = GalleryState::COMPLETED;
  } else if (active.user_stop_.load()) {
    report.state_ = GalleryState::PAUSED;
  } else if (report.files_uploaded_ > 0) {
    report.state_ = GalleryState::INCOMPLETE;
  } else {
    report.state_ = GalleryState::FAILED;
  }

  {
    std::lock_guard<std::mutex> lock(active.failure_mutex_);
    if (report.state_ != GalleryState::COMPLETED && report.state_ != GalleryState::PAUSED) {
      report.error_kind_    = active.failure_;
      report.error_message_ = active.failure_message_;
      if (report.error_kind_ == ErrorKind::NONE) {
        report.error_kind_    = ErrorKind::NETWORK;
        report.error_message_ = "No image reached the host";
      }
    }
  }

  GalleryPatch patch;
  patch.uploaded_images_ = report.files_uploaded_;
  patch.uploaded_bytes_  = active.committed_bytes_.load();
  patch.error_kind_      = report.error_kind_;
  patch.error_message_   = report.error_message_;
  if (report.state_ != GalleryState::PAUSED) {
    patch.finished_ts_ = ToUnix(clock_());
    patch.final_kibps_ = report.kibps_;
  }
  auto status = queue_.Transition(gallery.id_, {GalleryState::UPLOADING}, report.state_, patch);
  if (status != TransitionStatus::OK) {
    LOG(WARNING) << "[upload] gallery " << gallery.id_ << " could not move to "
                 << ToString(report.state_) << ": " << ToString(status);
  }
  LOG(INFO) << "[upload] gallery " << gallery.id_ << " " << ToString(report.state_) << ", "
            << report.files_uploaded_ << "/" << files_total << " images, "
            << static_cast<int64_t>(report.kibps_) << " KiB/s";

  auto sent_now   = report.files_uploaded_ - active.files_at_start_;
  auto failed_now = report.state_ == GalleryState::PAUSED ? 0 : files_failed;
  if (sent_now > 0 || failed_now > 0) {
    TransferSample sample{kPrimaryMetricsHost, report.bytes_sent_, elapsed, sent_now, failed_now};
    try {
      queue_.RecordTransfer(sample);
    } catch (const StorageUnavailableError& e) {
      LOG(WARNING) << "[upload] gallery " << gallery.id_ << " metrics not recorded: " << e.what();
    }
  }

  auto stored = queue_.Get(gallery.id_).value_or(gallery);
  if (status == TransitionStatus::OK && report.state_ == GalleryState::COMPLETED) {
    try {
      report.artifact_ = WriteGalleryArtifact(artifact_dir_, stored, queue_.GetFiles(gallery.id_),
                                              settings_.thumbnail_size_,
                                              settings_.thumbnail_format_);
    } catch (const std::exception& e) {
      LOG(ERROR) << "[upload] gallery " << gallery.id_ << " artifact not written: " << e.what();
    }
  }

  status_.SetState(kPrimaryWorkerId, "idle");
  if (!report.error_message_.empty()) status_.SetError(kPrimaryWorkerId, report.error_message_);
  if (listener_) listener_->OnGalleryFinished(stored, report.state_, report.artifact_);
  return report;
}
};  // namespace imxup

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

#include "queue/queue_manager.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <format>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "queue/image_files.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/service/gallery/gallery_service.hpp"
#include "storage/service/gallery/host_upload_service.hpp"
#include "storage/service/metrics/host_metrics_service.hpp"
#include "utils/string/convert.hpp"

namespace imxup {
namespace {
void ApplyPatch(Gallery& gallery, const GalleryPatch& patch) {
  if (patch.name_) gallery.name_ = conv::ToValidUtf8(*patch.name_);
  if (patch.template_name_) gallery.template_name_ = *patch.template_name_;
  if (patch.started_ts_) gallery.started_ts_ = *patch.started_ts_;
  if (patch.finished_ts_) gallery.finished_ts_ = *patch.finished_ts_;
  if (patch.total_images_) gallery.total_images_ = *patch.total_images_;
  if (patch.uploaded_images_) gallery.uploaded_images_ = *patch.uploaded_images_;
  if (patch.total_size_) gallery.total_size_ = *patch.total_size_;
  if (patch.uploaded_bytes_) gallery.uploaded_bytes_ = *patch.uploaded_bytes_;
  if (patch.final_kibps_) gallery.final_kibps_ = *patch.final_kibps_;
  if (patch.host_gallery_id_) gallery.host_gallery_id_ = *patch.host_gallery_id_;
  if (patch.gallery_url_) gallery.gallery_url_ = *patch.gallery_url_;
  if (patch.error_kind_) gallery.error_kind_ = *patch.error_kind_;
  if (patch.error_message_) gallery.error_message_ = *patch.error_message_;
  for (size_t i = 0; i < gallery.ext_.size(); ++i) {
    if (patch.ext_[i]) gallery.ext_[i] = conv::ToValidUtf8(*patch.ext_[i]);
    if (patch.custom_[i]) gallery.custom_[i] = conv::ToValidUtf8(*patch.custom_[i]);
  }
  if (patch.dims_) gallery.dims_ = *patch.dims_;
  if (patch.auto_start_) gallery.auto_start_ = *patch.auto_start_;
}

auto LoadGallery(duckdb_connection& conn, gallery_id_t id) -> std::optional<Gallery> {
  GalleryService service{conn};
  auto           found = service.GetGalleryById(id);
  if (found.empty()) return std::nullopt;
  return std::move(found.front());
}

auto NextId(duckdb_connection& conn, const char* sequence) -> int64_t {
  return duckorm::scalar_int64(conn, std::format("SELECT nextval('{}');", sequence));
}
};  // namespace

QueueManager::QueueManager(std::shared_ptr<DBController> db, BackoffPolicy storage_retry,
                           SystemClockFn clock, SleepFn sleep)
    : db_(std::move(db)),
      write_conn_(db_->GetConnectionGuard()),
      storage_retry_(storage_retry),
      clock_(std::move(clock)),
      sleep_(std::move(sleep)) {}

auto QueueManager::NowUnix() const -> unix_ts_t { return ToUnix(clock_()); }

template <typename F>
auto QueueManager::Write(const char* op, F&& fn) -> decltype(fn(std::declval<duckdb_connection&>())) {
  using R = decltype(fn(std::declval<duckdb_connection&>()));
  return RetryOnContention(storage_retry_, sleep_, op, [&]() -> R {
    std::lock_guard<std::mutex> lock(write_mutex_);
    TransactionGuard            txn(write_conn_._conn);
    if constexpr (std::is_void_v<R>) {
      fn(write_conn_._conn);
      txn.Commit();
    } else {
      R result = fn(write_conn_._conn);
      txn.Commit();
      return result;
    }
  });
}

template <typename F>
auto QueueManager::Read(const char* op, F&& fn) -> decltype(fn(std::declval<duckdb_connection&>())) {
  return RetryOnContention(storage_retry_, sleep_, op, [&]() {
    auto guard = db_->GetConnectionGuard();
    return fn(guard._conn);
  });
}

void QueueManager::InsertFiles(duckdb_connection& conn, gallery_id_t id,
                               std::vector<GalleryFile> files) {
  GalleryFileService service{conn};
  for (auto& file : files) {
    file.id_         = NextId(conn, "gallery_file_id_seq");
    file.gallery_id_ = id;
    service.Insert(file);
  }
}

auto QueueManager::Enqueue(const NewGallery& gallery) -> std::optional<gallery_id_t> {
  auto id = Write("enqueue", [&](duckdb_connection& conn) -> std::optional<gallery_id_t> {
    GalleryService service{conn};
    if (!service.GetGalleryByPath(gallery.path_).empty()) {
      return std::nullopt;
    }
    Gallery record;
    record.id_              = NextId(conn, "gallery_id_seq");
    record.path_            = gallery.path_;
    record.name_            = gallery.name_.empty() ? gallery.path_.filename().string()
                                                    : conv::ToValidUtf8(gallery.name_);
    record.template_name_   = gallery.template_name_;
    record.state_           = GalleryState::VALIDATING;
    record.added_ts_        = NowUnix();
    record.insertion_order_ = record.id_;
    record.auto_start_      = gallery.auto_start_;
    record.total_images_    = static_cast<int32_t>(gallery.files_.size());
    for (const auto& file : gallery.files_) record.total_size_ += file.size_bytes_;
    service.Insert(record);
    InsertFiles(conn, record.id_, gallery.files_);
    return record.id_;
  });
  if (id) {
    LOG(INFO) << "[queue] enqueued gallery " << *id << " from " << gallery.path_;
  } else {
    LOG(INFO) << "[queue] " << gallery.path_ << " is already in the queue";
  }
  return id;
}

auto QueueManager::Transition(gallery_id_t id, const std::vector<GalleryState>& from,
                              GalleryState to, const GalleryPatch& patch) -> TransitionStatus {
  GalleryState previous = to;
  auto status = Write("transition", [&](duckdb_connection& conn) -> TransitionStatus {
    auto current = LoadGallery(conn, id);
    if (!current) return TransitionStatus::NOT_FOUND;
    previous = current->state_;
    if (std::find(from.begin(), from.end(), current->state_) == from.end()) {
      return TransitionStatus::CONFLICT;
    }
    if (!IsValidTransition(current->state_, to)) {
      return TransitionStatus::INVALID_TRANSITION;
    }
    if (current->state_ == GalleryState::PAUSED && current->paused_from_ &&
        *current->paused_from_ != to) {
      return TransitionStatus::INVALID_TRANSITION;
    }

    current->paused_from_.reset();
    if (to == GalleryState::PAUSED) current->paused_from_ = previous;
    if (to == GalleryState::UPLOADING && current->started_ts_ == 0) {
      current->started_ts_ = NowUnix();
    }
    if (IsTerminal(to)) current->finished_ts_ = NowUnix();
    current->state_ = to;
    ApplyPatch(*current, patch);

    GalleryService service{conn};
    service.Update(*current, id);
    return TransitionStatus::OK;
  });

  if (status == TransitionStatus::OK) {
    VLOG(1) << "[queue] gallery " << id << ": " << ToString(previous) << " -> " << ToString(to);
    events_.Publish(GalleryEvent{id, previous, to});
  } else if (status == TransitionStatus::INVALID_TRANSITION) {
    LOG(WARNING) << "[queue] rejected transition of gallery " << id << " from "
                 << ToString(previous) << " to " << ToString(to);
  }
  return status;
}

auto QueueManager::Query(const GalleryFilter& filter) -> std::vector<Gallery> {
  std::string predicate = filter.include_archived_ ? "TRUE" : "NOT archived";
  if (!filter.states_.empty()) {
    predicate += " AND state IN (";
    for (size_t i = 0; i < filter.states_.size(); ++i) {
      predicate += std::format("{}{}", i == 0 ? "" : ", ", static_cast<int32_t>(filter.states_[i]));
    }
    predicate += ")";
  }
  if (filter.path_) {
    predicate += " AND path=" + duckorm::quote(conv::ToValidUtf8(filter.path_->string()));
  }
  if (filter.parent_id_) {
    predicate += std::format(" AND parent_id={}", *filter.parent_id_);
  }
  predicate += " ORDER BY insertion_order";
  if (filter.limit_ > 0) predicate += std::format(" LIMIT {}", filter.limit_);

  return Read("query", [&](duckdb_connection& conn) {
    GalleryService service{conn};
    return service.GetByPredicate(std::string(predicate));
  });
}

auto QueueManager::Get(gallery_id_t id) -> std::optional<Gallery> {
  return Read("get", [&](duckdb_connection& conn) { return LoadGallery(conn, id); });
}

auto QueueManager::UpdateFields(gallery_id_t id, const GalleryPatch& patch) -> bool {
  if (patch.Empty()) return Get(id).has_value();
  return Write("update_fields", [&](duckdb_connection& conn) {
    auto current = LoadGallery(conn, id);
    if (!current) return false;
    ApplyPatch(*current, patch);
    GalleryService service{conn};
    service.Update(*current, id);
    return true;
  });
}

auto QueueManager::Remove(gallery_id_t id) -> bool {
  bool removed = Write("remove", [&](duckdb_connection& conn) {
    if (!LoadGallery(conn, id)) return false;
    GalleryFileService files{conn};
    files.RemoveFilesOfGallery(id);
    HostUploadService jobs{conn};
    jobs.RemoveByClause(std::format("gallery_fk={}", id));
    GalleryService galleries{conn};
    galleries.RemoveById(id);
    return true;
  });
  if (removed) LOG(INFO) << "[queue] removed gallery " << id;
  return removed;
}

void QueueManager::SetFiles(gallery_id_t id, const std::vector<GalleryFile>& files) {
  Write("set_files", [&](duckdb_connection& conn) {
    auto current = LoadGallery(conn, id);
    if (!current) {
      throw std::runtime_error(std::format("SetFiles: gallery {} does not exist", id));
    }
    GalleryFileService service{conn};
    service.RemoveFilesOfGallery(id);
    InsertFiles(conn, id, files);

    current->total_images_ = static_cast<int32_t>(files.size());
    current->total_size_   = 0;
    for (const auto& file : files) current->total_size_ += file.size_bytes_;
    GalleryService galleries{conn};
    galleries.UpdateColumns(*current, id,
                            std::array{GalleryMapper::Column("total_images"),
                                       GalleryMapper::Column("total_size")});
  });
}

auto QueueManager::GetFiles(gallery_id_t id) -> std::vector<GalleryFile> {
  return Read("get_files", [&](duckdb_connection& conn) {
    GalleryFileService service{conn};
    return service.GetFilesOfGallery(id);
  });
}

auto QueueManager::MarkFileUploaded(gallery_id_t id, gallery_file_id_t file_id,
                                    const std::string& image_url, const std::string& thumb_url)
    -> bool {
  return Write("mark_file_uploaded", [&](duckdb_connection& conn) {
    auto matched = duckorm::scalar_int64(
        conn, "SELECT count(*) FROM GalleryFile WHERE id=? AND gallery_fk=?;", {file_id, id});
    if (matched == 0) return false;
    duckorm::execute(conn,
                     "UPDATE GalleryFile SET uploaded=true, uploaded_ts=?, image_url=?, "
                     "thumb_url=? WHERE id=? AND gallery_fk=?;",
                     {NowUnix(), image_url, thumb_url, file_id, id});
    return true;
  });
}

auto QueueManager::Resume(gallery_id_t id) -> TransitionStatus {
  auto current = Get(id);
  if (!current) return TransitionStatus::NOT_FOUND;
  if (current->state_ != GalleryState::PAUSED || !current->paused_from_) {
    return TransitionStatus::CONFLICT;
  }
  return Transition(id, {GalleryState::PAUSED}, *current->paused_from_);
}

auto QueueManager::CreateFollowUp(duckdb_connection& conn, Gallery& source,
                                  std::vector<GalleryFile> files, UploadMode mode)
    -> gallery_id_t {
  Gallery next;
  next.id_              = NextId(conn, "gallery_id_seq");
  next.path_            = source.path_;
  next.name_            = source.name_;
  next.template_name_   = source.template_name_;
  next.state_           = GalleryState::QUEUED;
  next.added_ts_        = NowUnix();
  next.host_gallery_id_ = source.host_gallery_id_;
  next.gallery_url_     = source.gallery_url_;
  next.ext_             = source.ext_;
  next.custom_          = source.custom_;
  next.insertion_order_ = next.id_;
  next.parent_id_       = source.id_;
  next.upload_mode_     = mode;
  next.auto_start_      = source.auto_start_;
  next.dims_            = source.dims_;
  next.total_images_    = static_cast<int32_t>(files.size());
  for (auto& file : files) {
    next.total_size_ += file.size_bytes_;
    file.uploaded_    = false;
    file.uploaded_ts_ = 0;
    file.image_url_.clear();
    file.thumb_url_.clear();
  }

  GalleryService service{conn};
  service.Insert(next);
  InsertFiles(conn, next.id_, std::move(files));

  source.archived_ = true;
  service.UpdateColumns(source, source.id_, std::array{GalleryMapper::Column("archived")});
  return next.id_;
}

auto QueueManager::Requeue(gallery_id_t id) -> FollowUpResult {
  auto result = Write("requeue", [&](duckdb_connection& conn) -> FollowUpResult {
    auto current = LoadGallery(conn, id);
    if (!current) return {TransitionStatus::NOT_FOUND};
    if (current->state_ != GalleryState::INCOMPLETE || current->archived_) {
      return {TransitionStatus::CONFLICT};
    }
    GalleryFileService       file_service{conn};
    std::vector<GalleryFile> remaining;
    for (auto& file : file_service.GetFilesOfGallery(id)) {
      if (!file.uploaded_) remaining.push_back(std::move(file));
    }
    if (remaining.empty()) return {TransitionStatus::INVALID_TRANSITION};
    size_t count  = remaining.size();
    auto   new_id = CreateFollowUp(conn, *current, std::move(remaining), UploadMode::RESUME);
    return {TransitionStatus::OK, new_id, count};
  });
  if (result.status_ == TransitionStatus::OK) {
    LOG(INFO) << "[queue] gallery " << id << " requeued as " << result.new_id_ << " with "
              << result.file_count_ << " remaining files";
    events_.Publish(GalleryEvent{result.new_id_, GalleryState::INCOMPLETE, GalleryState::QUEUED});
  }
  return result;
}

auto QueueManager::AppendFiles(gallery_id_t id, const std::vector<std::string>& file_names)
    -> FollowUpResult {
  if (file_names.empty()) return {TransitionStatus::INVALID_TRANSITION};
  auto current = Get(id);
  if (!current) return {TransitionStatus::NOT_FOUND};
  // Sizes are read before taking the writer lock
  auto files   = DescribeFiles(current->path_, file_names);

  auto result  = Write("append", [&](duckdb_connection& conn) -> FollowUpResult {
    auto fresh = LoadGallery(conn, id);
    if (!fresh) return {TransitionStatus::NOT_FOUND};
    if (fresh->state_ != GalleryState::COMPLETED || fresh->archived_) {
      return {TransitionStatus::CONFLICT};
    }
    size_t count  = files.size();
    auto   new_id = CreateFollowUp(conn, *fresh, files, UploadMode::APPEND);
    return {TransitionStatus::OK, new_id, count};
  });
  if (result.status_ == TransitionStatus::OK) {
    LOG(INFO) << "[queue] appending " << result.file_count_ << " files to gallery " << id
              << " as " << result.new_id_;
    events_.Publish(GalleryEvent{result.new_id_, GalleryState::COMPLETED, GalleryState::QUEUED});
  }
  return result;
}

auto QueueManager::RescanAdditive(gallery_id_t id) -> FollowUpResult {
  auto current = Get(id);
  if (!current) return {TransitionStatus::NOT_FOUND};

  std::set<std::string> known;
  int32_t               next_seq = 0;
  for (const auto& file : GetFiles(id)) {
    known.insert(file.file_name_);
    next_seq = std::max(next_seq, file.seq_ + 1);
  }
  std::vector<std::string> added;
  for (auto& name : ListImageFiles(current->path_)) {
    if (!known.contains(name)) added.push_back(std::move(name));
  }
  if (added.empty()) return {TransitionStatus::OK, 0, 0};

  if (current->state_ == GalleryState::COMPLETED) {
    return AppendFiles(id, added);
  }
  bool in_place = current->state_ == GalleryState::READY ||
                  current->state_ == GalleryState::QUEUED ||
                  (current->state_ == GalleryState::PAUSED &&
                   current->paused_from_ == GalleryState::QUEUED);
  if (!in_place) return {TransitionStatus::CONFLICT};

  auto files = DescribeFiles(current->path_, added, next_seq);
  return Write("rescan", [&](duckdb_connection& conn) -> FollowUpResult {
    auto fresh = LoadGallery(conn, id);
    if (!fresh) return {TransitionStatus::NOT_FOUND};
    if (fresh->state_ != current->state_) return {TransitionStatus::CONFLICT};
    for (const auto& file : files) {
      fresh->total_images_ += 1;
      fresh->total_size_ += file.size_bytes_;
    }
    size_t count = files.size();
    InsertFiles(conn, id, std::move(files));
    GalleryService service{conn};
    service.UpdateColumns(*fresh, id,
                          std::array{GalleryMapper::Column("total_images"),
                                     GalleryMapper::Column("total_size")});
    return {TransitionStatus::OK, 0, count};
  });
}

void QueueManager::RecoverInterrupted() {
  std::vector<GalleryEvent> events;
  Write("recover", [&](duckdb_connection& conn) {
    GalleryService service{conn};
    for (auto& gallery : service.GetGalleryByState(GalleryState::UPLOADING)) {
      gallery.state_         = GalleryState::INCOMPLETE;
      gallery.finished_ts_   = NowUnix();
      gallery.error_kind_    = ErrorKind::CANCELLED;
      gallery.error_message_ = "Upload interrupted by shutdown";
      service.Update(gallery, gallery.id_);
      events.push_back({gallery.id_, GalleryState::UPLOADING, GalleryState::INCOMPLETE});
    }
    duckorm::execute(conn, "UPDATE HostUpload SET state=? WHERE state=?;",
                     {static_cast<int32_t>(HostUploadState::PENDING),
                      static_cast<int32_t>(HostUploadState::UPLOADING)});
  });
  for (const auto& event : events) {
    LOG(WARNING) << "[queue] gallery " << event.id_ << " was interrupted, marked incomplete";
    events_.Publish(event);
  }
}

auto QueueManager::EnqueueHostUpload(gallery_id_t gallery_id, const host_id_t& host_id)
    -> host_job_id_t {
  return Write("enqueue_host_upload", [&](duckdb_connection& conn) -> host_job_id_t {
    HostUploadService service{conn};
    HostUploadFilter  live{host_id, gallery_id,
                          {HostUploadState::PENDING, HostUploadState::UPLOADING}};
    auto              existing = service.GetByFilter(live);
    if (!existing.empty()) return existing.front().id_;

    HostUploadJob job;
    job.id_         = NextId(conn, "host_upload_id_seq");
    job.gallery_id_ = gallery_id;
    job.host_id_    = host_id;
    job.state_      = HostUploadState::PENDING;
    job.created_ts_ = NowUnix();
    service.Insert(job);
    return job.id_;
  });
}

auto QueueManager::GetHostUploads(const HostUploadFilter& filter) -> std::vector<HostUploadJob> {
  return Read("get_host_uploads", [&](duckdb_connection& conn) {
    HostUploadService service{conn};
    return service.GetByFilter(filter);
  });
}

auto QueueManager::GetHostUpload(host_job_id_t job_id) -> std::optional<HostUploadJob> {
  return Read("get_host_upload", [&](duckdb_connection& conn) -> std::optional<HostUploadJob> {
    HostUploadService service{conn};
    auto              found = service.GetByPredicate(std::format("id={}", job_id));
    if (found.empty()) return std::nullopt;
    return std::move(found.front());
  });
}

auto QueueManager::UpdateHostUpload(const HostUploadJob& job) -> bool {
  return Write("update_host_upload", [&](duckdb_connection& conn) {
    HostUploadService service{conn};
    if (service.GetByPredicate(std::format("id={}", job.id_)).empty()) return false;
    service.Update(job, job.id_);
    return true;
  });
}

auto QueueManager::ClaimHostUpload(host_job_id_t job_id) -> TransitionStatus {
  return Write("claim_host_upload", [&](duckdb_connection& conn) {
    HostUploadService service{conn};
    auto              found = service.GetByPredicate(std::format("id={}", job_id));
    if (found.empty()) return TransitionStatus::NOT_FOUND;
    auto& job = found.front();
    if (job.state_ != HostUploadState::PENDING) return TransitionStatus::CONFLICT;
    job.state_ = HostUploadState::UPLOADING;
    service.UpdateColumns(job, job_id, std::array{HostUploadMapper::Column("state")});
    return TransitionStatus::OK;
  });
}

auto QueueManager::PendingHostUploads(const host_id_t& host_id) -> std::vector<HostUploadJob> {
  return GetHostUploads(HostUploadFilter{host_id, std::nullopt, {HostUploadState::PENDING}});
}

void QueueManager::AddUnnamed(const std::string& host_gallery_id,
                              const std::string& intended_name) {
  Write("add_unnamed", [&](duckdb_connection& conn) {
    auto name    = conv::ToValidUtf8(intended_name);
    auto present = duckorm::scalar_int64(
        conn, "SELECT count(*) FROM UnnamedGallery WHERE gallery_id=?;", {host_gallery_id});
    if (present > 0) {
      duckorm::execute(conn,
                       "UPDATE UnnamedGallery SET intended_name=?, discovered_ts=? WHERE "
                       "gallery_id=?;",
                       {name, NowUnix(), host_gallery_id});
      return;
    }
    UnnamedGalleryService service{conn};
    service.Insert(UnnamedGallery{host_gallery_id, name, NowUnix()});
  });
}

void QueueManager::RemoveUnnamed(const std::string& host_gallery_id) {
  Write("remove_unnamed", [&](duckdb_connection& conn) {
    UnnamedGalleryService service{conn};
    service.RemoveByGalleryId(host_gallery_id);
  });
}

auto QueueManager::GetUnnamed() -> std::vector<UnnamedGallery> {
  return Read("get_unnamed", [&](duckdb_connection& conn) {
    UnnamedGalleryService service{conn};
    return service.GetByPredicate("TRUE ORDER BY discovered_ts");
  });
}

auto QueueManager::MetricsSince(int32_t days) const -> std::string {
  return MetricsDay(clock_() - std::chrono::days{std::max(days, 1) - 1});
}

void QueueManager::RecordTransfer(const TransferSample& sample) {
  auto now = clock_();
  Write("record_transfer", [&](duckdb_connection& conn) {
    HostMetricsService service{conn};
    service.Accumulate(sample, kDailyPeriod, MetricsDay(now), ToUnix(now));
    service.Accumulate(sample, kAllTimePeriod, "", ToUnix(now));
  });
  VLOG(1) << "[queue] " << sample.host_ << " transfer: " << sample.bytes_ << " bytes, "
          << sample.files_ok_ << " ok, " << sample.files_failed_ << " failed";
}

auto QueueManager::GetHostMetrics(const host_id_t& host, MetricsPeriod period) -> HostMetrics {
  return Read("get_host_metrics", [&](duckdb_connection& conn) {
    HostMetricsService service{conn};
    switch (period) {
      case MetricsPeriod::TODAY:
        return service.SumDaily(host, MetricsSince(1));
      case MetricsPeriod::WEEK:
        return service.SumDaily(host, MetricsSince(7));
      case MetricsPeriod::MONTH:
        return service.SumDaily(host, MetricsSince(30));
      case MetricsPeriod::ALL_TIME:
        break;
    }
    return service.AllTime(host);
  });
}

auto QueueManager::GetDailyMetrics(const host_id_t& host, int32_t days)
    -> std::vector<HostMetrics> {
  return Read("get_daily_metrics", [&](duckdb_connection& conn) {
    HostMetricsService service{conn};
    return service.DailyRows(host, MetricsSince(days));
  });
}

auto QueueManager::MetricsHosts() -> std::vector<host_id_t> {
  return Read("metrics_hosts", [&](duckdb_connection& conn) {
    HostMetricsService service{conn};
    return service.Hosts();
  });
}

auto QueueManager::PruneMetrics(int32_t days_to_keep) -> int64_t {
  auto removed = Write("prune_metrics", [&](duckdb_connection& conn) {
    HostMetricsService service{conn};
    return service.RemoveDailyBefore(MetricsSince(days_to_keep));
  });
  if (removed > 0) LOG(INFO) << "[queue] pruned " << removed << " daily metric rows";
  return removed;
}
};  // namespace imxup

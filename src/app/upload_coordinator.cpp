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

#include "app/upload_coordinator.hpp"

#include <easy/profiler.h>
#include <glog/logging.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

#include "network/host_config.hpp"
#include "network/host_protocol_client.hpp"
#include "storage/storage_error.hpp"

namespace imxup {
namespace {
auto TriggerFor(HookEvent event) -> HostTrigger {
  switch (event) {
    case HookEvent::ADDED:
      return HostTrigger::ON_ADDED;
    case HookEvent::STARTED:
      return HostTrigger::ON_STARTED;
    case HookEvent::COMPLETED:
      return HostTrigger::ON_COMPLETED;
  }
  return HostTrigger::DISABLED;
}

auto FailureText(const HookOutcome& outcome) -> std::string {
  std::string text;
  for (const auto& failure : outcome.failures_) {
    if (!text.empty()) text += "; ";
    text += failure;
  }
  return text.empty() ? std::string{"required hook failed"} : text;
}
}  // namespace

UploadCoordinator::UploadCoordinator(AppConfig config, CredentialCipher cipher,
                                     TransportFactory transports,
                                     std::unique_ptr<PrimaryHostClient> primary,
                                     FileHostClientFactory host_factory,
                                     CommandRunner hook_runner)
    : config_(std::move(config)),
      cipher_(std::move(cipher)),
      transports_(std::move(transports)),
      proxies_(config_.proxy_),
      primary_(std::move(primary)) {
  if (!transports_) throw std::invalid_argument("UploadCoordinator needs a transport factory");
  for (const auto& dir : {config_.data_dir_, config_.temp_dir_, config_.artifact_dir_}) {
    if (!dir.empty()) std::filesystem::create_directories(dir);
  }
  if (config_.database_path_.has_parent_path()) {
    std::filesystem::create_directories(config_.database_path_.parent_path());
  }

  db_     = std::make_shared<DBController>(config_.database_path_);
  queue_  = std::make_unique<QueueManager>(db_, config_.storage_retry_);
  tokens_ = std::make_unique<TokenCache>(config_.token_cache_path_, cipher_);
  if (!primary_) {
    primary_transport_ = MakeTransport(kPrimaryProxyCategory, kPrimaryMetricsHost);
    primary_           = std::make_unique<ImxHostClient>(config_.primary_, *primary_transport_,
                                                         config_.network_retry_);
  }
  hooks_   = std::make_unique<HooksExecutor>(config_.hooks_, config_.temp_dir_ / "hooks",
                                           std::move(hook_runner));
  scanner_ = std::make_unique<GalleryScanner>(*queue_);
  engine_  = std::make_unique<UploadEngine>(config_.primary_, *primary_, *queue_, status_,
                                           config_.artifact_dir_);
  engine_->SetListener(this);

  if (!host_factory) {
    host_factory = [this](const HostConfig& host, const HostSettings& settings) {
      return std::make_unique<HostProtocolClient>(host, settings.credentials_, *tokens_,
                                                  MakeTransport(kFileHostProxyCategory, host.id_),
                                                  config_.network_retry_,
                                                  config_.token_refresh_margin_);
    };
  }
  pool_ = std::make_unique<FileHostWorkerPool>(*queue_, status_, std::move(host_factory),
                                               config_.temp_dir_ / "hosts");

  RenameSettings rename;
  rename.web_url_     = config_.primary_.web_url_;
  rename.username_    = config_.primary_.username_;
  rename.password_    = config_.primary_.password_;
  rename.cookie_file_ = config_.cookie_file_;
  web_transport_      = MakeTransport(kPrimaryProxyCategory, kPrimaryMetricsHost);
  rename_ = std::make_unique<RenameWorker>(rename, *web_transport_, *queue_, status_);
}

UploadCoordinator::~UploadCoordinator() { Stop(); }

auto UploadCoordinator::MakeTransport(std::string_view category, std::string_view service)
    -> std::unique_ptr<HttpTransport> {
  auto route = proxies_.Resolve(category, service);
  VLOG(1) << "[app] " << category << "/" << service << " connects "
          << (route.Direct() ? std::string{"directly"} : "through the " + route.source_ + " proxy");
  return std::make_unique<ProxiedTransport>(transports_(), std::move(route));
}

void UploadCoordinator::Start() {
  if (running_.load()) return;
  std::vector<HostConfig> hosts;
  if (std::filesystem::is_directory(config_.hosts_dir_)) {
    hosts = LoadHostConfigs(config_.hosts_dir_);
  }
  queue_->RecoverInterrupted();
  tokens_->Init();
  running_.store(true);

  pool_->Configure(hosts, config_.hosts_);
  pool_->Start();
  scanner_->Start();
  rename_->Start();

  // Galleries added before the last shutdown that were never scanned
  GalleryFilter unscanned;
  unscanned.states_ = {GalleryState::VALIDATING, GalleryState::SCANNING};
  for (const auto& gallery : queue_->Query(unscanned)) {
    if (gallery.error_kind_ == ErrorKind::NONE) scanner_->Submit(gallery.id_);
  }

  upload_thread_ = std::thread([this] { UploadLoop(); });
  task_thread_   = std::thread([this] { TaskLoop(); });
  LOG(INFO) << "[app] coordinator started with " << pool_->EnabledHosts().size()
            << " file hosts";
}

void UploadCoordinator::Stop() {
  if (!running_.exchange(false)) return;
  engine_->RequestStopAll();
  wake_.close();
  if (upload_thread_.joinable()) upload_thread_.join();
  tasks_.close();
  if (task_thread_.joinable()) task_thread_.join();

  scanner_->Stop();
  rename_->Stop();
  pool_->Stop();
  tokens_->Teardown();
  LOG(INFO) << "[app] coordinator stopped";
}

auto UploadCoordinator::AddGallery(const file_path_t& folder, const std::string& name,
                                   bool auto_start) -> std::optional<gallery_id_t> {
  NewGallery gallery;
  gallery.path_          = std::filesystem::absolute(folder).lexically_normal();
  gallery.name_          = name;
  gallery.template_name_ = config_.template_name_;
  gallery.auto_start_    = auto_start;
  auto id                = queue_->Enqueue(gallery);
  if (!id) return std::nullopt;

  scanner_->Submit(*id);
  auto gallery_id = *id;
  Post([this, gallery_id] {
    RunHooks(HookEvent::ADDED, gallery_id, std::nullopt);
    Dispatch(HostTrigger::ON_ADDED, gallery_id);
  });
  return id;
}

auto UploadCoordinator::StartGallery(gallery_id_t id) -> TransitionStatus {
  auto status = queue_->Transition(id, {GalleryState::READY}, GalleryState::QUEUED);
  if (status == TransitionStatus::OK) wake_.push(0);
  return status;
}

auto UploadCoordinator::StopGallery(gallery_id_t id) -> bool {
  if (engine_->RequestStop(id)) return true;
  return queue_->Transition(id, {GalleryState::QUEUED}, GalleryState::PAUSED) ==
         TransitionStatus::OK;
}

auto UploadCoordinator::ResumeGallery(gallery_id_t id) -> TransitionStatus {
  auto status = queue_->Resume(id);
  if (status != TransitionStatus::OK) return status;
  auto gallery = queue_->Get(id);
  wake_.push(gallery && gallery->state_ == GalleryState::UPLOADING ? id : 0);
  return status;
}

auto UploadCoordinator::RequeueGallery(gallery_id_t id) -> FollowUpResult {
  auto result = queue_->Requeue(id);
  if (result.status_ == TransitionStatus::OK) wake_.push(0);
  return result;
}

void UploadCoordinator::UploadLoop() {
  while (running_.load()) {
    try {
      if (engine_->RunNext()) continue;
      auto woke = wake_.pop_for(poll_interval_);
      if (woke && *woke != 0) engine_->UploadGallery(*woke);
    } catch (const StorageUnavailableError& e) {
      LOG(ERROR) << "[app] queue storage unavailable: " << e.what();
      wake_.pop_for(poll_interval_);
    } catch (const std::exception& e) {
      LOG(ERROR) << "[app] upload loop: " << e.what();
      wake_.pop_for(poll_interval_);
    }
  }
}

void UploadCoordinator::TaskLoop() {
  while (auto task = tasks_.pop()) {
    try {
      (*task)();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[app] follow-up task failed: " << e.what();
    }
    pending_tasks_.fetch_sub(1);
  }
}

void UploadCoordinator::Post(Task task) {
  pending_tasks_.fetch_add(1);
  if (!tasks_.push(std::move(task))) {
    pending_tasks_.fetch_sub(1);
    LOG(WARNING) << "[app] follow-up task dropped, coordinator is stopping";
  }
}

auto UploadCoordinator::RunHooks(HookEvent event, gallery_id_t id,
                                 const std::optional<file_path_t>& artifact)
    -> std::optional<HookOutcome> {
  EASY_BLOCK("UploadCoordinator::RunHooks");
  auto gallery = queue_->Get(id);
  if (!gallery) return std::nullopt;

  auto context      = HookContext::FromGallery(*gallery);
  context.tab_name_ = config_.tab_name_;
  if (artifact) context.json_path_ = *artifact;
  auto outcome = hooks_->Execute(event, context);
  if (outcome.executed_ == 0) return outcome;

  GalleryPatch patch;
  for (size_t i = 0; i < outcome.ext_.size(); ++i) patch.ext_[i] = outcome.ext_[i];
  if (!outcome.success_) {
    patch.error_kind_    = ErrorKind::HOOK;
    patch.error_message_ = FailureText(outcome);
  }
  if (!patch.Empty()) queue_->UpdateFields(id, patch);
  return outcome;
}

void UploadCoordinator::Dispatch(HostTrigger trigger, gallery_id_t id) {
  auto gallery = queue_->Get(id);
  if (!gallery) return;
  auto jobs = pool_->DispatchGallery(trigger, *gallery);
  if (!jobs.empty()) {
    VLOG(1) << "[app] gallery " << id << " queued on " << jobs.size() << " file hosts ("
            << ToString(trigger) << ")";
  }
}

void UploadCoordinator::OnGalleryStarted(const Gallery& gallery) {
  auto outcome = RunHooks(HookEvent::STARTED, gallery.id_, std::nullopt);
  if (outcome && !outcome->success_) {
    engine_->Abort(gallery.id_, ErrorKind::HOOK, FailureText(*outcome));
    return;
  }
  auto id = gallery.id_;
  Post([this, id] { Dispatch(TriggerFor(HookEvent::STARTED), id); });
}

void UploadCoordinator::OnGalleryCreated(const Gallery& gallery,
                                         const std::string& host_gallery_id) {
  rename_->Submit(host_gallery_id, gallery.name_);
}

void UploadCoordinator::OnGalleryFinished(const Gallery& gallery, GalleryState state,
                                          const std::optional<file_path_t>& artifact) {
  if (state != GalleryState::COMPLETED) return;
  auto id = gallery.id_;
  Post([this, id, artifact] {
    RunHooks(HookEvent::COMPLETED, id, artifact);
    Dispatch(TriggerFor(HookEvent::COMPLETED), id);
  });
}

auto UploadCoordinator::Busy() -> bool {
  if (pending_tasks_.load() > 0) return true;
  GalleryFilter active;
  active.states_ = {GalleryState::VALIDATING, GalleryState::SCANNING, GalleryState::QUEUED,
                    GalleryState::UPLOADING};
  for (const auto& gallery : queue_->Query(active)) {
    // A rejected folder stays in Validating with its error
    if (gallery.state_ == GalleryState::VALIDATING && gallery.error_kind_ != ErrorKind::NONE) {
      continue;
    }
    return true;
  }
  HostUploadFilter jobs;
  jobs.states_ = {HostUploadState::PENDING, HostUploadState::UPLOADING};
  return !queue_->GetHostUploads(jobs).empty();
}

auto UploadCoordinator::WaitUntilIdle(std::chrono::milliseconds timeout,
                                      const std::function<bool()>& interrupted) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  // Scanner and engine hand a gallery over in two steps (Ready then Queued, Completed then the
  // follow-up task), so idle has to hold for two polls in a row
  int  idle_polls = 0;
  while (idle_polls < 2) {
    idle_polls = Busy() ? 0 : idle_polls + 1;
    if (idle_polls == 2) break;
    if (interrupted && interrupted()) return false;
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds{100});
  }
  return true;
}
};  // namespace imxup

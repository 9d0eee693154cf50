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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "app/app_config.hpp"
#include "auth/credential_cipher.hpp"
#include "auth/token_cache.hpp"
#include "hooks/hooks_executor.hpp"
#include "network/http_transport.hpp"
#include "network/primary_host_client.hpp"
#include "network/proxy_resolver.hpp"
#include "queue/gallery_scanner.hpp"
#include "queue/queue_manager.hpp"
#include "storage/controller/db_controller.hpp"
#include "upload/upload_engine.hpp"
#include "utils/queue/queue.hpp"
#include "workers/file_host_worker_pool.hpp"
#include "workers/rename_worker.hpp"
#include "workers/worker_status_table.hpp"

namespace imxup {
/**
 * @brief Wires the queue, the scanner, the upload engine, the file host pool, the rename worker
 *        and the hooks into one running application.
 *
 * One thread takes queued galleries and hands them to the upload engine. A second thread runs
 * the work that follows lifecycle events (added and completed hooks, host job dispatch) so
 * uploads never wait for an external program. Hooks of the started event run before the first
 * image is sent; a required one that fails aborts the gallery.
 *
 * The primary host, the rename worker and every secondary host client each get their own
 * transport from `transports`, so their login sessions stay apart. Each of those transports
 * goes through the proxy the config assigns to its category and service.
 */
class UploadCoordinator final : public UploadListener {
 public:
  UploadCoordinator(AppConfig config, CredentialCipher cipher,
                    TransportFactory transports,
                    std::unique_ptr<PrimaryHostClient> primary = nullptr,
                    FileHostClientFactory host_factory = nullptr,
                    CommandRunner hook_runner = RunShellCommand);
  ~UploadCoordinator() override;

  UploadCoordinator(const UploadCoordinator&)            = delete;
  UploadCoordinator& operator=(const UploadCoordinator&) = delete;

  /**
   * @brief Recover interrupted work, then start every worker
   */
  void Start();
  /**
   * @brief Running galleries are paused, host transfers go back to pending. A stopped
   *        coordinator is not started again.
   */
  void Stop();

  /**
   * @brief Enqueue a folder and hand it to the scanner. nullopt when the folder is already in
   *        the queue.
   */
  auto AddGallery(const file_path_t& folder, const std::string& name = {}, bool auto_start = true)
      -> std::optional<gallery_id_t>;
  /**
   * @brief Ready to Queued
   */
  auto StartGallery(gallery_id_t id) -> TransitionStatus;
  /**
   * @brief Pause a queued gallery, or stop a running upload after its current transfers
   */
  auto StopGallery(gallery_id_t id) -> bool;
  /**
   * @brief Paused back to the state it paused from; a paused upload continues where it stopped
   */
  auto ResumeGallery(gallery_id_t id) -> TransitionStatus;
  auto RequeueGallery(gallery_id_t id) -> FollowUpResult;

  /**
   * @brief Block until no gallery is waiting or uploading, every follow-up task ran and no host
   *        job is pending
   *
   * @return false on timeout or when `interrupted` returned true
   */
  auto WaitUntilIdle(std::chrono::milliseconds timeout,
                     const std::function<bool()>& interrupted = {}) -> bool;

  auto Queue() -> QueueManager& { return *queue_; }
  auto Status() -> WorkerStatusTable& { return status_; }
  auto Pool() -> FileHostWorkerPool& { return *pool_; }
  auto Config() const -> const AppConfig& { return config_; }

  void OnGalleryStarted(const Gallery& gallery) override;
  void OnGalleryCreated(const Gallery& gallery, const std::string& host_gallery_id) override;
  void OnGalleryFinished(const Gallery& gallery, GalleryState state,
                         const std::optional<file_path_t>& artifact) override;

 private:
  using Task = std::function<void()>;

  void UploadLoop();
  void TaskLoop();
  void Post(Task task);
  auto Busy() -> bool;

  auto RunHooks(HookEvent event, gallery_id_t id, const std::optional<file_path_t>& artifact)
      -> std::optional<HookOutcome>;
  void Dispatch(HostTrigger trigger, gallery_id_t id);
  /**
   * @brief Fresh transport routed through the proxy assigned to `category`/`service`
   */
  auto MakeTransport(std::string_view category, std::string_view service)
      -> std::unique_ptr<HttpTransport>;

  AppConfig                               config_;
  CredentialCipher                        cipher_;
  TransportFactory                        transports_;
  ProxyResolver                           proxies_;
  std::unique_ptr<HttpTransport>          primary_transport_;
  std::unique_ptr<HttpTransport>          web_transport_;
  std::shared_ptr<DBController>           db_;
  std::unique_ptr<QueueManager>           queue_;
  WorkerStatusTable                       status_;
  std::unique_ptr<TokenCache>             tokens_;
  std::unique_ptr<PrimaryHostClient>      primary_;
  std::unique_ptr<HooksExecutor>          hooks_;
  std::unique_ptr<GalleryScanner>         scanner_;
  std::unique_ptr<UploadEngine>           engine_;
  std::unique_ptr<FileHostWorkerPool>     pool_;
  std::unique_ptr<RenameWorker>           rename_;

  // Galleries resumed into Uploading; 0 only wakes the upload thread
  ConcurrentBlockingQueue<gallery_id_t>   wake_;
  ConcurrentBlockingQueue<Task>           tasks_;
  std::atomic<int>                        pending_tasks_{0};
  std::atomic<bool>                       running_{false};
  std::thread                             upload_thread_;
  std::thread                             task_thread_;
  std::chrono::milliseconds               poll_interval_{250};
};
};  // namespace imxup

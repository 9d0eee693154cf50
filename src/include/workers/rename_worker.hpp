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
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "network/http_transport.hpp"
#include "queue/queue_manager.hpp"
#include "type/type.hpp"
#include "utils/clock/time_provider.hpp"
#include "utils/queue/queue.hpp"
#include "workers/worker_status_table.hpp"

namespace imxup {
enum class RenameStatus : uint8_t {
  OK = 0,
  FAILED,
  // The host answered with a bot challenge page instead of the requested one
  ANTI_BOT,
  NOT_LOGGED_IN,
  NO_CREDENTIALS,
};

auto ToString(RenameStatus status) -> std::string_view;

struct RenameRequest {
  std::string gallery_id_;
  std::string name_;
};

struct RenameSettings {
  std::string          web_url_ = "https://imx.to";
  std::string          username_;
  std::string          password_;
  // Netscape cookies.txt seeded into the session before the first login, optional
  file_path_t          cookie_file_;
  std::chrono::seconds reauth_interval_{5};
};

inline const worker_id_t kRenameWorkerId = "rename";

/**
 * @brief Renames galleries on the primary host through its web interface.
 *
 * Uploads through the API create galleries without a name; the name is set afterwards with
 * the logged-in web session. Requests are handled one at a time on a background thread.
 * A rename that cannot be done is recorded as an unnamed gallery and retried after the next
 * successful login. A session that turns out to be logged out triggers a login, at most one
 * per reauth interval however many requests hit the expired session.
 */
class RenameWorker {
 public:
  RenameWorker(RenameSettings settings, HttpTransport& transport, QueueManager& queue,
               WorkerStatusTable& status, SteadyClockFn clock = TimeProvider::SteadyClock());
  ~RenameWorker();

  RenameWorker(const RenameWorker&)            = delete;
  RenameWorker& operator=(const RenameWorker&) = delete;

  void Start();
  void Stop();
  auto Submit(const std::string& gallery_id, const std::string& name) -> bool;

  /**
   * @brief Reuse the session cookies if they are still logged in, otherwise post the login form
   */
  auto Login() -> RenameStatus;
  /**
   * @brief Rename one gallery on the calling thread, recording it as unnamed on failure
   */
  auto RenameNow(const std::string& gallery_id, const std::string& name) -> RenameStatus;
  /**
   * @brief Retry the recorded unnamed galleries
   *
   * @return number of galleries renamed
   */
  auto RetryUnnamed() -> size_t;

  auto LoginAttempts() const -> uint32_t { return login_attempts_.load(); }

 private:
  void Run();
  auto Rename(const std::string& gallery_id, const std::string& name) -> RenameStatus;
  auto CheckSession() -> RenameStatus;
  auto TryReauthenticate() -> bool;
  void SeedCookies();
  auto Get(const std::string& url) -> HttpResponse;
  auto PostForm(const std::string& url, const FieldList& fields) -> HttpResponse;

  RenameSettings                                       settings_;
  HttpTransport&                                       transport_;
  QueueManager&                                        queue_;
  WorkerStatusTable&                                   status_;
  SteadyClockFn                                        clock_;

  ConcurrentBlockingQueue<RenameRequest>               requests_;
  std::thread                                          thread_;
  std::atomic<bool>                                    running_{false};

  std::mutex                                           auth_mutex_;
  std::mutex                                           login_mutex_;
  std::optional<std::chrono::steady_clock::time_point> last_reauth_;
  std::atomic<uint32_t>                                login_attempts_{0};
  std::atomic<bool>                                    retry_unnamed_{false};
  bool                                                 cookies_seeded_ = false;
};
};  // namespace imxup

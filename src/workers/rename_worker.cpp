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

#include "workers/rename_worker.hpp"

#include <glog/logging.h>

#include <utility>

#include "network/cookie_file.hpp"
#include "storage/storage_error.hpp"
#include "utils/string/convert.hpp"

namespace imxup {
namespace {
constexpr std::string_view kAntiBotMarker = "DDoS-Guard";

auto IsAntiBot(const HttpResponse& response) -> bool {
  return conv::Contains(response.body_, kAntiBotMarker);
}

/**
 * @brief The host sends logged-out sessions to its login page or answers with the login form
 */
auto IsLoggedOut(const HttpResponse& response) -> bool {
  return response.status_ == 401 || response.status_ == 403 ||
         conv::ContainsNoCase(response.final_url_, "login") ||
         conv::Contains(response.body_, "name=\"usr_email\"");
}

auto HostOf(const std::string& url) -> std::string {
  auto scheme = url.find("://");
  auto begin  = scheme == std::string::npos ? 0 : scheme + 3;
  auto end    = url.find('/', begin);
  return url.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
}
}  // namespace

auto ToString(RenameStatus status) -> std::string_view {
  switch (status) {
    case RenameStatus::OK:
      return "ok";
    case RenameStatus::FAILED:
      return "failed";
    case RenameStatus::ANTI_BOT:
      return "anti_bot";
    case RenameStatus::NOT_LOGGED_IN:
      return "not_logged_in";
    case RenameStatus::NO_CREDENTIALS:
      return "no_credentials";
  }
  return "failed";
}

RenameWorker::RenameWorker(RenameSettings settings, HttpTransport& transport, QueueManager& queue,
                           WorkerStatusTable& status, SteadyClockFn clock)
    : settings_(std::move(settings)),
      transport_(transport),
      queue_(queue),
      status_(status),
      clock_(std::move(clock)) {
  ActiveWorker entry;
  entry.id_        = kRenameWorkerId;
  entry.kind_      = WorkerKind::RENAME;
  entry.host_name_ = HostOf(settings_.web_url_);
  status_.Put(std::move(entry));
}

RenameWorker::~RenameWorker() { Stop(); }

void RenameWorker::Start() {
  if (running_.exchange(true)) return;
  requests_.reopen();
  thread_ = std::thread([this] { Run(); });
}

void RenameWorker::Stop() {
  if (!running_.exchange(false)) return;
  requests_.close();
  if (thread_.joinable()) thread_.join();
}

auto RenameWorker::Submit(const std::string& gallery_id, const std::string& name) -> bool {
  if (gallery_id.empty() || name.empty()) return false;
  return requests_.push(RenameRequest{gallery_id, name});
}

void RenameWorker::Run() {
  status_.SetState(kRenameWorkerId, "authenticating");
  auto login = Login();
  if (login != RenameStatus::OK) {
    LOG(WARNING) << "[rename] initial login: " << ToString(login);
  }
  status_.SetState(kRenameWorkerId, "idle");

  auto drain_unnamed = [this] {
    if (!retry_unnamed_.exchange(false)) return;
    try {
      auto renamed = RetryUnnamed();
      if (renamed > 0) LOG(INFO) << "[rename] renamed " << renamed << " pending galleries";
    } catch (const StorageUnavailableError& e) {
      LOG(ERROR) << "[rename] cannot read unnamed galleries: " << e.what();
    }
  };

  drain_unnamed();
  while (auto request = requests_.pop()) {
    try {
      RenameNow(request->gallery_id_, request->name_);
    } catch (const StorageUnavailableError& e) {
      LOG(ERROR) << "[rename] gallery " << request->gallery_id_
                 << " outcome not recorded: " << e.what();
    }
    drain_unnamed();
  }
}

void RenameWorker::SeedCookies() {
  if (cookies_seeded_) return;
  cookies_seeded_ = true;
  if (settings_.cookie_file_.empty()) return;
  auto cookies = LoadNetscapeCookies(settings_.cookie_file_, HostOf(settings_.web_url_));
  for (const auto& cookie : cookies) {
    transport_.SetCookie(cookie.domain_, cookie.name_, cookie.value_);
  }
  if (!cookies.empty()) {
    VLOG(1) << "[auth] loaded " << cookies.size() << " cookies from "
            << settings_.cookie_file_.string();
  }
}

auto RenameWorker::Get(const std::string& url) -> HttpResponse {
  HttpRequest request;
  request.method_ = HttpMethod::GET;
  request.url_    = url;
  return transport_.Send(request);
}

auto RenameWorker::PostForm(const std::string& url, const FieldList& fields) -> HttpResponse {
  HttpRequest request;
  request.method_ = HttpMethod::POST;
  request.url_    = url;
  request.body_   = EncodeForm(fields);
  request.headers_.emplace_back("Content-Type", "application/x-www-form-urlencoded");
  return transport_.Send(request);
}

auto RenameWorker::CheckSession() -> RenameStatus {
  auto page = Get(settings_.web_url_ + "/user/gallery/manage");
  if (!page.Received()) return RenameStatus::FAILED;
  if (IsAntiBot(page)) return RenameStatus::ANTI_BOT;
  if (IsLoggedOut(page) || page.status_ != 200) return RenameStatus::NOT_LOGGED_IN;
  return RenameStatus::OK;
}

auto RenameWorker::Login() -> RenameStatus {
  std::lock_guard<std::mutex> lock(login_mutex_);
  ++login_attempts_;
  SeedCookies();

  if (!transport_.Cookies().empty()) {
    auto session = CheckSession();
    if (session == RenameStatus::OK) {
      LOG(INFO) << "[auth] authenticated using cookies";
      retry_unnamed_ = true;
      return RenameStatus::OK;
    }
    VLOG(1) << "[auth] stored session not usable: " << ToString(session);
  }

  if (settings_.username_.empty() || settings_.password_.empty()) {
    LOG(WARNING) << "[auth] no web credentials available";
    return RenameStatus::NO_CREDENTIALS;
  }

  auto response = PostForm(settings_.web_url_ + "/login.php",
                           {{"usr_email", settings_.username_},
                            {"pwd", settings_.password_},
                            {"remember", "1"},
                            {"doLogin", "Login"}});
  if (!response.Received()) {
    LOG(WARNING) << "[auth] login request failed: " << response.error_;
    return RenameStatus::FAILED;
  }
  if (IsAntiBot(response)) {
    LOG(WARNING) << "[auth] login blocked by an anti-bot challenge";
    return RenameStatus::ANTI_BOT;
  }
  const auto& landed = response.final_url_;
  if (!conv::ContainsNoCase(landed, "login") &&
      (conv::Contains(landed, "user") || conv::Contains(landed, "dashboard") ||
       conv::Contains(landed, "gallery"))) {
    LOG(INFO) << "[auth] authenticated using credentials";
    retry_unnamed_ = true;
    return RenameStatus::OK;
  }
  LOG(WARNING) << "[auth] login refused";
  return RenameStatus::FAILED;
}

auto RenameWorker::TryReauthenticate() -> bool {
  std::lock_guard<std::mutex> lock(auth_mutex_);
  auto                        now = clock_();
  if (last_reauth_ && now - *last_reauth_ < settings_.reauth_interval_) {
    VLOG(1) << "[rename] re-authentication attempted recently, skipping";
    return false;
  }
  last_reauth_ = now;
  LOG(INFO) << "[rename] session expired, re-authenticating";
  return Login() == RenameStatus::OK;
}

auto RenameWorker::Rename(const std::string& gallery_id, const std::string& name)
    -> RenameStatus {
  auto url  = settings_.web_url_ + "/user/gallery/edit?id=" + conv::UrlEncode(gallery_id);
  auto page = Get(url);
  if (!page.Received()) {
    LOG(WARNING) << "[rename] cannot load edit page of " << gallery_id << ": " << page.error_;
    return RenameStatus::FAILED;
  }
  if (IsAntiBot(page)) return RenameStatus::ANTI_BOT;
  if (IsLoggedOut(page)) return RenameStatus::NOT_LOGGED_IN;
  if (page.status_ != 200) {
    LOG(WARNING) << "[rename] cannot access edit page of " << gallery_id << " (HTTP "
                 << page.status_ << ")";
    return RenameStatus::FAILED;
  }

  auto response = PostForm(url, {{"gallery_name", name}, {"submit_new_gallery", "Rename Gallery"}});
  if (!response.Received()) return RenameStatus::FAILED;
  if (IsAntiBot(response)) return RenameStatus::ANTI_BOT;
  if (IsLoggedOut(response)) return RenameStatus::NOT_LOGGED_IN;
  if (response.status_ != 200) {
    LOG(WARNING) << "[rename] rename of " << gallery_id << " failed (HTTP " << response.status_
                 << ")";
    return RenameStatus::FAILED;
  }
  return RenameStatus::OK;
}

auto RenameWorker::RenameNow(const std::string& gallery_id, const std::string& name)
    -> RenameStatus {
  auto clean = conv::SanitizeGalleryName(name);
  if (clean.empty()) {
    LOG(WARNING) << "[rename] nothing left of name '" << name << "' after sanitizing";
    return RenameStatus::FAILED;
  }
  if (clean != name) VLOG(1) << "[rename] sanitized '" << name << "' -> '" << clean << "'";

  status_.SetState(kRenameWorkerId, "renaming");
  auto result = Rename(gallery_id, clean);
  if (result == RenameStatus::NOT_LOGGED_IN && TryReauthenticate()) {
    result = Rename(gallery_id, clean);
  }

  if (result == RenameStatus::OK) {
    LOG(INFO) << "[rename] gallery " << gallery_id << " renamed to '" << clean << "'";
    queue_.RemoveUnnamed(gallery_id);
  } else {
    LOG(WARNING) << "[rename] gallery " << gallery_id << " left unnamed (" << ToString(result)
                 << "), queued for a later attempt";
    queue_.AddUnnamed(gallery_id, clean);
    status_.SetError(kRenameWorkerId, std::string("rename ") + std::string(ToString(result)));
  }
  status_.SetState(kRenameWorkerId, "idle");
  return result;
}

auto RenameWorker::RetryUnnamed() -> size_t {
  size_t renamed = 0;
  for (const auto& unnamed : queue_.GetUnnamed()) {
    auto result =
        Rename(unnamed.host_gallery_id_, conv::SanitizeGalleryName(unnamed.intended_name_));
    if (result == RenameStatus::OK) {
      queue_.RemoveUnnamed(unnamed.host_gallery_id_);
      ++renamed;
      continue;
    }
    if (result == RenameStatus::ANTI_BOT || result == RenameStatus::NOT_LOGGED_IN) break;
  }
  return renamed;
}
};  // namespace imxup

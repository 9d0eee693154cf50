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

#include <curl/curl.h>

#include <array>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "network/http_transport.hpp"

namespace imxup {
/**
 * @brief HttpTransport on libcurl easy handles.
 *
 * Every Send() runs on its own easy handle; the handles of one transport share a cookie jar
 * through a CURLSH, so a session established by a login request is visible to the uploads that
 * follow it, from any thread.
 */
class CurlTransport final : public HttpTransport {
 public:
  explicit CurlTransport(std::string user_agent = "imxup/1.0");
  ~CurlTransport() override;

  CurlTransport(const CurlTransport&)            = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  auto Send(const HttpRequest& request, const TransferControl& control = {})
      -> HttpResponse override;

  auto Cookies() -> std::map<std::string, std::string> override;
  void SetCookie(const std::string& domain, const std::string& name,
                 const std::string& value) override;
  void ClearCookies() override;

 private:
  static void LockShared(CURL* handle, curl_lock_data data, curl_lock_access access, void* self);
  static void UnlockShared(CURL* handle, curl_lock_data data, void* self);

  // Run `op` on a throw-away handle attached to the shared cookie jar
  void        WithCookieHandle(const std::function<void(CURL*)>& op);

  std::string                                 user_agent_;
  CURLSH*                                     share_ = nullptr;
  std::array<std::mutex, CURL_LOCK_DATA_LAST> share_locks_;
};
};  // namespace imxup

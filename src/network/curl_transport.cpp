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

#include "network/curl_transport.hpp"

#include <glog/logging.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <format>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "utils/string/convert.hpp"

namespace imxup {
namespace {
constexpr long kLowSpeedLimit = 1024;

size_t         WriteToString(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t n   = size * nmemb;
  auto*        out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), n);
  return n;
}

size_t ReadFromFile(char* buffer, size_t size, size_t nitems, void* userp) {
  return std::fread(buffer, size, nitems, static_cast<std::FILE*>(userp));
}

/**
 * @brief Collect response headers. A status line starts a new response (redirects, 100-continue),
 *        so only the last response's headers are kept.
 */
size_t CollectHeader(char* buffer, size_t size, size_t nitems, void* userp) {
  const size_t     n       = size * nitems;
  auto*            headers = static_cast<FieldList*>(userp);
  std::string_view line(buffer, n);
  if (line.starts_with("HTTP/")) {
    headers->clear();
    return n;
  }
  auto colon = line.find(':');
  if (colon == std::string_view::npos) return n;
  headers->emplace_back(conv::ToLowerAscii(conv::Trim(line.substr(0, colon))),
                        conv::Trim(line.substr(colon + 1)));
  return n;
}

struct ProgressState {
  const TransferControl*                control_;
  std::chrono::steady_clock::time_point last_report_;
  curl_off_t                            last_sent_ = 0;
  double                                speed_bps_ = 0.0;
};

int OnTransferInfo(void* userp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t ultotal,
                   curl_off_t ulnow) {
  auto* state = static_cast<ProgressState*>(userp);
  auto  now   = std::chrono::steady_clock::now();
  auto  since = now - state->last_report_;
  bool  done  = ultotal > 0 && ulnow >= ultotal;
  if (since < state->control_->interval_ && !done) return 0;

  auto seconds = std::chrono::duration<double>(since).count();
  if (seconds > 0.0 && ulnow > state->last_sent_) {
    state->speed_bps_ = static_cast<double>(ulnow - state->last_sent_) / seconds;
  }
  state->last_sent_   = ulnow;
  state->last_report_ = now;

  if (state->control_->should_stop_ && state->control_->should_stop_()) {
    return 1;
  }
  if (state->control_->progress_ && ultotal > 0) {
    state->control_->progress_(TransferProgress{static_cast<int64_t>(ulnow),
                                                static_cast<int64_t>(ultotal), state->speed_bps_});
  }
  return 0;
}

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
struct MimeDeleter {
  void operator()(curl_mime* mime) const { curl_mime_free(mime); }
};
struct FileCloser {
  void operator()(std::FILE* file) const { std::fclose(file); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using SlistPtr   = std::unique_ptr<curl_slist, SlistDeleter>;
using MimePtr    = std::unique_ptr<curl_mime, MimeDeleter>;
using FilePtr    = std::unique_ptr<std::FILE, FileCloser>;
}  // namespace

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {
  EnsureCurlGlobalInit();
  share_ = curl_share_init();
  if (share_ == nullptr) {
    throw std::runtime_error("curl_share_init failed");
  }
  curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlTransport::LockShared);
  curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlTransport::UnlockShared);
  curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
  curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
  curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
}

CurlTransport::~CurlTransport() {
  if (share_ != nullptr) curl_share_cleanup(share_);
}

void CurlTransport::LockShared(CURL*, curl_lock_data data, curl_lock_access, void* self) {
  static_cast<CurlTransport*>(self)->share_locks_[data].lock();
}

void CurlTransport::UnlockShared(CURL*, curl_lock_data data, void* self) {
  static_cast<CurlTransport*>(self)->share_locks_[data].unlock();
}

auto CurlTransport::Send(const HttpRequest& request, const TransferControl& control)
    -> HttpResponse {
  HttpResponse response;

  EasyHandle   curl(curl_easy_init());
  if (!curl) {
    response.error_ = "curl_easy_init failed";
    return response;
  }
  CURL* h = curl.get();

  char  error_buffer[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(h, CURLOPT_URL, request.url_.c_str());
  curl_easy_setopt(h, CURLOPT_SHARE, share_);
  // Empty file name turns the cookie engine on without reading anything
  curl_easy_setopt(h, CURLOPT_COOKIEFILE, "");
  curl_easy_setopt(h, CURLOPT_USERAGENT, user_agent_.c_str());
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, request.follow_redirects_ ? 1L : 0L);
  curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body_);
  curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, CollectHeader);
  curl_easy_setopt(h, CURLOPT_HEADERDATA, &response.headers_);
  curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout_.count()));
  // An empty string also keeps libcurl from picking a proxy out of the environment
  if (request.proxy_) curl_easy_setopt(h, CURLOPT_PROXY, request.proxy_->c_str());
  if (request.total_timeout_) {
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(request.total_timeout_->count()));
  }
  if (request.inactivity_timeout_) {
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimit);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(request.inactivity_timeout_->count()));
  }

  ProgressState progress{&control, std::chrono::steady_clock::now()};
  if (control.progress_ || control.should_stop_) {
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, OnTransferInfo);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &progress);
  }

  SlistPtr headers;
  for (const auto& [name, value] : request.headers_) {
    auto line = name + ": " + value;
    headers.reset(curl_slist_append(headers.release(), line.c_str()));
  }
  if (headers) curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

  MimePtr mime;
  FilePtr upload_file;
  if (request.upload_file_) {
    std::error_code ec;
    auto            size = std::filesystem::file_size(*request.upload_file_, ec);
    upload_file.reset(std::fopen(request.upload_file_->c_str(), "rb"));
    if (ec || !upload_file) {
      response.error_ = std::format("cannot open {}", request.upload_file_->string());
      return response;
    }
    curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(h, CURLOPT_READFUNCTION, ReadFromFile);
    curl_easy_setopt(h, CURLOPT_READDATA, upload_file.get());
    curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
    if (request.method_ != HttpMethod::PUT) {
      curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, ToString(request.method_).data());
    }
  } else if (!request.multipart_.empty()) {
    mime.reset(curl_mime_init(h));
    for (const auto& field : request.multipart_) {
      curl_mimepart* part = curl_mime_addpart(mime.get());
      curl_mime_name(part, field.name_.c_str());
      if (field.file_) {
        if (curl_mime_filedata(part, field.file_->c_str()) != CURLE_OK) {
          response.error_ = std::format("cannot read {}", field.file_->string());
          return response;
        }
        if (!field.filename_.empty()) curl_mime_filename(part, field.filename_.c_str());
      } else {
        curl_mime_data(part, field.value_.data(), field.value_.size());
      }
    }
    curl_easy_setopt(h, CURLOPT_MIMEPOST, mime.get());
  } else {
    switch (request.method_) {
      case HttpMethod::GET:
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        break;
      case HttpMethod::POST:
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body_.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body_.size()));
        break;
      case HttpMethod::PUT:
      case HttpMethod::DELETE:
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, ToString(request.method_).data());
        if (!request.body_.empty()) {
          curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body_.data());
          curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                           static_cast<curl_off_t>(request.body_.size()));
        }
        break;
    }
  }

  const CURLcode code = curl_easy_perform(h);
  long           status = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
  response.status_ = status;
  char* effective  = nullptr;
  if (curl_easy_getinfo(h, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
    response.final_url_ = effective;
  }

  if (code != CURLE_OK) {
    response.cancelled_ = code == CURLE_ABORTED_BY_CALLBACK;
    response.timed_out_ = code == CURLE_OPERATION_TIMEDOUT;
    response.error_     = error_buffer[0] != '\0' ? std::string(error_buffer)
                                                  : std::string(curl_easy_strerror(code));
    VLOG(1) << "[http] " << ToString(request.method_) << " " << request.url_
            << " failed: " << response.error_;
    return response;
  }
  VLOG(1) << "[http] " << ToString(request.method_) << " " << request.url_ << " -> " << status;
  return response;
}

void CurlTransport::WithCookieHandle(const std::function<void(CURL*)>& op) {
  EasyHandle curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("curl_easy_init failed");
  }
  curl_easy_setopt(curl.get(), CURLOPT_SHARE, share_);
  curl_easy_setopt(curl.get(), CURLOPT_COOKIEFILE, "");
  op(curl.get());
}

auto CurlTransport::Cookies() -> std::map<std::string, std::string> {
  std::map<std::string, std::string> cookies;
  WithCookieHandle([&](CURL* h) {
    curl_slist* list = nullptr;
    if (curl_easy_getinfo(h, CURLINFO_COOKIELIST, &list) != CURLE_OK) return;
    SlistPtr owned(list);
    // Netscape format: domain, tailmatch, path, secure, expires, name, value
    for (auto* node = list; node != nullptr; node = node->next) {
      std::istringstream       line(node->data);
      std::vector<std::string> fields;
      std::string              field;
      while (std::getline(line, field, '\t')) fields.push_back(field);
      if (fields.size() >= 7) cookies[fields[5]] = fields[6];
      else if (fields.size() == 6) cookies[fields[5]] = "";
    }
  });
  return cookies;
}

void CurlTransport::SetCookie(const std::string& domain, const std::string& name,
                              const std::string& value) {
  auto line = std::format("{}\tTRUE\t/\tFALSE\t0\t{}\t{}", domain, name, value);
  WithCookieHandle([&](CURL* h) { curl_easy_setopt(h, CURLOPT_COOKIELIST, line.c_str()); });
}

void CurlTransport::ClearCookies() {
  WithCookieHandle([](CURL* h) { curl_easy_setopt(h, CURLOPT_COOKIELIST, "ALL"); });
}
};  // namespace imxup

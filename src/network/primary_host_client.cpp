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

#include "network/primary_host_client.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace imxup {
using json = nlohmann::json;

namespace {
auto Failure(FailureKind kind, std::string message, long status = 0) -> ImageUploadResult {
  ImageUploadResult result;
  result.failure_     = kind;
  result.message_     = std::move(message);
  result.http_status_ = status;
  return result;
}

auto Transient(const HttpResponse& response) -> bool {
  if (response.cancelled_) return false;
  if (!response.error_.empty()) return true;
  return response.status_ >= 500 || response.status_ == 429;
}

auto StringField(const json& data, const char* key) -> std::string {
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) return {};
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}
}  // namespace

void to_json(json& j, const PrimaryHostSettings& s) {
  j = json{{"api_base_url", s.api_base_url_},
           {"web_url", s.web_url_},
           {"api_key", s.api_key_},
           {"username", s.username_},
           {"password", s.password_},
           {"thumbnail_size", s.thumbnail_size_},
           {"thumbnail_format", s.thumbnail_format_},
           {"parallel_batch_size", s.parallel_batch_size_},
           {"retry_passes", s.retry_passes_},
           {"inactivity_timeout", s.inactivity_timeout_.count()}};
}

void from_json(const json& j, PrimaryHostSettings& s) {
  s.api_base_url_        = j.value("api_base_url", s.api_base_url_);
  s.web_url_             = j.value("web_url", s.web_url_);
  s.api_key_             = j.value("api_key", s.api_key_);
  s.username_            = j.value("username", s.username_);
  s.password_            = j.value("password", s.password_);
  s.thumbnail_size_      = j.value("thumbnail_size", s.thumbnail_size_);
  s.thumbnail_format_    = j.value("thumbnail_format", s.thumbnail_format_);
  s.parallel_batch_size_ = std::max<uint32_t>(1, j.value("parallel_batch_size", s.parallel_batch_size_));
  s.retry_passes_        = j.value("retry_passes", s.retry_passes_);
  s.inactivity_timeout_  =
      std::chrono::seconds(j.value("inactivity_timeout", s.inactivity_timeout_.count()));
  if (s.thumbnail_size_ < 1 || s.thumbnail_size_ > 6) {
    throw std::runtime_error(std::format("thumbnail_size must be 1-6, got {}", s.thumbnail_size_));
  }
  if (s.thumbnail_format_ < 1 || s.thumbnail_format_ > 4) {
    throw std::runtime_error(
        std::format("thumbnail_format must be 1-4, got {}", s.thumbnail_format_));
  }
}

ImxHostClient::ImxHostClient(PrimaryHostSettings settings, HttpTransport& transport,
                             BackoffPolicy network_retry, SleepFn sleep)
    : settings_(std::move(settings)),
      transport_(transport),
      network_retry_(network_retry),
      sleep_(std::move(sleep)) {}

auto ImxHostClient::GalleryUrl(const std::string& gallery_id) const -> std::string {
  return settings_.web_url_ + "/g/" + gallery_id;
}

auto ImxHostClient::ThumbFromImageUrl(const std::string& image_url, const std::string& extension)
    -> std::string {
  auto marker = image_url.find("/i/");
  if (marker == std::string::npos) return {};
  auto id_begin = marker + 3;
  auto id_end   = image_url.find('/', id_begin);
  auto id       = image_url.substr(id_begin, id_end == std::string::npos ? std::string::npos
                                                                         : id_end - id_begin);
  if (id.empty()) return {};
  auto ext = conv::ToLowerAscii(extension.empty() ? ".jpg" : extension);
  return image_url.substr(0, marker) + "/u/t/" + id + ext;
}

auto ImxHostClient::UploadImage(const ImageUploadRequest& request, const TransferControl& control)
    -> ImageUploadResult {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(request.file_, ec)) {
    return Failure(FailureKind::VALIDATION, "Image file not found: " + request.file_.string());
  }
  if (settings_.api_key_.empty()) {
    return Failure(FailureKind::AUTH, "No API key configured for the primary host");
  }

  HttpRequest http;
  http.method_ = HttpMethod::POST;
  http.url_    = settings_.api_base_url_ + "/upload.php";
  http.headers_.emplace_back("X-API-Key", settings_.api_key_);
  http.multipart_.push_back(MultipartPart{"image", {}, request.file_,
                                          request.file_.filename().string()});
  if (request.create_gallery_) http.multipart_.push_back(MultipartPart{"create_gallery", "true"});
  if (!request.gallery_id_.empty()) {
    http.multipart_.push_back(MultipartPart{"gallery_id", request.gallery_id_});
  }
  http.multipart_.push_back(MultipartPart{"format", "all"});
  http.multipart_.push_back(
      MultipartPart{"thumbnail_size", std::to_string(request.thumbnail_size_)});
  http.multipart_.push_back(
      MultipartPart{"thumbnail_format", std::to_string(request.thumbnail_format_)});
  http.inactivity_timeout_ = settings_.inactivity_timeout_;
  http.total_timeout_      = std::nullopt;

  HttpResponse response;
  for (uint32_t attempt = 1;; ++attempt) {
    response = transport_.Send(http, control);
    if (response.cancelled_) return Failure(FailureKind::CANCELLED, "Upload cancelled");
    if (!Transient(response) || attempt >= network_retry_.max_attempts_) break;
    auto delay = network_retry_.DelayAfter(attempt);
    VLOG(1) << "[upload] " << request.file_.filename().string() << " attempt " << attempt
            << " failed (" << (response.error_.empty() ? std::to_string(response.status_)
                                                       : response.error_)
            << "), retrying in " << delay.count() << " ms";
    sleep_(delay);
    if (control.should_stop_ && control.should_stop_()) {
      return Failure(FailureKind::CANCELLED, "Upload cancelled");
    }
  }

  if (!response.error_.empty()) {
    return Failure(FailureKind::NETWORK, "Network error during upload: " + response.error_);
  }
  if (response.status_ >= 500 || response.status_ == 429) {
    return Failure(FailureKind::NETWORK,
                   std::format("Server answered {} after {} attempts", response.status_,
                               network_retry_.max_attempts_),
                   response.status_);
  }
  if (response.status_ == 401 || response.status_ == 403) {
    return Failure(FailureKind::AUTH, "API key rejected", response.status_);
  }
  if (response.status_ == 413) {
    return Failure(FailureKind::REJECTED, "Image too large", response.status_);
  }
  if (response.status_ != 200) {
    return Failure(FailureKind::REJECTED,
                   std::format("Upload failed with status code {}: {}", response.status_,
                               response.body_.substr(0, 200)),
                   response.status_);
  }

  auto result = ParseAnswer(response);
  if (result.success_ && result.thumb_url_.empty()) {
    result.thumb_url_ =
        ThumbFromImageUrl(result.image_url_, request.file_.extension().string());
  }
  return result;
}

auto ImxHostClient::ParseAnswer(const HttpResponse& response) const -> ImageUploadResult {
  auto doc = json::parse(response.body_, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return Failure(FailureKind::REJECTED, "Malformed answer: " + response.body_.substr(0, 200),
                   response.status_);
  }
  if (doc.value("status", std::string{}) != "success") {
    return Failure(FailureKind::REJECTED, "API error: " + doc.dump().substr(0, 200),
                   response.status_);
  }
  auto data = doc.find("data");
  if (data == doc.end() || !data->is_object()) {
    return Failure(FailureKind::REJECTED, "Answer without data", response.status_);
  }

  ImageUploadResult result;
  result.success_     = true;
  result.http_status_ = response.status_;
  result.image_url_   = StringField(*data, "image_url");
  result.thumb_url_   = StringField(*data, "thumb_url");
  result.gallery_id_  = StringField(*data, "gallery_id");
  result.bbcode_      = StringField(*data, "bbcode");
  if (result.image_url_.empty()) {
    return Failure(FailureKind::REJECTED, "Answer without image_url", response.status_);
  }
  return result;
}
};  // namespace imxup

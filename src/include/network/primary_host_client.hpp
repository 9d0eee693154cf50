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

#include <chrono>
#include <cstdint>
#include <json.hpp>
#include <string>

#include "network/file_host_client.hpp"
#include "network/http_transport.hpp"
#include "type/type.hpp"
#include "utils/retry/backoff.hpp"

namespace imxup {
/**
 * @brief Connection and upload options of the primary image host
 */
struct PrimaryHostSettings {
  std::string          api_base_url_        = "https://api.imx.to/v1";
  std::string          web_url_             = "https://imx.to";
  std::string          api_key_;
  std::string          username_;
  std::string          password_;
  // 1=100x100, 2=180x180, 3=250x250, 4=300x300, 5=350x350, 6=150x150
  int32_t              thumbnail_size_      = 3;
  // 1=fixed width, 2=proportional, 3=square, 4=fixed height
  int32_t              thumbnail_format_    = 2;
  uint32_t             parallel_batch_size_ = 4;
  // Extra passes over the images that failed
  uint32_t             retry_passes_        = 3;
  std::chrono::seconds inactivity_timeout_{300};
};

void to_json(nlohmann::json& j, const PrimaryHostSettings& s);
/**
 * @brief Missing keys keep their defaults. Throws std::runtime_error when a thumbnail option is
 *        out of range.
 */
void from_json(const nlohmann::json& j, PrimaryHostSettings& s);

struct ImageUploadRequest {
  file_path_t file_;
  // The first image of a new gallery creates it
  bool        create_gallery_   = false;
  std::string gallery_id_;
  int32_t     thumbnail_size_   = 3;
  int32_t     thumbnail_format_ = 2;
};

struct ImageUploadResult : CallOutcome {
  std::string image_url_;
  std::string thumb_url_;
  std::string gallery_id_;
  std::string bbcode_;
};

/**
 * @brief Upload of a single image to the primary host
 */
class PrimaryHostClient {
 public:
  virtual ~PrimaryHostClient() = default;

  virtual auto UploadImage(const ImageUploadRequest& request, const TransferControl& control = {})
      -> ImageUploadResult = 0;
  virtual auto GalleryUrl(const std::string& gallery_id) const -> std::string = 0;
};

/**
 * @brief imx.to upload API: multipart POST of one image to `<api>/upload.php` with the API key
 *        header. Transport failures and 5xx answers are retried with the backoff policy.
 */
class ImxHostClient final : public PrimaryHostClient {
 public:
  ImxHostClient(PrimaryHostSettings settings, HttpTransport& transport,
                BackoffPolicy network_retry = {}, SleepFn sleep = RealSleep());

  auto UploadImage(const ImageUploadRequest& request, const TransferControl& control = {})
      -> ImageUploadResult override;
  auto GalleryUrl(const std::string& gallery_id) const -> std::string override;

  /**
   * @brief Thumbnail link derived from an image link "<web>/i/<id>" when the answer has none
   */
  static auto ThumbFromImageUrl(const std::string& image_url, const std::string& extension)
      -> std::string;

 private:
  auto ParseAnswer(const HttpResponse& response) const -> ImageUploadResult;

  PrimaryHostSettings settings_;
  HttpTransport&      transport_;
  BackoffPolicy       network_retry_;
  SleepFn             sleep_;
};
};  // namespace imxup

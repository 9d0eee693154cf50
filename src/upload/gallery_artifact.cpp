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

#include "upload/gallery_artifact.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "utils/clock/time_provider.hpp"
#include "utils/string/convert.hpp"

namespace imxup {
using json = nlohmann::json;

namespace {
auto FormatTs(unix_ts_t ts) -> std::string {
  if (ts <= 0) return {};
  return TimeProvider::TimePointToString(FromUnix(ts));
}

auto LowerExtension(const std::string& file_name) -> std::string {
  auto path = std::filesystem::path(file_name);
  auto ext  = path.extension().string();
  return path.stem().string() + conv::ToLowerAscii(ext);
}
}  // namespace

auto ArtifactFileName(const Gallery& gallery) -> std::string {
  auto name = conv::SanitizeGalleryName(gallery.name_);
  if (name.empty()) name = "gallery";
  return name + "_" + gallery.host_gallery_id_ + ".json";
}

auto BuildGalleryArtifact(const Gallery& gallery, const std::vector<GalleryFile>& files,
                          int32_t thumbnail_size, int32_t thumbnail_format) -> json {
  json images = json::array();
  for (const auto& file : files) {
    if (!file.uploaded_) continue;
    images.push_back({{"filename", LowerExtension(file.file_name_)},
                      {"image_url", file.image_url_},
                      {"thumb_url", file.thumb_url_},
                      {"width", file.width_},
                      {"height", file.height_},
                      {"size_bytes", file.size_bytes_},
                      {"uploaded_at", FormatTs(file.uploaded_ts_)}});
  }

  json meta = {{"gallery_id", gallery.host_gallery_id_},
               {"gallery_name", gallery.name_},
               {"gallery_url", gallery.gallery_url_},
               {"template", gallery.template_name_},
               {"source_path", gallery.path_.string()},
               {"total_images", gallery.total_images_},
               {"uploaded_images", images.size()},
               {"total_size", gallery.total_size_},
               {"uploaded_size", gallery.uploaded_bytes_},
               {"transfer_speed_kibps", gallery.final_kibps_},
               {"started_at", FormatTs(gallery.started_ts_)},
               {"finished_at", FormatTs(gallery.finished_ts_)},
               {"thumbnail_size", thumbnail_size},
               {"thumbnail_format", thumbnail_format},
               {"avg_width", gallery.dims_.avg_width_},
               {"avg_height", gallery.dims_.avg_height_},
               {"min_width", gallery.dims_.min_width_},
               {"max_width", gallery.dims_.max_width_},
               {"min_height", gallery.dims_.min_height_},
               {"max_height", gallery.dims_.max_height_}};
  for (size_t i = 0; i < gallery.ext_.size(); ++i) {
    if (!gallery.ext_[i].empty()) meta["ext" + std::to_string(i + 1)] = gallery.ext_[i];
  }
  return json{{"meta", std::move(meta)}, {"images", std::move(images)}};
}

auto WriteGalleryArtifact(const file_path_t& dir, const Gallery& gallery,
                          const std::vector<GalleryFile>& files, int32_t thumbnail_size,
                          int32_t thumbnail_format) -> file_path_t {
  std::filesystem::create_directories(dir);
  auto target = dir / ArtifactFileName(gallery);
  auto tmp    = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Cannot write artifact " + tmp.string());
    out << BuildGalleryArtifact(gallery, files, thumbnail_size, thumbnail_format).dump(4);
    if (!out) throw std::runtime_error("Cannot write artifact " + tmp.string());
  }
  std::filesystem::rename(tmp, target);
  return target;
}
};  // namespace imxup

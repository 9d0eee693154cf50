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

#include "queue/image_files.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/string/convert.hpp"

namespace imxup {
auto IsImageExtension(const file_path_t& file) -> bool {
  static constexpr std::array<const char*, 4> kExtensions = {".jpg", ".jpeg", ".png", ".gif"};
  auto ext = conv::ToLowerAscii(file.extension().string());
  for (const auto* known : kExtensions) {
    if (ext == known) return true;
  }
  return false;
}

auto ListImageFiles(const file_path_t& folder) -> std::vector<std::string> {
  std::vector<std::string> names;
  std::error_code          ec;
  for (const auto& entry : std::filesystem::directory_iterator(folder, ec)) {
    if (!entry.is_regular_file(ec)) continue;
    if (IsImageExtension(entry.path())) {
      names.push_back(entry.path().filename().string());
    }
  }
  if (ec) {
    throw std::runtime_error("Cannot list " + folder.string() + ": " + ec.message());
  }
  conv::NaturalSort(names);
  return names;
}

auto HasImageSignature(const file_path_t& file) -> bool {
  std::ifstream in(file, std::ios::binary);
  if (!in) return false;
  std::array<unsigned char, 8> head{};
  in.read(reinterpret_cast<char*>(head.data()), head.size());
  auto got = in.gcount();

  // JPEG: FF D8 FF
  if (got >= 3 && head[0] == 0xFF && head[1] == 0xD8 && head[2] == 0xFF) return true;
  // PNG: 89 50 4E 47 0D 0A 1A 0A
  static constexpr std::array<unsigned char, 8> kPng = {0x89, 0x50, 0x4E, 0x47,
                                                         0x0D, 0x0A, 0x1A, 0x0A};
  if (got >= 8 && std::equal(kPng.begin(), kPng.end(), head.begin())) return true;
  // GIF87a / GIF89a
  if (got >= 6 && head[0] == 'G' && head[1] == 'I' && head[2] == 'F' && head[3] == '8' &&
      (head[4] == '7' || head[4] == '9') && head[5] == 'a') {
    return true;
  }
  return false;
}

auto DescribeFiles(const file_path_t& folder, const std::vector<std::string>& names,
                   int32_t first_seq) -> std::vector<GalleryFile> {
  std::vector<GalleryFile> files;
  files.reserve(names.size());
  int32_t seq = first_seq;
  for (const auto& name : names) {
    GalleryFile file;
    file.seq_        = seq++;
    file.file_name_  = name;
    file.size_bytes_ = static_cast<int64_t>(std::filesystem::file_size(folder / name));
    files.push_back(std::move(file));
  }
  return files;
}
};  // namespace imxup

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

#include <cstdint>
#include <string>
#include <vector>

#include "type/type.hpp"

namespace imxup {
struct ZipEntry {
  // Name inside the archive, '/' separated
  std::string name_;
  file_path_t source_;
  uint64_t    size_ = 0;
};

/**
 * @brief Entries for every regular file below `folder`, named `<folder name>/<relative path>`
 *        and in natural order. Throws std::runtime_error when `folder` is not a directory.
 */
auto CollectZipEntries(const file_path_t& folder) -> std::vector<ZipEntry>;

/**
 * @brief Write an uncompressed (store mode) zip of `folder` to `zip_path`, replacing any existing
 *        file. Entries and offsets are limited to 4 GiB each (no ZIP64).
 *
 * @return size of the written archive in bytes
 */
auto WriteStoreZip(const file_path_t& folder, const file_path_t& zip_path) -> uint64_t;

/**
 * @brief Archive that lives exactly as long as this object. The file is removed on destruction
 *        whatever happened in between.
 */
class ScopedArchive {
 public:
  ScopedArchive(const file_path_t& folder, file_path_t zip_path);
  ~ScopedArchive();

  ScopedArchive(const ScopedArchive&)            = delete;
  ScopedArchive& operator=(const ScopedArchive&) = delete;

  auto Path() const -> const file_path_t& { return path_; }
  auto Size() const -> uint64_t { return size_; }

 private:
  file_path_t path_;
  uint64_t    size_ = 0;
};
};  // namespace imxup

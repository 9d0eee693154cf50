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

#include "utils/archive/zip_writer.hpp"

#include <glog/logging.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <utility>

#include "utils/string/convert.hpp"

namespace imxup {
namespace {
constexpr uint32_t kLocalHeaderSig   = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralSig  = 0x06054b50;
constexpr uint16_t kVersion          = 20;
// General purpose flag bit 11: names are UTF-8
constexpr uint16_t kUtf8Names        = 0x0800;
constexpr uint64_t kMax32            = std::numeric_limits<uint32_t>::max();
constexpr size_t   kChunk            = 64 * 1024;

void Put16(std::string& out, uint16_t v) {
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void Put32(std::string& out, uint32_t v) {
  for (int shift = 0; shift < 32; shift += 8) out.push_back(static_cast<char>((v >> shift) & 0xFF));
}

struct DosStamp {
  uint16_t time_ = 0;
  uint16_t date_ = 0;
};

auto NowDos() -> DosStamp {
  std::time_t now = std::time(nullptr);
  std::tm     local{};
  localtime_r(&now, &local);
  DosStamp stamp;
  stamp.time_ = static_cast<uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
  stamp.date_ = static_cast<uint16_t>(((std::max(local.tm_year, 80) - 80) << 9) |
                                      ((local.tm_mon + 1) << 5) | local.tm_mday);
  return stamp;
}

struct WrittenEntry {
  const ZipEntry* entry_;
  uint32_t        crc_    = 0;
  uint32_t        offset_ = 0;
};
}  // namespace

auto CollectZipEntries(const file_path_t& folder) -> std::vector<ZipEntry> {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw std::runtime_error(std::format("{} is not a directory", folder.string()));
  }
  auto                  root = folder.filename().empty() ? folder.parent_path().filename()
                                                         : folder.filename();
  std::vector<ZipEntry> entries;
  for (const auto& item : std::filesystem::recursive_directory_iterator(folder)) {
    if (!item.is_regular_file()) continue;
    ZipEntry entry;
    entry.source_ = item.path();
    entry.name_   = (root / std::filesystem::relative(item.path(), folder)).generic_string();
    entry.size_   = item.file_size();
    entries.push_back(std::move(entry));
  }
  std::sort(entries.begin(), entries.end(), [](const ZipEntry& a, const ZipEntry& b) {
    return conv::NaturalLess(a.name_, b.name_);
  });
  return entries;
}

auto WriteStoreZip(const file_path_t& folder, const file_path_t& zip_path) -> uint64_t {
  auto entries = CollectZipEntries(folder);
  if (entries.size() > std::numeric_limits<uint16_t>::max()) {
    throw std::runtime_error(std::format("{} holds too many files for a zip", folder.string()));
  }

  std::ofstream out(zip_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error(std::format("cannot create {}", zip_path.string()));
  }

  const auto                stamp = NowDos();
  std::vector<WrittenEntry> written;
  written.reserve(entries.size());
  std::vector<char> buffer(kChunk);

  for (const auto& entry : entries) {
    auto offset = static_cast<uint64_t>(out.tellp());
    if (entry.size_ > kMax32 || offset > kMax32) {
      throw std::runtime_error(std::format("{} exceeds the 4 GiB zip limit", entry.name_));
    }
    std::string header;
    Put32(header, kLocalHeaderSig);
    Put16(header, kVersion);
    Put16(header, kUtf8Names);
    Put16(header, 0);  // stored
    Put16(header, stamp.time_);
    Put16(header, stamp.date_);
    Put32(header, 0);  // crc, patched below
    Put32(header, static_cast<uint32_t>(entry.size_));
    Put32(header, static_cast<uint32_t>(entry.size_));
    Put16(header, static_cast<uint16_t>(entry.name_.size()));
    Put16(header, 0);
    header += entry.name_;
    out.write(header.data(), static_cast<std::streamsize>(header.size()));

    std::ifstream in(entry.source_, std::ios::binary);
    if (!in) {
      throw std::runtime_error(std::format("cannot read {}", entry.source_.string()));
    }
    uLong    crc    = crc32(0L, Z_NULL, 0);
    uint64_t copied = 0;
    while (in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      auto got = in.gcount();
      if (got <= 0) break;
      crc = crc32(crc, reinterpret_cast<const Bytef*>(buffer.data()), static_cast<uInt>(got));
      out.write(buffer.data(), got);
      copied += static_cast<uint64_t>(got);
    }
    if (copied != entry.size_) {
      throw std::runtime_error(std::format("{} changed while being archived", entry.source_.string()));
    }

    auto end = out.tellp();
    out.seekp(static_cast<std::streamoff>(offset + 14));
    std::string crc_bytes;
    Put32(crc_bytes, static_cast<uint32_t>(crc));
    out.write(crc_bytes.data(), 4);
    out.seekp(end);

    written.push_back(WrittenEntry{&entry, static_cast<uint32_t>(crc), static_cast<uint32_t>(offset)});
  }

  auto        central_offset = static_cast<uint64_t>(out.tellp());
  std::string central;
  for (const auto& item : written) {
    const auto& entry = *item.entry_;
    Put32(central, kCentralHeaderSig);
    Put16(central, kVersion);
    Put16(central, kVersion);
    Put16(central, kUtf8Names);
    Put16(central, 0);
    Put16(central, stamp.time_);
    Put16(central, stamp.date_);
    Put32(central, item.crc_);
    Put32(central, static_cast<uint32_t>(entry.size_));
    Put32(central, static_cast<uint32_t>(entry.size_));
    Put16(central, static_cast<uint16_t>(entry.name_.size()));
    Put16(central, 0);  // extra
    Put16(central, 0);  // comment
    Put16(central, 0);  // disk
    Put16(central, 0);  // internal attributes
    Put32(central, 0);  // external attributes
    Put32(central, item.offset_);
    central += entry.name_;
  }
  if (central_offset > kMax32) {
    throw std::runtime_error(std::format("{} exceeds the 4 GiB zip limit", zip_path.string()));
  }
  auto central_size = central.size();
  Put32(central, kEndOfCentralSig);
  Put16(central, 0);
  Put16(central, 0);
  Put16(central, static_cast<uint16_t>(written.size()));
  Put16(central, static_cast<uint16_t>(written.size()));
  Put32(central, static_cast<uint32_t>(central_size));
  Put32(central, static_cast<uint32_t>(central_offset));
  Put16(central, 0);
  out.write(central.data(), static_cast<std::streamsize>(central.size()));
  out.close();
  if (!out) {
    throw std::runtime_error(std::format("failed writing {}", zip_path.string()));
  }

  auto size = central_offset + central.size();
  VLOG(1) << "[archive] wrote " << zip_path.string() << " (" << written.size() << " files, "
          << size << " bytes)";
  return size;
}

ScopedArchive::ScopedArchive(const file_path_t& folder, file_path_t zip_path)
    : path_(std::move(zip_path)) {
  try {
    size_ = WriteStoreZip(folder, path_);
  } catch (const std::exception&) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    throw;
  }
}

ScopedArchive::~ScopedArchive() {
  std::error_code ec;
  if (!std::filesystem::remove(path_, ec) && ec) {
    LOG(WARNING) << "[archive] could not remove " << path_.string() << ": " << ec.message();
  }
}
};  // namespace imxup

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

#include "utils/hash/md5.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace imxup {
auto Md5FileHex(const file_path_t& file) -> std::string {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw std::runtime_error(std::format("cannot read {}", file.string()));
  }

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("MD5 digest init failed");
  }

  std::array<char, 64 * 1024> buffer;
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
      throw std::runtime_error("MD5 digest update failed");
    }
  }
  if (in.bad()) {
    throw std::runtime_error(std::format("read error on {}", file.string()));
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int                               length = 0;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
    throw std::runtime_error("MD5 digest final failed");
  }

  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex += std::format("{:02x}", digest[i]);
  }
  return hex;
}
};  // namespace imxup

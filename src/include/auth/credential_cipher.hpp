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

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace imxup {
auto Base64Encode(std::string_view input) -> std::string;
auto Base64Decode(std::string_view input) -> std::optional<std::string>;

/**
 * @brief AES-256-GCM for credentials and tokens at rest.
 *
 * The key is derived with PBKDF2-HMAC-SHA256 from a secret tied to the machine and user.
 * Ciphertexts are base64(iv | tag | data), a fresh random iv per call.
 */
class CredentialCipher {
 public:
  explicit CredentialCipher(std::string_view secret);

  /**
   * @brief Cipher keyed on the host name and login name of the current process
   */
  static auto ForCurrentUser() -> CredentialCipher;

  auto        Encrypt(std::string_view plaintext) const -> std::string;
  /**
   * @brief nullopt when the input is not base64, was produced with another key or was altered
   */
  auto        Decrypt(std::string_view encoded) const -> std::optional<std::string>;

 private:
  static constexpr size_t       kKeySize = 32;
  static constexpr size_t       kIvSize  = 12;
  static constexpr size_t       kTagSize = 16;

  std::array<unsigned char, kKeySize> key_{};
};
};  // namespace imxup

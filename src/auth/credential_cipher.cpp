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

#include "auth/credential_cipher.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <unistd.h>

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace imxup {
namespace {
constexpr const char* kKeySalt       = "imxup.credentials.v1";
constexpr int         kKdfIterations = 100000;

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
};  // namespace

auto Base64Encode(std::string_view input) -> std::string {
  BIO* b64  = BIO_new(BIO_f_base64());
  BIO* bmem = BIO_new(BIO_s_mem());
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
  b64 = BIO_push(b64, bmem);
  BIO_write(b64, input.data(), static_cast<int>(input.size()));
  BIO_flush(b64);
  BUF_MEM* bptr = nullptr;
  BIO_get_mem_ptr(b64, &bptr);
  std::string out(bptr->data, bptr->length);
  BIO_free_all(b64);
  return out;
}

auto Base64Decode(std::string_view input) -> std::optional<std::string> {
  if (input.empty()) return std::string{};
  std::string out(input.size(), '\0');
  BIO*        b64  = BIO_new(BIO_f_base64());
  BIO*        bmem = BIO_new_mem_buf(input.data(), static_cast<int>(input.size()));
  BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
  bmem        = BIO_push(b64, bmem);
  int decoded = BIO_read(bmem, out.data(), static_cast<int>(out.size()));
  BIO_free_all(bmem);
  if (decoded <= 0) return std::nullopt;
  out.resize(static_cast<size_t>(decoded));
  return out;
}

CredentialCipher::CredentialCipher(std::string_view secret) {
  const auto* salt = reinterpret_cast<const unsigned char*>(kKeySalt);
  if (PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()), salt,
                        static_cast<int>(std::char_traits<char>::length(kKeySalt)), kKdfIterations,
                        EVP_sha256(), static_cast<int>(key_.size()), key_.data()) != 1) {
    throw std::runtime_error("Credential key derivation failed");
  }
}

auto CredentialCipher::ForCurrentUser() -> CredentialCipher {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) != 0) host[0] = '\0';
  const char* user = std::getenv("USER");
  std::string secret = std::string(host) + ":" + (user ? user : "imxup");
  return CredentialCipher{secret};
}

auto CredentialCipher::Encrypt(std::string_view plaintext) const -> std::string {
  std::vector<unsigned char> buffer(kIvSize + kTagSize + plaintext.size());
  unsigned char*             iv   = buffer.data();
  unsigned char*             tag  = buffer.data() + kIvSize;
  unsigned char*             data = buffer.data() + kIvSize + kTagSize;
  if (RAND_bytes(iv, static_cast<int>(kIvSize)) != 1) {
    throw std::runtime_error("No randomness available for credential encryption");
  }

  CipherCtxPtr ctx{EVP_CIPHER_CTX_new()};
  int          len = 0;
  if (!ctx || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) !=
          1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) != 1 ||
      EVP_EncryptUpdate(ctx.get(), data, &len,
                        reinterpret_cast<const unsigned char*>(plaintext.data()),
                        static_cast<int>(plaintext.size())) != 1 ||
      EVP_EncryptFinal_ex(ctx.get(), data + len, &len) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag) != 1) {
    throw std::runtime_error("Credential encryption failed");
  }
  return Base64Encode(
      std::string_view(reinterpret_cast<const char*>(buffer.data()), buffer.size()));
}

auto CredentialCipher::Decrypt(std::string_view encoded) const -> std::optional<std::string> {
  auto raw = Base64Decode(encoded);
  if (!raw || raw->size() < kIvSize + kTagSize) return std::nullopt;

  auto*       bytes    = reinterpret_cast<unsigned char*>(raw->data());
  const auto* iv       = bytes;
  auto*       tag      = bytes + kIvSize;
  const auto* data     = bytes + kIvSize + kTagSize;
  size_t      data_len = raw->size() - kIvSize - kTagSize;

  std::string  plain(data_len, '\0');
  CipherCtxPtr ctx{EVP_CIPHER_CTX_new()};
  int          len = 0;
  if (!ctx || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kIvSize), nullptr) !=
          1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), iv) != 1 ||
      EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()), &len, data,
                        static_cast<int>(data_len)) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag) != 1) {
    return std::nullopt;
  }
  int final_len = 0;
  // Tag mismatch shows up here
  if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plain.data()) + len,
                          &final_len) != 1) {
    return std::nullopt;
  }
  plain.resize(static_cast<size_t>(len + final_len));
  return plain;
}
};  // namespace imxup

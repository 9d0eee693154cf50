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

#include "auth/token_cache.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <json.hpp>
#include <stdexcept>
#include <utility>

namespace imxup {
using json = nlohmann::json;

namespace {
auto IsTimestamp(const json& entry, const char* key) -> bool {
  if (!entry.contains(key) || entry[key].is_null()) return true;
  return entry[key].is_number_integer();
}

// A hand-edited or truncated file may hold anything under a host key
auto WellFormed(const json& entry) -> bool {
  if (!entry.is_object()) return false;
  if (!entry.contains("value") || !entry["value"].is_string()) return false;
  return IsTimestamp(entry, "issued") && IsTimestamp(entry, "expires");
}
}  // namespace

TokenCache::TokenCache(file_path_t path, CredentialCipher cipher, SystemClockFn clock)
    : path_(std::move(path)), cipher_(std::move(cipher)), clock_(std::move(clock)) {}

TokenCache::~TokenCache() {
  if (Initialized()) {
    try {
      Teardown();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[auth] token cache not saved on shutdown: " << e.what();
    }
  }
}

void TokenCache::Init() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) {
    throw std::logic_error("TokenCache initialized twice");
  }
  tokens_.clear();
  if (std::filesystem::exists(path_)) {
    std::ifstream in(path_);
    json          doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
      LOG(WARNING) << "[auth] token cache " << path_ << " is unreadable, starting empty";
    } else {
      for (auto& [host, entry] : doc.items()) {
        if (!WellFormed(entry)) {
          LOG(WARNING) << "[auth] dropping malformed token entry for " << host;
          continue;
        }
        auto value = cipher_.Decrypt(entry.value("value", ""));
        if (!value) {
          LOG(WARNING) << "[auth] dropping undecryptable token for " << host;
          continue;
        }
        Token token{host, std::move(*value), FromUnix(entry.contains("issued") && !entry["issued"].is_null()
                                           ? entry["issued"].get<int64_t>()
                                           : int64_t{0}),
                    std::nullopt};
        if (entry.contains("expires") && !entry["expires"].is_null()) {
          token.expires_ = FromUnix(entry["expires"].get<int64_t>());
        }
        tokens_.emplace(host, std::move(token));
      }
    }
  }
  initialized_ = true;
  VLOG(1) << "[auth] token cache loaded " << tokens_.size() << " tokens";
}

void TokenCache::Teardown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) return;
  Persist();
  tokens_.clear();
  initialized_ = false;
}

auto TokenCache::Initialized() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

void TokenCache::CheckInitialized() const {
  if (!initialized_) {
    throw std::logic_error("TokenCache used before Init()");
  }
}

auto TokenCache::IsExpired(const Token& token) const -> bool {
  return token.expires_ && clock_() >= *token.expires_;
}

auto TokenCache::Get(const host_id_t& host) -> std::optional<Token> {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckInitialized();
  auto it = tokens_.find(host);
  if (it == tokens_.end()) return std::nullopt;
  if (IsExpired(it->second)) {
    VLOG(1) << "[auth] token for " << host << " expired";
    tokens_.erase(it);
    Persist();
    return std::nullopt;
  }
  return it->second;
}

void TokenCache::Put(const host_id_t& host, const std::string& value,
                     std::optional<std::chrono::seconds> ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckInitialized();
  auto  now = clock_();
  Token token{host, value, now, std::nullopt};
  if (ttl) token.expires_ = now + *ttl;
  tokens_[host] = std::move(token);
  Persist();
}

void TokenCache::Invalidate(const host_id_t& host) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckInitialized();
  if (tokens_.erase(host) > 0) {
    VLOG(1) << "[auth] token for " << host << " invalidated";
    Persist();
  }
}

auto TokenCache::GetInfo(const host_id_t& host) -> std::optional<TokenInfo> {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckInitialized();
  auto it = tokens_.find(host);
  if (it == tokens_.end()) return std::nullopt;
  TokenInfo info;
  info.issued_  = it->second.issued_;
  info.expires_ = it->second.expires_;
  info.valid_   = !IsExpired(it->second);
  if (it->second.expires_) {
    auto left       = std::chrono::duration_cast<std::chrono::seconds>(*it->second.expires_ - clock_());
    info.remaining_ = std::max(left, std::chrono::seconds{0});
  }
  return info;
}

void TokenCache::ClearAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckInitialized();
  tokens_.clear();
  Persist();
}

auto TokenCache::NeedsRefresh(const host_id_t& host, std::chrono::seconds margin) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckInitialized();
  auto it = tokens_.find(host);
  if (it == tokens_.end()) return true;
  if (!it->second.expires_) return false;
  return clock_() + margin >= *it->second.expires_;
}

void TokenCache::Persist() {
  json doc = json::object();
  for (const auto& [host, token] : tokens_) {
    json entry{{"value", cipher_.Encrypt(token.value_)}, {"issued", ToUnix(token.issued_)}};
    entry["expires"] = token.expires_ ? json(ToUnix(*token.expires_)) : json(nullptr);
    doc[host]        = std::move(entry);
  }
  if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());
  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Cannot write token cache " + tmp.string());
    }
    out << doc.dump(4);
  }
  std::filesystem::rename(tmp, path_);
}
};  // namespace imxup

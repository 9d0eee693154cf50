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

#include "app/app_config.hpp"

#include <glog/logging.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace imxup {
using json = nlohmann::json;

namespace {
auto ResolvePath(const json& doc, const char* key, const file_path_t& data_dir,
                 const file_path_t& fallback) -> file_path_t {
  auto value = doc.value(key, std::string{});
  if (value.empty()) return fallback;
  file_path_t path{value};
  return path.is_absolute() ? path : data_dir / path;
}

auto Reveal(const json& doc, const char* key, const CredentialCipher& cipher) -> std::string {
  auto stored = doc.value(key, std::string{});
  if (stored.empty()) return {};
  auto plain = cipher.Decrypt(stored);
  if (!plain) {
    LOG(WARNING) << "[config] '" << key << "' cannot be decrypted on this machine, ignored";
    return {};
  }
  return *plain;
}

auto Seal(const std::string& value, const CredentialCipher& cipher) -> std::string {
  return value.empty() ? std::string{} : cipher.Encrypt(value);
}
}  // namespace

auto AppConfig::Defaults(const file_path_t& data_dir) -> AppConfig {
  AppConfig config;
  config.data_dir_         = data_dir;
  config.database_path_    = data_dir / "imxup.db";
  config.token_cache_path_ = data_dir / "tokens.json";
  config.artifact_dir_     = data_dir / "galleries";
  config.temp_dir_         = data_dir / "tmp";
  config.hosts_dir_        = data_dir / "hosts";
  return config;
}

auto DefaultDataDir() -> file_path_t {
  if (const char* home = std::getenv("IMXUP_HOME"); home != nullptr && *home != '\0') {
    return file_path_t{home};
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return file_path_t{home} / ".imxup";
  }
  return std::filesystem::current_path() / ".imxup";
}

auto ParseAppConfig(const json& doc, const file_path_t& data_dir, const CredentialCipher& cipher)
    -> AppConfig {
  auto config = AppConfig::Defaults(data_dir);
  if (!doc.is_object()) throw std::runtime_error("Config root must be a JSON object");

  auto paths               = doc.value("paths", json::object());
  config.database_path_    = ResolvePath(paths, "database", data_dir, config.database_path_);
  config.token_cache_path_ = ResolvePath(paths, "token_cache", data_dir, config.token_cache_path_);
  config.artifact_dir_     = ResolvePath(paths, "artifacts", data_dir, config.artifact_dir_);
  config.temp_dir_         = ResolvePath(paths, "temp", data_dir, config.temp_dir_);
  config.hosts_dir_        = ResolvePath(paths, "hosts", data_dir, config.hosts_dir_);
  config.cookie_file_      = ResolvePath(paths, "cookie_file", data_dir, {});
  config.tab_name_         = doc.value("tab_name", config.tab_name_);
  config.template_name_    = doc.value("template", config.template_name_);

  if (doc.contains("primary")) {
    const auto& primary = doc.at("primary");
    config.primary_     = primary.get<PrimaryHostSettings>();
    config.primary_.api_key_  = Reveal(primary, "api_key", cipher);
    config.primary_.username_ = Reveal(primary, "username", cipher);
    config.primary_.password_ = Reveal(primary, "password", cipher);
  }
  if (doc.contains("storage_retry")) {
    config.storage_retry_ = doc.at("storage_retry").get<BackoffPolicy>();
  }
  if (doc.contains("network_retry")) {
    config.network_retry_ = doc.at("network_retry").get<BackoffPolicy>();
  }
  config.token_refresh_margin_ =
      std::chrono::seconds(doc.value("token_refresh_margin", config.token_refresh_margin_.count()));
  if (doc.contains("hooks")) config.hooks_ = ParseHooksConfig(doc.at("hooks"));
  if (doc.contains("proxy")) config.proxy_ = ParseProxySettings(doc.at("proxy"));

  for (const auto& [host, entry] : doc.value("file_hosts", json::object()).items()) {
    auto settings         = ParseHostSettings(entry);
    settings.credentials_ = Reveal(entry, "credentials", cipher);
    config.hosts_[host]   = std::move(settings);
  }
  return config;
}

auto ToJson(const AppConfig& config, const CredentialCipher& cipher) -> json {
  json primary        = config.primary_;
  primary["api_key"]  = Seal(config.primary_.api_key_, cipher);
  primary["username"] = Seal(config.primary_.username_, cipher);
  primary["password"] = Seal(config.primary_.password_, cipher);

  json hosts          = json::object();
  for (const auto& [host, settings] : config.hosts_) {
    auto entry           = ToJson(settings);
    entry["credentials"] = Seal(settings.credentials_, cipher);
    hosts[host]          = std::move(entry);
  }

  return json{{"paths",
               {{"database", config.database_path_.string()},
                {"token_cache", config.token_cache_path_.string()},
                {"artifacts", config.artifact_dir_.string()},
                {"temp", config.temp_dir_.string()},
                {"hosts", config.hosts_dir_.string()},
                {"cookie_file", config.cookie_file_.string()}}},
              {"tab_name", config.tab_name_},
              {"template", config.template_name_},
              {"primary", std::move(primary)},
              {"storage_retry", config.storage_retry_},
              {"network_retry", config.network_retry_},
              {"token_refresh_margin", config.token_refresh_margin_.count()},
              {"hooks", ToJson(config.hooks_)},
              {"proxy", ToJson(config.proxy_)},
              {"file_hosts", std::move(hosts)}};
}

auto LoadAppConfig(const file_path_t& file, const CredentialCipher& cipher) -> AppConfig {
  auto data_dir = file.parent_path();
  if (!std::filesystem::exists(file)) {
    LOG(INFO) << "[config] " << file.string() << " not found, using defaults";
    return AppConfig::Defaults(data_dir);
  }
  std::ifstream in(file);
  if (!in.is_open()) throw std::runtime_error("Failed to open config file " + file.string());
  auto doc = json::parse(in, nullptr, false);
  if (doc.is_discarded()) throw std::runtime_error("Config file is not valid JSON: " + file.string());
  try {
    return ParseAppConfig(doc, data_dir, cipher);
  } catch (const json::exception& e) {
    throw std::runtime_error("Invalid config file " + file.string() + ": " + e.what());
  }
}

void SaveAppConfig(const AppConfig& config, const file_path_t& file,
                   const CredentialCipher& cipher) {
  if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path());
  auto tmp = file;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("Failed to open config file for writing");
    out << ToJson(config, cipher).dump(4);
    if (!out) throw std::runtime_error("Failed to write config file " + tmp.string());
  }
  std::filesystem::rename(tmp, file);
}
};  // namespace imxup

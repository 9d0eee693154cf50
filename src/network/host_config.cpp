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

#include "network/host_config.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>

#include "utils/string/convert.hpp"

namespace imxup {
using json = nlohmann::json;

namespace {
auto Section(const json& doc, const char* name) -> const json& {
  static const json kEmpty = json::object();
  auto              it     = doc.find(name);
  if (it == doc.end() || !it->is_object()) return kEmpty;
  return *it;
}

auto Text(const json& section, const char* key, std::string fallback = {}) -> std::string {
  auto it = section.find(key);
  if (it == section.end() || it->is_null()) return fallback;
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

auto Fields(const json& section, const char* key) -> FieldList {
  FieldList fields;
  auto      it = section.find(key);
  if (it == section.end() || !it->is_object()) return fields;
  for (const auto& [name, value] : it->items()) {
    fields.emplace_back(name, value.is_string() ? value.get<std::string>() : value.dump());
  }
  return fields;
}

auto Strings(const json& section, const char* key) -> std::vector<std::string> {
  std::vector<std::string> out;
  auto                     it = section.find(key);
  if (it == section.end() || !it->is_array()) return out;
  for (const auto& value : *it) {
    if (value.is_string()) out.push_back(value.get<std::string>());
  }
  return out;
}

auto Seconds(const json& section, const char* key) -> std::optional<std::chrono::seconds> {
  auto it = section.find(key);
  if (it == section.end() || !it->is_number()) return std::nullopt;
  return std::chrono::seconds(it->get<int64_t>());
}

auto Path(const json& section, const char* key) -> JsonPath {
  auto it = section.find(key);
  if (it == section.end()) return {};
  return JsonPath::FromJson(*it);
}

auto Method(const json& section, const char* key, HttpMethod fallback) -> HttpMethod {
  auto name = Text(section, key);
  if (name.empty()) return fallback;
  auto method = HttpMethodFromString(name);
  if (!method) throw std::runtime_error(std::format("unknown HTTP method \"{}\"", name));
  return *method;
}

auto ParseAuthType(const std::string& name) -> AuthType {
  if (name.empty() || name == "none") return AuthType::NONE;
  if (name == "api_key") return AuthType::API_KEY;
  if (name == "token_login") return AuthType::TOKEN_LOGIN;
  if (name == "session") return AuthType::SESSION;
  throw std::runtime_error(std::format("unknown auth_type \"{}\"", name));
}

auto ParseResponseType(const std::string& name) -> ResponseType {
  if (name.empty() || name == "json") return ResponseType::JSON;
  if (name == "text") return ResponseType::TEXT;
  if (name == "regex") return ResponseType::REGEX;
  if (name == "redirect") return ResponseType::REDIRECT;
  throw std::runtime_error(std::format("unknown response type \"{}\"", name));
}
}  // namespace

auto ToString(AuthType type) -> std::string_view {
  switch (type) {
    case AuthType::NONE:
      return "none";
    case AuthType::API_KEY:
      return "api_key";
    case AuthType::TOKEN_LOGIN:
      return "token_login";
    case AuthType::SESSION:
      return "session";
  }
  return "none";
}

auto ParseHostConfig(const host_id_t& id, const json& doc) -> HostConfig {
  if (!doc.is_object()) {
    throw std::runtime_error(std::format("host {}: description is not a JSON object", id));
  }
  const auto& upload    = Section(doc, "upload");
  const auto& response  = Section(doc, "response");
  const auto& auth      = Section(doc, "auth");
  const auto& multistep = Section(doc, "multistep");
  const auto& del       = Section(doc, "delete");
  const auto& user_info = Section(doc, "user_info");

  HostConfig  config;
  config.id_                     = id;
  config.name_                   = Text(doc, "name", id);
  config.requires_auth_          = doc.value("requires_auth", false);
  config.auth_type_              = ParseAuthType(Text(doc, "auth_type"));

  config.upload_endpoint_        = Text(upload, "endpoint");
  config.method_                 = Method(upload, "method", HttpMethod::POST);
  config.file_field_             = Text(upload, "file_field", "file");
  config.extra_fields_           = Fields(upload, "extra_fields");
  config.get_server_             = Text(upload, "get_server");
  config.server_response_path_   = Path(upload, "server_response_path");
  config.server_session_id_path_ = Path(upload, "server_session_id_path");
  config.auth_header_            = Text(upload, "auth_header");
  config.inactivity_timeout_ =
      Seconds(upload, "inactivity_timeout").value_or(std::chrono::seconds{300});
  config.upload_timeout_        = Seconds(upload, "upload_timeout");

  config.response_type_         = ParseResponseType(Text(response, "type"));
  config.link_path_             = Path(response, "link_path");
  config.link_prefix_           = Text(response, "link_prefix");
  config.link_suffix_           = Text(response, "link_suffix");
  config.link_regex_            = Text(response, "link_regex");
  config.file_id_path_          = Path(response, "file_id_path");

  config.login_url_             = Text(auth, "login_url");
  config.login_fields_          = Fields(auth, "login_fields");
  config.token_path_            = Path(auth, "token_path");
  config.session_id_regex_      = Text(auth, "session_id_regex");
  config.session_cookie_name_   = Text(auth, "session_cookie_name");
  config.upload_page_url_       = Text(auth, "upload_page_url");
  config.token_ttl_             = Seconds(auth, "token_ttl");
  config.session_token_ttl_     = Seconds(auth, "session_token_ttl");
  config.stale_token_patterns_  = Strings(auth, "stale_token_patterns");
  config.check_body_on_success_ = auth.value("check_body_on_success", false);

  config.init_url_              = Text(multistep, "init_url");
  config.init_method_           = Method(multistep, "init_method", HttpMethod::GET);
  config.init_body_json_        = multistep.value("init_body_json", false);
  config.upload_url_path_       = Path(multistep, "upload_url_path");
  config.upload_id_path_        = Path(multistep, "upload_id_path");
  config.file_field_path_       = Path(multistep, "file_field_path");
  config.form_data_path_        = Path(multistep, "form_data_path");
  config.poll_url_              = Text(multistep, "poll_url");
  config.poll_delay_            = std::chrono::milliseconds(
      static_cast<int64_t>(multistep.value("poll_delay", 1.0) * 1000.0));
  config.poll_retries_       = multistep.value("poll_retries", 10u);
  config.require_hash_       = multistep.value("require_hash", false);

  config.delete_url_         = Text(del, "url");
  config.delete_method_      = Method(del, "method", HttpMethod::GET);
  config.delete_body_json_   = del.value("body_json", false);
  config.delete_params_      = Strings(del, "params");

  config.user_info_url_      = Text(user_info, "url");
  config.user_info_method_   = Method(user_info, "method", HttpMethod::GET);
  config.user_info_body_json_ = user_info.value("body_json", false);
  config.storage_total_path_ = Path(user_info, "storage_total_path");
  config.storage_left_path_  = Path(user_info, "storage_left_path");
  config.storage_used_path_  = Path(user_info, "storage_used_path");
  config.storage_regex_      = Text(user_info, "storage_regex");

  if (config.upload_endpoint_.empty() && config.init_url_.empty()) {
    throw std::runtime_error(std::format("host {}: neither upload.endpoint nor multistep.init_url",
                                         id));
  }
  if (config.auth_type_ == AuthType::TOKEN_LOGIN && config.token_path_.Empty()) {
    throw std::runtime_error(std::format("host {}: token_login needs auth.token_path", id));
  }
  return config;
}

auto LoadHostConfig(const file_path_t& file) -> HostConfig {
  std::ifstream in(file);
  if (!in) {
    throw std::runtime_error(std::format("cannot open host description {}", file.string()));
  }
  json doc = json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    throw std::runtime_error(std::format("{} is not valid JSON", file.string()));
  }
  return ParseHostConfig(file.stem().string(), doc);
}

auto LoadHostConfigs(const file_path_t& dir) -> std::vector<HostConfig> {
  std::vector<HostConfig> hosts;
  std::error_code         ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    LOG(WARNING) << "[filehost] host directory " << dir << " does not exist";
    return hosts;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file() || conv::ToLowerAscii(entry.path().extension().string()) != ".json") {
      continue;
    }
    try {
      hosts.push_back(LoadHostConfig(entry.path()));
    } catch (const std::exception& e) {
      LOG(ERROR) << "[filehost] skipping " << entry.path() << ": " << e.what();
    }
  }
  std::sort(hosts.begin(), hosts.end(),
            [](const HostConfig& a, const HostConfig& b) { return a.id_ < b.id_; });
  return hosts;
}
};  // namespace imxup

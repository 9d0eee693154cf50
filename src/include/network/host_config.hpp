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

#include <chrono>
#include <cstdint>
#include <json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "network/http_transport.hpp"
#include "network/json_path.hpp"
#include "type/type.hpp"

namespace imxup {
enum class AuthType : uint8_t {
  NONE = 0,
  API_KEY,
  TOKEN_LOGIN,
  SESSION,
};

enum class ResponseType : uint8_t {
  JSON = 0,
  TEXT,
  REGEX,
  REDIRECT,
};

/**
 * @brief Protocol description of one secondary file host, loaded from `<hosts dir>/<id>.json`.
 *
 * The JSON groups the keys in sections: "upload", "response", "auth", "multistep", "delete" and
 * "user_info". URL templates accept {token}, {filename}, {size}, {hash}, {upload_id},
 * {file_id} and {server} where the step makes them available.
 */
struct HostConfig {
  host_id_t                           id_;
  std::string                         name_;
  bool                                requires_auth_ = false;
  AuthType                            auth_type_     = AuthType::NONE;

  // upload
  std::string                         upload_endpoint_;
  HttpMethod                          method_     = HttpMethod::POST;
  std::string                         file_field_ = "file";
  FieldList                           extra_fields_;
  std::string                         get_server_;
  JsonPath                            server_response_path_;
  JsonPath                            server_session_id_path_;
  // Header added to authenticated requests, e.g. "Authorization: Bearer {token}"
  std::string                         auth_header_;
  std::chrono::seconds                inactivity_timeout_{300};
  std::optional<std::chrono::seconds> upload_timeout_;

  // response
  ResponseType                        response_type_ = ResponseType::JSON;
  JsonPath                            link_path_;
  std::string                         link_prefix_;
  std::string                         link_suffix_;
  std::string                         link_regex_;
  JsonPath                            file_id_path_;

  // auth
  std::string                         login_url_;
  FieldList                           login_fields_;
  JsonPath                            token_path_;
  std::string                         session_id_regex_;
  std::string                         session_cookie_name_;
  std::string                         upload_page_url_;
  std::optional<std::chrono::seconds> token_ttl_;
  std::optional<std::chrono::seconds> session_token_ttl_;
  std::vector<std::string>            stale_token_patterns_;
  bool                                check_body_on_success_ = false;

  // multistep
  std::string                         init_url_;
  HttpMethod                          init_method_    = HttpMethod::GET;
  bool                                init_body_json_ = false;
  JsonPath                            upload_url_path_;
  JsonPath                            upload_id_path_;
  JsonPath                            file_field_path_;
  JsonPath                            form_data_path_;
  std::string                         poll_url_;
  std::chrono::milliseconds           poll_delay_{1000};
  uint32_t                            poll_retries_ = 10;
  bool                                require_hash_ = false;

  // delete
  std::string                         delete_url_;
  HttpMethod                          delete_method_    = HttpMethod::GET;
  bool                                delete_body_json_ = false;
  std::vector<std::string>            delete_params_;

  // user info / storage
  std::string                         user_info_url_;
  HttpMethod                          user_info_method_    = HttpMethod::GET;
  bool                                user_info_body_json_ = false;
  JsonPath                            storage_total_path_;
  JsonPath                            storage_left_path_;
  JsonPath                            storage_used_path_;
  // Two capture groups, used and total, in GiB
  std::string                         storage_regex_;

  auto                                IsMultistep() const -> bool { return !init_url_.empty(); }
};

auto ToString(AuthType type) -> std::string_view;

/**
 * @brief Parse a host description. Throws std::runtime_error on unknown enum values.
 */
auto ParseHostConfig(const host_id_t& id, const nlohmann::json& doc) -> HostConfig;
auto LoadHostConfig(const file_path_t& file) -> HostConfig;
/**
 * @brief Every `*.json` in `dir`, keyed by file stem. Files that fail to parse are logged and
 *        skipped.
 */
auto LoadHostConfigs(const file_path_t& dir) -> std::vector<HostConfig>;
};  // namespace imxup

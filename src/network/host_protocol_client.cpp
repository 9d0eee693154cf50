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

#include "network/host_protocol_client.hpp"

#include <easy/profiler.h>
#include <glog/logging.h>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <format>
#include <json.hpp>
#include <regex>
#include <tuple>

#include "utils/hash/md5.hpp"
#include "utils/string/convert.hpp"

namespace imxup {
using json = nlohmann::json;

namespace {
constexpr int64_t     kGiB = int64_t{1024} * 1024 * 1024;

constexpr const char* kQuotaPhrases[] = {"quota",          "storage limit", "not enough space",
                                         "insufficient storage", "storage is full",
                                         "traffic limit"};

auto Substitute(std::string text,
                std::initializer_list<std::pair<std::string_view, std::string_view>> values)
    -> std::string {
  for (const auto& [key, value] : values) {
    text = conv::ReplaceAll(std::move(text), std::format("{{{}}}", key), value);
  }
  return text;
}

auto ParseJson(const std::string& body) -> json { return json::parse(body, nullptr, false); }

auto ContainsQuotaPhrase(std::string_view text) -> bool {
  return std::any_of(std::begin(kQuotaPhrases), std::end(kQuotaPhrases),
                     [&](const char* phrase) { return conv::ContainsNoCase(text, phrase); });
}

/**
 * @brief Hosts report API level failures with a "status" member next to a 200 answer
 */
auto ApiStatusOk(const json& doc) -> bool {
  if (!doc.is_object()) return true;
  auto it = doc.find("status");
  if (it == doc.end() || it->is_null()) return true;
  if (it->is_number_integer()) return it->get<int64_t>() == 200;
  if (it->is_boolean()) return it->get<bool>();
  if (it->is_string()) {
    auto status = conv::ToLowerAscii(it->get<std::string>());
    return status == "success" || status == "ok" || status == "200" || status == "true";
  }
  return true;
}

auto ApiMessage(const json& doc) -> std::string {
  for (const char* path : {"response.details", "response.msg", "error", "message"}) {
    if (auto message = JsonPath::Parse(path).FindString(doc)) return *message;
  }
  return doc.is_discarded() ? std::string{} : doc.dump().substr(0, 200);
}

auto OriginOf(const std::string& url) -> std::string {
  auto scheme = url.find("://");
  if (scheme == std::string::npos) return {};
  auto path = url.find('/', scheme + 3);
  return conv::ToLowerAscii(url.substr(0, path));
}

auto ParseDouble(const std::string& text) -> std::optional<double> {
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc()) return std::nullopt;
  return value;
}

void JsonBody(HttpRequest& request, const json& body) {
  request.method_ = HttpMethod::POST;
  request.body_   = body.dump();
  request.headers_.emplace_back("Content-Type", "application/json");
}

template <typename Outcome>
auto FailureOf(const HostError& e) -> Outcome {
  Outcome outcome;
  outcome.success_     = false;
  outcome.failure_     = e.Kind();
  outcome.message_     = e.what();
  outcome.http_status_ = e.Status();
  return outcome;
}

auto RequireTransport(const std::unique_ptr<HttpTransport>& transport) -> HttpTransport& {
  if (!transport) throw std::invalid_argument("HostProtocolClient needs a transport");
  return *transport;
}
}  // namespace

HostProtocolClient::HostProtocolClient(HostConfig config, std::string credentials,
                                       TokenCache& tokens, HttpTransport& transport,
                                       BackoffPolicy network_retry,
                                       std::chrono::seconds refresh_margin, SleepFn sleep)
    : config_(std::move(config)),
      credentials_(std::move(credentials)),
      tokens_(tokens),
      transport_(transport),
      network_retry_(network_retry),
      refresh_margin_(refresh_margin),
      sleep_(std::move(sleep)) {}

HostProtocolClient::HostProtocolClient(HostConfig config, std::string credentials,
                                       TokenCache& tokens, std::unique_ptr<HttpTransport> transport,
                                       BackoffPolicy network_retry,
                                       std::chrono::seconds refresh_margin, SleepFn sleep)
    : config_(std::move(config)),
      credentials_(std::move(credentials)),
      tokens_(tokens),
      owned_transport_(std::move(transport)),
      transport_(RequireTransport(owned_transport_)),
      network_retry_(network_retry),
      refresh_margin_(refresh_margin),
      sleep_(std::move(sleep)) {}

auto HostProtocolClient::CleanFileName(const std::string& name) -> std::string {
  static const std::regex kArchivePrefix(R"(^imxup_\d+_)");
  return std::regex_replace(name, kArchivePrefix, "");
}

template <typename F>
auto HostProtocolClient::WithAuthRetry(F&& op) -> decltype(op()) {
  try {
    return op();
  } catch (const HostError& e) {
    if (e.Kind() != FailureKind::AUTH || !CanReauthenticate()) throw;
    LOG(INFO) << "[filehost:" << config_.id_ << "] credentials rejected (" << e.what()
              << "), re-authenticating";
    Reauthenticate();
  }
  return op();
}

auto HostProtocolClient::Upload(const file_path_t& file, const TransferControl& control)
    -> UploadOutcome {
  EASY_BLOCK("HostProtocolClient::Upload");
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    UploadOutcome outcome;
    outcome.failure_ = FailureKind::VALIDATION;
    outcome.message_ = std::format("{} is not a readable file", file.string());
    return outcome;
  }

  LOG(INFO) << "[filehost:" << config_.id_ << "] uploading " << file.filename().string();
  for (uint32_t attempt = 1;; ++attempt) {
    if (control.should_stop_ && control.should_stop_()) {
      return FailureOf<UploadOutcome>(HostError(FailureKind::CANCELLED, "upload cancelled"));
    }
    try {
      auto outcome = WithAuthRetry([&] {
        return config_.IsMultistep() ? UploadMultistep(file, control)
                                     : UploadStandard(file, control);
      });
      LOG(INFO) << "[filehost:" << config_.id_ << "] " << file.filename().string() << " -> "
                << outcome.url_;
      return outcome;
    } catch (const HostError& e) {
      bool retry = e.Kind() == FailureKind::NETWORK && e.Transient() &&
                   attempt < network_retry_.max_attempts_;
      if (!retry) {
        LOG(WARNING) << "[filehost:" << config_.id_ << "] upload of "
                     << file.filename().string() << " failed (" << ToString(e.Kind())
                     << "): " << e.what();
        return FailureOf<UploadOutcome>(e);
      }
      auto delay = network_retry_.DelayAfter(attempt);
      LOG(WARNING) << "[filehost:" << config_.id_ << "] attempt " << attempt
                   << " failed: " << e.what() << ", retrying in " << delay.count() << " ms";
      try {
        Sleep(delay, control);
      } catch (const HostError& stop) {
        return FailureOf<UploadOutcome>(stop);
      }
    }
  }
}

auto HostProtocolClient::TestCredentials() -> CallOutcome {
  CallOutcome outcome;
  if (config_.auth_type_ == AuthType::NONE) {
    outcome.success_ = true;
    outcome.message_ = "no authentication required";
    return outcome;
  }
  try {
    EnsureAuthenticated();
    if (!config_.user_info_url_.empty()) {
      WithAuthRetry([&] { return FetchQuota(); });
      outcome.message_ = "credentials valid";
    } else {
      outcome.message_ = "authenticated, host offers no validation endpoint";
    }
    outcome.success_ = true;
  } catch (const HostError& e) {
    LOG(WARNING) << "[filehost:" << config_.id_ << "] credential check failed: " << e.what();
    return FailureOf<CallOutcome>(e);
  }
  return outcome;
}

auto HostProtocolClient::GetStorageQuota() -> std::optional<StorageQuota> {
  if (config_.user_info_url_.empty()) {
    std::lock_guard<std::mutex> lock(auth_mutex_);
    return login_quota_;
  }
  try {
    return WithAuthRetry([&] { return FetchQuota(); });
  } catch (const HostError& e) {
    LOG(WARNING) << "[filehost:" << config_.id_ << "] storage lookup failed: " << e.what();
    return std::nullopt;
  }
}

auto HostProtocolClient::DeleteFile(const std::string& file_id) -> CallOutcome {
  CallOutcome outcome;
  if (config_.delete_url_.empty()) {
    outcome.failure_ = FailureKind::REJECTED;
    outcome.message_ = std::format("{} does not support deletion", config_.name_);
    return outcome;
  }
  try {
    outcome.http_status_ = WithAuthRetry([&] {
      auto        token = EnsureAuthenticated();
      HttpRequest request;
      request.follow_redirects_ = false;
      request.headers_          = AuthHeaders(token);
      request.url_              = config_.delete_url_;
      if (config_.delete_body_json_) {
        JsonBody(request, json{{"ids", json::array({file_id})}, {"access_token", token}});
      } else if (config_.delete_method_ == HttpMethod::POST && !config_.delete_params_.empty()) {
        FieldList form;
        for (const auto& param : config_.delete_params_) {
          if (param == "del_code" || param == "file_id") {
            form.emplace_back(param, file_id);
          } else if (param == "sess_id") {
            form.emplace_back(param, token);
          } else {
            LOG(WARNING) << "[filehost:" << config_.id_ << "] unknown delete parameter " << param;
          }
        }
        request.method_ = HttpMethod::POST;
        request.body_   = EncodeForm(form);
        request.headers_.emplace_back("Content-Type", "application/x-www-form-urlencoded");
      } else {
        request.method_ = config_.delete_method_;
        request.url_    = Substitute(config_.delete_url_, {{"file_id", file_id}, {"token", token}});
      }

      auto response = transport_.Send(request);
      Check(response, "delete", {200, 204, 301, 302});
      if (response.status_ == 301 || response.status_ == 302) {
        auto location = response.Header("location");
        if (location && location->starts_with("http") &&
            OriginOf(*location) != OriginOf(request.url_)) {
          throw HostError(FailureKind::REJECTED,
                          std::format("delete redirected to another origin: {}", *location),
                          response.status_);
        }
      }
      return response.status_;
    });
  } catch (const HostError& e) {
    LOG(WARNING) << "[filehost:" << config_.id_ << "] delete of " << file_id
                 << " failed: " << e.what();
    return FailureOf<CallOutcome>(e);
  }
  LOG(INFO) << "[filehost:" << config_.id_ << "] deleted " << file_id;
  outcome.success_ = true;
  outcome.message_ = "deleted";
  return outcome;
}

auto HostProtocolClient::CanReauthenticate() const -> bool {
  return config_.auth_type_ == AuthType::TOKEN_LOGIN || config_.auth_type_ == AuthType::SESSION;
}

auto HostProtocolClient::EnsureAuthenticated() -> std::string {
  std::lock_guard<std::mutex> lock(auth_mutex_);
  switch (config_.auth_type_) {
    case AuthType::NONE:
      return {};
    case AuthType::API_KEY:
      if (credentials_.empty()) {
        throw HostError(FailureKind::AUTH, std::format("no API key configured for {}", config_.name_));
      }
      return credentials_;
    case AuthType::TOKEN_LOGIN: {
      if (!tokens_.NeedsRefresh(config_.id_, refresh_margin_)) {
        if (auto token = tokens_.Get(config_.id_)) return token->value_;
      }
      VLOG(1) << "[filehost:" << config_.id_ << "] token missing or about to expire, logging in";
      auto token = LoginWithToken();
      tokens_.Put(config_.id_, token, config_.token_ttl_);
      return token;
    }
    case AuthType::SESSION: {
      if (!session_ready_) LoginSession();
      auto token = tokens_.Get(config_.id_);
      return token ? token->value_ : std::string{};
    }
  }
  return {};
}

void HostProtocolClient::Reauthenticate() {
  std::lock_guard<std::mutex> lock(auth_mutex_);
  tokens_.Invalidate(config_.id_);
  if (config_.auth_type_ == AuthType::TOKEN_LOGIN) {
    auto token = LoginWithToken();
    tokens_.Put(config_.id_, token, config_.token_ttl_);
  } else if (config_.auth_type_ == AuthType::SESSION) {
    transport_.ClearCookies();
    session_ready_ = false;
    LoginSession();
  }
}

auto HostProtocolClient::SplitCredentials() const -> std::pair<std::string, std::string> {
  auto colon = credentials_.find(':');
  if (colon == std::string::npos) {
    throw HostError(FailureKind::AUTH,
                    std::format("{} needs credentials as username:password", config_.name_));
  }
  return {credentials_.substr(0, colon), credentials_.substr(colon + 1)};
}

auto HostProtocolClient::LoginWithToken() -> std::string {
  auto [username, password] = SplitCredentials();
  FieldList fields;
  for (const auto& [name, value] : config_.login_fields_) {
    fields.emplace_back(name, Substitute(value, {{"username", username}, {"password", password}}));
  }

  HttpRequest request;
  request.url_ = config_.login_url_;
  if (!fields.empty()) {
    request.url_ += (request.url_.find('?') == std::string::npos ? "?" : "&") + EncodeForm(fields);
  }
  auto response = transport_.Send(request);
  if (!response.Received()) {
    throw HostError(FailureKind::NETWORK, std::format("login: {}", response.error_), 0, true);
  }
  if (response.status_ != 200) {
    bool server_side = response.status_ >= 500;
    throw HostError(server_side ? FailureKind::NETWORK : FailureKind::AUTH,
                    std::format("login failed with status {}", response.status_),
                    response.status_, server_side);
  }

  auto doc = ParseJson(response.body_);
  if (doc.is_discarded()) {
    throw HostError(FailureKind::AUTH, "login answer is not JSON", response.status_);
  }
  if (!ApiStatusOk(doc)) {
    throw HostError(FailureKind::AUTH, std::format("login failed: {}", ApiMessage(doc)),
                    response.status_);
  }
  auto token = config_.token_path_.FindString(doc);
  if (!token) {
    throw HostError(FailureKind::AUTH, "login answer carries no token", response.status_);
  }

  // Some hosts report the account's storage with the login
  StorageQuota quota{config_.storage_total_path_.FindInt(doc),
                     config_.storage_left_path_.FindInt(doc),
                     config_.storage_used_path_.FindInt(doc)};
  if (quota.total_ || quota.left_ || quota.used_) login_quota_ = quota;

  LOG(INFO) << "[filehost:" << config_.id_ << "] logged in";
  return *token;
}

void HostProtocolClient::LoginSession() {
  auto [username, password] = SplitCredentials();
  if (config_.login_url_.empty()) {
    throw HostError(FailureKind::AUTH, std::format("{} has no login_url", config_.name_));
  }

  HttpRequest page_request;
  page_request.url_ = config_.login_url_;
  auto page         = transport_.Send(page_request);
  if (!page.Received()) {
    throw HostError(FailureKind::NETWORK, std::format("login page: {}", page.error_), 0, true);
  }
  if (page.status_ != 200) {
    bool server_side = page.status_ >= 500;
    throw HostError(server_side ? FailureKind::NETWORK : FailureKind::AUTH,
                    std::format("login page answered {}", page.status_), page.status_,
                    server_side);
  }

  // Hidden inputs carry the form's anti-CSRF values
  static const std::regex kHiddenInput(R"(<input[^>]+type=["']hidden["'][^>]*>)",
                                       std::regex::icase);
  static const std::regex kName(R"(name=["']([^"']+)["'])", std::regex::icase);
  static const std::regex kValue(R"(value=["']([^"']*)["'])", std::regex::icase);
  FieldList               form;
  for (auto it = std::sregex_iterator(page.body_.begin(), page.body_.end(), kHiddenInput);
       it != std::sregex_iterator(); ++it) {
    auto        tag = it->str();
    std::smatch name;
    std::smatch value;
    if (!std::regex_search(tag, name, kName)) continue;
    form.emplace_back(name[1].str(),
                      std::regex_search(tag, value, kValue) ? value[1].str() : std::string{});
  }
  for (const auto& [field, templ] : config_.login_fields_) {
    auto filled = Substitute(templ, {{"username", username}, {"password", password}});
    auto it     = std::find_if(form.begin(), form.end(),
                               [&](const auto& entry) { return entry.first == field; });
    if (it != form.end()) {
      it->second = filled;
    } else {
      form.emplace_back(field, filled);
    }
  }

  HttpRequest login;
  login.method_ = HttpMethod::POST;
  login.url_    = config_.login_url_;
  login.body_   = EncodeForm(form);
  login.headers_ = {{"Content-Type", "application/x-www-form-urlencoded"},
                    {"Referer", config_.login_url_}};
  auto response = transport_.Send(login);
  if (!response.Received()) {
    throw HostError(FailureKind::NETWORK, std::format("login: {}", response.error_), 0, true);
  }
  if (response.status_ != 200 && response.status_ != 302) {
    bool server_side = response.status_ >= 500;
    throw HostError(server_side ? FailureKind::NETWORK : FailureKind::AUTH,
                    std::format("login failed with status {}", response.status_),
                    response.status_, server_side);
  }
  if (transport_.Cookies().empty()) {
    throw HostError(FailureKind::AUTH, "login returned no session cookies", response.status_);
  }
  session_ready_ = true;
  LOG(INFO) << "[filehost:" << config_.id_ << "] session established";
}

auto HostProtocolClient::SessionId(const std::string& upload_url) -> std::optional<std::string> {
  if (!config_.session_cookie_name_.empty()) {
    auto cookies = transport_.Cookies();
    auto it      = cookies.find(config_.session_cookie_name_);
    if (it != cookies.end()) return it->second;
    LOG(WARNING) << "[filehost:" << config_.id_ << "] cookie " << config_.session_cookie_name_
                 << " missing from the session";
    return std::nullopt;
  }
  if (config_.session_id_regex_.empty()) return std::nullopt;

  {
    std::lock_guard<std::mutex> lock(auth_mutex_);
    if (!tokens_.NeedsRefresh(config_.id_, refresh_margin_)) {
      if (auto token = tokens_.Get(config_.id_)) return token->value_;
    }
  }

  auto page_url = config_.upload_page_url_;
  if (page_url.empty()) {
    auto slash = upload_url.rfind('/');
    page_url   = (slash == std::string::npos ? upload_url : upload_url.substr(0, slash)) + "/upload";
  }
  HttpRequest request;
  request.url_  = page_url;
  auto response = transport_.Send(request);
  Check(response, "upload page", {200});

  std::smatch match;
  std::regex  pattern(config_.session_id_regex_);
  if (!std::regex_search(response.body_, match, pattern) || match.size() < 2) {
    throw HostError(FailureKind::AUTH, "no session id on the upload page", response.status_);
  }
  auto sess_id = match[1].str();
  {
    std::lock_guard<std::mutex> lock(auth_mutex_);
    tokens_.Put(config_.id_, sess_id, config_.session_token_ttl_);
  }
  VLOG(1) << "[filehost:" << config_.id_ << "] fresh session id from " << page_url;
  return sess_id;
}

auto HostProtocolClient::UploadStandard(const file_path_t& file, const TransferControl& control)
    -> UploadOutcome {
  auto token    = EnsureAuthenticated();
  auto filename = file.filename().string();

  auto url      = config_.upload_endpoint_;
  std::optional<std::string> server_sess_id;
  if (!config_.get_server_.empty()) {
    std::tie(url, server_sess_id) = ResolveUploadServer(token);
  }
  url = Substitute(url, {{"filename", conv::UrlEncode(filename)}, {"token", token}});

  std::optional<std::string> sess_id;
  if (config_.auth_type_ == AuthType::SESSION) sess_id = SessionId(url);

  HttpRequest request;
  request.method_             = config_.method_;
  request.url_                = url;
  request.headers_            = AuthHeaders(token);
  request.inactivity_timeout_ = config_.inactivity_timeout_;
  request.total_timeout_      = config_.upload_timeout_;
  if (config_.method_ == HttpMethod::PUT) {
    request.upload_file_ = file;
  } else {
    request.method_ = HttpMethod::POST;
    request.multipart_.push_back(
        MultipartPart{config_.file_field_, {}, file, CleanFileName(filename)});
    for (const auto& [name, value] : config_.extra_fields_) {
      request.multipart_.push_back(MultipartPart{name, Substitute(value, {{"token", token}})});
    }
    if (sess_id) {
      request.multipart_.push_back(MultipartPart{"sess_id", *sess_id});
    } else if (server_sess_id) {
      request.multipart_.push_back(MultipartPart{"sess_id", *server_sess_id});
    }
  }

  auto response = transport_.Send(request, control);
  Check(response, "upload", {200, 201});
  return ParseUploadResponse(response);
}

auto HostProtocolClient::ResolveUploadServer(const std::string& token)
    -> std::pair<std::string, std::optional<std::string>> {
  HttpRequest request;
  request.url_           = Substitute(config_.get_server_, {{"token", token}});
  request.headers_       = AuthHeaders(token);
  request.total_timeout_ = std::chrono::seconds{10};
  auto response          = transport_.Send(request);
  Check(response, "get server", {200});

  auto doc = ParseJson(response.body_);
  if (doc.is_discarded()) {
    throw HostError(FailureKind::REJECTED, "get server answer is not JSON", response.status_);
  }
  auto endpoint    = config_.upload_endpoint_;
  auto server_path = config_.server_response_path_.Empty() ? JsonPath::Parse("data.server")
                                                           : config_.server_response_path_;
  auto server      = server_path.FindString(doc);
  if (server) {
    endpoint = conv::ReplaceAll(std::move(endpoint), "{server}", *server);
  } else if (!config_.server_response_path_.Empty()) {
    throw HostError(FailureKind::REJECTED,
                    std::format("no server at {} in the get server answer", server_path.ToString()),
                    response.status_);
  }

  std::optional<std::string> sess_id;
  if (!config_.server_session_id_path_.Empty()) {
    sess_id = config_.server_session_id_path_.FindString(doc);
    if (!sess_id) {
      throw HostError(FailureKind::REJECTED, "get server answer carries no session id",
                      response.status_);
    }
  }
  return {endpoint, sess_id};
}

auto HostProtocolClient::ParseUploadResponse(const HttpResponse& response) -> UploadOutcome {
  UploadOutcome outcome;
  outcome.success_      = true;
  outcome.http_status_  = response.status_;
  outcome.raw_response_ = response.body_;

  switch (config_.response_type_) {
    case ResponseType::JSON: {
      auto doc = ParseJson(response.body_);
      if (doc.is_discarded()) {
        throw HostError(FailureKind::REJECTED, "upload answer is not JSON", response.status_);
      }
      if (doc.is_array() && !doc.empty()) doc = json(doc[0]);
      if (auto link = config_.link_path_.FindString(doc)) {
        outcome.url_ = config_.link_prefix_ + *link + config_.link_suffix_;
        if (!config_.link_regex_.empty()) {
          std::smatch match;
          std::regex  pattern(config_.link_regex_);
          if (std::regex_search(outcome.url_, match, pattern) && match.size() > 1) {
            outcome.url_ = config_.link_prefix_ + match[1].str() + config_.link_suffix_;
          }
        }
      }
      if (auto file_id = config_.file_id_path_.FindString(doc)) outcome.file_id_ = *file_id;
      break;
    }
    case ResponseType::TEXT:
    case ResponseType::REGEX:
      if (!config_.link_regex_.empty()) {
        std::smatch match;
        std::regex  pattern(config_.link_regex_);
        if (std::regex_search(response.body_, match, pattern)) {
          auto extracted   = match.size() > 1 ? match[1].str() : match[0].str();
          outcome.url_     = config_.link_prefix_ + extracted + config_.link_suffix_;
          outcome.file_id_ = extracted;
        }
      } else {
        outcome.url_ = conv::Trim(response.body_);
      }
      break;
    case ResponseType::REDIRECT:
      outcome.url_ = response.final_url_;
      break;
  }

  if (outcome.url_.empty()) {
    throw HostError(FailureKind::REJECTED,
                    std::format("no download link in the answer: {}", response.body_.substr(0, 200)),
                    response.status_);
  }
  return outcome;
}

auto HostProtocolClient::UploadMultistep(const file_path_t& file, const TransferControl& control)
    -> UploadOutcome {
  auto            token = EnsureAuthenticated();
  std::error_code ec;
  auto            size = std::filesystem::file_size(file, ec);
  if (ec) {
    throw HostError(FailureKind::VALIDATION, std::format("cannot stat {}", file.string()));
  }
  std::string hash;
  if (config_.require_hash_) {
    try {
      hash = Md5FileHex(file);
    } catch (const std::runtime_error& e) {
      throw HostError(FailureKind::VALIDATION, e.what());
    }
  }
  auto        clean_name = CleanFileName(file.filename().string());

  HttpRequest init;
  init.headers_ = AuthHeaders(token);
  if (config_.init_method_ == HttpMethod::POST && config_.init_body_json_) {
    init.url_ = Substitute(config_.init_url_, {{"token", token}});
    JsonBody(init, json{{"access_token", token}, {"parent_id", "/"}});
  } else {
    init.method_ = config_.init_method_;
    init.url_    = Substitute(config_.init_url_, {{"filename", conv::UrlEncode(clean_name)},
                                                  {"size", std::to_string(size)},
                                                  {"token", token},
                                                  {"hash", hash}});
  }
  auto init_response = transport_.Send(init);
  Check(init_response, "upload init", {200});

  auto doc = ParseJson(init_response.body_);
  if (doc.is_discarded()) doc = json::object();
  if (!ApiStatusOk(doc)) {
    auto message = ApiMessage(doc);
    auto kind    = ContainsQuotaPhrase(message) ? FailureKind::QUOTA
                   : MatchesStalePattern(message) ? FailureKind::AUTH
                                                  : FailureKind::REJECTED;
    throw HostError(kind, std::format("upload init refused: {}", message), init_response.status_);
  }

  auto upload_url = config_.upload_url_path_.FindString(doc);
  auto upload_id  = config_.upload_id_path_.FindString(doc).value_or("");
  auto state      = JsonPath::Parse("response.upload.state").FindInt(doc);

  // The host already stores identical content
  if (state == 2 || (!upload_url && state)) {
    if (auto existing = JsonPath::Parse("response.upload.file.url").FindString(doc)) {
      LOG(INFO) << "[filehost:" << config_.id_ << "] " << clean_name
                << " already on the host, reusing its link";
      UploadOutcome outcome;
      outcome.success_      = true;
      outcome.http_status_  = init_response.status_;
      outcome.url_          = *existing;
      outcome.upload_id_    = upload_id;
      outcome.file_id_      = config_.file_id_path_.FindString(doc).value_or(upload_id);
      outcome.raw_response_ = init_response.body_;
      outcome.deduplicated_ = true;
      return outcome;
    }
  }
  if (!upload_url) {
    throw HostError(FailureKind::REJECTED, "upload init answer carries no upload URL",
                    init_response.status_);
  }

  auto file_field = config_.file_field_;
  if (!config_.file_field_path_.Empty()) {
    file_field = config_.file_field_path_.FindString(doc).value_or(file_field);
  }
  HttpRequest data;
  data.method_             = HttpMethod::POST;
  data.url_                = *upload_url;
  data.inactivity_timeout_ = config_.inactivity_timeout_;
  data.total_timeout_      = config_.upload_timeout_;
  data.multipart_.push_back(MultipartPart{file_field, {}, file, clean_name});
  if (const auto* form = config_.form_data_path_.Find(doc); form && form->is_object()) {
    for (const auto& [name, value] : form->items()) {
      data.multipart_.push_back(
          MultipartPart{name, value.is_string() ? value.get<std::string>() : value.dump()});
    }
  }
  VLOG(1) << "[filehost:" << config_.id_ << "] sending " << clean_name << " to " << *upload_url;
  auto data_response = transport_.Send(data, control);
  Check(data_response, "upload", {200, 201});

  if (!config_.poll_url_.empty()) return PollForLink(upload_id, token, control);

  auto upload_doc = ParseJson(data_response.body_);
  if (upload_doc.is_discarded()) upload_doc = json::object();
  UploadOutcome outcome;
  outcome.success_      = true;
  outcome.http_status_  = data_response.status_;
  outcome.upload_id_    = upload_id;
  outcome.raw_response_ = data_response.body_;
  auto link             = config_.link_path_.FindString(upload_doc);
  if (!link) {
    throw HostError(FailureKind::REJECTED, "upload answer carries no download link",
                    data_response.status_);
  }
  outcome.url_     = *link;
  outcome.file_id_ = config_.file_id_path_.FindString(upload_doc).value_or(upload_id);
  return outcome;
}

auto HostProtocolClient::PollForLink(const std::string& upload_id, const std::string& token,
                                     const TransferControl& control) -> UploadOutcome {
  if (upload_id.empty()) {
    throw HostError(FailureKind::REJECTED, "cannot poll an upload without its id");
  }
  HttpRequest request;
  request.url_           = Substitute(config_.poll_url_, {{"upload_id", upload_id}, {"token", token}});
  request.total_timeout_ = std::chrono::seconds{120};

  Sleep(config_.poll_delay_, control);
  for (uint32_t attempt = 1; attempt <= config_.poll_retries_; ++attempt) {
    auto response = transport_.Send(request);
    if (response.cancelled_) throw HostError(FailureKind::CANCELLED, "poll cancelled");
    if (response.Received()) {
      Check(response, "poll", {200});
      auto doc = ParseJson(response.body_);
      VLOG(1) << "[filehost:" << config_.id_ << "] poll " << attempt << "/"
              << config_.poll_retries_ << ": " << response.body_.substr(0, 200);
      if (!doc.is_discarded()) {
        auto link = config_.link_path_.FindString(doc);
        auto file_id = config_.file_id_path_.FindString(doc).value_or(upload_id);
        if (!link && JsonPath::Parse("response.upload.state").FindInt(doc) == 2) {
          link = JsonPath::Parse("response.file.url").FindString(doc);
          if (!link) link = JsonPath::Parse("response.upload.file_url").FindString(doc);
          file_id = upload_id;
        }
        if (link) {
          UploadOutcome outcome;
          outcome.success_      = true;
          outcome.http_status_  = response.status_;
          outcome.url_          = *link;
          outcome.upload_id_    = upload_id;
          outcome.file_id_      = file_id;
          outcome.raw_response_ = response.body_;
          return outcome;
        }
      }
    } else {
      VLOG(1) << "[filehost:" << config_.id_ << "] poll " << attempt << " failed: "
              << response.error_;
    }
    if (attempt < config_.poll_retries_) Sleep(config_.poll_delay_, control);
  }
  throw HostError(FailureKind::NETWORK,
                  std::format("upload {} still processing after {} polls", upload_id,
                              config_.poll_retries_));
}

auto HostProtocolClient::FetchQuota() -> std::optional<StorageQuota> {
  auto        token = EnsureAuthenticated();
  HttpRequest request;
  request.method_  = config_.user_info_method_;
  request.url_     = Substitute(config_.user_info_url_, {{"token", token}});
  request.headers_ = AuthHeaders(token);
  if (config_.user_info_method_ == HttpMethod::POST && config_.user_info_body_json_) {
    JsonBody(request, json{{"access_token", token}});
  }
  auto response = transport_.Send(request);
  Check(response, "user info", {200});

  StorageQuota quota;
  if (!config_.storage_regex_.empty()) {
    std::smatch match;
    std::regex  pattern(config_.storage_regex_);
    if (!std::regex_search(response.body_, match, pattern) || match.size() < 3) {
      LOG(WARNING) << "[filehost:" << config_.id_ << "] storage pattern did not match the page";
      return std::nullopt;
    }
    auto used  = ParseDouble(match[1].str());
    auto total = ParseDouble(match[2].str());
    if (!used || !total) return std::nullopt;
    quota.total_ = static_cast<int64_t>(*total * static_cast<double>(kGiB));
    quota.used_  = static_cast<int64_t>(*used * static_cast<double>(kGiB));
    quota.left_  = *quota.total_ - *quota.used_;
    return quota;
  }

  auto doc = ParseJson(response.body_);
  if (doc.is_discarded()) {
    throw HostError(FailureKind::REJECTED, "user info answer is not JSON", response.status_);
  }
  if (!ApiStatusOk(doc)) {
    throw HostError(FailureKind::REJECTED, std::format("user info refused: {}", ApiMessage(doc)),
                    response.status_);
  }
  quota.total_ = config_.storage_total_path_.FindInt(doc);
  quota.left_  = config_.storage_left_path_.FindInt(doc);
  quota.used_  = config_.storage_used_path_.FindInt(doc);
  if (!quota.total_ && quota.left_ && quota.used_) quota.total_ = *quota.left_ + *quota.used_;
  if (!quota.total_ && !quota.left_ && !quota.used_) return std::nullopt;
  return quota;
}

auto HostProtocolClient::AuthHeaders(const std::string& token) const -> FieldList {
  if (config_.auth_header_.empty() || token.empty()) return {};
  auto colon = config_.auth_header_.find(':');
  if (colon == std::string::npos) return {};
  return {{conv::Trim(config_.auth_header_.substr(0, colon)),
           Substitute(conv::Trim(config_.auth_header_.substr(colon + 1)), {{"token", token}})}};
}

auto HostProtocolClient::MatchesStalePattern(const std::string& text) const -> bool {
  for (const auto& pattern : config_.stale_token_patterns_) {
    try {
      if (std::regex_search(text, std::regex(pattern, std::regex::icase))) return true;
    } catch (const std::regex_error&) {
      if (conv::ContainsNoCase(text, pattern)) return true;
    }
  }
  return false;
}

auto HostProtocolClient::IsStale(const HttpResponse& response) const -> bool {
  if (response.status_ == 401 || response.status_ == 403) return true;
  return !response.body_.empty() && MatchesStalePattern(response.body_);
}

void HostProtocolClient::Check(const HttpResponse& response, std::string_view step,
                               std::initializer_list<long> accepted) const {
  if (response.cancelled_) {
    throw HostError(FailureKind::CANCELLED, std::format("{} cancelled", step));
  }
  if (!response.error_.empty()) {
    throw HostError(FailureKind::NETWORK, std::format("{}: {}", step, response.error_), 0, true);
  }
  const auto status    = response.status_;
  bool       status_ok = std::find(accepted.begin(), accepted.end(), status) != accepted.end();
  if ((!status_ok || config_.check_body_on_success_) && IsStale(response)) {
    throw HostError(FailureKind::AUTH, std::format("{}: credentials rejected ({})", step, status),
                    status);
  }
  if (status_ok) return;

  auto snippet = response.body_.substr(0, 200);
  if (status == 413 || status == 507 || ContainsQuotaPhrase(response.body_)) {
    throw HostError(FailureKind::QUOTA, std::format("{}: host storage exhausted ({}) {}", step,
                                                    status, snippet),
                    status);
  }
  if (status >= 500 || status == 408 || status == 429) {
    throw HostError(FailureKind::NETWORK, std::format("{}: server answered {}", step, status),
                    status, true);
  }
  throw HostError(FailureKind::REJECTED,
                  std::format("{} failed with status {}: {}", step, status, snippet), status);
}

void HostProtocolClient::Sleep(std::chrono::milliseconds delay, const TransferControl& control) {
  if (!control.should_stop_) {
    sleep_(delay);
    return;
  }
  while (delay.count() > 0) {
    if (control.should_stop_()) {
      throw HostError(FailureKind::CANCELLED, "cancelled while waiting");
    }
    auto slice = std::min(delay, std::chrono::milliseconds{100});
    sleep_(slice);
    delay -= slice;
  }
  if (control.should_stop_()) {
    throw HostError(FailureKind::CANCELLED, "cancelled while waiting");
  }
}
};  // namespace imxup

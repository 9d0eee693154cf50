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

#include <functional>
#include <json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "network/http_transport.hpp"

namespace imxup {
// Assignment values with a meaning of their own
inline constexpr std::string_view kProxyDirect = "__direct__";
inline constexpr std::string_view kProxyFromOs = "__os_proxy__";

inline constexpr std::string_view kPrimaryProxyCategory  = "primary";
inline constexpr std::string_view kFileHostProxyCategory = "file_hosts";

/**
 * @brief Proxy assignments. Each value is a proxy URL, kProxyDirect or kProxyFromOs; an empty or
 *        missing value defers to the next level.
 */
struct ProxySettings {
  std::string                        global_;
  // Consulted after the global assignment: HTTPS_PROXY / HTTP_PROXY from the environment
  bool                               use_os_proxy_ = false;
  std::map<std::string, std::string> categories_;
  // Keyed "<category>/<service>", e.g. "file_hosts/rapidgator"
  std::map<std::string, std::string> services_;
};

auto ParseProxySettings(const nlohmann::json& doc) -> ProxySettings;
auto ToJson(const ProxySettings& settings) -> nlohmann::json;

/**
 * @brief Add http:// to a bare "host:port". Schemes other than http, https, socks4, socks4a,
 *        socks5 and socks5h are rejected.
 */
auto NormalizeProxyUrl(std::string_view value) -> std::optional<std::string>;

struct ProxyRoute {
  // Empty for a direct connection
  std::string url_;
  // Level that decided: "service", "category", "global", "os" or "direct"
  std::string source_ = "direct";

  auto        Direct() const -> bool { return url_.empty(); }
};

using EnvLookupFn = std::function<std::optional<std::string>(const char* name)>;
auto ProcessEnvironment() -> EnvLookupFn;

/**
 * @brief Picks the proxy of a connection: the service assignment, then the category, then the
 *        global one, then the OS proxy when enabled, else a direct connection.
 */
class ProxyResolver {
 public:
  explicit ProxyResolver(ProxySettings settings, EnvLookupFn env = ProcessEnvironment());

  auto Resolve(std::string_view category, std::string_view service = {}) const -> ProxyRoute;

 private:
  auto FromAssignment(const std::string& value, const char* source) const
      -> std::optional<ProxyRoute>;
  auto OsProxy() const -> std::optional<std::string>;

  ProxySettings settings_;
  EnvLookupFn   env_;
};

/**
 * @brief Sends every request of the wrapped transport through one proxy route. Requests that
 *        already name a proxy keep it.
 */
class ProxiedTransport final : public HttpTransport {
 public:
  ProxiedTransport(std::unique_ptr<HttpTransport> inner, ProxyRoute route);

  auto Send(const HttpRequest& request, const TransferControl& control = {})
      -> HttpResponse override;

  auto Cookies() -> std::map<std::string, std::string> override { return inner_->Cookies(); }
  void SetCookie(const std::string& domain, const std::string& name,
                 const std::string& value) override {
    inner_->SetCookie(domain, name, value);
  }
  void ClearCookies() override { inner_->ClearCookies(); }

  auto Route() const -> const ProxyRoute& { return route_; }

 private:
  std::unique_ptr<HttpTransport> inner_;
  ProxyRoute                     route_;
};
};  // namespace imxup

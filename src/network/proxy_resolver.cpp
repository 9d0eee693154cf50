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

#include "network/proxy_resolver.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace imxup {
using json = nlohmann::json;

namespace {
constexpr std::array<std::string_view, 6> kProxySchemes = {"http",   "https",  "socks4",
                                                           "socks4a", "socks5", "socks5h"};

auto StringMap(const json& doc, const char* key) -> std::map<std::string, std::string> {
  std::map<std::string, std::string> out;
  if (!doc.contains(key)) return out;
  const auto& section = doc.at(key);
  if (!section.is_object()) {
    throw std::runtime_error(std::string("proxy.") + key + " must be an object");
  }
  for (const auto& [name, value] : section.items()) out[name] = value.get<std::string>();
  return out;
}
}  // namespace

auto ParseProxySettings(const json& doc) -> ProxySettings {
  ProxySettings settings;
  if (!doc.is_object()) throw std::runtime_error("proxy must be an object");
  settings.global_       = doc.value("global", std::string{});
  settings.use_os_proxy_ = doc.value("use_os_proxy", false);
  settings.categories_   = StringMap(doc, "categories");
  settings.services_     = StringMap(doc, "services");
  return settings;
}

auto ToJson(const ProxySettings& settings) -> json {
  return json{{"global", settings.global_},
              {"use_os_proxy", settings.use_os_proxy_},
              {"categories", settings.categories_},
              {"services", settings.services_}};
}

auto NormalizeProxyUrl(std::string_view value) -> std::optional<std::string> {
  if (value.empty()) return std::nullopt;
  auto sep = value.find("://");
  if (sep == std::string_view::npos) return "http://" + std::string(value);
  std::string scheme(value.substr(0, sep));
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (std::find(kProxySchemes.begin(), kProxySchemes.end(), scheme) == kProxySchemes.end()) {
    return std::nullopt;
  }
  if (sep + 3 >= value.size()) return std::nullopt;
  return scheme + std::string(value.substr(sep));
}

auto ProcessEnvironment() -> EnvLookupFn {
  return [](const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
  };
}

ProxyResolver::ProxyResolver(ProxySettings settings, EnvLookupFn env)
    : settings_(std::move(settings)), env_(std::move(env)) {}

auto ProxyResolver::Resolve(std::string_view category, std::string_view service) const
    -> ProxyRoute {
  if (!service.empty()) {
    auto found = settings_.services_.find(std::string(category) + "/" + std::string(service));
    if (found != settings_.services_.end()) {
      if (auto route = FromAssignment(found->second, "service")) return *route;
    }
  }
  auto found = settings_.categories_.find(std::string(category));
  if (found != settings_.categories_.end()) {
    if (auto route = FromAssignment(found->second, "category")) return *route;
  }
  if (auto route = FromAssignment(settings_.global_, "global")) return *route;
  if (settings_.use_os_proxy_) {
    if (auto url = OsProxy()) return ProxyRoute{*url, "os"};
  }
  return ProxyRoute{};
}

auto ProxyResolver::FromAssignment(const std::string& value, const char* source) const
    -> std::optional<ProxyRoute> {
  if (value.empty()) return std::nullopt;
  if (value == kProxyDirect) return ProxyRoute{"", source};
  if (value == kProxyFromOs) {
    // No proxy in the environment means a direct connection, not the next level
    return ProxyRoute{OsProxy().value_or(""), source};
  }
  auto url = NormalizeProxyUrl(value);
  if (!url) {
    LOG(WARNING) << "[proxy] ignoring " << source << " assignment with unsupported scheme";
    return std::nullopt;
  }
  return ProxyRoute{*url, source};
}

auto ProxyResolver::OsProxy() const -> std::optional<std::string> {
  for (const char* name : {"HTTPS_PROXY", "https_proxy", "HTTP_PROXY", "http_proxy"}) {
    auto value = env_(name);
    if (!value) continue;
    if (auto url = NormalizeProxyUrl(*value)) return url;
  }
  return std::nullopt;
}

ProxiedTransport::ProxiedTransport(std::unique_ptr<HttpTransport> inner, ProxyRoute route)
    : inner_(std::move(inner)), route_(std::move(route)) {
  if (!inner_) throw std::invalid_argument("ProxiedTransport needs a transport");
}

auto ProxiedTransport::Send(const HttpRequest& request, const TransferControl& control)
    -> HttpResponse {
  if (request.proxy_) return inner_->Send(request, control);
  HttpRequest routed = request;
  routed.proxy_      = route_.url_;
  return inner_->Send(routed, control);
}
};  // namespace imxup

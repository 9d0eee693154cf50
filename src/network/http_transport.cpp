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

#include "network/http_transport.hpp"

#include "utils/string/convert.hpp"

namespace imxup {
auto ToString(HttpMethod method) -> std::string_view {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::DELETE:
      return "DELETE";
  }
  return "GET";
}

auto HttpMethodFromString(std::string_view name) -> std::optional<HttpMethod> {
  auto lower = conv::ToLowerAscii(name);
  if (lower == "get") return HttpMethod::GET;
  if (lower == "post") return HttpMethod::POST;
  if (lower == "put") return HttpMethod::PUT;
  if (lower == "delete") return HttpMethod::DELETE;
  return std::nullopt;
}

auto HttpResponse::Header(std::string_view name) const -> std::optional<std::string> {
  auto key = conv::ToLowerAscii(name);
  for (const auto& [header, value] : headers_) {
    if (header == key) return value;
  }
  return std::nullopt;
}

auto EncodeForm(const FieldList& fields) -> std::string {
  std::string out;
  for (const auto& [key, value] : fields) {
    if (!out.empty()) out.push_back('&');
    out += conv::UrlEncode(key);
    out.push_back('=');
    out += conv::UrlEncode(value);
  }
  return out;
}
};  // namespace imxup

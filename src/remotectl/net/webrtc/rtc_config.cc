// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "remotectl/net/webrtc/rtc_config.h"

#include <cstdint>
#include <utility>

#include <absl/status/status.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

namespace rctl::net {

absl::StatusOr<TurnServer> TurnServer::FromString(std::string_view url) {
  std::string_view username_password;
  std::string_view hostname_port = url;

  if (const size_t at_pos = url.rfind('@'); at_pos != std::string_view::npos) {
    username_password = url.substr(0, at_pos);
    hostname_port = url.substr(at_pos + 1);
  }

  if (hostname_port.empty()) {
    return absl::InvalidArgumentError(
        "TurnServer URL must contain a hostname");
  }

  TurnServer server;
  if (const size_t colon_pos = hostname_port.find(':');
      colon_pos == std::string_view::npos) {
    server.hostname = std::string(hostname_port);
  } else {
    server.hostname = std::string(hostname_port.substr(0, colon_pos));
    const std::string_view port_str = hostname_port.substr(colon_pos + 1);
    uint32_t port = 0;
    if (!absl::SimpleAtoi(port_str, &port) || port == 0 || port > 65535) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "TurnServer URL contains an invalid port: '%s'", port_str));
    }
    server.port = static_cast<uint16_t>(port);
  }
  if (server.hostname.empty()) {
    return absl::InvalidArgumentError(
        "TurnServer URL must contain a hostname");
  }

  if (const size_t colon_pos = username_password.find(':');
      colon_pos == std::string_view::npos) {
    server.username = std::string(username_password);
  } else {
    server.username = std::string(username_password.substr(0, colon_pos));
    server.password = std::string(username_password.substr(colon_pos + 1));
  }

  return server;
}

bool AbslParseFlag(std::string_view text, TurnServer* server,
                   std::string* error) {
  auto result = TurnServer::FromString(text);
  if (!result.ok()) {
    *error = std::string(result.status().message());
    return false;
  }
  *server = *std::move(result);
  return true;
}

std::string AbslUnparseFlag(const TurnServer& server) {
  if (server.username.empty()) {
    return absl::StrFormat("%s:%d", server.hostname, server.port);
  }
  return absl::StrFormat("%s:%s@%s:%d", server.username, server.password,
                         server.hostname, server.port);
}

bool AbslParseFlag(std::string_view text, std::vector<TurnServer>* servers,
                   std::string* error) {
  servers->clear();
  if (text.empty()) {
    return true;
  }
  for (std::string_view server_str : absl::StrSplit(text, ',')) {
    TurnServer server;
    if (!AbslParseFlag(server_str, &server, error)) {
      return false;
    }
    servers->push_back(std::move(server));
  }
  return true;
}

std::string AbslUnparseFlag(const std::vector<TurnServer>& servers) {
  return absl::StrJoin(servers, ",",
                       [](std::string* out, const TurnServer& server) {
                         out->append(AbslUnparseFlag(server));
                       });
}

}  // namespace rctl::net

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

#ifndef REMOTECTL_NET_WEBRTC_RTC_CONFIG_H_
#define REMOTECTL_NET_WEBRTC_RTC_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/status/statusor.h>

namespace rctl::net {

struct TurnServer {
  // Parses "[username[:password]@]hostname[:port]".
  static absl::StatusOr<TurnServer> FromString(std::string_view url);

  bool operator==(const TurnServer& other) const = default;

  std::string hostname;
  uint16_t port = 3478;
  std::string username;
  std::string password;
};

bool AbslParseFlag(std::string_view text, TurnServer* absl_nonnull server,
                   std::string* absl_nonnull error);
std::string AbslUnparseFlag(const TurnServer& server);

bool AbslParseFlag(std::string_view text,
                   std::vector<TurnServer>* absl_nonnull servers,
                   std::string* absl_nonnull error);
std::string AbslUnparseFlag(const std::vector<TurnServer>& servers);

// Peer connection settings: ICE servers and transport limits.
struct RtcConfig {
  static constexpr size_t kDefaultMaxMessageSize =
      65536;  // 64 KiB to match the defaults of several browsers

  std::optional<size_t> max_message_size = kDefaultMaxMessageSize;
  bool enable_ice_udp_mux = false;

  std::optional<uint16_t> port_range_begin;
  std::optional<uint16_t> port_range_end;

  std::vector<std::string> stun_servers = {
      "stun:stun.l.google.com:19302",
      "stun:stun1.l.google.com:19302",
  };
  std::vector<TurnServer> turn_servers;
};

}  // namespace rctl::net

#endif  // REMOTECTL_NET_WEBRTC_RTC_CONFIG_H_

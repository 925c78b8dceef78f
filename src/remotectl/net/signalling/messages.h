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

#ifndef REMOTECTL_NET_SIGNALLING_MESSAGES_H_
#define REMOTECTL_NET_SIGNALLING_MESSAGES_H_

#include <string>
#include <string_view>
#include <variant>

#include <absl/status/statusor.h>

#include "remotectl/net/webrtc/types.h"

/**
 * @file
 * JSON codec for the signalling protocol. Every message is an object with a
 * `type` discriminator:
 *
 *   {"type":"join","deviceId":...,"role":"device"|"controller"}
 *   {"type":"offer","sdp":...}, {"type":"answer","sdp":...}
 *   {"type":"ice-candidate","candidate":{"candidate":...,"sdpMid":...,
 *    "sdpMLineIndex":...}}
 *   {"type":"peer-joined","role":...}, {"type":"peer-left"}
 *   {"type":"error","message":...}
 */
namespace rctl::net {

inline constexpr std::string_view kDeviceRole = "device";
inline constexpr std::string_view kControllerRole = "controller";

struct PeerJoined {
  std::string role;

  bool operator==(const PeerJoined& other) const = default;
};

struct PeerLeft {
  bool operator==(const PeerLeft& other) const = default;
};

struct ServerError {
  std::string message;

  bool operator==(const ServerError& other) const = default;
};

// Inbound messages. SessionDescription covers both offers and answers.
using SignallingMessage = std::variant<SessionDescription, IceCandidate,
                                       PeerJoined, PeerLeft, ServerError>;

std::string MakeJoinMessage(std::string_view device_id, std::string_view role);
std::string MakeSessionDescriptionMessage(
    const SessionDescription& description);
std::string MakeIceCandidateMessage(const IceCandidate& candidate);

// Returns InvalidArgument for malformed JSON, unknown types and missing
// fields. Unknown fields are ignored.
absl::StatusOr<SignallingMessage> ParseSignallingMessage(
    std::string_view message);

}  // namespace rctl::net

#endif  // REMOTECTL_NET_SIGNALLING_MESSAGES_H_

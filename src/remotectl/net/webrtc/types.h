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

#ifndef REMOTECTL_NET_WEBRTC_TYPES_H_
#define REMOTECTL_NET_WEBRTC_TYPES_H_

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>

namespace rctl::net {

enum class SdpType { kOffer, kAnswer, kPrAnswer };

std::string_view SdpTypeToString(SdpType type);
absl::StatusOr<SdpType> SdpTypeFromString(std::string_view type);

// An SDP blob together with its negotiation role.
struct SessionDescription {
  SdpType type = SdpType::kOffer;
  std::string sdp;

  bool operator==(const SessionDescription& other) const = default;
};

// A network path candidate, forwarded verbatim between peers.
struct IceCandidate {
  std::string candidate;
  std::optional<std::string> sdp_mid;
  std::optional<int> sdp_mline_index;
  std::optional<std::string> username_fragment;

  bool operator==(const IceCandidate& other) const = default;
};

enum class PeerConnectionState {
  kNew,
  kConnecting,
  kConnected,
  kDisconnected,
  kFailed,
  kClosed,
};

enum class DataChannelState { kConnecting, kOpen, kClosing, kClosed };

std::string_view PeerConnectionStateToString(PeerConnectionState state);
std::string_view DataChannelStateToString(DataChannelState state);

template <typename Sink>
void AbslStringify(Sink& sink, PeerConnectionState state) {
  sink.Append(PeerConnectionStateToString(state));
}

template <typename Sink>
void AbslStringify(Sink& sink, DataChannelState state) {
  sink.Append(DataChannelStateToString(state));
}

template <typename Sink>
void AbslStringify(Sink& sink, SdpType type) {
  sink.Append(SdpTypeToString(type));
}

}  // namespace rctl::net

#endif  // REMOTECTL_NET_WEBRTC_TYPES_H_

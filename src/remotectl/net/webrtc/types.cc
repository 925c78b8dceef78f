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

#include "remotectl/net/webrtc/types.h"

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

namespace rctl::net {

std::string_view SdpTypeToString(SdpType type) {
  switch (type) {
    case SdpType::kOffer:
      return "offer";
    case SdpType::kAnswer:
      return "answer";
    case SdpType::kPrAnswer:
      return "pranswer";
  }
  return "unknown";
}

absl::StatusOr<SdpType> SdpTypeFromString(std::string_view type) {
  if (type == "offer") {
    return SdpType::kOffer;
  }
  if (type == "answer") {
    return SdpType::kAnswer;
  }
  if (type == "pranswer") {
    return SdpType::kPrAnswer;
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Unknown SDP type: '", type, "'"));
}

std::string_view PeerConnectionStateToString(PeerConnectionState state) {
  switch (state) {
    case PeerConnectionState::kNew:
      return "NEW";
    case PeerConnectionState::kConnecting:
      return "CONNECTING";
    case PeerConnectionState::kConnected:
      return "CONNECTED";
    case PeerConnectionState::kDisconnected:
      return "DISCONNECTED";
    case PeerConnectionState::kFailed:
      return "FAILED";
    case PeerConnectionState::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

std::string_view DataChannelStateToString(DataChannelState state) {
  switch (state) {
    case DataChannelState::kConnecting:
      return "CONNECTING";
    case DataChannelState::kOpen:
      return "OPEN";
    case DataChannelState::kClosing:
      return "CLOSING";
    case DataChannelState::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

}  // namespace rctl::net

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

#include "remotectl/net/signalling/messages.h"

#include <cstdint>
#include <optional>
#include <utility>

#include <absl/status/status.h>
#include <absl/strings/str_format.h>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "remotectl/util/json.h"
#include "remotectl/util/status_macros.h"

namespace rctl::net {

std::string MakeJoinMessage(std::string_view device_id,
                            std::string_view role) {
  boost::json::object join;
  join["type"] = "join";
  join["deviceId"] = device_id;
  join["role"] = role;
  return util::SerializeJson(std::move(join));
}

std::string MakeSessionDescriptionMessage(
    const SessionDescription& description) {
  boost::json::object message;
  message["type"] = SdpTypeToString(description.type);
  message["sdp"] = description.sdp;
  return util::SerializeJson(std::move(message));
}

std::string MakeIceCandidateMessage(const IceCandidate& candidate) {
  boost::json::object candidate_json;
  candidate_json["candidate"] = candidate.candidate;
  if (candidate.sdp_mid) {
    candidate_json["sdpMid"] = *candidate.sdp_mid;
  } else {
    candidate_json["sdpMid"] = nullptr;
  }
  if (candidate.sdp_mline_index) {
    candidate_json["sdpMLineIndex"] = *candidate.sdp_mline_index;
  } else {
    candidate_json["sdpMLineIndex"] = nullptr;
  }
  if (candidate.username_fragment) {
    candidate_json["usernameFragment"] = *candidate.username_fragment;
  }

  boost::json::object message;
  message["type"] = "ice-candidate";
  message["candidate"] = std::move(candidate_json);
  return util::SerializeJson(std::move(message));
}

static absl::StatusOr<IceCandidate> ParseIceCandidate(
    const boost::json::object& message) {
  const boost::json::value* candidate_value = message.if_contains("candidate");
  if (candidate_value == nullptr) {
    return absl::InvalidArgumentError(
        "ice-candidate message has no 'candidate' field");
  }
  ASSIGN_OR_RETURN(const boost::json::object* candidate_json,
                   util::AsObject(*candidate_value));

  IceCandidate candidate;
  ASSIGN_OR_RETURN(candidate.candidate,
                   util::GetString(*candidate_json, "candidate"));
  ASSIGN_OR_RETURN(candidate.sdp_mid,
                   util::GetOptionalString(*candidate_json, "sdpMid"));
  ASSIGN_OR_RETURN(candidate.sdp_mline_index,
                   util::GetOptionalInt(*candidate_json, "sdpMLineIndex"));
  ASSIGN_OR_RETURN(
      candidate.username_fragment,
      util::GetOptionalString(*candidate_json, "usernameFragment"));
  return candidate;
}

absl::StatusOr<SignallingMessage> ParseSignallingMessage(
    std::string_view message) {
  ASSIGN_OR_RETURN(const boost::json::value json, util::ParseJson(message));
  ASSIGN_OR_RETURN(const boost::json::object* object, util::AsObject(json));
  ASSIGN_OR_RETURN(const std::string type, util::GetString(*object, "type"));

  if (type == "offer" || type == "answer") {
    ASSIGN_OR_RETURN(const SdpType sdp_type, SdpTypeFromString(type));
    ASSIGN_OR_RETURN(std::string sdp, util::GetString(*object, "sdp"));
    return SessionDescription{.type = sdp_type, .sdp = std::move(sdp)};
  }
  if (type == "ice-candidate") {
    ASSIGN_OR_RETURN(IceCandidate candidate, ParseIceCandidate(*object));
    return candidate;
  }
  if (type == "peer-joined") {
    ASSIGN_OR_RETURN(std::optional<std::string> role,
                     util::GetOptionalString(*object, "role"));
    return PeerJoined{.role = std::move(role).value_or("")};
  }
  if (type == "peer-left") {
    return PeerLeft{};
  }
  if (type == "error") {
    ASSIGN_OR_RETURN(std::optional<std::string> error_message,
                     util::GetOptionalString(*object, "message"));
    return ServerError{.message =
                           std::move(error_message).value_or("Unknown error")};
  }

  return absl::InvalidArgumentError(
      absl::StrFormat("Unknown signalling message type: '%s'", type));
}

}  // namespace rctl::net

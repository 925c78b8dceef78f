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

#include <string>
#include <variant>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <boost/json/value.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "remotectl/net/signalling/messages.h"
#include "remotectl/util/json.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::VariantWith;

using rctl::net::IceCandidate;
using rctl::net::SdpType;
using rctl::net::SessionDescription;

boost::json::value Json(const std::string& text) {
  absl::StatusOr<boost::json::value> value = rctl::util::ParseJson(text);
  EXPECT_TRUE(value.ok()) << value.status();
  return value.ok() ? *value : boost::json::value();
}

TEST(SignallingMessagesTest, JoinMessage) {
  EXPECT_THAT(Json(rctl::net::MakeJoinMessage("pixel-7",
                                              rctl::net::kDeviceRole)),
              Eq(Json(R"({"type":"join","deviceId":"pixel-7",
                          "role":"device"})")));
}

TEST(SignallingMessagesTest, AnswerMessage) {
  EXPECT_THAT(Json(rctl::net::MakeSessionDescriptionMessage(
                  {.type = SdpType::kAnswer, .sdp = "v=0\r\n"})),
              Eq(Json(R"({"type":"answer","sdp":"v=0\r\n"})")));
}

TEST(SignallingMessagesTest, IceCandidateMessageWritesNullsForMissingFields) {
  EXPECT_THAT(Json(rctl::net::MakeIceCandidateMessage(
                  {.candidate = "candidate:1 1 udp 1 10.0.0.1 5000 typ host"})),
              Eq(Json(R"({"type":"ice-candidate","candidate":{
                  "candidate":"candidate:1 1 udp 1 10.0.0.1 5000 typ host",
                  "sdpMid":null,"sdpMLineIndex":null}})")));
}

TEST(SignallingMessagesTest, ParsesOfferAndAnswer) {
  EXPECT_THAT(rctl::net::ParseSignallingMessage(
                  R"({"type":"offer","sdp":"v=0","extra":true})"),
              IsOkAndHolds(VariantWith<SessionDescription>(SessionDescription{
                  .type = SdpType::kOffer, .sdp = "v=0"})));
  EXPECT_THAT(
      rctl::net::ParseSignallingMessage(R"({"type":"answer","sdp":"v=0"})"),
      IsOkAndHolds(VariantWith<SessionDescription>(
          SessionDescription{.type = SdpType::kAnswer, .sdp = "v=0"})));
}

TEST(SignallingMessagesTest, ParsesIceCandidate) {
  EXPECT_THAT(
      rctl::net::ParseSignallingMessage(
          R"({"type":"ice-candidate","candidate":{"candidate":"c",
              "sdpMid":"0","sdpMLineIndex":0}})"),
      IsOkAndHolds(VariantWith<IceCandidate>(IceCandidate{
          .candidate = "c", .sdp_mid = "0", .sdp_mline_index = 0})));
  EXPECT_THAT(
      rctl::net::ParseSignallingMessage(
          R"({"type":"ice-candidate","candidate":{"candidate":"c",
              "sdpMid":null}})"),
      IsOkAndHolds(VariantWith<IceCandidate>(IceCandidate{.candidate = "c"})));
}

TEST(SignallingMessagesTest, ParsesPeerEventsAndErrors) {
  EXPECT_THAT(rctl::net::ParseSignallingMessage(
                  R"({"type":"peer-joined","role":"controller"})"),
              IsOkAndHolds(VariantWith<rctl::net::PeerJoined>(
                  rctl::net::PeerJoined{.role = "controller"})));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(R"({"type":"peer-left"})"),
              IsOkAndHolds(VariantWith<rctl::net::PeerLeft>(
                  rctl::net::PeerLeft{})));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(R"({"type":"error"})"),
              IsOkAndHolds(VariantWith<rctl::net::ServerError>(
                  rctl::net::ServerError{.message = "Unknown error"})));
}

TEST(SignallingMessagesTest, RejectsBadMessages) {
  EXPECT_THAT(rctl::net::ParseSignallingMessage("not json"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::net::ParseSignallingMessage("[]"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(R"({"sdp":"v=0"})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(R"({"type":"offer"})"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("'sdp'")));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(R"({"type":"ice-candidate"})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(R"({"type":"bye"})"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unknown signalling message type")));
}

TEST(SignallingMessagesTest, RejectsOutOfRangeMLineIndex) {
  EXPECT_THAT(
      rctl::net::ParseSignallingMessage(
          R"({"type":"ice-candidate","candidate":{"candidate":"c",
              "sdpMLineIndex":4294967296}})"),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("sdpMLineIndex")));
}

}  // namespace

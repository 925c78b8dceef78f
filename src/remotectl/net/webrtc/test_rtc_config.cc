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
#include <vector>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "remotectl/net/webrtc/rtc_config.h"
#include "remotectl/net/webrtc/types.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::IsEmpty;

using rctl::net::TurnServer;

TEST(TurnServerTest, ParsesFullForm) {
  EXPECT_THAT(TurnServer::FromString("alice:secret@turn.example.com:5349"),
              IsOkAndHolds(TurnServer{.hostname = "turn.example.com",
                                      .port = 5349,
                                      .username = "alice",
                                      .password = "secret"}));
}

TEST(TurnServerTest, UsernameAndPortAreOptional) {
  EXPECT_THAT(TurnServer::FromString("turn.example.com"),
              IsOkAndHolds(TurnServer{.hostname = "turn.example.com"}));
  EXPECT_THAT(TurnServer::FromString("bob@turn.example.com"),
              IsOkAndHolds(TurnServer{.hostname = "turn.example.com",
                                      .username = "bob"}));
}

TEST(TurnServerTest, RejectsMissingHostAndBadPorts) {
  EXPECT_THAT(TurnServer::FromString(""),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(TurnServer::FromString("alice:secret@"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(TurnServer::FromString(":3478"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(TurnServer::FromString("turn.example.com:0"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(TurnServer::FromString("turn.example.com:99999"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(TurnServer::FromString("turn.example.com:port"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(TurnServerTest, FlagRoundTrip) {
  std::vector<TurnServer> servers;
  std::string error;
  ASSERT_TRUE(rctl::net::AbslParseFlag(
      "a:b@one.example.com:3478,two.example.com:3479", &servers, &error))
      << error;
  EXPECT_THAT(servers,
              ElementsAre(TurnServer{.hostname = "one.example.com",
                                     .username = "a",
                                     .password = "b"},
                          TurnServer{.hostname = "two.example.com",
                                     .port = 3479}));
  EXPECT_THAT(rctl::net::AbslUnparseFlag(servers),
              Eq("a:b@one.example.com:3478,two.example.com:3479"));

  EXPECT_TRUE(rctl::net::AbslParseFlag("", &servers, &error));
  EXPECT_THAT(servers, IsEmpty());

  EXPECT_FALSE(rctl::net::AbslParseFlag("ok.example.com,:1", &servers, &error));
  EXPECT_THAT(error, ::testing::HasSubstr("hostname"));
}

TEST(RtcConfigTest, DefaultsToPublicStunServers) {
  const rctl::net::RtcConfig config;
  EXPECT_THAT(config.stun_servers,
              ElementsAre("stun:stun.l.google.com:19302",
                          "stun:stun1.l.google.com:19302"));
  EXPECT_THAT(config.turn_servers, IsEmpty());
  EXPECT_THAT(config.max_message_size,
              Eq(rctl::net::RtcConfig::kDefaultMaxMessageSize));
}

TEST(SdpTypeTest, WireNames) {
  EXPECT_THAT(rctl::net::SdpTypeToString(rctl::net::SdpType::kPrAnswer),
              Eq("pranswer"));
  EXPECT_THAT(rctl::net::SdpTypeFromString("answer"),
              IsOkAndHolds(rctl::net::SdpType::kAnswer));
  EXPECT_THAT(rctl::net::SdpTypeFromString("rollback"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

}  // namespace

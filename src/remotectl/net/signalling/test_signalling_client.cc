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

#include <memory>
#include <string>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "remotectl/concurrency/concurrency.h"
#include "remotectl/net/signalling/messages.h"
#include "remotectl/net/signalling/signalling_client.h"
#include "remotectl/testing/fake_text_socket.h"

#define EXPECT_OK(expression) EXPECT_THAT(expression, ::absl_testing::IsOk())
#define ASSERT_OK(expression) ASSERT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::VariantWith;

using rctl::net::IceCandidate;
using rctl::net::SdpType;
using rctl::net::SessionDescription;
using rctl::net::SignallingClient;
using rctl::testing::FakeSignallingServer;
using rctl::testing::FakeTextSocket;

constexpr absl::Duration kTimeout = absl::Seconds(5);

class SignallingClientTest : public ::testing::Test {
 protected:
  std::unique_ptr<SignallingClient> MakeClient(
      std::string_view url = "ws://signal.example.com/ws") {
    absl::StatusOr<std::unique_ptr<SignallingClient>> client =
        SignallingClient::Create(url, "device-1", rctl::net::kDeviceRole,
                                 server_.MakeConnector());
    EXPECT_OK(client.status());
    return client.ok() ? *std::move(client) : nullptr;
  }

  // Connects `client` and returns the server's end after reading the join.
  std::unique_ptr<FakeTextSocket> ConnectAndAccept(SignallingClient* client) {
    EXPECT_OK(client->Connect());
    absl::StatusOr<std::unique_ptr<FakeTextSocket>> server_end =
        server_.Accept(kTimeout);
    EXPECT_OK(server_end.status());
    if (!server_end.ok()) {
      return nullptr;
    }
    std::string join;
    EXPECT_OK((*server_end)->ReadTextWithTimeout(kTimeout, &join));
    return *std::move(server_end);
  }

  FakeSignallingServer server_;
};

TEST_F(SignallingClientTest, RejectsNonWebsocketUrls) {
  EXPECT_THAT(SignallingClient::Create("https://signal.example.com", "d",
                                       rctl::net::kDeviceRole,
                                       server_.MakeConnector()),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST_F(SignallingClientTest, ConnectSendsJoin) {
  std::unique_ptr<SignallingClient> client =
      MakeClient("ws://signal.example.com/ws?token=abc");
  ASSERT_OK(client->Connect());
  EXPECT_TRUE(client->IsConnected());

  absl::StatusOr<std::unique_ptr<FakeTextSocket>> server_end =
      server_.Accept(kTimeout);
  ASSERT_OK(server_end.status());
  std::string join;
  ASSERT_OK((*server_end)->ReadTextWithTimeout(kTimeout, &join));
  EXPECT_THAT(join, Eq(rctl::net::MakeJoinMessage("device-1", "device")));
  EXPECT_THAT(server_.requested_targets(), ElementsAre("/ws?token=abc"));

  EXPECT_THAT(client->Connect(),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST_F(SignallingClientTest, RefusedConnectionIsUnavailable) {
  server_.RefuseConnections(true);
  std::unique_ptr<SignallingClient> client = MakeClient();
  EXPECT_THAT(client->Connect(),
              StatusIs(absl::StatusCode::kUnavailable,
                       HasSubstr("Signaling connection failed")));
  EXPECT_FALSE(client->IsConnected());
}

TEST_F(SignallingClientTest, SendsRequireConnection) {
  std::unique_ptr<SignallingClient> client = MakeClient();
  EXPECT_THAT(client->SendAnswer({.type = SdpType::kAnswer, .sdp = "v=0"}),
              StatusIs(absl::StatusCode::kFailedPrecondition));
  EXPECT_THAT(client->SendIceCandidate({.candidate = "c"}),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST_F(SignallingClientTest, SendsDescriptionsAndCandidates) {
  std::unique_ptr<SignallingClient> client = MakeClient();
  std::unique_ptr<FakeTextSocket> server_end = ConnectAndAccept(client.get());
  ASSERT_NE(server_end, nullptr);

  const SessionDescription offer{.type = SdpType::kOffer, .sdp = "v=0 offer"};
  const SessionDescription answer{.type = SdpType::kAnswer, .sdp = "v=0"};
  const IceCandidate candidate{.candidate = "c", .sdp_mid = "0",
                               .sdp_mline_index = 0};
  EXPECT_OK(client->SendOffer(offer));
  EXPECT_OK(client->SendAnswer(answer));
  EXPECT_OK(client->SendIceCandidate(candidate));

  std::string message;
  ASSERT_OK(server_end->ReadTextWithTimeout(kTimeout, &message));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(message),
              ::absl_testing::IsOkAndHolds(
                  VariantWith<SessionDescription>(offer)));
  ASSERT_OK(server_end->ReadTextWithTimeout(kTimeout, &message));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(message),
              ::absl_testing::IsOkAndHolds(
                  VariantWith<SessionDescription>(answer)));
  ASSERT_OK(server_end->ReadTextWithTimeout(kTimeout, &message));
  EXPECT_THAT(rctl::net::ParseSignallingMessage(message),
              ::absl_testing::IsOkAndHolds(VariantWith<IceCandidate>(candidate)));
}

TEST_F(SignallingClientTest, DemultiplexesInboundMessages) {
  std::unique_ptr<SignallingClient> client = MakeClient();
  auto offers = client->SubscribeToOffers();
  auto answers = client->SubscribeToAnswers();
  auto candidates = client->SubscribeToIceCandidates();
  auto joined = client->SubscribeToPeerJoined();
  auto errors = client->SubscribeToErrors();

  std::unique_ptr<FakeTextSocket> server_end = ConnectAndAccept(client.get());
  ASSERT_NE(server_end, nullptr);
  EXPECT_OK(server_end->WriteText(R"({"type":"peer-joined","role":"controller"})"));
  EXPECT_OK(server_end->WriteText("garbage"));
  EXPECT_OK(server_end->WriteText(R"({"type":"offer","sdp":"offer-sdp"})"));
  EXPECT_OK(server_end->WriteText(R"({"type":"answer","sdp":"answer-sdp"})"));
  EXPECT_OK(server_end->WriteText(
      R"({"type":"ice-candidate","candidate":{"candidate":"c"}})"));
  EXPECT_OK(server_end->WriteText(R"({"type":"error","message":"busy"})"));

  std::string role;
  ASSERT_TRUE(joined->Read(&role));
  EXPECT_THAT(role, Eq("controller"));

  SessionDescription description;
  ASSERT_TRUE(offers->Read(&description));
  EXPECT_THAT(description.sdp, Eq("offer-sdp"));
  ASSERT_TRUE(answers->Read(&description));
  EXPECT_THAT(description.sdp, Eq("answer-sdp"));

  IceCandidate candidate;
  ASSERT_TRUE(candidates->Read(&candidate));
  EXPECT_THAT(candidate.candidate, Eq("c"));

  std::string error;
  ASSERT_TRUE(errors->Read(&error));
  EXPECT_THAT(error, Eq("busy"));
  EXPECT_TRUE(client->IsConnected());
}

TEST_F(SignallingClientTest, DisconnectClosesSequences) {
  std::unique_ptr<SignallingClient> client = MakeClient();
  auto offers = client->SubscribeToOffers();
  std::unique_ptr<FakeTextSocket> server_end = ConnectAndAccept(client.get());
  ASSERT_NE(server_end, nullptr);

  client->Disconnect();
  client->Disconnect();
  EXPECT_FALSE(client->IsConnected());
  SessionDescription offer;
  EXPECT_FALSE(offers->Read(&offer));
  EXPECT_TRUE(server_end->closed());
  EXPECT_OK(client->GetStatus());
  EXPECT_THAT(client->Connect(),
              StatusIs(absl::StatusCode::kFailedPrecondition));
}

TEST_F(SignallingClientTest, LostConnectionFiresOnError) {
  std::unique_ptr<SignallingClient> client = MakeClient();
  auto offers = client->SubscribeToOffers();
  std::unique_ptr<FakeTextSocket> server_end = ConnectAndAccept(client.get());
  ASSERT_NE(server_end, nullptr);

  EXPECT_OK(server_end->Close());
  EXPECT_THAT(rctl::thread::SelectUntil(absl::Now() + kTimeout,
                                        {client->OnError()}),
              Eq(0));
  EXPECT_FALSE(client->IsConnected());
  EXPECT_THAT(client->GetStatus(),
              StatusIs(absl::StatusCode::kUnavailable,
                       HasSubstr("Signaling connection lost")));
  SessionDescription offer;
  EXPECT_FALSE(offers->Read(&offer));
}

}  // namespace

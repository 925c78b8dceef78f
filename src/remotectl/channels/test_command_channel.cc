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
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "remotectl/channels/command_channel.h"
#include "remotectl/net/webrtc/types.h"
#include "remotectl/protocol/commands.h"
#include "remotectl/testing/fake_peer_connection.h"

#define ASSERT_OK(expression) ASSERT_THAT(expression, ::absl_testing::IsOk())

namespace {

using ::absl_testing::StatusIs;
using ::testing::ElementsAreArray;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::SizeIs;
using ::testing::UnorderedElementsAreArray;

using rctl::testing::FakeDataChannel;

constexpr absl::Duration kTimeout = absl::Seconds(5);

class CommandChannelTest : public ::testing::Test {
 protected:
  CommandChannelTest()
      : controller_end_(std::make_shared<FakeDataChannel>("commands")),
        device_end_(std::make_shared<FakeDataChannel>("commands")) {
    FakeDataChannel::Link(controller_end_, device_end_);
  }

  std::shared_ptr<FakeDataChannel> controller_end_;
  std::shared_ptr<FakeDataChannel> device_end_;
};

TEST_F(CommandChannelTest, EnvelopeIdsAreUnique) {
  rctl::CommandChannel channel(controller_end_);
  absl::flat_hash_set<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    absl::StatusOr<std::string> id = channel.Send(rctl::Tap{.x = 0.1, .y = 0.2});
    ASSERT_OK(id.status());
    ids.insert(*id);
  }
  EXPECT_THAT(ids, SizeIs(50));
  EXPECT_THAT(controller_end_->sent(), SizeIs(50));
  EXPECT_TRUE(controller_end_->sent()[0].is_text);
}

TEST_F(CommandChannelTest, AckMatchesCommandId) {
  rctl::CommandChannel controller(controller_end_);
  rctl::DeviceCommandChannel device(device_end_);
  auto commands = device.SubscribeToCommands();
  auto acks = controller.SubscribeToAcknowledgments();

  absl::StatusOr<std::string> id =
      controller.Send(rctl::KeyPress{.key_code = 4});
  ASSERT_OK(id.status());

  rctl::CommandEnvelope envelope;
  ASSERT_TRUE(commands->Read(&envelope));
  EXPECT_THAT(envelope.id, Eq(*id));
  EXPECT_THAT(envelope.command,
              Eq(rctl::RemoteCommand(rctl::KeyPress{.key_code = 4})));

  ASSERT_TRUE(device.SendAck({.command_id = envelope.id,
                              .success = true,
                              .timestamp_ms = 10}));

  rctl::CommandAck ack;
  ASSERT_TRUE(acks->Read(&ack));
  EXPECT_THAT(ack.command_id, Eq(*id));
  EXPECT_TRUE(ack.success);
  EXPECT_THAT(ack.error_message, Eq(std::nullopt));
}

TEST_F(CommandChannelTest, AcksInAnyOrderMatchTheirCommands) {
  rctl::CommandChannel controller(controller_end_);
  rctl::DeviceCommandChannel device(device_end_);
  auto commands = device.SubscribeToCommands();
  auto acks = controller.SubscribeToAcknowledgments();

  constexpr int kNumCommands = 10;
  std::vector<std::string> sent_ids;
  for (int i = 0; i < kNumCommands; ++i) {
    absl::StatusOr<std::string> id =
        controller.Send(rctl::Tap{.x = 0.1 * i, .y = 0.5});
    ASSERT_OK(id.status());
    sent_ids.push_back(*id);
  }

  std::vector<rctl::CommandEnvelope> received;
  for (int i = 0; i < kNumCommands; ++i) {
    rctl::CommandEnvelope envelope;
    ASSERT_TRUE(commands->Read(&envelope));
    received.push_back(std::move(envelope));
  }

  // Reverse order, with the odd positions ahead of the even ones.
  std::vector<std::string> ack_order;
  for (int i = kNumCommands - 1; i >= 0; i -= 2) {
    ack_order.push_back(received[i].id);
  }
  for (int i = kNumCommands - 2; i >= 0; i -= 2) {
    ack_order.push_back(received[i].id);
  }
  for (const std::string& id : ack_order) {
    ASSERT_TRUE(device.SendAck({.command_id = id, .success = true,
                                .timestamp_ms = 10}));
  }

  std::vector<std::string> acked_ids;
  for (int i = 0; i < kNumCommands; ++i) {
    rctl::CommandAck ack;
    ASSERT_TRUE(acks->Read(&ack));
    acked_ids.push_back(ack.command_id);
  }

  EXPECT_THAT(acked_ids, ElementsAreArray(ack_order));
  EXPECT_THAT(acked_ids, UnorderedElementsAreArray(sent_ids));
  const absl::flat_hash_set<std::string> unique_ids(acked_ids.begin(),
                                                    acked_ids.end());
  EXPECT_THAT(unique_ids, SizeIs(kNumCommands));
}

TEST_F(CommandChannelTest, MalformedMessagesAreDropped) {
  rctl::CommandChannel controller(controller_end_);
  auto acks = controller.SubscribeToAcknowledgments();

  controller_end_->DeliverText("{not json");
  controller_end_->DeliverBinary("\x01\x00\x00");
  controller_end_->DeliverText(R"({"commandId":"z","success":false,
                                   "errorMessage":"boom","timestamp":1})");

  rctl::CommandAck ack;
  ASSERT_TRUE(acks->Read(&ack));
  EXPECT_THAT(ack.command_id, Eq("z"));
  EXPECT_THAT(ack.error_message, Eq("boom"));
  EXPECT_TRUE(controller.IsOpen());
}

TEST_F(CommandChannelTest, DeviceDropsMalformedCommands) {
  rctl::DeviceCommandChannel device(device_end_);
  auto commands = device.SubscribeToCommands();

  device_end_->DeliverText(R"({"id":"1","command":{"type":"TELEPORT"}})");
  device_end_->DeliverText(
      R"({"id":"2","command":{"type":"LOCK_DEVICE"},"timestamp":5})");

  rctl::CommandEnvelope envelope;
  ASSERT_TRUE(commands->Read(&envelope));
  EXPECT_THAT(envelope.id, Eq("2"));
}

TEST_F(CommandChannelTest, SendFailsWhenNotOpen) {
  controller_end_->SetState(rctl::net::DataChannelState::kConnecting);
  rctl::CommandChannel channel(controller_end_);
  EXPECT_THAT(channel.Send(rctl::LockDevice{}),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("not open")));
  EXPECT_FALSE(channel.IsOpen());
}

TEST_F(CommandChannelTest, RefusedSendIsUnavailable) {
  rctl::CommandChannel channel(controller_end_);
  controller_end_->RefuseSends(true);
  EXPECT_THAT(channel.Send(rctl::LockDevice{}),
              StatusIs(absl::StatusCode::kUnavailable));
}

TEST_F(CommandChannelTest, CloseIsIdempotentAndEndsAcks) {
  rctl::CommandChannel channel(controller_end_);
  auto acks = channel.SubscribeToAcknowledgments();

  channel.Close();
  channel.Close();
  EXPECT_THAT(controller_end_->close_calls(), Eq(1));
  EXPECT_FALSE(channel.IsOpen());

  rctl::CommandAck ack;
  EXPECT_FALSE(acks->Read(&ack));
  EXPECT_THAT(channel.Send(rctl::Tap{}),
              StatusIs(absl::StatusCode::kFailedPrecondition,
                       HasSubstr("closed")));
}

TEST_F(CommandChannelTest, DeviceAckFailsAfterClose) {
  rctl::DeviceCommandChannel device(device_end_);
  device.Close();
  EXPECT_FALSE(device.SendAck({.command_id = "x", .success = true}));
  EXPECT_THAT(device_end_->close_calls(), Eq(1));
}

}  // namespace

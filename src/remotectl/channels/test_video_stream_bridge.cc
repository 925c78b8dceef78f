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
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "remotectl/channels/video_channel.h"
#include "remotectl/channels/video_stream_bridge.h"
#include "remotectl/concurrency/broadcast.h"
#include "remotectl/concurrency/concurrency.h"
#include "remotectl/protocol/video_frames.h"
#include "remotectl/testing/fake_peer_connection.h"

namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::SizeIs;

using rctl::FrameData;
using rctl::testing::FakeDataChannel;

constexpr absl::Duration kTimeout = absl::Seconds(5);

class VideoStreamBridgeTest : public ::testing::Test {
 protected:
  VideoStreamBridgeTest()
      : data_channel_(std::make_shared<FakeDataChannel>("video")),
        bridge_(&frames_, std::make_shared<rctl::VideoChannel>(data_channel_)) {
  }

  void PublishFrame(int64_t timestamp_us) {
    frames_.Publish(FrameData{.data = absl::StrCat("frame-", timestamp_us),
                              .presentation_time_us = timestamp_us,
                              .is_key_frame = timestamp_us == 0});
  }

  std::vector<int64_t> SentTimestamps() const {
    std::vector<int64_t> timestamps;
    for (const rctl::net::DataChannelMessage& message : data_channel_->sent()) {
      absl::StatusOr<rctl::DecodedFrameMessage> frame =
          rctl::DecodeFrame(message.data);
      EXPECT_TRUE(frame.ok()) << frame.status();
      if (frame.ok()) {
        timestamps.push_back(frame->timestamp_us);
      }
    }
    return timestamps;
  }

  rctl::Topic<FrameData> frames_;
  std::shared_ptr<FakeDataChannel> data_channel_;
  rctl::VideoStreamBridge bridge_;
};

TEST_F(VideoStreamBridgeTest, ForwardsFramesInOrder) {
  bridge_.Start();
  EXPECT_TRUE(bridge_.IsRunning());
  for (int64_t t = 0; t < 5; ++t) {
    PublishFrame(t);
  }
  ASSERT_TRUE(data_channel_->WaitForSent(5, kTimeout));
  EXPECT_THAT(SentTimestamps(), ElementsAre(0, 1, 2, 3, 4));
  EXPECT_THAT(bridge_.frames_forwarded(), Eq(5));
}

TEST_F(VideoStreamBridgeTest, StartingTwiceDoesNotDuplicateFrames) {
  bridge_.Start();
  bridge_.Start();
  EXPECT_THAT(frames_.NumSubscribers(), Eq(1));

  PublishFrame(1);
  PublishFrame(2);
  ASSERT_TRUE(data_channel_->WaitForSent(2, kTimeout));
  rctl::SleepFor(absl::Milliseconds(20));
  EXPECT_THAT(SentTimestamps(), ElementsAre(1, 2));
}

TEST_F(VideoStreamBridgeTest, NoFramesAfterStop) {
  bridge_.Start();
  PublishFrame(1);
  ASSERT_TRUE(data_channel_->WaitForSent(1, kTimeout));

  bridge_.Stop();
  bridge_.Stop();
  EXPECT_FALSE(bridge_.IsRunning());
  EXPECT_THAT(frames_.NumSubscribers(), Eq(0));

  PublishFrame(2);
  rctl::SleepFor(absl::Milliseconds(20));
  EXPECT_THAT(SentTimestamps(), ElementsAre(1));
}

TEST_F(VideoStreamBridgeTest, RefusedFramesAreSkipped) {
  bridge_.Start();
  data_channel_->RefuseSends(true);
  PublishFrame(1);
  PublishFrame(2);

  const absl::Time deadline = absl::Now() + kTimeout;
  while (bridge_.frames_dropped() < 2 && absl::Now() < deadline) {
    rctl::SleepFor(absl::Milliseconds(1));
  }
  EXPECT_THAT(bridge_.frames_dropped(), Eq(2));

  data_channel_->RefuseSends(false);
  PublishFrame(3);
  ASSERT_TRUE(data_channel_->WaitForSent(1, kTimeout));
  EXPECT_THAT(SentTimestamps(), ElementsAre(3));
  EXPECT_TRUE(bridge_.IsRunning());
}

TEST_F(VideoStreamBridgeTest, StopsRunningWhenSourceCloses) {
  bridge_.Start();
  frames_.Close();

  const absl::Time deadline = absl::Now() + kTimeout;
  while (bridge_.IsRunning() && absl::Now() < deadline) {
    rctl::SleepFor(absl::Milliseconds(1));
  }
  EXPECT_FALSE(bridge_.IsRunning());
  EXPECT_THAT(data_channel_->sent(), SizeIs(0));
}

TEST_F(VideoStreamBridgeTest, RestartsAfterStoppingOnItsOwn) {
  auto source = std::make_unique<rctl::Topic<FrameData>>();
  rctl::VideoStreamBridge bridge(
      source.get(), std::make_shared<rctl::VideoChannel>(data_channel_));
  bridge.Start();
  source->Close();
  const absl::Time deadline = absl::Now() + kTimeout;
  while (bridge.IsRunning() && absl::Now() < deadline) {
    rctl::SleepFor(absl::Milliseconds(1));
  }
  ASSERT_FALSE(bridge.IsRunning());

  // New fibers are posted, so the restarted pump has not run yet.
  bridge.Start();
  EXPECT_TRUE(bridge.IsRunning());

  bridge.Stop();
  EXPECT_FALSE(bridge.IsRunning());
}

}  // namespace

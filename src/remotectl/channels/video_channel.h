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

#ifndef REMOTECTL_CHANNELS_VIDEO_CHANNEL_H_
#define REMOTECTL_CHANNELS_VIDEO_CHANNEL_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include "remotectl/net/webrtc/peer_connection.h"
#include "remotectl/protocol/video_frames.h"

namespace rctl {

inline constexpr std::string_view kVideoChannelLabel = "video";

/**
 * Sends encoded video frames as binary data channel messages, framed as
 * described in `remotectl/protocol/video_frames.h`.
 *
 * Sending is best effort: `SendFrame` reports whether the transport accepted
 * the frame and never fails otherwise. Safe to use from several fibers.
 */
class VideoChannel {
 public:
  struct Options {
    // When set, frames whose message would exceed
    // `kFrameHeaderSize + *chunk_payload_size` bytes are sent in chunks of
    // at most this many payload bytes.
    std::optional<size_t> chunk_payload_size;
  };

  static constexpr size_t kDefaultChunkPayloadSize = 4000;

  explicit VideoChannel(std::shared_ptr<net::DataChannel> data_channel)
      : VideoChannel(std::move(data_channel), Options{}) {}
  VideoChannel(std::shared_ptr<net::DataChannel> data_channel,
               Options options);

  VideoChannel(const VideoChannel&) = delete;
  VideoChannel& operator=(const VideoChannel&) = delete;

  // Returns false if any message of the frame was refused. A chunked frame
  // stops at the first refused chunk.
  bool SendFrame(std::string_view data, int64_t timestamp_us,
                 bool is_key_frame);

  bool SendFrame(const FrameData& frame) {
    return SendFrame(frame.data, frame.presentation_time_us,
                     frame.is_key_frame);
  }

  // True only while the data channel is open.
  [[nodiscard]] bool IsOpen() const { return data_channel_->IsOpen(); }

  [[nodiscard]] uint64_t frames_sent() const { return frames_sent_.load(); }
  [[nodiscard]] uint64_t frames_failed() const {
    return frames_failed_.load();
  }

  const std::shared_ptr<net::DataChannel>& data_channel() const {
    return data_channel_;
  }

 private:
  std::shared_ptr<net::DataChannel> data_channel_;
  const Options options_;

  std::atomic<uint64_t> frames_sent_ = 0;
  std::atomic<uint64_t> frames_failed_ = 0;
};

}  // namespace rctl

#endif  // REMOTECTL_CHANNELS_VIDEO_CHANNEL_H_

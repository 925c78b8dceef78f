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

#include "remotectl/channels/video_channel.h"

#include <string>
#include <utility>
#include <vector>

#include <absl/log/log.h>
#include <absl/status/statusor.h>

namespace rctl {

static bool ShouldLog(uint64_t frame_number) {
  return frame_number <= 10 || frame_number % 100 == 0;
}

VideoChannel::VideoChannel(std::shared_ptr<net::DataChannel> data_channel,
                           Options options)
    : data_channel_(std::move(data_channel)), options_(options) {}

bool VideoChannel::SendFrame(std::string_view data, int64_t timestamp_us,
                             bool is_key_frame) {
  const uint64_t frame_number =
      frames_sent_.load() + frames_failed_.load() + 1;

  if (!options_.chunk_payload_size ||
      data.size() <= *options_.chunk_payload_size) {
    const std::string message = EncodeFrame(data, timestamp_us, is_key_frame);
    if (!data_channel_->SendBinary(message)) {
      const uint64_t failed = ++frames_failed_;
      LOG(WARNING) << "VideoChannel send failed #" << failed << "/"
                   << frame_number << ", size=" << message.size()
                   << ", key=" << is_key_frame;
      return false;
    }
    ++frames_sent_;
    LOG_IF(INFO, ShouldLog(frame_number))
        << "VideoChannel sent #" << frame_number << ", size=" << message.size()
        << ", key=" << is_key_frame;
    return true;
  }

  const absl::StatusOr<std::vector<std::string>> encoded = EncodeFrameChunks(
      data, timestamp_us, is_key_frame, *options_.chunk_payload_size);
  if (!encoded.ok()) {
    ++frames_failed_;
    LOG(WARNING) << "VideoChannel cannot chunk frame #" << frame_number
                 << ": " << encoded.status();
    return false;
  }
  const std::vector<std::string>& chunks = *encoded;
  for (size_t index = 0; index < chunks.size(); ++index) {
    if (!data_channel_->SendBinary(chunks[index])) {
      ++frames_failed_;
      LOG(WARNING) << "VideoChannel chunk send failed, frame #"
                   << frame_number << " chunk " << index << "/"
                   << chunks.size() << ", size=" << chunks[index].size();
      return false;
    }
  }
  ++frames_sent_;
  LOG_IF(INFO, ShouldLog(frame_number))
      << "VideoChannel sent #" << frame_number << " in " << chunks.size()
      << " chunks, total=" << data.size() << ", key=" << is_key_frame;
  return true;
}

}  // namespace rctl

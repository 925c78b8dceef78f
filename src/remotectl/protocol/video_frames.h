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

#ifndef REMOTECTL_PROTOCOL_VIDEO_FRAMES_H_
#define REMOTECTL_PROTOCOL_VIDEO_FRAMES_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

/**
 * @file
 * Binary framing of encoded video over a data channel. One message carries
 * one frame:
 *
 *   [flags:1][timestampUs:8 big-endian][payload]
 *
 * with flags bit 0 set for key frames. There is no length field: the message
 * boundary is the frame boundary. Frames may instead be split into chunks,
 * marked by flags bit 7:
 *
 *   [flags|0x80:1][timestampUs:8][chunkIndex:2][totalChunks:2][payload]
 *
 * all big-endian, the timestamp identifying the frame for reassembly.
 */
namespace rctl {

// One encoded video access unit.
struct FrameData {
  std::string data;
  int64_t presentation_time_us = 0;
  bool is_key_frame = false;

  bool operator==(const FrameData& other) const = default;
};

inline constexpr uint8_t kKeyFrameFlag = 0x01;
inline constexpr uint8_t kChunkedFlag = 0x80;
inline constexpr size_t kFrameHeaderSize = 9;
inline constexpr size_t kChunkHeaderSize = 13;

std::string EncodeFrame(std::string_view data, int64_t timestamp_us,
                        bool is_key_frame);

inline constexpr size_t kMaxChunksPerFrame = 0xFFFF;

// Splits `data` into ceil(size / chunk_payload_size) chunk messages. Returns
// InvalidArgument for a zero chunk size or when more than
// kMaxChunksPerFrame chunks would be needed.
absl::StatusOr<std::vector<std::string>> EncodeFrameChunks(
    std::string_view data, int64_t timestamp_us, bool is_key_frame,
    size_t chunk_payload_size);

struct FrameChunk {
  uint16_t index = 0;
  uint16_t total = 0;

  bool operator==(const FrameChunk& other) const = default;
};

struct DecodedFrameMessage {
  bool is_key_frame = false;
  int64_t timestamp_us = 0;
  // Set for chunk messages.
  std::optional<FrameChunk> chunk;
  std::string payload;

  bool operator==(const DecodedFrameMessage& other) const = default;
};

// Returns InvalidArgument for messages shorter than their header.
absl::StatusOr<DecodedFrameMessage> DecodeFrame(std::string_view message);

}  // namespace rctl

#endif  // REMOTECTL_PROTOCOL_VIDEO_FRAMES_H_

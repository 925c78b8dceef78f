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

#include "remotectl/protocol/video_frames.h"

#include <algorithm>

#include <absl/status/status.h>
#include <absl/strings/str_format.h>
#include <boost/endian/conversion.hpp>

namespace rctl {

namespace {

void AppendBigEndian64(int64_t value, std::string* out) {
  unsigned char bytes[8];
  boost::endian::store_big_u64(bytes, static_cast<uint64_t>(value));
  out->append(reinterpret_cast<const char*>(bytes), sizeof(bytes));
}

void AppendBigEndian16(uint16_t value, std::string* out) {
  unsigned char bytes[2];
  boost::endian::store_big_u16(bytes, value);
  out->append(reinterpret_cast<const char*>(bytes), sizeof(bytes));
}

uint8_t Flags(bool is_key_frame) {
  return is_key_frame ? kKeyFrameFlag : 0;
}

}  // namespace

std::string EncodeFrame(std::string_view data, int64_t timestamp_us,
                        bool is_key_frame) {
  std::string message;
  message.reserve(kFrameHeaderSize + data.size());
  message.push_back(static_cast<char>(Flags(is_key_frame)));
  AppendBigEndian64(timestamp_us, &message);
  message.append(data);
  return message;
}

absl::StatusOr<std::vector<std::string>> EncodeFrameChunks(
    std::string_view data, int64_t timestamp_us, bool is_key_frame,
    size_t chunk_payload_size) {
  if (chunk_payload_size == 0) {
    return absl::InvalidArgumentError("Chunk payload size must be positive");
  }
  const size_t total_chunks =
      std::max<size_t>(1, (data.size() + chunk_payload_size - 1) /
                              chunk_payload_size);
  if (total_chunks > kMaxChunksPerFrame) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Frame of %d bytes needs %d chunks of %d bytes, more than %d",
        data.size(), total_chunks, chunk_payload_size, kMaxChunksPerFrame));
  }

  const auto flags =
      static_cast<char>(kChunkedFlag | Flags(is_key_frame));
  std::vector<std::string> chunks;
  chunks.reserve(total_chunks);
  for (size_t index = 0; index < total_chunks; ++index) {
    const size_t offset = index * chunk_payload_size;
    const std::string_view payload = data.substr(
        offset, std::min(chunk_payload_size, data.size() - offset));

    std::string chunk;
    chunk.reserve(kChunkHeaderSize + payload.size());
    chunk.push_back(flags);
    AppendBigEndian64(timestamp_us, &chunk);
    AppendBigEndian16(static_cast<uint16_t>(index), &chunk);
    AppendBigEndian16(static_cast<uint16_t>(total_chunks), &chunk);
    chunk.append(payload);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

absl::StatusOr<DecodedFrameMessage> DecodeFrame(std::string_view message) {
  if (message.size() < kFrameHeaderSize) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Video message of %d bytes is shorter than its header",
        message.size()));
  }

  const auto flags = static_cast<uint8_t>(message[0]);
  DecodedFrameMessage frame;
  frame.is_key_frame = (flags & kKeyFrameFlag) != 0;
  const auto* bytes = reinterpret_cast<const unsigned char*>(message.data());
  frame.timestamp_us =
      static_cast<int64_t>(boost::endian::load_big_u64(bytes + 1));

  size_t header_size = kFrameHeaderSize;
  if ((flags & kChunkedFlag) != 0) {
    if (message.size() < kChunkHeaderSize) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "Video chunk of %d bytes is shorter than its header",
          message.size()));
    }
    frame.chunk = FrameChunk{
        .index = boost::endian::load_big_u16(bytes + 9),
        .total = boost::endian::load_big_u16(bytes + 11),
    };
    header_size = kChunkHeaderSize;
  }

  frame.payload = std::string(message.substr(header_size));
  return frame;
}

}  // namespace rctl

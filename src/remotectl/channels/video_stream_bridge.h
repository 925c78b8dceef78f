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

#ifndef REMOTECTL_CHANNELS_VIDEO_STREAM_BRIDGE_H_
#define REMOTECTL_CHANNELS_VIDEO_STREAM_BRIDGE_H_

#include <atomic>
#include <cstdint>
#include <memory>

#include <absl/base/nullability.h>
#include <absl/base/thread_annotations.h>

#include "remotectl/channels/video_channel.h"
#include "remotectl/concurrency/broadcast.h"
#include "remotectl/concurrency/concurrency.h"
#include "remotectl/protocol/video_frames.h"

namespace rctl {

/**
 * Pumps frames published on a `Topic<FrameData>` into a `VideoChannel` on a
 * fiber of its own.
 *
 * Streaming is lossy: a frame the channel refuses is counted and logged, and
 * consumption continues with the next one. Frames are never reordered.
 */
class VideoStreamBridge {
 public:
  VideoStreamBridge(Topic<FrameData>* absl_nonnull source,
                    std::shared_ptr<VideoChannel> channel);
  ~VideoStreamBridge();

  VideoStreamBridge(const VideoStreamBridge&) = delete;
  VideoStreamBridge& operator=(const VideoStreamBridge&) = delete;

  // Starts consuming frames published from now on. No-op while running, and
  // restarts the bridge once it has stopped on its own.
  void Start();

  // Stops consuming. Once Stop() returns, no further frame reaches the
  // channel. Idempotent.
  void Stop();

  // False before Start(), after Stop(), and once the source is closed.
  [[nodiscard]] bool IsRunning() const;

  [[nodiscard]] uint64_t frames_forwarded() const {
    return frames_forwarded_.load();
  }
  [[nodiscard]] uint64_t frames_dropped() const {
    return frames_dropped_.load();
  }

  const std::shared_ptr<VideoChannel>& channel() const { return channel_; }

 private:
  void Pump(Subscription<FrameData>* absl_nonnull frames);

  Topic<FrameData>* absl_nonnull const source_;
  const std::shared_ptr<VideoChannel> channel_;

  mutable Mutex mu_;
  std::unique_ptr<Subscription<FrameData>> frames_ ABSL_GUARDED_BY(mu_);
  std::unique_ptr<thread::Fiber> fiber_ ABSL_GUARDED_BY(mu_);
  std::atomic<bool> consuming_ = false;

  std::atomic<uint64_t> frames_forwarded_ = 0;
  std::atomic<uint64_t> frames_dropped_ = 0;
};

}  // namespace rctl

#endif  // REMOTECTL_CHANNELS_VIDEO_STREAM_BRIDGE_H_

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

#include "remotectl/channels/video_stream_bridge.h"

#include <utility>

#include <absl/log/log.h>

namespace rctl {

VideoStreamBridge::VideoStreamBridge(Topic<FrameData>* source,
                                     std::shared_ptr<VideoChannel> channel)
    : source_(source), channel_(std::move(channel)) {}

VideoStreamBridge::~VideoStreamBridge() { Stop(); }

void VideoStreamBridge::Start() {
  // A pump that ended on its own (the source closed) is replaced.
  std::unique_ptr<thread::Fiber> finished;
  std::unique_ptr<Subscription<FrameData>> finished_frames;
  {
    MutexLock lock(&mu_);
    if (fiber_ != nullptr && consuming_.load()) {
      return;
    }
    finished = std::move(fiber_);
    finished_frames = std::move(frames_);

    frames_ = source_->Subscribe();
    consuming_ = true;
    fiber_ = thread::NewTree(
        {}, [this, frames = frames_.get()]() { Pump(frames); });
  }
  if (finished != nullptr) {
    finished->Join();
  }
  LOG(INFO) << "VideoStreamBridge started";
}

void VideoStreamBridge::Stop() {
  std::unique_ptr<thread::Fiber> fiber;
  std::unique_ptr<Subscription<FrameData>> frames;
  {
    MutexLock lock(&mu_);
    if (fiber_ == nullptr) {
      return;
    }
    fiber = std::move(fiber_);
    frames = std::move(frames_);
  }

  fiber->Cancel();
  frames->Unsubscribe();
  fiber->Join();
  consuming_ = false;

  LOG(INFO) << "VideoStreamBridge stopped after " << frames_forwarded_.load()
            << " frames (" << frames_dropped_.load() << " dropped)";
}

bool VideoStreamBridge::IsRunning() const { return consuming_.load(); }

void VideoStreamBridge::Pump(Subscription<FrameData>* frames) {
  FrameData frame;
  while (frames->Read(&frame)) {
    if (thread::Cancelled()) {
      break;
    }
    if (channel_->SendFrame(frame)) {
      ++frames_forwarded_;
    } else {
      const uint64_t dropped = ++frames_dropped_;
      DLOG(INFO) << "VideoStreamBridge dropped frame at "
                 << frame.presentation_time_us << "us (" << dropped
                 << " dropped so far)";
    }
  }
  consuming_ = false;
}

}  // namespace rctl

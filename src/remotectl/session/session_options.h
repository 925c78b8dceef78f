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

#ifndef REMOTECTL_SESSION_SESSION_OPTIONS_H_
#define REMOTECTL_SESSION_SESSION_OPTIONS_H_

#include <absl/time/time.h>

#include "remotectl/channels/video_channel.h"
#include "remotectl/net/webrtc/rtc_config.h"

namespace rctl {

struct SessionOptions {
  // Reconnection attempts after a connected session is lost. The delay
  // before attempt n is initial_reconnect_delay * 2^(n-1), capped at
  // max_reconnect_delay.
  int max_reconnect_attempts = 5;
  absl::Duration initial_reconnect_delay = absl::Seconds(1);
  absl::Duration max_reconnect_delay = absl::Seconds(30);

  // Bounds the signalling connect plus negotiation, until the transport
  // reports it is connected.
  absl::Duration connect_timeout = absl::Seconds(30);
  // Bounds the wait for the "commands" data channel once connected.
  absl::Duration data_channel_timeout = absl::Seconds(10);

  net::RtcConfig rtc;
  VideoChannel::Options video;
};

}  // namespace rctl

#endif  // REMOTECTL_SESSION_SESSION_OPTIONS_H_

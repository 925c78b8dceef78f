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

#ifndef REMOTECTL_NET_WEBRTC_PEER_CONNECTION_H_
#define REMOTECTL_NET_WEBRTC_PEER_CONNECTION_H_

#include <memory>
#include <string>
#include <string_view>

#include <absl/base/nullability.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "remotectl/concurrency/broadcast.h"
#include "remotectl/net/webrtc/rtc_config.h"
#include "remotectl/net/webrtc/types.h"

namespace rctl::net {

struct DataChannelMessage {
  bool is_text = false;
  std::string data;
};

/**
 * One data channel of a peer connection.
 *
 * Sends never block and never throw: they return false when the transport
 * refuses the message (channel not open, buffer full). Incoming messages are
 * delivered through subscriptions, which close when the channel closes.
 */
class DataChannel {
 public:
  virtual ~DataChannel() = default;

  [[nodiscard]] virtual std::string label() const = 0;
  [[nodiscard]] virtual DataChannelState state() const = 0;

  [[nodiscard]] bool IsOpen() const {
    return state() == DataChannelState::kOpen;
  }

  virtual bool SendBinary(std::string_view data) = 0;
  virtual bool SendText(std::string_view text) = 0;

  // Idempotent.
  virtual void Close() = 0;

  virtual std::unique_ptr<Subscription<DataChannelMessage>>
  SubscribeToMessages() = 0;
};

// Receives transport events. Methods may be called on any thread, including
// threads owned by the transport engine, and must not block.
class PeerConnectionObserver {
 public:
  virtual ~PeerConnectionObserver() = default;

  virtual void OnIceCandidate(const IceCandidate& candidate) = 0;
  virtual void OnConnectionStateChange(PeerConnectionState state) = 0;
  virtual void OnDataChannel(std::shared_ptr<DataChannel> channel) = 0;
};

class PeerConnection {
 public:
  virtual ~PeerConnection() = default;

  virtual absl::StatusOr<SessionDescription> CreateOffer() = 0;
  virtual absl::StatusOr<SessionDescription> CreateAnswer() = 0;

  virtual absl::Status SetLocalDescription(
      const SessionDescription& description) = 0;
  virtual absl::Status SetRemoteDescription(
      const SessionDescription& description) = 0;
  virtual absl::Status AddIceCandidate(const IceCandidate& candidate) = 0;

  virtual absl::StatusOr<std::shared_ptr<DataChannel>> CreateDataChannel(
      std::string_view label) = 0;

  [[nodiscard]] virtual PeerConnectionState state() const = 0;

  // Releases the native resources synchronously. No observer method is
  // called after Close() returns. Idempotent.
  virtual void Close() = 0;
};

/**
 * Creates peer connections. The factory stands for process-wide transport
 * engine state: it is created once, outlives every connection it creates,
 * and callers must Close() a connection before creating its successor.
 */
class PeerConnectionFactory {
 public:
  virtual ~PeerConnectionFactory() = default;

  virtual absl::StatusOr<std::unique_ptr<PeerConnection>> CreatePeerConnection(
      const RtcConfig& config,
      PeerConnectionObserver* absl_nonnull observer) = 0;
};

}  // namespace rctl::net

#endif  // REMOTECTL_NET_WEBRTC_PEER_CONNECTION_H_

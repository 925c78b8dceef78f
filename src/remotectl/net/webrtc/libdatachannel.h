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

#ifndef REMOTECTL_NET_WEBRTC_LIBDATACHANNEL_H_
#define REMOTECTL_NET_WEBRTC_LIBDATACHANNEL_H_

#include <memory>
#include <string>
#include <string_view>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <rtc/rtc.hpp>

#include "remotectl/concurrency/broadcast.h"
#include "remotectl/concurrency/concurrency.h"
#include "remotectl/net/webrtc/peer_connection.h"

namespace rctl::net {

rtc::Configuration BuildLibdatachannelConfig(const RtcConfig& config);

class LibdatachannelDataChannel final : public DataChannel {
 public:
  explicit LibdatachannelDataChannel(
      std::shared_ptr<rtc::DataChannel> data_channel);

  ~LibdatachannelDataChannel() override;

  [[nodiscard]] std::string label() const override;
  [[nodiscard]] DataChannelState state() const override;

  bool SendBinary(std::string_view data) override;
  bool SendText(std::string_view text) override;

  void Close() override;

  std::unique_ptr<Subscription<DataChannelMessage>> SubscribeToMessages()
      override;

 private:
  void InstallMessageCallbacks() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  std::shared_ptr<rtc::DataChannel> data_channel_;
  Topic<DataChannelMessage> messages_;

  mutable Mutex mu_;
  bool message_callbacks_installed_ ABSL_GUARDED_BY(mu_) = false;
  bool closing_ ABSL_GUARDED_BY(mu_) = false;
};

class LibdatachannelPeerConnection final : public PeerConnection {
 public:
  LibdatachannelPeerConnection(const RtcConfig& config,
                               PeerConnectionObserver* absl_nonnull observer);

  ~LibdatachannelPeerConnection() override;

  absl::StatusOr<SessionDescription> CreateOffer() override;
  absl::StatusOr<SessionDescription> CreateAnswer() override;

  absl::Status SetLocalDescription(
      const SessionDescription& description) override;
  absl::Status SetRemoteDescription(
      const SessionDescription& description) override;
  absl::Status AddIceCandidate(const IceCandidate& candidate) override;

  absl::StatusOr<std::shared_ptr<DataChannel>> CreateDataChannel(
      std::string_view label) override;

  [[nodiscard]] PeerConnectionState state() const override;

  void Close() override;

 private:
  absl::StatusOr<SessionDescription> GenerateLocalDescription(SdpType type);

  std::unique_ptr<rtc::PeerConnection> connection_;
  PeerConnectionObserver* absl_nonnull const observer_;

  mutable Mutex mu_;
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
};

// Creates LibdatachannelPeerConnections and owns libdatachannel's global
// state: the destructor runs rtc::Cleanup().
class LibdatachannelPeerConnectionFactory final : public PeerConnectionFactory {
 public:
  LibdatachannelPeerConnectionFactory();
  ~LibdatachannelPeerConnectionFactory() override;

  absl::StatusOr<std::unique_ptr<PeerConnection>> CreatePeerConnection(
      const RtcConfig& config,
      PeerConnectionObserver* absl_nonnull observer) override;
};

}  // namespace rctl::net

#endif  // REMOTECTL_NET_WEBRTC_LIBDATACHANNEL_H_

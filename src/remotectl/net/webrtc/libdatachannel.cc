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

#include "remotectl/net/webrtc/libdatachannel.h"

#include <cstddef>
#include <exception>
#include <optional>
#include <utility>

#include <absl/log/log.h>
#include <absl/strings/str_format.h>

namespace rctl::net {

namespace {

absl::Status TransportError(std::string_view operation,
                            const std::exception& e) {
  return absl::InternalError(
      absl::StrFormat("libdatachannel %s failed: %s", operation, e.what()));
}

PeerConnectionState FromLibdatachannel(rtc::PeerConnection::State state) {
  switch (state) {
    case rtc::PeerConnection::State::New:
      return PeerConnectionState::kNew;
    case rtc::PeerConnection::State::Connecting:
      return PeerConnectionState::kConnecting;
    case rtc::PeerConnection::State::Connected:
      return PeerConnectionState::kConnected;
    case rtc::PeerConnection::State::Disconnected:
      return PeerConnectionState::kDisconnected;
    case rtc::PeerConnection::State::Failed:
      return PeerConnectionState::kFailed;
    case rtc::PeerConnection::State::Closed:
      return PeerConnectionState::kClosed;
  }
  return PeerConnectionState::kFailed;
}

rtc::Description::Type ToLibdatachannel(SdpType type) {
  switch (type) {
    case SdpType::kOffer:
      return rtc::Description::Type::Offer;
    case SdpType::kAnswer:
      return rtc::Description::Type::Answer;
    case SdpType::kPrAnswer:
      return rtc::Description::Type::Pranswer;
  }
  return rtc::Description::Type::Unspec;
}

}  // namespace

rtc::Configuration BuildLibdatachannelConfig(const RtcConfig& config) {
  rtc::Configuration rtc_config;
  rtc_config.maxMessageSize = config.max_message_size;
  if (config.port_range_begin) {
    rtc_config.portRangeBegin = *config.port_range_begin;
  }
  if (config.port_range_end) {
    rtc_config.portRangeEnd = *config.port_range_end;
  }
  rtc_config.enableIceUdpMux = config.enable_ice_udp_mux;
  // Offers and answers are driven explicitly through the signalling flow.
  rtc_config.disableAutoNegotiation = true;

  for (const auto& server : config.stun_servers) {
    rtc_config.iceServers.emplace_back(server);
  }
  for (const auto& server : config.turn_servers) {
    rtc_config.iceServers.emplace_back(server.hostname, server.port,
                                       server.username, server.password);
  }

  return rtc_config;
}

LibdatachannelDataChannel::LibdatachannelDataChannel(
    std::shared_ptr<rtc::DataChannel> data_channel)
    : data_channel_(std::move(data_channel)) {
  data_channel_->onClosed([this]() { messages_.Close(); });
}

LibdatachannelDataChannel::~LibdatachannelDataChannel() {
  data_channel_->resetCallbacks();
  messages_.Close();
}

std::string LibdatachannelDataChannel::label() const {
  return data_channel_->label();
}

DataChannelState LibdatachannelDataChannel::state() const {
  {
    MutexLock lock(&mu_);
    if (closing_ && !data_channel_->isClosed()) {
      return DataChannelState::kClosing;
    }
  }
  if (data_channel_->isOpen()) {
    return DataChannelState::kOpen;
  }
  if (data_channel_->isClosed()) {
    return DataChannelState::kClosed;
  }
  return DataChannelState::kConnecting;
}

bool LibdatachannelDataChannel::SendBinary(std::string_view data) {
  if (!data_channel_->isOpen()) {
    return false;
  }
  try {
    return data_channel_->send(reinterpret_cast<const std::byte*>(data.data()),
                               data.size());
  } catch (const std::exception& e) {
    LOG(WARNING) << "DataChannel '" << data_channel_->label()
                 << "' binary send failed: " << e.what();
    return false;
  }
}

bool LibdatachannelDataChannel::SendText(std::string_view text) {
  if (!data_channel_->isOpen()) {
    return false;
  }
  try {
    return data_channel_->send(std::string(text));
  } catch (const std::exception& e) {
    LOG(WARNING) << "DataChannel '" << data_channel_->label()
                 << "' text send failed: " << e.what();
    return false;
  }
}

void LibdatachannelDataChannel::Close() {
  {
    MutexLock lock(&mu_);
    if (closing_) {
      return;
    }
    closing_ = true;
  }
  try {
    data_channel_->close();
  } catch (const std::exception& e) {
    LOG(WARNING) << "DataChannel '" << data_channel_->label()
                 << "' close failed: " << e.what();
  }
  messages_.Close();
}

std::unique_ptr<Subscription<DataChannelMessage>>
LibdatachannelDataChannel::SubscribeToMessages() {
  auto subscription = messages_.Subscribe();
  MutexLock lock(&mu_);
  InstallMessageCallbacks();
  return subscription;
}

void LibdatachannelDataChannel::InstallMessageCallbacks() {
  if (message_callbacks_installed_) {
    return;
  }
  message_callbacks_installed_ = true;
  // libdatachannel queues messages until a callback is set, so messages
  // that arrive before the first subscriber are not lost.
  data_channel_->onMessage(
      [this](rtc::binary message) {
        messages_.Publish(DataChannelMessage{
            .is_text = false,
            .data = std::string(reinterpret_cast<const char*>(message.data()),
                                message.size()),
        });
      },
      [this](rtc::string message) {
        messages_.Publish(DataChannelMessage{
            .is_text = true,
            .data = std::move(message),
        });
      });
}

LibdatachannelPeerConnection::LibdatachannelPeerConnection(
    const RtcConfig& config, PeerConnectionObserver* observer)
    : connection_(std::make_unique<rtc::PeerConnection>(
          BuildLibdatachannelConfig(config))),
      observer_(observer) {
  connection_->onLocalCandidate([this](const rtc::Candidate& candidate) {
    IceCandidate ice_candidate{.candidate = candidate.candidate()};
    if (std::string mid = candidate.mid(); !mid.empty()) {
      ice_candidate.sdp_mid = std::move(mid);
    }
    observer_->OnIceCandidate(ice_candidate);
  });
  connection_->onStateChange([this](rtc::PeerConnection::State state) {
    observer_->OnConnectionStateChange(FromLibdatachannel(state));
  });
  connection_->onDataChannel(
      [this](std::shared_ptr<rtc::DataChannel> data_channel) {
        observer_->OnDataChannel(std::make_shared<LibdatachannelDataChannel>(
            std::move(data_channel)));
      });
}

LibdatachannelPeerConnection::~LibdatachannelPeerConnection() { Close(); }

absl::StatusOr<SessionDescription>
LibdatachannelPeerConnection::GenerateLocalDescription(SdpType type) {
  try {
    connection_->setLocalDescription(ToLibdatachannel(type));
    std::optional<rtc::Description> local = connection_->localDescription();
    if (!local) {
      return absl::InternalError(absl::StrFormat(
          "libdatachannel produced no local %v description", type));
    }
    return SessionDescription{.type = type,
                              .sdp = local->generateSdp("\r\n")};
  } catch (const std::exception& e) {
    return TransportError(absl::StrFormat("create %v", type), e);
  }
}

absl::StatusOr<SessionDescription> LibdatachannelPeerConnection::CreateOffer() {
  return GenerateLocalDescription(SdpType::kOffer);
}

absl::StatusOr<SessionDescription>
LibdatachannelPeerConnection::CreateAnswer() {
  return GenerateLocalDescription(SdpType::kAnswer);
}

absl::Status LibdatachannelPeerConnection::SetLocalDescription(
    const SessionDescription& description) {
  // libdatachannel applies a local description as it generates it, so only
  // a description of another type needs work here.
  try {
    if (std::optional<rtc::Description> local =
            connection_->localDescription();
        local && local->type() == ToLibdatachannel(description.type)) {
      return absl::OkStatus();
    }
    connection_->setLocalDescription(ToLibdatachannel(description.type));
  } catch (const std::exception& e) {
    return TransportError("setLocalDescription", e);
  }
  return absl::OkStatus();
}

absl::Status LibdatachannelPeerConnection::SetRemoteDescription(
    const SessionDescription& description) {
  try {
    connection_->setRemoteDescription(rtc::Description(
        description.sdp, std::string(SdpTypeToString(description.type))));
  } catch (const std::exception& e) {
    return TransportError("setRemoteDescription", e);
  }
  return absl::OkStatus();
}

absl::Status LibdatachannelPeerConnection::AddIceCandidate(
    const IceCandidate& candidate) {
  try {
    if (candidate.sdp_mid) {
      connection_->addRemoteCandidate(
          rtc::Candidate(candidate.candidate, *candidate.sdp_mid));
    } else {
      connection_->addRemoteCandidate(rtc::Candidate(candidate.candidate));
    }
  } catch (const std::exception& e) {
    return TransportError("addRemoteCandidate", e);
  }
  return absl::OkStatus();
}

absl::StatusOr<std::shared_ptr<DataChannel>>
LibdatachannelPeerConnection::CreateDataChannel(std::string_view label) {
  try {
    return std::make_shared<LibdatachannelDataChannel>(
        connection_->createDataChannel(std::string(label)));
  } catch (const std::exception& e) {
    return TransportError("createDataChannel", e);
  }
}

PeerConnectionState LibdatachannelPeerConnection::state() const {
  return FromLibdatachannel(connection_->state());
}

void LibdatachannelPeerConnection::Close() {
  MutexLock lock(&mu_);
  if (closed_) {
    return;
  }
  closed_ = true;
  connection_->resetCallbacks();
  try {
    connection_->close();
  } catch (const std::exception& e) {
    LOG(WARNING) << "PeerConnection close failed: " << e.what();
  }
}

LibdatachannelPeerConnectionFactory::LibdatachannelPeerConnectionFactory() {
  rtc::InitLogger(rtc::LogLevel::Warning);
  rtc::Preload();
}

LibdatachannelPeerConnectionFactory::~LibdatachannelPeerConnectionFactory() {
  rtc::Cleanup().wait();
}

absl::StatusOr<std::unique_ptr<PeerConnection>>
LibdatachannelPeerConnectionFactory::CreatePeerConnection(
    const RtcConfig& config, PeerConnectionObserver* observer) {
  try {
    return std::make_unique<LibdatachannelPeerConnection>(config, observer);
  } catch (const std::exception& e) {
    return TransportError("PeerConnection construction", e);
  }
}

}  // namespace rctl::net

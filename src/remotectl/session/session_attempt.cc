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

#include "remotectl/session/session_attempt.h"

#include <utility>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "remotectl/channels/video_channel.h"
#include "remotectl/net/webrtc/types.h"
#include "remotectl/util/status_macros.h"

namespace rctl {

SessionAttempt::SessionAttempt(
    net::PeerConnectionFactory* absl_nonnull factory,
    std::shared_ptr<net::SignallingClient> signalling,
    const CommandDispatcher* absl_nonnull dispatcher,
    const SessionOptions& options, Callbacks callbacks)
    : factory_(factory),
      signalling_(std::move(signalling)),
      dispatcher_(dispatcher),
      options_(options),
      callbacks_(std::move(callbacks)) {}

SessionAttempt::~SessionAttempt() {
  if (!shut_down_) {
    Shutdown();
  }
}

absl::Status SessionAttempt::Run() {
  CHECK(!ran_) << "SessionAttempt::Run() may only be called once.";
  ran_ = true;
  absl::Status status = RunUntilLost();
  Shutdown();
  return status;
}

void SessionAttempt::OnIceCandidate(const net::IceCandidate& candidate) {
  local_candidates_.writer()->Write(candidate);
}

void SessionAttempt::OnConnectionStateChange(net::PeerConnectionState state) {
  transport_states_.writer()->Write(state);
}

void SessionAttempt::OnDataChannel(std::shared_ptr<net::DataChannel> channel) {
  data_channels_.writer()->Write(std::move(channel));
}

absl::Status SessionAttempt::RunUntilLost() {
  const absl::Time connect_deadline = absl::Now() + options_.connect_timeout;

  // Subscribed before connecting so that an early offer is not missed.
  offers_ = signalling_->SubscribeToOffers();
  remote_candidates_ = signalling_->SubscribeToIceCandidates();
  server_errors_ = signalling_->SubscribeToErrors();
  RETURN_IF_ERROR(ConnectSignalling(connect_deadline));

  ASSIGN_OR_RETURN(peer_connection_,
                   factory_->CreatePeerConnection(options_.rtc, this));
  LOG(INFO) << "SessionAttempt waiting for an offer.";

  RETURN_IF_ERROR(ProcessEventsUntil(
      connect_deadline, "Connection timed out", [this] {
        return transport_state_ == net::PeerConnectionState::kConnected;
      }));
  RETURN_IF_ERROR(ProcessEventsUntil(
      absl::Now() + options_.data_channel_timeout,
      "Data channel not available after timeout",
      [this] { return commands_data_channel_ != nullptr; }));

  command_channel_ =
      std::make_unique<DeviceCommandChannel>(commands_data_channel_);
  commands_ = command_channel_->SubscribeToCommands();
  connected_ = true;
  LOG(INFO) << "SessionAttempt connected.";
  callbacks_.on_connected();
  callbacks_.on_video_channel(VideoDataChannel());

  return ProcessEventsUntil(absl::InfiniteFuture(), "", [] { return false; });
}

absl::Status SessionAttempt::ConnectSignalling(absl::Time deadline) {
  absl::Status status;
  thread::Fiber connect([this, &status] { status = signalling_->Connect(); });

  const int selected = thread::SelectUntil(
      deadline, {connect.OnJoinable(), thread::OnCancel()});
  if (selected != 0) {
    // Makes the pending Connect() return.
    connect.Cancel();
    signalling_->Disconnect();
  }
  connect.Join();

  if (selected == -1) {
    return absl::DeadlineExceededError("Signaling connection timed out");
  }
  if (selected == 1) {
    return absl::CancelledError("Session attempt cancelled");
  }
  return status;
}

absl::Status SessionAttempt::ProcessEventsUntil(
    absl::Time deadline, std::string_view timeout_message,
    absl::FunctionRef<bool()> done) {
  while (!done()) {
    net::SessionDescription offer;
    net::IceCandidate remote_candidate;
    net::IceCandidate local_candidate;
    net::PeerConnectionState transport_state;
    std::shared_ptr<net::DataChannel> data_channel;
    std::string server_error;
    CommandEnvelope envelope;
    bool ok = false;

    const bool watch_signalling = signalling_open_;
    const int selected = thread::SelectUntil(
        deadline,
        {
            thread::OnCancel(),
            watch_signalling ? offers_->OnRead(&offer, &ok)
                             : thread::NonSelectableCase(),
            watch_signalling
                ? remote_candidates_->OnRead(&remote_candidate, &ok)
                : thread::NonSelectableCase(),
            watch_signalling ? server_errors_->OnRead(&server_error, &ok)
                             : thread::NonSelectableCase(),
            connected_ ? thread::NonSelectableCase() : signalling_->OnError(),
            local_candidates_.reader()->OnRead(&local_candidate, &ok),
            transport_states_.reader()->OnRead(&transport_state, &ok),
            data_channels_.reader()->OnRead(&data_channel, &ok),
            commands_ != nullptr ? commands_->OnRead(&envelope, &ok)
                                 : thread::NonSelectableCase(),
        });

    switch (selected) {
      case -1:
        return absl::DeadlineExceededError(timeout_message);
      case 0:
        return absl::CancelledError("Session attempt cancelled");
      case 1:
        if (!ok) {
          RETURN_IF_ERROR(HandleSignallingClosed());
          break;
        }
        RETURN_IF_ERROR(AnswerOffer(offer));
        break;
      case 2:
        if (!ok) {
          RETURN_IF_ERROR(HandleSignallingClosed());
          break;
        }
        AddRemoteCandidate(remote_candidate);
        break;
      case 3:
        if (!ok) {
          RETURN_IF_ERROR(HandleSignallingClosed());
          break;
        }
        LOG(WARNING) << "SessionAttempt signalling server error: "
                     << server_error;
        break;
      case 4:
        RETURN_IF_ERROR(HandleSignallingClosed());
        break;
      case 5:
        SendLocalCandidate(local_candidate);
        break;
      case 6:
        RETURN_IF_ERROR(HandleTransportState(transport_state));
        break;
      case 7:
        AcceptDataChannel(std::move(data_channel));
        break;
      case 8:
        if (!ok) {
          return absl::UnavailableError("Command channel closed");
        }
        HandleCommand(envelope);
        break;
      default:
        LOG(FATAL) << "Unexpected select result: " << selected;
    }
  }
  return absl::OkStatus();
}

absl::Status SessionAttempt::AnswerOffer(const net::SessionDescription& offer) {
  if (offer.type != net::SdpType::kOffer) {
    LOG(WARNING) << "SessionAttempt ignoring remote description of type "
                 << net::SdpTypeToString(offer.type);
    return absl::OkStatus();
  }
  LOG(INFO) << "SessionAttempt answering offer.";

  RETURN_IF_ERROR(peer_connection_->SetRemoteDescription(offer));
  ASSIGN_OR_RETURN(const net::SessionDescription answer,
                   peer_connection_->CreateAnswer());
  RETURN_IF_ERROR(peer_connection_->SetLocalDescription(answer));
  RETURN_IF_ERROR(signalling_->SendAnswer(answer));

  if (!remote_description_set_) {
    remote_description_set_ = true;
    std::vector<net::IceCandidate> pending =
        std::move(pending_remote_candidates_);
    pending_remote_candidates_.clear();
    for (const net::IceCandidate& candidate : pending) {
      AddRemoteCandidate(candidate);
    }
  }
  return absl::OkStatus();
}

void SessionAttempt::AddRemoteCandidate(const net::IceCandidate& candidate) {
  if (!remote_description_set_) {
    pending_remote_candidates_.push_back(candidate);
    return;
  }
  if (absl::Status status = peer_connection_->AddIceCandidate(candidate);
      !status.ok()) {
    LOG(WARNING) << "SessionAttempt could not add remote candidate: "
                 << status;
  }
}

void SessionAttempt::SendLocalCandidate(const net::IceCandidate& candidate) {
  if (!signalling_open_) {
    return;
  }
  if (absl::Status status = signalling_->SendIceCandidate(candidate);
      !status.ok()) {
    LOG(WARNING) << "SessionAttempt could not send local candidate: "
                 << status;
  }
}

absl::Status SessionAttempt::HandleTransportState(
    net::PeerConnectionState state) {
  transport_state_ = state;
  LOG(INFO) << "SessionAttempt transport state "
            << net::PeerConnectionStateToString(state);

  switch (state) {
    case net::PeerConnectionState::kDisconnected:
    case net::PeerConnectionState::kFailed:
    case net::PeerConnectionState::kClosed:
      if (connected_) {
        return absl::UnavailableError(absl::StrCat(
            "Transport ", net::PeerConnectionStateToString(state)));
      }
      // A transport that has never connected may still recover from a
      // disconnect.
      if (state != net::PeerConnectionState::kDisconnected) {
        return absl::UnavailableError("Connection failed");
      }
      return absl::OkStatus();
    default:
      return absl::OkStatus();
  }
}

void SessionAttempt::AcceptDataChannel(
    std::shared_ptr<net::DataChannel> channel) {
  const std::string label = channel->label();
  if (label == kCommandsChannelLabel) {
    if (commands_data_channel_ != nullptr) {
      LOG(WARNING) << "SessionAttempt ignoring a second '" << label
                   << "' data channel.";
      return;
    }
    LOG(INFO) << "SessionAttempt data channel '" << label << "' available.";
    commands_data_channel_ = std::move(channel);
    return;
  }
  if (label == kVideoChannelLabel) {
    LOG(INFO) << "SessionAttempt data channel '" << label << "' available.";
    video_data_channel_ = std::move(channel);
    if (connected_) {
      callbacks_.on_video_channel(video_data_channel_);
    }
    return;
  }
  LOG(WARNING) << "SessionAttempt ignoring data channel '" << label << "'.";
}

absl::Status SessionAttempt::HandleSignallingClosed() {
  absl::Status status = signalling_->GetStatus();
  if (status.ok()) {
    status = absl::UnavailableError("Signaling connection closed");
  }
  if (!connected_) {
    return status;
  }
  // The transport does not need signalling once connected.
  if (signalling_open_) {
    LOG(WARNING) << "SessionAttempt lost signalling while connected: "
                 << status;
    signalling_open_ = false;
  }
  return absl::OkStatus();
}

void SessionAttempt::HandleCommand(const CommandEnvelope& envelope) {
  const CommandAck ack = dispatcher_->Dispatch(envelope);
  if (!command_channel_->SendAck(ack)) {
    LOG(WARNING) << "SessionAttempt could not acknowledge "
                 << CommandType(envelope.command) << " " << envelope.id;
  }
}

std::shared_ptr<net::DataChannel> SessionAttempt::VideoDataChannel() const {
  return video_data_channel_ != nullptr ? video_data_channel_
                                        : commands_data_channel_;
}

void SessionAttempt::Shutdown() {
  shut_down_ = true;

  if (connected_) {
    callbacks_.on_video_channel(nullptr);
  }
  if (commands_ != nullptr) {
    commands_->Unsubscribe();
  }
  if (command_channel_ != nullptr) {
    command_channel_->Close();
  }
  if (peer_connection_ != nullptr) {
    peer_connection_->Close();
  }

  if (offers_ != nullptr) {
    offers_->Unsubscribe();
  }
  if (remote_candidates_ != nullptr) {
    remote_candidates_->Unsubscribe();
  }
  if (server_errors_ != nullptr) {
    server_errors_->Unsubscribe();
  }

  thread::Detach({}, [signalling = signalling_] { signalling->Disconnect(); });
}

}  // namespace rctl

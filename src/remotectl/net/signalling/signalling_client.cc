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

#include "remotectl/net/signalling/signalling_client.h"

#include <utility>
#include <variant>

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include "remotectl/util/overloaded.h"
#include "remotectl/util/status_macros.h"

namespace rctl::net {

absl::StatusOr<std::unique_ptr<SignallingClient>> SignallingClient::Create(
    std::string_view server_url, std::string_view device_id,
    std::string_view role, TextSocketConnector connector) {
  ASSIGN_OR_RETURN(WsUrl url, WsUrl::FromString(server_url));
  return std::unique_ptr<SignallingClient>(new SignallingClient(
      std::move(url), device_id, role, std::move(connector)));
}

SignallingClient::SignallingClient(WsUrl url, std::string_view device_id,
                                   std::string_view role,
                                   TextSocketConnector connector)
    : url_(std::move(url)),
      device_id_(device_id),
      role_(role),
      connector_(std::move(connector)) {}

SignallingClient::~SignallingClient() { Disconnect(); }

absl::Status SignallingClient::Connect() {
  {
    MutexLock lock(&mu_);
    if (connected_ || connecting_) {
      return absl::FailedPreconditionError(
          "Signaling client is already connected");
    }
    if (finished_) {
      return absl::FailedPreconditionError(
          "Signaling client has been disconnected and cannot be reused");
    }
    connecting_ = true;
  }

  absl::StatusOr<std::unique_ptr<TextSocket>> socket = connector_(url_);
  absl::Status join_status;
  if (socket.ok()) {
    join_status = (*socket)->WriteText(MakeJoinMessage(device_id_, role_));
    if (!join_status.ok()) {
      if (const absl::Status close_status = (*socket)->Close();
          !close_status.ok()) {
        LOG(WARNING) << "SignallingClient close after failed join: "
                     << close_status;
      }
    }
  }

  MutexLock lock(&mu_);
  connecting_ = false;

  if (!socket.ok()) {
    if (absl::IsCancelled(socket.status())) {
      return socket.status();
    }
    return absl::UnavailableError(absl::StrCat(
        "Signaling connection failed: ", socket.status().message()));
  }
  if (!join_status.ok()) {
    return absl::UnavailableError(
        absl::StrCat("Signaling connection failed: ", join_status.message()));
  }
  if (finished_) {
    if (const absl::Status close_status = (*socket)->Close();
        !close_status.ok()) {
      LOG(WARNING) << "SignallingClient close after disconnect: "
                   << close_status;
    }
    return absl::CancelledError(
        "Signaling client was disconnected while connecting");
  }

  socket_ = *std::move(socket);
  connected_ = true;
  loop_ = thread::NewTree({}, [this]() { RunLoop(); });

  LOG(INFO) << "SignallingClient connected to " << url_ << " as " << role_
            << " for device " << device_id_;
  return absl::OkStatus();
}

void SignallingClient::Disconnect() {
  TextSocket* socket = nullptr;
  std::unique_ptr<thread::Fiber> loop;
  {
    MutexLock lock(&mu_);
    if (!finished_) {
      socket = socket_.get();
    }
    finished_ = true;
    connected_ = false;
    loop = std::move(loop_);
  }

  if (socket != nullptr) {
    if (const absl::Status status = socket->Close(); !status.ok()) {
      LOG(WARNING) << "SignallingClient::Disconnect close failed: " << status;
    }
  }
  if (loop != nullptr) {
    loop->Cancel();
    loop->Join();
  }
  CloseSequences();
}

bool SignallingClient::IsConnected() const {
  MutexLock lock(&mu_);
  return connected_;
}

absl::Status SignallingClient::SendOffer(const SessionDescription& offer) {
  return Send(MakeSessionDescriptionMessage(offer));
}

absl::Status SignallingClient::SendAnswer(const SessionDescription& answer) {
  return Send(MakeSessionDescriptionMessage(answer));
}

absl::Status SignallingClient::SendIceCandidate(const IceCandidate& candidate) {
  return Send(MakeIceCandidateMessage(candidate));
}

absl::Status SignallingClient::Send(const std::string& message) {
  TextSocket* socket;
  {
    MutexLock lock(&mu_);
    if (!connected_) {
      return absl::FailedPreconditionError(
          "Signaling client is not connected");
    }
    socket = socket_.get();
  }
  return socket->WriteText(message);
}

void SignallingClient::RunLoop() {
  TextSocket* socket;
  {
    MutexLock lock(&mu_);
    socket = socket_.get();
  }

  absl::Status status;
  while (true) {
    std::string message;
    status = socket->ReadText(&message);
    if (!status.ok()) {
      break;
    }

    absl::StatusOr<SignallingMessage> parsed =
        ParseSignallingMessage(message);
    if (!parsed.ok()) {
      LOG(WARNING) << "SignallingClient dropping message: "
                   << parsed.status().message();
      continue;
    }
    Dispatch(*std::move(parsed));
  }

  {
    MutexLock lock(&mu_);
    if (finished_) {
      return;
    }
    finished_ = true;
    connected_ = false;
    loop_status_ = absl::UnavailableError(
        absl::StrCat("Signaling connection lost: ", status.message()));
    LOG(ERROR) << "SignallingClient " << loop_status_;
  }

  if (const absl::Status close_status = socket->Close(); !close_status.ok()) {
    LOG(WARNING) << "SignallingClient close after read failure: "
                 << close_status;
  }
  CloseSequences();
  error_event_.Notify();
}

void SignallingClient::Dispatch(SignallingMessage message) {
  std::visit(util::Overloaded{
                 [this](SessionDescription description) {
                   if (description.type == SdpType::kOffer) {
                     offers_.Publish(description);
                   } else {
                     answers_.Publish(description);
                   }
                 },
                 [this](IceCandidate candidate) {
                   ice_candidates_.Publish(candidate);
                 },
                 [this](PeerJoined joined) {
                   LOG(INFO) << "SignallingClient peer joined: "
                             << joined.role;
                   peer_joined_.Publish(joined.role);
                 },
                 [this](PeerLeft left) {
                   LOG(INFO) << "SignallingClient peer left";
                   peer_left_.Publish(left);
                 },
                 [this](ServerError error) {
                   LOG(WARNING) << "SignallingClient server error: "
                                << error.message;
                   errors_.Publish(error.message);
                 },
             },
             std::move(message));
}

void SignallingClient::CloseSequences() {
  offers_.Close();
  answers_.Close();
  ice_candidates_.Close();
  peer_joined_.Close();
  peer_left_.Close();
  errors_.Close();
}

}  // namespace rctl::net

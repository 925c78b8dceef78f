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

#include "remotectl/testing/fake_peer_connection.h"

#include <utility>

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

namespace rctl::testing {

void FakeDataChannel::Link(const std::shared_ptr<FakeDataChannel>& a,
                           const std::shared_ptr<FakeDataChannel>& b) {
  {
    MutexLock lock(&a->mu_);
    a->peer_ = b;
  }
  MutexLock lock(&b->mu_);
  b->peer_ = a;
}

net::DataChannelState FakeDataChannel::state() const {
  MutexLock lock(&mu_);
  return state_;
}

bool FakeDataChannel::SendBinary(std::string_view data) {
  return Send({.is_text = false, .data = std::string(data)});
}

bool FakeDataChannel::SendText(std::string_view text) {
  return Send({.is_text = true, .data = std::string(text)});
}

bool FakeDataChannel::Send(net::DataChannelMessage message) {
  std::shared_ptr<FakeDataChannel> peer;
  {
    MutexLock lock(&mu_);
    if (state_ != net::DataChannelState::kOpen || refuse_sends_) {
      return false;
    }
    sent_.push_back(message);
    peer = peer_.lock();
    cv_.SignalAll();
  }
  if (peer != nullptr) {
    peer->Deliver(std::move(message));
  }
  return true;
}

void FakeDataChannel::Close() {
  {
    MutexLock lock(&mu_);
    ++close_calls_;
    state_ = net::DataChannelState::kClosed;
  }
  messages_.Close();
}

void FakeDataChannel::Deliver(net::DataChannelMessage message) {
  messages_.Publish(message);
}

void FakeDataChannel::SetState(net::DataChannelState state) {
  {
    MutexLock lock(&mu_);
    state_ = state;
  }
  if (state == net::DataChannelState::kClosed) {
    messages_.Close();
  }
}

void FakeDataChannel::RefuseSends(bool refuse) {
  MutexLock lock(&mu_);
  refuse_sends_ = refuse;
}

std::vector<net::DataChannelMessage> FakeDataChannel::sent() const {
  MutexLock lock(&mu_);
  return sent_;
}

size_t FakeDataChannel::close_calls() const {
  MutexLock lock(&mu_);
  return close_calls_;
}

bool FakeDataChannel::WaitForSent(size_t count, absl::Duration timeout) const {
  const absl::Time deadline = absl::Now() + timeout;
  MutexLock lock(&mu_);
  while (sent_.size() < count) {
    if (cv_.WaitWithDeadline(&mu_, deadline)) {
      return sent_.size() >= count;
    }
  }
  return true;
}

void FakeConnectionControl::SimulateState(net::PeerConnectionState state) {
  MutexLock lock(&mu_);
  if (closed_) {
    return;
  }
  state_ = state;
  observer_->OnConnectionStateChange(state);
}

void FakeConnectionControl::SimulateIceCandidate(
    const net::IceCandidate& candidate) {
  MutexLock lock(&mu_);
  if (closed_) {
    return;
  }
  observer_->OnIceCandidate(candidate);
}

std::shared_ptr<FakeDataChannel> FakeConnectionControl::SimulateDataChannel(
    std::string label) {
  MutexLock lock(&mu_);
  if (closed_) {
    return nullptr;
  }
  auto channel = std::make_shared<FakeDataChannel>(std::move(label));
  data_channels_.push_back(channel);
  observer_->OnDataChannel(channel);
  return channel;
}

void FakeConnectionControl::FailRemoteDescription(bool fail) {
  MutexLock lock(&mu_);
  fail_remote_description_ = fail;
}

bool FakeConnectionControl::closed() const {
  MutexLock lock(&mu_);
  return closed_;
}

std::optional<net::SessionDescription>
FakeConnectionControl::remote_description() const {
  MutexLock lock(&mu_);
  return remote_description_;
}

std::optional<net::SessionDescription>
FakeConnectionControl::local_description() const {
  MutexLock lock(&mu_);
  return local_description_;
}

std::vector<net::IceCandidate> FakeConnectionControl::remote_candidates()
    const {
  MutexLock lock(&mu_);
  return remote_candidates_;
}

std::vector<std::shared_ptr<FakeDataChannel>>
FakeConnectionControl::created_data_channels() const {
  MutexLock lock(&mu_);
  return data_channels_;
}

bool FakeConnectionControl::WaitUntilClosed(absl::Duration timeout) const {
  const absl::Time deadline = absl::Now() + timeout;
  MutexLock lock(&mu_);
  while (!closed_) {
    if (cv_.WaitWithDeadline(&mu_, deadline)) {
      return closed_;
    }
  }
  return true;
}

absl::StatusOr<net::SessionDescription> FakePeerConnection::CreateOffer() {
  MutexLock lock(&control_->mu_);
  if (control_->closed_) {
    return absl::FailedPreconditionError("Peer connection is closed");
  }
  return net::SessionDescription{.type = net::SdpType::kOffer,
                                 .sdp = "v=0 fake-offer"};
}

absl::StatusOr<net::SessionDescription> FakePeerConnection::CreateAnswer() {
  MutexLock lock(&control_->mu_);
  if (control_->closed_) {
    return absl::FailedPreconditionError("Peer connection is closed");
  }
  if (!control_->remote_description_ ||
      control_->remote_description_->type != net::SdpType::kOffer) {
    return absl::FailedPreconditionError(
        "Cannot create an answer without a remote offer");
  }
  return net::SessionDescription{.type = net::SdpType::kAnswer,
                                 .sdp = "v=0 fake-answer"};
}

absl::Status FakePeerConnection::SetLocalDescription(
    const net::SessionDescription& description) {
  MutexLock lock(&control_->mu_);
  if (control_->closed_) {
    return absl::FailedPreconditionError("Peer connection is closed");
  }
  control_->local_description_ = description;
  return absl::OkStatus();
}

absl::Status FakePeerConnection::SetRemoteDescription(
    const net::SessionDescription& description) {
  MutexLock lock(&control_->mu_);
  if (control_->closed_) {
    return absl::FailedPreconditionError("Peer connection is closed");
  }
  if (control_->fail_remote_description_) {
    return absl::InternalError(
        "libdatachannel setRemoteDescription failed: invalid description");
  }
  control_->remote_description_ = description;
  return absl::OkStatus();
}

absl::Status FakePeerConnection::AddIceCandidate(
    const net::IceCandidate& candidate) {
  MutexLock lock(&control_->mu_);
  if (control_->closed_) {
    return absl::FailedPreconditionError("Peer connection is closed");
  }
  if (!control_->remote_description_) {
    return absl::FailedPreconditionError(
        "Cannot add a candidate before the remote description");
  }
  control_->remote_candidates_.push_back(candidate);
  return absl::OkStatus();
}

absl::StatusOr<std::shared_ptr<net::DataChannel>>
FakePeerConnection::CreateDataChannel(std::string_view label) {
  MutexLock lock(&control_->mu_);
  if (control_->closed_) {
    return absl::FailedPreconditionError("Peer connection is closed");
  }
  auto channel = std::make_shared<FakeDataChannel>(std::string(label));
  control_->data_channels_.push_back(channel);
  return channel;
}

net::PeerConnectionState FakePeerConnection::state() const {
  MutexLock lock(&control_->mu_);
  return control_->state_;
}

void FakePeerConnection::Close() {
  std::vector<std::shared_ptr<FakeDataChannel>> channels;
  {
    MutexLock lock(&control_->mu_);
    if (control_->closed_) {
      return;
    }
    control_->closed_ = true;
    control_->observer_ = nullptr;
    control_->state_ = net::PeerConnectionState::kClosed;
    channels = control_->data_channels_;
    control_->cv_.SignalAll();
  }
  for (const std::shared_ptr<FakeDataChannel>& channel : channels) {
    channel->Close();
  }
}

absl::StatusOr<std::unique_ptr<net::PeerConnection>>
FakePeerConnectionFactory::CreatePeerConnection(
    const net::RtcConfig& config,
    net::PeerConnectionObserver* absl_nonnull observer) {
  MutexLock lock(&mu_);
  if (fail_creation_) {
    return absl::InternalError("libdatachannel PeerConnection failed: fake");
  }
  for (const std::shared_ptr<FakeConnectionControl>& previous : connections_) {
    if (!previous->closed()) {
      LOG(ERROR) << "FakePeerConnectionFactory creating connection #"
                 << connections_.size() << " while another is open";
      overlap_ = true;
    }
  }
  auto control = std::make_shared<FakeConnectionControl>(config, observer);
  connections_.push_back(control);
  cv_.SignalAll();
  return std::make_unique<FakePeerConnection>(std::move(control));
}

void FakePeerConnectionFactory::FailCreation(bool fail) {
  MutexLock lock(&mu_);
  fail_creation_ = fail;
}

absl::StatusOr<std::shared_ptr<FakeConnectionControl>>
FakePeerConnectionFactory::WaitForConnection(size_t index,
                                             absl::Duration timeout) {
  const absl::Time deadline = absl::Now() + timeout;
  MutexLock lock(&mu_);
  while (connections_.size() <= index) {
    if (cv_.WaitWithDeadline(&mu_, deadline) && connections_.size() <= index) {
      return absl::DeadlineExceededError(
          absl::StrCat("Connection #", index, " was not created in time"));
    }
  }
  return connections_[index];
}

size_t FakePeerConnectionFactory::created_count() const {
  MutexLock lock(&mu_);
  return connections_.size();
}

bool FakePeerConnectionFactory::created_while_another_was_open() const {
  MutexLock lock(&mu_);
  return overlap_;
}

}  // namespace rctl::testing

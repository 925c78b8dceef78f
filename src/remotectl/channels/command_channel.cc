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

#include "remotectl/channels/command_channel.h"

#include <utility>

#include <absl/log/log.h>
#include <absl/strings/str_format.h>

namespace rctl {

namespace internal {

TextMessageReader::TextMessageReader(net::DataChannel* data_channel,
                                     Handler handler)
    : messages_(data_channel->SubscribeToMessages()),
      handler_(std::move(handler)) {
  fiber_ = thread::NewTree({}, [this]() {
    net::DataChannelMessage message;
    while (messages_->Read(&message)) {
      if (!message.is_text) {
        continue;
      }
      handler_(message.data);
    }
  });
}

TextMessageReader::~TextMessageReader() { Stop(); }

void TextMessageReader::Stop() {
  if (fiber_ == nullptr) {
    return;
  }
  messages_->Unsubscribe();
  fiber_->Cancel();
  fiber_->Join();
  fiber_ = nullptr;
}

}  // namespace internal

CommandChannel::CommandChannel(std::shared_ptr<net::DataChannel> data_channel)
    : data_channel_(std::move(data_channel)),
      reader_(data_channel_.get(),
              [this](std::string_view text) { OnText(text); }) {}

CommandChannel::~CommandChannel() { Close(); }

absl::StatusOr<std::string> CommandChannel::Send(RemoteCommand command) {
  CommandEnvelope envelope = MakeEnvelope(std::move(command));
  if (absl::Status status = SendText(SerializeEnvelope(envelope));
      !status.ok()) {
    return status;
  }
  DLOG(INFO) << "CommandChannel sent " << CommandType(envelope.command)
             << " with id " << envelope.id;
  return std::move(envelope.id);
}

absl::Status CommandChannel::SendAck(const CommandAck& ack) {
  return SendText(SerializeAck(ack));
}

absl::Status CommandChannel::SendText(const std::string& text) {
  {
    MutexLock lock(&mu_);
    if (closed_) {
      return absl::FailedPreconditionError("Command channel is closed");
    }
  }
  if (!data_channel_->IsOpen()) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Data channel '%s' is not open (%s)", data_channel_->label(),
        net::DataChannelStateToString(data_channel_->state())));
  }
  if (!data_channel_->SendText(text)) {
    return absl::UnavailableError(absl::StrFormat(
        "Data channel '%s' refused the message", data_channel_->label()));
  }
  return absl::OkStatus();
}

void CommandChannel::OnText(std::string_view text) {
  absl::StatusOr<CommandAck> ack = ParseAck(text);
  if (!ack.ok()) {
    LOG(WARNING) << "CommandChannel dropping malformed ack: "
                 << ack.status().message();
    return;
  }
  acknowledgments_.Publish(*std::move(ack));
}

void CommandChannel::Close() {
  {
    MutexLock lock(&mu_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  reader_.Stop();
  data_channel_->Close();
  acknowledgments_.Close();
}

bool CommandChannel::IsOpen() const {
  MutexLock lock(&mu_);
  return !closed_ && data_channel_->IsOpen();
}

DeviceCommandChannel::DeviceCommandChannel(
    std::shared_ptr<net::DataChannel> data_channel)
    : data_channel_(std::move(data_channel)),
      reader_(data_channel_.get(),
              [this](std::string_view text) { OnText(text); }) {}

DeviceCommandChannel::~DeviceCommandChannel() { Close(); }

bool DeviceCommandChannel::SendAck(const CommandAck& ack) {
  {
    MutexLock lock(&mu_);
    if (closed_) {
      return false;
    }
  }
  if (!data_channel_->IsOpen()) {
    LOG(WARNING) << "DeviceCommandChannel cannot ack " << ack.command_id
                 << ": data channel is "
                 << net::DataChannelStateToString(data_channel_->state());
    return false;
  }
  return data_channel_->SendText(SerializeAck(ack));
}

void DeviceCommandChannel::OnText(std::string_view text) {
  absl::StatusOr<CommandEnvelope> envelope = ParseEnvelope(text);
  if (!envelope.ok()) {
    LOG(WARNING) << "DeviceCommandChannel dropping malformed command: "
                 << envelope.status().message();
    return;
  }
  commands_.Publish(*std::move(envelope));
}

void DeviceCommandChannel::Close() {
  {
    MutexLock lock(&mu_);
    if (closed_) {
      return;
    }
    closed_ = true;
  }
  reader_.Stop();
  data_channel_->Close();
  commands_.Close();
}

bool DeviceCommandChannel::IsOpen() const {
  MutexLock lock(&mu_);
  return !closed_ && data_channel_->IsOpen();
}

}  // namespace rctl

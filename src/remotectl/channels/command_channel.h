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

#ifndef REMOTECTL_CHANNELS_COMMAND_CHANNEL_H_
#define REMOTECTL_CHANNELS_COMMAND_CHANNEL_H_

#include <memory>
#include <string>
#include <string_view>

#include <absl/base/nullability.h>
#include <absl/base/thread_annotations.h>
#include <absl/functional/any_invocable.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "remotectl/concurrency/broadcast.h"
#include "remotectl/concurrency/concurrency.h"
#include "remotectl/net/webrtc/peer_connection.h"
#include "remotectl/protocol/commands.h"

namespace rctl {

inline constexpr std::string_view kCommandsChannelLabel = "commands";

namespace internal {

// Reads text messages of a data channel on a fiber of its own. Binary
// messages are skipped: a "commands" channel may also carry video.
class TextMessageReader {
 public:
  using Handler = absl::AnyInvocable<void(std::string_view)>;

  TextMessageReader(net::DataChannel* absl_nonnull data_channel,
                    Handler handler);
  ~TextMessageReader();

  // Stops reading and waits for the reader fiber. Idempotent.
  void Stop();

 private:
  std::unique_ptr<Subscription<net::DataChannelMessage>> messages_;
  Handler handler_;
  std::unique_ptr<thread::Fiber> fiber_;
};

}  // namespace internal

/**
 * The controller end of the command protocol.
 *
 * Wraps each `RemoteCommand` in a `CommandEnvelope` with a fresh id and sends
 * it as JSON text. Inbound text is parsed as `CommandAck`s and published on a
 * live-only sequence; malformed messages are logged and dropped without
 * closing the channel.
 */
class CommandChannel {
 public:
  explicit CommandChannel(std::shared_ptr<net::DataChannel> data_channel);
  ~CommandChannel();

  CommandChannel(const CommandChannel&) = delete;
  CommandChannel& operator=(const CommandChannel&) = delete;

  /**
   * Sends `command` in a new envelope.
   *
   * @return
   *   The envelope id, `FailedPreconditionError` if the channel is closed or
   *   not open, or `UnavailableError` if the transport refused the message.
   */
  absl::StatusOr<std::string> Send(RemoteCommand command);

  absl::Status SendAck(const CommandAck& ack);

  std::unique_ptr<Subscription<CommandAck>> SubscribeToAcknowledgments() {
    return acknowledgments_.Subscribe();
  }

  // Closes the underlying data channel exactly once.
  void Close();

  [[nodiscard]] bool IsOpen() const;

 private:
  absl::Status SendText(const std::string& text);
  void OnText(std::string_view text);

  std::shared_ptr<net::DataChannel> data_channel_;
  Topic<CommandAck> acknowledgments_;

  mutable Mutex mu_;
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
  internal::TextMessageReader reader_;
};

/**
 * The device end of the command protocol: parses inbound envelopes and sends
 * acks back on the same channel.
 */
class DeviceCommandChannel {
 public:
  explicit DeviceCommandChannel(
      std::shared_ptr<net::DataChannel> data_channel);
  ~DeviceCommandChannel();

  DeviceCommandChannel(const DeviceCommandChannel&) = delete;
  DeviceCommandChannel& operator=(const DeviceCommandChannel&) = delete;

  std::unique_ptr<Subscription<CommandEnvelope>> SubscribeToCommands() {
    return commands_.Subscribe();
  }

  // Returns false if the channel is closed, not open, or refused the send.
  bool SendAck(const CommandAck& ack);

  void Close();

  [[nodiscard]] bool IsOpen() const;

  const std::shared_ptr<net::DataChannel>& data_channel() const {
    return data_channel_;
  }

 private:
  void OnText(std::string_view text);

  std::shared_ptr<net::DataChannel> data_channel_;
  Topic<CommandEnvelope> commands_;

  mutable Mutex mu_;
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
  internal::TextMessageReader reader_;
};

}  // namespace rctl

#endif  // REMOTECTL_CHANNELS_COMMAND_CHANNEL_H_

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

#ifndef REMOTECTL_SESSION_SESSION_ATTEMPT_H_
#define REMOTECTL_SESSION_SESSION_ATTEMPT_H_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/functional/any_invocable.h>
#include <absl/functional/function_ref.h>
#include <absl/status/status.h>
#include <absl/time/time.h>

#include "remotectl/channels/command_channel.h"
#include "remotectl/concurrency/broadcast.h"
#include "remotectl/concurrency/concurrency.h"
#include "remotectl/net/signalling/signalling_client.h"
#include "remotectl/net/webrtc/peer_connection.h"
#include "remotectl/protocol/commands.h"
#include "remotectl/session/command_dispatcher.h"
#include "remotectl/session/session_options.h"

namespace rctl {

/**
 * One connection attempt of the device, from the signalling handshake to the
 * loss of the transport.
 *
 * The device answers: it joins the signalling server, waits for the
 * controller's offer, answers it and trades ICE candidates until the
 * transport is connected. It then waits for the controller's "commands" data
 * channel and serves commands on it until the transport is lost.
 *
 * All work happens on the fiber that calls `Run()`; transport callbacks only
 * enqueue events for it. When `Run()` returns, the peer connection has been
 * closed and the signalling client is being closed on a detached fiber.
 */
class SessionAttempt final : public net::PeerConnectionObserver {
 public:
  struct Callbacks {
    // The transport is connected and commands are being served.
    absl::AnyInvocable<void()> on_connected;
    // The data channel video should be sent on, once connected. Called again
    // when a better channel appears, and with null when the attempt ends.
    absl::AnyInvocable<void(std::shared_ptr<net::DataChannel>)>
        on_video_channel;
  };

  SessionAttempt(net::PeerConnectionFactory* absl_nonnull factory,
                 std::shared_ptr<net::SignallingClient> signalling,
                 const CommandDispatcher* absl_nonnull dispatcher,
                 const SessionOptions& options, Callbacks callbacks);
  ~SessionAttempt() override;

  SessionAttempt(const SessionAttempt&) = delete;
  SessionAttempt& operator=(const SessionAttempt&) = delete;

  // Runs the attempt to its end and returns why it ended: the negotiation
  // error, a DeadlineExceeded timeout, the loss of the transport, or
  // Cancelled when the calling fiber is cancelled. May be called once.
  absl::Status Run();

  // Whether the attempt reached the connected state.
  [[nodiscard]] bool connected() const { return connected_; }

  void OnIceCandidate(const net::IceCandidate& candidate) override;
  void OnConnectionStateChange(net::PeerConnectionState state) override;
  void OnDataChannel(std::shared_ptr<net::DataChannel> channel) override;

 private:
  absl::Status RunUntilLost();
  absl::Status ConnectSignalling(absl::Time deadline);

  // Handles events until `done()` holds, returning OK, or until `deadline`,
  // returning DeadlineExceeded(timeout_message). Stops early on any event
  // that ends the attempt.
  absl::Status ProcessEventsUntil(absl::Time deadline,
                                  std::string_view timeout_message,
                                  absl::FunctionRef<bool()> done);

  absl::Status AnswerOffer(const net::SessionDescription& offer);
  void AddRemoteCandidate(const net::IceCandidate& candidate);
  void SendLocalCandidate(const net::IceCandidate& candidate);
  absl::Status HandleTransportState(net::PeerConnectionState state);
  void AcceptDataChannel(std::shared_ptr<net::DataChannel> channel);
  absl::Status HandleSignallingClosed();
  void HandleCommand(const CommandEnvelope& envelope);

  std::shared_ptr<net::DataChannel> VideoDataChannel() const;
  void Shutdown();

  net::PeerConnectionFactory* absl_nonnull const factory_;
  const std::shared_ptr<net::SignallingClient> signalling_;
  const CommandDispatcher* absl_nonnull const dispatcher_;
  const SessionOptions options_;
  Callbacks callbacks_;

  // Written by transport threads, read by the attempt's fiber.
  thread::Channel<net::IceCandidate> local_candidates_;
  thread::Channel<net::PeerConnectionState> transport_states_;
  thread::Channel<std::shared_ptr<net::DataChannel>> data_channels_;

  std::unique_ptr<Subscription<net::SessionDescription>> offers_;
  std::unique_ptr<Subscription<net::IceCandidate>> remote_candidates_;
  std::unique_ptr<Subscription<std::string>> server_errors_;
  bool signalling_open_ = true;

  std::unique_ptr<net::PeerConnection> peer_connection_;
  net::PeerConnectionState transport_state_ = net::PeerConnectionState::kNew;
  bool remote_description_set_ = false;
  std::vector<net::IceCandidate> pending_remote_candidates_;

  std::shared_ptr<net::DataChannel> commands_data_channel_;
  std::shared_ptr<net::DataChannel> video_data_channel_;
  std::unique_ptr<DeviceCommandChannel> command_channel_;
  std::unique_ptr<Subscription<CommandEnvelope>> commands_;

  bool ran_ = false;
  bool connected_ = false;
  bool shut_down_ = false;
};

}  // namespace rctl

#endif  // REMOTECTL_SESSION_SESSION_ATTEMPT_H_

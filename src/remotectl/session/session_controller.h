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

#ifndef REMOTECTL_SESSION_SESSION_CONTROLLER_H_
#define REMOTECTL_SESSION_SESSION_CONTROLLER_H_

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <absl/base/nullability.h>
#include <absl/base/thread_annotations.h>
#include <absl/functional/function_ref.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "remotectl/channels/video_stream_bridge.h"
#include "remotectl/concurrency/broadcast.h"
#include "remotectl/concurrency/concurrency.h"
#include "remotectl/net/signalling/signalling_client.h"
#include "remotectl/net/webrtc/peer_connection.h"
#include "remotectl/net/websockets/text_socket.h"
#include "remotectl/protocol/video_frames.h"
#include "remotectl/session/command_dispatcher.h"
#include "remotectl/session/handlers.h"
#include "remotectl/session/session_options.h"
#include "remotectl/session/session_state.h"

/**
 * @file
 * Provides the `SessionController`, which owns the device's remote control
 * session and keeps it alive across transport failures.
 */

namespace rctl {

// Creates a fresh, unconnected signalling client for every connection
// attempt.
using SignallingConnector =
    std::function<absl::StatusOr<std::unique_ptr<net::SignallingClient>>(
        std::string_view server_url, std::string_view device_id)>;

// Joins as the device role, over `connector`.
SignallingConnector MakeSignallingConnector(
    net::TextSocketConnector connector = net::MakeWebsocketConnector());

// Returns `url` with `key=value` appended to its query, percent-encoding the
// value.
std::string AppendQueryParameter(std::string_view url, std::string_view key,
                                 std::string_view value);

/**
 * The device side of a remote control session.
 *
 * States and transitions:
 *
 *   Disconnected --Connect()--> Connecting
 *   Connecting --transport connected, "commands" channel up--> Connected
 *   Connecting --negotiation error, failure or timeout--> Error
 *   Connected --transport disconnected or failed--> Reconnecting(1, max)
 *   Reconnecting(n, max) --backoff--> Connecting --> Connected
 *                                                \--> Reconnecting(n+1, max)
 *   Reconnecting(max, max) --attempt failed--> Error
 *   any --Disconnect()--> Disconnected
 *
 * Every attempt runs on one supervising fiber tree and strictly after the
 * previous one: its peer connection is closed before the next one is
 * created. Commands received while connected are dispatched to the injected
 * handlers and acknowledged on the same channel.
 *
 * Public methods are safe to call from any fiber.
 *
 * @headerfile remotectl/session/session_controller.h
 */
class SessionController {
 public:
  // `factory` and the handlers are not owned and must outlive the
  // controller.
  SessionController(net::PeerConnectionFactory* absl_nonnull factory,
                    SignallingConnector signalling_connector,
                    CommandHandlers handlers, SessionOptions options = {});
  ~SessionController();

  SessionController(const SessionController&) = delete;
  SessionController& operator=(const SessionController&) = delete;

  /**
   * Starts connecting in the background. Progress is reported through the
   * session state.
   *
   * @return
   *   `FailedPreconditionError` unless the state is Disconnected or Error,
   *   `InvalidArgumentError` if `server_url` is not a ws:// or wss:// URL.
   */
  absl::Status Connect(std::string_view server_url, std::string_view token,
                       std::string_view device_id);

  // Ends the session, whatever its state, and waits until its peer
  // connection is closed. Idempotent.
  void Disconnect();

  [[nodiscard]] SessionState State() const;

  // Live-only: yields the transitions made after subscribing.
  std::unique_ptr<Subscription<SessionState>> SubscribeToState() {
    return states_.Subscribe();
  }

  // Blocks until the state satisfies `predicate` (true) or until `timeout`
  // or cancellation (false).
  bool WaitForState(absl::FunctionRef<bool(const SessionState&)> predicate,
                    absl::Duration timeout);

  /**
   * Streams frames published on `source` to the controller, over the "video"
   * data channel when there is one and over "commands" otherwise. The stream
   * resumes on the new channel after a reconnect.
   *
   * @return
   *   `FailedPreconditionError("No active session")` in Disconnected or
   *   Error, `DeadlineExceededError` if no channel became available within
   *   the data channel timeout.
   */
  absl::Status StartVideoStream(Topic<FrameData>* absl_nonnull source);

  void StopVideoStream();

  // The delay before reconnection attempt `attempt` (counting from 1).
  static absl::Duration ReconnectDelay(const SessionOptions& options,
                                       int attempt);

 private:
  void Supervise(const std::string& url, const std::string& device_id);
  absl::Status RunAttempt(const std::string& url, const std::string& device_id,
                          bool* absl_nonnull connected);

  void SetState(SessionState state) ABSL_LOCKS_EXCLUDED(mu_);
  void SetStateLocked(SessionState state) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  void SetVideoChannel(std::shared_ptr<net::DataChannel> channel)
      ABSL_LOCKS_EXCLUDED(mu_);
  void StartBridgeLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void StopBridgeLocked() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  net::PeerConnectionFactory* absl_nonnull const factory_;
  const SignallingConnector signalling_connector_;
  const CommandDispatcher dispatcher_;
  const SessionOptions options_;

  Topic<SessionState> states_;

  // Serializes Connect() and Disconnect().
  Mutex lifecycle_mu_;

  mutable Mutex mu_ ABSL_ACQUIRED_AFTER(lifecycle_mu_);
  SessionState state_ ABSL_GUARDED_BY(mu_);
  std::unique_ptr<thread::Fiber> supervisor_ ABSL_GUARDED_BY(mu_);

  std::shared_ptr<net::DataChannel> video_data_channel_ ABSL_GUARDED_BY(mu_);
  Topic<FrameData>* video_source_ ABSL_GUARDED_BY(mu_) = nullptr;
  std::unique_ptr<VideoStreamBridge> bridge_ ABSL_GUARDED_BY(mu_);
  CondVar video_cv_;
};

}  // namespace rctl

#endif  // REMOTECTL_SESSION_SESSION_CONTROLLER_H_

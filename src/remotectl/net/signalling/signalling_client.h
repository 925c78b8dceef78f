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

#ifndef REMOTECTL_NET_SIGNALLING_SIGNALLING_CLIENT_H_
#define REMOTECTL_NET_SIGNALLING_SIGNALLING_CLIENT_H_

#include <memory>
#include <string>
#include <string_view>

#include <absl/base/thread_annotations.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "remotectl/concurrency/broadcast.h"
#include "remotectl/concurrency/concurrency.h"
#include "remotectl/net/signalling/messages.h"
#include "remotectl/net/webrtc/types.h"
#include "remotectl/net/websockets/text_socket.h"

/**
 * @file
 * Provides the `SignallingClient` class for WebRTC signalling over WebSocket.
 */
namespace rctl::net {

/**
 * A client for WebRTC signalling using WebSocket.
 *
 * The client joins the server as `role` for `device_id`, sends offers,
 * answers and ICE candidates, and demultiplexes inbound messages by their
 * `type` into live-only sequences. Subscribe before `Connect()` to see every
 * message; late subscribers get no replay.
 *
 * A client is good for one connection: after `Disconnect()` (or a lost
 * connection) all sequences are closed and a new client must be created.
 *
 * @headerfile remotectl/net/signalling/signalling_client.h
 */
class SignallingClient {
 public:
  // Returns InvalidArgument if `server_url` is not a ws:// or wss:// URL.
  static absl::StatusOr<std::unique_ptr<SignallingClient>> Create(
      std::string_view server_url, std::string_view device_id,
      std::string_view role,
      TextSocketConnector connector = MakeWebsocketConnector());

  // This class is not copyable or movable
  SignallingClient(const SignallingClient&) = delete;
  SignallingClient& operator=(const SignallingClient&) = delete;

  ~SignallingClient();

  /**
   * Opens the socket and sends the join message.
   *
   * @return
   *   `UnavailableError("Signaling connection failed: ...")` if the socket
   *   could not be established or the join message could not be sent;
   *   `FailedPreconditionError` if the client was already connected or
   *   disconnected.
   */
  absl::Status Connect();

  // Closes the socket, stops the reader and closes all sequences. Idempotent.
  void Disconnect();

  [[nodiscard]] bool IsConnected() const;

  // All sends return FailedPreconditionError("Signaling client is not
  // connected") while disconnected.
  absl::Status SendOffer(const SessionDescription& offer);
  absl::Status SendAnswer(const SessionDescription& answer);
  absl::Status SendIceCandidate(const IceCandidate& candidate);

  std::unique_ptr<Subscription<SessionDescription>> SubscribeToOffers() {
    return offers_.Subscribe();
  }
  std::unique_ptr<Subscription<SessionDescription>> SubscribeToAnswers() {
    return answers_.Subscribe();
  }
  std::unique_ptr<Subscription<IceCandidate>> SubscribeToIceCandidates() {
    return ice_candidates_.Subscribe();
  }
  // Yields the role of each newly joined peer.
  std::unique_ptr<Subscription<std::string>> SubscribeToPeerJoined() {
    return peer_joined_.Subscribe();
  }
  std::unique_ptr<Subscription<PeerLeft>> SubscribeToPeerLeft() {
    return peer_left_.Subscribe();
  }
  // Yields server-reported error text.
  std::unique_ptr<Subscription<std::string>> SubscribeToErrors() {
    return errors_.Subscribe();
  }

  // Fires when the connection is lost other than by Disconnect().
  thread::Case OnError() const { return error_event_.OnEvent(); }

  absl::Status GetStatus() const {
    MutexLock lock(&mu_);
    return loop_status_;
  }

  const WsUrl& url() const { return url_; }

 private:
  SignallingClient(WsUrl url, std::string_view device_id,
                   std::string_view role, TextSocketConnector connector);

  absl::Status Send(const std::string& message);
  void RunLoop();
  void Dispatch(SignallingMessage message);
  void CloseSequences();

  const WsUrl url_;
  const std::string device_id_;
  const std::string role_;
  const TextSocketConnector connector_;

  Topic<SessionDescription> offers_;
  Topic<SessionDescription> answers_;
  Topic<IceCandidate> ice_candidates_;
  Topic<std::string> peer_joined_;
  Topic<PeerLeft> peer_left_;
  Topic<std::string> errors_;

  mutable Mutex mu_;
  bool connecting_ ABSL_GUARDED_BY(mu_) = false;
  bool connected_ ABSL_GUARDED_BY(mu_) = false;
  bool finished_ ABSL_GUARDED_BY(mu_) = false;
  std::unique_ptr<TextSocket> socket_ ABSL_GUARDED_BY(mu_);
  std::unique_ptr<thread::Fiber> loop_ ABSL_GUARDED_BY(mu_);
  absl::Status loop_status_ ABSL_GUARDED_BY(mu_);
  thread::PermanentEvent error_event_;
};

}  // namespace rctl::net

#endif  // REMOTECTL_NET_SIGNALLING_SIGNALLING_CLIENT_H_

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

#include "remotectl/session/session_controller.h"

#include <algorithm>
#include <utility>
#include <variant>

#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include "remotectl/net/signalling/messages.h"
#include "remotectl/net/websockets/fiber_aware_websocket_stream.h"
#include "remotectl/session/session_attempt.h"
#include "remotectl/util/status_macros.h"

namespace rctl {

namespace {

bool IsUnreserved(char c) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '-' ||
         c == '.' || c == '_' || c == '~';
}

std::string PercentEncode(std::string_view value) {
  std::string encoded;
  encoded.reserve(value.size());
  for (const char c : value) {
    if (IsUnreserved(c)) {
      encoded.push_back(c);
    } else {
      absl::StrAppendFormat(&encoded, "%%%02X", static_cast<unsigned char>(c));
    }
  }
  return encoded;
}

}  // namespace

SignallingConnector MakeSignallingConnector(
    net::TextSocketConnector connector) {
  return [connector = std::move(connector)](std::string_view server_url,
                                            std::string_view device_id) {
    return net::SignallingClient::Create(server_url, device_id,
                                         net::kDeviceRole, connector);
  };
}

std::string AppendQueryParameter(std::string_view url, std::string_view key,
                                 std::string_view value) {
  const size_t fragment = std::min(url.find('#'), url.size());
  std::string result(url.substr(0, fragment));
  if (result.find('?') == std::string::npos) {
    result.push_back('?');
  } else if (result.back() != '?' && result.back() != '&') {
    result.push_back('&');
  }
  absl::StrAppend(&result, PercentEncode(key), "=", PercentEncode(value),
                  url.substr(fragment));
  return result;
}

SessionController::SessionController(
    net::PeerConnectionFactory* absl_nonnull factory,
    SignallingConnector signalling_connector, CommandHandlers handlers,
    SessionOptions options)
    : factory_(factory),
      signalling_connector_(std::move(signalling_connector)),
      dispatcher_(handlers),
      options_(std::move(options)) {}

SessionController::~SessionController() {
  Disconnect();
  states_.Close();
}

absl::Status SessionController::Connect(std::string_view server_url,
                                        std::string_view token,
                                        std::string_view device_id) {
  std::string url(server_url);
  if (!token.empty()) {
    url = AppendQueryParameter(url, "token", token);
  }
  RETURN_IF_ERROR(net::WsUrl::FromString(url).status());

  MutexLock lifecycle(&lifecycle_mu_);
  std::unique_ptr<thread::Fiber> finished_supervisor;
  {
    MutexLock lock(&mu_);
    if (!CanConnect(state_)) {
      return absl::FailedPreconditionError(absl::StrCat(
          "Cannot connect while ", SessionStateToString(state_)));
    }
    // After an Error, the previous supervisor has published its last state
    // and is about to return.
    finished_supervisor = std::move(supervisor_);
  }
  if (finished_supervisor != nullptr) {
    finished_supervisor->Join();
  }

  LOG(INFO) << "SessionController connecting " << device_id << " to "
            << server_url;
  MutexLock lock(&mu_);
  SetStateLocked(session_state::Connecting{});
  supervisor_ = thread::NewTree(
      {}, [this, url = std::move(url), device_id = std::string(device_id)] {
        Supervise(url, device_id);
      });
  return absl::OkStatus();
}

void SessionController::Disconnect() {
  MutexLock lifecycle(&lifecycle_mu_);
  std::unique_ptr<thread::Fiber> supervisor;
  {
    MutexLock lock(&mu_);
    supervisor = std::move(supervisor_);
  }

  // Unwinding the running attempt stops command processing, closes its peer
  // connection synchronously and hands its signalling client to a detached
  // fiber for closing.
  if (supervisor != nullptr) {
    supervisor->Cancel();
    supervisor->Join();
  }

  MutexLock lock(&mu_);
  StopBridgeLocked();
  video_source_ = nullptr;
  video_data_channel_ = nullptr;
  if (!std::holds_alternative<session_state::Disconnected>(state_)) {
    LOG(INFO) << "SessionController disconnected from "
              << SessionStateToString(state_);
    SetStateLocked(session_state::Disconnected{});
  }
}

SessionState SessionController::State() const {
  MutexLock lock(&mu_);
  return state_;
}

bool SessionController::WaitForState(
    absl::FunctionRef<bool(const SessionState&)> predicate,
    absl::Duration timeout) {
  // Subscribed first so that no transition falls between the check of the
  // current state and the wait.
  std::unique_ptr<Subscription<SessionState>> states = states_.Subscribe();
  if (predicate(State())) {
    return true;
  }

  const absl::Time deadline = absl::Now() + timeout;
  SessionState state;
  bool ok = false;
  while (true) {
    const int selected = thread::SelectUntil(
        deadline, {states->OnRead(&state, &ok), thread::OnCancel()});
    if (selected != 0 || !ok) {
      return false;
    }
    if (predicate(state)) {
      return true;
    }
  }
}

absl::Status SessionController::StartVideoStream(
    Topic<FrameData>* absl_nonnull source) {
  MutexLock lock(&mu_);
  const absl::Time deadline = absl::Now() + options_.data_channel_timeout;
  while (true) {
    if (CanConnect(state_)) {
      return absl::FailedPreconditionError("No active session");
    }
    if (video_data_channel_ != nullptr) {
      break;
    }
    if (video_cv_.WaitWithDeadline(&mu_, deadline) &&
        video_data_channel_ == nullptr) {
      return absl::DeadlineExceededError(
          "Video channel not available after timeout");
    }
  }

  if (video_source_ == source && bridge_ != nullptr) {
    return absl::OkStatus();
  }
  StopBridgeLocked();
  video_source_ = source;
  StartBridgeLocked();
  return absl::OkStatus();
}

void SessionController::StopVideoStream() {
  MutexLock lock(&mu_);
  StopBridgeLocked();
  video_source_ = nullptr;
}

absl::Duration SessionController::ReconnectDelay(const SessionOptions& options,
                                                 int attempt) {
  absl::Duration delay = options.initial_reconnect_delay;
  for (int i = 1; i < attempt && delay < options.max_reconnect_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, options.max_reconnect_delay);
}

void SessionController::Supervise(const std::string& url,
                                  const std::string& device_id) {
  const int max_attempts = options_.max_reconnect_attempts;
  int attempt = 0;

  while (!thread::Cancelled()) {
    bool connected = false;
    const absl::Status status = RunAttempt(url, device_id, &connected);
    if (thread::Cancelled()) {
      return;
    }

    if (connected) {
      LOG(WARNING) << "SessionController connection lost: " << status;
      attempt = 0;
    } else if (attempt == 0) {
      LOG(ERROR) << "SessionController connection failed: " << status;
      SetState(session_state::Error{status.message().empty()
                                        ? status.ToString()
                                        : std::string(status.message())});
      return;
    } else {
      LOG(WARNING) << "SessionController reconnection attempt " << attempt
                   << "/" << max_attempts << " failed: " << status;
    }

    if (attempt >= max_attempts) {
      SetState(session_state::Error{
          "Connection lost after max reconnection attempts"});
      return;
    }

    ++attempt;
    SetState(session_state::Reconnecting{.attempt = attempt,
                                         .max_attempts = max_attempts});
    const absl::Duration delay = ReconnectDelay(options_, attempt);
    LOG(INFO) << "SessionController reconnecting in " << delay;
    if (thread::SelectUntil(absl::Now() + delay, {thread::OnCancel()}) == 0) {
      return;
    }
    SetState(session_state::Connecting{});
  }
}

absl::Status SessionController::RunAttempt(const std::string& url,
                                           const std::string& device_id,
                                           bool* absl_nonnull connected) {
  ASSIGN_OR_RETURN(std::unique_ptr<net::SignallingClient> signalling,
                   signalling_connector_(url, device_id));

  SessionAttempt attempt(
      factory_, std::move(signalling), &dispatcher_, options_,
      {
          .on_connected =
              [this, &device_id] {
                SetState(session_state::Connected{.device_id = device_id});
              },
          .on_video_channel =
              [this](std::shared_ptr<net::DataChannel> channel) {
                SetVideoChannel(std::move(channel));
              },
      });
  absl::Status status = attempt.Run();
  *connected = attempt.connected();
  return status;
}

void SessionController::SetState(SessionState state) {
  MutexLock lock(&mu_);
  SetStateLocked(std::move(state));
}

void SessionController::SetStateLocked(SessionState state) {
  DLOG(INFO) << "SessionController " << SessionStateToString(state_) << " -> "
             << SessionStateToString(state);
  state_ = std::move(state);
  states_.Publish(state_);
  video_cv_.SignalAll();
}

void SessionController::SetVideoChannel(
    std::shared_ptr<net::DataChannel> channel) {
  MutexLock lock(&mu_);
  StopBridgeLocked();
  video_data_channel_ = std::move(channel);
  if (video_data_channel_ != nullptr && video_source_ != nullptr) {
    StartBridgeLocked();
  }
  video_cv_.SignalAll();
}

void SessionController::StartBridgeLocked() {
  DCHECK(bridge_ == nullptr);
  DCHECK(video_data_channel_ != nullptr);
  DCHECK(video_source_ != nullptr);
  LOG(INFO) << "SessionController streaming video on '"
            << video_data_channel_->label() << "'";
  bridge_ = std::make_unique<VideoStreamBridge>(
      video_source_,
      std::make_shared<VideoChannel>(video_data_channel_, options_.video));
  bridge_->Start();
}

void SessionController::StopBridgeLocked() {
  if (bridge_ == nullptr) {
    return;
  }
  bridge_->Stop();
  bridge_.reset();
}

}  // namespace rctl

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

#ifndef REMOTECTL_SESSION_SESSION_STATE_H_
#define REMOTECTL_SESSION_SESSION_STATE_H_

#include <string>
#include <variant>

namespace rctl {

namespace session_state {

struct Disconnected {
  bool operator==(const Disconnected&) const = default;
};

struct Connecting {
  bool operator==(const Connecting&) const = default;
};

struct Connected {
  std::string device_id;

  bool operator==(const Connected&) const = default;
};

// `attempt` counts from 1 and never exceeds `max_attempts`.
struct Reconnecting {
  int attempt = 1;
  int max_attempts = 0;

  bool operator==(const Reconnecting&) const = default;
};

// Terminal until the next Connect().
struct Error {
  std::string message;

  bool operator==(const Error&) const = default;
};

}  // namespace session_state

using SessionState =
    std::variant<session_state::Disconnected, session_state::Connecting,
                 session_state::Connected, session_state::Reconnecting,
                 session_state::Error>;

// True for Disconnected and Error.
bool CanConnect(const SessionState& state);

bool IsConnected(const SessionState& state);

// E.g. "Disconnected", "Connected(pixel-7)", "Reconnecting(2/5)",
// "Error(Connection failed)".
std::string SessionStateToString(const SessionState& state);

}  // namespace rctl

#endif  // REMOTECTL_SESSION_SESSION_STATE_H_

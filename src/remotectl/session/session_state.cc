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

#include "remotectl/session/session_state.h"

#include <absl/strings/str_cat.h>

#include "remotectl/util/overloaded.h"

namespace rctl {

bool CanConnect(const SessionState& state) {
  return std::holds_alternative<session_state::Disconnected>(state) ||
         std::holds_alternative<session_state::Error>(state);
}

bool IsConnected(const SessionState& state) {
  return std::holds_alternative<session_state::Connected>(state);
}

std::string SessionStateToString(const SessionState& state) {
  return std::visit(
      util::Overloaded{
          [](const session_state::Disconnected&) -> std::string {
            return "Disconnected";
          },
          [](const session_state::Connecting&) -> std::string {
            return "Connecting";
          },
          [](const session_state::Connected& s) {
            return absl::StrCat("Connected(", s.device_id, ")");
          },
          [](const session_state::Reconnecting& s) {
            return absl::StrCat("Reconnecting(", s.attempt, "/",
                                s.max_attempts, ")");
          },
          [](const session_state::Error& s) {
            return absl::StrCat("Error(", s.message, ")");
          },
      },
      state);
}

}  // namespace rctl

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

#ifndef REMOTECTL_SESSION_COMMAND_DISPATCHER_H_
#define REMOTECTL_SESSION_COMMAND_DISPATCHER_H_

#include "remotectl/protocol/commands.h"
#include "remotectl/session/handlers.h"

namespace rctl {

/**
 * Routes each command to exactly one handler and folds the result into the
 * acknowledgment sent back to the controller.
 *
 * Touch and key commands go to the input handler, `TYPE_TEXT` to the text
 * input handler and device management commands to the MDM handler. A command
 * whose handler is missing is acknowledged as unsupported.
 */
class CommandDispatcher {
 public:
  explicit CommandDispatcher(CommandHandlers handlers) : handlers_(handlers) {}

  CommandAck Dispatch(const CommandEnvelope& envelope) const;

 private:
  CommandHandlers handlers_;
};

}  // namespace rctl

#endif  // REMOTECTL_SESSION_COMMAND_DISPATCHER_H_

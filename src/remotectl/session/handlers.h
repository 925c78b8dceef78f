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

#ifndef REMOTECTL_SESSION_HANDLERS_H_
#define REMOTECTL_SESSION_HANDLERS_H_

#include <optional>
#include <string>
#include <utility>

#include "remotectl/protocol/commands.h"

namespace rctl {

/**
 * The outcome of one command, folded into a `CommandAck` by the dispatcher.
 */
struct CommandResult {
  static CommandResult Success(
      std::optional<std::string> message = std::nullopt,
      std::optional<CommandResponseData> data = std::nullopt) {
    return {.success = true,
            .message = std::move(message),
            .data = std::move(data)};
  }

  static CommandResult Failure(std::string message) {
    return {.success = false, .message = std::move(message)};
  }

  bool success = false;
  std::optional<std::string> message;
  std::optional<CommandResponseData> data;
};

/**
 * Injects touch and key events on the device.
 *
 * Handlers are called from the session's command fiber, one command at a
 * time. They may block that fiber for the duration of a gesture. A handler
 * that throws `std::exception` produces a failed ack carrying `what()`.
 */
class InputHandler {
 public:
  virtual ~InputHandler() = default;

  virtual CommandResult Handle(const Tap& command) = 0;
  virtual CommandResult Handle(const Swipe& command) = 0;
  virtual CommandResult Handle(const LongPress& command) = 0;
  virtual CommandResult Handle(const KeyPress& command) = 0;
  virtual CommandResult Handle(const Pinch& command) = 0;
  virtual CommandResult Handle(const Scroll& command) = 0;
  virtual CommandResult Handle(const MultiTap& command) = 0;
};

class TextInputHandler {
 public:
  virtual ~TextInputHandler() = default;

  virtual CommandResult Handle(const TypeText& command) = 0;
};

// Device management. Only available on enrolled devices.
class MdmHandler {
 public:
  virtual ~MdmHandler() = default;

  virtual CommandResult Handle(const GetDeviceInfo& command) = 0;
  virtual CommandResult Handle(const LockDevice& command) = 0;
  virtual CommandResult Handle(const RebootDevice& command) = 0;
  virtual CommandResult Handle(const WipeDevice& command) = 0;
  virtual CommandResult Handle(const ListApps& command) = 0;
  virtual CommandResult Handle(const InstallApp& command) = 0;
  virtual CommandResult Handle(const UninstallApp& command) = 0;
};

// Handlers are not owned and must outlive the dispatcher. Any of them may be
// null, in which case its commands are acknowledged as unsupported.
struct CommandHandlers {
  InputHandler* input = nullptr;
  TextInputHandler* text_input = nullptr;
  MdmHandler* mdm = nullptr;
};

}  // namespace rctl

#endif  // REMOTECTL_SESSION_HANDLERS_H_

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

#include "remotectl/session/command_dispatcher.h"

#include <exception>
#include <string>
#include <utility>
#include <variant>

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>

#include "remotectl/util/overloaded.h"
#include "remotectl/util/time.h"

namespace rctl {

namespace {

template <typename Command>
concept InputCommand = requires(InputHandler& handler, const Command& command) {
  handler.Handle(command);
};

template <typename Command>
concept MdmCommand = requires(MdmHandler& handler, const Command& command) {
  handler.Handle(command);
};

template <typename Handler, typename Command>
CommandResult Invoke(Handler* handler, const Command& command) {
  if (handler == nullptr) {
    return CommandResult::Failure(
        absl::StrCat(Command::kType, " is not supported on this device"));
  }
  try {
    return handler->Handle(command);
  } catch (const std::exception& e) {
    LOG(WARNING) << "CommandDispatcher " << Command::kType
                 << " handler threw: " << e.what();
    return CommandResult::Failure(e.what());
  }
}

}  // namespace

CommandAck CommandDispatcher::Dispatch(const CommandEnvelope& envelope) const {
  CommandResult result = std::visit(
      util::Overloaded{
          [this](const InputCommand auto& command) {
            return Invoke(handlers_.input, command);
          },
          [this](const TypeText& command) {
            return Invoke(handlers_.text_input, command);
          },
          [this](const MdmCommand auto& command) {
            return Invoke(handlers_.mdm, command);
          },
      },
      envelope.command);

  DLOG(INFO) << "CommandDispatcher " << CommandType(envelope.command) << " "
             << envelope.id << (result.success ? " succeeded" : " failed");

  return CommandAck{
      .command_id = envelope.id,
      .success = result.success,
      .error_message = std::move(result.message),
      .data = std::move(result.data),
      .timestamp_ms = NowUnixMillis(),
  };
}

}  // namespace rctl

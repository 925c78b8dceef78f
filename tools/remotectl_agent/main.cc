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

#include <sys/utsname.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/debugging/failure_signal_handler.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

#include "remotectl/net/webrtc/libdatachannel.h"
#include "remotectl/net/webrtc/rtc_config.h"
#include "remotectl/protocol/commands.h"
#include "remotectl/session/handlers.h"
#include "remotectl/session/session_controller.h"
#include "remotectl/session/session_state.h"
#include "remotectl/util/random.h"

ABSL_FLAG(std::string, server_url, "ws://localhost:8080/ws",
          "Signalling server URL (ws:// or wss://).");

ABSL_FLAG(std::string, device_id, "",
          "Identifier this device joins the signalling server with.");

ABSL_FLAG(std::string, token, "",
          "Authentication token, sent as the `token` query parameter.");

ABSL_FLAG(int, max_reconnect_attempts, 5,
          "Reconnection attempts after a connected session is lost.");

ABSL_FLAG(absl::Duration, initial_reconnect_delay, absl::Seconds(1),
          "Delay before the first reconnection attempt. Doubles with every "
          "further attempt.");

ABSL_FLAG(absl::Duration, data_channel_timeout, absl::Seconds(10),
          "How long to wait for the controller's data channel once the "
          "transport is connected.");

ABSL_FLAG(std::vector<std::string>, stun_servers,
          std::vector<std::string>({"stun:stun.l.google.com:19302",
                                    "stun:stun1.l.google.com:19302"}),
          "Comma-separated STUN server URLs.");

ABSL_FLAG(
    std::vector<rctl::net::TurnServer>, turn_servers, {},
    "List of TURN servers to use for WebRTC connections. Format: "
    "username1:password1@hostname1:port1,username2:password2@hostname2:port2");

namespace {

// Acknowledges input commands without injecting them.
class LoggingInputHandler final : public rctl::InputHandler {
 public:
  rctl::CommandResult Handle(const rctl::Tap& command) override {
    LOG(INFO) << "TAP at " << command.x << "," << command.y;
    return rctl::CommandResult::Success();
  }
  rctl::CommandResult Handle(const rctl::Swipe& command) override {
    LOG(INFO) << "SWIPE " << command.start_x << "," << command.start_y
              << " -> " << command.end_x << "," << command.end_y << " in "
              << command.duration_ms << "ms";
    return rctl::CommandResult::Success();
  }
  rctl::CommandResult Handle(const rctl::LongPress& command) override {
    LOG(INFO) << "LONG_PRESS at " << command.x << "," << command.y << " for "
              << command.duration_ms << "ms";
    return rctl::CommandResult::Success();
  }
  rctl::CommandResult Handle(const rctl::KeyPress& command) override {
    LOG(INFO) << "KEY_PRESS " << command.key_code;
    return rctl::CommandResult::Success();
  }
  rctl::CommandResult Handle(const rctl::Pinch& command) override {
    LOG(INFO) << "PINCH at " << command.center_x << "," << command.center_y
              << " scale " << command.scale;
    return rctl::CommandResult::Success();
  }
  rctl::CommandResult Handle(const rctl::Scroll& command) override {
    LOG(INFO) << "SCROLL at " << command.x << "," << command.y << " by "
              << command.delta_x << "," << command.delta_y;
    return rctl::CommandResult::Success();
  }
  rctl::CommandResult Handle(const rctl::MultiTap& command) override {
    LOG(INFO) << "MULTI_TAP x" << command.count << " at " << command.x << ","
              << command.y;
    return rctl::CommandResult::Success();
  }
};

class LoggingTextInputHandler final : public rctl::TextInputHandler {
 public:
  rctl::CommandResult Handle(const rctl::TypeText& command) override {
    LOG(INFO) << "TYPE_TEXT of " << command.text.size() << " characters";
    return rctl::CommandResult::Success();
  }
};

// Reports what the host can tell about itself and refuses every command
// that would change the device.
class HostMdmHandler final : public rctl::MdmHandler {
 public:
  explicit HostMdmHandler(std::string device_name)
      : device_name_(std::move(device_name)) {}

  rctl::CommandResult Handle(const rctl::GetDeviceInfo&) override {
    rctl::DeviceInfo info;
    info.device_name = device_name_;
    if (utsname host{}; uname(&host) == 0) {
      info.model = host.machine;
      info.manufacturer = host.sysname;
      info.android_version = host.release;
    }
    return rctl::CommandResult::Success(std::nullopt, std::move(info));
  }
  rctl::CommandResult Handle(const rctl::LockDevice&) override {
    return Refuse(rctl::LockDevice::kType);
  }
  rctl::CommandResult Handle(const rctl::RebootDevice&) override {
    return Refuse(rctl::RebootDevice::kType);
  }
  rctl::CommandResult Handle(const rctl::WipeDevice&) override {
    return Refuse(rctl::WipeDevice::kType);
  }
  rctl::CommandResult Handle(const rctl::ListApps&) override {
    return rctl::CommandResult::Success(std::nullopt, rctl::AppList{});
  }
  rctl::CommandResult Handle(const rctl::InstallApp&) override {
    return Refuse(rctl::InstallApp::kType);
  }
  rctl::CommandResult Handle(const rctl::UninstallApp&) override {
    return Refuse(rctl::UninstallApp::kType);
  }

 private:
  static rctl::CommandResult Refuse(std::string_view type) {
    return rctl::CommandResult::Failure(
        absl::StrCat(type, " is disabled on this agent"));
  }

  const std::string device_name_;
};

}  // namespace

int main(int argc, char** argv) {
  absl::InstallFailureSignalHandler({});
  absl::ParseCommandLine(argc, argv);
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  absl::InitializeLog();

  std::string device_id = absl::GetFlag(FLAGS_device_id);
  if (device_id.empty()) {
    device_id = rctl::GenerateUUID4();
    LOG(INFO) << "No --device_id given, using " << device_id;
  }

  rctl::SessionOptions options;
  options.max_reconnect_attempts = absl::GetFlag(FLAGS_max_reconnect_attempts);
  options.initial_reconnect_delay =
      absl::GetFlag(FLAGS_initial_reconnect_delay);
  options.data_channel_timeout = absl::GetFlag(FLAGS_data_channel_timeout);
  options.rtc.stun_servers = absl::GetFlag(FLAGS_stun_servers);
  options.rtc.turn_servers = absl::GetFlag(FLAGS_turn_servers);

  LoggingInputHandler input;
  LoggingTextInputHandler text_input;
  HostMdmHandler mdm(device_id);

  rctl::net::LibdatachannelPeerConnectionFactory factory;
  rctl::SessionController controller(
      &factory, rctl::MakeSignallingConnector(),
      {.input = &input, .text_input = &text_input, .mdm = &mdm},
      std::move(options));

  const std::unique_ptr<rctl::Subscription<rctl::SessionState>> states =
      controller.SubscribeToState();
  if (const absl::Status status =
          controller.Connect(absl::GetFlag(FLAGS_server_url),
                             absl::GetFlag(FLAGS_token), device_id);
      !status.ok()) {
    LOG(ERROR) << "Failed to start the session: " << status;
    return 1;
  }

  rctl::SessionState state;
  while (states->Read(&state)) {
    LOG(INFO) << "Session " << rctl::SessionStateToString(state);
    if (std::holds_alternative<rctl::session_state::Error>(state)) {
      controller.Disconnect();
      return 1;
    }
  }
  return 0;
}

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

#ifndef REMOTECTL_PROTOCOL_COMMANDS_H_
#define REMOTECTL_PROTOCOL_COMMANDS_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <boost/json/object.hpp>

/**
 * @file
 * The command protocol carried as JSON text over the "commands" data channel.
 *
 * A controller sends `CommandEnvelope`s:
 *
 *   {"id":"...","command":{"type":"TAP","x":0.5,"y":0.5},"timestamp":...}
 *
 * and the device answers each with a `CommandAck` correlated by id:
 *
 *   {"commandId":"...","success":true,"errorMessage":null,"data":null,
 *    "timestamp":...}
 *
 * Coordinates are normalized to [0, 1] relative to the target surface. The
 * `type` tags are part of the wire format and must not change. Decoding
 * ignores unknown fields; fields with defaults may be omitted.
 */
namespace rctl {

struct Tap {
  static constexpr std::string_view kType = "TAP";
  double x = 0;
  double y = 0;
  bool operator==(const Tap& other) const = default;
};

struct Swipe {
  static constexpr std::string_view kType = "SWIPE";
  double start_x = 0;
  double start_y = 0;
  double end_x = 0;
  double end_y = 0;
  int64_t duration_ms = 300;
  bool operator==(const Swipe& other) const = default;
};

struct LongPress {
  static constexpr std::string_view kType = "LONG_PRESS";
  double x = 0;
  double y = 0;
  int64_t duration_ms = 500;
  bool operator==(const LongPress& other) const = default;
};

struct KeyPress {
  static constexpr std::string_view kType = "KEY_PRESS";
  int key_code = 0;
  bool operator==(const KeyPress& other) const = default;
};

struct TypeText {
  static constexpr std::string_view kType = "TYPE_TEXT";
  std::string text;
  bool operator==(const TypeText& other) const = default;
};

struct Pinch {
  static constexpr std::string_view kType = "PINCH";
  double center_x = 0;
  double center_y = 0;
  double scale = 1;
  int64_t duration_ms = 300;
  bool operator==(const Pinch& other) const = default;
};

struct Scroll {
  static constexpr std::string_view kType = "SCROLL";
  double x = 0;
  double y = 0;
  double delta_x = 0;
  double delta_y = 0;
  bool operator==(const Scroll& other) const = default;
};

struct MultiTap {
  static constexpr std::string_view kType = "MULTI_TAP";
  double x = 0;
  double y = 0;
  int count = 3;
  int64_t interval_ms = 100;
  bool operator==(const MultiTap& other) const = default;
};

struct GetDeviceInfo {
  static constexpr std::string_view kType = "GET_DEVICE_INFO";
  bool operator==(const GetDeviceInfo& other) const = default;
};

struct LockDevice {
  static constexpr std::string_view kType = "LOCK_DEVICE";
  bool operator==(const LockDevice& other) const = default;
};

struct RebootDevice {
  static constexpr std::string_view kType = "REBOOT_DEVICE";
  bool operator==(const RebootDevice& other) const = default;
};

struct WipeDevice {
  static constexpr std::string_view kType = "WIPE_DEVICE";
  bool wipe_external_storage = false;
  bool operator==(const WipeDevice& other) const = default;
};

struct ListApps {
  static constexpr std::string_view kType = "LIST_APPS";
  bool include_system_apps = false;
  bool operator==(const ListApps& other) const = default;
};

struct InstallApp {
  static constexpr std::string_view kType = "INSTALL_APP";
  std::string package_name;
  std::string apk_url;
  bool operator==(const InstallApp& other) const = default;
};

struct UninstallApp {
  static constexpr std::string_view kType = "UNINSTALL_APP";
  std::string package_name;
  bool operator==(const UninstallApp& other) const = default;
};

using RemoteCommand =
    std::variant<Tap, Swipe, LongPress, KeyPress, TypeText, Pinch, Scroll,
                 MultiTap, GetDeviceInfo, LockDevice, RebootDevice, WipeDevice,
                 ListApps, InstallApp, UninstallApp>;

// The wire tag of the active alternative, e.g. "TAP".
std::string_view CommandType(const RemoteCommand& command);

struct CommandEnvelope {
  std::string id;
  RemoteCommand command;
  int64_t timestamp_ms = 0;

  bool operator==(const CommandEnvelope& other) const = default;
};

// Wraps `command` with a fresh UUIDv4 id and the current time.
CommandEnvelope MakeEnvelope(RemoteCommand command);

struct DeviceInfo {
  static constexpr std::string_view kType = "DEVICE_INFO";
  std::string device_name;
  std::string model;
  std::string manufacturer;
  std::string android_version;
  int sdk_version = 0;
  int battery_level = 0;
  bool is_charging = false;
  bool wifi_connected = false;
  int64_t free_storage_bytes = 0;
  int64_t total_storage_bytes = 0;
  bool is_device_owner = false;
  bool is_device_admin = false;
  bool operator==(const DeviceInfo& other) const = default;
};

struct AppInfo {
  std::string package_name;
  std::string app_name;
  std::optional<std::string> version_name;
  int64_t version_code = 0;
  bool is_system_app = false;
  bool operator==(const AppInfo& other) const = default;
};

struct AppList {
  static constexpr std::string_view kType = "APP_LIST";
  std::vector<AppInfo> apps;
  bool operator==(const AppList& other) const = default;
};

using CommandResponseData = std::variant<DeviceInfo, AppList>;

struct CommandAck {
  std::string command_id;
  bool success = false;
  std::optional<std::string> error_message;
  std::optional<CommandResponseData> data;
  int64_t timestamp_ms = 0;

  bool operator==(const CommandAck& other) const = default;
};

boost::json::object CommandToJson(const RemoteCommand& command);
absl::StatusOr<RemoteCommand> CommandFromJson(const boost::json::object& json);

boost::json::object ResponseDataToJson(const CommandResponseData& data);
absl::StatusOr<CommandResponseData> ResponseDataFromJson(
    const boost::json::object& json);

std::string SerializeEnvelope(const CommandEnvelope& envelope);
// A missing timestamp decodes as the current time.
absl::StatusOr<CommandEnvelope> ParseEnvelope(std::string_view text);

std::string SerializeAck(const CommandAck& ack);
// A missing timestamp decodes as the current time. Data of an unknown type
// is dropped and the ack decodes with no data.
absl::StatusOr<CommandAck> ParseAck(std::string_view text);

}  // namespace rctl

#endif  // REMOTECTL_PROTOCOL_COMMANDS_H_

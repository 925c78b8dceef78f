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

#include "remotectl/protocol/commands.h"

#include <utility>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/str_format.h>
#include <boost/json/array.hpp>
#include <boost/json/value.hpp>

#include "remotectl/util/json.h"
#include "remotectl/util/overloaded.h"
#include "remotectl/util/random.h"
#include "remotectl/util/status_macros.h"
#include "remotectl/util/time.h"

namespace rctl {

namespace {

using boost::json::object;

object Tagged(std::string_view type) {
  object json;
  json["type"] = type;
  return json;
}

template <typename T>
absl::StatusOr<RemoteCommand> DecodeCommand(const object& json);

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<Tap>(const object& json) {
  Tap tap;
  ASSIGN_OR_RETURN(tap.x, util::GetDouble(json, "x"));
  ASSIGN_OR_RETURN(tap.y, util::GetDouble(json, "y"));
  return tap;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<Swipe>(const object& json) {
  Swipe swipe;
  ASSIGN_OR_RETURN(swipe.start_x, util::GetDouble(json, "startX"));
  ASSIGN_OR_RETURN(swipe.start_y, util::GetDouble(json, "startY"));
  ASSIGN_OR_RETURN(swipe.end_x, util::GetDouble(json, "endX"));
  ASSIGN_OR_RETURN(swipe.end_y, util::GetDouble(json, "endY"));
  ASSIGN_OR_RETURN(swipe.duration_ms,
                   util::GetInt64Or(json, "durationMs", swipe.duration_ms));
  return swipe;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<LongPress>(const object& json) {
  LongPress press;
  ASSIGN_OR_RETURN(press.x, util::GetDouble(json, "x"));
  ASSIGN_OR_RETURN(press.y, util::GetDouble(json, "y"));
  ASSIGN_OR_RETURN(press.duration_ms,
                   util::GetInt64Or(json, "durationMs", press.duration_ms));
  return press;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<KeyPress>(const object& json) {
  ASSIGN_OR_RETURN(const int key_code, util::GetInt(json, "keyCode"));
  return KeyPress{.key_code = key_code};
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<TypeText>(const object& json) {
  ASSIGN_OR_RETURN(std::string text, util::GetString(json, "text"));
  return TypeText{.text = std::move(text)};
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<Pinch>(const object& json) {
  Pinch pinch;
  ASSIGN_OR_RETURN(pinch.center_x, util::GetDouble(json, "centerX"));
  ASSIGN_OR_RETURN(pinch.center_y, util::GetDouble(json, "centerY"));
  ASSIGN_OR_RETURN(pinch.scale, util::GetDouble(json, "scale"));
  ASSIGN_OR_RETURN(pinch.duration_ms,
                   util::GetInt64Or(json, "durationMs", pinch.duration_ms));
  return pinch;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<Scroll>(const object& json) {
  Scroll scroll;
  ASSIGN_OR_RETURN(scroll.x, util::GetDouble(json, "x"));
  ASSIGN_OR_RETURN(scroll.y, util::GetDouble(json, "y"));
  ASSIGN_OR_RETURN(scroll.delta_x, util::GetDouble(json, "deltaX"));
  ASSIGN_OR_RETURN(scroll.delta_y, util::GetDouble(json, "deltaY"));
  return scroll;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<MultiTap>(const object& json) {
  MultiTap tap;
  ASSIGN_OR_RETURN(tap.x, util::GetDouble(json, "x"));
  ASSIGN_OR_RETURN(tap.y, util::GetDouble(json, "y"));
  ASSIGN_OR_RETURN(tap.count, util::GetIntOr(json, "count", tap.count));
  ASSIGN_OR_RETURN(tap.interval_ms,
                   util::GetInt64Or(json, "intervalMs", tap.interval_ms));
  return tap;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<GetDeviceInfo>(const object&) {
  return GetDeviceInfo{};
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<LockDevice>(const object&) {
  return LockDevice{};
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<RebootDevice>(const object&) {
  return RebootDevice{};
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<WipeDevice>(const object& json) {
  WipeDevice wipe;
  ASSIGN_OR_RETURN(wipe.wipe_external_storage,
                   util::GetBoolOr(json, "wipeExternalStorage", false));
  return wipe;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<ListApps>(const object& json) {
  ListApps list;
  ASSIGN_OR_RETURN(list.include_system_apps,
                   util::GetBoolOr(json, "includeSystemApps", false));
  return list;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<InstallApp>(const object& json) {
  InstallApp install;
  ASSIGN_OR_RETURN(install.package_name, util::GetString(json, "packageName"));
  ASSIGN_OR_RETURN(install.apk_url, util::GetString(json, "apkUrl"));
  return install;
}

template <>
absl::StatusOr<RemoteCommand> DecodeCommand<UninstallApp>(const object& json) {
  ASSIGN_OR_RETURN(std::string package_name,
                   util::GetString(json, "packageName"));
  return UninstallApp{.package_name = std::move(package_name)};
}

template <size_t I = 0>
absl::StatusOr<RemoteCommand> DecodeCommandOfType(std::string_view type,
                                                  const object& json) {
  if constexpr (I == std::variant_size_v<RemoteCommand>) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Unknown command type: '%s'", type));
  } else {
    using Alternative = std::variant_alternative_t<I, RemoteCommand>;
    if (type == Alternative::kType) {
      return DecodeCommand<Alternative>(json);
    }
    return DecodeCommandOfType<I + 1>(type, json);
  }
}

absl::StatusOr<AppInfo> AppInfoFromJson(const boost::json::value& value) {
  ASSIGN_OR_RETURN(const object* json, util::AsObject(value));
  AppInfo app;
  ASSIGN_OR_RETURN(app.package_name, util::GetString(*json, "packageName"));
  ASSIGN_OR_RETURN(app.app_name, util::GetString(*json, "appName"));
  ASSIGN_OR_RETURN(app.version_name,
                   util::GetOptionalString(*json, "versionName"));
  ASSIGN_OR_RETURN(app.version_code, util::GetInt64(*json, "versionCode"));
  ASSIGN_OR_RETURN(app.is_system_app, util::GetBool(*json, "isSystemApp"));
  return app;
}

boost::json::value OptionalString(const std::optional<std::string>& value) {
  if (!value) {
    return nullptr;
  }
  return boost::json::value(*value);
}

}  // namespace

std::string_view CommandType(const RemoteCommand& command) {
  return std::visit(
      [](const auto& alternative) -> std::string_view {
        return std::decay_t<decltype(alternative)>::kType;
      },
      command);
}

CommandEnvelope MakeEnvelope(RemoteCommand command) {
  return CommandEnvelope{
      .id = GenerateUUID4(),
      .command = std::move(command),
      .timestamp_ms = NowUnixMillis(),
  };
}

object CommandToJson(const RemoteCommand& command) {
  return std::visit(
      util::Overloaded{
          [](const Tap& tap) {
            object json = Tagged(Tap::kType);
            json["x"] = tap.x;
            json["y"] = tap.y;
            return json;
          },
          [](const Swipe& swipe) {
            object json = Tagged(Swipe::kType);
            json["startX"] = swipe.start_x;
            json["startY"] = swipe.start_y;
            json["endX"] = swipe.end_x;
            json["endY"] = swipe.end_y;
            json["durationMs"] = swipe.duration_ms;
            return json;
          },
          [](const LongPress& press) {
            object json = Tagged(LongPress::kType);
            json["x"] = press.x;
            json["y"] = press.y;
            json["durationMs"] = press.duration_ms;
            return json;
          },
          [](const KeyPress& press) {
            object json = Tagged(KeyPress::kType);
            json["keyCode"] = press.key_code;
            return json;
          },
          [](const TypeText& type_text) {
            object json = Tagged(TypeText::kType);
            json["text"] = type_text.text;
            return json;
          },
          [](const Pinch& pinch) {
            object json = Tagged(Pinch::kType);
            json["centerX"] = pinch.center_x;
            json["centerY"] = pinch.center_y;
            json["scale"] = pinch.scale;
            json["durationMs"] = pinch.duration_ms;
            return json;
          },
          [](const Scroll& scroll) {
            object json = Tagged(Scroll::kType);
            json["x"] = scroll.x;
            json["y"] = scroll.y;
            json["deltaX"] = scroll.delta_x;
            json["deltaY"] = scroll.delta_y;
            return json;
          },
          [](const MultiTap& tap) {
            object json = Tagged(MultiTap::kType);
            json["x"] = tap.x;
            json["y"] = tap.y;
            json["count"] = tap.count;
            json["intervalMs"] = tap.interval_ms;
            return json;
          },
          [](const GetDeviceInfo&) { return Tagged(GetDeviceInfo::kType); },
          [](const LockDevice&) { return Tagged(LockDevice::kType); },
          [](const RebootDevice&) { return Tagged(RebootDevice::kType); },
          [](const WipeDevice& wipe) {
            object json = Tagged(WipeDevice::kType);
            json["wipeExternalStorage"] = wipe.wipe_external_storage;
            return json;
          },
          [](const ListApps& list) {
            object json = Tagged(ListApps::kType);
            json["includeSystemApps"] = list.include_system_apps;
            return json;
          },
          [](const InstallApp& install) {
            object json = Tagged(InstallApp::kType);
            json["packageName"] = install.package_name;
            json["apkUrl"] = install.apk_url;
            return json;
          },
          [](const UninstallApp& uninstall) {
            object json = Tagged(UninstallApp::kType);
            json["packageName"] = uninstall.package_name;
            return json;
          },
      },
      command);
}

absl::StatusOr<RemoteCommand> CommandFromJson(const object& json) {
  ASSIGN_OR_RETURN(const std::string type, util::GetString(json, "type"));
  return DecodeCommandOfType(type, json);
}

object ResponseDataToJson(const CommandResponseData& data) {
  return std::visit(
      util::Overloaded{
          [](const DeviceInfo& info) {
            object json = Tagged(DeviceInfo::kType);
            json["deviceName"] = info.device_name;
            json["model"] = info.model;
            json["manufacturer"] = info.manufacturer;
            json["androidVersion"] = info.android_version;
            json["sdkVersion"] = info.sdk_version;
            json["batteryLevel"] = info.battery_level;
            json["isCharging"] = info.is_charging;
            json["wifiConnected"] = info.wifi_connected;
            json["freeStorageBytes"] = info.free_storage_bytes;
            json["totalStorageBytes"] = info.total_storage_bytes;
            json["isDeviceOwner"] = info.is_device_owner;
            json["isDeviceAdmin"] = info.is_device_admin;
            return json;
          },
          [](const AppList& list) {
            object json = Tagged(AppList::kType);
            boost::json::array apps;
            for (const AppInfo& app : list.apps) {
              object app_json;
              app_json["packageName"] = app.package_name;
              app_json["appName"] = app.app_name;
              app_json["versionName"] = OptionalString(app.version_name);
              app_json["versionCode"] = app.version_code;
              app_json["isSystemApp"] = app.is_system_app;
              apps.emplace_back(std::move(app_json));
            }
            json["apps"] = std::move(apps);
            return json;
          },
      },
      data);
}

absl::StatusOr<CommandResponseData> ResponseDataFromJson(const object& json) {
  ASSIGN_OR_RETURN(const std::string type, util::GetString(json, "type"));

  if (type == DeviceInfo::kType) {
    DeviceInfo info;
    ASSIGN_OR_RETURN(info.device_name, util::GetString(json, "deviceName"));
    ASSIGN_OR_RETURN(info.model, util::GetString(json, "model"));
    ASSIGN_OR_RETURN(info.manufacturer, util::GetString(json, "manufacturer"));
    ASSIGN_OR_RETURN(info.android_version,
                     util::GetString(json, "androidVersion"));
    ASSIGN_OR_RETURN(info.sdk_version, util::GetInt(json, "sdkVersion"));
    ASSIGN_OR_RETURN(info.battery_level, util::GetInt(json, "batteryLevel"));
    ASSIGN_OR_RETURN(info.is_charging, util::GetBool(json, "isCharging"));
    ASSIGN_OR_RETURN(info.wifi_connected,
                     util::GetBool(json, "wifiConnected"));
    ASSIGN_OR_RETURN(info.free_storage_bytes,
                     util::GetInt64(json, "freeStorageBytes"));
    ASSIGN_OR_RETURN(info.total_storage_bytes,
                     util::GetInt64(json, "totalStorageBytes"));
    ASSIGN_OR_RETURN(info.is_device_owner,
                     util::GetBool(json, "isDeviceOwner"));
    ASSIGN_OR_RETURN(info.is_device_admin,
                     util::GetBool(json, "isDeviceAdmin"));
    return info;
  }

  if (type == AppList::kType) {
    const boost::json::value* apps = json.if_contains("apps");
    if (apps == nullptr || !apps->is_array()) {
      return absl::InvalidArgumentError("APP_LIST has no 'apps' array");
    }
    AppList list;
    for (const boost::json::value& app_json : apps->get_array()) {
      ASSIGN_OR_RETURN(AppInfo app, AppInfoFromJson(app_json));
      list.apps.push_back(std::move(app));
    }
    return list;
  }

  return absl::InvalidArgumentError(
      absl::StrFormat("Unknown response data type: '%s'", type));
}

std::string SerializeEnvelope(const CommandEnvelope& envelope) {
  object json;
  json["id"] = envelope.id;
  json["command"] = CommandToJson(envelope.command);
  json["timestamp"] = envelope.timestamp_ms;
  return util::SerializeJson(std::move(json));
}

absl::StatusOr<CommandEnvelope> ParseEnvelope(std::string_view text) {
  ASSIGN_OR_RETURN(const boost::json::value value, util::ParseJson(text));
  ASSIGN_OR_RETURN(const object* json, util::AsObject(value));

  CommandEnvelope envelope;
  ASSIGN_OR_RETURN(envelope.id, util::GetString(*json, "id"));
  const boost::json::value* command = json->if_contains("command");
  if (command == nullptr) {
    return absl::InvalidArgumentError("Envelope has no 'command' field");
  }
  ASSIGN_OR_RETURN(const object* command_json, util::AsObject(*command));
  ASSIGN_OR_RETURN(envelope.command, CommandFromJson(*command_json));
  ASSIGN_OR_RETURN(envelope.timestamp_ms,
                   util::GetInt64Or(*json, "timestamp", NowUnixMillis()));
  return envelope;
}

std::string SerializeAck(const CommandAck& ack) {
  object json;
  json["commandId"] = ack.command_id;
  json["success"] = ack.success;
  json["errorMessage"] = OptionalString(ack.error_message);
  if (ack.data) {
    json["data"] = ResponseDataToJson(*ack.data);
  } else {
    json["data"] = nullptr;
  }
  json["timestamp"] = ack.timestamp_ms;
  return util::SerializeJson(std::move(json));
}

absl::StatusOr<CommandAck> ParseAck(std::string_view text) {
  ASSIGN_OR_RETURN(const boost::json::value value, util::ParseJson(text));
  ASSIGN_OR_RETURN(const object* json, util::AsObject(value));

  CommandAck ack;
  ASSIGN_OR_RETURN(ack.command_id, util::GetString(*json, "commandId"));
  ASSIGN_OR_RETURN(ack.success, util::GetBool(*json, "success"));
  ASSIGN_OR_RETURN(ack.error_message,
                   util::GetOptionalString(*json, "errorMessage"));
  if (const boost::json::value* data = json->if_contains("data");
      data != nullptr && !data->is_null()) {
    ASSIGN_OR_RETURN(const object* data_json, util::AsObject(*data));
    ASSIGN_OR_RETURN(const std::string type,
                     util::GetString(*data_json, "type"));
    // Newer devices may attach data this build cannot decode. The ack itself
    // is still delivered.
    if (type == DeviceInfo::kType || type == AppList::kType) {
      ASSIGN_OR_RETURN(ack.data, ResponseDataFromJson(*data_json));
    } else {
      LOG(WARNING) << "Ack " << ack.command_id
                   << " carries unknown data type '" << type
                   << "', dropping the data";
    }
  }
  ASSIGN_OR_RETURN(ack.timestamp_ms,
                   util::GetInt64Or(*json, "timestamp", NowUnixMillis()));
  return ack;
}

}  // namespace rctl

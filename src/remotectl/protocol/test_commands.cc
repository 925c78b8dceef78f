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

#include <string>
#include <variant>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <boost/json/value.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "remotectl/protocol/commands.h"
#include "remotectl/util/json.h"
#include "remotectl/util/time.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::AllOf;
using ::testing::Eq;
using ::testing::Field;
using ::testing::Ge;
using ::testing::HasSubstr;
using ::testing::Ne;

boost::json::value Json(const std::string& text) {
  absl::StatusOr<boost::json::value> value = rctl::util::ParseJson(text);
  EXPECT_TRUE(value.ok()) << value.status();
  return value.ok() ? *value : boost::json::value();
}

TEST(CommandsTest, SerializesTapEnvelope) {
  const rctl::CommandEnvelope envelope{
      .id = "a", .command = rctl::Tap{.x = 0.5, .y = 0.5}, .timestamp_ms = 1};
  EXPECT_THAT(
      rctl::SerializeEnvelope(envelope),
      Eq(R"({"id":"a","command":{"type":"TAP","x":0.5,"y":0.5},"timestamp":1})"));
}

TEST(CommandsTest, CommandTypeIsTheWireTag) {
  EXPECT_THAT(rctl::CommandType(rctl::LongPress{}), Eq("LONG_PRESS"));
  EXPECT_THAT(rctl::CommandType(rctl::MultiTap{}), Eq("MULTI_TAP"));
  EXPECT_THAT(rctl::CommandType(rctl::GetDeviceInfo{}), Eq("GET_DEVICE_INFO"));
}

TEST(CommandsTest, MakeEnvelopeAssignsFreshIds) {
  const int64_t before = rctl::NowUnixMillis();
  const rctl::CommandEnvelope first = rctl::MakeEnvelope(rctl::LockDevice{});
  const rctl::CommandEnvelope second = rctl::MakeEnvelope(rctl::LockDevice{});
  EXPECT_THAT(first.id, Ne(second.id));
  EXPECT_THAT(first.id.size(), Eq(36));
  EXPECT_THAT(first.timestamp_ms, Ge(before));
}

TEST(CommandsTest, OmittedFieldsTakeDefaults) {
  absl::StatusOr<rctl::CommandEnvelope> envelope = rctl::ParseEnvelope(
      R"({"id":"s","command":{"type":"SWIPE","startX":0.1,"startY":0.2,
          "endX":0.3,"endY":0.4},"timestamp":5})");
  ASSERT_TRUE(envelope.ok()) << envelope.status();
  EXPECT_THAT(envelope->command,
              Eq(rctl::RemoteCommand(rctl::Swipe{.start_x = 0.1,
                                                 .start_y = 0.2,
                                                 .end_x = 0.3,
                                                 .end_y = 0.4,
                                                 .duration_ms = 300})));

  absl::StatusOr<rctl::RemoteCommand> multi_tap = rctl::CommandFromJson(
      Json(R"({"type":"MULTI_TAP","x":0,"y":1})").get_object());
  EXPECT_THAT(multi_tap,
              IsOkAndHolds(rctl::RemoteCommand(rctl::MultiTap{
                  .x = 0, .y = 1, .count = 3, .interval_ms = 100})));

  absl::StatusOr<rctl::RemoteCommand> wipe = rctl::CommandFromJson(
      Json(R"({"type":"WIPE_DEVICE"})").get_object());
  EXPECT_THAT(wipe, IsOkAndHolds(rctl::RemoteCommand(rctl::WipeDevice{})));
}

TEST(CommandsTest, IgnoresUnknownFields) {
  EXPECT_THAT(
      rctl::ParseEnvelope(
          R"({"id":"k","command":{"type":"KEY_PRESS","keyCode":4,"meta":1},
              "timestamp":9,"priority":"high"})"),
      IsOkAndHolds(rctl::CommandEnvelope{
          .id = "k", .command = rctl::KeyPress{.key_code = 4},
          .timestamp_ms = 9}));
}

TEST(CommandsTest, MissingTimestampIsNow) {
  const int64_t before = rctl::NowUnixMillis();
  absl::StatusOr<rctl::CommandEnvelope> envelope = rctl::ParseEnvelope(
      R"({"id":"t","command":{"type":"TYPE_TEXT","text":"hello"}})");
  ASSERT_TRUE(envelope.ok()) << envelope.status();
  EXPECT_THAT(envelope->timestamp_ms, Ge(before));
  EXPECT_THAT(envelope->command,
              Eq(rctl::RemoteCommand(rctl::TypeText{.text = "hello"})));
}

TEST(CommandsTest, RejectsBadEnvelopes) {
  EXPECT_THAT(rctl::ParseEnvelope(R"({"id":"x","command":{"type":"FLY"}})"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unknown command type")));
  EXPECT_THAT(rctl::ParseEnvelope(R"({"id":"x","command":{"type":"TAP"}})"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("'x'")));
  EXPECT_THAT(rctl::ParseEnvelope(R"({"command":{"type":"LOCK_DEVICE"}})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::ParseEnvelope(R"({"id":"x"})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::ParseEnvelope(R"({"id":"x","command":"TAP"})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(CommandsTest, AckWritesExplicitNulls) {
  const rctl::CommandAck ack{
      .command_id = "a", .success = true, .timestamp_ms = 2};
  EXPECT_THAT(Json(rctl::SerializeAck(ack)),
              Eq(Json(R"({"commandId":"a","success":true,"errorMessage":null,
                          "data":null,"timestamp":2})")));
  EXPECT_THAT(rctl::ParseAck(rctl::SerializeAck(ack)), IsOkAndHolds(ack));
}

TEST(CommandsTest, FailedAckCarriesMessage) {
  EXPECT_THAT(rctl::ParseAck(R"({"commandId":"b","success":false,
                                 "errorMessage":"no handler"})"),
              IsOkAndHolds(AllOf(
                  Field(&rctl::CommandAck::success, false),
                  Field(&rctl::CommandAck::error_message,
                        Eq("no handler")),
                  Field(&rctl::CommandAck::data, Eq(std::nullopt)))));
}

TEST(CommandsTest, AckWithAppList) {
  const rctl::CommandAck ack{
      .command_id = "c",
      .success = true,
      .data = rctl::AppList{.apps = {{.package_name = "com.example.app",
                                      .app_name = "Example",
                                      .version_code = 12},
                                     {.package_name = "com.android.settings",
                                      .app_name = "Settings",
                                      .version_name = "14",
                                      .version_code = 34,
                                      .is_system_app = true}}},
      .timestamp_ms = 3,
  };
  const boost::json::value json = Json(rctl::SerializeAck(ack));
  EXPECT_THAT(json.at("data").at("type"), Eq(boost::json::value("APP_LIST")));
  EXPECT_TRUE(json.at("data").at("apps").at(0).at("versionName").is_null());
  EXPECT_THAT(rctl::ParseAck(rctl::SerializeAck(ack)), IsOkAndHolds(ack));
}

TEST(CommandsTest, AckWithDeviceInfo) {
  absl::StatusOr<rctl::CommandAck> ack = rctl::ParseAck(
      R"({"commandId":"d","success":true,"data":{"type":"DEVICE_INFO",
          "deviceName":"lab-3","model":"x86_64","manufacturer":"Linux",
          "androidVersion":"6.1","sdkVersion":0,"batteryLevel":100,
          "isCharging":false,"wifiConnected":true,"freeStorageBytes":10,
          "totalStorageBytes":20,"isDeviceOwner":false,
          "isDeviceAdmin":false},"timestamp":4})");
  ASSERT_TRUE(ack.ok()) << ack.status();
  ASSERT_TRUE(ack->data.has_value());
  ASSERT_TRUE(std::holds_alternative<rctl::DeviceInfo>(*ack->data));
  EXPECT_THAT(std::get<rctl::DeviceInfo>(*ack->data).device_name,
              Eq("lab-3"));
  EXPECT_THAT(std::get<rctl::DeviceInfo>(*ack->data).total_storage_bytes,
              Eq(20));
}

TEST(CommandsTest, AckWithUnknownDataTypeKeepsTheResult) {
  absl::StatusOr<rctl::CommandAck> ack =
      rctl::ParseAck(R"({"commandId":"e","success":true,
                         "data":{"type":"SCREENSHOT","png":"..."},
                         "timestamp":5})");
  ASSERT_TRUE(ack.ok()) << ack.status();
  EXPECT_THAT(ack->command_id, Eq("e"));
  EXPECT_TRUE(ack->success);
  EXPECT_FALSE(ack->data.has_value());

  EXPECT_THAT(rctl::ResponseDataFromJson(
                  Json(R"({"type":"SCREENSHOT"})").as_object()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Unknown response data type")));
}

TEST(CommandsTest, RejectsMalformedKnownResponseData) {
  EXPECT_THAT(rctl::ParseAck(R"({"commandId":"f","success":true,
                                 "data":{"type":"APP_LIST"}})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(CommandsTest, RejectsIntegersThatDoNotFit) {
  EXPECT_THAT(rctl::ParseEnvelope(
                  R"({"id":"g","command":{"type":"KEY_PRESS","keyCode":1e300}})"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(
      rctl::ParseEnvelope(
          R"({"id":"h","command":{"type":"KEY_PRESS","keyCode":4294967296}})"),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("keyCode")));
  EXPECT_THAT(
      rctl::ParseEnvelope(
          R"({"id":"i","command":{"type":"MULTI_TAP","x":1,"y":1,"count":-3000000000}})"),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("count")));
  EXPECT_THAT(rctl::ParseEnvelope(
                  R"({"id":"j","command":{"type":"TAP","x":1,"y":1},
                      "timestamp":1e300})"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("timestamp")));
}

}  // namespace

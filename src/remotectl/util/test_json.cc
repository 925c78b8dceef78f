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

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/status_matchers.h>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "remotectl/util/json.h"

namespace {

using ::absl_testing::IsOkAndHolds;
using ::absl_testing::StatusIs;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::Optional;

boost::json::object ParseObject(std::string_view text) {
  absl::StatusOr<boost::json::value> value = rctl::util::ParseJson(text);
  EXPECT_TRUE(value.ok()) << value.status();
  return value.ok() && value->is_object() ? value->get_object()
                                          : boost::json::object{};
}

TEST(JsonTest, RejectsMalformedInputAndNonObjects) {
  EXPECT_THAT(rctl::util::ParseJson("{\"type\":"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Malformed JSON")));
  EXPECT_THAT(rctl::util::AsObject(boost::json::value(1)),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(JsonTest, NullCountsAsAbsent) {
  const boost::json::object object =
      ParseObject(R"({"name":null,"count":null})");
  EXPECT_THAT(rctl::util::GetOptionalString(object, "name"),
              IsOkAndHolds(Eq(std::nullopt)));
  EXPECT_THAT(rctl::util::GetInt64Or(object, "count", 7), IsOkAndHolds(7));
  EXPECT_THAT(rctl::util::GetString(object, "name"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Missing required field 'name'")));
}

TEST(JsonTest, TypeMismatchesAreErrors) {
  const boost::json::object object =
      ParseObject(R"({"name":1,"flag":"yes","ratio":"0.5"})");
  EXPECT_THAT(rctl::util::GetString(object, "name"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not a string")));
  EXPECT_THAT(rctl::util::GetBoolOr(object, "flag", false),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::util::GetDouble(object, "ratio"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(JsonTest, IntegersAcceptWholeDoubles) {
  const boost::json::object object =
      ParseObject(R"({"whole":3.0,"fraction":3.5,"big":9007199254740993})");
  EXPECT_THAT(rctl::util::GetInt64(object, "whole"), IsOkAndHolds(3));
  EXPECT_THAT(rctl::util::GetInt64(object, "fraction"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::util::GetOptionalInt64(object, "big"),
              IsOkAndHolds(Optional(int64_t{9007199254740993})));
  EXPECT_THAT(rctl::util::GetDouble(object, "whole"), IsOkAndHolds(3.0));
}

TEST(JsonTest, IntegersOutsideInt64AreRejected) {
  const boost::json::object object = ParseObject(
      R"({"huge":1e300,"tiny":-1e300,"edge":9.223372036854775808e18,
          "lowest":-9.223372036854775808e18,"max":9223372036854775807,
          "unsigned":18446744073709551615})");
  EXPECT_THAT(rctl::util::GetInt64(object, "huge"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not an integer")));
  EXPECT_THAT(rctl::util::GetInt64Or(object, "tiny", 0),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::util::GetInt64(object, "edge"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::util::GetInt64(object, "lowest"),
              IsOkAndHolds(std::numeric_limits<int64_t>::min()));
  EXPECT_THAT(rctl::util::GetInt64(object, "max"),
              IsOkAndHolds(std::numeric_limits<int64_t>::max()));
  EXPECT_THAT(rctl::util::GetOptionalInt64(object, "unsigned"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(JsonTest, IntAccessorsCheckTheRange) {
  const boost::json::object object = ParseObject(
      R"({"small":-7,"large":2147483648,"negative":-2147483649})");
  EXPECT_THAT(rctl::util::GetInt(object, "small"), IsOkAndHolds(-7));
  EXPECT_THAT(rctl::util::GetInt(object, "large"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("out of range")));
  EXPECT_THAT(rctl::util::GetIntOr(object, "negative", 3),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(rctl::util::GetIntOr(object, "absent", 3), IsOkAndHolds(3));
  EXPECT_THAT(rctl::util::GetOptionalInt(object, "absent"),
              IsOkAndHolds(Eq(std::nullopt)));
}

TEST(JsonTest, SerializesDoublesInShortestForm) {
  boost::json::object object;
  object["x"] = 0.5;
  object["y"] = 1.0;
  object["n"] = nullptr;
  object["s"] = "a\"b";
  EXPECT_THAT(rctl::util::SerializeJson(object),
              Eq(R"({"x":0.5,"y":1,"n":null,"s":"a\"b"})"));
}

}  // namespace

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

#include "remotectl/util/json.h"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <system_error>

#include <absl/base/nullability.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/system/error_code.hpp>

#include "remotectl/util/status_macros.h"

namespace rctl::util {

namespace {

const boost::json::value* absl_nullable FindPresent(
    const boost::json::object& object, std::string_view key) {
  const boost::json::value* value = object.if_contains(key);
  if (value == nullptr || value->is_null()) {
    return nullptr;
  }
  return value;
}

absl::Status MissingField(std::string_view key) {
  return absl::InvalidArgumentError(
      absl::StrFormat("Missing required field '%s'", key));
}

absl::Status WrongType(std::string_view key, std::string_view expected) {
  return absl::InvalidArgumentError(
      absl::StrFormat("Field '%s' is not %s", key, expected));
}

absl::StatusOr<double> ToDouble(const boost::json::value& value,
                                std::string_view key) {
  if (value.is_double()) {
    return value.get_double();
  }
  if (value.is_int64()) {
    return static_cast<double>(value.get_int64());
  }
  if (value.is_uint64()) {
    return static_cast<double>(value.get_uint64());
  }
  return WrongType(key, "a number");
}

absl::StatusOr<int64_t> ToInt64(const boost::json::value& value,
                                std::string_view key) {
  if (value.is_int64()) {
    return value.get_int64();
  }
  if (value.is_uint64()) {
    const uint64_t number = value.get_uint64();
    if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return WrongType(key, "an integer");
    }
    return static_cast<int64_t>(number);
  }
  if (value.is_double()) {
    // 2^63 is exact as a double; anything at or above it does not fit.
    constexpr double kTwoPow63 = 9223372036854775808.0;
    const double number = value.get_double();
    if (std::trunc(number) == number && number >= -kTwoPow63 &&
        number < kTwoPow63) {
      return static_cast<int64_t>(number);
    }
  }
  return WrongType(key, "an integer");
}

absl::StatusOr<int> NarrowToInt(int64_t number, std::string_view key) {
  if (number < std::numeric_limits<int>::min() ||
      number > std::numeric_limits<int>::max()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Field '%s' is out of range: %d", key, number));
  }
  return static_cast<int>(number);
}

void AppendDouble(double number, std::string* out) {
  if (!std::isfinite(number)) {
    out->append("null");
    return;
  }
  char buffer[32];
  const std::to_chars_result result =
      std::to_chars(buffer, buffer + sizeof(buffer), number);
  if (result.ec != std::errc()) {
    out->append("null");
    return;
  }
  out->append(buffer, result.ptr);
}

void AppendJson(const boost::json::value& value, std::string* out) {
  switch (value.kind()) {
    case boost::json::kind::null:
      out->append("null");
      return;
    case boost::json::kind::bool_:
      out->append(value.get_bool() ? "true" : "false");
      return;
    case boost::json::kind::int64:
      absl::StrAppend(out, value.get_int64());
      return;
    case boost::json::kind::uint64:
      absl::StrAppend(out, value.get_uint64());
      return;
    case boost::json::kind::double_:
      AppendDouble(value.get_double(), out);
      return;
    case boost::json::kind::string:
      out->append(boost::json::serialize(value.get_string()));
      return;
    case boost::json::kind::array: {
      out->push_back('[');
      bool first = true;
      for (const boost::json::value& element : value.get_array()) {
        if (!first) {
          out->push_back(',');
        }
        first = false;
        AppendJson(element, out);
      }
      out->push_back(']');
      return;
    }
    case boost::json::kind::object: {
      out->push_back('{');
      bool first = true;
      for (const boost::json::key_value_pair& field : value.get_object()) {
        if (!first) {
          out->push_back(',');
        }
        first = false;
        out->append(boost::json::serialize(field.key()));
        out->push_back(':');
        AppendJson(field.value(), out);
      }
      out->push_back('}');
      return;
    }
  }
}

}  // namespace

std::string SerializeJson(const boost::json::value& value) {
  std::string out;
  AppendJson(value, &out);
  return out;
}

absl::StatusOr<boost::json::value> ParseJson(std::string_view text) {
  boost::system::error_code error;
  boost::json::value value = boost::json::parse(text, error);
  if (error) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Malformed JSON: %s", error.message()));
  }
  return value;
}

absl::StatusOr<const boost::json::object*> AsObject(
    const boost::json::value& value) {
  const boost::json::object* object = value.if_object();
  if (object == nullptr) {
    return absl::InvalidArgumentError("JSON value is not an object");
  }
  return object;
}

absl::StatusOr<std::string> GetString(const boost::json::object& object,
                                      std::string_view key) {
  ASSIGN_OR_RETURN(std::optional<std::string> value,
                   GetOptionalString(object, key));
  if (!value) {
    return MissingField(key);
  }
  return *std::move(value);
}

absl::StatusOr<std::optional<std::string>> GetOptionalString(
    const boost::json::object& object, std::string_view key) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    return WrongType(key, "a string");
  }
  return std::string(value->get_string());
}

absl::StatusOr<double> GetDouble(const boost::json::object& object,
                                 std::string_view key) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return MissingField(key);
  }
  return ToDouble(*value, key);
}

absl::StatusOr<double> GetDoubleOr(const boost::json::object& object,
                                   std::string_view key,
                                   double default_value) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return default_value;
  }
  return ToDouble(*value, key);
}

absl::StatusOr<int64_t> GetInt64(const boost::json::object& object,
                                 std::string_view key) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return MissingField(key);
  }
  return ToInt64(*value, key);
}

absl::StatusOr<int64_t> GetInt64Or(const boost::json::object& object,
                                   std::string_view key,
                                   int64_t default_value) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return default_value;
  }
  return ToInt64(*value, key);
}

absl::StatusOr<std::optional<int64_t>> GetOptionalInt64(
    const boost::json::object& object, std::string_view key) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  ASSIGN_OR_RETURN(int64_t number, ToInt64(*value, key));
  return number;
}

absl::StatusOr<int> GetInt(const boost::json::object& object,
                           std::string_view key) {
  ASSIGN_OR_RETURN(const int64_t number, GetInt64(object, key));
  return NarrowToInt(number, key);
}

absl::StatusOr<int> GetIntOr(const boost::json::object& object,
                             std::string_view key, int default_value) {
  ASSIGN_OR_RETURN(const int64_t number,
                   GetInt64Or(object, key, default_value));
  return NarrowToInt(number, key);
}

absl::StatusOr<std::optional<int>> GetOptionalInt(
    const boost::json::object& object, std::string_view key) {
  ASSIGN_OR_RETURN(const std::optional<int64_t> number,
                   GetOptionalInt64(object, key));
  if (!number) {
    return std::nullopt;
  }
  ASSIGN_OR_RETURN(const int narrowed, NarrowToInt(*number, key));
  return narrowed;
}

absl::StatusOr<bool> GetBool(const boost::json::object& object,
                             std::string_view key) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return MissingField(key);
  }
  if (!value->is_bool()) {
    return WrongType(key, "a boolean");
  }
  return value->get_bool();
}

absl::StatusOr<bool> GetBoolOr(const boost::json::object& object,
                               std::string_view key, bool default_value) {
  const boost::json::value* value = FindPresent(object, key);
  if (value == nullptr) {
    return default_value;
  }
  if (!value->is_bool()) {
    return WrongType(key, "a boolean");
  }
  return value->get_bool();
}

}  // namespace rctl::util

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

#ifndef REMOTECTL_UTIL_JSON_H_
#define REMOTECTL_UTIL_JSON_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

/**
 * @file
 * Typed field access on Boost.JSON objects, returning absl::Status errors
 * instead of throwing. Missing fields and `null` are both treated as absent
 * by the `Optional` and `...Or` accessors.
 */
namespace rctl::util {

absl::StatusOr<boost::json::value> ParseJson(std::string_view text);

// Serializes like boost::json::serialize, except that floating point numbers
// use their shortest round-trip decimal form ("0.5" rather than "5E-1").
std::string SerializeJson(const boost::json::value& value);

// Returns InvalidArgument unless `value` is an object.
absl::StatusOr<const boost::json::object*> AsObject(
    const boost::json::value& value);

absl::StatusOr<std::string> GetString(const boost::json::object& object,
                                      std::string_view key);
absl::StatusOr<std::optional<std::string>> GetOptionalString(
    const boost::json::object& object, std::string_view key);

// Accepts any JSON number.
absl::StatusOr<double> GetDouble(const boost::json::object& object,
                                 std::string_view key);
absl::StatusOr<double> GetDoubleOr(const boost::json::object& object,
                                   std::string_view key, double default_value);

// Accepts integers and floating point numbers with no fractional part that
// fit in an int64_t.
absl::StatusOr<int64_t> GetInt64(const boost::json::object& object,
                                 std::string_view key);
absl::StatusOr<int64_t> GetInt64Or(const boost::json::object& object,
                                   std::string_view key,
                                   int64_t default_value);
absl::StatusOr<std::optional<int64_t>> GetOptionalInt64(
    const boost::json::object& object, std::string_view key);

// As above, and InvalidArgument when the value does not fit in an int.
absl::StatusOr<int> GetInt(const boost::json::object& object,
                           std::string_view key);
absl::StatusOr<int> GetIntOr(const boost::json::object& object,
                             std::string_view key, int default_value);
absl::StatusOr<std::optional<int>> GetOptionalInt(
    const boost::json::object& object, std::string_view key);

absl::StatusOr<bool> GetBool(const boost::json::object& object,
                             std::string_view key);
absl::StatusOr<bool> GetBoolOr(const boost::json::object& object,
                               std::string_view key, bool default_value);

}  // namespace rctl::util

#endif  // REMOTECTL_UTIL_JSON_H_

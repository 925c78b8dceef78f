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

#ifndef REMOTECTL_UTIL_TIME_H_
#define REMOTECTL_UTIL_TIME_H_

#include <cstdint>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace rctl {

// Wall-clock time in Unix milliseconds, as carried in protocol timestamps.
inline int64_t NowUnixMillis() { return absl::ToUnixMillis(absl::Now()); }

}  // namespace rctl

#endif  // REMOTECTL_UTIL_TIME_H_

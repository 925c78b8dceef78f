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

#include "remotectl/util/boost_asio_utils.h"

#include <algorithm>
#include <thread>

#include <absl/base/no_destructor.h>

namespace rctl::util {

boost::asio::thread_pool* GetDefaultAsioExecutionContext() {
  static absl::NoDestructor<boost::asio::thread_pool> context(
      std::max(2u, std::thread::hardware_concurrency()));
  return context.get();
}

}  // namespace rctl::util

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

#ifndef REMOTECTL_UTIL_BOOST_ASIO_UTILS_H_
#define REMOTECTL_UTIL_BOOST_ASIO_UTILS_H_

#define BOOST_ASIO_NO_DEPRECATED

#include <boost/asio/thread_pool.hpp>

namespace rctl::util {

// Process-wide execution context for websocket I/O. Completion handlers run
// on its threads and hand results back to fibers through PermanentEvents.
boost::asio::thread_pool* GetDefaultAsioExecutionContext();

}  // namespace rctl::util

#endif  // REMOTECTL_UTIL_BOOST_ASIO_UTILS_H_

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

/**
 * @file
 * @brief
 *   Concurrency utilities for remotectl.
 *
 * Fibers, channels, Select and basic synchronization primitives, implemented
 * on top of Boost.Fiber. The API follows the `thread::Fiber` and
 * `thread::Channel` family of interfaces: fibers form cancellation trees,
 * blocking waits are expressed as `Select` over `Case`s, and every bounded
 * wait is a `SelectUntil` with a deadline.
 */

#ifndef REMOTECTL_CONCURRENCY_CONCURRENCY_H_
#define REMOTECTL_CONCURRENCY_CONCURRENCY_H_

#include <absl/time/time.h>

#include "remotectl/concurrency/base.h"
#include "remotectl/concurrency/channel.h"
#include "remotectl/concurrency/fiber.h"
#include "remotectl/concurrency/select.h"
#include "remotectl/concurrency/selectables.h"

namespace rctl {

using thread::CondVar;
using thread::Mutex;
using thread::MutexLock;

/**
 * @brief
 *   Sleeps for the given duration, letting other fibers run.
 *
 * The sleep is not interrupted by cancellation. Use
 * `thread::SelectUntil(deadline, {thread::OnCancel()})` for a cancellable
 * wait.
 */
inline void SleepFor(absl::Duration duration) {
  thread::SleepFor(duration);
}

}  // namespace rctl

#endif  // REMOTECTL_CONCURRENCY_CONCURRENCY_H_

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

#ifndef REMOTECTL_CONCURRENCY_FIBER_H_
#define REMOTECTL_CONCURRENCY_FIBER_H_

#include <cstdint>
#include <list>
#include <memory>
#include <type_traits>
#include <utility>

#include <absl/functional/any_invocable.h>
#include <absl/time/time.h>
#include <boost/fiber/all.hpp>

#include "remotectl/concurrency/base.h"
#include "remotectl/concurrency/select.h"
#include "remotectl/concurrency/selectables.h"

namespace rctl::thread {

using Invocable = absl::AnyInvocable<void() &&>;

class TreeOptions {};

// A cooperatively scheduled unit of work on Boost.Fiber.
//
// Fibers form cancellation trees: a fiber constructed from inside another
// fiber becomes its child, and cancelling a fiber cancels its whole subtree.
// Cancellation is advisory; code observes it with Cancelled() or by
// selecting on OnCancel().
//
// Fibers run on the thread that created them. Every fiber must be Join()-ed
// before it is destroyed.
class Fiber {
 public:
  template <typename F, typename = std::invoke_result_t<F>>
  explicit Fiber(F&& f)
      : Fiber(Unstarted{}, Invocable(std::forward<F>(f)), Current()) {
    static_assert(std::is_void_v<std::invoke_result_t<std::decay_t<F>>>,
                  "Fiber bodies must return void.");
    Start();
  }

  Fiber(const Fiber&) = delete;
  Fiber& operator=(const Fiber&) = delete;

  // REQUIRES: Join() has been called.
  ~Fiber();

  // Returns the running fiber. Plain threads get a lazily created,
  // never-cancelled root fiber.
  static Fiber* Current();

  // Waits until this fiber and all of its descendants have finished. Second
  // and further calls are no-ops.
  void Join();

  void Cancel();

  bool Cancelled() const { return cancellation_.HasBeenNotified(); }
  Case OnCancel() const { return cancellation_.OnEvent(); }
  Case OnJoinable() const { return joinable_.OnEvent(); }

 private:
  struct Unstarted {};

  Fiber(Unstarted, Invocable invocable, Fiber* parent);

  void Start();
  void Body();
  void MarkFinished();
  void MarkJoined();

  friend std::unique_ptr<Fiber> NewTreeInternal(Invocable f);
  friend void Detach(TreeOptions, Invocable f);
  friend struct PerThreadRootFiber;

  mutable Mutex mu_;

  Invocable work_;
  boost::fibers::fiber impl_;

  enum State : uint8_t { RUNNING, FINISHED, JOINED };
  State state_ ABSL_GUARDED_BY(mu_) = RUNNING;

  Fiber* const parent_;
  bool detached_ = false;
  std::list<Fiber*> children_ ABSL_GUARDED_BY(mu_);

  PermanentEvent cancellation_;
  PermanentEvent joinable_;
};

std::unique_ptr<Fiber> NewTreeInternal(Invocable f);

// Starts a fiber that is the root of a new cancellation tree: it is not
// cancelled together with the calling fiber and may be joined from anywhere.
template <typename F>
[[nodiscard]] std::unique_ptr<Fiber> NewTree(TreeOptions, F&& f) {
  return NewTreeInternal(Invocable(std::forward<F>(f)));
}

// Starts a self-owned root fiber which destroys itself once it and its
// children have finished.
void Detach(TreeOptions, Invocable f);

inline bool Cancelled() { return Fiber::Current()->Cancelled(); }

inline Case OnCancel() { return Fiber::Current()->OnCancel(); }

void SleepFor(absl::Duration duration);

}  // namespace rctl::thread

#endif  // REMOTECTL_CONCURRENCY_FIBER_H_

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

#ifndef REMOTECTL_CONCURRENCY_SELECTABLES_H_
#define REMOTECTL_CONCURRENCY_SELECTABLES_H_

#include <atomic>

#include "remotectl/concurrency/base.h"
#include "remotectl/concurrency/select.h"

namespace rctl::thread {

// A level-triggered event which may be added to a Select statement. It can
// only transition into the notified state; selecting on OnEvent() of an event
// that has been notified returns immediately.
//
// Notify() may be called from any thread, including transport callback
// threads that are not running fibers.
class PermanentEvent final : public internal::Selectable {
 public:
  PermanentEvent() = default;

  ~PermanentEvent() override {
    // Synchronizes with a concurrent Notify() that is still unwinding.
    MutexLock lock(&mu_);
    DCHECK(enqueued_list_ == nullptr);
  }

  PermanentEvent(const PermanentEvent&) = delete;
  PermanentEvent& operator=(const PermanentEvent&) = delete;

  // May only be called once.
  void Notify();

  bool HasBeenNotified() const;

  Case OnEvent() const { return {const_cast<PermanentEvent*>(this)}; }

  bool Handle(internal::CaseState* c, bool enqueue) override;
  void Unregister(internal::CaseState* c) override;

 private:
  Mutex mu_;
  std::atomic<bool> notified_{false};
  internal::CaseState* enqueued_list_ ABSL_GUARDED_BY(mu_) = nullptr;
};

// A case that never becomes ready. Useful to disable one slot of a CaseArray
// without re-labeling the others.
Case NonSelectableCase();

// A case that is always ready.
Case AlwaysSelectableCase();

}  // namespace rctl::thread

#endif  // REMOTECTL_CONCURRENCY_SELECTABLES_H_

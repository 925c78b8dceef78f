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

#include "remotectl/concurrency/selectables.h"

#include <absl/base/no_destructor.h>

namespace rctl::thread {

bool PermanentEvent::Handle(internal::CaseState* c, bool enqueue) {
  MutexLock lock(&mu_);

  if (notified_.load(std::memory_order_relaxed)) {
    MutexLock sel_lock(&c->sel->mu);
    // May lose a race against another ready case; nothing to undo then.
    return c->Pick();
  }
  if (enqueue) {
    internal::PushBack(&enqueued_list_, c);
  }
  return false;
}

void PermanentEvent::Unregister(internal::CaseState* c) {
  MutexLock lock(&mu_);
  // Waiting cases are only tracked until notification.
  if (!notified_.load(std::memory_order_relaxed) && c->prev != nullptr) {
    internal::RemoveFromList(&enqueued_list_, c);
  }
}

void PermanentEvent::Notify() {
  MutexLock lock(&mu_);

  DCHECK(!notified_.load(std::memory_order_relaxed))
      << "Notify() called more than once for PermanentEvent "
      << static_cast<void*>(this);
  notified_.store(true, std::memory_order_release);

  while (enqueued_list_ != nullptr) {
    internal::CaseState* head = enqueued_list_;
    MutexLock sel_lock(&head->sel->mu);
    head->Pick();
    // sel->mu keeps *head alive until it is off the list.
    internal::RemoveFromList(&enqueued_list_, head);
  }
}

bool PermanentEvent::HasBeenNotified() const {
  return notified_.load(std::memory_order_acquire);
}

namespace {

class NonSelectable final : public internal::Selectable {
 public:
  bool Handle(internal::CaseState*, bool) override { return false; }
  void Unregister(internal::CaseState*) override {}
};

class AlwaysSelectable final : public internal::Selectable {
 public:
  bool Handle(internal::CaseState* c, bool) override {
    MutexLock lock(&c->sel->mu);
    return c->Pick();
  }
  void Unregister(internal::CaseState*) override {}
};

}  // namespace

Case NonSelectableCase() {
  static absl::NoDestructor<NonSelectable> non_selectable;
  return {non_selectable.get()};
}

Case AlwaysSelectableCase() {
  static absl::NoDestructor<AlwaysSelectable> always_selectable;
  return {always_selectable.get()};
}

}  // namespace rctl::thread

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

#ifndef REMOTECTL_CONCURRENCY_SELECT_H_
#define REMOTECTL_CONCURRENCY_SELECT_H_

#include <concepts>
#include <cstddef>
#include <type_traits>

#include <absl/container/inlined_vector.h>
#include <absl/log/check.h>
#include <absl/time/time.h>

#include "remotectl/concurrency/base.h"

namespace rctl::thread {

namespace internal {

template <typename T>
concept IsPointer = std::is_pointer_v<T>;

struct Selector {
  static constexpr int kNonePicked = -1;

  bool Pick(int index) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu) {
    if (picked != kNonePicked) {
      return false;
    }
    picked = index;
    cv.Signal();
    return true;
  }

  int picked = kNonePicked;

  Mutex mu;
  CondVar cv;
};

class Selectable;

}  // namespace internal

// A single alternative of a Select statement: a selectable plus the
// out-arguments it fills in when picked.
struct [[nodiscard]] Case {
  internal::Selectable* selectable;
  absl::InlinedVector<void*, 2> arguments;

  // NOLINTNEXTLINE(google-explicit-constructor)
  Case(internal::Selectable* s = nullptr) : selectable(s) {}

  Case(internal::Selectable* s, internal::IsPointer auto... args)
      : selectable(s) {
    (arguments.push_back(
         const_cast<void*>(static_cast<const void*>(args))),
     ...);
  }

  template <typename T>
  [[nodiscard]] T* absl_nonnull GetArgPtrOrDie(size_t index) const {
    CHECK_LT(index, arguments.size()) << "Case argument index out of bounds";
    return static_cast<T*>(arguments[index]);
  }
};

using CaseArray = absl::InlinedVector<Case, 4>;

namespace internal {

// Per-Select state of one Case. Selectables keep waiting CaseStates on an
// intrusive circular list; prev == nullptr means "not on any list".
struct CaseState {
  const Case* params;
  int index;
  Selector* absl_nonnull sel;
  CaseState* prev;
  CaseState* next;

  // Must be called with sel->mu held. After sel->mu is released, the
  // CaseState may be destroyed at any time if this returned true.
  bool Pick() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(sel->mu) {
    return sel->Pick(index);
  }
};

class Selectable {
 public:
  virtual ~Selectable() = default;

  // If ready: lock c->sel->mu, call c->Pick() and perform side effects only
  // if it returned true, then return true. Otherwise enqueue c if `enqueue`
  // and return false.
  virtual bool Handle(CaseState* c, bool enqueue) = 0;

  // Removes an enqueued case that was not picked.
  virtual void Unregister(CaseState* c) = 0;
};

inline void PushBack(CaseState** head, CaseState* elem) {
  if (*head == nullptr) {
    elem->next = elem;
    elem->prev = elem;
    *head = elem;
  } else {
    elem->next = *head;
    elem->prev = elem->next->prev;
    elem->prev->next = elem;
    elem->next->prev = elem;
  }
}

inline void RemoveFromList(CaseState** head, CaseState* elem) {
  if (elem->next == elem) {
    *head = nullptr;
  } else {
    elem->next->prev = elem->prev;
    elem->prev->next = elem->next;
    if (*head == elem) {
      *head = elem->next;
    }
  }
  elem->prev = nullptr;
}

}  // namespace internal

// Blocks until one of the cases is ready, and returns its index. Returns -1
// if the deadline expires first, in which case no case has proceeded.
int SelectUntil(absl::Time deadline, const CaseArray& cases);

inline int Select(const CaseArray& cases) {
  CHECK(!cases.empty()) << "No cases provided";
  return SelectUntil(absl::InfiniteFuture(), cases);
}

}  // namespace rctl::thread

#endif  // REMOTECTL_CONCURRENCY_SELECT_H_

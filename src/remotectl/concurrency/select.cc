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

#include "remotectl/concurrency/select.h"

#include <absl/container/fixed_array.h>
#include <absl/random/random.h>

namespace rctl::thread {

namespace {

uint32_t Rand32() {
  thread_local absl::InsecureBitGen gen;
  return absl::Uniform<uint32_t>(gen);
}

// Returns false if the deadline expired with nothing picked.
bool CvBlock(absl::Time deadline, internal::Selector* sel)
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(sel->mu) {
  while (sel->picked == internal::Selector::kNonePicked) {
    if (sel->cv.WaitWithDeadline(&sel->mu, deadline) &&
        sel->picked == internal::Selector::kNonePicked) {
      return false;
    }
  }
  return true;
}

}  // namespace

int SelectUntil(absl::Time deadline, const CaseArray& cases) {
  internal::Selector sel;
  const int num_cases = static_cast<int>(cases.size());

  absl::FixedArray<internal::CaseState, 4> case_states(num_cases);

  // Inside-out Fisher-Yates shuffle, so that no case is starved.
  if (num_cases > 0) {
    case_states[0].index = 0;
  }
  for (int i = 1; i < num_cases; ++i) {
    const int swap = static_cast<int>(Rand32() % (i + 1));
    case_states[i].index = case_states[swap].index;
    case_states[swap].index = i;
  }

  const bool need_to_block = deadline != absl::InfinitePast();
  bool ready = false;
  int registered_limit;
  for (registered_limit = 0; registered_limit < num_cases;
       ++registered_limit) {
    internal::CaseState* case_state = &case_states[registered_limit];
    const Case* assoc_case = &cases[case_state->index];
    case_state->params = assoc_case;
    case_state->prev = nullptr;
    case_state->sel = &sel;
    if (assoc_case->selectable->Handle(case_state,
                                       /*enqueue=*/need_to_block)) {
      ready = true;
      break;
    }
  }

  if (!need_to_block) {
    return ready ? sel.picked : -1;
  }

  if (!ready) {
    MutexLock lock(&sel.mu);
    if (!CvBlock(deadline, &sel)) {
      // Nothing may be picked from this point on.
      sel.picked = num_cases;
    }
  }

  for (int i = 0; i < registered_limit; ++i) {
    internal::CaseState* case_state = &case_states[i];
    if (case_state->index != sel.picked) {
      case_state->params->selectable->Unregister(case_state);
    }
  }

  return sel.picked < num_cases ? sel.picked : -1;
}

}  // namespace rctl::thread

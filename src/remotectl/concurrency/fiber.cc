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

#include "remotectl/concurrency/fiber.h"

#include <absl/base/no_destructor.h>
#include <absl/log/check.h>
#include <absl/log/log.h>
#include <absl/memory/memory.h>

namespace rctl::thread {

namespace {

void KeepFiber(Fiber*) {}

boost::fibers::fiber_specific_ptr<Fiber>& CurrentFiberSlot() {
  static absl::NoDestructor<boost::fibers::fiber_specific_ptr<Fiber>> slot(
      &KeepFiber);
  return *slot;
}

}  // namespace

// Root fiber of a plain thread. Intentionally leaked: fiber primitives cannot
// be torn down safely while the thread's scheduler is being destroyed.
struct PerThreadRootFiber {
  static Fiber* Get() {
    thread_local Fiber* root = nullptr;
    if (root == nullptr) {
      root = new Fiber(Fiber::Unstarted{}, Invocable(), /*parent=*/nullptr);
      DVLOG(2) << "Created root fiber " << root << " for plain thread.";
    }
    return root;
  }
};

Fiber::Fiber(Unstarted, Invocable invocable, Fiber* parent)
    : work_(std::move(invocable)), parent_(parent) {
  if (parent_ == nullptr) {
    return;
  }
  // Visible to cancellation as soon as we are added to the parent.
  MutexLock lock(&parent_->mu_);
  CHECK_EQ(parent_->state_, RUNNING)
      << "Cannot start a child of a finished fiber.";
  parent_->children_.push_back(this);
  if (parent_->cancellation_.HasBeenNotified()) {
    cancellation_.Notify();
  }
}

Fiber::~Fiber() {
  MutexLock lock(&mu_);
  CHECK_EQ(state_, JOINED) << "Fiber " << this
                           << " destroyed before being joined. (Did you "
                              "forget to Join() a child?)";
  DCHECK(children_.empty());
}

Fiber* Fiber::Current() {
  if (Fiber* fiber = CurrentFiberSlot().get(); fiber != nullptr) {
    return fiber;
  }
  return PerThreadRootFiber::Get();
}

void Fiber::Start() {
  impl_ = boost::fibers::fiber(boost::fibers::launch::post,
                               [this]() { Body(); });
}

void Fiber::Body() {
  CurrentFiberSlot().reset(this);
  std::move(work_)();
  work_ = nullptr;

  MarkFinished();

  if (detached_) {
    Select({joinable_.OnEvent()});
    impl_.detach();
    {
      MutexLock lock(&mu_);
      state_ = JOINED;
    }
    delete this;
  }
}

void Fiber::MarkFinished() {
  MutexLock lock(&mu_);
  DCHECK_EQ(state_, RUNNING);
  state_ = FINISHED;
  if (children_.empty()) {
    joinable_.Notify();
  }
}

void Fiber::MarkJoined() {
  {
    MutexLock lock(&mu_);
    if (state_ == JOINED) {
      return;
    }
    DCHECK_EQ(state_, FINISHED);
    state_ = JOINED;
  }
  if (parent_ != nullptr) {
    MutexLock lock(&parent_->mu_);
    parent_->children_.remove(this);
    if (parent_->children_.empty() && parent_->state_ == FINISHED) {
      parent_->joinable_.Notify();
    }
  }
}

void Fiber::Join() {
  {
    MutexLock lock(&mu_);
    if (state_ == JOINED) {
      return;
    }
  }
  CHECK(this != Current()) << "Fiber trying to join itself!";
  DCHECK(!detached_) << "Join() on a detached fiber.";

  Select({joinable_.OnEvent()});
  if (impl_.joinable()) {
    impl_.join();
  }
  MarkJoined();
}

void Fiber::Cancel() {
  // Locks are taken parent before child, which keeps children alive (they
  // need the parent's lock to detach themselves) while we visit them.
  MutexLock lock(&mu_);
  if (!cancellation_.HasBeenNotified()) {
    cancellation_.Notify();
  }
  for (Fiber* child : children_) {
    child->Cancel();
  }
}

std::unique_ptr<Fiber> NewTreeInternal(Invocable f) {
  auto fiber = absl::WrapUnique(
      new Fiber(Fiber::Unstarted{}, std::move(f), /*parent=*/nullptr));
  fiber->Start();
  return fiber;
}

void Detach(TreeOptions, Invocable f) {
  auto* fiber = new Fiber(Fiber::Unstarted{}, std::move(f), /*parent=*/nullptr);
  fiber->detached_ = true;
  fiber->Start();
}

void SleepFor(absl::Duration duration) {
  boost::this_fiber::sleep_for(absl::ToChronoNanoseconds(duration));
}

}  // namespace rctl::thread

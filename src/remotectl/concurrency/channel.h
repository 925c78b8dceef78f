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

#ifndef REMOTECTL_CONCURRENCY_CHANNEL_H_
#define REMOTECTL_CONCURRENCY_CHANNEL_H_

#include <cstddef>
#include <deque>
#include <type_traits>
#include <utility>

#include <absl/base/nullability.h>
#include <absl/log/check.h>

#include "remotectl/concurrency/base.h"
#include "remotectl/concurrency/fiber.h"
#include "remotectl/concurrency/select.h"

namespace rctl::thread {

template <typename T>
  requires std::is_move_assignable_v<T>
class Channel;

namespace internal {

template <typename T>
struct ReadSelectable final : Selectable {
  explicit ReadSelectable(Channel<T>* absl_nonnull channel)
      : channel(channel) {}

  bool Handle(CaseState* c, bool enqueue) override;
  void Unregister(CaseState* c) override;

  Channel<T>* absl_nonnull channel;
};

}  // namespace internal

template <typename T>
class Reader {
 public:
  Reader(const Reader&) = delete;
  Reader& operator=(const Reader&) = delete;

  // Blocks until an item is available, and returns true, or until the
  // channel is closed and drained, and returns false.
  bool Read(T* absl_nonnull item) {
    bool ok = false;
    Select({OnRead(item, &ok)});
    return ok;
  }

  // Selectable form of Read(). When picked, *ok tells whether *item was
  // filled (true) or the channel was closed and drained (false).
  Case OnRead(T* absl_nonnull item, bool* absl_nonnull ok) {
    return {&channel_->rd_, item, ok};
  }

 private:
  friend class Channel<T>;
  explicit Reader(Channel<T>* absl_nonnull channel) : channel_(channel) {}

  Channel<T>* absl_nonnull channel_;
};

template <typename T>
class Writer {
 public:
  Writer(const Writer&) = delete;
  Writer& operator=(const Writer&) = delete;

  // Never blocks. Writing to a closed channel is a programming error.
  void Write(T item) { channel_->Put(std::move(item)); }

  // Returns false, without writing, if the calling fiber is cancelled.
  bool WriteUnlessCancelled(T item) {
    if (Cancelled()) {
      return false;
    }
    channel_->Put(std::move(item));
    return true;
  }

  // Marks the channel as closed; readers drain what is left and then observe
  // ok == false. May be called at most once.
  void Close() { channel_->Close(); }

 private:
  friend class Channel<T>;
  explicit Writer(Channel<T>* absl_nonnull channel) : channel_(channel) {}

  Channel<T>* absl_nonnull channel_;
};

// An unbounded, order-preserving multi-producer multi-consumer queue that can
// be read from Select statements. Writes may come from any thread.
template <typename T>
  requires std::is_move_assignable_v<T>
class Channel {
 public:
  Channel() : rd_(this), reader_(this), writer_(this) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  ~Channel() {
    MutexLock lock(&mu_);
    DCHECK(waiting_readers_ == nullptr)
        << "Channel destroyed while readers are waiting on it.";
  }

  Reader<T>* reader() { return &reader_; }
  Writer<T>* writer() { return &writer_; }

  [[nodiscard]] size_t length() const {
    MutexLock lock(&mu_);
    return queue_.size();
  }

 private:
  friend struct internal::ReadSelectable<T>;
  friend class Reader<T>;
  friend class Writer<T>;

  static void Deliver(const internal::CaseState* c, T* item) {
    *c->params->template GetArgPtrOrDie<T>(0) = std::move(*item);
    *c->params->template GetArgPtrOrDie<bool>(1) = true;
  }

  static void DeliverClosed(const internal::CaseState* c) {
    *c->params->template GetArgPtrOrDie<bool>(1) = false;
  }

  void Put(T item) {
    MutexLock lock(&mu_);
    CHECK(!closed_) << "Write to a closed channel.";

    // Hand the item straight to the oldest waiting reader that can still be
    // picked. Readers that lost their Select race are dropped from the list.
    while (waiting_readers_ != nullptr) {
      internal::CaseState* reader = waiting_readers_;
      MutexLock sel_lock(&reader->sel->mu);
      const bool picked = reader->Pick();
      if (picked) {
        Deliver(reader, &item);
      }
      internal::RemoveFromList(&waiting_readers_, reader);
      if (picked) {
        return;
      }
    }
    queue_.push_back(std::move(item));
  }

  void Close() {
    MutexLock lock(&mu_);
    CHECK(!closed_) << "Channel closed twice.";
    closed_ = true;
    // Waiting readers imply an empty queue.
    while (waiting_readers_ != nullptr) {
      internal::CaseState* reader = waiting_readers_;
      MutexLock sel_lock(&reader->sel->mu);
      if (reader->Pick()) {
        DeliverClosed(reader);
      }
      internal::RemoveFromList(&waiting_readers_, reader);
    }
  }

  bool HandleRead(internal::CaseState* c, bool enqueue) {
    MutexLock lock(&mu_);
    if (!queue_.empty()) {
      MutexLock sel_lock(&c->sel->mu);
      if (!c->Pick()) {
        return false;
      }
      Deliver(c, &queue_.front());
      queue_.pop_front();
      return true;
    }
    if (closed_) {
      MutexLock sel_lock(&c->sel->mu);
      if (!c->Pick()) {
        return false;
      }
      DeliverClosed(c);
      return true;
    }
    if (enqueue) {
      internal::PushBack(&waiting_readers_, c);
    }
    return false;
  }

  void UnregisterRead(internal::CaseState* c) {
    MutexLock lock(&mu_);
    if (c->prev != nullptr) {
      internal::RemoveFromList(&waiting_readers_, c);
    }
  }

  mutable Mutex mu_;
  std::deque<T> queue_ ABSL_GUARDED_BY(mu_);
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
  internal::CaseState* waiting_readers_ ABSL_GUARDED_BY(mu_) = nullptr;

  internal::ReadSelectable<T> rd_;
  Reader<T> reader_;
  Writer<T> writer_;
};

namespace internal {

template <typename T>
bool ReadSelectable<T>::Handle(CaseState* c, bool enqueue) {
  return channel->HandleRead(c, enqueue);
}

template <typename T>
void ReadSelectable<T>::Unregister(CaseState* c) {
  channel->UnregisterRead(c);
}

}  // namespace internal

}  // namespace rctl::thread

#endif  // REMOTECTL_CONCURRENCY_CHANNEL_H_

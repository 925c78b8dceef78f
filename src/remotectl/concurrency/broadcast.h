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

#ifndef REMOTECTL_CONCURRENCY_BROADCAST_H_
#define REMOTECTL_CONCURRENCY_BROADCAST_H_

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include <absl/base/nullability.h>
#include <absl/base/thread_annotations.h>

#include "remotectl/concurrency/concurrency.h"

namespace rctl {

template <typename T>
class Topic;

template <typename T>
class Subscription;

namespace internal {

template <typename T>
struct TopicState {
  Mutex mu;
  bool closed ABSL_GUARDED_BY(mu) = false;
  std::vector<Subscription<T>*> subscribers ABSL_GUARDED_BY(mu);
};

}  // namespace internal

/**
 * A live view of a `Topic`.
 *
 * Receives every item published after it was created, in publication order,
 * and nothing published before. The reader reports `ok == false` once the
 * topic is closed (and the remaining items are drained) or the subscription
 * is unsubscribed.
 */
template <typename T>
class Subscription {
 public:
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  ~Subscription() { Unsubscribe(); }

  thread::Reader<T>* GetReader() { return channel_.reader(); }

  bool Read(T* absl_nonnull item) { return channel_.reader()->Read(item); }

  thread::Case OnRead(T* absl_nonnull item, bool* absl_nonnull ok) {
    return channel_.reader()->OnRead(item, ok);
  }

  // Stops delivery and closes the reader. Idempotent.
  void Unsubscribe() {
    MutexLock lock(&state_->mu);
    auto& subscribers = state_->subscribers;
    subscribers.erase(std::remove(subscribers.begin(), subscribers.end(), this),
                      subscribers.end());
    CloseWriter();
  }

 private:
  friend class Topic<T>;

  explicit Subscription(std::shared_ptr<internal::TopicState<T>> state)
      : state_(std::move(state)) {}

  void CloseWriter() ABSL_EXCLUSIVE_LOCKS_REQUIRED(state_->mu) {
    if (writer_closed_) {
      return;
    }
    writer_closed_ = true;
    channel_.writer()->Close();
  }

  std::shared_ptr<internal::TopicState<T>> state_;
  bool writer_closed_ ABSL_GUARDED_BY(state_->mu) = false;
  thread::Channel<T> channel_;
};

/**
 * A live-only broadcast of `T` values to any number of subscribers.
 *
 * Publishing never blocks and never replays history: late subscribers only
 * see what is published after `Subscribe()`. `Publish` may be called from
 * any thread.
 */
template <typename T>
class Topic {
 public:
  Topic() : state_(std::make_shared<internal::TopicState<T>>()) {}

  Topic(const Topic&) = delete;
  Topic& operator=(const Topic&) = delete;

  ~Topic() { Close(); }

  // Subscribing to a closed topic yields an already-closed subscription.
  std::unique_ptr<Subscription<T>> Subscribe() {
    auto subscription =
        std::unique_ptr<Subscription<T>>(new Subscription<T>(state_));
    MutexLock lock(&state_->mu);
    if (state_->closed) {
      subscription->CloseWriter();
    } else {
      state_->subscribers.push_back(subscription.get());
    }
    return subscription;
  }

  // Returns false if the topic has been closed.
  bool Publish(const T& item) {
    MutexLock lock(&state_->mu);
    if (state_->closed) {
      return false;
    }
    for (Subscription<T>* subscriber : state_->subscribers) {
      subscriber->channel_.writer()->Write(item);
    }
    return true;
  }

  // Closes all current subscriptions. Idempotent.
  void Close() {
    MutexLock lock(&state_->mu);
    if (state_->closed) {
      return;
    }
    state_->closed = true;
    for (Subscription<T>* subscriber : state_->subscribers) {
      subscriber->CloseWriter();
    }
    state_->subscribers.clear();
  }

  [[nodiscard]] size_t NumSubscribers() const {
    MutexLock lock(&state_->mu);
    return state_->subscribers.size();
  }

 private:
  std::shared_ptr<internal::TopicState<T>> state_;
};

}  // namespace rctl

#endif  // REMOTECTL_CONCURRENCY_BROADCAST_H_

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

#ifndef REMOTECTL_NET_WEBSOCKETS_TEXT_SOCKET_H_
#define REMOTECTL_NET_WEBSOCKETS_TEXT_SOCKET_H_

#include <functional>
#include <memory>
#include <string>

#include <absl/base/nullability.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "remotectl/net/websockets/fiber_aware_websocket_stream.h"

namespace rctl::net {

/**
 * A message-oriented, text-only duplex connection: the part of a websocket
 * that signalling needs.
 *
 * Implementations block the calling fiber. `ReadText` returns a non-OK status
 * once the connection is closed (locally or remotely) or the calling fiber
 * is cancelled.
 */
class TextSocket {
 public:
  virtual ~TextSocket() = default;

  virtual absl::Status WriteText(const std::string& message) = 0;
  virtual absl::Status ReadText(std::string* absl_nonnull message) = 0;

  // Idempotent. Unblocks a pending ReadText.
  virtual absl::Status Close() = 0;
};

using TextSocketConnector =
    std::function<absl::StatusOr<std::unique_ptr<TextSocket>>(const WsUrl&)>;

// A TextSocket over a FiberAwareWebsocketStream.
class WebsocketTextSocket final : public TextSocket {
 public:
  explicit WebsocketTextSocket(
      std::unique_ptr<FiberAwareWebsocketStream> stream)
      : stream_(std::move(stream)) {}

  absl::Status WriteText(const std::string& message) override {
    return stream_->WriteText(message);
  }

  absl::Status ReadText(std::string* absl_nonnull message) override {
    return stream_->ReadText(absl::InfiniteDuration(), message);
  }

  absl::Status Close() override { return stream_->Close(); }

 private:
  std::unique_ptr<FiberAwareWebsocketStream> stream_;
};

// Connects real websockets (TLS for wss://) on the default Asio context.
TextSocketConnector MakeWebsocketConnector();

}  // namespace rctl::net

#endif  // REMOTECTL_NET_WEBSOCKETS_TEXT_SOCKET_H_

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

#include "remotectl/net/websockets/text_socket.h"

#include "remotectl/util/status_macros.h"

namespace rctl::net {

TextSocketConnector MakeWebsocketConnector() {
  return [](const WsUrl& url) -> absl::StatusOr<std::unique_ptr<TextSocket>> {
    ASSIGN_OR_RETURN(std::unique_ptr<FiberAwareWebsocketStream> stream,
                     FiberAwareWebsocketStream::Connect(url));
    return std::make_unique<WebsocketTextSocket>(std::move(stream));
  };
}

}  // namespace rctl::net

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

#ifndef REMOTECTL_NET_WEBSOCKETS_FIBER_AWARE_WEBSOCKET_STREAM_H_
#define REMOTECTL_NET_WEBSOCKETS_FIBER_AWARE_WEBSOCKET_STREAM_H_

#define BOOST_ASIO_NO_DEPRECATED

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

#include <absl/base/nullability.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_format.h>
#include <absl/time/time.h>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "remotectl/concurrency/concurrency.h"

namespace rctl::net {

class BoostWebsocketStream;

using PrepareStreamFn =
    std::function<absl::Status(BoostWebsocketStream* absl_nonnull)>;

// Sets the user agent, timeouts and compression options of a client stream.
absl::Status PrepareClientStream(BoostWebsocketStream* absl_nonnull stream);

/**
 * A Beast websocket over either a plain TCP socket or a TLS stream, so the
 * rest of the code does not need to care which scheme was used.
 */
class BoostWebsocketStream {
 public:
  using PlainStream =
      boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;
  using SslStream = boost::beast::websocket::stream<
      boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>;

  template <typename ExecutionContext>
  explicit BoostWebsocketStream(ExecutionContext& context)
      : stream_(PlainStream(boost::asio::make_strand(context))) {}

  template <typename ExecutionContext>
  BoostWebsocketStream(ExecutionContext& context,
                       boost::asio::ssl::context& ssl_ctx)
      : stream_(std::in_place_type<SslStream>,
                boost::asio::make_strand(context), ssl_ctx) {}

  template <class Option>
  void set_option(Option&& opt) {
    std::visit([&](auto& s) { s.set_option(std::forward<Option>(opt)); },
               stream_);
  }

  void text(bool value);
  [[nodiscard]] bool got_text() const;
  [[nodiscard]] bool is_open() const;
  void write_buffer_bytes(std::size_t bytes);

  boost::asio::ip::tcp::socket& next_layer();

  template <typename Buffer, typename Callback>
  void async_write(const Buffer& buffer, Callback&& cb) {
    std::visit(
        [&](auto& s) { s.async_write(buffer, std::forward<Callback>(cb)); },
        stream_);
  }

  template <typename DynamicBuffer, typename Callback>
  void async_read(DynamicBuffer& buffer, Callback&& cb) {
    std::visit(
        [&](auto& s) { s.async_read(buffer, std::forward<Callback>(cb)); },
        stream_);
  }

  template <typename Callback>
  void async_close(boost::beast::websocket::close_code code, Callback&& cb) {
    std::visit(
        [&](auto& s) { s.async_close(code, std::forward<Callback>(cb)); },
        stream_);
  }

  template <typename Callback>
  void async_handshake(std::string_view host, std::string_view target,
                       Callback&& cb) {
    std::visit(
        [&](auto& s) {
          s.async_handshake(host, target, std::forward<Callback>(cb));
        },
        stream_);
  }

  void async_ssl_handshake(boost::asio::ssl::stream_base::handshake_type type,
                           std::function<void(boost::system::error_code)> cb);

  SslStream* absl_nullable GetSslStreamOrNull();

 private:
  std::variant<PlainStream, SslStream> stream_;
};

/**
 * A parsed websocket URL.
 *
 * Only `ws` and `wss` are accepted (case-insensitively). Ports default to 80
 * and 443 respectively; the path defaults to "/" and the query keeps
 * everything after '?', without the '?'.
 */
struct WsUrl {
  bool secure = false;
  std::string host;
  uint16_t port = 80;
  std::string path = "/";
  std::string query;

  // Path and query as sent in the HTTP upgrade request.
  [[nodiscard]] std::string Target() const;

  static absl::StatusOr<WsUrl> FromString(std::string_view url_str);

  template <typename Sink>
  friend void AbslStringify(Sink& sink, const WsUrl& url) {
    absl::Format(&sink, "%s://%s:%d%s", url.secure ? "wss" : "ws", url.host,
                 url.port, url.Target());
  }
};

/**
 * A text websocket stream whose operations block the calling fiber (not the
 * thread) until the underlying asynchronous Beast operation completes.
 *
 * At most one read and one write may be in flight; further calls wait for
 * the pending one. Operations observe fiber cancellation.
 */
class FiberAwareWebsocketStream {
 public:
  explicit FiberAwareWebsocketStream(
      std::unique_ptr<BoostWebsocketStream> stream,
      std::shared_ptr<boost::asio::ssl::context> ssl_ctx = nullptr);

  FiberAwareWebsocketStream(const FiberAwareWebsocketStream&) = delete;
  FiberAwareWebsocketStream& operator=(const FiberAwareWebsocketStream&) =
      delete;

  ~FiberAwareWebsocketStream();

  // Resolves, connects (with TLS for wss://) and performs the websocket
  // handshake against `url.Target()`.
  static absl::StatusOr<std::unique_ptr<FiberAwareWebsocketStream>> Connect(
      const WsUrl& url, PrepareStreamFn prepare_stream_fn = PrepareClientStream);

  absl::Status Close() noexcept;

  // Blocks until a text message arrives, skipping binary ones.
  absl::Status ReadText(absl::Duration timeout,
                        std::string* absl_nonnull message) noexcept;
  absl::Status WriteText(const std::string& message) noexcept;

 private:
  absl::Status CloseInternal() noexcept ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  std::unique_ptr<BoostWebsocketStream> stream_;
  std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;

  mutable Mutex mu_;
  CondVar cv_ ABSL_GUARDED_BY(mu_);
  bool write_pending_ ABSL_GUARDED_BY(mu_) = false;
  bool read_pending_ ABSL_GUARDED_BY(mu_) = false;
  bool closed_ ABSL_GUARDED_BY(mu_) = false;
  boost::asio::cancellation_signal cancel_signal_ ABSL_GUARDED_BY(mu_);
};

// Resolves `host:port` and connects the stream's TCP socket. Cancellable.
absl::Status ResolveAndConnect(BoostWebsocketStream* absl_nonnull stream,
                               std::string_view host, uint16_t port);

// Performs the websocket upgrade. Cancellable.
absl::Status DoHandshake(BoostWebsocketStream* absl_nonnull stream,
                         std::string_view host, std::string_view target);

}  // namespace rctl::net

#endif  // REMOTECTL_NET_WEBSOCKETS_FIBER_AWARE_WEBSOCKET_STREAM_H_

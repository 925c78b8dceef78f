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

#include "remotectl/net/websockets/fiber_aware_websocket_stream.h"

#include <utility>

#include <absl/log/log.h>
#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/ssl.h>

#include "remotectl/util/boost_asio_utils.h"
#include "remotectl/util/status_macros.h"

namespace rctl::net {

static constexpr absl::Duration kDebugWarningTimeout = absl::Seconds(5);

void BoostWebsocketStream::text(bool value) {
  std::visit([value](auto& s) { s.text(value); }, stream_);
}

bool BoostWebsocketStream::got_text() const {
  return std::visit([](auto& s) { return s.got_text(); }, stream_);
}

bool BoostWebsocketStream::is_open() const {
  return std::visit([](auto& s) { return s.is_open(); }, stream_);
}

void BoostWebsocketStream::write_buffer_bytes(std::size_t bytes) {
  std::visit([bytes](auto& s) { s.write_buffer_bytes(bytes); }, stream_);
}

boost::asio::ip::tcp::socket& BoostWebsocketStream::next_layer() {
  if (std::holds_alternative<PlainStream>(stream_)) {
    return std::get<PlainStream>(stream_).next_layer();
  }
  return std::get<SslStream>(stream_).next_layer().next_layer();
}

void BoostWebsocketStream::async_ssl_handshake(
    boost::asio::ssl::stream_base::handshake_type type,
    std::function<void(boost::system::error_code)> cb) {
  if (std::holds_alternative<SslStream>(stream_)) {
    std::get<SslStream>(stream_).next_layer().async_handshake(type,
                                                              std::move(cb));
  } else {
    cb(boost::asio::error::no_protocol_option);
  }
}

BoostWebsocketStream::SslStream* absl_nullable
BoostWebsocketStream::GetSslStreamOrNull() {
  return std::get_if<SslStream>(&stream_);
}

absl::Status PrepareClientStream(BoostWebsocketStream* stream) {
  stream->set_option(boost::beast::websocket::stream_base::decorator(
      [](boost::beast::websocket::request_type& req) {
        req.set(boost::beast::http::field::user_agent,
                "remotectl signalling client");
      }));
  stream->write_buffer_bytes(16);

  stream->set_option(boost::beast::websocket::stream_base::timeout{
      std::chrono::seconds(30), std::chrono::seconds(1800), true});

  boost::beast::websocket::permessage_deflate permessage_deflate_option;
  permessage_deflate_option.msg_size_threshold = 1024;  // 1 KiB
  permessage_deflate_option.client_enable = true;
  stream->set_option(permessage_deflate_option);

  return absl::OkStatus();
}

std::string WsUrl::Target() const {
  if (query.empty()) {
    return path;
  }
  return absl::StrCat(path, "?", query);
}

absl::StatusOr<WsUrl> WsUrl::FromString(std::string_view url_str) {
  const size_t scheme_end = url_str.find("://");
  if (scheme_end == std::string_view::npos) {
    return absl::InvalidArgumentError(absl::StrCat(
        "WebSocket URL must start with ws:// or wss://: '", url_str, "'"));
  }

  WsUrl url;
  const std::string scheme =
      absl::AsciiStrToLower(url_str.substr(0, scheme_end));
  if (scheme == "wss") {
    url.secure = true;
  } else if (scheme != "ws") {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid WebSocket URL scheme: '", scheme, "'"));
  }

  std::string_view rest = url_str.substr(scheme_end + 3);
  if (const size_t fragment_pos = rest.find('#');
      fragment_pos != std::string_view::npos) {
    rest = rest.substr(0, fragment_pos);
  }

  const size_t authority_end = rest.find_first_of("/?");
  const std::string_view authority = rest.substr(0, authority_end);
  std::string_view path_and_query =
      authority_end == std::string_view::npos ? std::string_view()
                                              : rest.substr(authority_end);

  std::string_view host = authority;
  std::string_view port_str;
  if (!authority.empty() && authority.front() == '[') {
    // IPv6 literal: [::1]:8080
    const size_t bracket_end = authority.find(']');
    if (bracket_end == std::string_view::npos) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unterminated IPv6 host in WebSocket URL: '", url_str,
                       "'"));
    }
    host = authority.substr(1, bracket_end - 1);
    std::string_view after_host = authority.substr(bracket_end + 1);
    if (!after_host.empty()) {
      if (after_host.front() != ':') {
        return absl::InvalidArgumentError(absl::StrCat(
            "Unexpected characters after IPv6 host: '", url_str, "'"));
      }
      port_str = after_host.substr(1);
    }
  } else if (const size_t colon_pos = authority.rfind(':');
             colon_pos != std::string_view::npos) {
    host = authority.substr(0, colon_pos);
    port_str = authority.substr(colon_pos + 1);
  }

  if (host.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("WebSocket URL must contain a host: '", url_str, "'"));
  }
  url.host = std::string(host);

  if (port_str.empty()) {
    url.port = url.secure ? 443 : 80;
  } else {
    uint32_t port = 0;
    if (!absl::SimpleAtoi(port_str, &port) || port == 0 || port > 65535) {
      return absl::InvalidArgumentError(absl::StrCat(
          "WebSocket URL contains an invalid port: '", port_str, "'"));
    }
    url.port = static_cast<uint16_t>(port);
  }

  if (const size_t query_pos = path_and_query.find('?');
      query_pos != std::string_view::npos) {
    url.query = std::string(path_and_query.substr(query_pos + 1));
    path_and_query = path_and_query.substr(0, query_pos);
  }
  url.path = path_and_query.empty() ? "/" : std::string(path_and_query);

  return url;
}

FiberAwareWebsocketStream::FiberAwareWebsocketStream(
    std::unique_ptr<BoostWebsocketStream> stream,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx)
    : stream_(std::move(stream)), ssl_ctx_(std::move(ssl_ctx)) {}

FiberAwareWebsocketStream::~FiberAwareWebsocketStream() {
  MutexLock lock(&mu_);

  cancel_signal_.emit(boost::asio::cancellation_type::total);

  bool timeout_logged = false;
  while (write_pending_ || read_pending_) {
    cv_.WaitWithTimeout(&mu_, kDebugWarningTimeout);
    if ((write_pending_ || read_pending_) && !timeout_logged) {
      LOG(WARNING) << "FiberAwareWebsocketStream destructor waiting for "
                      "pending operations to finish. You may have "
                      "forgotten to call Close() on the stream.";
      timeout_logged = true;
    }
  }

  if (const absl::Status status = CloseInternal(); !status.ok()) {
    DLOG(INFO) << "FiberAwareWebsocketStream close on destruction: "
               << status;
  }
}

absl::StatusOr<std::unique_ptr<FiberAwareWebsocketStream>>
FiberAwareWebsocketStream::Connect(const WsUrl& url,
                                   PrepareStreamFn prepare_stream_fn) {
  boost::asio::thread_pool& context = *util::GetDefaultAsioExecutionContext();

  std::unique_ptr<BoostWebsocketStream> ws_stream;
  std::shared_ptr<boost::asio::ssl::context> ssl_ctx;
  if (url.secure) {
    ssl_ctx = std::make_shared<boost::asio::ssl::context>(
        boost::asio::ssl::context::tls_client);
    ssl_ctx->set_default_verify_paths();
    ssl_ctx->set_verify_mode(boost::asio::ssl::verify_peer);
    ws_stream = std::make_unique<BoostWebsocketStream>(context, *ssl_ctx);
  } else {
    ws_stream = std::make_unique<BoostWebsocketStream>(context);
  }

  RETURN_IF_ERROR(ResolveAndConnect(ws_stream.get(), url.host, url.port));

  if (url.secure) {
    BoostWebsocketStream::SslStream* ssl_stream =
        ws_stream->GetSslStreamOrNull();
    if (ssl_stream == nullptr) {
      return absl::InternalError("Expected SSL stream, but got Plain stream");
    }
    if (!SSL_set_tlsext_host_name(ssl_stream->next_layer().native_handle(),
                                  url.host.c_str())) {
      return absl::InternalError("Failed to set SNI hostname");
    }
    ssl_stream->next_layer().set_verify_callback(
        boost::asio::ssl::host_name_verification(url.host));

    boost::system::error_code error;
    thread::PermanentEvent ssl_handshake_done;
    ws_stream->async_ssl_handshake(
        boost::asio::ssl::stream_base::client,
        [&error, &ssl_handshake_done](const boost::system::error_code& ec) {
          error = ec;
          ssl_handshake_done.Notify();
        });

    if (thread::Select({ssl_handshake_done.OnEvent(), thread::OnCancel()}) ==
        1) {
      boost::system::error_code ignored;
      ws_stream->next_layer().close(ignored);
      thread::Select({ssl_handshake_done.OnEvent()});
      return absl::CancelledError("SSL handshake cancelled");
    }
    if (error) {
      return absl::UnavailableError(
          absl::StrFormat("SSL handshake failed: %s", error.message()));
    }
  }

  if (prepare_stream_fn) {
    RETURN_IF_ERROR(prepare_stream_fn(ws_stream.get()));
  }

  RETURN_IF_ERROR(DoHandshake(ws_stream.get(),
                              absl::StrFormat("%s:%d", url.host, url.port),
                              url.Target()));

  return std::make_unique<FiberAwareWebsocketStream>(std::move(ws_stream),
                                                     std::move(ssl_ctx));
}

absl::Status ResolveAndConnect(BoostWebsocketStream* stream,
                               std::string_view host, uint16_t port) {
  boost::asio::ip::tcp::resolver resolver(
      *util::GetDefaultAsioExecutionContext());

  boost::system::error_code error;
  boost::asio::ip::tcp::resolver::results_type endpoints;
  thread::PermanentEvent resolved;
  resolver.async_resolve(
      std::string(host), std::to_string(port),
      [&error, &endpoints, &resolved](
          const boost::system::error_code& ec,
          boost::asio::ip::tcp::resolver::results_type results) {
        error = ec;
        endpoints = std::move(results);
        resolved.Notify();
      });

  if (thread::Select({resolved.OnEvent(), thread::OnCancel()}) == 1) {
    resolver.cancel();
    thread::Select({resolved.OnEvent()});
    return absl::CancelledError("Resolve cancelled");
  }
  if (error) {
    return absl::UnavailableError(absl::StrFormat(
        "Cannot resolve %s:%d: %s", host, port, error.message()));
  }

  thread::PermanentEvent connected;
  boost::asio::async_connect(
      stream->next_layer(), endpoints,
      [&error, &connected](const boost::system::error_code& ec,
                           const boost::asio::ip::tcp::endpoint&) {
        error = ec;
        connected.Notify();
      });

  if (thread::Select({connected.OnEvent(), thread::OnCancel()}) == 1) {
    boost::system::error_code ignored;
    stream->next_layer().close(ignored);
    thread::Select({connected.OnEvent()});
    return absl::CancelledError("Connect cancelled");
  }
  if (error) {
    return absl::UnavailableError(absl::StrFormat(
        "Cannot connect to %s:%d: %s", host, port, error.message()));
  }
  return absl::OkStatus();
}

absl::Status DoHandshake(BoostWebsocketStream* stream, std::string_view host,
                         std::string_view target) {
  boost::system::error_code error;
  thread::PermanentEvent handshake_done;
  stream->async_handshake(
      host, target,
      [&error, &handshake_done](const boost::system::error_code& ec) {
        error = ec;
        handshake_done.Notify();
      });

  if (thread::Select({handshake_done.OnEvent(), thread::OnCancel()}) == 1) {
    boost::system::error_code ignored;
    stream->next_layer().close(ignored);
    thread::Select({handshake_done.OnEvent()});
    return absl::CancelledError("WsHandshake cancelled");
  }

  if (error == boost::beast::websocket::error::closed ||
      error == boost::system::errc::operation_canceled) {
    return absl::CancelledError("WsHandshake cancelled");
  }
  if (error) {
    return absl::UnavailableError(
        absl::StrFormat("Websocket handshake failed: %s", error.message()));
  }
  return absl::OkStatus();
}

absl::Status FiberAwareWebsocketStream::WriteText(
    const std::string& message) noexcept {
  MutexLock lock(&mu_);

  while (write_pending_) {
    cv_.Wait(&mu_);
  }
  if (closed_ || !stream_->is_open()) {
    return absl::FailedPreconditionError(
        "Websocket stream is not open for writing");
  }

  write_pending_ = true;

  boost::system::error_code error;
  thread::PermanentEvent write_done;
  stream_->text(true);
  stream_->async_write(
      boost::asio::buffer(message),
      [&error, &write_done](const boost::system::error_code& ec, std::size_t) {
        error = ec;
        write_done.Notify();
      });

  mu_.unlock();
  thread::Select({write_done.OnEvent()});
  mu_.lock();
  write_pending_ = false;
  cv_.SignalAll();

  if (error == boost::beast::websocket::error::closed ||
      error == boost::system::errc::operation_canceled) {
    return absl::CancelledError("WsWrite cancelled");
  }

  if (error) {
    LOG(ERROR) << "Cannot write to websocket stream: " << error.message();
    return absl::InternalError(error.message());
  }

  return absl::OkStatus();
}

absl::Status FiberAwareWebsocketStream::Close() noexcept {
  MutexLock lock(&mu_);
  return CloseInternal();
}

absl::Status FiberAwareWebsocketStream::CloseInternal() noexcept {
  if (closed_ || stream_ == nullptr) {
    return absl::OkStatus();
  }
  closed_ = true;

  if (!stream_->is_open()) {
    return absl::OkStatus();
  }

  boost::system::error_code error;
  thread::PermanentEvent close_done;
  stream_->async_close(
      boost::beast::websocket::close_code::normal,
      [&error, &close_done](const boost::system::error_code& async_error) {
        error = async_error;
        close_done.Notify();
      });

  mu_.unlock();
  thread::Select({close_done.OnEvent()});
  mu_.lock();

  if (error && error != boost::asio::error::operation_aborted &&
      error != boost::beast::websocket::error::closed) {
    return absl::InternalError(
        absl::StrFormat("Websocket close failed: %s", error.message()));
  }
  return absl::OkStatus();
}

absl::Status FiberAwareWebsocketStream::ReadText(
    absl::Duration timeout, std::string* absl_nonnull message) noexcept {
  const absl::Time deadline = absl::Now() + timeout;

  MutexLock lock(&mu_);

  while (read_pending_) {
    if (cv_.WaitWithDeadline(&mu_, deadline)) {
      return absl::DeadlineExceededError(
          "Timed out waiting for another websocket read to complete");
    }
  }

  read_pending_ = true;
  absl::Status status;
  // Signalling is text only. Binary frames are skipped.
  while (true) {
    if (closed_ || !stream_->is_open()) {
      status = absl::FailedPreconditionError(
          "Websocket stream is not open for reading");
      break;
    }

    boost::system::error_code error;
    thread::PermanentEvent read_done;
    std::string received;
    auto dynamic_buffer = boost::asio::dynamic_buffer(received);
    stream_->async_read(
        dynamic_buffer,
        boost::asio::bind_cancellation_slot(
            cancel_signal_.slot(),
            [&error, &read_done](const boost::system::error_code& ec,
                                 std::size_t) {
              error = ec;
              read_done.Notify();
            }));

    mu_.unlock();
    const int selected = thread::SelectUntil(
        deadline, {read_done.OnEvent(), thread::OnCancel()});
    mu_.lock();
    if (selected != 0) {
      cancel_signal_.emit(boost::asio::cancellation_type::total);
      mu_.unlock();
      // The handler references this frame.
      thread::Select({read_done.OnEvent()});
      mu_.lock();
    }

    if (selected == -1) {
      status = absl::DeadlineExceededError("Websocket read timed out");
      break;
    }
    if (selected == 1) {
      status = absl::CancelledError("WsRead cancelled");
      break;
    }
    if (error == boost::beast::websocket::error::closed ||
        error == boost::system::errc::operation_canceled) {
      status = absl::CancelledError("WsRead cancelled");
      break;
    }
    if (error) {
      LOG(ERROR) << "Cannot read from websocket stream: " << error.message();
      status = absl::InternalError(error.message());
      break;
    }
    if (!stream_->got_text()) {
      DLOG(INFO) << "Skipping " << received.size()
                 << "-byte binary websocket message";
      continue;
    }
    *message = std::move(received);
    break;
  }

  read_pending_ = false;
  cv_.SignalAll();
  return status;
}

}  // namespace rctl::net

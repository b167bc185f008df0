/** LICENSE TEMPLATE */
#include "websocket_upstream.h"

// cdpr
#include <utils/logger.h>

// boost
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/error.hpp>

// stdlib
#include <charconv>

namespace cdpr::cdp {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

RelayResult<WebSocketEndpoint>
ParseWebSocketUrl(std::string_view url) noexcept
{
  static constexpr std::string_view kScheme = "ws://";
  if (!url.starts_with(kScheme)) {
    return std::unexpected(RelayError::Invalid(fmt::format("Not a ws:// URL: '{}'", url)));
  }
  auto rest = url.substr(kScheme.size());
  const auto slash = rest.find('/');
  const auto authority = rest.substr(0, slash);
  WebSocketEndpoint endpoint{ .mHost = {}, .mPort = "80", .mTarget = "/" };
  if (slash != std::string_view::npos) {
    endpoint.mTarget = std::string{ rest.substr(slash) };
  }

  const auto colon = authority.rfind(':');
  if (colon == std::string_view::npos) {
    endpoint.mHost = std::string{ authority };
  } else {
    const auto port = authority.substr(colon + 1);
    u16 value = 0;
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0) {
      return std::unexpected(RelayError::Invalid(fmt::format("Bad port in '{}'", url)));
    }
    endpoint.mHost = std::string{ authority.substr(0, colon) };
    endpoint.mPort = std::string{ port };
  }

  if (endpoint.mHost.empty()) {
    return std::unexpected(RelayError::Invalid(fmt::format("No host in '{}'", url)));
  }
  return endpoint;
}

WebSocketUpstream::WebSocketUpstream(boost::asio::io_context &context) noexcept
    : mResolver(context), mStream(context)
{
}

/* static */
std::shared_ptr<Upstream>
WebSocketUpstream::Create(boost::asio::io_context &context) noexcept
{
  return std::make_shared<WebSocketUpstream>(context);
}

void
WebSocketUpstream::Open(const std::string &url, UpstreamListener *listener) noexcept
{
  mListener = listener;
  auto endpoint = ParseWebSocketUrl(url);
  if (!endpoint) {
    boost::asio::post(mStream.get_executor(), [self = shared_from_this(), message = endpoint.error().mMessage]() {
      if (auto *listener = std::exchange(self->mListener, nullptr); listener) {
        listener->OnUpstreamError(message);
      }
    });
    return;
  }
  mEndpoint = std::move(*endpoint);
  DBGLOG(relay, "resolving {}:{}", mEndpoint.mHost, mEndpoint.mPort);
  mResolver.async_resolve(mEndpoint.mHost,
    mEndpoint.mPort,
    [self = shared_from_this()](const boost::system::error_code &ec, tcp::resolver::results_type results) {
      self->OnResolved(ec, std::move(results));
    });
}

void
WebSocketUpstream::OnResolved(const boost::system::error_code &ec, tcp::resolver::results_type results) noexcept
{
  if (ec) {
    Fail("resolve", ec);
    return;
  }
  beast::get_lowest_layer(mStream).async_connect(
    results, [self = shared_from_this()](const boost::system::error_code &ec, const tcp::endpoint &) {
      self->OnConnected(ec);
    });
}

void
WebSocketUpstream::OnConnected(const boost::system::error_code &ec) noexcept
{
  if (ec) {
    Fail("connect", ec);
    return;
  }
  // The relay bounds the handshake. Once open, websocket pings take over.
  beast::get_lowest_layer(mStream).expires_never();
  mStream.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
  // Heap snapshot chunks and coverage results get large.
  mStream.read_message_max(0);
  mStream.async_handshake(fmt::format("{}:{}", mEndpoint.mHost, mEndpoint.mPort),
    mEndpoint.mTarget,
    [self = shared_from_this()](const boost::system::error_code &ec) { self->OnHandshake(ec); });
}

void
WebSocketUpstream::OnHandshake(const boost::system::error_code &ec) noexcept
{
  if (ec) {
    Fail("handshake", ec);
    return;
  }
  mOpen = true;
  if (mListener) {
    mListener->OnUpstreamOpen();
  }
  if (mClosing) {
    SendClose();
    return;
  }
  Read();
  WriteNext();
}

void
WebSocketUpstream::Read() noexcept
{
  mStream.async_read(mReadBuffer, [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
    if (ec) {
      self->Fail("read", ec);
      return;
    }
    const auto text = beast::buffers_to_string(self->mReadBuffer.data());
    self->mReadBuffer.consume(self->mReadBuffer.size());
    if (self->mListener) {
      self->mListener->OnUpstreamMessage(text);
    }
    if (!self->mClosing) {
      self->Read();
    }
  });
}

void
WebSocketUpstream::Send(std::string text) noexcept
{
  if (mClosing) {
    return;
  }
  mWriteQueue.push_back(std::move(text));
  WriteNext();
}

void
WebSocketUpstream::WriteNext() noexcept
{
  if (mWriting || !mOpen || mWriteQueue.empty()) {
    return;
  }
  mWriting = true;
  mStream.text(true);
  mStream.async_write(boost::asio::buffer(mWriteQueue.front()),
    [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
      self->mWriting = false;
      if (ec) {
        self->Fail("write", ec);
        return;
      }
      if (!self->mWriteQueue.empty()) {
        self->mWriteQueue.pop_front();
      }
      if (self->mClosing) {
        self->SendClose();
        return;
      }
      self->WriteNext();
    });
}

void
WebSocketUpstream::Fail(std::string_view what, const boost::system::error_code &ec) noexcept
{
  auto *listener = std::exchange(mListener, nullptr);
  if (!listener) {
    return;
  }
  if (ec == websocket::error::closed) {
    const auto &reason = mStream.reason();
    DBGLOG(relay, "upstream sent close {} '{}'", static_cast<int>(reason.code), reason.reason.c_str());
    listener->OnUpstreamClosed(
      static_cast<int>(reason.code), std::string_view{ reason.reason.data(), reason.reason.size() }, true);
    return;
  }
  listener->OnUpstreamError(fmt::format("{} failed: {}", what, ec.message()));
}

void
WebSocketUpstream::SendClose() noexcept
{
  mStream.async_close(websocket::close_code::normal, [self = shared_from_this()](const boost::system::error_code &ec) {
    if (ec) {
      DBGLOG(relay, "closing upstream: {}", ec.message());
    }
  });
}

void
WebSocketUpstream::Close() noexcept
{
  mListener = nullptr;
  if (mClosing) {
    return;
  }
  mClosing = true;
  if (mOpen) {
    // Only the write in flight, if any, is kept. The close frame follows it.
    while (mWriteQueue.size() > (mWriting ? 1u : 0u)) {
      mWriteQueue.pop_back();
    }
    if (!mWriting) {
      SendClose();
    }
    return;
  }
  mWriteQueue.clear();
  mResolver.cancel();
  beast::get_lowest_layer(mStream).cancel();
}

} // namespace cdpr::cdp

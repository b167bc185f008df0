/** LICENSE TEMPLATE */
#include "proxy_server.h"

// cdpr
#include <interface/cdp/protocol_relay.h>
#include <utils/logger.h>

// boost
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

// stdlib
#include <chrono>
#include <deque>
#include <memory>

namespace cdpr::cdp {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

static constexpr std::string_view kProxyBanner = "Debugger Proxy API is running.";

// One UI connected over WebSocket.
class ProxyClient final : public RelayClient, public std::enable_shared_from_this<ProxyClient>
{
  ProtocolRelay &mRelay;
  websocket::stream<beast::tcp_stream> mStream;
  beast::flat_buffer mReadBuffer;
  std::deque<std::string> mWriteQueue;
  ClientId mId{ 0 };
  bool mWriting{ false };
  bool mClosed{ false };

  void
  Read() noexcept
  {
    mStream.async_read(mReadBuffer, [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
      if (ec) {
        self->Disconnected(ec);
        return;
      }
      const auto text = beast::buffers_to_string(self->mReadBuffer.data());
      self->mReadBuffer.consume(self->mReadBuffer.size());
      self->mRelay.OnClientMessage(self->mId, std::string_view{text});
      if (!self->mClosed) {
        self->Read();
      }
    });
  }

  void
  WriteNext() noexcept
  {
    if (mWriting || mWriteQueue.empty() || mClosed) {
      return;
    }
    mWriting = true;
    mStream.text(true);
    mStream.async_write(boost::asio::buffer(mWriteQueue.front()),
      [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
        self->mWriting = false;
        if (ec) {
          self->Disconnected(ec);
          return;
        }
        self->mWriteQueue.pop_front();
        self->WriteNext();
      });
  }

  void
  Disconnected(const boost::system::error_code &ec) noexcept
  {
    if (mClosed) {
      return;
    }
    mClosed = true;
    mWriteQueue.clear();
    DBGLOG(relay, "client {} went away: {}", mId, ec.message());
    mRelay.RemoveClient(mId);
  }

public:
  ProxyClient(ProtocolRelay &relay, beast::tcp_stream &&stream) noexcept : mRelay(relay), mStream(std::move(stream))
  {
  }

  void
  Accept(http::request<http::string_body> upgrade) noexcept
  {
    beast::get_lowest_layer(mStream).expires_never();
    mStream.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    mStream.read_message_max(0);
    mStream.async_accept(upgrade, [self = shared_from_this()](const boost::system::error_code &ec) {
      if (ec) {
        DBGLOG(relay, "websocket accept failed: {}", ec.message());
        return;
      }
      self->mId = self->mRelay.AddClient(self);
      DBGLOG(relay, "client {} connected", self->mId);
      self->Read();
    });
  }

  void
  Deliver(const Json &, const std::string &serialized) noexcept final
  {
    if (mClosed) {
      return;
    }
    mWriteQueue.push_back(serialized);
    WriteNext();
  }

  void
  Close(std::string_view reason) noexcept final
  {
    if (mClosed) {
      return;
    }
    mClosed = true;
    mWriteQueue.clear();
    DBGLOG(relay, "closing client {}: {}", mId, reason);
    // Close frame reasons are capped at 123 bytes.
    const auto text = reason.substr(0, 120);
    const websocket::close_reason why{ websocket::close_code::going_away, beast::string_view{ text.data(), text.size() } };
    mStream.async_close(why, [self = shared_from_this()](const boost::system::error_code &) {});
  }
};

// Reads the first request of a fresh connection and decides what it is.
class ProxyHandshake final : public std::enable_shared_from_this<ProxyHandshake>
{
  ProtocolRelay &mRelay;
  beast::tcp_stream mStream;
  beast::flat_buffer mBuffer;
  http::request<http::string_body> mRequest;
  http::response<http::string_body> mResponse;

public:
  ProxyHandshake(ProtocolRelay &relay, tcp::socket &&socket) noexcept : mRelay(relay), mStream(std::move(socket)) {}

  void
  Run() noexcept
  {
    mStream.expires_after(std::chrono::seconds{ 30 });
    http::async_read(
      mStream, mBuffer, mRequest, [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
        if (ec) {
          DBGLOG(relay, "proxy request read failed: {}", ec.message());
          return;
        }
        self->OnRequest();
      });
  }

  void
  OnRequest() noexcept
  {
    if (websocket::is_upgrade(mRequest)) {
      auto client = std::make_shared<ProxyClient>(mRelay, std::move(mStream));
      client->Accept(std::move(mRequest));
      return;
    }

    mResponse.version(mRequest.version());
    mResponse.result(http::status::ok);
    mResponse.set(http::field::content_type, "text/plain");
    mResponse.keep_alive(false);
    mResponse.body() = std::string{ kProxyBanner };
    mResponse.prepare_payload();
    http::async_write(
      mStream, mResponse, [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
        boost::system::error_code ignored;
        self->mStream.socket().shutdown(tcp::socket::shutdown_send, ignored);
        if (ec) {
          DBGLOG(relay, "proxy response write failed: {}", ec.message());
        }
      });
  }
};

ProxyServer::ProxyServer(boost::asio::io_context &context, ProtocolRelay &relay) noexcept
    : mContext(context), mRelay(relay), mAcceptor(context)
{
}

RelayResult<void>
ProxyServer::Listen(const std::string &address, u16 port) noexcept
{
  boost::system::error_code ec;
  const auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::unexpected(RelayError::Invalid(fmt::format("Bad listen address '{}': {}", address, ec.message())));
  }
  const tcp::endpoint endpoint{ ip, port };
  if (mAcceptor.open(endpoint.protocol(), ec); ec) {
    return std::unexpected(RelayError::Connection(fmt::format("proxy socket: {}", ec.message())));
  }
  mAcceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (mAcceptor.bind(endpoint, ec); ec) {
    return std::unexpected(
      RelayError::Connection(fmt::format("Can't bind proxy to {}:{}: {}", address, port, ec.message())));
  }
  if (mAcceptor.listen(boost::asio::socket_base::max_listen_connections, ec); ec) {
    return std::unexpected(RelayError::Connection(fmt::format("proxy listen: {}", ec.message())));
  }
  DBGLOG(relay, "proxy listening on {}:{}", address, Port());
  Accept();
  return {};
}

void
ProxyServer::Accept() noexcept
{
  mAcceptor.async_accept(mContext, [this](const boost::system::error_code &ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        DBGLOG(warning, "proxy accept failed: {}", ec.message());
        Accept();
      }
      return;
    }
    std::make_shared<ProxyHandshake>(mRelay, std::move(socket))->Run();
    Accept();
  });
}

void
ProxyServer::Stop() noexcept
{
  boost::system::error_code ignored;
  mAcceptor.close(ignored);
}

u16
ProxyServer::Port() const noexcept
{
  boost::system::error_code ec;
  const auto endpoint = mAcceptor.local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

} // namespace cdpr::cdp

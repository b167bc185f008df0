/** LICENSE TEMPLATE */
#include "http_server.h"

// cdpr
#include <interface/http/session_api.h>
#include <utils/logger.h>

// boost
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

// stdlib
#include <chrono>
#include <memory>

namespace cdpr::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

static constexpr auto kIdleTimeout = std::chrono::seconds{ 60 };

class HttpConnection final : public std::enable_shared_from_this<HttpConnection>
{
  SessionApi &mApi;
  beast::tcp_stream mStream;
  beast::flat_buffer mBuffer;
  bhttp::request<bhttp::string_body> mRequest;
  bhttp::response<bhttp::string_body> mResponse;
  ApiRequest mCurrent;

  void
  Read() noexcept
  {
    mRequest = {};
    mStream.expires_after(kIdleTimeout);
    bhttp::async_read(
      mStream, mBuffer, mRequest, [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
        if (ec) {
          if (ec != bhttp::error::end_of_stream && ec != beast::error::timeout) {
            DBGLOG(http, "request read failed: {}", ec.message());
          }
          self->Shutdown();
          return;
        }
        self->OnRequest();
      });
  }

  void
  OnRequest() noexcept
  {
    const auto method = mRequest.method_string();
    const auto target = mRequest.target();
    mCurrent = ApiRequest{ .mMethod = std::string(method.data(), method.size()),
      .mTarget = std::string(target.data(), target.size()),
      .mBody = mRequest.body() };
    // The API may answer after this returns. The connection is kept until it does.
    mApi.Handle(mCurrent, [self = shared_from_this()](ApiResponse response) { self->Write(std::move(response)); });
  }

  void
  Write(ApiResponse response) noexcept
  {
    mResponse = {};
    mResponse.version(mRequest.version());
    mResponse.result(static_cast<bhttp::status>(response.mStatus));
    mResponse.set(bhttp::field::content_type, "application/json");
    mResponse.keep_alive(mRequest.keep_alive());
    mResponse.body() = response.mBody.dump();
    mResponse.prepare_payload();
    DBGLOG(http, "{} {} -> {}", mCurrent.mMethod, mCurrent.mTarget, response.mStatus);

    mStream.expires_after(kIdleTimeout);
    bhttp::async_write(mStream, mResponse, [self = shared_from_this()](const boost::system::error_code &ec, std::size_t) {
      if (ec) {
        DBGLOG(http, "response write failed: {}", ec.message());
        return;
      }
      if (!self->mResponse.keep_alive()) {
        self->Shutdown();
        return;
      }
      self->Read();
    });
  }

  void
  Shutdown() noexcept
  {
    boost::system::error_code ignored;
    mStream.socket().shutdown(tcp::socket::shutdown_send, ignored);
  }

public:
  HttpConnection(SessionApi &api, tcp::socket &&socket) noexcept : mApi(api), mStream(std::move(socket)) {}

  void
  Run() noexcept
  {
    Read();
  }
};

HttpServer::HttpServer(boost::asio::io_context &context, SessionApi &api) noexcept
    : mContext(context), mApi(api), mAcceptor(context)
{
}

RelayResult<void>
HttpServer::Listen(const std::string &address, u16 port) noexcept
{
  boost::system::error_code ec;
  const auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    return std::unexpected(RelayError::Invalid(fmt::format("Bad listen address '{}': {}", address, ec.message())));
  }
  const tcp::endpoint endpoint{ ip, port };
  if (mAcceptor.open(endpoint.protocol(), ec); ec) {
    return std::unexpected(RelayError::Connection(fmt::format("api socket: {}", ec.message())));
  }
  mAcceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (mAcceptor.bind(endpoint, ec); ec) {
    return std::unexpected(
      RelayError::Connection(fmt::format("Can't bind API to {}:{}: {}", address, port, ec.message())));
  }
  if (mAcceptor.listen(boost::asio::socket_base::max_listen_connections, ec); ec) {
    return std::unexpected(RelayError::Connection(fmt::format("api listen: {}", ec.message())));
  }
  DBGLOG(http, "session API listening on {}:{}", address, Port());
  Accept();
  return {};
}

void
HttpServer::Accept() noexcept
{
  mAcceptor.async_accept(mContext, [this](const boost::system::error_code &ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        DBGLOG(warning, "api accept failed: {}", ec.message());
        Accept();
      }
      return;
    }
    std::make_shared<HttpConnection>(mApi, std::move(socket))->Run();
    Accept();
  });
}

void
HttpServer::Stop() noexcept
{
  boost::system::error_code ignored;
  mAcceptor.close(ignored);
}

u16
HttpServer::Port() const noexcept
{
  boost::system::error_code ec;
  const auto endpoint = mAcceptor.local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

} // namespace cdpr::http

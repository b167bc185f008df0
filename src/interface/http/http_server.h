/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <common/typedefs.h>

// boost
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

// stdlib
#include <string>

namespace cdpr::http {

class SessionApi;

// HTTP/1.1 front for the session API on the API port. Connections are kept alive between requests.
class HttpServer
{
  boost::asio::io_context &mContext;
  SessionApi &mApi;
  boost::asio::ip::tcp::acceptor mAcceptor;

  void Accept() noexcept;

public:
  NO_COPY(HttpServer);
  HttpServer(boost::asio::io_context &context, SessionApi &api) noexcept;

  // ConnectionError when the address can't be bound.
  RelayResult<void> Listen(const std::string &address, u16 port) noexcept;
  void Stop() noexcept;
  u16 Port() const noexcept;
};

} // namespace cdpr::http

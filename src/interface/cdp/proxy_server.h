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

namespace cdpr::cdp {

class ProtocolRelay;

// Accepts UI connections on the proxy port. WebSocket upgrades become relay clients, anything else gets a short
// plain text answer so that health checks work against the port.
class ProxyServer
{
  boost::asio::io_context &mContext;
  ProtocolRelay &mRelay;
  boost::asio::ip::tcp::acceptor mAcceptor;

  void Accept() noexcept;

public:
  NO_COPY(ProxyServer);
  ProxyServer(boost::asio::io_context &context, ProtocolRelay &relay) noexcept;

  // Binds and starts accepting. ConnectionError when the address can't be bound.
  RelayResult<void> Listen(const std::string &address, u16 port) noexcept;
  void Stop() noexcept;
  u16 Port() const noexcept;
};

} // namespace cdpr::cdp

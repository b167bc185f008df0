/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <interface/cdp/protocol_relay.h>

// boost
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

// stdlib
#include <deque>
#include <memory>
#include <string>
#include <string_view>

namespace cdpr::cdp {

struct WebSocketEndpoint
{
  std::string mHost;
  std::string mPort;
  // Path and query, at least "/".
  std::string mTarget;
};

// Splits `ws://host[:port][/path]`. InvalidArgument for anything else.
RelayResult<WebSocketEndpoint> ParseWebSocketUrl(std::string_view url) noexcept;

// The connection to the debuggee's inspector endpoint.
class WebSocketUpstream final : public Upstream, public std::enable_shared_from_this<WebSocketUpstream>
{
  boost::asio::ip::tcp::resolver mResolver;
  boost::beast::websocket::stream<boost::beast::tcp_stream> mStream;
  boost::beast::flat_buffer mReadBuffer;
  std::deque<std::string> mWriteQueue;
  UpstreamListener *mListener{ nullptr };
  WebSocketEndpoint mEndpoint;
  bool mOpen{ false };
  bool mClosing{ false };
  bool mWriting{ false };

  void OnResolved(const boost::system::error_code &ec, boost::asio::ip::tcp::resolver::results_type results) noexcept;
  void OnConnected(const boost::system::error_code &ec) noexcept;
  void OnHandshake(const boost::system::error_code &ec) noexcept;
  void Read() noexcept;
  void WriteNext() noexcept;
  void SendClose() noexcept;
  // Reports the end of the connection to the listener, once.
  void Fail(std::string_view what, const boost::system::error_code &ec) noexcept;

public:
  NO_COPY(WebSocketUpstream);
  explicit WebSocketUpstream(boost::asio::io_context &context) noexcept;
  ~WebSocketUpstream() noexcept final = default;

  static std::shared_ptr<Upstream> Create(boost::asio::io_context &context) noexcept;

  void Open(const std::string &url, UpstreamListener *listener) noexcept final;
  void Send(std::string text) noexcept final;
  void Close() noexcept final;
};

} // namespace cdpr::cdp

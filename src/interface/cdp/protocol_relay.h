/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <events/event_dispatcher.h>
#include <interface/cdp/protocol.h>
#include <interface/cdp/request_correlator.h>

// boost
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

// stdlib
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace cdpr::cdp {

// A downstream connection (a DevTools UI over WebSocket, or the in-process correlator).
class RelayClient
{
public:
  virtual ~RelayClient() noexcept = default;
  // `serialized` is `message` already dumped, so broadcasts serialize once.
  virtual void Deliver(const Json &message, const std::string &serialized) noexcept = 0;
  virtual void Close(std::string_view reason) noexcept = 0;
};

class UpstreamListener
{
public:
  virtual ~UpstreamListener() noexcept = default;
  virtual void OnUpstreamOpen() noexcept = 0;
  virtual void OnUpstreamMessage(std::string_view text) noexcept = 0;
  virtual void OnUpstreamError(std::string_view message) noexcept = 0;
  virtual void OnUpstreamClosed(int code, std::string_view reason, bool wasClean) noexcept = 0;
};

// The connection to the debuggee's inspector endpoint.
class Upstream
{
public:
  virtual ~Upstream() noexcept = default;
  virtual void Open(const std::string &url, UpstreamListener *listener) noexcept = 0;
  virtual void Send(std::string text) noexcept = 0;
  // Detaches the listener before closing; no listener callbacks happen after this returns.
  virtual void Close() noexcept = 0;
};

using UpstreamFactory = std::function<std::shared_ptr<Upstream>(boost::asio::io_context &)>;
using ConnectCallback = std::function<void(RelayResult<void>)>;

// WebSocket proxy between one inspector endpoint and any number of clients. Client request ids are rewritten into
// one relay wide id space before going upstream, and rewritten back when the response is routed to the client
// that sent it. Events go to every client and to the dispatcher.
//
// Reactor thread only.
class ProtocolRelay final : private UpstreamListener
{
  struct ClientConnection
  {
    ClientId mId;
    std::shared_ptr<RelayClient> mClient;
    // The in-process correlator. It gets responses but no broadcasts.
    bool mIsLocal;
    std::unordered_set<MessageId> mOutstanding;
  };

  struct Route
  {
    ClientId mClient;
    Json mOriginalId;
  };

  // Hands the correlator's commands to the relay as if they came from a client.
  class LocalTransport final : public Transport
  {
    ProtocolRelay &mRelay;

  public:
    explicit LocalTransport(ProtocolRelay &relay) noexcept : mRelay(relay) {}
    bool IsConnected() const noexcept final;
    void Send(const Json &message) noexcept final;
    void Abandon(MessageId id) noexcept final;
  };

  boost::asio::io_context &mContext;
  EventDispatcher &mDispatcher;
  RequestCorrelator &mCorrelator;
  UpstreamFactory mUpstreamFactory;

  std::shared_ptr<Upstream> mUpstream{ nullptr };
  bool mUpstreamOpen{ false };
  std::string mUpstreamUrl{};
  std::unique_ptr<boost::asio::steady_timer> mHandshakeTimer{ nullptr };
  ConnectCallback mConnectCallback{ nullptr };

  std::map<ClientId, ClientConnection> mClients;
  std::unordered_map<MessageId, Route> mRoutes;
  // Correlator id -> global id, for releasing the route of a command that timed out.
  std::unordered_map<MessageId, MessageId> mLocalRoutes;
  MessageId mNextGlobalId{ 1 };
  ClientId mNextClientId{ 1 };

  LocalTransport mLocalTransport;
  ClientId mLocalClientId{ 0 };

  void OnUpstreamOpen() noexcept final;
  void OnUpstreamMessage(std::string_view text) noexcept final;
  void OnUpstreamError(std::string_view message) noexcept final;
  void OnUpstreamClosed(int code, std::string_view reason, bool wasClean) noexcept final;

  void RouteResponse(Json message) noexcept;
  void ReleaseLocal(MessageId localId) noexcept;
  void Broadcast(const Json &message) noexcept;
  void ReplyError(ClientId client, const Json &id, int code, std::string_view message) noexcept;
  void TearDown(int code, std::string_view reason, bool wasClean) noexcept;
  void FinishConnect(RelayResult<void> result) noexcept;

public:
  NO_COPY(ProtocolRelay);
  ProtocolRelay(boost::asio::io_context &context,
    EventDispatcher &dispatcher,
    RequestCorrelator &correlator,
    UpstreamFactory upstreamFactory) noexcept;
  ~ProtocolRelay() noexcept;

  // Opens the upstream connection. `callback` gets the outcome once: handshake done, failed, or timed out.
  void Connect(std::string url, std::chrono::milliseconds handshakeTimeout, ConnectCallback callback) noexcept;
  // Tears the upstream down. Clients stay connected and are told through `Proxy.closed`.
  void Disconnect(std::string_view reason) noexcept;

  ClientId AddClient(std::shared_ptr<RelayClient> client) noexcept;
  void RemoveClient(ClientId client) noexcept;
  // Closes and forgets every remote client. Used at shutdown.
  void CloseClients(std::string_view reason) noexcept;
  void OnClientMessage(ClientId client, std::string_view text) noexcept;
  void OnClientMessage(ClientId client, Json message) noexcept;

  bool IsUpstreamOpen() const noexcept;
  bool HasUpstream() const noexcept;
  const std::string &UpstreamUrl() const noexcept;
  // Remote clients only.
  size_t ClientCount() const noexcept;
  size_t InFlightCount() const noexcept;
};

} // namespace cdpr::cdp

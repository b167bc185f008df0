/** LICENSE TEMPLATE */
#include "protocol_relay.h"

// cdpr
#include <common.h>
#include <utils/logger.h>

// stdlib
#include <vector>

namespace cdpr::cdp {

// WebSocket close code for a connection that went away without a close frame.
static constexpr int kAbnormalClosure = 1006;
static constexpr int kNormalClosure = 1000;

namespace {
class CorrelatorClient final : public RelayClient
{
  RequestCorrelator &mCorrelator;

public:
  explicit CorrelatorClient(RequestCorrelator &correlator) noexcept : mCorrelator(correlator) {}

  void
  Deliver(const Json &message, const std::string &) noexcept final
  {
    mCorrelator.HandleMessage(message);
  }

  void
  Close(std::string_view) noexcept final
  {
  }
};
} // namespace

bool
ProtocolRelay::LocalTransport::IsConnected() const noexcept
{
  return mRelay.IsUpstreamOpen();
}

void
ProtocolRelay::LocalTransport::Send(const Json &message) noexcept
{
  mRelay.OnClientMessage(mRelay.mLocalClientId, message);
}

void
ProtocolRelay::LocalTransport::Abandon(MessageId id) noexcept
{
  mRelay.ReleaseLocal(id);
}

ProtocolRelay::ProtocolRelay(boost::asio::io_context &context,
  EventDispatcher &dispatcher,
  RequestCorrelator &correlator,
  UpstreamFactory upstreamFactory) noexcept
    : mContext(context), mDispatcher(dispatcher), mCorrelator(correlator),
      mUpstreamFactory(std::move(upstreamFactory)), mLocalTransport(*this)
{
  mLocalClientId = mNextClientId++;
  mClients.emplace(mLocalClientId,
    ClientConnection{ .mId = mLocalClientId,
      .mClient = std::make_shared<CorrelatorClient>(mCorrelator),
      .mIsLocal = true,
      .mOutstanding = {} });
}

ProtocolRelay::~ProtocolRelay() noexcept
{
  if (mUpstream) {
    mUpstream->Close();
  }
  if (mHandshakeTimer) {
    mHandshakeTimer->cancel();
  }
}

void
ProtocolRelay::Connect(std::string url, std::chrono::milliseconds handshakeTimeout, ConnectCallback callback) noexcept
{
  if (mUpstream) {
    callback(std::unexpected(
      RelayError::SessionConflict(fmt::format("Relay is already connected to {}", mUpstreamUrl))));
    return;
  }

  DBGLOG(relay, "connecting upstream to {} (handshake timeout {}ms)", url, handshakeTimeout.count());
  mUpstreamUrl = std::move(url);
  mConnectCallback = std::move(callback);
  mUpstream = mUpstreamFactory(mContext);
  VERIFY(mUpstream != nullptr, "Upstream factory produced no upstream");

  mHandshakeTimer = std::make_unique<boost::asio::steady_timer>(mContext, handshakeTimeout);
  mHandshakeTimer->async_wait([this, timeout = handshakeTimeout](const boost::system::error_code &ec) {
    if (ec || mUpstreamOpen || !mUpstream) {
      return;
    }
    DBGLOG(relay, "handshake with {} timed out", mUpstreamUrl);
    auto callback = std::move(mConnectCallback);
    mConnectCallback = nullptr;
    TearDown(kAbnormalClosure, "handshake timeout", false);
    if (callback) {
      callback(std::unexpected(
        RelayError::Timeout(fmt::format("WebSocket handshake did not complete within {}ms", timeout.count()))));
    }
  });

  // Keep our own reference, Open may fail synchronously and tear `mUpstream` down.
  auto upstream = mUpstream;
  upstream->Open(mUpstreamUrl, this);
}

void
ProtocolRelay::Disconnect(std::string_view reason) noexcept
{
  if (!mUpstream) {
    return;
  }
  DBGLOG(relay, "disconnecting upstream: {}", reason);
  TearDown(kNormalClosure, reason, true);
}

void
ProtocolRelay::FinishConnect(RelayResult<void> result) noexcept
{
  if (mConnectCallback) {
    auto callback = std::move(mConnectCallback);
    mConnectCallback = nullptr;
    callback(std::move(result));
  }
}

void
ProtocolRelay::OnUpstreamOpen() noexcept
{
  if (mHandshakeTimer) {
    mHandshakeTimer->cancel();
  }
  mUpstreamOpen = true;
  DBGLOG(relay, "upstream {} open", mUpstreamUrl);
  mDispatcher.Publish(kWebSocketOpen, Json::object());
  mCorrelator.AttachTransport(&mLocalTransport);
  mDispatcher.Publish(kProxyReady, Json::object());
  Broadcast(MakeEvent(kProxyReady, Json::object()));
  FinishConnect({});
}

void
ProtocolRelay::OnUpstreamMessage(std::string_view text) noexcept
{
  auto parsed = ParseMessage(text);
  if (!parsed) {
    DBGLOG(warning, "dropping unparseable upstream message ({} bytes)", text.size());
    return;
  }

  switch (Classify(*parsed)) {
  case MessageKind::Response:
  case MessageKind::ErrorResponse:
    RouteResponse(std::move(*parsed));
    break;
  case MessageKind::Event: {
    const auto method = (*parsed)["method"].get<std::string>();
    CDLOG(true, relay, "event {}", method);
    Broadcast(*parsed);
    const auto params = parsed->find("params");
    mDispatcher.Publish(method, params != parsed->end() ? *params : Json::object());
    break;
  }
  case MessageKind::Request:
  case MessageKind::Invalid:
    DBGLOG(warning, "dropping unexpected upstream message: {}", text.substr(0, 200));
    break;
  }
}

void
ProtocolRelay::OnUpstreamError(std::string_view message) noexcept
{
  DBGLOG(relay, "upstream error: {}", message);
  mDispatcher.Publish(kWebSocketError, Json{ { "message", message } });
  TearDown(kAbnormalClosure, message, false);
}

void
ProtocolRelay::OnUpstreamClosed(int code, std::string_view reason, bool wasClean) noexcept
{
  DBGLOG(relay, "upstream closed: {} {} clean={}", code, reason, wasClean);
  TearDown(code, reason, wasClean);
}

void
ProtocolRelay::TearDown(int code, std::string_view reason, bool wasClean) noexcept
{
  if (!mUpstream) {
    return;
  }
  const std::string why{ reason };
  auto upstream = std::move(mUpstream);
  mUpstream = nullptr;
  upstream->Close();
  const bool wasOpen = mUpstreamOpen;
  mUpstreamOpen = false;
  if (mHandshakeTimer) {
    mHandshakeTimer->cancel();
  }

  mCorrelator.HandleDisconnect(why);

  // Everything still in flight for remote clients is answered here, nothing will come back for it.
  auto routes = std::move(mRoutes);
  mRoutes.clear();
  mLocalRoutes.clear();
  for (auto &[globalId, route] : routes) {
    auto client = mClients.find(route.mClient);
    if (client == mClients.end()) {
      continue;
    }
    client->second.mOutstanding.erase(globalId);
    if (!client->second.mIsLocal) {
      ReplyError(route.mClient, route.mOriginalId, kServerErrorCode, fmt::format("Connection closed: {}", why));
    }
  }

  if (wasOpen) {
    mDispatcher.Publish(kWebSocketClose, Json{ { "code", code }, { "reason", why } });
  }
  const Json closed{ { "code", code }, { "reason", why }, { "wasClean", wasClean } };
  mDispatcher.Publish(kProxyClosed, closed);
  Broadcast(MakeEvent(kProxyClosed, closed));

  FinishConnect(std::unexpected(RelayError::Connection(fmt::format("Upstream closed: {}", why))));
}

ClientId
ProtocolRelay::AddClient(std::shared_ptr<RelayClient> client) noexcept
{
  const ClientId id = mNextClientId++;
  auto [it, inserted] = mClients.emplace(
    id, ClientConnection{ .mId = id, .mClient = std::move(client), .mIsLocal = false, .mOutstanding = {} });
  VERIFY(inserted, "Client id {} reused", id);
  DBGLOG(relay, "client {} connected ({} clients)", id, ClientCount());
  if (mUpstreamOpen) {
    const auto ready = MakeEvent(kProxyReady, Json::object());
    it->second.mClient->Deliver(ready, ready.dump());
  }
  return id;
}

void
ProtocolRelay::RemoveClient(ClientId client) noexcept
{
  VERIFY(client != mLocalClientId, "The in-process client can't be removed");
  auto it = mClients.find(client);
  if (it == mClients.end()) {
    return;
  }
  for (const auto globalId : it->second.mOutstanding) {
    mRoutes.erase(globalId);
  }
  DBGLOG(relay, "client {} disconnected, dropped {} in-flight requests", client, it->second.mOutstanding.size());
  mClients.erase(it);
}

void
ProtocolRelay::CloseClients(std::string_view reason) noexcept
{
  std::vector<std::shared_ptr<RelayClient>> closing;
  for (auto it = mClients.begin(); it != mClients.end();) {
    if (it->second.mIsLocal) {
      ++it;
      continue;
    }
    for (const auto globalId : it->second.mOutstanding) {
      mRoutes.erase(globalId);
    }
    closing.push_back(std::move(it->second.mClient));
    it = mClients.erase(it);
  }
  DBGLOG(relay, "closing {} clients: {}", closing.size(), reason);
  for (auto &client : closing) {
    client->Close(reason);
  }
}

void
ProtocolRelay::OnClientMessage(ClientId client, std::string_view text) noexcept
{
  auto parsed = ParseMessage(text);
  if (!parsed) {
    DBGLOG(warning, "client {} sent a message that is not JSON, dropped", client);
    return;
  }
  OnClientMessage(client, std::move(*parsed));
}

void
ProtocolRelay::OnClientMessage(ClientId client, Json message) noexcept
{
  auto connection = mClients.find(client);
  if (connection == mClients.end()) {
    DBGLOG(warning, "message from unknown client {} dropped", client);
    return;
  }

  if (!message.is_object() || !message.contains("id")) {
    DBGLOG(warning, "client {} sent a message without an id, dropped", client);
    return;
  }

  const Json originalId = message["id"];
  const auto method = message.find("method");
  if (!originalId.is_number_integer() || method == message.end() || !method->is_string()) {
    ReplyError(client, originalId, kInvalidRequestCode, "Invalid request: expected numeric id and string method");
    return;
  }

  if (!mUpstreamOpen) {
    ReplyError(client, originalId, kServerErrorCode, kNoActiveSession);
    return;
  }

  const MessageId globalId = mNextGlobalId++;
  mRoutes.emplace(globalId, Route{ .mClient = client, .mOriginalId = originalId });
  connection->second.mOutstanding.insert(globalId);
  if (connection->second.mIsLocal) {
    mLocalRoutes[originalId.get<MessageId>()] = globalId;
  }
  message["id"] = globalId;
  CDLOG(true, relay, "client {} id {} -> {} ({})", client, originalId.dump(), globalId, method->get<std::string>());
  mUpstream->Send(message.dump());
}

void
ProtocolRelay::RouteResponse(Json message) noexcept
{
  const auto &idValue = message["id"];
  if (!idValue.is_number_unsigned()) {
    DBGLOG(warning, "upstream response with id {} was never issued by the relay", idValue.dump());
    return;
  }
  const auto globalId = idValue.get<MessageId>();
  auto node = mRoutes.extract(globalId);
  if (node.empty()) {
    DBGLOG(relay, "late response {} for a request nobody waits on, discarded", globalId);
    return;
  }
  const auto &route = node.mapped();
  auto client = mClients.find(route.mClient);
  if (client == mClients.end()) {
    return;
  }
  client->second.mOutstanding.erase(globalId);
  if (client->second.mIsLocal) {
    mLocalRoutes.erase(route.mOriginalId.get<MessageId>());
  }
  message["id"] = route.mOriginalId;
  // Hold the client, delivering may remove it.
  auto target = client->second.mClient;
  target->Deliver(message, message.dump());
}

void
ProtocolRelay::ReleaseLocal(MessageId localId) noexcept
{
  auto node = mLocalRoutes.extract(localId);
  if (node.empty()) {
    return;
  }
  const auto globalId = node.mapped();
  mRoutes.erase(globalId);
  if (auto local = mClients.find(mLocalClientId); local != mClients.end()) {
    local->second.mOutstanding.erase(globalId);
  }
  DBGLOG(relay, "released route {} of abandoned command {}", globalId, localId);
}

void
ProtocolRelay::Broadcast(const Json &message) noexcept
{
  std::vector<std::shared_ptr<RelayClient>> targets;
  targets.reserve(mClients.size());
  for (const auto &[id, connection] : mClients) {
    if (!connection.mIsLocal) {
      targets.push_back(connection.mClient);
    }
  }
  if (targets.empty()) {
    return;
  }
  const auto serialized = message.dump();
  for (const auto &client : targets) {
    client->Deliver(message, serialized);
  }
}

void
ProtocolRelay::ReplyError(ClientId client, const Json &id, int code, std::string_view message) noexcept
{
  auto it = mClients.find(client);
  if (it == mClients.end()) {
    return;
  }
  const auto response = MakeErrorResponse(id, code, message);
  auto target = it->second.mClient;
  target->Deliver(response, response.dump());
}

bool
ProtocolRelay::IsUpstreamOpen() const noexcept
{
  return mUpstreamOpen;
}

bool
ProtocolRelay::HasUpstream() const noexcept
{
  return mUpstream != nullptr;
}

const std::string &
ProtocolRelay::UpstreamUrl() const noexcept
{
  return mUpstreamUrl;
}

size_t
ProtocolRelay::ClientCount() const noexcept
{
  return mClients.size() - 1;
}

size_t
ProtocolRelay::InFlightCount() const noexcept
{
  return mRoutes.size();
}

} // namespace cdpr::cdp

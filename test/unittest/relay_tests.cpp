#include "test_helpers.h"
#include <events/event_dispatcher.h>
#include <gtest/gtest.h>
#include <interface/cdp/protocol_relay.h>
#include <interface/cdp/request_correlator.h>
#include <interface/cdp/websocket_upstream.h>

using cdpr::EventDispatcher;
using cdpr::Json;
using cdpr::RelayResult;
using cdpr::cdp::CommandResult;
using cdpr::cdp::ParseWebSocketUrl;
using cdpr::cdp::ProtocolRelay;
using cdpr::cdp::RequestCorrelator;
using cdpr::test::FailsWith;
using cdpr::test::FakeUpstreamFactory;
using cdpr::test::PumpUntil;
using cdpr::test::RecordingClient;
using namespace std::chrono_literals;

struct RelayFixture
{
  boost::asio::io_context mContext;
  EventDispatcher mDispatcher;
  RequestCorrelator mCorrelator;
  FakeUpstreamFactory mUpstreams;
  ProtocolRelay mRelay;
  std::vector<std::string> mTopics;
  std::optional<RelayResult<void>> mConnected;

  explicit RelayFixture(std::chrono::milliseconds commandTimeout = 5000ms)
      : mCorrelator(mContext, commandTimeout), mRelay(mContext, mDispatcher, mCorrelator, mUpstreams.Factory())
  {
    mDispatcher.Subscribe("*", [this](std::string_view topic, const Json &) { mTopics.emplace_back(topic); });
  }

  void
  Connect()
  {
    mRelay.Connect("ws://127.0.0.1:9229/abc", 1000ms, [this](RelayResult<void> r) { mConnected = std::move(r); });
    mUpstreams.mLast->Accept();
  }

  bool
  Published(std::string_view topic) const
  {
    return std::find(mTopics.begin(), mTopics.end(), topic) != mTopics.end();
  }
};

TEST(ProtocolRelay, ConnectPublishesLifecycleAndAttachesCorrelator)
{
  RelayFixture fx;
  auto early = std::make_shared<RecordingClient>();
  fx.mRelay.AddClient(early);
  EXPECT_FALSE(fx.mCorrelator.IsConnected());

  fx.Connect();
  ASSERT_TRUE(fx.mConnected.has_value() && fx.mConnected->has_value());
  EXPECT_EQ(fx.mUpstreams.mLast->mUrl, "ws://127.0.0.1:9229/abc");
  EXPECT_TRUE(fx.Published("WebSocket.open"));
  EXPECT_TRUE(fx.Published("Proxy.ready"));
  EXPECT_TRUE(fx.mCorrelator.IsConnected());
  EXPECT_EQ(early->Events("Proxy.ready").size(), 1);

  // Late joiners are told right away.
  auto late = std::make_shared<RecordingClient>();
  fx.mRelay.AddClient(late);
  EXPECT_EQ(late->Events("Proxy.ready").size(), 1);
  EXPECT_EQ(fx.mRelay.ClientCount(), 2);
}

TEST(ProtocolRelay, SecondConnectIsAConflict)
{
  RelayFixture fx;
  fx.Connect();
  std::optional<RelayResult<void>> second;
  fx.mRelay.Connect("ws://127.0.0.1:9230/x", 1000ms, [&](RelayResult<void> r) { second = std::move(r); });
  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(FailsWith(*second, ErrorKind::SessionConflictError));
}

TEST(ProtocolRelay, HandshakeTimeout)
{
  RelayFixture fx;
  fx.mRelay.Connect("ws://127.0.0.1:9229/abc", 30ms, [&](RelayResult<void> r) { fx.mConnected = std::move(r); });
  ASSERT_TRUE(PumpUntil(fx.mContext, [&] { return fx.mConnected.has_value(); }, 2000ms));
  EXPECT_TRUE(FailsWith(*fx.mConnected, ErrorKind::TimeoutError));
  EXPECT_FALSE(fx.mRelay.HasUpstream());
  EXPECT_TRUE(fx.mUpstreams.mLast->mClosed);
  EXPECT_TRUE(fx.Published("Proxy.closed"));
}

TEST(ProtocolRelay, ClientIdsAreRemappedAndRoutedBack)
{
  RelayFixture fx;
  fx.Connect();
  auto a = std::make_shared<RecordingClient>();
  auto b = std::make_shared<RecordingClient>();
  const auto clientA = fx.mRelay.AddClient(a);
  const auto clientB = fx.mRelay.AddClient(b);

  // Both clients use id 1.
  fx.mRelay.OnClientMessage(clientA, std::string_view{R"({"id":1,"method":"Runtime.evaluate","params":{"expression":"'a'"}})"});
  fx.mRelay.OnClientMessage(clientB, std::string_view{R"({"id":1,"method":"Runtime.evaluate","params":{"expression":"'b'"}})"});

  auto &upstream = *fx.mUpstreams.mLast;
  ASSERT_EQ(upstream.mSent.size(), 2);
  const auto globalA = upstream.mSent[0]["id"];
  const auto globalB = upstream.mSent[1]["id"];
  EXPECT_NE(globalA, globalB);
  EXPECT_EQ(fx.mRelay.InFlightCount(), 2);

  upstream.Reply(globalB, Json{{"result", {{"value", "b"}}}});
  upstream.Reply(globalA, Json{{"result", {{"value", "a"}}}});

  ASSERT_EQ(a->Responses().size(), 1);
  ASSERT_EQ(b->Responses().size(), 1);
  EXPECT_EQ(a->Responses()[0]["id"], 1);
  EXPECT_EQ(a->Responses()[0]["result"]["result"]["value"], "a");
  EXPECT_EQ(b->Responses()[0]["id"], 1);
  EXPECT_EQ(b->Responses()[0]["result"]["result"]["value"], "b");
  EXPECT_EQ(fx.mRelay.InFlightCount(), 0);
}

TEST(ProtocolRelay, ManyConcurrentCommandsNoCrossTalk)
{
  RelayFixture fx;
  fx.Connect();
  std::vector<std::shared_ptr<RecordingClient>> clients;
  std::vector<ClientId> ids;
  for (int i = 0; i < 3; ++i) {
    clients.push_back(std::make_shared<RecordingClient>());
    ids.push_back(fx.mRelay.AddClient(clients.back()));
  }
  constexpr int kPerClient = 20;
  for (int n = 0; n < kPerClient; ++n) {
    for (size_t c = 0; c < clients.size(); ++c) {
      fx.mRelay.OnClientMessage(ids[c], Json{{"id", n}, {"method", "Runtime.evaluate"},
                                             {"params", {{"expression", fmt::format("{}-{}", c, n)}}}});
    }
  }
  // Answer in reverse with the expression echoed back.
  auto &upstream = *fx.mUpstreams.mLast;
  for (auto it = upstream.mSent.rbegin(); it != upstream.mSent.rend(); ++it) {
    upstream.Reply((*it)["id"], Json{{"echo", (*it)["params"]["expression"]}});
  }

  for (size_t c = 0; c < clients.size(); ++c) {
    const auto responses = clients[c]->Responses();
    ASSERT_EQ(responses.size(), kPerClient);
    for (const auto &response : responses) {
      const auto n = response["id"].get<int>();
      EXPECT_EQ(response["result"]["echo"], fmt::format("{}-{}", c, n));
    }
  }
}

TEST(ProtocolRelay, EventsAreBroadcastAndPublished)
{
  RelayFixture fx;
  fx.Connect();
  auto a = std::make_shared<RecordingClient>();
  auto b = std::make_shared<RecordingClient>();
  fx.mRelay.AddClient(a);
  fx.mRelay.AddClient(b);

  Json pausedParams;
  fx.mDispatcher.Subscribe("Debugger.paused", [&](std::string_view, const Json &params) { pausedParams = params; });
  fx.mUpstreams.mLast->Emit("Debugger.paused", Json{{"reason", "breakpoint"}, {"callFrames", Json::array()}});

  EXPECT_EQ(a->Events("Debugger.paused").size(), 1);
  EXPECT_EQ(b->Events("Debugger.paused").size(), 1);
  EXPECT_EQ(pausedParams["reason"], "breakpoint");
}

TEST(ProtocolRelay, MalformedClientMessages)
{
  RelayFixture fx;
  fx.Connect();
  auto client = std::make_shared<RecordingClient>();
  const auto id = fx.mRelay.AddClient(client);
  client->mReceived.clear();

  fx.mRelay.OnClientMessage(id, std::string_view{"not json at all"});
  fx.mRelay.OnClientMessage(id, std::string_view{R"({"method":"Runtime.enable"})"});
  EXPECT_TRUE(client->mReceived.empty());

  fx.mRelay.OnClientMessage(id, std::string_view{R"({"id":"seven","method":"Runtime.enable"})"});
  fx.mRelay.OnClientMessage(id, std::string_view{R"({"id":8})"});
  ASSERT_EQ(client->mReceived.size(), 2);
  EXPECT_EQ(client->mReceived[0]["id"], "seven");
  EXPECT_EQ(client->mReceived[0]["error"]["code"], -32600);
  EXPECT_EQ(client->mReceived[1]["id"], 8);
  EXPECT_EQ(client->mReceived[1]["error"]["code"], -32600);
  EXPECT_TRUE(fx.mUpstreams.mLast->mSent.empty());
}

TEST(ProtocolRelay, RequestWithoutUpstreamGetsNoActiveSession)
{
  RelayFixture fx;
  auto client = std::make_shared<RecordingClient>();
  const auto id = fx.mRelay.AddClient(client);
  fx.mRelay.OnClientMessage(id, std::string_view{R"({"id":3,"method":"Debugger.pause"})"});
  ASSERT_EQ(client->Responses().size(), 1);
  EXPECT_EQ(client->Responses()[0]["error"]["code"], -32000);
  EXPECT_EQ(client->Responses()[0]["error"]["message"], "No active session");
}

TEST(ProtocolRelay, LateResponseForRemovedClientIsDiscarded)
{
  RelayFixture fx;
  fx.Connect();
  auto client = std::make_shared<RecordingClient>();
  const auto id = fx.mRelay.AddClient(client);
  fx.mRelay.OnClientMessage(id, std::string_view{R"({"id":1,"method":"HeapProfiler.takeHeapSnapshot"})"});
  const auto globalId = fx.mUpstreams.mLast->mSent.back()["id"];

  fx.mRelay.RemoveClient(id);
  EXPECT_EQ(fx.mRelay.InFlightCount(), 0);
  client->mReceived.clear();
  fx.mUpstreams.mLast->Reply(globalId, Json::object());
  EXPECT_TRUE(client->mReceived.empty());
}

TEST(ProtocolRelay, CorrelatorTrafficIsRemappedToo)
{
  RelayFixture fx;
  fx.Connect();
  auto client = std::make_shared<RecordingClient>();
  const auto id = fx.mRelay.AddClient(client);
  // Take global id 1 with a client request so the correlator's id 1 has to be remapped.
  fx.mRelay.OnClientMessage(id, std::string_view{R"({"id":1,"method":"Runtime.enable"})"});

  std::optional<CommandResult> result;
  fx.mCorrelator.Send("Runtime.evaluate", Json{{"expression", "1"}}, [&](CommandResult r) { result = std::move(r); });
  auto &upstream = *fx.mUpstreams.mLast;
  ASSERT_EQ(upstream.mSent.size(), 2);
  EXPECT_NE(upstream.mSent[1]["id"], 1);
  upstream.Reply(upstream.mSent[1]["id"], Json{{"result", {{"value", 1}}}});

  ASSERT_TRUE(result.has_value() && result->has_value());
  EXPECT_EQ((**result)["result"]["value"], 1);
  // Nothing of the correlator's traffic reaches remote clients.
  EXPECT_TRUE(client->Responses().empty());
}

TEST(ProtocolRelay, CorrelatorTimeoutReleasesRoute)
{
  RelayFixture fx{20ms};
  fx.Connect();
  auto client = std::make_shared<RecordingClient>();
  fx.mRelay.AddClient(client);

  std::vector<CommandResult> results;
  for (int i = 0; i < 50; ++i) {
    fx.mCorrelator.Send("Debugger.pause", Json::object(), [&](CommandResult r) { results.push_back(std::move(r)); });
  }
  EXPECT_EQ(fx.mRelay.InFlightCount(), 50);

  ASSERT_TRUE(PumpUntil(fx.mContext, [&] { return results.size() == 50; }, 2000ms));
  for (const auto &result : results) {
    EXPECT_TRUE(FailsWith(result, ErrorKind::TimeoutError));
  }
  EXPECT_EQ(fx.mCorrelator.PendingCount(), 0);
  EXPECT_EQ(fx.mRelay.InFlightCount(), 0);

  // The inspector answering afterwards reaches nobody.
  auto &upstream = *fx.mUpstreams.mLast;
  upstream.Reply(upstream.mSent[0]["id"], Json::object());
  EXPECT_EQ(results.size(), 50);
  EXPECT_TRUE(client->Responses().empty());
}

TEST(ProtocolRelay, UpstreamLossRejectsEverythingAndNotifiesClients)
{
  RelayFixture fx;
  fx.Connect();
  auto client = std::make_shared<RecordingClient>();
  const auto id = fx.mRelay.AddClient(client);
  fx.mRelay.OnClientMessage(id, std::string_view{R"({"id":5,"method":"Debugger.resume"})"});

  std::optional<CommandResult> pending;
  fx.mCorrelator.Send("Runtime.evaluate", Json::object(), [&](CommandResult r) { pending = std::move(r); });

  Json closed;
  fx.mDispatcher.Subscribe("Proxy.closed", [&](std::string_view, const Json &params) { closed = params; });
  fx.mUpstreams.mLast->Drop(1006, "debuggee killed");

  ASSERT_TRUE(pending.has_value());
  EXPECT_TRUE(FailsWith(*pending, ErrorKind::ConnectionError));
  EXPECT_EQ(closed["code"], 1006);
  EXPECT_EQ(closed["wasClean"], false);
  EXPECT_TRUE(fx.Published("WebSocket.close"));
  EXPECT_EQ(client->Events("Proxy.closed").size(), 1);
  ASSERT_EQ(client->Responses().size(), 1);
  EXPECT_EQ(client->Responses()[0]["id"], 5);
  EXPECT_TRUE(client->Responses()[0].contains("error"));
  EXPECT_FALSE(fx.mRelay.HasUpstream());
  EXPECT_FALSE(fx.mCorrelator.IsConnected());

  // Commands after the loss fail at once.
  auto after = fx.mCorrelator.Send("Runtime.evaluate", Json::object());
  EXPECT_TRUE(FailsWith(after.get(), ErrorKind::ConnectionError));
}

TEST(ProtocolRelay, DisconnectIsCleanAndClosesUpstream)
{
  RelayFixture fx;
  fx.Connect();
  Json closed;
  fx.mDispatcher.Subscribe("Proxy.closed", [&](std::string_view, const Json &params) { closed = params; });
  auto upstream = fx.mUpstreams.mLast;
  fx.mRelay.Disconnect("session stopped");
  EXPECT_TRUE(upstream->mClosed);
  EXPECT_EQ(closed["code"], 1000);
  EXPECT_EQ(closed["wasClean"], true);
  EXPECT_FALSE(fx.mRelay.IsUpstreamOpen());
}

TEST(ProtocolRelay, CloseClientsForgetsRemoteClients)
{
  RelayFixture fx;
  auto client = std::make_shared<RecordingClient>();
  fx.mRelay.AddClient(client);
  fx.mRelay.CloseClients("shutdown");
  EXPECT_TRUE(client->mClosed);
  EXPECT_EQ(fx.mRelay.ClientCount(), 0);
}

TEST(WebSocketUrl, InspectorEndpoint)
{
  const auto endpoint = ParseWebSocketUrl("ws://127.0.0.1:9229/0f2c936f-b1cd-4ac9-aab3-f63b0f33d55e");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->mHost, "127.0.0.1");
  EXPECT_EQ(endpoint->mPort, "9229");
  EXPECT_EQ(endpoint->mTarget, "/0f2c936f-b1cd-4ac9-aab3-f63b0f33d55e");
}

TEST(WebSocketUrl, DefaultsForPortAndTarget)
{
  const auto endpoint = ParseWebSocketUrl("ws://localhost");
  ASSERT_TRUE(endpoint.has_value());
  EXPECT_EQ(endpoint->mHost, "localhost");
  EXPECT_EQ(endpoint->mPort, "80");
  EXPECT_EQ(endpoint->mTarget, "/");
}

TEST(WebSocketUrl, Rejected)
{
  for (const auto *url : {"http://127.0.0.1:9229/x", "ws://:9229/x", "ws://host:0/x", "ws://host:http/x",
                          "ws://host:70000/x", ""}) {
    EXPECT_TRUE(FailsWith(ParseWebSocketUrl(url), ErrorKind::InvalidArgument)) << url;
  }
}

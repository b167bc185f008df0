#include "test_helpers.h"
#include <events/event_dispatcher.h>
#include <gtest/gtest.h>
#include <interface/cdp/domain_controllers.h>
#include <interface/cdp/execution_state.h>

using cdpr::EventDispatcher;
using cdpr::Json;
using cdpr::cdp::DebuggerController;
using cdpr::cdp::ExecutionStateMachine;
using cdpr::cdp::RequestCorrelator;
using cdpr::test::Drain;
using cdpr::test::FailsWith;
using cdpr::test::IsReady;
using cdpr::test::RecordingTransport;
using namespace std::chrono_literals;

TEST(ExecutionStateMachine, FollowsRelayEvents)
{
  EventDispatcher dispatcher;
  ExecutionStateMachine machine{dispatcher};
  std::vector<ExecutionState> changes;
  machine.StateChanged.Subscribe(cdpr::SubscriberIdentity::Of(&changes),
                                 [&](ExecutionState state) { changes.push_back(state); });

  EXPECT_EQ(machine.State(), ExecutionState::Disconnected);
  dispatcher.Publish("Proxy.ready", Json::object());
  EXPECT_EQ(machine.State(), ExecutionState::Running);

  Json frames = Json::array();
  frames.push_back(Json{{"callFrameId", "0"}});
  dispatcher.Publish("Debugger.paused", Json{{"reason", "breakpoint"}, {"callFrames", frames}});
  const auto snapshot = machine.Snapshot();
  EXPECT_EQ(snapshot.mState, ExecutionState::Paused);
  EXPECT_EQ(snapshot.mPauseReason, "breakpoint");
  EXPECT_EQ(snapshot.mCallFrames.size(), 1);

  dispatcher.Publish("Debugger.resumed", Json::object());
  EXPECT_EQ(machine.State(), ExecutionState::Running);
  EXPECT_TRUE(machine.Snapshot().mPauseReason.empty());

  dispatcher.Publish("Proxy.closed", Json{{"code", 1006}});
  EXPECT_EQ(machine.State(), ExecutionState::Disconnected);

  const std::vector expected{ExecutionState::Running, ExecutionState::Paused, ExecutionState::Running,
                             ExecutionState::Disconnected};
  EXPECT_EQ(changes, expected);
}

TEST(ExecutionStateMachine, RepeatedStateIsNotAChange)
{
  EventDispatcher dispatcher;
  ExecutionStateMachine machine{dispatcher};
  int changes = 0;
  machine.StateChanged.Subscribe(cdpr::SubscriberIdentity::Of(&changes), [&](ExecutionState) { ++changes; });
  machine.OnSessionStarted();
  dispatcher.Publish("Proxy.ready", Json::object());
  dispatcher.Publish("Debugger.resumed", Json::object());
  EXPECT_EQ(changes, 1);
  machine.OnSessionStopped();
  EXPECT_EQ(changes, 2);
  EXPECT_EQ(machine.State(), ExecutionState::Disconnected);
}

TEST(ExecutionStateMachine, PausedWithoutParamsUsesDefaults)
{
  EventDispatcher dispatcher;
  ExecutionStateMachine machine{dispatcher};
  dispatcher.Publish("Debugger.paused", Json::object());
  const auto snapshot = machine.Snapshot();
  EXPECT_EQ(snapshot.mState, ExecutionState::Paused);
  EXPECT_EQ(snapshot.mPauseReason, "other");
  EXPECT_TRUE(snapshot.mCallFrames.is_array());
}

struct GuardFixture
{
  boost::asio::io_context mContext;
  EventDispatcher mDispatcher;
  RequestCorrelator mCorrelator{mContext, 5000ms};
  RecordingTransport mTransport;
  ExecutionStateMachine mMachine{mDispatcher};
  DebuggerController mDebugger{mCorrelator, mDispatcher, mMachine};

  GuardFixture() { mCorrelator.AttachTransport(&mTransport); }
};

TEST(ExecutionStateMachine, SteppingWhileRunningIsRejectedLocally)
{
  GuardFixture fx;
  fx.mMachine.OnSessionStarted();

  std::vector<cdpr::cdp::CommandFuture> futures;
  futures.push_back(fx.mDebugger.Resume());
  futures.push_back(fx.mDebugger.StepOver());
  futures.push_back(fx.mDebugger.StepInto());
  futures.push_back(fx.mDebugger.StepOut());
  Drain(fx.mContext);

  for (auto &future : futures) {
    ASSERT_TRUE(IsReady(future));
    const auto result = future.get();
    ASSERT_TRUE(FailsWith(result, ErrorKind::StateError));
    EXPECT_NE(result.error().mMessage.find("paused"), std::string::npos);
  }
  EXPECT_TRUE(fx.mTransport.mSent.empty());
}

TEST(ExecutionStateMachine, SteppingWhileDisconnectedIsRejected)
{
  GuardFixture fx;
  auto future = fx.mDebugger.StepOver();
  ASSERT_TRUE(IsReady(future));
  EXPECT_TRUE(FailsWith(future.get(), ErrorKind::StateError));
  EXPECT_TRUE(fx.mTransport.mSent.empty());
}

TEST(ExecutionStateMachine, PauseOnlyWhileRunning)
{
  GuardFixture fx;
  fx.mMachine.OnSessionStarted();
  auto pause = fx.mDebugger.Pause();
  Drain(fx.mContext);
  ASSERT_EQ(fx.mTransport.mSent.size(), 1);
  EXPECT_EQ(fx.mTransport.mSent[0]["method"], "Debugger.pause");

  fx.mDispatcher.Publish("Debugger.paused", Json{{"reason", "other"}, {"callFrames", Json::array()}});
  EXPECT_EQ(fx.mMachine.State(), ExecutionState::Paused);

  auto again = fx.mDebugger.Pause();
  ASSERT_TRUE(IsReady(again));
  EXPECT_TRUE(FailsWith(again.get(), ErrorKind::StateError));

  auto step = fx.mDebugger.StepOver();
  Drain(fx.mContext);
  ASSERT_EQ(fx.mTransport.mSent.size(), 2);
  EXPECT_EQ(fx.mTransport.mSent[1]["method"], "Debugger.stepOver");
}

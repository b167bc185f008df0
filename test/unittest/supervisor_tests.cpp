#include "test_helpers.h"
#include <gtest/gtest.h>
#include <supervisor/process_supervisor.h>

#include <csignal>

using cdpr::ProcessExit;
using cdpr::ProcessSupervisor;
using cdpr::RelayResult;
using cdpr::SupervisorSettings;
using cdpr::SubscriberIdentity;
using cdpr::test::FailsWith;
using cdpr::test::kFakeNode;
using cdpr::test::PumpUntil;
using cdpr::test::TempDir;
using namespace std::chrono_literals;

struct SupervisorFixture
{
  TempDir mDir;
  boost::asio::io_context mContext;
  std::unique_ptr<ProcessSupervisor> mSupervisor;
  std::vector<ProcessExit> mExits;

  explicit SupervisorFixture(std::string_view program = kFakeNode, std::chrono::milliseconds killGrace = 2000ms)
  {
    const auto executable = mDir.WriteExecutable("bin/fake-node", program);
    mSupervisor = std::make_unique<ProcessSupervisor>(
      mContext, SupervisorSettings{.mExecutable = executable.string(), .mKillGrace = killGrace, .mEchoOutput = false});
    mSupervisor->Exited.Subscribe(SubscriberIdentity::Of(this), [this](const ProcessExit &exit) {
      mExits.push_back(exit);
    });
  }

  std::optional<RelayResult<std::string>>
  AwaitUrl(std::chrono::milliseconds timeout = 5000ms)
  {
    std::optional<RelayResult<std::string>> url;
    mSupervisor->AwaitInspectorUrl(timeout, [&](RelayResult<std::string> r) { url = std::move(r); });
    PumpUntil(mContext, [&] { return url.has_value(); }, timeout + 2000ms);
    return url;
  }

  bool
  CloseAndWait()
  {
    bool reaped = false;
    mSupervisor->Close([&] { reaped = true; });
    return PumpUntil(mContext, [&] { return reaped; }, 10000ms);
  }
};

TEST(ProcessSupervisor, CapturesTheInspectorUrl)
{
  SupervisorFixture fx;
  const auto pid = fx.mSupervisor->Open(9339, "127.0.0.1", false, fx.mDir.Path() / "app.js");
  ASSERT_TRUE(pid.has_value()) << fmt::format("{}", pid.error());
  EXPECT_EQ(fx.mSupervisor->GetPid(), *pid);
  EXPECT_TRUE(fx.mSupervisor->IsActive());

  const auto url = fx.AwaitUrl();
  ASSERT_TRUE(url.has_value() && url->has_value());
  EXPECT_EQ(**url, "ws://127.0.0.1:9339/0f2c936f-b1cd-4ac9-aab3-f63b0f33d55e");
  EXPECT_EQ(fx.mSupervisor->Url(), **url);

  // Known URL is handed out again without waiting.
  const auto again = fx.AwaitUrl(10ms);
  ASSERT_TRUE(again.has_value() && again->has_value());

  ASSERT_TRUE(fx.CloseAndWait());
  ASSERT_EQ(fx.mExits.size(), 1);
  EXPECT_EQ(fx.mExits[0].mPid, *pid);
  EXPECT_EQ(fx.mExits[0].mSignal, SIGTERM);
  EXPECT_FALSE(fx.mSupervisor->IsActive());
  EXPECT_FALSE(fx.mSupervisor->Url().has_value());
}

TEST(ProcessSupervisor, BreakOnStartUsesInspectBrk)
{
  SupervisorFixture fx{R"(#!/bin/sh
echo "flag $1"
echo "ws://x/${1%%=*}"
exec sleep 30
)"};
  ASSERT_TRUE(fx.mSupervisor->Open(9229, "127.0.0.1", true, fx.mDir.Path() / "app.js").has_value());
  const auto url = fx.AwaitUrl();
  ASSERT_TRUE(url.has_value() && url->has_value());
  EXPECT_EQ(**url, "ws://x/--inspect-brk");
  ASSERT_TRUE(fx.CloseAndWait());
}

TEST(ProcessSupervisor, SecondOpenIsAConflict)
{
  SupervisorFixture fx;
  ASSERT_TRUE(fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "a.js").has_value());
  EXPECT_TRUE(FailsWith(fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "b.js"),
                        ErrorKind::SessionConflictError));
  ASSERT_TRUE(fx.CloseAndWait());
}

TEST(ProcessSupervisor, NaturalExitIsReapedAndEmitted)
{
  SupervisorFixture fx{"#!/bin/sh\necho bye\nexit 3\n"};
  ASSERT_TRUE(fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "app.js").has_value());
  ASSERT_TRUE(PumpUntil(fx.mContext, [&] { return !fx.mExits.empty(); }));
  EXPECT_EQ(fx.mExits[0].mExitCode, 3);
  EXPECT_FALSE(fx.mExits[0].mSignal.has_value());
  EXPECT_FALSE(fx.mSupervisor->GetPid().has_value());

  const auto url = fx.AwaitUrl(100ms);
  ASSERT_TRUE(url.has_value());
  EXPECT_TRUE(FailsWith(*url, ErrorKind::ProcessError));
}

TEST(ProcessSupervisor, ExitBeforeAnnouncingFailsUrlWaiters)
{
  SupervisorFixture fx{"#!/bin/sh\nsleep 0.2\nexit 1\n"};
  ASSERT_TRUE(fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "app.js").has_value());
  const auto url = fx.AwaitUrl(5000ms);
  ASSERT_TRUE(url.has_value());
  ASSERT_TRUE(FailsWith(*url, ErrorKind::ProcessError));
  EXPECT_NE(url->error().mMessage.find("exited"), std::string::npos);
}

TEST(ProcessSupervisor, SilentDebuggeeTimesOut)
{
  SupervisorFixture fx{"#!/bin/sh\nexec sleep 30\n"};
  ASSERT_TRUE(fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "app.js").has_value());
  const auto url = fx.AwaitUrl(50ms);
  ASSERT_TRUE(url.has_value());
  EXPECT_TRUE(FailsWith(*url, ErrorKind::TimeoutError));
  EXPECT_TRUE(fx.mSupervisor->IsActive());
  ASSERT_TRUE(fx.CloseAndWait());
}

TEST(ProcessSupervisor, StubbornDebuggeeIsKilledAfterGrace)
{
  SupervisorFixture fx{"#!/bin/sh\ntrap '' TERM\necho ready\nwhile true; do sleep 1; done\n", 100ms};
  ASSERT_TRUE(fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "app.js").has_value());
  // Give the shell time to install its trap.
  PumpUntil(fx.mContext, [] { return false; }, 200ms);
  ASSERT_TRUE(fx.CloseAndWait());
  ASSERT_EQ(fx.mExits.size(), 1);
  EXPECT_EQ(fx.mExits[0].mSignal, SIGKILL);
}

TEST(ProcessSupervisor, CloseWithoutProcessCompletes)
{
  SupervisorFixture fx;
  EXPECT_TRUE(fx.CloseAndWait());
  EXPECT_TRUE(fx.mExits.empty());

  const auto url = fx.AwaitUrl(100ms);
  ASSERT_TRUE(url.has_value());
  EXPECT_TRUE(FailsWith(*url, ErrorKind::ProcessError));
}

TEST(ProcessSupervisor, RepeatedCloseWaitsForTheSameReap)
{
  SupervisorFixture fx;
  ASSERT_TRUE(fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "app.js").has_value());
  int reaped = 0;
  fx.mSupervisor->Close([&] { ++reaped; });
  fx.mSupervisor->Delete([&] { ++reaped; });
  ASSERT_TRUE(PumpUntil(fx.mContext, [&] { return reaped == 2; }, 10000ms));
  EXPECT_EQ(fx.mExits.size(), 1);
}

TEST(ProcessSupervisor, ExitIsPublishedBeforeReapWaitersRun)
{
  SupervisorFixture fx;
  const auto pid = fx.mSupervisor->Open(9229, "127.0.0.1", false, fx.mDir.Path() / "app.js");
  ASSERT_TRUE(pid.has_value());
  std::optional<size_t> exitsSeenWhenReaped;
  fx.mSupervisor->Close([&] { exitsSeenWhenReaped = fx.mExits.size(); });
  ASSERT_TRUE(PumpUntil(fx.mContext, [&] { return exitsSeenWhenReaped.has_value(); }, 10000ms));
  EXPECT_EQ(*exitsSeenWhenReaped, 1);
  EXPECT_EQ(fx.mExits[0].mPid, *pid);
}

TEST(ProcessSupervisor, ExecFailureIsAProcessError)
{
  boost::asio::io_context context;
  ProcessSupervisor supervisor{
    context, SupervisorSettings{.mExecutable = "/nonexistent/cdpr-node", .mKillGrace = 100ms, .mEchoOutput = false}};
  const auto pid = supervisor.Open(9229, "127.0.0.1", false, "/tmp/app.js");
  ASSERT_TRUE(FailsWith(pid, ErrorKind::ProcessError));
  EXPECT_NE(pid.error().mMessage.find("Failed to execute"), std::string::npos);
  EXPECT_FALSE(supervisor.IsActive());
}

#pragma once
#include "test_helpers.h"
#include <events/event_dispatcher.h>
#include <interface/cdp/domain_controllers.h>
#include <interface/cdp/execution_state.h>
#include <session/session_registry.h>
#include <session/workspace_guard.h>
#include <supervisor/process_supervisor.h>

namespace cdpr::test {

using namespace std::chrono_literals;

// Full session stack around a fake node and a fake inspector. The workspace holds app.js and other.js, with
// secret.js one level above it.
struct RegistryFixture
{
  TempDir mDir;
  boost::asio::io_context mContext;
  EventDispatcher mDispatcher;
  cdp::RequestCorrelator mCorrelator{mContext, 5000ms};
  FakeUpstreamFactory mUpstreams{.mLast = nullptr, .mAutoAccept = true, .mAutoRespond = true};
  cdp::ProtocolRelay mRelay{mContext, mDispatcher, mCorrelator, mUpstreams.Factory()};
  cdp::ExecutionStateMachine mMachine{mDispatcher};
  cdp::DomainControllers mDomains{mCorrelator, mDispatcher, mMachine};
  std::unique_ptr<ProcessSupervisor> mSupervisor;
  std::unique_ptr<WorkspaceGuard> mWorkspace;
  std::unique_ptr<SessionRegistry> mRegistry;

  explicit RegistryFixture(std::string_view node = kFakeNode)
  {
    const auto executable = mDir.WriteExecutable("bin/node", node);
    mDir.Write("workspace/app.js", "setInterval(() => {}, 1000);\n");
    mDir.Write("workspace/other.js", "console.log('other');\n");
    mDir.Write("secret.js", "");
    mSupervisor = std::make_unique<ProcessSupervisor>(
      mContext, SupervisorSettings{.mExecutable = executable.string(), .mKillGrace = 2000ms, .mEchoOutput = false});
    mWorkspace = std::make_unique<WorkspaceGuard>(mDir.Path() / "workspace");
    mRegistry = std::make_unique<SessionRegistry>(mContext, *mWorkspace, *mSupervisor, mRelay, mDomains, mMachine,
                                                  SessionSettings{.mInspectPort = 9329,
                                                                  .mInspectHost = "127.0.0.1",
                                                                  .mProxyPort = 8899,
                                                                  .mBreakOnStart = false,
                                                                  .mHandshakeTimeout = 3000ms});
  }

  ~RegistryFixture()
  {
    bool stopped = false;
    mRegistry->Stop(std::nullopt, [&](RelayResult<DebugSession>) { stopped = true; });
    PumpUntil(mContext, [&] { return stopped; }, 10000ms);
  }

  std::optional<RelayResult<DebugSession>>
  Start(std::string file, StartOptions options = {})
  {
    std::optional<RelayResult<DebugSession>> result;
    mRegistry->Start(std::move(file), options, [&](RelayResult<DebugSession> r) { result = std::move(r); });
    PumpUntil(mContext, [&] { return result.has_value(); }, 10000ms);
    return result;
  }

  std::optional<RelayResult<DebugSession>>
  Stop(std::optional<std::string> id = std::nullopt)
  {
    std::optional<RelayResult<DebugSession>> result;
    mRegistry->Stop(std::move(id), [&](RelayResult<DebugSession> r) { result = std::move(r); });
    PumpUntil(mContext, [&] { return result.has_value(); }, 10000ms);
    return result;
  }

  std::vector<std::string>
  SentMethods() const
  {
    std::vector<std::string> methods;
    for (const auto &message : mUpstreams.mLast->mSent) {
      methods.push_back(message["method"].get<std::string>());
    }
    return methods;
  }
};

} // namespace cdpr::test

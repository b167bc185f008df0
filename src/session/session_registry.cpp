/** LICENSE TEMPLATE */
#include "session_registry.h"

// cdpr
#include <interface/cdp/domain_controllers.h>
#include <interface/cdp/protocol_relay.h>
#include <supervisor/process_supervisor.h>
#include <utils/logger.h>

// fmt
#include <fmt/chrono.h>
#include <fmt/format.h>

// boost
#include <boost/asio/post.hpp>

// stdlib
#include <algorithm>
#include <cctype>
#include <ctime>

namespace cdpr {

static std::string
NowIso8601() noexcept
{
  const auto now = std::chrono::system_clock::now();
  const auto millis =
    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, millis);
}

static std::string
StatusName(SessionStatus status) noexcept
{
  std::string name{ Enum<SessionStatus>::ToString(status) };
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
  return name;
}

Json
DebugSession::ToJson() const noexcept
{
  Json json{
    { "sessionId", mSessionId },
    { "targetFile", mTargetFile },
    { "absolutePath", mAbsolutePath.string() },
    { "wsUrl", mWsUrl },
    { "status", StatusName(mStatus) },
    { "createdAt", mCreatedAt },
    { "inspectPort", mInspectPort },
    { "proxyPort", mProxyPort },
  };
  json["pid"] = mPid ? Json(*mPid) : Json(nullptr);
  return json;
}

SessionRegistry::SessionRegistry(boost::asio::io_context &context,
  const WorkspaceGuard &workspace,
  ProcessSupervisor &supervisor,
  cdp::ProtocolRelay &relay,
  cdp::DomainControllers &domains,
  cdp::ExecutionStateMachine &stateMachine,
  SessionSettings settings) noexcept
    : mContext(context), mWorkspace(workspace), mSupervisor(supervisor), mRelay(relay), mDomains(domains),
      mStateMachine(stateMachine), mSettings(std::move(settings))
{
  mSupervisor.Exited.Subscribe(
    SubscriberIdentity::Of(this), [this](const ProcessExit &exit) { OnDebuggeeExited(exit); });
  mStateMachine.StateChanged.Subscribe(
    SubscriberIdentity::Of(this), [this](const ExecutionState &state) { OnExecutionStateChanged(state); });
}

SessionRegistry::~SessionRegistry() noexcept
{
  mSupervisor.Exited.Unsubscribe(SubscriberIdentity::Of(this));
  mStateMachine.StateChanged.Unsubscribe(SubscriberIdentity::Of(this));
}

void
SessionRegistry::Start(std::string targetFile, StartOptions options, SessionCallback callback) noexcept
{
  if (mStarting) {
    callback(std::unexpected(RelayError::SessionConflict("Another session is currently starting")));
    return;
  }

  auto resolved = mWorkspace.Resolve(targetFile);
  if (!resolved) {
    callback(std::unexpected(std::move(resolved.error())));
    return;
  }
  std::error_code ec;
  if (!fs::is_regular_file(*resolved, ec)) {
    callback(std::unexpected(RelayError::NotFound(fmt::format("Target file not found: {}", targetFile))));
    return;
  }

  const auto generation = ++mGeneration;
  mStarting = true;
  const bool breakOnStart = options.mBreakOnStart.value_or(mSettings.mBreakOnStart);
  DBGLOG(session, "starting session for {} (break on start: {})", resolved->c_str(), breakOnStart);

  TearDownActive("Session replaced",
    [this,
      generation,
      targetFile = std::move(targetFile),
      absolutePath = std::move(*resolved),
      breakOnStart,
      callback = std::move(callback)]() mutable {
      StartAfterTeardown(
        generation, std::move(targetFile), std::move(absolutePath), breakOnStart, std::move(callback));
    });
}

SessionFuture
SessionRegistry::Start(std::string targetFile, StartOptions options) noexcept
{
  auto promise = std::make_shared<std::promise<RelayResult<DebugSession>>>();
  auto future = promise->get_future();
  boost::asio::post(mContext, [this, targetFile = std::move(targetFile), options, promise]() mutable {
    Start(std::move(targetFile), options, [promise](auto result) { promise->set_value(std::move(result)); });
  });
  return future;
}

bool
SessionRegistry::Superseded(u64 generation, const SessionCallback &callback) noexcept
{
  if (generation == mGeneration) {
    return false;
  }
  DBGLOG(session, "start #{} superseded by #{}", generation, mGeneration);
  callback(std::unexpected(RelayError::State("Session start was cancelled")));
  return true;
}

void
SessionRegistry::StartAfterTeardown(
  u64 generation, std::string targetFile, Path absolutePath, bool breakOnStart, SessionCallback callback) noexcept
{
  if (Superseded(generation, callback)) {
    return;
  }

  auto pid = mSupervisor.Open(mSettings.mInspectPort, mSettings.mInspectHost, breakOnStart, absolutePath);
  if (!pid) {
    AbortStart(generation, std::move(pid.error()), std::move(callback));
    return;
  }

  {
    std::lock_guard lock{ mMutex };
    mActive = DebugSession{ .mSessionId = fmt::format("session-{}", mNextSessionNumber++),
      .mTargetFile = std::move(targetFile),
      .mAbsolutePath = std::move(absolutePath),
      .mInspectPort = mSettings.mInspectPort,
      .mProxyPort = mSettings.mProxyPort,
      .mWsUrl = fmt::format("ws://localhost:{}", mSettings.mProxyPort),
      .mPid = *pid,
      .mStatus = SessionStatus::Starting,
      .mCreatedAt = NowIso8601() };
  }

  mSupervisor.AwaitInspectorUrl(mSettings.mHandshakeTimeout,
    [this, generation, callback = std::move(callback)](RelayResult<std::string> url) mutable {
      if (Superseded(generation, callback)) {
        return;
      }
      if (!url) {
        AbortStart(generation, std::move(url.error()), std::move(callback));
        return;
      }
      ConnectRelay(generation, std::move(*url), std::move(callback));
    });
}

void
SessionRegistry::ConnectRelay(u64 generation, std::string url, SessionCallback callback) noexcept
{
  DBGLOG(session, "connecting relay to {}", url);
  mRelay.Connect(std::move(url),
    mSettings.mHandshakeTimeout,
    [this, generation, callback = std::move(callback)](RelayResult<void> connected) mutable {
      if (Superseded(generation, callback)) {
        return;
      }
      if (!connected) {
        AbortStart(generation, std::move(connected.error()), std::move(callback));
        return;
      }
      mStateMachine.OnSessionStarted();
      EnableDomains(generation, std::move(callback));
    });
}

void
SessionRegistry::EnableDomains(u64 generation, SessionCallback callback) noexcept
{
  auto &runtime = mDomains.mRuntime;
  auto &debugger = mDomains.mDebugger;
  runtime.Send(RuntimeCommand::enable,
    Json::object(),
    [this, generation, &debugger, callback = std::move(callback)](cdp::CommandResult result) mutable {
      if (Superseded(generation, callback)) {
        return;
      }
      if (!result) {
        AbortStart(generation, std::move(result.error()), std::move(callback));
        return;
      }
      debugger.Send(DebuggerCommand::enable,
        Json::object(),
        [this, generation, callback = std::move(callback)](cdp::CommandResult result) mutable {
          if (Superseded(generation, callback)) {
            return;
          }
          if (!result) {
            AbortStart(generation, std::move(result.error()), std::move(callback));
            return;
          }
          FinishStart(generation, std::move(callback));
        });
    });
}

void
SessionRegistry::FinishStart(u64 generation, SessionCallback callback) noexcept
{
  mDomains.mRuntime.Send(RuntimeCommand::runIfWaitingForDebugger,
    Json::object(),
    [this, generation, callback = std::move(callback)](cdp::CommandResult result) mutable {
      if (Superseded(generation, callback)) {
        return;
      }
      if (!result) {
        AbortStart(generation, std::move(result.error()), std::move(callback));
        return;
      }

      mStarting = false;
      DebugSession session;
      {
        std::lock_guard lock{ mMutex };
        VERIFY(mActive.has_value(), "Session record disappeared while starting");
        mActive->mStatus =
          mStateMachine.State() == ExecutionState::Paused ? SessionStatus::Paused : SessionStatus::Running;
        session = *mActive;
      }
      DBGLOG(session, "{} is up, debuggee {}", session.mSessionId, session.mPid.value_or(0));
      callback(std::move(session));
    });
}

void
SessionRegistry::AbortStart(u64 generation, RelayError error, SessionCallback callback) noexcept
{
  DBGLOG(session, "start #{} failed: {}", generation, error);
  // Keeps later continuations of this start from acting.
  ++mGeneration;
  TearDownActive("Session start failed", [this, error = std::move(error), callback = std::move(callback)]() mutable {
    mStarting = false;
    callback(std::unexpected(std::move(error)));
  });
}

void
SessionRegistry::TearDownActive(std::string_view reason, std::function<void()> done) noexcept
{
  if (mRelay.HasUpstream()) {
    mRelay.Disconnect(reason);
  }
  mStateMachine.OnSessionStopped();
  mSupervisor.Close([this, done = std::move(done)]() {
    {
      std::lock_guard lock{ mMutex };
      if (mActive) {
        DBGLOG(session, "{} stopped", mActive->mSessionId);
      }
      mActive.reset();
    }
    done();
  });
}

void
SessionRegistry::Stop(std::optional<std::string> sessionId, SessionCallback callback) noexcept
{
  std::optional<DebugSession> session;
  {
    std::lock_guard lock{ mMutex };
    if (mActive && (!sessionId || *sessionId == mActive->mSessionId)) {
      session = mActive;
    }
  }
  if (!session) {
    callback(std::unexpected(RelayError::NotFound(sessionId ? fmt::format("Session not found: {}", *sessionId)
                                                            : std::string{ "No debug session is currently running" })));
    return;
  }

  DBGLOG(session, "stopping {}", session->mSessionId);
  // A start still in flight is abandoned. Its continuations report it cancelled.
  ++mGeneration;
  mStarting = false;
  TearDownActive("Session stopped", [session = std::move(*session), callback = std::move(callback)]() mutable {
    session.mStatus = SessionStatus::Stopped;
    callback(std::move(session));
  });
}

SessionFuture
SessionRegistry::Stop(std::optional<std::string> sessionId) noexcept
{
  auto promise = std::make_shared<std::promise<RelayResult<DebugSession>>>();
  auto future = promise->get_future();
  boost::asio::post(mContext, [this, sessionId = std::move(sessionId), promise]() mutable {
    Stop(std::move(sessionId), [promise](auto result) { promise->set_value(std::move(result)); });
  });
  return future;
}

void
SessionRegistry::OnDebuggeeExited(const ProcessExit &exit) noexcept
{
  // A start in flight finds out through its own waits.
  if (mStarting) {
    return;
  }
  {
    std::lock_guard lock{ mMutex };
    if (!mActive || mActive->mPid != exit.mPid) {
      return;
    }
    DBGLOG(session, "debuggee of {} exited, ending session", mActive->mSessionId);
    mActive.reset();
  }
  if (mRelay.HasUpstream()) {
    mRelay.Disconnect("Debuggee exited");
  }
  mStateMachine.OnSessionStopped();
}

void
SessionRegistry::OnExecutionStateChanged(ExecutionState state) noexcept
{
  std::lock_guard lock{ mMutex };
  if (!mActive || mActive->mStatus == SessionStatus::Starting) {
    return;
  }
  switch (state) {
  case ExecutionState::Running:
    mActive->mStatus = SessionStatus::Running;
    break;
  case ExecutionState::Paused:
    mActive->mStatus = SessionStatus::Paused;
    break;
  case ExecutionState::Disconnected:
    break;
  }
}

std::optional<DebugSession>
SessionRegistry::Current() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mActive;
}

std::optional<DebugSession>
SessionRegistry::Find(std::string_view sessionId) const noexcept
{
  std::lock_guard lock{ mMutex };
  if (mActive && mActive->mSessionId == sessionId) {
    return mActive;
  }
  return std::nullopt;
}

std::vector<DebugSession>
SessionRegistry::List() const noexcept
{
  std::lock_guard lock{ mMutex };
  std::vector<DebugSession> sessions;
  if (mActive) {
    sessions.push_back(*mActive);
  }
  return sessions;
}

} // namespace cdpr

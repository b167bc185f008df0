/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common.h>
#include <common/error.h>
#include <common/macros.h>
#include <interface/cdp/execution_state.h>
#include <interface/cdp/protocol.h>
#include <session/workspace_guard.h>

// boost
#include <boost/asio/io_context.hpp>

// stdlib
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#define FOR_EACH_SESSION_STATUS(STATUS)                                                                             \
  STATUS(Starting, "Debuggee spawned, inspector connection being brought up")                                      \
  STATUS(Running, "Debuggee attached and executing")                                                               \
  STATUS(Paused, "Debuggee attached and paused")                                                                   \
  STATUS(Stopped, "Session torn down")

ENUM_TYPE_METADATA(SessionStatus, FOR_EACH_SESSION_STATUS, DEFAULT_ENUM, u8)

namespace cdpr {

class ProcessSupervisor;
struct ProcessExit;

namespace cdp {
class ProtocolRelay;
struct DomainControllers;
} // namespace cdp

struct DebugSession
{
  std::string mSessionId;
  // As the client asked for it.
  std::string mTargetFile;
  Path mAbsolutePath;
  u16 mInspectPort;
  u16 mProxyPort;
  std::string mWsUrl;
  std::optional<Pid> mPid;
  SessionStatus mStatus;
  std::string mCreatedAt;

  Json ToJson() const noexcept;
};

struct StartOptions
{
  // Falls back to the registry default when not set.
  std::optional<bool> mBreakOnStart{};
};

struct SessionSettings
{
  u16 mInspectPort{ 9229 };
  std::string mInspectHost{ "127.0.0.1" };
  u16 mProxyPort{ 8888 };
  bool mBreakOnStart{ false };
  std::chrono::milliseconds mHandshakeTimeout{ 10000 };
};

using SessionCallback = std::function<void(RelayResult<DebugSession>)>;
using SessionFuture = std::future<RelayResult<DebugSession>>;

// Owns the one debug session and drives start and stop across the supervisor, the relay, the domain controllers
// and the execution state machine. A start that fails anywhere tears down what it brought up before reporting.
//
// The callback overloads run on the reactor, the future overloads may be called from any thread. Current, Find
// and List may be called from anywhere.
class SessionRegistry
{
  boost::asio::io_context &mContext;
  const WorkspaceGuard &mWorkspace;
  ProcessSupervisor &mSupervisor;
  cdp::ProtocolRelay &mRelay;
  cdp::DomainControllers &mDomains;
  cdp::ExecutionStateMachine &mStateMachine;
  SessionSettings mSettings;

  mutable std::mutex mMutex;
  std::optional<DebugSession> mActive{};
  u64 mNextSessionNumber{ 1 };

  // Bumped by every start and stop. A start continuation that sees another value has been superseded.
  u64 mGeneration{ 0 };
  bool mStarting{ false };

  void StartAfterTeardown(u64 generation, std::string targetFile, Path absolutePath, bool breakOnStart,
    SessionCallback callback) noexcept;
  void ConnectRelay(u64 generation, std::string url, SessionCallback callback) noexcept;
  void EnableDomains(u64 generation, SessionCallback callback) noexcept;
  void FinishStart(u64 generation, SessionCallback callback) noexcept;
  void AbortStart(u64 generation, RelayError error, SessionCallback callback) noexcept;
  bool Superseded(u64 generation, const SessionCallback &callback) noexcept;

  // Disconnects the relay and reaps the debuggee, then forgets the active session.
  void TearDownActive(std::string_view reason, std::function<void()> done) noexcept;
  void OnDebuggeeExited(const ProcessExit &exit) noexcept;
  void OnExecutionStateChanged(ExecutionState state) noexcept;

public:
  NO_COPY(SessionRegistry);
  SessionRegistry(boost::asio::io_context &context,
    const WorkspaceGuard &workspace,
    ProcessSupervisor &supervisor,
    cdp::ProtocolRelay &relay,
    cdp::DomainControllers &domains,
    cdp::ExecutionStateMachine &stateMachine,
    SessionSettings settings) noexcept;
  ~SessionRegistry() noexcept;

  // PathViolationError for paths outside the workspace, NotFoundError when the file does not exist,
  // SessionConflictError while another start is in progress. Any running session is stopped first.
  void Start(std::string targetFile, StartOptions options, SessionCallback callback) noexcept;
  SessionFuture Start(std::string targetFile, StartOptions options) noexcept;

  // Stops `sessionId`, or the current session when none is given. Reports the session as it was, marked Stopped.
  // NotFoundError when there is no such session.
  void Stop(std::optional<std::string> sessionId, SessionCallback callback) noexcept;
  SessionFuture Stop(std::optional<std::string> sessionId) noexcept;

  std::optional<DebugSession> Current() const noexcept;
  std::optional<DebugSession> Find(std::string_view sessionId) const noexcept;
  std::vector<DebugSession> List() const noexcept;
};

} // namespace cdpr

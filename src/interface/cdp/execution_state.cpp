/** LICENSE TEMPLATE */
#include "execution_state.h"

// cdpr
#include <common.h>
#include <utils/logger.h>

namespace cdpr::cdp {

ExecutionStateMachine::ExecutionStateMachine(EventDispatcher &dispatcher) noexcept : mDispatcher(dispatcher)
{
  mSubscriptions.push_back(mDispatcher.Subscribe(kProxyReady, [this](std::string_view, const Json &) {
    Transition(ExecutionState::Running, {}, nullptr);
  }));

  mSubscriptions.push_back(mDispatcher.Subscribe("Debugger.paused", [this](std::string_view, const Json &params) {
    std::string reason = params.is_object() ? params.value("reason", std::string{ "other" }) : "other";
    Json callFrames = params.is_object() && params.contains("callFrames") ? params["callFrames"] : Json::array();
    Transition(ExecutionState::Paused, std::move(reason), std::move(callFrames));
  }));

  mSubscriptions.push_back(mDispatcher.Subscribe("Debugger.resumed", [this](std::string_view, const Json &) {
    Transition(ExecutionState::Running, {}, nullptr);
  }));

  const auto disconnected = [this](std::string_view, const Json &) {
    Transition(ExecutionState::Disconnected, {}, nullptr);
  };
  mSubscriptions.push_back(mDispatcher.Subscribe(kProxyClosed, disconnected));
  mSubscriptions.push_back(mDispatcher.Subscribe(kWebSocketClose, disconnected));
}

ExecutionStateMachine::~ExecutionStateMachine() noexcept
{
  for (const auto handle : mSubscriptions) {
    mDispatcher.Unsubscribe(handle);
  }
}

void
ExecutionStateMachine::Transition(ExecutionState next, std::string reason, Json callFrames) noexcept
{
  ExecutionState previous;
  {
    std::lock_guard lock{ mMutex };
    previous = mSnapshot.mState;
    mSnapshot = ExecutionSnapshot{ next, std::move(reason), std::move(callFrames) };
  }
  if (previous != next) {
    DBGLOG(session, "execution state {} -> {}", previous, next);
    StateChanged.Emit(next);
  }
}

ExecutionState
ExecutionStateMachine::State() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mSnapshot.mState;
}

ExecutionSnapshot
ExecutionStateMachine::Snapshot() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mSnapshot;
}

void
ExecutionStateMachine::OnSessionStarted() noexcept
{
  Transition(ExecutionState::Running, {}, nullptr);
}

void
ExecutionStateMachine::OnSessionStopped() noexcept
{
  Transition(ExecutionState::Disconnected, {}, nullptr);
}

RelayResult<void>
ExecutionStateMachine::RequirePaused(std::string_view operation) const noexcept
{
  const auto state = State();
  if (state != ExecutionState::Paused) {
    return std::unexpected(
      RelayError::State(fmt::format("{} requires the target to be paused (it is {})", operation, state)));
  }
  return {};
}

RelayResult<void>
ExecutionStateMachine::RequireRunning(std::string_view operation) const noexcept
{
  const auto state = State();
  if (state != ExecutionState::Running) {
    return std::unexpected(
      RelayError::State(fmt::format("{} requires the target to be running (it is {})", operation, state)));
  }
  return {};
}

} // namespace cdpr::cdp

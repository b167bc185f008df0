/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <events/event.h>
#include <events/event_dispatcher.h>
#include <interface/cdp/protocol.h>

// stdlib
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#define FOR_EACH_EXECUTION_STATE(STATE)                                                                              \
  STATE(Running, "Target is executing JavaScript")                                                                   \
  STATE(Paused, "Target is stopped on a breakpoint, step or pause request")                                          \
  STATE(Disconnected, "No inspector connection")

ENUM_TYPE_METADATA(ExecutionState, FOR_EACH_EXECUTION_STATE, DEFAULT_ENUM, u8)

namespace cdpr::cdp {

struct ExecutionSnapshot
{
  ExecutionState mState;
  // Reason of the last `Debugger.paused`, empty unless paused.
  std::string mPauseReason;
  // `callFrames` of the last `Debugger.paused`, null unless paused.
  Json mCallFrames;
};

// Tracks whether the debuggee runs, is paused or is gone, purely from the events the relay publishes. Operations
// that need a particular state ask it before anything goes on the wire.
class ExecutionStateMachine
{
  mutable std::mutex mMutex;
  ExecutionSnapshot mSnapshot{ ExecutionState::Disconnected, {}, nullptr };
  EventDispatcher &mDispatcher;
  std::vector<SubscriptionHandle> mSubscriptions;

  void Transition(ExecutionState next, std::string reason, Json callFrames) noexcept;

public:
  NO_COPY(ExecutionStateMachine);
  explicit ExecutionStateMachine(EventDispatcher &dispatcher) noexcept;
  ~ExecutionStateMachine() noexcept;

  // Emitted on the reactor after every state change.
  Publisher<ExecutionState> StateChanged;

  ExecutionState State() const noexcept;
  ExecutionSnapshot Snapshot() const noexcept;

  void OnSessionStarted() noexcept;
  void OnSessionStopped() noexcept;

  // StateError naming `operation` unless the target is paused.
  RelayResult<void> RequirePaused(std::string_view operation) const noexcept;
  // StateError naming `operation` unless the target is running.
  RelayResult<void> RequireRunning(std::string_view operation) const noexcept;
};

} // namespace cdpr::cdp

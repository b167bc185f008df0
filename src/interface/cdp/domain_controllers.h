/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <events/event_dispatcher.h>
#include <interface/cdp/domains.h>
#include <interface/cdp/execution_state.h>
#include <interface/cdp/protocol.h>
#include <interface/cdp/request_correlator.h>

// fmt
#include <fmt/format.h>

// stdlib
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cdpr::cdp {

// Commands and event subscriptions of one inspector domain, addressed by name.
class DomainController
{
protected:
  std::string_view mDomain;
  RequestCorrelator &mCorrelator;
  EventDispatcher &mDispatcher;
  std::vector<SubscriptionHandle> mSubscriptions;

  std::string Qualified(std::string_view name) const noexcept;

public:
  NO_COPY(DomainController);
  DomainController(std::string_view domain, RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept;
  virtual ~DomainController() noexcept;

  std::string_view
  Name() const noexcept
  {
    return mDomain;
  }

  CommandFuture Invoke(std::string_view method, Json params) noexcept;
  void Invoke(std::string_view method, Json params, CommandCallback callback) noexcept;

  // Subscribes to `<Domain>.<eventName>`. Subscriptions end with the controller at the latest.
  SubscriptionHandle On(std::string_view eventName, EventCallback callback) noexcept;
  SubscriptionHandle Once(std::string_view eventName, EventCallback callback) noexcept;
  bool Off(SubscriptionHandle handle) noexcept;
};

template <typename CommandSet, typename EventSet = void> class Domain : public DomainController
{
public:
  using Commands = CommandSet;
  using Events = EventSet;
  using DomainController::DomainController;
  using DomainController::On;
  using DomainController::Once;

  CommandFuture
  Send(CommandSet command, Json params = Json::object()) noexcept
  {
    return Invoke(Enum<CommandSet>::ToString(command), std::move(params));
  }

  void
  Send(CommandSet command, Json params, CommandCallback callback) noexcept
  {
    Invoke(Enum<CommandSet>::ToString(command), std::move(params), std::move(callback));
  }

  template <typename C = CommandSet>
  CommandFuture
  Enable() noexcept
    requires requires { C::enable; }
  {
    return Send(C::enable);
  }

  template <typename C = CommandSet>
  CommandFuture
  Disable() noexcept
    requires requires { C::disable; }
  {
    return Send(C::disable);
  }

  template <typename E = EventSet>
    requires(!std::is_void_v<E>)
  SubscriptionHandle
  On(std::type_identity_t<E> event, EventCallback callback) noexcept
  {
    return On(Enum<E>::ToString(event), std::move(callback));
  }

  template <typename E = EventSet>
    requires(!std::is_void_v<E>)
  SubscriptionHandle
  Once(std::type_identity_t<E> event, EventCallback callback) noexcept
  {
    return Once(Enum<E>::ToString(event), std::move(callback));
  }
};

class DebuggerController final : public Domain<DebuggerCommand, DebuggerEvent>
{
  ExecutionStateMachine &mStateMachine;

  // Sends `command` only if `guard` passes; a failed guard never reaches the wire.
  CommandFuture Guarded(RelayResult<void> guard, DebuggerCommand command, Json params) noexcept;

public:
  DebuggerController(RequestCorrelator &correlator,
    EventDispatcher &dispatcher,
    ExecutionStateMachine &stateMachine) noexcept;

  CommandFuture Pause() noexcept;
  CommandFuture Resume(bool terminateOnResume = false) noexcept;
  CommandFuture StepOver() noexcept;
  CommandFuture StepInto(bool breakOnAsyncCall = false) noexcept;
  CommandFuture StepOut() noexcept;

  CommandFuture SetBreakpointByUrl(std::string_view url,
    u32 lineNumber,
    std::optional<u32> columnNumber = std::nullopt,
    std::optional<std::string_view> condition = std::nullopt) noexcept;
  CommandFuture RemoveBreakpoint(std::string_view breakpointId) noexcept;
  CommandFuture SetBreakpointsActive(bool active) noexcept;
  CommandFuture SetPauseOnExceptions(PauseOnExceptions state) noexcept;
  CommandFuture EvaluateOnCallFrame(std::string_view expression, std::string_view callFrameId) noexcept;
  CommandFuture SetVariableValue(
    u32 scopeNumber, std::string_view variableName, Json newValue, std::string_view callFrameId) noexcept;
  CommandFuture RestartFrame(std::string_view callFrameId) noexcept;
  CommandFuture GetPossibleBreakpoints(Json location) noexcept;
  CommandFuture GetScriptSource(std::string_view scriptId) noexcept;
  CommandFuture SetAsyncCallStackDepth(u32 maxDepth) noexcept;
};

class RuntimeController final : public Domain<RuntimeCommand, RuntimeEvent>
{
public:
  RuntimeController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept;

  // `options` is merged into the parameters; `returnByValue` is true unless `options` says otherwise.
  CommandFuture Evaluate(std::string_view expression, Json options = Json::object()) noexcept;
  CommandFuture GetProperties(std::string_view objectId, bool ownProperties = true) noexcept;
  CommandFuture CallFunctionOn(
    std::string_view functionDeclaration, std::string_view objectId, Json arguments = Json::array()) noexcept;
  CommandFuture RunIfWaitingForDebugger() noexcept;
  CommandFuture ReleaseObject(std::string_view objectId) noexcept;
  CommandFuture GetHeapUsage() noexcept;
};

class ConsoleController final : public Domain<ConsoleCommand, ConsoleEvent>
{
public:
  ConsoleController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept;
  CommandFuture ClearMessages() noexcept;
};

class ProfilerController final : public Domain<ProfilerCommand, ProfilerEvent>
{
public:
  ProfilerController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept;
  CommandFuture Start() noexcept;
  CommandFuture Stop() noexcept;
  // Sampling interval in microseconds.
  CommandFuture SetSamplingInterval(u32 interval) noexcept;
  CommandFuture StartPreciseCoverage(bool callCount, bool detailed) noexcept;
  CommandFuture TakePreciseCoverage() noexcept;
  CommandFuture StopPreciseCoverage() noexcept;
  CommandFuture GetBestEffortCoverage() noexcept;
};

class HeapProfilerController final : public Domain<HeapProfilerCommand, HeapProfilerEvent>
{
public:
  HeapProfilerController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept;
  CommandFuture TakeHeapSnapshot(bool reportProgress = false) noexcept;
  CommandFuture StartTrackingHeapObjects(bool trackAllocations = false) noexcept;
  CommandFuture StopTrackingHeapObjects(bool reportProgress = false) noexcept;
  CommandFuture CollectGarbage() noexcept;
  CommandFuture StartSampling(std::optional<u32> samplingInterval = std::nullopt) noexcept;
  CommandFuture StopSampling() noexcept;
  CommandFuture GetObjectByHeapObjectId(std::string_view objectId) noexcept;
  CommandFuture GetHeapObjectId(std::string_view objectId) noexcept;
};

// Schema has no enable/disable and no events.
class SchemaController final : public Domain<SchemaCommand>
{
public:
  SchemaController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept;
  CommandFuture GetDomains() noexcept;
};

struct DomainControllers
{
  RuntimeController mRuntime;
  DebuggerController mDebugger;
  ConsoleController mConsole;
  ProfilerController mProfiler;
  HeapProfilerController mHeapProfiler;
  SchemaController mSchema;

  DomainControllers(
    RequestCorrelator &correlator, EventDispatcher &dispatcher, ExecutionStateMachine &stateMachine) noexcept;
};

} // namespace cdpr::cdp

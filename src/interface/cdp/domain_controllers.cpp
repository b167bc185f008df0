/** LICENSE TEMPLATE */
#include "domain_controllers.h"

// cdpr
#include <common.h>
#include <utils/logger.h>

namespace cdpr::cdp {

DomainController::DomainController(
  std::string_view domain, RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept
    : mDomain(domain), mCorrelator(correlator), mDispatcher(dispatcher)
{
}

DomainController::~DomainController() noexcept
{
  for (const auto handle : mSubscriptions) {
    mDispatcher.Unsubscribe(handle);
  }
}

std::string
DomainController::Qualified(std::string_view name) const noexcept
{
  return fmt::format("{}.{}", mDomain, name);
}

CommandFuture
DomainController::Invoke(std::string_view method, Json params) noexcept
{
  return mCorrelator.Send(Qualified(method), std::move(params));
}

void
DomainController::Invoke(std::string_view method, Json params, CommandCallback callback) noexcept
{
  mCorrelator.Send(Qualified(method), std::move(params), std::move(callback));
}

SubscriptionHandle
DomainController::On(std::string_view eventName, EventCallback callback) noexcept
{
  auto handle = mDispatcher.Subscribe(Qualified(eventName), std::move(callback));
  mSubscriptions.push_back(handle);
  return handle;
}

SubscriptionHandle
DomainController::Once(std::string_view eventName, EventCallback callback) noexcept
{
  auto handle = mDispatcher.Once(Qualified(eventName), std::move(callback));
  mSubscriptions.push_back(handle);
  return handle;
}

bool
DomainController::Off(SubscriptionHandle handle) noexcept
{
  std::erase(mSubscriptions, handle);
  return mDispatcher.Unsubscribe(handle);
}

// Debugger

DebuggerController::DebuggerController(
  RequestCorrelator &correlator, EventDispatcher &dispatcher, ExecutionStateMachine &stateMachine) noexcept
    : Domain("Debugger", correlator, dispatcher), mStateMachine(stateMachine)
{
}

CommandFuture
DebuggerController::Guarded(RelayResult<void> guard, DebuggerCommand command, Json params) noexcept
{
  if (!guard) {
    DBGLOG(cdp, "Debugger.{} rejected: {}", command, guard.error().mMessage);
    return ReadyFuture(std::move(guard.error()));
  }
  return Send(command, std::move(params));
}

CommandFuture
DebuggerController::Pause() noexcept
{
  return Guarded(mStateMachine.RequireRunning("pause"), DebuggerCommand::pause, Json::object());
}

CommandFuture
DebuggerController::Resume(bool terminateOnResume) noexcept
{
  Json params = Json::object();
  if (terminateOnResume) {
    params["terminateOnResume"] = true;
  }
  return Guarded(mStateMachine.RequirePaused("resume"), DebuggerCommand::resume, std::move(params));
}

CommandFuture
DebuggerController::StepOver() noexcept
{
  return Guarded(mStateMachine.RequirePaused("stepOver"), DebuggerCommand::stepOver, Json::object());
}

CommandFuture
DebuggerController::StepInto(bool breakOnAsyncCall) noexcept
{
  Json params = Json::object();
  if (breakOnAsyncCall) {
    params["breakOnAsyncCall"] = true;
  }
  return Guarded(mStateMachine.RequirePaused("stepInto"), DebuggerCommand::stepInto, std::move(params));
}

CommandFuture
DebuggerController::StepOut() noexcept
{
  return Guarded(mStateMachine.RequirePaused("stepOut"), DebuggerCommand::stepOut, Json::object());
}

CommandFuture
DebuggerController::SetBreakpointByUrl(std::string_view url,
  u32 lineNumber,
  std::optional<u32> columnNumber,
  std::optional<std::string_view> condition) noexcept
{
  return Send(DebuggerCommand::setBreakpointByUrl,
    Json{ { "url", url },
      { "lineNumber", lineNumber },
      { "columnNumber", columnNumber.value_or(0) },
      { "condition", condition.value_or("") } });
}

CommandFuture
DebuggerController::RemoveBreakpoint(std::string_view breakpointId) noexcept
{
  return Send(DebuggerCommand::removeBreakpoint, Json{ { "breakpointId", breakpointId } });
}

CommandFuture
DebuggerController::SetBreakpointsActive(bool active) noexcept
{
  return Send(DebuggerCommand::setBreakpointsActive, Json{ { "active", active } });
}

CommandFuture
DebuggerController::SetPauseOnExceptions(PauseOnExceptions state) noexcept
{
  return Send(DebuggerCommand::setPauseOnExceptions, Json{ { "state", Enum<PauseOnExceptions>::ToString(state) } });
}

CommandFuture
DebuggerController::EvaluateOnCallFrame(std::string_view expression, std::string_view callFrameId) noexcept
{
  return Send(DebuggerCommand::evaluateOnCallFrame,
    Json{ { "callFrameId", callFrameId }, { "expression", expression } });
}

CommandFuture
DebuggerController::SetVariableValue(
  u32 scopeNumber, std::string_view variableName, Json newValue, std::string_view callFrameId) noexcept
{
  return Send(DebuggerCommand::setVariableValue,
    Json{ { "scopeNumber", scopeNumber },
      { "variableName", variableName },
      { "newValue", std::move(newValue) },
      { "callFrameId", callFrameId } });
}

CommandFuture
DebuggerController::RestartFrame(std::string_view callFrameId) noexcept
{
  return Send(DebuggerCommand::restartFrame, Json{ { "callFrameId", callFrameId } });
}

CommandFuture
DebuggerController::GetPossibleBreakpoints(Json location) noexcept
{
  return Send(DebuggerCommand::getPossibleBreakpoints, Json{ { "start", std::move(location) } });
}

CommandFuture
DebuggerController::GetScriptSource(std::string_view scriptId) noexcept
{
  return Send(DebuggerCommand::getScriptSource, Json{ { "scriptId", scriptId } });
}

CommandFuture
DebuggerController::SetAsyncCallStackDepth(u32 maxDepth) noexcept
{
  return Send(DebuggerCommand::setAsyncCallStackDepth, Json{ { "maxDepth", maxDepth } });
}

// Runtime

RuntimeController::RuntimeController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept
    : Domain("Runtime", correlator, dispatcher)
{
}

CommandFuture
RuntimeController::Evaluate(std::string_view expression, Json options) noexcept
{
  Json params{ { "expression", expression }, { "returnByValue", true } };
  if (options.is_object()) {
    params.update(options);
  }
  return Send(RuntimeCommand::evaluate, std::move(params));
}

CommandFuture
RuntimeController::GetProperties(std::string_view objectId, bool ownProperties) noexcept
{
  return Send(RuntimeCommand::getProperties, Json{ { "objectId", objectId }, { "ownProperties", ownProperties } });
}

CommandFuture
RuntimeController::CallFunctionOn(std::string_view functionDeclaration, std::string_view objectId, Json arguments) noexcept
{
  return Send(RuntimeCommand::callFunctionOn,
    Json{ { "functionDeclaration", functionDeclaration },
      { "objectId", objectId },
      { "arguments", arguments.is_array() ? std::move(arguments) : Json::array() } });
}

CommandFuture
RuntimeController::RunIfWaitingForDebugger() noexcept
{
  return Send(RuntimeCommand::runIfWaitingForDebugger);
}

CommandFuture
RuntimeController::ReleaseObject(std::string_view objectId) noexcept
{
  return Send(RuntimeCommand::releaseObject, Json{ { "objectId", objectId } });
}

CommandFuture
RuntimeController::GetHeapUsage() noexcept
{
  return Send(RuntimeCommand::getHeapUsage);
}

// Console

ConsoleController::ConsoleController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept
    : Domain("Console", correlator, dispatcher)
{
}

CommandFuture
ConsoleController::ClearMessages() noexcept
{
  return Send(ConsoleCommand::clearMessages);
}

// Profiler

ProfilerController::ProfilerController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept
    : Domain("Profiler", correlator, dispatcher)
{
}

CommandFuture
ProfilerController::Start() noexcept
{
  return Send(ProfilerCommand::start);
}

CommandFuture
ProfilerController::Stop() noexcept
{
  return Send(ProfilerCommand::stop);
}

CommandFuture
ProfilerController::SetSamplingInterval(u32 interval) noexcept
{
  return Send(ProfilerCommand::setSamplingInterval, Json{ { "interval", interval } });
}

CommandFuture
ProfilerController::StartPreciseCoverage(bool callCount, bool detailed) noexcept
{
  return Send(ProfilerCommand::startPreciseCoverage, Json{ { "callCount", callCount }, { "detailed", detailed } });
}

CommandFuture
ProfilerController::TakePreciseCoverage() noexcept
{
  return Send(ProfilerCommand::takePreciseCoverage);
}

CommandFuture
ProfilerController::StopPreciseCoverage() noexcept
{
  return Send(ProfilerCommand::stopPreciseCoverage);
}

CommandFuture
ProfilerController::GetBestEffortCoverage() noexcept
{
  return Send(ProfilerCommand::getBestEffortCoverage);
}

// HeapProfiler

HeapProfilerController::HeapProfilerController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept
    : Domain("HeapProfiler", correlator, dispatcher)
{
}

CommandFuture
HeapProfilerController::TakeHeapSnapshot(bool reportProgress) noexcept
{
  return Send(HeapProfilerCommand::takeHeapSnapshot, Json{ { "reportProgress", reportProgress } });
}

CommandFuture
HeapProfilerController::StartTrackingHeapObjects(bool trackAllocations) noexcept
{
  return Send(HeapProfilerCommand::startTrackingHeapObjects, Json{ { "trackAllocations", trackAllocations } });
}

CommandFuture
HeapProfilerController::StopTrackingHeapObjects(bool reportProgress) noexcept
{
  return Send(HeapProfilerCommand::stopTrackingHeapObjects, Json{ { "reportProgress", reportProgress } });
}

CommandFuture
HeapProfilerController::CollectGarbage() noexcept
{
  return Send(HeapProfilerCommand::collectGarbage);
}

CommandFuture
HeapProfilerController::StartSampling(std::optional<u32> samplingInterval) noexcept
{
  Json params = Json::object();
  if (samplingInterval) {
    params["samplingInterval"] = *samplingInterval;
  }
  return Send(HeapProfilerCommand::startSampling, std::move(params));
}

CommandFuture
HeapProfilerController::StopSampling() noexcept
{
  return Send(HeapProfilerCommand::stopSampling);
}

CommandFuture
HeapProfilerController::GetObjectByHeapObjectId(std::string_view objectId) noexcept
{
  return Send(HeapProfilerCommand::getObjectByHeapObjectId, Json{ { "objectId", objectId } });
}

CommandFuture
HeapProfilerController::GetHeapObjectId(std::string_view objectId) noexcept
{
  return Send(HeapProfilerCommand::getHeapObjectId, Json{ { "objectId", objectId } });
}

// Schema

SchemaController::SchemaController(RequestCorrelator &correlator, EventDispatcher &dispatcher) noexcept
    : Domain("Schema", correlator, dispatcher)
{
}

CommandFuture
SchemaController::GetDomains() noexcept
{
  return Send(SchemaCommand::getDomains);
}

DomainControllers::DomainControllers(
  RequestCorrelator &correlator, EventDispatcher &dispatcher, ExecutionStateMachine &stateMachine) noexcept
    : mRuntime(correlator, dispatcher), mDebugger(correlator, dispatcher, stateMachine),
      mConsole(correlator, dispatcher), mProfiler(correlator, dispatcher), mHeapProfiler(correlator, dispatcher),
      mSchema(correlator, dispatcher)
{
}

} // namespace cdpr::cdp

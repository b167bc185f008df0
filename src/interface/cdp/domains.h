/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/macros.h>
#include <common/typedefs.h>

// Command and event tables of the inspector domains the relay has typed facades for. The enumerator names are
// the wire names, so `Enum<T>::ToString` gives the method part of `Domain.method`.

#define FOR_EACH_RUNTIME_COMMAND(CMD)                                                                                \
  CMD(enable)                                                                                                        \
  CMD(disable)                                                                                                       \
  CMD(evaluate)                                                                                                      \
  CMD(getProperties)                                                                                                 \
  CMD(callFunctionOn)                                                                                                \
  CMD(runIfWaitingForDebugger)                                                                                       \
  CMD(releaseObject)                                                                                                 \
  CMD(releaseObjectGroup)                                                                                            \
  CMD(getHeapUsage)                                                                                                  \
  CMD(compileScript)                                                                                                 \
  CMD(runScript)

#define FOR_EACH_RUNTIME_EVENT(EVT)                                                                                  \
  EVT(consoleAPICalled)                                                                                              \
  EVT(exceptionThrown)                                                                                               \
  EVT(exceptionRevoked)                                                                                              \
  EVT(executionContextCreated)                                                                                       \
  EVT(executionContextDestroyed)                                                                                     \
  EVT(executionContextsCleared)                                                                                      \
  EVT(inspectRequested)

#define FOR_EACH_DEBUGGER_COMMAND(CMD)                                                                               \
  CMD(enable)                                                                                                        \
  CMD(disable)                                                                                                       \
  CMD(pause)                                                                                                         \
  CMD(resume)                                                                                                        \
  CMD(stepOver)                                                                                                      \
  CMD(stepInto)                                                                                                      \
  CMD(stepOut)                                                                                                       \
  CMD(setBreakpointByUrl)                                                                                            \
  CMD(setBreakpoint)                                                                                                 \
  CMD(removeBreakpoint)                                                                                              \
  CMD(setBreakpointsActive)                                                                                          \
  CMD(setPauseOnExceptions)                                                                                          \
  CMD(getScriptSource)                                                                                               \
  CMD(continueToLocation)                                                                                            \
  CMD(setVariableValue)                                                                                              \
  CMD(setScriptSource)                                                                                               \
  CMD(restartFrame)                                                                                                  \
  CMD(setAsyncCallStackDepth)                                                                                        \
  CMD(setBlackboxPatterns)                                                                                           \
  CMD(setSkipAllPauses)                                                                                              \
  CMD(evaluateOnCallFrame)                                                                                           \
  CMD(getPossibleBreakpoints)

#define FOR_EACH_DEBUGGER_EVENT(EVT)                                                                                 \
  EVT(scriptParsed)                                                                                                  \
  EVT(scriptFailedToParse)                                                                                           \
  EVT(paused)                                                                                                        \
  EVT(resumed)                                                                                                       \
  EVT(breakpointResolved)

#define FOR_EACH_CONSOLE_COMMAND(CMD)                                                                                \
  CMD(enable)                                                                                                        \
  CMD(disable)                                                                                                       \
  CMD(clearMessages)

#define FOR_EACH_CONSOLE_EVENT(EVT) EVT(messageAdded)

#define FOR_EACH_PROFILER_COMMAND(CMD)                                                                               \
  CMD(enable)                                                                                                        \
  CMD(disable)                                                                                                       \
  CMD(start)                                                                                                         \
  CMD(stop)                                                                                                          \
  CMD(setSamplingInterval)                                                                                           \
  CMD(startPreciseCoverage)                                                                                          \
  CMD(stopPreciseCoverage)                                                                                           \
  CMD(takePreciseCoverage)                                                                                           \
  CMD(getBestEffortCoverage)

#define FOR_EACH_PROFILER_EVENT(EVT)                                                                                 \
  EVT(consoleProfileStarted)                                                                                         \
  EVT(consoleProfileFinished)

#define FOR_EACH_HEAP_PROFILER_COMMAND(CMD)                                                                          \
  CMD(enable)                                                                                                        \
  CMD(disable)                                                                                                       \
  CMD(takeHeapSnapshot)                                                                                              \
  CMD(startTrackingHeapObjects)                                                                                      \
  CMD(stopTrackingHeapObjects)                                                                                       \
  CMD(collectGarbage)                                                                                                \
  CMD(getObjectByHeapObjectId)                                                                                       \
  CMD(getHeapObjectId)                                                                                               \
  CMD(startSampling)                                                                                                 \
  CMD(stopSampling)                                                                                                  \
  CMD(addInspectedHeapObject)

#define FOR_EACH_HEAP_PROFILER_EVENT(EVT)                                                                            \
  EVT(addHeapSnapshotChunk)                                                                                          \
  EVT(heapStatsUpdate)                                                                                               \
  EVT(lastSeenObjectId)                                                                                              \
  EVT(reportHeapSnapshotProgress)                                                                                    \
  EVT(resetProfiles)

#define FOR_EACH_SCHEMA_COMMAND(CMD) CMD(getDomains)

// Values of Debugger.setPauseOnExceptions `state`.
#define FOR_EACH_PAUSE_ON_EXCEPTIONS(STATE)                                                                          \
  STATE(none)                                                                                                        \
  STATE(uncaught)                                                                                                    \
  STATE(all)

ENUM_TYPE_METADATA(RuntimeCommand, FOR_EACH_RUNTIME_COMMAND, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(RuntimeEvent, FOR_EACH_RUNTIME_EVENT, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(DebuggerCommand, FOR_EACH_DEBUGGER_COMMAND, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(DebuggerEvent, FOR_EACH_DEBUGGER_EVENT, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(ConsoleCommand, FOR_EACH_CONSOLE_COMMAND, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(ConsoleEvent, FOR_EACH_CONSOLE_EVENT, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(ProfilerCommand, FOR_EACH_PROFILER_COMMAND, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(ProfilerEvent, FOR_EACH_PROFILER_EVENT, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(HeapProfilerCommand, FOR_EACH_HEAP_PROFILER_COMMAND, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(HeapProfilerEvent, FOR_EACH_HEAP_PROFILER_EVENT, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(SchemaCommand, FOR_EACH_SCHEMA_COMMAND, DEFAULT_ENUM, u8)
ENUM_TYPE_METADATA(PauseOnExceptions, FOR_EACH_PAUSE_ON_EXCEPTIONS, DEFAULT_ENUM, u8)

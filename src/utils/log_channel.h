/** LICENSE TEMPLATE */
#pragma once

#include <common/macros.h>

#define FOR_EACH_LOG(LOGCHANNEL)                                                                                  \
  LOGCHANNEL(core, "Relay Core", "Messages that don't have a intuitive log channel can be logged here.")          \
  LOGCHANNEL(relay, "Protocol Relay", "Client/upstream connection lifecycle and id remapping.")                   \
  LOGCHANNEL(cdp, "DevTools Protocol", "Commands, responses and events of the inspector protocol.")               \
  LOGCHANNEL(process, "Debuggee Process", "Spawning, output and exit of the debuggee process.")                   \
  LOGCHANNEL(session, "Debug Sessions", "Session start/stop orchestration and execution state changes.")          \
  LOGCHANNEL(http, "Session REST API", "Requests served by the REST session API.")                                \
  LOGCHANNEL(warning, "Warnings", "Unexpected behaviors should be logged to this chanel")

ENUM_TYPE_METADATA(Channel, FOR_EACH_LOG, DEFAULT_ENUM, i8)

/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common.h>
#include <configuration/command_line.h>
#include <utils/log_channel.h>

// stdlib
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace cdpr::cfg {

class RelayConfiguration
{
  // Construction only allowed via `ConfigureWithParser`
  RelayConfiguration() noexcept = default;

public:
  std::filesystem::path mWorkspaceRoot;
  std::filesystem::path mLogDirectory;
  // REST session API
  u16 mApiPort;
  // Downstream WebSocket proxy
  u16 mProxyPort;
  // --inspect port handed to the debuggee
  u16 mInspectPort;
  std::string mInspectHost;
  // Listen address for the API and the proxy
  std::string mBindAddress;
  std::string mDebuggeeExecutable;
  bool mBreakOnStart;
  u32 mCommandTimeoutMs;
  u32 mHandshakeTimeoutMs;
  u32 mKillGraceMs;
  std::vector<Channel> mLogChannels;

  std::chrono::milliseconds
  CommandTimeout() const noexcept
  {
    return std::chrono::milliseconds{ mCommandTimeoutMs };
  }

  std::chrono::milliseconds
  HandshakeTimeout() const noexcept
  {
    return std::chrono::milliseconds{ mHandshakeTimeoutMs };
  }

  std::chrono::milliseconds
  KillGrace() const noexcept
  {
    return std::chrono::milliseconds{ mKillGraceMs };
  }

  // Registers every option and environment variable with `parser`, bound to the returned configuration.
  static std::unique_ptr<RelayConfiguration> ConfigureWithParser(CommandLineRegistry &parser) noexcept;
};
} // namespace cdpr::cfg

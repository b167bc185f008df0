/** LICENSE TEMPLATE */
#include "config.h"

// cdpr
#include <configuration/command_line.h>
#include <utils/util.h>

// stdlib
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <memory>

namespace cdpr::cfg {

static ParseResult<u16>
ParsePort(ArgIterator &it) noexcept
{
  auto arg = TryExpected(it);
  u32 number = 0;
  auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), number);
  if (ec != std::errc() || ptr != arg.data() + arg.size()) {
    return it.Error(ParseErrorType::InvalidFormat);
  }
  if (number == 0 || number > 65535) {
    return it.Error(ParseErrorType::PortOutOfRange);
  }
  return static_cast<u16>(number);
}

static ParseResult<fs::path>
ParseExistingDirectory(ArgIterator &it) noexcept
{
  auto arg = TryExpected(it);
  std::error_code ec;
  if (fs::is_directory(arg, ec)) {
    return fs::path{ arg };
  }
  return it.Error(ParseErrorType::DirectoryDoesNotExist);
}

std::unique_ptr<RelayConfiguration>
RelayConfiguration::ConfigureWithParser(CommandLineRegistry &parser) noexcept
{
  auto config = std::unique_ptr<RelayConfiguration>(new RelayConfiguration{});

  parser.AddOption<ArgIterator &>("-w",
    "--workspace",
    "Root directory debug targets are resolved against. Targets that resolve outside of it are refused. The "
    "directory must exist.",
    config->mWorkspaceRoot,
    &ParseExistingDirectory,
    fs::current_path());

  parser.AddOption<ArgIterator &>(
    "-p", "--port", "Port of the REST session API.", config->mApiPort, &ParsePort, u16{ 8080 });

  parser.AddOption<ArgIterator &>("",
    "--proxy-port",
    "Port the WebSocket proxy accepts DevTools clients on.",
    config->mProxyPort,
    &ParsePort,
    u16{ 8888 });

  parser.AddOption<ArgIterator &>("",
    "--inspect-port",
    "Port the debuggee's inspector listens on (passed as --inspect=<host>:<port>).",
    config->mInspectPort,
    &ParsePort,
    u16{ 9229 });

  parser.AddOption<ArgIterator &>("",
    "--host",
    "Host the debuggee's inspector binds to.",
    config->mInspectHost,
    &FromTraits<std::string>::From,
    std::string{ "127.0.0.1" });

  parser.AddOption<ArgIterator &>("",
    "--bind",
    "Address the REST API and the WebSocket proxy listen on.",
    config->mBindAddress,
    &FromTraits<std::string>::From,
    std::string{ "127.0.0.1" });

  parser.AddOption<ArgIterator &>("",
    "--node",
    "Executable used to run debug targets. Looked up in PATH unless it contains a '/'.",
    config->mDebuggeeExecutable,
    &FromTraits<std::string>::From,
    std::string{ "node" });

  parser.AddOption<ArgIterator &>("",
    "--break-on-start",
    "Start debuggees with --inspect-brk so they stop before the first statement. Sessions can still override "
    "this per request.",
    config->mBreakOnStart,
    &FlagIsSet,
    false);

  parser.AddOption<ArgIterator &>("",
    "--timeout",
    "Milliseconds a DevTools command may stay unanswered before it fails with a timeout.",
    config->mCommandTimeoutMs,
    &FromTraits<u32>::From,
    5000u);

  parser.AddOption<ArgIterator &>("",
    "--handshake-timeout",
    "Milliseconds to wait for the debuggee to announce its inspector endpoint and for the WebSocket handshake.",
    config->mHandshakeTimeoutMs,
    &FromTraits<u32>::From,
    10000u);

  parser.AddOption<ArgIterator &>("",
    "--kill-grace",
    "Milliseconds between SIGTERM and SIGKILL when stopping a debuggee.",
    config->mKillGraceMs,
    &FromTraits<u32>::From,
    5000u);

  parser.AddOption<ArgIterator &>("-l",
    "--log",
    "The directory where log files should be saved. If that directory doesn't exist, it will not be created for "
    "you, and cdpr will terminate.",
    config->mLogDirectory,
    &ParseExistingDirectory,
    fs::current_path());

  parser.AddLambdaCommand("-h", "--help", "Print this help and exit.", [&parser](ArgIterator &) noexcept {
    parser.PrintHelp();
    parser.RequestExit();
  });

#define LOG_HELP(channel, name, help) "\n - " #channel ": " help

  parser.AddEnvironmentVariable<std::vector<Channel>>("LOG",
    "Configure what logging channels should be opened (comma separated, or 'all'). Without it every channel is "
    "opened." FOR_EACH_LOG(LOG_HELP),
    config->mLogChannels,
    [](std::string_view &stringView) -> ParseResult<std::vector<Channel>> {
      std::vector<Channel> result{};
      auto splits = SplitString(stringView, ',');
      if (std::ranges::any_of(splits, [](std::string_view cfg) { return Trim(cfg) == "all"; })) {
        CopyTo(Enum<Channel>::Variants(), result);
        return result;
      }

      result.reserve(splits.size());
      for (const auto &el : splits) {
        if (const auto chan = Enum<Channel>::FromString(Trim(el)); chan) {
          result.push_back(*chan);
        }
      }
      return result;
    });
#undef LOG_HELP

  return config;
}
} // namespace cdpr::cfg

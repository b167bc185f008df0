/** LICENSE TEMPLATE */
#pragma once
#include <array>
#include <atomic>
#include <common/macros.h>
#include <common/typedefs.h>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <mutex>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utils/log_channel.h>

namespace cdpr::logging {

struct LogChannel
{
  std::mutex mChannelMutex;
  std::fstream mFileStream;
  void LogMessage(const char *file, u32 line, u32 column, std::string_view message) noexcept;
  void LogMessage(const char *file, u32 line, u32 column, const std::string &message) noexcept;
  void Log(std::string_view msg) noexcept;
};

class Logger
{
  static Logger *sLoggerInstance;
  std::atomic<uint64_t> mSequenceId{ 0 };

public:
  Logger() noexcept = default;
  ~Logger() noexcept;
  void SetupChannel(const std::filesystem::path &logDirectory, Channel id) noexcept;
  void Log(Channel id, std::string_view log_msg) noexcept;
  static Logger *GetLogger() noexcept;
  static uint64_t GetLogMessageId() noexcept;

  void OnAbort() noexcept;
  LogChannel *GetLogChannel(Channel id) noexcept;

  static void
  LogIf(Channel id, const char *file, u32 line, u32 column, std::string_view message) noexcept
  {
    if (auto *channel = GetLogger()->GetLogChannel(id); channel) {
      channel->LogMessage(file, line, column, message);
    }
  }

  static void
  LogIf(Channel id, std::string_view message) noexcept
  {
    if (auto *channel = GetLogger()->GetLogChannel(id); channel) {
      channel->Log(message);
    }
  }

  /// Opens `<logDirectory>/<channel>.log` for each of `channels`. An empty set opens every channel.
  static void ConfigureLogging(const std::filesystem::path &logDirectory, std::span<const Channel> channels) noexcept;

private:
  std::array<LogChannel *, Enum<Channel>::Count()> LogChannels{};
};

Logger *GetLogger() noexcept;
LogChannel *GetLogChannel(Channel id) noexcept;

#if defined(CDPR_DEBUG) and CDPR_DEBUG == 1

// CONDITIONAL DEBUG LOG
#define CDLOG(condition, channel_name, ...)                                                                          \
  if ((condition)) {                                                                                                 \
    auto LOC = std::source_location::current();                                                                      \
    if (auto logChannel = cdpr::logging::GetLogChannel(Channel::channel_name); logChannel) {                         \
      logChannel->LogMessage(LOC.file_name(), LOC.line() - 1, LOC.column() - 2, fmt::format(__VA_ARGS__));           \
    }                                                                                                                \
  }
#else
#define CDLOG(...)
#endif

#define DBGLOG(channel, ...)                                                                                         \
  if (auto logChannel = cdpr::logging::GetLogChannel(Channel::channel); logChannel) {                                \
    std::source_location srcLoc = std::source_location::current();                                                   \
    logChannel->LogMessage(srcLoc.file_name(), srcLoc.line() - 1, srcLoc.column() - 2, ::fmt::format(__VA_ARGS__));  \
  }

#define DBGLOG_STR(channel, str)                                                                                     \
  if (auto logChannel = cdpr::logging::GetLogChannel(Channel::channel); logChannel) {                                \
    std::source_location srcLoc = std::source_location::current();                                                   \
    logChannel->LogMessage(srcLoc.file_name(), srcLoc.line() - 1, srcLoc.column() - 2, str);                         \
  }

} // namespace cdpr::logging

/** LICENSE TEMPLATE */
#include "logger.h"
#include <common.h>
#include <fmt/format.h>
#include <utility>

namespace cdpr::logging {

logging::Logger *logging::Logger::sLoggerInstance = new logging::Logger{};

/* static */
void
Logger::ConfigureLogging(const std::filesystem::path &logDirectory, std::span<const Channel> channels) noexcept
{
  if (channels.empty()) {
    channels = Enum<Channel>::Variants();
  }
  for (auto channel : channels) {
    if (sLoggerInstance->GetLogChannel(channel) == nullptr) {
      sLoggerInstance->SetupChannel(logDirectory, channel);
    }
  }
  DBGLOG(core, "channels set: {}", channels.size());
}

Logger::~Logger() noexcept
{
  for (auto ptr : LogChannels) {
    if (ptr) {
      ptr->mFileStream.flush();
      ptr->mFileStream.close();
      delete ptr;
    }
  }
}

void
Logger::SetupChannel(const Path &logDirectory, Channel id) noexcept
{
  VERIFY(LogChannels[std::to_underlying(id)] == nullptr, "Channel {} already created", id);
  Path p = logDirectory / fmt::format("{}.log", id);
  auto channel = new LogChannel{ .mChannelMutex = {},
    .mFileStream = std::fstream{ p, std::ios_base::in | std::ios_base::out | std::ios_base::trunc } };
  if (!channel->mFileStream.is_open()) {
    channel->mFileStream.open(p, std::ios_base::out | std::ios_base::trunc);
  }
  LogChannels[std::to_underlying(id)] = channel;
}

void
Logger::Log(Channel id, std::string_view log_msg) noexcept
{
  if (auto ptr = LogChannels[std::to_underlying(id)]; ptr) {
    ptr->Log(log_msg);
  }
}

Logger *
Logger::GetLogger() noexcept
{
  return Logger::sLoggerInstance;
}

/* static */
uint64_t
Logger::GetLogMessageId() noexcept
{
  return (*GetLogger()).mSequenceId++;
}

void
Logger::OnAbort() noexcept
{
  for (auto chan : LogChannels) {
    if (chan != nullptr) {
      chan->mFileStream.flush();
      chan->mFileStream.close();
    }
  }
}

void
LogChannel::LogMessage(const char *file, u32 line, u32 column, std::string_view message) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  const auto id = Logger::GetLogMessageId();
  mFileStream << '[' << id << "] " << message;
  char buf[1024];
  auto it = fmt::format_to_n(buf, sizeof(buf) - 1, " [{}:{}]", file, line).out;
  *it = 0;
  mFileStream << buf << std::endl;
}

void
LogChannel::LogMessage(const char *file, u32 line, u32 column, const std::string &message) noexcept
{
  LogMessage(file, line, column, std::string_view{ message });
}

void
LogChannel::Log(std::string_view msg) noexcept
{
  std::lock_guard guard{ mChannelMutex };
  mFileStream << msg << std::endl;
}

LogChannel *
Logger::GetLogChannel(Channel id) noexcept
{
  return LogChannels[std::to_underlying(id)];
}

Logger *
GetLogger() noexcept
{
  return Logger::GetLogger();
}

LogChannel *
GetLogChannel(Channel id) noexcept
{
  return GetLogger()->GetLogChannel(id);
}

} // namespace cdpr::logging

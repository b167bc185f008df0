/** LICENSE TEMPLATE */
#include "command_line.h"

// cdpr
#include <common.h>

// fmt
#include <fmt/core.h>

// stdlib
#include <cstdlib>
#include <iterator>

// system
#include <sys/ioctl.h>
#include <unistd.h>

namespace cdpr::cfg {
CommandLineResult
CommandLineRegistry::Parse(int argc, const char **argv) noexcept
{
  CommandLineResult result{};

  result.mErrors.reserve(argc > 1 ? argc - 1 : 0);
  for (auto &opt : GetOptions()) {
    opt->ApplyDefault();
  }
  ArgIterator it(argc, argv);
  while (it.HasNext()) {
    auto current = it.BeginNext();

    if (auto optionIter = mOptions.find(current); optionIter != std::end(mOptions)) {
      auto res = optionIter->second->Parse(it);
      if (!res) {
        result.mErrors.push_back(std::move(res.error()));
      }
    } else if (auto cmdIter = mCommands.find(current); cmdIter != std::end(mCommands)) {
      cmdIter->second->Exec(it);
    } else {
      result.mErrors.push_back(it.Error(ParseErrorType::UnrecognizedArgument).error());
    }
  }

  // Environment variables fail silently, they're not intended to be "hard options".
  ParseEnvironmentVariableOptions();
  mParseCompleted = true;
  result.mExitRequested = mExitRequested;
  return result;
}

void
CommandLineRegistry::ParseEnvironmentVariableOptions() noexcept
{
  for (auto &opt : GetEnvironmentVariableOptions()) {
    opt->ApplyDefault();
  }

  for (const auto &[k, v] : mEnvironmentVariables) {
    const std::string name{ k };
    if (auto value = std::getenv(name.c_str()); value) {
      if (auto res = v->Parse(std::string_view{ value }); !res) {
        v->ApplyDefault();
      }
    }
  }
}

std::pair<u16, u16>
CommandLineRegistry::GetTerminalSize() const noexcept
{
  struct winsize terminalSize;

  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &terminalSize) == 0 && terminalSize.ws_col > 0) {
    auto leftColumnWidth = static_cast<u16>(terminalSize.ws_col * 0.25);
    if (leftColumnWidth <= mLeftColumnDisplayWidth) {
      leftColumnWidth = mLeftColumnDisplayWidth + 1;
    } else {
      leftColumnWidth = std::max<u16>(leftColumnWidth, mLeftColumnDisplayWidth + 4);
    }
    const auto rightColumnWidth = static_cast<u16>(std::max(terminalSize.ws_col - leftColumnWidth, 20));

    return std::pair<u16, u16>{ leftColumnWidth, rightColumnWidth };
  }
  const auto left = static_cast<u16>(mLeftColumnDisplayWidth + 1);
  return std::pair<u16, u16>{ left, static_cast<u16>(std::max(100 - left, 20)) };
}

void
CommandLineRegistry::PrintHelpAbout(const OptionMetadata &option, u16 leftColumn, u16 rightColumn) const noexcept
{
  fmt::memory_buffer buffer;
  auto it = std::back_inserter(buffer);
  it = fmt::format_to(it, "  ");
  if (!option.mShortName.empty()) {
    it = fmt::format_to(it, "{}, ", option.mShortName);
  }
  it = fmt::format_to(it, "{}", option.mLongName);
  if (!option.mIsFlag) {
    it = fmt::format_to(it, "{}", kValuePlaceHolder);
  }
  const auto written = buffer.size();
  if (written < leftColumn) {
    it = fmt::format_to(it, "{:<{}}", "", leftColumn - written);
  }

  const auto lines = option.mInfo.CreateLinesOfWidth(rightColumn);
  const auto span = std::span{ lines };
  for (const auto &line : span.subspan(0, std::min<size_t>(1, span.size()))) {
    it = fmt::format_to(it, "{}\n", line);
  }
  if (!span.empty()) {
    for (const auto &line : span.subspan(1)) {
      it = fmt::format_to(it, "{:<{}}{}\n", "", leftColumn, line);
    }
  } else {
    it = fmt::format_to(it, "\n");
  }
  fmt::print("{}", fmt::to_string(buffer));
}

void
CommandLineRegistry::PrintHelp() const noexcept
{
  fmt::print("Usage:\n\n");
  fmt::print("  cdpr [options]\n\n");
  fmt::print("Options:\n\n");

  const auto [leftColumn, rightColumn] = GetTerminalSize();

  for (const auto &option : GetOptions()) {
    PrintHelpAbout(*option, leftColumn, rightColumn);
  }

  for (const auto &command : GetCommands()) {
    OptionMetadata metadata{ std::string{ command->mShortName },
      std::string{ command->mLongName },
      command->mHelpMessage,
      true };
    PrintHelpAbout(metadata, leftColumn, rightColumn);
  }

  fmt::print("\nEnvironment variables:\n\n");
  for (const auto &envVar : GetEnvironmentVariableOptions()) {
    PrintHelpAbout(*envVar, leftColumn, rightColumn);
  }
}

} // namespace cdpr::cfg

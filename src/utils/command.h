/** LICENSE TEMPLATE */
#pragma once

#include <common/typedefs.h>

// stdlib
#include <cctype>
#include <utility>
#include <string_view>
#include <vector>

namespace cdpr {
struct HelpMessage
{
  std::string_view mInfo{};

  constexpr HelpMessage() noexcept = default;
  constexpr HelpMessage(std::string_view message) noexcept : mInfo(message) {}
  constexpr HelpMessage(const char *message) noexcept : mInfo(message) {}

  // Splits the help text into lines no wider than `width`, breaking on the last white space before the edge.
  // Explicit '\n' in the text always starts a new line.
  template <PushBackContainer ContainerType>
  void
  CreateLinesOfWidth(ContainerType &outResult, size_t width) const noexcept
  {
    size_t lastWordBoundary = 0;
    auto txt = mInfo;
    i64 i = 0;

    const auto consumePrefix = [&](auto prefixLen, bool recordLine) noexcept {
      if (recordLine) {
        outResult.push_back(txt.substr(0, prefixLen));
      }
      txt.remove_prefix(prefixLen);
      i = -1;
      lastWordBoundary = 0;
    };

    for (; i < static_cast<i64>(txt.size()); ++i) {
      lastWordBoundary = std::isspace(txt[i]) ? i : lastWordBoundary;
      if (txt[i] == '\n') {
        if (i == 0) {
          consumePrefix(1, false);
          continue;
        }
        const auto subLength = (lastWordBoundary == 0 ? i : lastWordBoundary);
        consumePrefix(subLength, true);
        consumePrefix(1, false);
        continue;
      }
      if (i == static_cast<i64>(width)) {
        const auto subLength = lastWordBoundary == 0 ? width : lastWordBoundary;
        consumePrefix(subLength, true);
      }
    }
    if (!txt.empty()) {
      outResult.push_back(txt);
    }
  }

  std::vector<std::string_view>
  CreateLinesOfWidth(size_t width) const noexcept
  {
    std::vector<std::string_view> result;
    CreateLinesOfWidth(result, width);
    return result;
  }
};

} // namespace cdpr

namespace cdpr::cfg {
class ArgIterator;
}

namespace cdpr::cmd {

// A command line entry that acts immediately instead of storing a value (e.g. --help).
struct ICommand
{
  std::string_view mLongName;
  std::string_view mShortName;
  HelpMessage mHelpMessage;
  virtual void Exec(cdpr::cfg::ArgIterator &it) noexcept = 0;
  virtual ~ICommand() noexcept = default;
};

template <typename Fn> struct LambdaCommand final : public ICommand
{
  Fn mLambda;

  LambdaCommand() = delete;
  LambdaCommand(const LambdaCommand &) = delete;
  LambdaCommand &operator=(const LambdaCommand &) = delete;
  LambdaCommand(LambdaCommand &&rhs) noexcept = default;
  LambdaCommand &operator=(LambdaCommand &&rhs) noexcept = default;

  constexpr LambdaCommand(Fn &&lambda) noexcept : mLambda(std::move(lambda)) {}
  ~LambdaCommand() noexcept final = default;

  void
  Exec(cdpr::cfg::ArgIterator &it) noexcept final
  {
    mLambda(it);
  }
};
} // namespace cdpr::cmd

/** LICENSE TEMPLATE */
#include "argslist.h"
#include <common.h>

namespace cdpr {

PosixArgsList::PosixArgsList(std::vector<std::string> &&args) noexcept : mArgs(std::move(args))
{
  VERIFY(!mArgs.empty(), "An argument list needs at least the program");
  mCStringArgs.reserve(mArgs.size() + 1);
  for (const auto &str : mArgs) {
    mCStringArgs.push_back(str.c_str());
  }
  mCStringArgs.push_back(nullptr);
}

const char *
PosixArgsList::Program() const noexcept
{
  return mCStringArgs.front();
}

char *const *
PosixArgsList::Argv() const noexcept
{
  return const_cast<char *const *>(mCStringArgs.data());
}

std::span<const std::string>
PosixArgsList::Args() const noexcept
{
  return std::span{ mArgs };
}

} // namespace cdpr

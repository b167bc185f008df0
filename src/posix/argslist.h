/** LICENSE TEMPLATE */
#pragma once
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cdpr {

/**
 * A program and its arguments in the shape exec(3) wants: a nullptr terminated array of C strings where the first
 * entry is the program itself. Build it before fork(), the child must not allocate.
 */
class PosixArgsList
{
public:
  explicit PosixArgsList(std::vector<std::string> &&args) noexcept;

  const char *Program() const noexcept;
  char *const *Argv() const noexcept;
  std::span<const std::string> Args() const noexcept;

private:
  std::vector<std::string> mArgs;
  std::vector<const char *> mCStringArgs;
};

} // namespace cdpr

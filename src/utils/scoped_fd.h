/** LICENSE TEMPLATE */
#pragma once
#include <common.h>
#include <common/error.h>
#include <common/typedefs.h>

namespace cdpr {

// Owns a file descriptor and closes it when it goes out of scope.
class ScopedFd
{
public:
  ScopedFd() noexcept;
  explicit ScopedFd(int fd) noexcept;
  ScopedFd &operator=(ScopedFd &&other) noexcept;
  ScopedFd(ScopedFd &&) noexcept;
  ScopedFd(const ScopedFd &) = delete;
  ScopedFd &operator=(const ScopedFd &) = delete;
  ~ScopedFd() noexcept;

  int Get() const noexcept;
  bool IsOpen() const noexcept;
  void Close() noexcept;
  // Gives up ownership without closing and returns the descriptor.
  int Release() noexcept;

  static ScopedFd TakeFileDescriptorOwnership(int fd) noexcept;

private:
  int mFd;
};

struct Pipe
{
  ScopedFd mRead;
  ScopedFd mWrite;

  // pipe2(2) with `flags` (O_CLOEXEC, O_NONBLOCK, ...). ProcessError on failure.
  static RelayResult<Pipe> Create(int flags) noexcept;
};

} // namespace cdpr

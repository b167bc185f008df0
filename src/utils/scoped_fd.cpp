/** LICENSE TEMPLATE */
#include "scoped_fd.h"
#include <utils/logger.h>

// system
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace cdpr {

ScopedFd::ScopedFd() noexcept : mFd(-1) {}

ScopedFd::ScopedFd(int fd) noexcept : mFd(fd)
{
  VERIFY(fd != -1, "Taking ownership of a closed file or error file: {}", strerror(errno));
}

ScopedFd::ScopedFd(ScopedFd &&other) noexcept : mFd(other.mFd) { other.mFd = -1; }

ScopedFd &
ScopedFd::operator=(ScopedFd &&other) noexcept
{
  if (this == &other) {
    return *this;
  }
  Close();
  mFd = other.mFd;
  other.mFd = -1;
  return *this;
}

ScopedFd::~ScopedFd() noexcept { Close(); }

int
ScopedFd::Get() const noexcept
{
  return mFd;
}

bool
ScopedFd::IsOpen() const noexcept
{
  return mFd != -1;
}

void
ScopedFd::Close() noexcept
{
  if (mFd >= 0) {
    if (::close(mFd) != 0 && errno != EINTR && errno != EIO) {
      PANIC("Failed to close file");
    }
  }
  mFd = -1;
}

int
ScopedFd::Release() noexcept
{
  const auto fd = mFd;
  mFd = -1;
  return fd;
}

/*static*/
ScopedFd
ScopedFd::TakeFileDescriptorOwnership(int fd) noexcept
{
  return ScopedFd{ fd };
}

/* static */
RelayResult<Pipe>
Pipe::Create(int flags) noexcept
{
  int fds[2];
  if (::pipe2(fds, flags) == -1) {
    const auto err = errno;
    DBGLOG(process, "pipe2 failed: {}", strerror(err));
    return std::unexpected(RelayError::Process(fmt::format("pipe2 failed: {}", strerror(err))));
  }
  return Pipe{ ScopedFd{ fds[0] }, ScopedFd{ fds[1] } };
}

} // namespace cdpr

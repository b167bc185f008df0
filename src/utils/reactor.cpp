/** LICENSE TEMPLATE */
#include "reactor.h"

// cdpr
#include <common.h>
#include <utils/logger.h>

// system
#include <linux/prctl.h>
#include <sys/prctl.h>

namespace cdpr {

Reactor::Reactor(std::string threadName) noexcept : mThreadName(std::move(threadName)), mContext(1) {}

Reactor::~Reactor() noexcept
{
  Stop();
  Join();
}

boost::asio::io_context &
Reactor::Context() noexcept
{
  return mContext;
}

void
Reactor::Start() noexcept
{
  VERIFY(!mStarted, "Reactor {} already started", mThreadName);
  mStarted = true;
  mWorkGuard.emplace(boost::asio::make_work_guard(mContext));
  mThread = std::jthread([this]() { Run(); });
  mThreadId = mThread.get_id();
}

void
Reactor::Run() noexcept
{
  // The kernel truncates thread names to 15 characters.
  VERIFY(prctl(PR_SET_NAME, mThreadName.substr(0, 15).c_str()) != -1, "Failed to set reactor thread name.");
  DBGLOG(core, "reactor {} running", mThreadName);
  const auto handled = mContext.run();
  DBGLOG(core, "reactor {} done after {} handlers", mThreadName, handled);
}

void
Reactor::Stop() noexcept
{
  mWorkGuard.reset();
  mContext.stop();
}

void
Reactor::Join() noexcept
{
  if (mThread.joinable()) {
    mThread.join();
  }
}

bool
Reactor::IsReactorThread() const noexcept
{
  return std::this_thread::get_id() == mThreadId;
}

} // namespace cdpr

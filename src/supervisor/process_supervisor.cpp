/** LICENSE TEMPLATE */
#include "process_supervisor.h"

// cdpr
#include <posix/argslist.h>
#include <utils/logger.h>

// boost
#include <boost/asio/post.hpp>

// stdlib
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <regex>

// system
#include <csignal>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cdpr {

ProcessSupervisor::ProcessSupervisor(boost::asio::io_context &context, SupervisorSettings settings) noexcept
    : mContext(context), mSettings(std::move(settings)), mChildSignals(context, SIGCHLD)
{
  WaitForChildSignal();
}

ProcessSupervisor::~ProcessSupervisor() noexcept
{
  boost::system::error_code ignored;
  mChildSignals.cancel(ignored);
  std::optional<Pid> pid;
  {
    std::lock_guard lock{ mMutex };
    pid = mPid;
    mPid.reset();
  }
  if (pid) {
    DBGLOG(process, "supervisor going away, killing {}", *pid);
    ::kill(*pid, SIGKILL);
    int status = 0;
    while (::waitpid(*pid, &status, 0) == -1 && errno == EINTR) {
    }
  }
}

void
ProcessSupervisor::WaitForChildSignal() noexcept
{
  mChildSignals.async_wait([this](const boost::system::error_code &ec, int) {
    if (ec) {
      return;
    }
    ReapChild();
    WaitForChildSignal();
  });
}

RelayResult<Pid>
ProcessSupervisor::Open(u16 port, const std::string &host, bool breakOnStart, const Path &script) noexcept
{
  {
    std::lock_guard lock{ mMutex };
    if (mPid) {
      return std::unexpected(
        RelayError::SessionConflict(fmt::format("A debuggee is already running (pid {})", *mPid)));
    }
  }

  auto output = Pipe::Create(O_CLOEXEC);
  if (!output) {
    return std::unexpected(std::move(output.error()));
  }
  // Closed by a successful exec. Carries errno back when exec fails.
  auto execStatus = Pipe::Create(O_CLOEXEC);
  if (!execStatus) {
    return std::unexpected(std::move(execStatus.error()));
  }

  // Everything the child needs is allocated before fork.
  const PosixArgsList args{ { mSettings.mExecutable,
    fmt::format("--inspect{}={}:{}", breakOnStart ? "-brk" : "", host, port),
    script.string() } };
  const int outputFd = output->mWrite.Get();
  const int statusFd = execStatus->mWrite.Get();

  const Pid pid = ::fork();
  if (pid == -1) {
    const auto err = errno;
    return std::unexpected(RelayError::Process(fmt::format("fork failed: {}", strerror(err))));
  }

  if (pid == 0) {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_DFL;
    for (int i = 1; i <= 31; ++i) {
      if (i == SIGKILL || i == SIGSTOP) {
        continue;
      }
      sigaction(i, &sa, nullptr);
    }
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    if (::dup2(outputFd, STDOUT_FILENO) == -1 || ::dup2(outputFd, STDERR_FILENO) == -1) {
      const int err = errno;
      [[maybe_unused]] auto written = ::write(statusFd, &err, sizeof(err));
      _exit(127);
    }
    ::execvp(args.Program(), args.Argv());
    const int err = errno;
    [[maybe_unused]] auto written = ::write(statusFd, &err, sizeof(err));
    _exit(127);
  }

  output->mWrite.Close();
  execStatus->mWrite.Close();

  int childErrno = 0;
  ssize_t bytesRead = 0;
  do {
    bytesRead = ::read(execStatus->mRead.Get(), &childErrno, sizeof(childErrno));
  } while (bytesRead == -1 && errno == EINTR);

  if (bytesRead == sizeof(childErrno)) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    DBGLOG(process, "exec of {} failed: {}", mSettings.mExecutable, strerror(childErrno));
    return std::unexpected(RelayError::Process(
      fmt::format("Failed to execute '{}': {}", mSettings.mExecutable, strerror(childErrno))));
  }

  {
    std::lock_guard lock{ mMutex };
    mPid = pid;
    mUrl.reset();
  }
  mTerminating = false;
  mLineBuffer.clear();
  mOutput = std::make_unique<boost::asio::posix::stream_descriptor>(mContext, output->mRead.Release());
  ReadOutput();

  DBGLOG(process, "spawned {} ({})", pid, fmt::join(args.Args(), " "));
  return pid;
}

void
ProcessSupervisor::ReadOutput() noexcept
{
  auto *descriptor = mOutput.get();
  descriptor->async_read_some(boost::asio::buffer(mReadBuffer),
    [this, descriptor](const boost::system::error_code &ec, std::size_t bytes) {
      if (descriptor != mOutput.get()) {
        return;
      }
      if (ec) {
        if (!mLineBuffer.empty()) {
          OnOutputLine(mLineBuffer);
          mLineBuffer.clear();
        }
        if (ec != boost::asio::error::eof) {
          DBGLOG(process, "reading debuggee output failed: {}", ec.message());
        }
        mOutput.reset();
        return;
      }

      mLineBuffer.append(mReadBuffer.data(), bytes);
      for (auto newline = mLineBuffer.find('\n'); newline != std::string::npos; newline = mLineBuffer.find('\n')) {
        const std::string line = mLineBuffer.substr(0, newline);
        mLineBuffer.erase(0, newline + 1);
        OnOutputLine(line);
      }
      if (mOutput.get() == descriptor) {
        ReadOutput();
      }
    });
}

void
ProcessSupervisor::OnOutputLine(std::string_view line) noexcept
{
  if (line.ends_with('\r')) {
    line.remove_suffix(1);
  }
  DBGLOG(process, "{}", line);
  if (mSettings.mEchoOutput) {
    fmt::print(stderr, "[debuggee] {}\n", line);
  }

  {
    std::lock_guard lock{ mMutex };
    if (mUrl) {
      return;
    }
  }

  static const std::regex kInspectorUrl{ R"(ws://\S+)" };
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(line.begin(), line.end(), match, kInspectorUrl)) {
    return;
  }
  std::string url = match.str();
  {
    std::lock_guard lock{ mMutex };
    mUrl = url;
  }
  DBGLOG(process, "inspector endpoint: {}", url);
  ResolveUrlWaiters(std::move(url));
}

void
ProcessSupervisor::ResolveUrlWaiters(RelayResult<std::string> result) noexcept
{
  auto waiters = std::move(mUrlWaiters);
  mUrlWaiters.clear();
  for (auto &waiter : waiters) {
    waiter.mTimer->cancel();
    waiter.mCallback(result);
  }
}

void
ProcessSupervisor::AwaitInspectorUrl(std::chrono::milliseconds timeout, UrlCallback callback) noexcept
{
  std::optional<std::string> url;
  bool running = false;
  {
    std::lock_guard lock{ mMutex };
    url = mUrl;
    running = mPid.has_value();
  }

  if (url) {
    boost::asio::post(mContext, [callback = std::move(callback), url = std::move(*url)]() { callback(url); });
    return;
  }
  if (!running) {
    boost::asio::post(mContext, [callback = std::move(callback)]() {
      callback(std::unexpected(RelayError::Process("No debuggee process is running")));
    });
    return;
  }

  const auto id = mNextWaiterId++;
  auto timer = std::make_unique<boost::asio::steady_timer>(mContext, timeout);
  timer->async_wait([this, id, timeout](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    auto it = std::find_if(
      mUrlWaiters.begin(), mUrlWaiters.end(), [id](const UrlWaiter &waiter) { return waiter.mId == id; });
    if (it == mUrlWaiters.end()) {
      return;
    }
    auto waiter = std::move(*it);
    mUrlWaiters.erase(it);
    DBGLOG(process, "no inspector endpoint after {}ms", timeout.count());
    waiter.mCallback(std::unexpected(RelayError::Timeout(
      fmt::format("Debuggee did not announce an inspector endpoint within {}ms", timeout.count()))));
  });
  mUrlWaiters.push_back(UrlWaiter{ .mId = id, .mCallback = std::move(callback), .mTimer = std::move(timer) });
}

void
ProcessSupervisor::ReapChild() noexcept
{
  std::optional<Pid> pid;
  {
    std::lock_guard lock{ mMutex };
    pid = mPid;
  }
  if (!pid) {
    return;
  }

  int status = 0;
  Pid result;
  do {
    result = ::waitpid(*pid, &status, WNOHANG);
  } while (result == -1 && errno == EINTR);

  if (result == 0) {
    return;
  }

  ProcessExit exit{ .mPid = *pid, .mExitCode = std::nullopt, .mSignal = std::nullopt };
  if (result == -1) {
    DBGLOG(warning, "waitpid({}) failed: {}", *pid, strerror(errno));
  } else if (WIFEXITED(status)) {
    exit.mExitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit.mSignal = WTERMSIG(status);
  } else {
    // Stopped or continued, still alive.
    return;
  }
  OnExited(exit);
}

void
ProcessSupervisor::OnExited(ProcessExit exit) noexcept
{
  {
    std::lock_guard lock{ mMutex };
    mPid.reset();
    mUrl.reset();
  }
  mTerminating = false;
  if (mKillTimer) {
    mKillTimer->cancel();
  }

  const auto how = exit.mSignal ? fmt::format("signal {}", *exit.mSignal)
                                : fmt::format("exit code {}", exit.mExitCode.value_or(-1));
  DBGLOG(process, "debuggee {} exited ({})", exit.mPid, how);

  ResolveUrlWaiters(std::unexpected(
    RelayError::Process(fmt::format("Debuggee exited before announcing its inspector endpoint ({})", how))));

  // Exit subscribers hear about the process before any reap waiter gets to spawn the next one.
  auto reapWaiters = std::move(mReapWaiters);
  mReapWaiters.clear();
  Exited.Emit(exit);
  for (auto &reaped : reapWaiters) {
    reaped();
  }
}

void
ProcessSupervisor::Close(ReapedCallback reaped) noexcept
{
  std::optional<Pid> pid;
  {
    std::lock_guard lock{ mMutex };
    pid = mPid;
  }
  if (!pid) {
    boost::asio::post(mContext, std::move(reaped));
    return;
  }

  mReapWaiters.push_back(std::move(reaped));
  if (mTerminating) {
    return;
  }
  mTerminating = true;

  DBGLOG(process, "terminating {}", *pid);
  if (::kill(*pid, SIGTERM) == -1 && errno != ESRCH) {
    DBGLOG(warning, "SIGTERM to {} failed: {}", *pid, strerror(errno));
  }

  mKillTimer = std::make_unique<boost::asio::steady_timer>(mContext, mSettings.mKillGrace);
  mKillTimer->async_wait([this, target = *pid](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    {
      std::lock_guard lock{ mMutex };
      if (mPid != target) {
        return;
      }
    }
    DBGLOG(process, "{} survived SIGTERM for {}ms, sending SIGKILL", target, mSettings.mKillGrace.count());
    ::kill(target, SIGKILL);
  });
}

std::future<void>
ProcessSupervisor::Close() noexcept
{
  auto promise = std::make_shared<std::promise<void>>();
  auto future = promise->get_future();
  boost::asio::post(mContext, [this, promise]() { Close([promise]() { promise->set_value(); }); });
  return future;
}

void
ProcessSupervisor::Delete(ReapedCallback reaped) noexcept
{
  Close(std::move(reaped));
}

bool
ProcessSupervisor::IsActive() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mPid.has_value() || mUrl.has_value();
}

std::optional<std::string>
ProcessSupervisor::Url() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mUrl;
}

std::optional<Pid>
ProcessSupervisor::GetPid() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mPid;
}

} // namespace cdpr

/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common.h>
#include <common/error.h>
#include <common/macros.h>
#include <events/event.h>
#include <utils/scoped_fd.h>

// boost
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

// stdlib
#include <array>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cdpr {

struct ProcessExit
{
  Pid mPid;
  // Set when the process called exit.
  std::optional<int> mExitCode;
  // Set when a signal terminated it.
  std::optional<int> mSignal;
};

struct SupervisorSettings
{
  // Program used to run scripts, looked up in PATH when it has no '/'.
  std::string mExecutable{ "node" };
  std::chrono::milliseconds mKillGrace{ 5000 };
  // Copy debuggee output to our stderr in addition to the process log channel.
  bool mEchoOutput{ true };
};

using UrlCallback = std::function<void(RelayResult<std::string>)>;
using ReapedCallback = std::function<void()>;

// Owns the one debuggee process: spawns it with the inspector enabled, reads its output for the inspector
// endpoint, reaps it when it exits and kills it on request.
//
// Open, Close and AwaitInspectorUrl run on the reactor. IsActive, Url and GetPid may be called from anywhere.
class ProcessSupervisor
{
  struct UrlWaiter
  {
    u64 mId;
    UrlCallback mCallback;
    std::unique_ptr<boost::asio::steady_timer> mTimer;
  };

  boost::asio::io_context &mContext;
  SupervisorSettings mSettings;
  boost::asio::signal_set mChildSignals;

  mutable std::mutex mMutex;
  std::optional<Pid> mPid{};
  std::optional<std::string> mUrl{};

  std::unique_ptr<boost::asio::posix::stream_descriptor> mOutput{ nullptr };
  std::array<char, 4096> mReadBuffer{};
  std::string mLineBuffer{};

  std::vector<UrlWaiter> mUrlWaiters;
  u64 mNextWaiterId{ 1 };
  std::vector<ReapedCallback> mReapWaiters;
  std::unique_ptr<boost::asio::steady_timer> mKillTimer{ nullptr };
  bool mTerminating{ false };

  void WaitForChildSignal() noexcept;
  void ReapChild() noexcept;
  void OnExited(ProcessExit exit) noexcept;
  void ReadOutput() noexcept;
  void OnOutputLine(std::string_view line) noexcept;
  void ResolveUrlWaiters(RelayResult<std::string> result) noexcept;

public:
  NO_COPY(ProcessSupervisor);
  ProcessSupervisor(boost::asio::io_context &context, SupervisorSettings settings) noexcept;
  ~ProcessSupervisor() noexcept;

  // Emitted on the reactor once the debuggee has been reaped, whether it exited by itself or was killed.
  Publisher<ProcessExit> Exited;

  // Spawns `<executable> --inspect[-brk]=<host>:<port> <script>`. SessionConflictError while a process is tracked,
  // ProcessError when fork or exec fails.
  RelayResult<Pid> Open(u16 port, const std::string &host, bool breakOnStart, const Path &script) noexcept;

  // Calls `callback` with the inspector URL once the debuggee has printed it. TimeoutError after `timeout`,
  // ProcessError if the debuggee exits first or there is none.
  void AwaitInspectorUrl(std::chrono::milliseconds timeout, UrlCallback callback) noexcept;

  // SIGTERM, then SIGKILL after the grace window. `reaped` runs once the process is gone (right away when there
  // is none). Repeated calls while terminating just wait for the same reap.
  void Close(ReapedCallback reaped) noexcept;
  std::future<void> Close() noexcept;
  void Delete(ReapedCallback reaped) noexcept;

  bool IsActive() const noexcept;
  std::optional<std::string> Url() const noexcept;
  std::optional<Pid> GetPid() const noexcept;
};

} // namespace cdpr

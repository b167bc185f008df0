/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/macros.h>

// boost
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

// stdlib
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace cdpr {

// The single io_context every socket, timer and child signal of the relay runs on, and the thread that runs it.
class Reactor
{
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  std::string mThreadName;
  boost::asio::io_context mContext;
  std::optional<WorkGuard> mWorkGuard;
  std::jthread mThread;
  std::thread::id mThreadId;
  bool mStarted{ false };

  void Run() noexcept;

public:
  NO_COPY(Reactor);
  explicit Reactor(std::string threadName) noexcept;
  // Stops and joins.
  ~Reactor() noexcept;

  boost::asio::io_context &Context() noexcept;

  // Spawns the reactor thread. The context keeps running until `Stop`, even without pending work.
  void Start() noexcept;
  // Abandons pending handlers.
  void Stop() noexcept;
  void Join() noexcept;

  bool IsReactorThread() const noexcept;
};

} // namespace cdpr

#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <common/error.h>
#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <fmt/format.h>
#include <functional>
#include <future>
#include <gtest/gtest.h>
#include <interface/cdp/protocol.h>
#include <interface/cdp/protocol_relay.h>
#include <interface/cdp/request_correlator.h>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

namespace cdpr::test {

// Runs handlers on the calling thread until `done` holds or `timeout` passes.
inline bool
PumpUntil(boost::asio::io_context &context, const std::function<bool()> &done,
          std::chrono::milliseconds timeout = std::chrono::milliseconds{5000})
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    context.restart();
    context.run_for(std::chrono::milliseconds{5});
  }
  return true;
}

inline void
Drain(boost::asio::io_context &context)
{
  context.restart();
  context.poll();
}

template <typename T>
bool
IsReady(const std::future<T> &future)
{
  return future.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
}

template <typename T>
testing::AssertionResult
FailsWith(const RelayResult<T> &result, ErrorKind kind)
{
  if (result) {
    return testing::AssertionFailure() << "expected " << Enum<ErrorKind>::ToString(kind) << " but succeeded";
  }
  if (!result.error().Is(kind)) {
    return testing::AssertionFailure() << "expected " << Enum<ErrorKind>::ToString(kind) << " but got "
                                       << fmt::format("{}", result.error());
  }
  return testing::AssertionSuccess();
}

// Transport that records what the correlator sends.
class RecordingTransport final : public cdp::Transport
{
public:
  bool mConnected{true};
  std::vector<Json> mSent;
  std::vector<MessageId> mAbandoned;

  bool
  IsConnected() const noexcept final
  {
    return mConnected;
  }

  void
  Send(const Json &message) noexcept final
  {
    mSent.push_back(message);
  }

  void
  Abandon(MessageId id) noexcept final
  {
    mAbandoned.push_back(id);
  }
};

// Downstream client that records everything delivered to it.
class RecordingClient final : public cdp::RelayClient
{
public:
  std::vector<Json> mReceived;
  bool mClosed{false};

  void
  Deliver(const Json &message, const std::string &) noexcept final
  {
    mReceived.push_back(message);
  }

  void
  Close(std::string_view) noexcept final
  {
    mClosed = true;
  }

  std::vector<Json>
  Events(std::string_view method) const
  {
    std::vector<Json> events;
    for (const auto &message : mReceived) {
      if (message.contains("method") && !message.contains("id") && message["method"] == method) {
        events.push_back(message);
      }
    }
    return events;
  }

  std::vector<Json>
  Responses() const
  {
    std::vector<Json> responses;
    for (const auto &message : mReceived) {
      if (message.contains("id")) {
        responses.push_back(message);
      }
    }
    return responses;
  }
};

// Inspector stand-in. Opens when told to, records requests and lets the test answer them.
class FakeUpstream final : public cdp::Upstream, public std::enable_shared_from_this<FakeUpstream>
{
public:
  cdp::UpstreamListener *mListener{nullptr};
  std::string mUrl;
  std::vector<Json> mSent;
  bool mClosed{false};
  // Answers every request with an empty result on the next turn of `mContext`.
  bool mAutoRespond{false};
  boost::asio::io_context *mContext{nullptr};

  void
  Open(const std::string &url, cdp::UpstreamListener *listener) noexcept final
  {
    mUrl = url;
    mListener = listener;
  }

  void
  Send(std::string text) noexcept final
  {
    auto message = Json::parse(text);
    mSent.push_back(message);
    if (mAutoRespond && mContext) {
      boost::asio::post(*mContext, [self = shared_from_this(), id = message["id"]]() {
        if (self->mListener) {
          self->Reply(id, Json::object());
        }
      });
    }
  }

  void
  Close() noexcept final
  {
    mClosed = true;
    mListener = nullptr;
  }

  void
  Accept()
  {
    mListener->OnUpstreamOpen();
  }

  void
  Reply(const Json &id, Json result)
  {
    mListener->OnUpstreamMessage(cdp::MakeResponse(id, std::move(result)).dump());
  }

  void
  ReplyError(const Json &id, int code, std::string_view message)
  {
    mListener->OnUpstreamMessage(cdp::MakeErrorResponse(id, code, message).dump());
  }

  void
  Emit(std::string_view method, Json params = Json::object())
  {
    mListener->OnUpstreamMessage(cdp::MakeEvent(method, std::move(params)).dump());
  }

  void
  Drop(int code = 1006, std::string_view reason = "gone")
  {
    auto *listener = std::exchange(mListener, nullptr);
    listener->OnUpstreamClosed(code, reason, false);
  }
};

// Hands out FakeUpstreams and remembers the last one.
struct FakeUpstreamFactory
{
  std::shared_ptr<FakeUpstream> mLast;
  bool mAutoAccept{false};
  bool mAutoRespond{false};

  cdp::UpstreamFactory
  Factory()
  {
    return [this](boost::asio::io_context &context) -> std::shared_ptr<cdp::Upstream> {
      mLast = std::make_shared<FakeUpstream>();
      mLast->mAutoRespond = mAutoRespond;
      mLast->mContext = &context;
      if (mAutoAccept) {
        std::weak_ptr<FakeUpstream> weak = mLast;
        boost::asio::post(context, [weak]() {
          if (auto upstream = weak.lock(); upstream && upstream->mListener) {
            upstream->Accept();
          }
        });
      }
      return mLast;
    };
  }
};

// Fresh directory under the system temp dir, removed with everything in it on destruction.
class TempDir
{
  std::filesystem::path mPath;

public:
  TempDir()
  {
    const auto *info = testing::UnitTest::GetInstance()->current_test_info();
    mPath = std::filesystem::temp_directory_path() /
            fmt::format("cdpr-{}-{}-{}", info ? info->name() : "test", ::getpid(), sNext++);
    std::filesystem::remove_all(mPath);
    std::filesystem::create_directories(mPath);
  }

  ~TempDir()
  {
    std::error_code ignored;
    std::filesystem::remove_all(mPath, ignored);
  }

  const std::filesystem::path &
  Path() const
  {
    return mPath;
  }

  std::filesystem::path
  Write(const std::filesystem::path &relative, std::string_view contents) const
  {
    const auto path = mPath / relative;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream{path} << contents;
    return path;
  }

  std::filesystem::path
  WriteExecutable(const std::filesystem::path &relative, std::string_view contents) const
  {
    auto path = Write(relative, contents);
    std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
    return path;
  }

private:
  static inline int sNext = 0;
};

// Stand-in for node: announces an inspector endpoint built from its `--inspect[-brk]=host:port` argument and
// then waits to be killed.
constexpr std::string_view kFakeNode = R"(#!/bin/sh
endpoint="${1#*=}"
echo "Debugger listening on ws://${endpoint}/0f2c936f-b1cd-4ac9-aab3-f63b0f33d55e"
echo "For help, see: https://nodejs.org/en/docs/inspector"
exec sleep 30
)";

} // namespace cdpr::test

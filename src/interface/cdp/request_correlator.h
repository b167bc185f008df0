/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <interface/cdp/protocol.h>

// boost
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

// stdlib
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>

namespace cdpr::cdp {

using CommandResult = RelayResult<Json>;
using CommandCallback = std::function<void(CommandResult)>;
using CommandFuture = std::future<CommandResult>;

// Where serialized commands go. The relay provides the implementation the correlator talks through.
class Transport
{
public:
  virtual ~Transport() noexcept = default;
  virtual bool IsConnected() const noexcept = 0;
  virtual void Send(const Json &message) noexcept = 0;
  // The command `id` timed out. Nothing will wait for its response any more.
  virtual void Abandon(MessageId id) noexcept = 0;
};

// Returns a future that already holds `error`.
CommandFuture ReadyFuture(RelayError error) noexcept;

// Correlates outgoing commands with their responses by message id. Every command ends exactly once: resolved by
// its response, rejected by an error response, by the command timeout, or by the transport going away.
//
// Everything except the future returning `Send` and `IsConnected` must be called on the reactor thread.
class RequestCorrelator
{
  struct PendingRequest
  {
    MessageId mId;
    std::string mMethod;
    std::chrono::steady_clock::time_point mCreatedAt;
    CommandCallback mCompletion;
    std::unique_ptr<boost::asio::steady_timer> mTimeoutTimer;
  };

  boost::asio::io_context &mContext;
  std::chrono::milliseconds mTimeout;
  Transport *mTransport{ nullptr };
  // Mirrors `mTransport != nullptr` for callers off the reactor.
  std::atomic<bool> mConnected{ false };
  MessageId mNextId{ 1 };
  std::map<MessageId, PendingRequest> mPending;

  void OnTimeout(MessageId id) noexcept;
  void Complete(MessageId id, CommandResult result) noexcept;

public:
  NO_COPY(RequestCorrelator);
  RequestCorrelator(boost::asio::io_context &context, std::chrono::milliseconds timeout) noexcept;
  ~RequestCorrelator() noexcept;

  void AttachTransport(Transport *transport) noexcept;
  // Detaches the transport and rejects every outstanding command with a ConnectionError.
  void HandleDisconnect(std::string_view reason) noexcept;

  // Reactor side. Without a transport `callback` is invoked right away with "No active session".
  void Send(std::string method, Json params, CommandCallback callback) noexcept;
  // Callable from any thread. Never block on the returned future from the reactor thread.
  CommandFuture Send(std::string method, Json params) noexcept;

  // Feed for messages coming back through the transport. Messages without an id are not ours and are ignored.
  void HandleMessage(const Json &message) noexcept;

  bool IsConnected() const noexcept;
  size_t PendingCount() const noexcept;
};

} // namespace cdpr::cdp

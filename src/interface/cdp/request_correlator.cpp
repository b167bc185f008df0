/** LICENSE TEMPLATE */
#include "request_correlator.h"

// cdpr
#include <common.h>
#include <utils/logger.h>

// boost
#include <boost/asio/post.hpp>

namespace cdpr::cdp {

CommandFuture
ReadyFuture(RelayError error) noexcept
{
  std::promise<CommandResult> promise;
  promise.set_value(std::unexpected(std::move(error)));
  return promise.get_future();
}

RequestCorrelator::RequestCorrelator(boost::asio::io_context &context, std::chrono::milliseconds timeout) noexcept
    : mContext(context), mTimeout(timeout)
{
}

RequestCorrelator::~RequestCorrelator() noexcept
{
  for (auto &[id, pending] : mPending) {
    pending.mTimeoutTimer->cancel();
  }
}

void
RequestCorrelator::AttachTransport(Transport *transport) noexcept
{
  VERIFY(transport != nullptr, "Attaching a null transport");
  mTransport = transport;
  mConnected = true;
  DBGLOG(cdp, "transport attached");
}

void
RequestCorrelator::HandleDisconnect(std::string_view reason) noexcept
{
  mTransport = nullptr;
  mConnected = false;
  auto pending = std::move(mPending);
  mPending.clear();
  DBGLOG(cdp, "transport detached ({}), rejecting {} pending commands", reason, pending.size());
  for (auto &[id, request] : pending) {
    request.mTimeoutTimer->cancel();
    request.mCompletion(
      std::unexpected(RelayError::Connection(fmt::format("Connection closed ({}): {}", reason, request.mMethod))));
  }
}

void
RequestCorrelator::Send(std::string method, Json params, CommandCallback callback) noexcept
{
  if (mTransport == nullptr || !mTransport->IsConnected()) {
    DBGLOG(cdp, "{} refused: no transport", method);
    callback(std::unexpected(RelayError::Connection(std::string{ kNoActiveSession })));
    return;
  }

  const MessageId id = mNextId++;
  auto timer = std::make_unique<boost::asio::steady_timer>(mContext, mTimeout);
  timer->async_wait([this, id](const boost::system::error_code &ec) {
    if (!ec) {
      OnTimeout(id);
    }
  });

  auto message = MakeRequest(id, method, params);
  DBGLOG(cdp, "-> [{}] {}", id, method);
  mPending.emplace(id,
    PendingRequest{ .mId = id,
      .mMethod = std::move(method),
      .mCreatedAt = std::chrono::steady_clock::now(),
      .mCompletion = std::move(callback),
      .mTimeoutTimer = std::move(timer) });
  mTransport->Send(message);
}

CommandFuture
RequestCorrelator::Send(std::string method, Json params) noexcept
{
  if (!mConnected) {
    return ReadyFuture(RelayError::Connection(std::string{ kNoActiveSession }));
  }

  auto promise = std::make_shared<std::promise<CommandResult>>();
  auto future = promise->get_future();
  boost::asio::post(mContext, [this, promise, method = std::move(method), params = std::move(params)]() mutable {
    Send(std::move(method), std::move(params), [promise](CommandResult result) {
      promise->set_value(std::move(result));
    });
  });
  return future;
}

void
RequestCorrelator::OnTimeout(MessageId id) noexcept
{
  auto it = mPending.find(id);
  if (it == mPending.end()) {
    return;
  }
  const auto method = it->second.mMethod;
  DBGLOG(cdp, "[{}] {} timed out after {}ms", id, method, mTimeout.count());
  if (mTransport != nullptr) {
    mTransport->Abandon(id);
  }
  Complete(id,
    std::unexpected(RelayError::Timeout(fmt::format("{} timed out after {}ms", method, mTimeout.count()))));
}

void
RequestCorrelator::Complete(MessageId id, CommandResult result) noexcept
{
  auto node = mPending.extract(id);
  if (node.empty()) {
    return;
  }
  auto &request = node.mapped();
  request.mTimeoutTimer->cancel();
  request.mCompletion(std::move(result));
}

void
RequestCorrelator::HandleMessage(const Json &message) noexcept
{
  if (!message.is_object()) {
    return;
  }
  const auto idIt = message.find("id");
  if (idIt == message.end() || !idIt->is_number_unsigned()) {
    return;
  }
  const auto id = idIt->get<MessageId>();
  if (!mPending.contains(id)) {
    DBGLOG(warning, "response for unknown or expired command id {}", id);
    return;
  }

  if (auto error = message.find("error"); error != message.end()) {
    auto relayError = ToRelayError(*error);
    DBGLOG(cdp, "<- [{}] error {}", id, relayError);
    Complete(id, std::unexpected(std::move(relayError)));
    return;
  }

  DBGLOG(cdp, "<- [{}] result", id);
  auto result = message.find("result");
  Complete(id, result != message.end() ? *result : Json::object());
}

bool
RequestCorrelator::IsConnected() const noexcept
{
  return mConnected;
}

size_t
RequestCorrelator::PendingCount() const noexcept
{
  return mPending.size();
}

} // namespace cdpr::cdp

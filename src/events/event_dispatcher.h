/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common/error.h>
#include <common/macros.h>
#include <events/matcher.h>
#include <interface/cdp/protocol.h>

// stdlib
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace cdpr {

using EventCallback = std::function<void(std::string_view topic, const Json &params)>;

struct SubscriptionHandle
{
  u64 mId{ 0 };

  constexpr bool
  IsValid() const noexcept
  {
    return mId != 0;
  }

  constexpr friend bool operator==(const SubscriptionHandle &, const SubscriptionHandle &) noexcept = default;
};

// Topic based pub/sub for protocol events. Subscriptions are delivered in the order they were made. Delivery is
// synchronous on the publishing thread (the reactor, for everything coming from the inspector).
class EventDispatcher
{
  struct Subscription
  {
    SubscriptionHandle mHandle;
    std::shared_ptr<const Matcher> mMatcher;
    EventCallback mCallback;
    bool mOnce;
    // Cleared on unsubscribe, so a delivery already holding this subscription skips it.
    std::shared_ptr<bool> mAlive;
  };

  mutable std::mutex mMutex;
  std::vector<Subscription> mSubscriptions;
  u64 mNextSubscriptionId{ 1 };

  SubscriptionHandle Add(std::unique_ptr<Matcher> matcher, EventCallback &&callback, bool once) noexcept;

public:
  NO_COPY(EventDispatcher);
  EventDispatcher() noexcept = default;

  // `pattern` is an exact topic or a wildcard pattern (`Debugger.*`).
  SubscriptionHandle Subscribe(std::string_view pattern, EventCallback callback) noexcept;
  SubscriptionHandle Subscribe(std::unique_ptr<Matcher> matcher, EventCallback callback) noexcept;
  // Like `Subscribe` but removed right before its first delivery.
  SubscriptionHandle Once(std::string_view pattern, EventCallback callback) noexcept;
  // Returns false when no such subscription (or it was already removed).
  bool Unsubscribe(SubscriptionHandle handle) noexcept;

  // Invokes every matching subscription and returns how many were invoked. A throwing callback is logged and
  // does not stop delivery to the others.
  u32 Publish(std::string_view topic, const Json &params) noexcept;

  size_t SubscriptionCount() const noexcept;
  std::vector<SubscriptionHandle> MatchingSubscriptions(std::string_view topic) const noexcept;
};

} // namespace cdpr

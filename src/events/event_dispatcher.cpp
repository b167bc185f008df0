/** LICENSE TEMPLATE */
#include "event_dispatcher.h"

// cdpr
#include <common.h>
#include <utils/logger.h>

// stdlib
#include <algorithm>
#include <exception>

namespace cdpr {

SubscriptionHandle
EventDispatcher::Add(std::unique_ptr<Matcher> matcher, EventCallback &&callback, bool once) noexcept
{
  VERIFY(matcher != nullptr, "Subscribing with no matcher");
  VERIFY(callback != nullptr, "Subscribing to '{}' with an empty callback", matcher->Pattern());
  std::lock_guard lock{ mMutex };
  const SubscriptionHandle handle{ mNextSubscriptionId++ };
  DBGLOG(cdp, "subscription {} on '{}'{}", handle.mId, matcher->Pattern(), once ? " (once)" : "");
  mSubscriptions.push_back(Subscription{ .mHandle = handle,
    .mMatcher = std::shared_ptr<const Matcher>{ std::move(matcher) },
    .mCallback = std::move(callback),
    .mOnce = once,
    .mAlive = std::make_shared<bool>(true) });
  return handle;
}

SubscriptionHandle
EventDispatcher::Subscribe(std::string_view pattern, EventCallback callback) noexcept
{
  return Add(MatcherFromPattern(pattern), std::move(callback), false);
}

SubscriptionHandle
EventDispatcher::Subscribe(std::unique_ptr<Matcher> matcher, EventCallback callback) noexcept
{
  return Add(std::move(matcher), std::move(callback), false);
}

SubscriptionHandle
EventDispatcher::Once(std::string_view pattern, EventCallback callback) noexcept
{
  return Add(MatcherFromPattern(pattern), std::move(callback), true);
}

bool
EventDispatcher::Unsubscribe(SubscriptionHandle handle) noexcept
{
  std::lock_guard lock{ mMutex };
  auto it = std::find_if(mSubscriptions.begin(), mSubscriptions.end(), [handle](const Subscription &sub) {
    return sub.mHandle == handle;
  });
  if (it == mSubscriptions.end()) {
    return false;
  }
  *it->mAlive = false;
  mSubscriptions.erase(it);
  return true;
}

u32
EventDispatcher::Publish(std::string_view topic, const Json &params) noexcept
{
  std::vector<Subscription> deliverTo;
  {
    std::lock_guard lock{ mMutex };
    for (const auto &sub : mSubscriptions) {
      if (sub.mMatcher->Matches(topic)) {
        deliverTo.push_back(sub);
      }
    }
    // Once-subscriptions are gone before anybody gets to see the event, so a re-entrant publish can't deliver
    // them twice.
    for (const auto &sub : deliverTo) {
      if (sub.mOnce) {
        *sub.mAlive = false;
        std::erase_if(mSubscriptions, [&](const Subscription &s) { return s.mHandle == sub.mHandle; });
      }
    }
  }

  u32 delivered = 0;
  for (auto &sub : deliverTo) {
    if (!sub.mOnce && !*sub.mAlive) {
      continue;
    }
    ++delivered;
    try {
      sub.mCallback(topic, params);
    } catch (const std::exception &e) {
      DBGLOG(warning, "subscriber {} ('{}') threw on {}: {}", sub.mHandle.mId, sub.mMatcher->Pattern(), topic,
        e.what());
    } catch (...) {
      DBGLOG(warning, "subscriber {} ('{}') threw a non-standard exception on {}", sub.mHandle.mId,
        sub.mMatcher->Pattern(), topic);
    }
  }
  return delivered;
}

size_t
EventDispatcher::SubscriptionCount() const noexcept
{
  std::lock_guard lock{ mMutex };
  return mSubscriptions.size();
}

std::vector<SubscriptionHandle>
EventDispatcher::MatchingSubscriptions(std::string_view topic) const noexcept
{
  std::lock_guard lock{ mMutex };
  std::vector<SubscriptionHandle> result;
  for (const auto &sub : mSubscriptions) {
    if (sub.mMatcher->Matches(topic)) {
      result.push_back(sub.mHandle);
    }
  }
  return result;
}

} // namespace cdpr

/** LICENSE TEMPLATE */
#pragma once

// cdpr
#include <common.h>
#include <common/macros.h>

// stdlib
#include <algorithm>
#include <cstdint>
#include <functional>
#include <vector>

namespace cdpr {

struct SubscriberIdentity
{
  constexpr SubscriberIdentity(const SubscriberIdentity &) = default;
  constexpr SubscriberIdentity &operator=(const SubscriberIdentity &) = default;
  constexpr SubscriberIdentity(SubscriberIdentity &&) = default;
  constexpr SubscriberIdentity &operator=(SubscriberIdentity &&) = default;

  template <typename T>
  constexpr explicit SubscriberIdentity(const T *obj) noexcept : addr(reinterpret_cast<std::uintptr_t>(obj))
  {
  }

  template <typename T>
  static constexpr SubscriberIdentity
  Of(const T *t) noexcept
  {
    return SubscriberIdentity{ t };
  }

  std::uintptr_t addr;

  constexpr friend auto operator<=>(const SubscriberIdentity &l, const SubscriberIdentity &r) noexcept = default;
  constexpr friend bool
  operator==(const SubscriberIdentity &l, const SubscriberIdentity &r) noexcept
  {
    return l.addr == r.addr;
  }
};

// In-process notification between components that know about each other (supervisor exit, execution state
// changes). Not thread safe: subscribe, unsubscribe and emit on the same thread (the reactor).
// Protocol traffic with topic strings goes through `EventDispatcher` instead.
template <typename... EventData> class Publisher
{
  using SubscriberAction = std::function<void(const EventData &...)>;

  struct Subscriber
  {
    Subscriber(SubscriberIdentity id, SubscriberAction &&fn) noexcept : identity(id), fn(std::move(fn)) {}
    SubscriberIdentity identity;
    SubscriberAction fn;
  };

  std::vector<Subscriber> mSubscribers{};
  std::vector<SubscriberAction> mSubscribeOnce{};

public:
  void
  Subscribe(SubscriberIdentity identity, SubscriberAction &&fn) noexcept
  {
    VERIFY(std::none_of(mSubscribers.begin(),
             mSubscribers.end(),
             [&identity](const auto &c) { return identity == c.identity; }),
      "Expected Identity to be a unique value");
    mSubscribers.emplace_back(identity, std::move(fn));
  }

  void
  Unsubscribe(SubscriberIdentity identity) noexcept
  {
    if (auto it = std::find_if(mSubscribers.begin(),
          mSubscribers.end(),
          [&identity](const auto &sub) { return sub.identity == identity; });
      it != std::end(mSubscribers)) {
      mSubscribers.erase(it);
    }
  }

  void
  Once(SubscriberAction &&fn) noexcept
  {
    mSubscribeOnce.push_back(std::move(fn));
  }

  // Subscribers may (un)subscribe from within their callback; they see that change on the next emit.
  void
  Emit(const EventData &...data) noexcept
  {
    auto once = std::move(mSubscribeOnce);
    mSubscribeOnce.clear();
    for (auto &fn : once) {
      fn(data...);
    }

    std::vector<SubscriberAction> subscribers;
    subscribers.reserve(mSubscribers.size());
    for (const auto &sub : mSubscribers) {
      subscribers.push_back(sub.fn);
    }
    for (auto &fn : subscribers) {
      fn(data...);
    }
  }

  size_t
  SubscriberCount() const noexcept
  {
    return mSubscribers.size() + mSubscribeOnce.size();
  }
};

} // namespace cdpr

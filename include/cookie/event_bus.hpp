#pragma once

#include "events.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace cookie {

using SubscriptionId = std::uint64_t;

/**
 * EventBus: synchronous publish/subscribe keyed by event kind.
 *
 * Handlers for one kind run in registration order. Dispatch walks a snapshot
 * of the handler list, so handlers may publish, subscribe or unsubscribe while
 * a dispatch is in flight. A handler removed mid-dispatch is skipped for the
 * remainder of that dispatch. Exceptions thrown by a handler are logged and do
 * not stop the remaining handlers.
 */
class EventBus {
public:
  EventBus() = default;
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  template <typename E>
  SubscriptionId subscribe(std::function<void(const E&)> handler) {
    if (!handler) {
      throw std::invalid_argument("EventBus::subscribe requires a callable handler");
    }
    return subscribe_kind(event_kind<E>(),
                          [fn = std::move(handler)](const Event& event) {
                            fn(std::get<E>(event));
                          });
  }

  // Returns false when the id is unknown (already removed or never issued).
  bool unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  // Drops every subscription. Used on session teardown.
  void clear();

  std::size_t subscriber_count(std::size_t kind) const;

  template <typename E>
  std::size_t subscriber_count() const {
    return subscriber_count(event_kind<E>());
  }

private:
  struct Slot {
    SubscriptionId id = 0;
    std::function<void(const Event&)> handler;
    bool active = true;
  };

  SubscriptionId subscribe_kind(std::size_t kind, std::function<void(const Event&)> handler);

  std::array<std::vector<std::shared_ptr<Slot>>, kEventKindCount> slots_{};
  std::unordered_map<SubscriptionId, std::size_t> kind_by_id_;
  SubscriptionId next_id_ = 1;
};

/// Owns one subscription and releases it on destruction.
class ScopedSubscription {
public:
  ScopedSubscription() = default;
  ScopedSubscription(EventBus& bus, SubscriptionId id) : bus_(&bus), id_(id) {}
  ~ScopedSubscription() { reset(); }

  ScopedSubscription(const ScopedSubscription&) = delete;
  ScopedSubscription& operator=(const ScopedSubscription&) = delete;

  ScopedSubscription(ScopedSubscription&& other) noexcept
      : bus_(std::exchange(other.bus_, nullptr)), id_(std::exchange(other.id_, 0)) {}

  ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
    if (this != &other) {
      reset();
      bus_ = std::exchange(other.bus_, nullptr);
      id_ = std::exchange(other.id_, 0);
    }
    return *this;
  }

  void reset() {
    if (bus_ != nullptr) {
      bus_->unsubscribe(id_);
      bus_ = nullptr;
      id_ = 0;
    }
  }

  bool active() const { return bus_ != nullptr; }
  SubscriptionId id() const { return id_; }

private:
  EventBus* bus_ = nullptr;
  SubscriptionId id_ = 0;
};

template <typename E>
ScopedSubscription scoped_subscribe(EventBus& bus, std::function<void(const E&)> handler) {
  return ScopedSubscription(bus, bus.subscribe<E>(std::move(handler)));
}

} // namespace cookie

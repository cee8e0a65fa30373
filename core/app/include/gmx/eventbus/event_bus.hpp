#pragma once

#include "gmx/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace gmx {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for pipeline observability.
// OrderPipeline publishes state transitions and allowance outcomes; the IPC
// telemetry bridge, the engine's run counters and tests subscribe.
//
// The bus is an observer channel only: no pipeline decision depends on a
// subscriber, and a subscriber cannot alter a run. An exception thrown by a
// subscriber is logged and counted, never propagated to the publisher.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread (the pipeline's).
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored. A publish already in flight may still deliver
  // to the removed callback once.
  void unsubscribe(SubscriptionId id);

  // Copies the subscriber list under the lock and invokes callbacks without
  // it, so a callback may publish or unsubscribe without deadlocking.
  void publish(const Event& event);

  std::uint64_t subscriberFailures() const {
    return subscriber_failures_.load();
  }

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
  std::atomic<std::uint64_t> subscriber_failures_{0};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace gmx

#include "gmx/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace gmx {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace_back(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                         [id](const SubscriberEntry& e) { return e.first == id; });
  if (it != subscribers_.end()) {
    subscribers_.erase(it);
  }
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
// A subscriber that throws is reported and skipped; the remaining
// subscribers still see the event and the publisher never sees the error.
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<SubscriberEntry> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& entry : snapshot) {
    try {
      entry.second(event);
    } catch (const std::exception& e) {
      subscriber_failures_.fetch_add(1);
      std::cerr << "[EventBus] subscriber " << entry.first
                << " threw: " << e.what() << "\n";
    }
  }
}

}  // namespace gmx

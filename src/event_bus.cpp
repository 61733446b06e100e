#include "cookie/event_bus.hpp"

#include "cookie/logging.hpp"

#include <exception>

namespace cookie {

const char* event_name(std::size_t kind) {
  static const char* const names[kEventKindCount] = {
      "QuestionGenerated",
      "CookieDropped",
      "CookiePileUpdated",
      "DistributionRoundCompleted",
      "RemainderError",
      "AnswerSubmitted",
      "ScoreUpdated",
      "RoundScoreAdded",
      "LivesUpdated",
      "LivesDepleted",
      "TimerUpdated",
      "TimerExpired",
      "GamePaused",
      "GameResumed",
      "GameOver",
      "ScreenChanged",
  };
  if (kind >= kEventKindCount) {
    return "Unknown";
  }
  return names[kind];
}

SubscriptionId EventBus::subscribe_kind(std::size_t kind,
                                        std::function<void(const Event&)> handler) {
  auto slot = std::make_shared<Slot>();
  slot->id = next_id_++;
  slot->handler = std::move(handler);
  slots_[kind].push_back(slot);
  kind_by_id_.emplace(slot->id, kind);
  return slot->id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
  auto it = kind_by_id_.find(id);
  if (it == kind_by_id_.end()) {
    return false;
  }
  auto& list = slots_[it->second];
  for (auto slot_it = list.begin(); slot_it != list.end(); ++slot_it) {
    if ((*slot_it)->id == id) {
      (*slot_it)->active = false;
      list.erase(slot_it);
      break;
    }
  }
  kind_by_id_.erase(it);
  return true;
}

void EventBus::publish(const Event& event) {
  const std::size_t kind = event.index();
  if (slots_[kind].empty()) {
    return;
  }
  // Snapshot: handlers may mutate the table while we iterate.
  const auto snapshot = slots_[kind];
  for (const auto& slot : snapshot) {
    if (!slot->active) {
      continue;
    }
    try {
      slot->handler(event);
    } catch (const std::exception& ex) {
      logging::get()->error("EventBus: handler {} for {} threw: {}", slot->id,
                            event_name(kind), ex.what());
    } catch (...) {
      logging::get()->error("EventBus: handler {} for {} threw a non-standard exception",
                            slot->id, event_name(kind));
    }
  }
}

void EventBus::clear() {
  for (auto& list : slots_) {
    for (auto& slot : list) {
      slot->active = false;
    }
    list.clear();
  }
  kind_by_id_.clear();
}

std::size_t EventBus::subscriber_count(std::size_t kind) const {
  if (kind >= kEventKindCount) {
    return 0;
  }
  return slots_[kind].size();
}

} // namespace cookie

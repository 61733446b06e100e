#include "lives_engine.hpp"

#include "cookie/logging.hpp"

namespace cookie {

LivesEngine::LivesEngine(EventBus& bus, int lives, bool unlimited)
    : bus_(bus), lives_(lives < 0 ? 0 : lives), unlimited_(unlimited) {}

void LivesEngine::start() {
  depleted_announced_ = false;
  paused_ = false;
  publish_update();
}

void LivesEngine::lose_life() {
  if (unlimited_) {
    return;
  }
  if (paused_) {
    logging::get()->debug("LivesEngine: paused, life not deducted");
    return;
  }

  if (lives_ > 0) {
    --lives_;
  }
  publish_update();

  if (lives_ == 0 && !depleted_announced_) {
    depleted_announced_ = true;
    logging::get()->info("Lives depleted");
    bus_.publish(LivesDepleted{});
  }
}

void LivesEngine::add_life() {
  if (unlimited_) {
    return;
  }
  ++lives_;
  if (lives_ > 0) {
    depleted_announced_ = false;
  }
  publish_update();
}

void LivesEngine::publish_update() {
  bus_.publish(LivesUpdated{lives_});
}

} // namespace cookie

#pragma once

#include "../include/cookie/event_bus.hpp"

namespace cookie {

/**
 * LivesEngine: counts down lives on wrong answers. A practice session
 * configured with zero lives is unlimited and never loses one.
 */
class LivesEngine {
public:
  LivesEngine(EventBus& bus, int lives, bool unlimited);

  // Publishes the initial LivesUpdated.
  void start();

  // Decrements (clamped at zero). Publishes LivesUpdated and, on reaching
  // zero, LivesDepleted exactly once.
  void lose_life();
  void add_life();

  bool has_lives() const { return unlimited_ || lives_ > 0; }
  bool unlimited() const { return unlimited_; }
  int lives() const { return lives_; }

  // Both are no-ops for an unlimited pool.
  void pause() {
    if (!unlimited_) paused_ = true;
  }
  void resume() {
    if (!unlimited_) paused_ = false;
  }
  bool paused() const { return paused_; }

private:
  void publish_update();

  EventBus& bus_;
  int lives_ = 0;
  bool unlimited_ = false;
  bool paused_ = false;
  bool depleted_announced_ = false;
};

} // namespace cookie

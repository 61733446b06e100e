#pragma once

#include "../include/cookie/event_bus.hpp"

namespace cookie {

/**
 * TimerEngine: session countdown driven by frame deltas. A limit of zero in
 * practice mode is unlimited: the timer never activates and never expires.
 */
class TimerEngine {
public:
  TimerEngine(EventBus& bus, double time_limit, bool unlimited);

  // Arms the countdown (no-op when unlimited).
  void start();

  // Publishes TimerUpdated while active; TimerExpired once on reaching zero.
  void tick(double dt);

  void pause();
  // No-op when unlimited or already expired.
  void resume();

  void add_time(double seconds);

  bool has_time() const;
  bool active() const { return active_; }
  bool expired() const { return expired_; }
  bool unlimited() const { return unlimited_; }
  double remaining() const { return remaining_; }

private:
  EventBus& bus_;
  double remaining_ = 0.0;
  bool unlimited_ = false;
  bool active_ = false;
  bool expired_ = false;
};

} // namespace cookie

#include "timer_engine.hpp"

#include "cookie/logging.hpp"

namespace cookie {

TimerEngine::TimerEngine(EventBus& bus, double time_limit, bool unlimited)
    : bus_(bus), remaining_(time_limit < 0.0 ? 0.0 : time_limit), unlimited_(unlimited) {}

void TimerEngine::start() {
  expired_ = false;
  active_ = !unlimited_;
}

void TimerEngine::tick(double dt) {
  if (!active_) {
    return;
  }
  if (dt > 0.0) {
    remaining_ -= dt;
  }
  if (remaining_ < 0.0) {
    remaining_ = 0.0;
  }

  bus_.publish(TimerUpdated{remaining_});

  if (remaining_ == 0.0 && active_ && !expired_) {
    active_ = false;
    expired_ = true;
    logging::get()->info("Timer expired");
    bus_.publish(TimerExpired{});
  }
}

void TimerEngine::pause() {
  active_ = false;
}

void TimerEngine::resume() {
  if (unlimited_ || expired_) {
    return;
  }
  active_ = true;
}

void TimerEngine::add_time(double seconds) {
  if (unlimited_ || expired_ || seconds <= 0.0) {
    return;
  }
  remaining_ += seconds;
}

bool TimerEngine::has_time() const {
  if (unlimited_) {
    return true;
  }
  return remaining_ > 0.0;
}

} // namespace cookie

#pragma once

#include "../include/cookie/config.hpp"
#include "../include/cookie/event_bus.hpp"
#include "../include/cookie/task_scheduler.hpp"
#include "../include/cookie/types.hpp"
#include "../scoring/scoring.hpp"
#include "distribution_validator.hpp"
#include "lives_engine.hpp"
#include "question_generator.hpp"
#include "timer_engine.hpp"

#include <vector>

#include <nlohmann/json.hpp>

namespace cookie {

/**
 * GameplaySession: one practice or test run, from the first question to
 * GameOver.
 *
 * The session owns the per-run engines and listens to their events: an
 * answer is scored, a wrong one costs a life, and the next question follows
 * after the feedback delay. Running out of questions, lives or time ends the
 * session; only the first of these publishes GameOver.
 *
 * The session is destroyed when play leaves the gameplay screen, which
 * releases every subscription it made.
 */
class GameplaySession {
public:
  GameplaySession(EventBus& bus, const GameConfig& config, QuestionGenerator& generator,
                  bool practice);
  ~GameplaySession();

  GameplaySession(const GameplaySession&) = delete;
  GameplaySession& operator=(const GameplaySession&) = delete;

  void start();
  void tick(double dt);

  // Judges the current distribution; false when no question is open.
  bool submit();

  void pause();
  void resume();

  // Safe to call more than once; only the first call publishes GameOver.
  void end_session(const char* reason);

  const SessionState& state() const { return state_; }
  bool practice() const { return state_.is_practice_mode; }
  bool paused() const { return paused_; }
  bool ended() const { return state_.ended; }

  const DistributionValidator& validator() const { return validator_; }
  const scoring::ScoreEngine& score() const { return score_; }
  const LivesEngine& lives() const { return lives_; }
  const TimerEngine& timer() const { return timer_; }
  const TaskScheduler& scheduler() const { return scheduler_; }

  nlohmann::json debug_state() const;

private:
  void subscribe_all();
  void start_next_question();
  void on_answer(const AnswerSubmitted& event);

  EventBus& bus_;
  const GameConfig& config_;
  QuestionGenerator& generator_;

  SessionState state_{};
  DistributionValidator validator_;
  scoring::ScoreEngine score_;
  LivesEngine lives_;
  TimerEngine timer_;
  TaskScheduler scheduler_;
  bool paused_ = false;
  bool started_ = false;

  std::vector<ScopedSubscription> subscriptions_;
};

} // namespace cookie

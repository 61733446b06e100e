#pragma once

#include "../include/cookie/event_bus.hpp"
#include "../include/cookie/events.hpp"

#include <map>
#include <set>

#include <nlohmann/json.hpp>

namespace cookie {

enum class DistributionPhase {
  Idle,
  Collecting,
  SubmittedCorrect,
  SubmittedIncorrect
};

const char* to_string(DistributionPhase phase);

/**
 * DistributionState: everything the validator knows about the question in
 * play. Reset whenever a QuestionGenerated event arrives.
 */
struct DistributionState {
  std::map<int, int> monster_cookie_counts;
  std::set<int> monsters_with_cookies;
  int dividend = 0;
  int divisor = 0;
  int quotient = 0;
  int cookies_remaining = 0;
  int rounds_completed = 0;
  double elapsed = 0.0;
  DistributionPhase phase = DistributionPhase::Idle;
};

/**
 * DistributionValidator enforces "give cookies to exactly `divisor` monsters,
 * each ending with `quotient` cookies" as drops arrive.
 *
 * Picking one monster too many fails the question immediately. Over-counting a
 * single monster is only judged on submit. Outcomes are published as
 * AnswerSubmitted; nothing here throws for a wrong answer.
 */
class DistributionValidator {
public:
  DistributionValidator(EventBus& bus, int max_monsters);
  ~DistributionValidator();

  DistributionValidator(const DistributionValidator&) = delete;
  DistributionValidator& operator=(const DistributionValidator&) = delete;

  // Registers for QuestionGenerated and CookieDropped. Calling attach() twice
  // re-registers rather than duplicating handlers.
  void attach();
  void detach();

  void on_question_generated(const QuestionGenerated& event);
  void on_cookie_dropped(const CookieDropped& event);

  // Judges the current distribution. Returns false (and publishes nothing)
  // when the question is not collecting input any more.
  bool on_submit();

  void tick(double dt);

  const DistributionState& state() const { return state_; }
  bool accepting_input() const { return state_.phase == DistributionPhase::Collecting; }
  int cookies_for(int monster_id) const;

  nlohmann::json debug_state() const;

private:
  void publish_result(bool correct);
  void check_round_completed();

  EventBus& bus_;
  int max_monsters_ = 0;
  DistributionState state_{};
  ScopedSubscription question_sub_;
  ScopedSubscription drop_sub_;
};

} // namespace cookie

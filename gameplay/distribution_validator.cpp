#include "distribution_validator.hpp"

#include "cookie/logging.hpp"

#include <algorithm>
#include <limits>

namespace cookie {

const char* to_string(DistributionPhase phase) {
  switch (phase) {
    case DistributionPhase::Idle: return "idle";
    case DistributionPhase::Collecting: return "collecting";
    case DistributionPhase::SubmittedCorrect: return "submitted_correct";
    case DistributionPhase::SubmittedIncorrect: return "submitted_incorrect";
  }
  return "idle";
}

DistributionValidator::DistributionValidator(EventBus& bus, int max_monsters)
    : bus_(bus), max_monsters_(max_monsters) {}

DistributionValidator::~DistributionValidator() = default;

void DistributionValidator::attach() {
  detach();
  question_sub_ = scoped_subscribe<QuestionGenerated>(
      bus_, [this](const QuestionGenerated& event) { on_question_generated(event); });
  drop_sub_ = scoped_subscribe<CookieDropped>(
      bus_, [this](const CookieDropped& event) { on_cookie_dropped(event); });
}

void DistributionValidator::detach() {
  question_sub_.reset();
  drop_sub_.reset();
}

void DistributionValidator::on_question_generated(const QuestionGenerated& event) {
  state_ = DistributionState{};
  state_.dividend = event.dividend;
  state_.divisor = event.divisor;
  state_.quotient = event.quotient;
  state_.cookies_remaining = event.dividend;
  state_.phase = DistributionPhase::Collecting;

  logging::get()->debug("DistributionValidator: new question - {} cookies, {} monsters",
                        event.dividend, event.divisor);
  bus_.publish(CookiePileUpdated{state_.cookies_remaining, state_.dividend});
}

void DistributionValidator::on_cookie_dropped(const CookieDropped& event) {
  auto logger = logging::get();
  if (state_.phase != DistributionPhase::Collecting) {
    logger->debug("Cookie drop on monster {} ignored: question is {}", event.monster_id,
                  to_string(state_.phase));
    return;
  }
  if (event.monster_id < 0 || event.monster_id >= max_monsters_) {
    logger->warn("Monster with id {} not found", event.monster_id);
    return;
  }

  const int monster = event.monster_id;
  const bool is_new_monster = state_.monsters_with_cookies.count(monster) == 0;
  const int chosen = static_cast<int>(state_.monsters_with_cookies.size());
  if (is_new_monster && chosen >= state_.divisor) {
    logger->info("Cookie dropped on monster {} but {} monsters already chosen (allowed {})", monster,
                 chosen, state_.divisor);
    publish_result(false);
    return;
  }

  if (state_.cookies_remaining <= 0) {
    logger->info("Remainder error: {} cookies left, need {} for an even share",
                 state_.cookies_remaining, state_.divisor);
    bus_.publish(RemainderError{state_.cookies_remaining, state_.divisor});
    return;
  }

  ++state_.monster_cookie_counts[monster];
  state_.monsters_with_cookies.insert(monster);
  --state_.cookies_remaining;

  logger->debug("Cookie dropped on monster {} (now {}), monsters chosen {}/{}", monster,
                state_.monster_cookie_counts[monster], state_.monsters_with_cookies.size(),
                state_.divisor);

  bus_.publish(CookiePileUpdated{state_.cookies_remaining, state_.dividend});
  check_round_completed();
}

void DistributionValidator::check_round_completed() {
  if (state_.phase != DistributionPhase::Collecting) {
    return;
  }
  if (static_cast<int>(state_.monsters_with_cookies.size()) != state_.divisor) {
    return;
  }
  int lowest = std::numeric_limits<int>::max();
  for (int monster : state_.monsters_with_cookies) {
    lowest = std::min(lowest, state_.monster_cookie_counts[monster]);
  }
  if (lowest > state_.rounds_completed && lowest <= state_.quotient) {
    state_.rounds_completed = lowest;
    bus_.publish(DistributionRoundCompleted{state_.rounds_completed, state_.cookies_remaining});
  }
}

bool DistributionValidator::on_submit() {
  if (state_.phase != DistributionPhase::Collecting) {
    logging::get()->debug("Submit ignored: question is {}", to_string(state_.phase));
    return false;
  }

  const int chosen = static_cast<int>(state_.monsters_with_cookies.size());
  if (chosen != state_.divisor) {
    logging::get()->info("Wrong: cookies given to {} monsters, expected exactly {}", chosen,
                         state_.divisor);
    publish_result(false);
    return true;
  }

  const bool all_correct =
      std::all_of(state_.monsters_with_cookies.begin(), state_.monsters_with_cookies.end(),
                  [this](int monster) { return cookies_for(monster) == state_.quotient; });
  logging::get()->info("{}: each monster should hold {} cookies", all_correct ? "Correct" : "Wrong",
                       state_.quotient);
  publish_result(all_correct);
  return true;
}

void DistributionValidator::publish_result(bool correct) {
  state_.phase = correct ? DistributionPhase::SubmittedCorrect : DistributionPhase::SubmittedIncorrect;
  AnswerSubmitted event;
  event.is_correct = correct;
  event.submitted_answer = correct ? state_.quotient : -1;
  event.correct_answer = state_.quotient;
  event.time_taken = state_.elapsed;
  bus_.publish(event);
}

void DistributionValidator::tick(double dt) {
  if (state_.phase == DistributionPhase::Collecting && dt > 0.0) {
    state_.elapsed += dt;
  }
}

int DistributionValidator::cookies_for(int monster_id) const {
  auto it = state_.monster_cookie_counts.find(monster_id);
  return it == state_.monster_cookie_counts.end() ? 0 : it->second;
}

nlohmann::json DistributionValidator::debug_state() const {
  nlohmann::json info = nlohmann::json::object();
  info["phase"] = to_string(state_.phase);
  info["dividend"] = state_.dividend;
  info["divisor"] = state_.divisor;
  info["quotient"] = state_.quotient;
  info["cookies_remaining"] = state_.cookies_remaining;
  info["rounds_completed"] = state_.rounds_completed;
  info["elapsed"] = state_.elapsed;
  nlohmann::json counts = nlohmann::json::object();
  for (const auto& [monster, count] : state_.monster_cookie_counts) {
    counts[std::to_string(monster)] = count;
  }
  info["monster_cookie_counts"] = counts;
  return info;
}

} // namespace cookie

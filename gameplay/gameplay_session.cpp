#include "gameplay_session.hpp"

#include "cookie/logging.hpp"

#include <string>

namespace cookie {

GameplaySession::GameplaySession(EventBus& bus, const GameConfig& config,
                                 QuestionGenerator& generator, bool practice)
    : bus_(bus),
      config_(config),
      generator_(generator),
      validator_(bus, config.max_monsters),
      score_(bus),
      lives_(bus, config.lives(practice), config.unlimited_lives(practice)),
      timer_(bus, config.time_limit(practice), config.unlimited_time(practice)) {
  state_.is_practice_mode = practice;
}

GameplaySession::~GameplaySession() {
  scheduler_.cancel_all();
}

void GameplaySession::subscribe_all() {
  subscriptions_.clear();
  subscriptions_.push_back(scoped_subscribe<AnswerSubmitted>(
      bus_, [this](const AnswerSubmitted& event) { on_answer(event); }));
  subscriptions_.push_back(scoped_subscribe<DistributionRoundCompleted>(
      bus_, [this](const DistributionRoundCompleted& event) {
        if (state_.ended || config_.points_per_round <= 0) {
          return;
        }
        logging::get()->debug("Round {} completed, {} cookies left", event.round_number,
                              event.remaining_cookies);
        score_.add_round_score(config_.points_per_round);
      }));
  subscriptions_.push_back(scoped_subscribe<LivesDepleted>(
      bus_, [this](const LivesDepleted&) { end_session("lives depleted"); }));
  subscriptions_.push_back(scoped_subscribe<TimerExpired>(
      bus_, [this](const TimerExpired&) { end_session("time expired"); }));

  // Mirrors of engine state.
  subscriptions_.push_back(scoped_subscribe<ScoreUpdated>(bus_, [this](const ScoreUpdated& event) {
    state_.score = event.new_score;
    state_.correct_answers = event.correct_answers;
  }));
  subscriptions_.push_back(scoped_subscribe<LivesUpdated>(
      bus_, [this](const LivesUpdated& event) { state_.lives = event.remaining_lives; }));
  subscriptions_.push_back(scoped_subscribe<TimerUpdated>(
      bus_, [this](const TimerUpdated& event) { state_.remaining_time = event.remaining_time; }));
}

void GameplaySession::start() {
  auto logger = logging::get();
  if (started_) {
    logger->warn("GameplaySession::start called twice, ignored");
    return;
  }
  started_ = true;

  subscribe_all();
  validator_.attach();
  score_.reset();

  if (!state_.is_practice_mode && generator_.submitted_count() > 0) {
    generator_.rewind();
    state_.total_questions = static_cast<int>(generator_.submitted_count());
  } else {
    state_.total_questions = config_.total_questions;
  }
  state_.remaining_time = timer_.remaining();

  lives_.start();
  timer_.start();

  logger->info("{} session started: {} questions, {} lives, {}s",
               state_.is_practice_mode ? "Practice" : "Test", state_.total_questions,
               lives_.unlimited() ? std::string("unlimited") : std::to_string(lives_.lives()),
               timer_.unlimited() ? std::string("unlimited") : std::to_string(timer_.remaining()));
  start_next_question();
}

void GameplaySession::start_next_question() {
  if (state_.ended) {
    return;
  }
  ++state_.question_number;
  if (state_.question_number > state_.total_questions) {
    end_session("all questions answered");
    return;
  }

  try {
    generator_.next_question(config_, state_.used_questions);
  } catch (const ConfigurationError& ex) {
    logging::get()->error("Cannot generate question {}: {}", state_.question_number, ex.what());
    end_session("question generation failed");
    return;
  }
  logging::get()->debug("Question {}/{} started", state_.question_number, state_.total_questions);
}

void GameplaySession::on_answer(const AnswerSubmitted& event) {
  if (state_.ended) {
    return;
  }
  ++state_.answered_questions;

  if (event.is_correct) {
    int base = config_.points_per_correct_answer;
    if (event.time_taken < config_.fast_answer_threshold) {
      base += config_.fast_answer_bonus;
      logging::get()->debug("Fast answer in {:.2f}s, bonus {}", event.time_taken,
                            config_.fast_answer_bonus);
    }
    score_.add_answer_score(base, score_.projected_accuracy(true));
  } else {
    score_.add_wrong_answer(config_.points_per_wrong_answer);
    lives_.lose_life();
  }

  // lose_life() may have ended the session.
  if (state_.ended) {
    return;
  }
  const auto generation = scheduler_.generation();
  scheduler_.schedule(config_.feedback_delay, [this, generation] {
    if (generation == scheduler_.generation()) {
      start_next_question();
    }
  });
}

void GameplaySession::tick(double dt) {
  if (state_.ended || paused_) {
    return;
  }
  validator_.tick(dt);
  timer_.tick(dt);
  scheduler_.advance(dt);
}

bool GameplaySession::submit() {
  if (state_.ended || paused_) {
    return false;
  }
  return validator_.on_submit();
}

void GameplaySession::pause() {
  if (paused_ || state_.ended) {
    return;
  }
  paused_ = true;
  timer_.pause();
  lives_.pause();
  bus_.publish(GamePaused{});
}

void GameplaySession::resume() {
  if (!paused_ || state_.ended) {
    return;
  }
  paused_ = false;
  timer_.resume();
  lives_.resume();
  bus_.publish(GameResumed{});
}

void GameplaySession::end_session(const char* reason) {
  if (state_.ended) {
    return;
  }
  state_.ended = true;
  scheduler_.cancel_all();
  timer_.pause();
  validator_.detach();

  const int final_score = score_.score();
  const double accuracy = score_.accuracy();
  logging::get()->info("Session ended ({}): score {}, accuracy {:.0f}%", reason, final_score,
                       accuracy * 100.0);
  bus_.publish(GameOver{final_score, accuracy});
}

nlohmann::json GameplaySession::debug_state() const {
  nlohmann::json info = nlohmann::json::object();
  info["practice"] = state_.is_practice_mode;
  info["question_number"] = state_.question_number;
  info["total_questions"] = state_.total_questions;
  info["answered_questions"] = state_.answered_questions;
  info["correct_answers"] = state_.correct_answers;
  info["score"] = state_.score;
  info["lives"] = lives_.unlimited() ? nlohmann::json(nullptr) : nlohmann::json(state_.lives);
  info["remaining_time"] =
      timer_.unlimited() ? nlohmann::json(nullptr) : nlohmann::json(state_.remaining_time);
  info["paused"] = paused_;
  info["ended"] = state_.ended;
  info["pending_tasks"] = scheduler_.pending();
  info["distribution"] = validator_.debug_state();
  info["scoring"] = score_.debug_state();
  return info;
}

} // namespace cookie

#include "scoring.hpp"

#include "cookie/logging.hpp"

#include <cmath>

namespace cookie::scoring {

double multiplier_for(double accuracy) {
  if (accuracy >= 1.0) {
    return kMultiplierPerfect;
  }
  if (accuracy > 0.8) {
    return kMultiplierGood;
  }
  return kMultiplierNormal;
}

std::string grade_for(double accuracy) {
  if (accuracy >= 0.95) return "A+";
  if (accuracy >= 0.9) return "A";
  if (accuracy >= 0.85) return "B+";
  if (accuracy >= 0.8) return "B";
  if (accuracy >= 0.75) return "C+";
  if (accuracy >= 0.7) return "C";
  if (accuracy >= 0.6) return "D";
  return "F";
}

ScoreEngine::ScoreEngine(EventBus& bus) : bus_(bus) {}

void ScoreEngine::reset() {
  score_ = 0;
  correct_answers_ = 0;
  total_questions_ = 0;
  last_multiplier_ = kMultiplierNormal;
}

void ScoreEngine::add_round_score(int points) {
  score_ += points;
  bus_.publish(RoundScoreAdded{points, score_});
  logging::get()->debug("Round score added: +{} (total {})", points, score_);
  publish_update(last_multiplier_);
}

int ScoreEngine::add_answer_score(int base_points, double accuracy) {
  ++correct_answers_;
  ++total_questions_;

  const double multiplier = multiplier_for(accuracy);
  const int final_points = static_cast<int>(std::lround(base_points * multiplier));
  score_ += final_points;
  last_multiplier_ = multiplier;

  logging::get()->info("Answer score: {} x {:.1f} = {} points (accuracy {:.0f}%)", base_points,
                       multiplier, final_points, accuracy * 100.0);
  publish_update(multiplier);
  return final_points;
}

void ScoreEngine::add_wrong_answer(int points) {
  ++total_questions_;
  score_ += points;
  last_multiplier_ = kMultiplierNormal;
  publish_update(kMultiplierNormal);
}

double ScoreEngine::accuracy() const {
  if (total_questions_ == 0) {
    return 0.0;
  }
  return static_cast<double>(correct_answers_) / static_cast<double>(total_questions_);
}

double ScoreEngine::projected_accuracy(bool correct) const {
  const int correct_after = correct_answers_ + (correct ? 1 : 0);
  return static_cast<double>(correct_after) / static_cast<double>(total_questions_ + 1);
}

void ScoreEngine::publish_update(double multiplier) {
  ScoreUpdated event;
  event.new_score = score_;
  event.total_questions = total_questions_;
  event.correct_answers = correct_answers_;
  event.multiplier = multiplier;
  bus_.publish(event);
}

nlohmann::json ScoreEngine::debug_state() const {
  nlohmann::json info = nlohmann::json::object();
  info["score"] = score_;
  info["correct_answers"] = correct_answers_;
  info["total_questions"] = total_questions_;
  info["accuracy"] = accuracy();
  info["grade"] = grade_for(accuracy());
  info["multiplier"] = last_multiplier_;
  return info;
}

} // namespace cookie::scoring

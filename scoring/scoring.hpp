#pragma once

#include "../include/cookie/event_bus.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace cookie::scoring {

constexpr double kMultiplierPerfect = 2.0; // accuracy == 100%
constexpr double kMultiplierGood = 1.5;    // accuracy > 80%
constexpr double kMultiplierNormal = 1.0;

double multiplier_for(double accuracy);

// Letter grade ladder: A+ from 95%, then A, B+, B, C+, C in 5% steps, D from 60%, else F.
std::string grade_for(double accuracy);

/**
 * ScoreEngine: running score for one gameplay session. Every mutation is
 * announced on the bus as ScoreUpdated (and RoundScoreAdded for round points).
 */
class ScoreEngine {
public:
  explicit ScoreEngine(EventBus& bus);

  void reset();

  void add_round_score(int points);

  // Records a correct answer worth `base_points` scaled by multiplier_for(accuracy).
  // Returns the points actually awarded.
  int add_answer_score(int base_points, double accuracy);

  // Records a wrong answer; `points` is normally zero.
  void add_wrong_answer(int points = 0);

  int score() const noexcept { return score_; }
  int correct_answers() const noexcept { return correct_answers_; }
  int total_questions() const noexcept { return total_questions_; }
  double last_multiplier() const noexcept { return last_multiplier_; }

  // correct / total, 0 before the first answer.
  double accuracy() const;

  // Accuracy after recording one more answer of the given correctness.
  double projected_accuracy(bool correct) const;

  nlohmann::json debug_state() const;

private:
  void publish_update(double multiplier);

  EventBus& bus_;
  int score_ = 0;
  int correct_answers_ = 0;
  int total_questions_ = 0;
  double last_multiplier_ = kMultiplierNormal;
};

} // namespace cookie::scoring

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>

namespace cookie {

// Hard cap on the per-monster share, for gameplay balance.
constexpr int kMaxQuotient = 6;

struct Question {
  int dividend = 0;
  int divisor = 1;
  int quotient = 0;

  bool consistent() const { return divisor >= 1 && dividend == divisor * quotient; }
};

inline bool operator==(const Question& lhs, const Question& rhs) {
  return lhs.dividend == rhs.dividend && lhs.divisor == rhs.divisor &&
         lhs.quotient == rhs.quotient;
}

inline std::string to_string(const Question& q) {
  return std::to_string(q.dividend) + " / " + std::to_string(q.divisor) + " = " +
         std::to_string(q.quotient);
}

// Operator-entered question for test mode; the quotient is derived.
struct QuestionRequest {
  int dividend = 0;
  int divisor = 0;
};

/// (dividend, divisor) identity used for the no-repeat guarantee.
using QuestionKey = std::pair<int, int>;

struct QuestionKeyHash {
  std::size_t operator()(const QuestionKey& key) const noexcept {
    const std::size_t a = std::hash<int>{}(key.first);
    const std::size_t b = std::hash<int>{}(key.second);
    return a ^ (b + 0x9e3779b97f4a7c15ULL + (a << 6) + (a >> 2));
  }
};

using UsedQuestions = std::unordered_set<QuestionKey, QuestionKeyHash>;

struct SessionState {
  int question_number = 0;
  int total_questions = 0;
  int score = 0;
  int correct_answers = 0;
  int answered_questions = 0;
  UsedQuestions used_questions;
  int lives = 0;
  double remaining_time = 0.0;
  bool is_practice_mode = false;
  bool ended = false;
};

} // namespace cookie

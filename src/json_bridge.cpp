#include "json_bridge.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace cookie::bridge {

int json_to_int(const nlohmann::json& value, std::string_view key) {
  constexpr auto kMin = std::numeric_limits<int>::min();
  constexpr auto kMax = std::numeric_limits<int>::max();
  const auto out_of_range = [key] {
    return std::invalid_argument("Value of field '" + std::string(key) + "' is out of int range");
  };
  if (value.is_number_unsigned()) {
    if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(kMax)) {
      throw out_of_range();
    }
    return static_cast<int>(value.get<std::uint64_t>());
  }
  if (value.is_number_integer()) {
    const auto wide = value.get<std::int64_t>();
    if (wide < kMin || wide > kMax) {
      throw out_of_range();
    }
    return static_cast<int>(wide);
  }
  if (value.is_number_float()) {
    const double rounded = std::round(value.get<double>());
    if (!std::isfinite(rounded) || rounded < static_cast<double>(kMin) ||
        rounded > static_cast<double>(kMax)) {
      throw out_of_range();
    }
    return static_cast<int>(rounded);
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

namespace {

int require_int(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return json_to_int(*it, key);
}

} // namespace

nlohmann::json to_json(const Event& event) {
  nlohmann::json json = nlohmann::json::object();
  json["type"] = event_name(event);
  std::visit(
      [&json](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, QuestionGenerated>) {
          json["dividend"] = e.dividend;
          json["divisor"] = e.divisor;
          json["quotient"] = e.quotient;
        } else if constexpr (std::is_same_v<T, CookieDropped>) {
          json["monsterId"] = e.monster_id;
        } else if constexpr (std::is_same_v<T, CookiePileUpdated>) {
          json["remainingCookies"] = e.remaining_cookies;
          json["totalCookies"] = e.total_cookies;
        } else if constexpr (std::is_same_v<T, DistributionRoundCompleted>) {
          json["roundNumber"] = e.round_number;
          json["remainingCookies"] = e.remaining_cookies;
        } else if constexpr (std::is_same_v<T, RemainderError>) {
          json["remainingCookies"] = e.remaining_cookies;
          json["divisor"] = e.divisor;
        } else if constexpr (std::is_same_v<T, AnswerSubmitted>) {
          json["isCorrect"] = e.is_correct;
          json["submittedAnswer"] = e.submitted_answer;
          json["correctAnswer"] = e.correct_answer;
          json["timeTaken"] = e.time_taken;
        } else if constexpr (std::is_same_v<T, ScoreUpdated>) {
          json["newScore"] = e.new_score;
          json["totalQuestions"] = e.total_questions;
          json["correctAnswers"] = e.correct_answers;
          json["multiplier"] = e.multiplier;
        } else if constexpr (std::is_same_v<T, RoundScoreAdded>) {
          json["roundScore"] = e.round_score;
          json["totalScore"] = e.total_score;
        } else if constexpr (std::is_same_v<T, LivesUpdated>) {
          json["remainingLives"] = e.remaining_lives;
        } else if constexpr (std::is_same_v<T, TimerUpdated>) {
          json["remainingTime"] = e.remaining_time;
        } else if constexpr (std::is_same_v<T, GameOver>) {
          json["finalScore"] = e.final_score;
          json["accuracy"] = e.accuracy;
        } else if constexpr (std::is_same_v<T, ScreenChanged>) {
          json["screenName"] = e.screen_name;
        }
        // LivesDepleted, TimerExpired, GamePaused, GameResumed carry no payload.
      },
      event);
  return json;
}

nlohmann::json to_json(const Question& question) {
  nlohmann::json json = nlohmann::json::object();
  json["dividend"] = question.dividend;
  json["divisor"] = question.divisor;
  json["quotient"] = question.quotient;
  return json;
}

std::vector<QuestionRequest> question_requests_from_json(const nlohmann::json& json_requests) {
  if (!json_requests.is_array()) {
    throw std::invalid_argument("Submitted questions must be a JSON array");
  }
  std::vector<QuestionRequest> requests;
  requests.reserve(json_requests.size());
  for (const auto& entry : json_requests) {
    if (!entry.is_object()) {
      throw std::invalid_argument("Submitted question must be an object");
    }
    QuestionRequest request;
    request.dividend = require_int(entry, "dividend");
    request.divisor = require_int(entry, "divisor");
    requests.push_back(request);
  }
  return requests;
}

nlohmann::json to_json(const ResultsView& results) {
  nlohmann::json json = nlohmann::json::object();
  json["finalScore"] = results.final_score;
  json["accuracy"] = results.accuracy;
  json["grade"] = results.grade;
  json["highScore"] = results.high_score;
  json["newHighScore"] = results.new_high_score;
  json["practice"] = results.practice;
  return json;
}

nlohmann::json to_json(const flow::State& state) {
  nlohmann::json json = nlohmann::json::object();
  json["name"] = flow::state_name(state);
  if (const auto* loading = std::get_if<flow::Loading>(&state)) {
    json["remaining"] = loading->remaining;
  } else if (const auto* gameplay = std::get_if<flow::Gameplay>(&state)) {
    json["practice"] = gameplay->practice;
  } else if (const auto* over = std::get_if<flow::GameOver>(&state)) {
    json["finalScore"] = over->final_score;
    json["accuracy"] = over->accuracy;
    json["grade"] = over->grade;
    json["highScore"] = over->high_score;
    json["newHighScore"] = over->new_high_score;
  } else if (const auto* done = std::get_if<flow::PracticeComplete>(&state)) {
    json["finalScore"] = done->final_score;
    json["accuracy"] = done->accuracy;
    json["grade"] = done->grade;
  }
  return json;
}

} // namespace cookie::bridge

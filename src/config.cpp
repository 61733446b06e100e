#include "cookie/config.hpp"

#include "cookie/logging.hpp"
#include "cookie/types.hpp"
#include "json_bridge.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <string_view>

namespace cookie {
namespace {

using bridge::json_to_int;

const std::vector<int> kDefaultDivisors = {2, 3, 4, 5};
constexpr int kDefaultMinDividend = 4;
constexpr int kDefaultMaxDividend = 20;

// Defaults that fit on `max_monsters` monsters; always viable in 4..20.
std::vector<int> default_divisors(int max_monsters) {
  std::vector<int> divisors;
  for (int divisor : kDefaultDivisors) {
    if (divisor <= max_monsters) {
      divisors.push_back(divisor);
    }
  }
  if (divisors.empty()) {
    divisors.push_back(1);
  }
  return divisors;
}

// Looks up `camel` first, then `snake`; null values count as absent.
const nlohmann::json* find_field(const nlohmann::json& obj, const char* camel, const char* snake) {
  for (const char* key : {camel, snake}) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
      return &*it;
    }
  }
  return nullptr;
}

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* camel, const char* snake,
                       Setter&& setter) {
  const auto* value = find_field(obj, camel, snake);
  if (value == nullptr) {
    return false;
  }
  try {
    setter(*value);
  } catch (const std::invalid_argument& ex) {
    logging::get()->warn("Config field '{}' ignored: {}", camel, ex.what());
    return false;
  }
  return true;
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<int> json_to_int_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array for field '" + std::string(key) + "'");
  }
  std::vector<int> out;
  out.reserve(value.size());
  for (const auto& element : value) {
    out.push_back(json_to_int(element, key));
  }
  return out;
}

template <typename T>
void clamp_min(T& field, T minimum, const char* name, std::vector<std::string>& notes) {
  if (field < minimum) {
    notes.push_back(std::string(name) + " raised from " + std::to_string(field) + " to " +
                    std::to_string(minimum));
    field = minimum;
  }
}

} // namespace

std::pair<int, int> quotient_range(const GameConfig& config, int divisor) {
  const int min_quotient = std::max(1, (config.min_dividend + divisor - 1) / divisor);
  const int max_quotient = std::min(kMaxQuotient, config.max_dividend / divisor);
  return {min_quotient, max_quotient};
}

std::vector<std::string> GameConfig::sanitize() {
  std::vector<std::string> notes;
  clamp_min(total_questions, 1, "totalQuestions", notes);
  clamp_min(max_monsters, 1, "maxMonsters", notes);
  clamp_min(test_mode_time_limit, 10.0, "testModeTimeLimit", notes);
  clamp_min(practice_mode_time_limit, 0.0, "practiceModeTimeLimit", notes);
  clamp_min(test_mode_lives, 1, "testModeLives", notes);
  clamp_min(practice_mode_lives, 0, "practiceModeLives", notes);
  clamp_min(points_per_correct_answer, 0, "pointsPerCorrectAnswer", notes);
  clamp_min(points_per_wrong_answer, 0, "pointsPerWrongAnswer", notes);
  clamp_min(points_per_round, 0, "pointsPerRound", notes);
  clamp_min(fast_answer_bonus, 0, "fastAnswerBonus", notes);
  clamp_min(fast_answer_threshold, 0.0, "fastAnswerThreshold", notes);
  clamp_min(min_dividend, 2, "minDividend", notes);
  clamp_min(max_dividend, min_dividend, "maxDividend", notes);
  clamp_min(feedback_delay, 0.0, "feedbackDelay", notes);
  clamp_min(loading_duration, 0.0, "loadingDuration", notes);

  std::set<int> seen;
  std::vector<int> divisors;
  for (int divisor : allowed_divisors) {
    if (divisor < 1 || divisor > max_monsters) {
      notes.push_back("allowedDivisors: dropped " + std::to_string(divisor) +
                      " (outside 1.." + std::to_string(max_monsters) + ")");
      continue;
    }
    if (seen.insert(divisor).second) {
      divisors.push_back(divisor);
    }
  }
  if (divisors.empty()) {
    divisors = default_divisors(max_monsters);
    notes.push_back("allowedDivisors was empty, reset to defaults");
  }
  allowed_divisors = std::move(divisors);

  const auto any_viable = [this] {
    return std::any_of(allowed_divisors.begin(), allowed_divisors.end(),
                       [this](int d) { return has_quotients(*this, d); });
  };
  if (!any_viable()) {
    notes.push_back("dividend range [" + std::to_string(min_dividend) + "," +
                    std::to_string(max_dividend) + "] admits no question, reset to [" +
                    std::to_string(kDefaultMinDividend) + "," +
                    std::to_string(kDefaultMaxDividend) + "]");
    min_dividend = kDefaultMinDividend;
    max_dividend = kDefaultMaxDividend;
  }
  // Large divisors can still miss the default range entirely.
  if (!any_viable()) {
    allowed_divisors = default_divisors(max_monsters);
    notes.push_back("allowedDivisors admit no question in the default range, reset to defaults");
  }
  return notes;
}

void GameConfig::validate() const {
  if (allowed_divisors.empty()) {
    throw ConfigurationError("allowedDivisors must not be empty");
  }
  for (int divisor : allowed_divisors) {
    if (divisor < 1 || divisor > max_monsters) {
      throw ConfigurationError("allowedDivisors entry " + std::to_string(divisor) +
                               " must be within [1, maxMonsters]");
    }
  }
  if (min_dividend > max_dividend) {
    throw ConfigurationError("minDividend must not exceed maxDividend");
  }
}

GameConfig config_from_json(const nlohmann::json& json) {
  GameConfig config;
  if (!json.is_object()) {
    logging::get()->warn("Config document is not an object, using defaults");
    return config;
  }

  assign_if_present(json, "totalQuestions", "total_questions",
                    [&](const auto& v) { config.total_questions = json_to_int(v, "totalQuestions"); });
  assign_if_present(json, "maxMonsters", "max_monsters",
                    [&](const auto& v) { config.max_monsters = json_to_int(v, "maxMonsters"); });
  assign_if_present(json, "testModeTimeLimit", "test_mode_time_limit", [&](const auto& v) {
    config.test_mode_time_limit = json_to_double(v, "testModeTimeLimit");
  });
  assign_if_present(json, "practiceModeTimeLimit", "practice_mode_time_limit", [&](const auto& v) {
    config.practice_mode_time_limit = json_to_double(v, "practiceModeTimeLimit");
  });
  assign_if_present(json, "testModeLives", "test_mode_lives",
                    [&](const auto& v) { config.test_mode_lives = json_to_int(v, "testModeLives"); });
  assign_if_present(json, "practiceModeLives", "practice_mode_lives", [&](const auto& v) {
    config.practice_mode_lives = json_to_int(v, "practiceModeLives");
  });
  assign_if_present(json, "pointsPerCorrectAnswer", "points_per_correct_answer", [&](const auto& v) {
    config.points_per_correct_answer = json_to_int(v, "pointsPerCorrectAnswer");
  });
  assign_if_present(json, "pointsPerWrongAnswer", "points_per_wrong_answer", [&](const auto& v) {
    config.points_per_wrong_answer = json_to_int(v, "pointsPerWrongAnswer");
  });
  assign_if_present(json, "pointsPerRound", "points_per_round",
                    [&](const auto& v) { config.points_per_round = json_to_int(v, "pointsPerRound"); });
  assign_if_present(json, "fastAnswerBonus", "fast_answer_bonus",
                    [&](const auto& v) { config.fast_answer_bonus = json_to_int(v, "fastAnswerBonus"); });
  assign_if_present(json, "fastAnswerThreshold", "fast_answer_threshold", [&](const auto& v) {
    config.fast_answer_threshold = json_to_double(v, "fastAnswerThreshold");
  });
  assign_if_present(json, "minDividend", "min_dividend",
                    [&](const auto& v) { config.min_dividend = json_to_int(v, "minDividend"); });
  assign_if_present(json, "maxDividend", "max_dividend",
                    [&](const auto& v) { config.max_dividend = json_to_int(v, "maxDividend"); });
  assign_if_present(json, "allowedDivisors", "allowed_divisors", [&](const auto& v) {
    config.allowed_divisors = json_to_int_vector(v, "allowedDivisors");
  });
  assign_if_present(json, "feedbackDelay", "feedback_delay",
                    [&](const auto& v) { config.feedback_delay = json_to_double(v, "feedbackDelay"); });
  assign_if_present(json, "loadingDuration", "loading_duration", [&](const auto& v) {
    config.loading_duration = json_to_double(v, "loadingDuration");
  });
  assign_if_present(json, "seed", "seed", [&](const auto& v) {
    if (!v.is_number_integer() || v.template get<std::int64_t>() < 0) {
      throw std::invalid_argument("Expected non-negative integer for field 'seed'");
    }
    config.seed = v.template get<std::uint64_t>();
  });
  assign_if_present(json, "highScorePath", "high_score_path", [&](const auto& v) {
    config.high_score_path = json_to_string(v, "highScorePath");
  });
  assign_if_present(json, "logLevel", "log_level",
                    [&](const auto& v) { config.log_level = json_to_string(v, "logLevel"); });
  return config;
}

nlohmann::json to_json(const GameConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["totalQuestions"] = config.total_questions;
  json["maxMonsters"] = config.max_monsters;
  json["testModeTimeLimit"] = config.test_mode_time_limit;
  json["practiceModeTimeLimit"] = config.practice_mode_time_limit;
  json["testModeLives"] = config.test_mode_lives;
  json["practiceModeLives"] = config.practice_mode_lives;
  json["pointsPerCorrectAnswer"] = config.points_per_correct_answer;
  json["pointsPerWrongAnswer"] = config.points_per_wrong_answer;
  json["pointsPerRound"] = config.points_per_round;
  json["fastAnswerBonus"] = config.fast_answer_bonus;
  json["fastAnswerThreshold"] = config.fast_answer_threshold;
  json["minDividend"] = config.min_dividend;
  json["maxDividend"] = config.max_dividend;
  json["allowedDivisors"] = config.allowed_divisors;
  json["feedbackDelay"] = config.feedback_delay;
  json["loadingDuration"] = config.loading_duration;
  json["seed"] = config.seed;
  json["highScorePath"] = config.high_score_path;
  json["logLevel"] = config.log_level;
  return json;
}

GameConfig load_config(const std::filesystem::path& path) {
  auto logger = logging::get();
  GameConfig config;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    logger->warn("Config not found at '{}', using default values", path.string());
  } else {
    std::ifstream stream(path);
    if (!stream) {
      logger->warn("Failed to open config '{}', using default values", path.string());
    } else {
      std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
      try {
        config = config_from_json(nlohmann::json::parse(content));
      } catch (const nlohmann::json::parse_error& ex) {
        logger->warn("Config '{}' is not valid JSON ({}), using default values", path.string(),
                     ex.what());
      }
    }
  }

  for (const auto& note : config.sanitize()) {
    logger->warn("Config corrected: {}", note);
  }
  return config;
}

} // namespace cookie

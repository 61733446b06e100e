#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace cookie {

class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * GameConfig: every tunable of a play session. Loaded (or defaulted) once at
 * start-up and read-only afterwards. Values below are the shipped defaults.
 */
struct GameConfig {
  int total_questions = 3;
  int max_monsters = 5;

  double test_mode_time_limit = 60.0;
  double practice_mode_time_limit = 120.0; // 0 = unlimited
  int test_mode_lives = 3;
  int practice_mode_lives = 5; // 0 = unlimited

  int points_per_correct_answer = 10;
  int points_per_wrong_answer = 0;
  int points_per_round = 5;
  int fast_answer_bonus = 50;
  double fast_answer_threshold = 5.0;

  int min_dividend = 4;
  int max_dividend = 20;
  std::vector<int> allowed_divisors{2, 3, 4, 5};

  double feedback_delay = 1.5;
  double loading_duration = 0.0;
  std::uint64_t seed = 0; // 0 = seed from the clock
  std::string high_score_path = "highscore.json";
  std::string log_level = "info";

  double time_limit(bool practice) const {
    return practice ? practice_mode_time_limit : test_mode_time_limit;
  }
  int lives(bool practice) const { return practice ? practice_mode_lives : test_mode_lives; }

  bool unlimited_time(bool practice) const { return practice && practice_mode_time_limit <= 0.0; }
  bool unlimited_lives(bool practice) const { return practice && practice_mode_lives == 0; }

  // Clamps every field into its legal range. Returns one message per
  // correction so the caller can log what was changed.
  std::vector<std::string> sanitize();

  // Throws ConfigurationError if the invariants do not hold.
  void validate() const;
};

// Legal quotients for `divisor` (>= 1): [max(1, ceil(min/d)), min(6, floor(max/d))].
std::pair<int, int> quotient_range(const GameConfig& config, int divisor);
inline bool has_quotients(const GameConfig& config, int divisor) {
  const auto range = quotient_range(config, divisor);
  return range.first <= range.second;
}

GameConfig config_from_json(const nlohmann::json& json);
nlohmann::json to_json(const GameConfig& config);

// Reads a JSON config file. A missing or malformed file yields the defaults;
// the result is always sanitized and every correction is logged.
GameConfig load_config(const std::filesystem::path& path);

} // namespace cookie

#pragma once

#include <cstddef>
#include <string>
#include <type_traits>
#include <variant>

namespace cookie {

// ========== Question ==========
struct QuestionGenerated {
  int dividend = 0;
  int divisor = 0;
  int quotient = 0;
};

// ========== Distribution ==========
struct CookieDropped {
  int monster_id = 0;
};

struct CookiePileUpdated {
  int remaining_cookies = 0;
  int total_cookies = 0;
};

struct DistributionRoundCompleted {
  int round_number = 0;
  int remaining_cookies = 0;
};

struct RemainderError {
  int remaining_cookies = 0;
  int divisor = 0;
};

// ========== Answer ==========
struct AnswerSubmitted {
  bool is_correct = false;
  int submitted_answer = -1;
  int correct_answer = 0;
  double time_taken = 0.0;
};

// ========== Score ==========
struct ScoreUpdated {
  int new_score = 0;
  int total_questions = 0;
  int correct_answers = 0;
  double multiplier = 1.0;
};

struct RoundScoreAdded {
  int round_score = 0;
  int total_score = 0;
};

// ========== Lives / Timer ==========
struct LivesUpdated {
  int remaining_lives = 0;
};

struct LivesDepleted {};

struct TimerUpdated {
  double remaining_time = 0.0;
};

struct TimerExpired {};

// ========== Session ==========
struct GamePaused {};
struct GameResumed {};

struct GameOver {
  int final_score = 0;
  double accuracy = 0.0;
};

struct ScreenChanged {
  std::string screen_name;
};

/**
 * Closed set of event kinds carried by the EventBus. The variant index is the
 * dispatch key, so appending a kind never disturbs existing subscriptions.
 */
using Event = std::variant<QuestionGenerated,
                           CookieDropped,
                           CookiePileUpdated,
                           DistributionRoundCompleted,
                           RemainderError,
                           AnswerSubmitted,
                           ScoreUpdated,
                           RoundScoreAdded,
                           LivesUpdated,
                           LivesDepleted,
                           TimerUpdated,
                           TimerExpired,
                           GamePaused,
                           GameResumed,
                           GameOver,
                           ScreenChanged>;

constexpr std::size_t kEventKindCount = std::variant_size_v<Event>;

namespace detail {

template <typename E, typename Variant>
struct event_index;

template <typename E, typename... Ts>
struct event_index<E, std::variant<Ts...>> {
  static constexpr std::size_t compute() {
    constexpr bool matches[] = {std::is_same_v<E, Ts>...};
    for (std::size_t i = 0; i < sizeof...(Ts); ++i) {
      if (matches[i]) {
        return i;
      }
    }
    return sizeof...(Ts);
  }
  static constexpr std::size_t value = compute();
};

} // namespace detail

template <typename E>
constexpr std::size_t event_kind() {
  constexpr std::size_t index = detail::event_index<E, Event>::value;
  static_assert(index < kEventKindCount, "type is not a cookie::Event alternative");
  return index;
}

const char* event_name(std::size_t kind);

inline const char* event_name(const Event& event) {
  return event_name(event.index());
}

} // namespace cookie

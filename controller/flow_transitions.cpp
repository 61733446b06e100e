#include "cookie/flow_state.hpp"

#include "../scoring/scoring.hpp"

#include <algorithm>
#include <iterator>
#include <optional>

namespace cookie::flow {
namespace {

std::optional<State> next_state(const State& state, const Input& input) {
  if (std::holds_alternative<Loading>(state)) {
    if (std::holds_alternative<LoadingFinished>(input)) {
      return MainMenu{};
    }
  } else if (std::holds_alternative<MainMenu>(state)) {
    if (std::holds_alternative<PracticeChosen>(input)) {
      return Gameplay{true};
    }
    if (std::holds_alternative<TestChosen>(input)) {
      return QuestionSubmission{};
    }
  } else if (std::holds_alternative<QuestionSubmission>(state)) {
    if (std::holds_alternative<QuestionsSubmitted>(input)) {
      return Gameplay{false};
    }
    if (std::holds_alternative<BackToMenu>(input)) {
      return MainMenu{};
    }
  } else if (const auto* gameplay = std::get_if<Gameplay>(&state)) {
    if (const auto* ended = std::get_if<SessionEnded>(&input)) {
      const std::string grade = scoring::grade_for(ended->accuracy);
      if (gameplay->practice) {
        return PracticeComplete{ended->final_score, ended->accuracy, grade};
      }
      return GameOver{ended->final_score, ended->accuracy, grade,
                      std::max(ended->high_score, ended->final_score),
                      ended->final_score > ended->high_score};
    }
  } else if (std::holds_alternative<GameOver>(state)) {
    if (std::holds_alternative<PlayAgain>(input)) {
      return QuestionSubmission{};
    }
    if (std::holds_alternative<MainMenuChosen>(input)) {
      return MainMenu{};
    }
  } else if (std::holds_alternative<PracticeComplete>(state)) {
    if (std::holds_alternative<PlayAgain>(input)) {
      return Gameplay{true};
    }
    if (std::holds_alternative<MainMenuChosen>(input)) {
      return MainMenu{};
    }
  }
  return std::nullopt;
}

} // namespace

const char* state_name(const State& state) {
  static const char* const names[] = {"Loading",  "MainMenu", "QuestionSubmission",
                                      "Gameplay", "GameOver", "PracticeComplete"};
  static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<State>);
  return names[state.index()];
}

const char* input_name(const Input& input) {
  static const char* const names[] = {"LoadingFinished",    "PracticeChosen", "TestChosen",
                                      "QuestionsSubmitted", "BackToMenu",     "SessionEnded",
                                      "PlayAgain",          "MainMenuChosen"};
  static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<Input>);
  return names[input.index()];
}

std::vector<Effect> enter_effects(const State& state) {
  std::vector<Effect> effects;
  if (std::holds_alternative<Loading>(state)) {
    effects.emplace_back(ShowScreen{"LoadingScreen"});
  } else if (std::holds_alternative<MainMenu>(state)) {
    effects.emplace_back(ShowScreen{"MainMenuScreen"});
    effects.emplace_back(PlayMusic{"MenuMusic"});
  } else if (std::holds_alternative<QuestionSubmission>(state)) {
    effects.emplace_back(ClearSubmittedQuestions{});
    effects.emplace_back(ShowScreen{"QuestionSubmissionScreen"});
    effects.emplace_back(PlayMusic{"MenuMusic"});
  } else if (const auto* gameplay = std::get_if<Gameplay>(&state)) {
    if (gameplay->practice) {
      effects.emplace_back(ClearSubmittedQuestions{});
    }
    effects.emplace_back(ShowScreen{"GameplayScreen"});
    effects.emplace_back(PlayMusic{"GameplayMusic"});
    effects.emplace_back(StartGameplay{gameplay->practice});
  } else if (const auto* over = std::get_if<GameOver>(&state)) {
    effects.emplace_back(SaveHighScore{over->final_score});
    effects.emplace_back(ShowScreen{"GameOverScreen"});
    effects.emplace_back(ShowResults{ResultsView{over->final_score, over->accuracy, over->grade,
                                                 over->high_score, over->new_high_score, false}});
    effects.emplace_back(PlaySfx{over->accuracy >= kVictoryAccuracy ? "Victory" : "GameOver"});
  } else if (const auto* done = std::get_if<PracticeComplete>(&state)) {
    effects.emplace_back(ShowScreen{"PracticeCompleteScreen"});
    effects.emplace_back(
        ShowResults{ResultsView{done->final_score, done->accuracy, done->grade, 0, false, true}});
  }
  return effects;
}

std::vector<Effect> exit_effects(const State& state) {
  std::vector<Effect> effects;
  if (std::holds_alternative<Loading>(state)) {
    effects.emplace_back(HideScreen{"LoadingScreen"});
  } else if (std::holds_alternative<MainMenu>(state)) {
    effects.emplace_back(HideScreen{"MainMenuScreen"});
    effects.emplace_back(StopMusic{});
  } else if (std::holds_alternative<QuestionSubmission>(state)) {
    effects.emplace_back(HideScreen{"QuestionSubmissionScreen"});
  } else if (const auto* gameplay = std::get_if<Gameplay>(&state)) {
    effects.emplace_back(StopGameplay{});
    if (!gameplay->practice) {
      effects.emplace_back(ClearSubmittedQuestions{});
    }
    effects.emplace_back(HideScreen{"GameplayScreen"});
    effects.emplace_back(StopMusic{});
  } else if (std::holds_alternative<GameOver>(state)) {
    effects.emplace_back(HideScreen{"GameOverScreen"});
  } else if (std::holds_alternative<PracticeComplete>(state)) {
    effects.emplace_back(HideScreen{"PracticeCompleteScreen"});
  }
  return effects;
}

Transition transition(const State& state, const Input& input) {
  auto next = next_state(state, input);
  if (!next) {
    return Transition{state, {}, false};
  }
  Transition result{std::move(*next), exit_effects(state), true};
  auto entering = enter_effects(result.next);
  result.effects.insert(result.effects.end(), std::make_move_iterator(entering.begin()),
                        std::make_move_iterator(entering.end()));
  return result;
}

} // namespace cookie::flow

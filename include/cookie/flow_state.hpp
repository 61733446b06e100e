#pragma once

#include "presentation.hpp"

#include <string>
#include <variant>
#include <vector>

namespace cookie::flow {

// ========== States ==========
struct Loading {
  double remaining = 0.0;
};
struct MainMenu {};
struct QuestionSubmission {};
struct Gameplay {
  bool practice = false;
};
struct GameOver {
  int final_score = 0;
  double accuracy = 0.0;
  std::string grade;
  int high_score = 0;
  bool new_high_score = false;
};
struct PracticeComplete {
  int final_score = 0;
  double accuracy = 0.0;
  std::string grade;
};

using State = std::variant<Loading, MainMenu, QuestionSubmission, Gameplay, GameOver,
                           PracticeComplete>;

const char* state_name(const State& state);

// ========== Inputs ==========
struct LoadingFinished {};
struct PracticeChosen {};
struct TestChosen {};
struct QuestionsSubmitted {};
struct BackToMenu {};
struct SessionEnded {
  int final_score = 0;
  double accuracy = 0.0;
  int high_score = 0; // recorded best before this session
};
struct PlayAgain {};
struct MainMenuChosen {};

using Input = std::variant<LoadingFinished, PracticeChosen, TestChosen, QuestionsSubmitted,
                           BackToMenu, SessionEnded, PlayAgain, MainMenuChosen>;

const char* input_name(const Input& input);

// ========== Effects ==========
struct ShowScreen {
  std::string name;
};
struct HideScreen {
  std::string name;
};
struct PlayMusic {
  std::string track;
};
struct StopMusic {};
struct PlaySfx {
  std::string clip;
};
struct StartGameplay {
  bool practice = false;
};
struct StopGameplay {};
struct ClearSubmittedQuestions {};
struct SaveHighScore {
  int score = 0;
};
struct ShowResults {
  ResultsView results;
};

using Effect = std::variant<ShowScreen, HideScreen, PlayMusic, StopMusic, PlaySfx, StartGameplay,
                            StopGameplay, ClearSubmittedQuestions, SaveHighScore, ShowResults>;

struct Transition {
  State next;
  std::vector<Effect> effects; // exit effects of the old state, then enter effects of the new
  bool changed = false;
};

// Accuracy at or above this plays "Victory" on the GameOver screen.
constexpr double kVictoryAccuracy = 0.8;

/**
 * Pure game-flow step. An input the current state does not accept yields
 * {state, {}, false}; nothing else about the world is touched.
 */
Transition transition(const State& state, const Input& input);

std::vector<Effect> enter_effects(const State& state);
std::vector<Effect> exit_effects(const State& state);

} // namespace cookie::flow

#pragma once

#include "config.hpp"
#include "event_bus.hpp"
#include "flow_state.hpp"
#include "high_score_store.hpp"
#include "presentation.hpp"
#include "types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cookie {

class GameplaySession;
class QuestionGenerator;

/**
 * GameFlow: drives the flow::transition table against real collaborators.
 *
 * Every entry point feeds one input, runs the resulting effects (exit effects
 * of the old state first) and then applies any session end that was raised
 * while events were being dispatched. Inputs the current state does not
 * accept are logged and ignored.
 *
 * The bus, the store and the presentation must outlive the GameFlow.
 */
class GameFlow {
public:
  GameFlow(EventBus& bus, GameConfig config, HighScoreStore& high_scores,
           Presentation& presentation);
  ~GameFlow();

  GameFlow(const GameFlow&) = delete;
  GameFlow& operator=(const GameFlow&) = delete;

  // Menu
  bool on_practice_mode();
  bool on_test_mode();
  // Queues the valid requests and starts a test session. Returns how many were
  // accepted, or std::nullopt when not on the question submission screen.
  std::optional<std::size_t> on_questions_submitted(const std::vector<QuestionRequest>& requests);
  bool on_back_to_menu();
  bool on_play_again();
  bool on_main_menu();

  // Gameplay; no-ops outside a running session.
  void drop_cookie(int monster_id);
  bool submit_answer();
  void pause();
  void resume();

  // One frame: loading countdown, then the session's timers and tasks.
  void tick(double dt);

  const flow::State& state() const { return state_; }
  const char* state_name() const { return flow::state_name(state_); }
  const GameConfig& config() const { return config_; }
  const GameplaySession* session() const { return session_.get(); }
  QuestionGenerator& questions() { return *generator_; }

  nlohmann::json debug_state() const;

private:
  bool apply(const flow::Input& input);
  void run(const flow::Effect& effect);
  void start_gameplay(bool practice);
  void stop_gameplay();
  void process_pending();

  EventBus& bus_;
  GameConfig config_;
  HighScoreStore& high_scores_;
  Presentation& presentation_;
  std::unique_ptr<QuestionGenerator> generator_;

  std::unique_ptr<GameplaySession> session_;
  ScopedSubscription game_over_sub_;
  ScopedSubscription answer_sub_;
  std::optional<GameOver> pending_end_;

  flow::State state_;
  bool entered_ = false;
};

} // namespace cookie

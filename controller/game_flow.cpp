#include "cookie/game_flow.hpp"

#include "../gameplay/gameplay_session.hpp"
#include "../gameplay/question_generator.hpp"
#include "../src/json_bridge.hpp"
#include "cookie/logging.hpp"

#include <stdexcept>
#include <type_traits>
#include <utility>

namespace cookie {

GameFlow::GameFlow(EventBus& bus, GameConfig config, HighScoreStore& high_scores,
                   Presentation& presentation)
    : bus_(bus),
      config_(std::move(config)),
      high_scores_(high_scores),
      presentation_(presentation),
      generator_(std::make_unique<QuestionGenerator>(bus, config_.seed)) {
  for (const auto& note : config_.sanitize()) {
    logging::get()->warn("Config corrected: {}", note);
  }

  if (config_.loading_duration > 0.0) {
    state_ = flow::Loading{config_.loading_duration};
  } else {
    state_ = flow::MainMenu{};
  }
  for (const auto& effect : flow::enter_effects(state_)) {
    run(effect);
  }
  entered_ = true;
  logging::get()->info("GameFlow started in {}", state_name());
}

GameFlow::~GameFlow() {
  stop_gameplay();
}

bool GameFlow::apply(const flow::Input& input) {
  if (!entered_) {
    throw std::logic_error(std::string("GameFlow: cannot exit ") + state_name() +
                           " before it was entered");
  }
  auto result = flow::transition(state_, input);
  if (!result.changed) {
    logging::get()->warn("Input {} ignored in state {}", flow::input_name(input), state_name());
    return false;
  }

  logging::get()->info("GameFlow: {} -> {} ({})", state_name(), flow::state_name(result.next),
                       flow::input_name(input));
  entered_ = false;
  state_ = std::move(result.next);
  for (const auto& effect : result.effects) {
    run(effect);
  }
  entered_ = true;
  return true;
}

void GameFlow::run(const flow::Effect& effect) {
  std::visit(
      [this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, flow::ShowScreen>) {
          presentation_.show_screen(e.name);
          bus_.publish(ScreenChanged{e.name});
        } else if constexpr (std::is_same_v<T, flow::HideScreen>) {
          presentation_.hide_screen(e.name);
        } else if constexpr (std::is_same_v<T, flow::PlayMusic>) {
          presentation_.play_music(e.track);
        } else if constexpr (std::is_same_v<T, flow::StopMusic>) {
          presentation_.stop_music();
        } else if constexpr (std::is_same_v<T, flow::PlaySfx>) {
          presentation_.play_sfx(e.clip);
        } else if constexpr (std::is_same_v<T, flow::StartGameplay>) {
          start_gameplay(e.practice);
        } else if constexpr (std::is_same_v<T, flow::StopGameplay>) {
          stop_gameplay();
        } else if constexpr (std::is_same_v<T, flow::ClearSubmittedQuestions>) {
          generator_->clear_submitted();
        } else if constexpr (std::is_same_v<T, flow::SaveHighScore>) {
          try {
            update_high_score(high_scores_, e.score);
          } catch (const std::runtime_error& ex) {
            logging::get()->error("High score not saved: {}", ex.what());
          }
        } else if constexpr (std::is_same_v<T, flow::ShowResults>) {
          presentation_.show_results(e.results);
        }
      },
      effect);
}

void GameFlow::start_gameplay(bool practice) {
  // Never two sessions on the bus at once.
  stop_gameplay();

  game_over_sub_ = scoped_subscribe<GameOver>(bus_, [this](const GameOver& event) {
    if (!pending_end_) {
      pending_end_ = event;
    }
  });
  answer_sub_ = scoped_subscribe<AnswerSubmitted>(bus_, [this](const AnswerSubmitted& event) {
    presentation_.play_sfx(event.is_correct ? "CorrectAnswer" : "WrongAnswer");
  });

  session_ = std::make_unique<GameplaySession>(bus_, config_, *generator_, practice);
  session_->start();
}

void GameFlow::stop_gameplay() {
  game_over_sub_.reset();
  answer_sub_.reset();
  session_.reset();
  pending_end_.reset();
}

void GameFlow::process_pending() {
  while (pending_end_) {
    const GameOver ended = *pending_end_;
    pending_end_.reset();
    if (!std::holds_alternative<flow::Gameplay>(state_)) {
      logging::get()->debug("Session end ignored outside gameplay");
      continue;
    }
    const int best = high_scores_.get(kHighScoreKey, 0);
    apply(flow::SessionEnded{ended.final_score, ended.accuracy, best});
  }
}

bool GameFlow::on_practice_mode() {
  const bool changed = apply(flow::PracticeChosen{});
  process_pending();
  return changed;
}

bool GameFlow::on_test_mode() {
  return apply(flow::TestChosen{});
}

std::optional<std::size_t> GameFlow::on_questions_submitted(
    const std::vector<QuestionRequest>& requests) {
  if (!std::holds_alternative<flow::QuestionSubmission>(state_)) {
    logging::get()->warn("Questions submitted in state {}, ignored", state_name());
    return std::nullopt;
  }
  const std::size_t accepted = generator_->submit_questions(requests, config_);
  if (accepted == 0) {
    logging::get()->warn("No valid questions submitted, the test will use random questions");
  }
  apply(flow::QuestionsSubmitted{});
  process_pending();
  return accepted;
}

bool GameFlow::on_back_to_menu() {
  return apply(flow::BackToMenu{});
}

bool GameFlow::on_play_again() {
  const bool changed = apply(flow::PlayAgain{});
  process_pending();
  return changed;
}

bool GameFlow::on_main_menu() {
  return apply(flow::MainMenuChosen{});
}

void GameFlow::drop_cookie(int monster_id) {
  if (!session_ || session_->ended() || session_->paused()) {
    logging::get()->debug("Cookie drop on monster {} ignored: no running session", monster_id);
    return;
  }
  bus_.publish(CookieDropped{monster_id});
  process_pending();
}

bool GameFlow::submit_answer() {
  if (!session_) {
    return false;
  }
  const bool judged = session_->submit();
  process_pending();
  return judged;
}

void GameFlow::pause() {
  if (session_) {
    session_->pause();
  }
}

void GameFlow::resume() {
  if (session_) {
    session_->resume();
  }
}

void GameFlow::tick(double dt) {
  if (dt < 0.0) {
    dt = 0.0;
  }
  if (auto* loading = std::get_if<flow::Loading>(&state_)) {
    loading->remaining -= dt;
    if (loading->remaining <= 0.0) {
      apply(flow::LoadingFinished{});
    }
    return;
  }
  if (session_) {
    session_->tick(dt);
  }
  process_pending();
}

nlohmann::json GameFlow::debug_state() const {
  nlohmann::json info = nlohmann::json::object();
  info["state"] = bridge::to_json(state_);
  info["high_score"] = high_scores_.get(kHighScoreKey, 0);
  nlohmann::json submitted = nlohmann::json::array();
  for (const auto& question : generator_->submitted()) {
    submitted.push_back(bridge::to_json(question));
  }
  info["submitted_questions"] = std::move(submitted);
  info["repeats_accepted"] = generator_->repeats_accepted();
  info["session"] = session_ ? session_->debug_state() : nlohmann::json(nullptr);
  return info;
}

} // namespace cookie

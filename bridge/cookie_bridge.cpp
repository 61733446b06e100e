#include "cookie_bridge.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "../include/cookie/config.hpp"
#include "../include/cookie/event_bus.hpp"
#include "../include/cookie/game_flow.hpp"
#include "../include/cookie/high_score_store.hpp"
#include "../include/cookie/logging.hpp"
#include "../src/json_bridge.hpp"

namespace {

// Presentation requests are queued for the host next to the bus events.
class QueuedPresentation : public cookie::Presentation {
public:
  explicit QueuedPresentation(nlohmann::json& commands) : commands_(commands) {}

  void show_screen(const std::string& name) override { push("ShowScreen", "name", name); }
  void hide_screen(const std::string& name) override { push("HideScreen", "name", name); }
  void play_music(const std::string& track) override { push("PlayMusic", "track", track); }
  void stop_music() override {
    nlohmann::json command = nlohmann::json::object();
    command["type"] = "StopMusic";
    commands_.push_back(std::move(command));
  }
  void play_sfx(const std::string& clip) override { push("PlaySfx", "clip", clip); }
  void show_results(const cookie::ResultsView& results) override {
    nlohmann::json command = nlohmann::json::object();
    command["type"] = "ShowResults";
    command["results"] = cookie::bridge::to_json(results);
    commands_.push_back(std::move(command));
  }

private:
  void push(const char* type, const char* key, const std::string& value) {
    nlohmann::json command = nlohmann::json::object();
    command["type"] = type;
    command[key] = value;
    commands_.push_back(std::move(command));
  }

  nlohmann::json& commands_;
};

} // namespace

struct cookie_game {
  std::mutex mutex;
  cookie::EventBus bus;
  nlohmann::json events = nlohmann::json::array();
  nlohmann::json commands = nlohmann::json::array();
  std::vector<cookie::ScopedSubscription> subscriptions;
  std::unique_ptr<cookie::HighScoreStore> store;
  std::unique_ptr<QueuedPresentation> presentation;
  std::unique_ptr<cookie::GameFlow> flow;
};

namespace {

template <typename E>
void record_event(cookie_game& game, const E& event) {
  auto json = cookie::bridge::to_json(cookie::Event{event});
  // The clock reports every tick; only its latest value matters to the host.
  if constexpr (std::is_same_v<E, cookie::TimerUpdated>) {
    if (!game.events.empty() && game.events.back()["type"] == json["type"]) {
      game.events.back() = std::move(json);
      return;
    }
  }
  game.events.push_back(std::move(json));
}

template <std::size_t... I>
void record_all_events(cookie_game& game, std::index_sequence<I...>) {
  (game.subscriptions.push_back(
       cookie::scoped_subscribe<std::variant_alternative_t<I, cookie::Event>>(
           game.bus, [&game](const auto& event) { record_event(game, event); })),
   ...);
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["message"] = message;
  return payload;
}

// Runs `body` under the handle's lock; exceptions become error envelopes.
template <typename Body>
char* guarded(cookie_game* game, Body&& body) {
  if (game == nullptr) {
    return copy_json(error_envelope("Null game handle"));
  }
  try {
    std::scoped_lock guard(game->mutex);
    nlohmann::json payload = ok_envelope();
    body(*game, payload);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    cookie::logging::get()->error("Bridge call failed: {}", ex.what());
    return copy_json(error_envelope(ex.what()));
  }
}

void report_transition(const cookie_game& game, bool changed, nlohmann::json& payload) {
  payload["changed"] = changed;
  payload["state"] = game.flow->state_name();
}

} // namespace

extern "C" {

cookie_game* cookie_create(const char* config_json, const char* high_score_path) {
  try {
    cookie::GameConfig config;
    if (config_json != nullptr && config_json[0] != '\0') {
      config = cookie::config_from_json(nlohmann::json::parse(config_json));
    }
    cookie::logging::init_logging(config.log_level);

    auto game = std::make_unique<cookie_game>();
    record_all_events(*game, std::make_index_sequence<cookie::kEventKindCount>{});

    const std::string path = high_score_path != nullptr ? std::string(high_score_path)
                                                        : config.high_score_path;
    if (path.empty()) {
      game->store = std::make_unique<cookie::InMemoryHighScoreStore>();
    } else {
      game->store = std::make_unique<cookie::JsonFileHighScoreStore>(path);
    }
    game->presentation = std::make_unique<QueuedPresentation>(game->commands);
    game->flow = std::make_unique<cookie::GameFlow>(game->bus, std::move(config), *game->store,
                                                    *game->presentation);
    return game.release();
  } catch (const std::exception& ex) {
    cookie::logging::get()->error("cookie_create failed: {}", ex.what());
    return nullptr;
  }
}

void cookie_destroy(cookie_game* game) {
  delete game;
}

char* cookie_practice_mode(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    report_transition(g, g.flow->on_practice_mode(), payload);
  });
}

char* cookie_test_mode(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    report_transition(g, g.flow->on_test_mode(), payload);
  });
}

char* cookie_submit_questions(cookie_game* game, const char* questions_json) {
  return guarded(game, [questions_json](cookie_game& g, nlohmann::json& payload) {
    if (questions_json == nullptr) {
      throw std::invalid_argument("Missing questions json");
    }
    const auto requests =
        cookie::bridge::question_requests_from_json(nlohmann::json::parse(questions_json));
    const auto accepted = g.flow->on_questions_submitted(requests);
    if (!accepted) {
      throw std::logic_error(std::string("Questions cannot be submitted in state ") +
                             g.flow->state_name());
    }
    payload["accepted"] = *accepted;
    payload["state"] = g.flow->state_name();
  });
}

char* cookie_back_to_menu(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    report_transition(g, g.flow->on_back_to_menu(), payload);
  });
}

char* cookie_play_again(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    report_transition(g, g.flow->on_play_again(), payload);
  });
}

char* cookie_main_menu(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    report_transition(g, g.flow->on_main_menu(), payload);
  });
}

char* cookie_drop_cookie(cookie_game* game, int monster_id) {
  return guarded(game, [monster_id](cookie_game& g, nlohmann::json&) {
    g.flow->drop_cookie(monster_id);
  });
}

char* cookie_submit_answer(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    payload["judged"] = g.flow->submit_answer();
  });
}

char* cookie_tick(cookie_game* game, double dt) {
  return guarded(game, [dt](cookie_game& g, nlohmann::json& payload) {
    g.flow->tick(dt);
    payload["state"] = g.flow->state_name();
  });
}

char* cookie_pause(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json&) { g.flow->pause(); });
}

char* cookie_resume(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json&) { g.flow->resume(); });
}

char* cookie_poll_events(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    payload["events"] = std::exchange(g.events, nlohmann::json::array());
    payload["commands"] = std::exchange(g.commands, nlohmann::json::array());
  });
}

char* cookie_state(cookie_game* game) {
  return guarded(game, [](cookie_game& g, nlohmann::json& payload) {
    payload["state"] = g.flow->debug_state();
    payload["config"] = cookie::to_json(g.flow->config());
  });
}

void cookie_free_string(char* ptr) {
  if (ptr != nullptr) {
    std::free(ptr);
  }
}

} // extern "C"

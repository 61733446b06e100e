#include "../include/cookie/config.hpp"
#include "../include/cookie/event_bus.hpp"
#include "../include/cookie/events.hpp"
#include "../include/cookie/high_score_store.hpp"
#include "../include/cookie/logging.hpp"
#include "../include/cookie/task_scheduler.hpp"
#include "../include/cookie/types.hpp"
#include "gameplay/distribution_validator.hpp"
#include "gameplay/lives_engine.hpp"
#include "gameplay/question_generator.hpp"
#include "gameplay/timer_engine.hpp"
#include "scoring/scoring.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

template <typename E>
struct Recorder {
  std::vector<E> events;
  cookie::ScopedSubscription subscription;

  explicit Recorder(cookie::EventBus& bus)
      : subscription(cookie::scoped_subscribe<E>(bus, [this](const E& e) { events.push_back(e); })) {}
};

bool near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

std::filesystem::path temp_file(const std::string& name) {
  auto path = std::filesystem::temp_directory_path() / ("cookie_test_" + name);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return path;
}

void test_event_bus(TestSuite& suite) {
  using namespace cookie;
  {
    EventBus bus;
    std::vector<int> order;
    bus.subscribe<CookieDropped>([&](const CookieDropped&) { order.push_back(1); });
    const auto second = bus.subscribe<CookieDropped>([&](const CookieDropped&) { order.push_back(2); });
    bus.subscribe<CookieDropped>([&](const CookieDropped&) { order.push_back(3); });
    bus.publish(CookieDropped{0});
    suite.require(order == std::vector<int>({1, 2, 3}), "handlers should run in registration order");

    suite.require(bus.unsubscribe(second), "unsubscribe should report a known id");
    suite.require(!bus.unsubscribe(second), "second unsubscribe should report an unknown id");
    order.clear();
    bus.publish(CookieDropped{0});
    suite.require(order == std::vector<int>({1, 3}), "unsubscribed handler must not run");
    suite.require(bus.subscriber_count<CookieDropped>() == 2, "two CookieDropped handlers remain");
    suite.require(bus.subscriber_count<TimerExpired>() == 0, "other kinds are unaffected");
  }
  {
    EventBus bus;
    bool later_ran = false;
    bus.subscribe<TimerExpired>([](const TimerExpired&) { throw std::runtime_error("boom"); });
    bus.subscribe<TimerExpired>([&](const TimerExpired&) { later_ran = true; });
    bus.publish(TimerExpired{});
    suite.require(later_ran, "a throwing handler must not stop the remaining handlers");
  }
  {
    EventBus bus;
    bool later_ran = false;
    bool escaped = false;
    bus.subscribe<TimerExpired>([](const TimerExpired&) { throw 42; });
    bus.subscribe<TimerExpired>([&](const TimerExpired&) { later_ran = true; });
    try {
      bus.publish(TimerExpired{});
    } catch (int) {
      escaped = true;
    }
    suite.require(!escaped && later_ran,
                  "a handler throwing a non-exception value is isolated like any other");
  }
  {
    EventBus bus;
    std::vector<std::string> trace;
    bus.subscribe<QuestionGenerated>([&](const QuestionGenerated&) {
      trace.push_back("question");
      bus.publish(CookieDropped{4});
      trace.push_back("question-done");
    });
    bus.subscribe<CookieDropped>(
        [&](const CookieDropped& e) { trace.push_back("drop " + std::to_string(e.monster_id)); });
    bus.publish(QuestionGenerated{6, 3, 2});
    suite.require(trace == std::vector<std::string>({"question", "drop 4", "question-done"}),
                  "publish from inside a handler should dispatch synchronously");
  }
  {
    EventBus bus;
    int second_calls = 0;
    int added_calls = 0;
    SubscriptionId second = 0;
    bus.subscribe<LivesDepleted>([&](const LivesDepleted&) {
      bus.unsubscribe(second);
      bus.subscribe<LivesDepleted>([&](const LivesDepleted&) { ++added_calls; });
    });
    second = bus.subscribe<LivesDepleted>([&](const LivesDepleted&) { ++second_calls; });
    bus.publish(LivesDepleted{});
    suite.require(second_calls == 0, "handler removed mid-dispatch should be skipped");
    suite.require(added_calls == 0, "handler added mid-dispatch waits for the next publish");
    bus.publish(LivesDepleted{});
    suite.require(added_calls >= 1, "handler added mid-dispatch runs on the next publish");
  }
  {
    EventBus bus;
    int calls = 0;
    {
      auto scoped = scoped_subscribe<GamePaused>(bus, [&](const GamePaused&) { ++calls; });
      bus.publish(GamePaused{});
      suite.require(scoped.active(), "scoped subscription should be active");
    }
    bus.publish(GamePaused{});
    suite.require(calls == 1, "scoped subscription should release on destruction");
    suite.require(bus.subscriber_count<GamePaused>() == 0, "no handler left after scope exit");

    bool threw = false;
    try {
      bus.subscribe<GamePaused>(std::function<void(const GamePaused&)>());
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "subscribing an empty handler should throw invalid_argument");
  }
  suite.require(std::string(event_name(event_kind<GameOver>())) == "GameOver",
                "event_name should match the variant alternative");
}

void test_config(TestSuite& suite) {
  using namespace cookie;
  {
    GameConfig defaults;
    suite.require(defaults.total_questions == 3 && defaults.max_monsters == 5,
                  "default question count and monsters");
    suite.require(defaults.allowed_divisors == std::vector<int>({2, 3, 4, 5}),
                  "default allowed divisors");
    suite.require(defaults.unlimited_time(true) == false, "practice timer limited by default");
    suite.require(!defaults.unlimited_time(false), "test timer is never unlimited");
    auto copy = defaults;
    suite.require(copy.sanitize().empty(), "defaults need no correction");
  }
  {
    auto json = nlohmann::json::parse(
        R"({"totalQuestions": 7, "max_monsters": 4, "feedbackDelay": "slow",
            "allowedDivisors": [2, 4], "practiceModeLives": 0, "seed": 9})");
    auto config = config_from_json(json);
    suite.require(config.total_questions == 7, "camelCase key should be read");
    suite.require(config.max_monsters == 4, "snake_case key should be read");
    suite.require(near(config.feedback_delay, 1.5), "wrongly typed field keeps its default");
    suite.require(config.allowed_divisors == std::vector<int>({2, 4}), "divisor list read");
    suite.require(config.unlimited_lives(true), "practice lives 0 means unlimited");
    suite.require(config.seed == 9, "seed read");

    auto round_trip = config_from_json(to_json(config));
    suite.require(round_trip.total_questions == config.total_questions &&
                      round_trip.allowed_divisors == config.allowed_divisors &&
                      near(round_trip.feedback_delay, config.feedback_delay) &&
                      round_trip.seed == config.seed,
                  "config should survive a JSON round trip");
  }
  {
    auto json = nlohmann::json::parse(
        R"({"totalQuestions": 5000000000, "maxMonsters": 1e12, "testModeLives": -5000000000,
            "pointsPerRound": 7.6})");
    auto config = config_from_json(json);
    suite.require(config.total_questions == 3 && config.max_monsters == 5 &&
                      config.test_mode_lives == 3,
                  "integers outside the int range keep their defaults");
    suite.require(config.points_per_round == 8, "float integer fields are rounded");
  }
  {
    GameConfig config;
    config.total_questions = 0;
    config.test_mode_time_limit = 5.0;
    config.allowed_divisors = {0, 7, 3, 3};
    const auto notes = config.sanitize();
    suite.require(!notes.empty(), "sanitize should report corrections");
    suite.require(config.total_questions == 1, "totalQuestions raised to 1");
    suite.require(near(config.test_mode_time_limit, 10.0), "test time limit raised to 10s");
    suite.require(config.allowed_divisors == std::vector<int>({3}),
                  "out-of-range and duplicate divisors dropped");

    bool threw = false;
    try {
      config.validate();
    } catch (const ConfigurationError&) {
      threw = true;
    }
    suite.require(!threw, "sanitized config validates");

    config.allowed_divisors.clear();
    threw = false;
    try {
      config.validate();
    } catch (const ConfigurationError&) {
      threw = true;
    }
    suite.require(threw, "empty divisor list fails validation");
    config.sanitize();
    suite.require(config.allowed_divisors == std::vector<int>({2, 3, 4, 5}),
                  "empty divisor list resets to defaults");
  }
  {
    GameConfig config;
    config.min_dividend = 30;
    config.max_dividend = 40;
    config.allowed_divisors = {2};
    config.sanitize();
    suite.require(config.min_dividend == 4 && config.max_dividend == 20,
                  "dividend range without any question is reset");
  }
  {
    GameConfig config;
    config.max_monsters = 30;
    config.allowed_divisors = {25};
    config.sanitize();
    suite.require(config.min_dividend == 4 && config.max_dividend == 20,
                  "range reset when divisor 25 admits no question");
    suite.require(config.allowed_divisors == std::vector<int>({2, 3, 4, 5}),
                  "divisors reset when the default range still admits no question");
    suite.require(config.sanitize().empty(), "corrected config is stable");

    EventBus bus;
    QuestionGenerator generator(bus, 3);
    UsedQuestions used;
    bool threw = false;
    try {
      const auto question = generator.generate_random(config, used);
      threw = !question.consistent();
    } catch (const ConfigurationError&) {
      threw = true;
    }
    suite.require(!threw, "sanitized config always yields a question");
  }
  {
    auto missing = load_config(temp_file("missing_config.json"));
    suite.require(missing.total_questions == 3, "missing config file yields defaults");

    const auto path = temp_file("config.json");
    {
      std::ofstream out(path);
      out << R"({"totalQuestions": 4, "maxDividend": 12, "allowedDivisors": [2, 9]})";
    }
    auto loaded = load_config(path);
    suite.require(loaded.total_questions == 4 && loaded.max_dividend == 12,
                  "config file values applied");
    suite.require(loaded.allowed_divisors == std::vector<int>({2}), "loaded config is sanitized");

    {
      std::ofstream out(path, std::ios::trunc);
      out << "{ not json";
    }
    auto broken = load_config(path);
    suite.require(broken.total_questions == 3, "malformed config yields defaults");
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
}

void test_question_generator(TestSuite& suite) {
  using namespace cookie;
  {
    EventBus bus;
    GameConfig config;
    QuestionGenerator generator(bus, 1234);
    UsedQuestions used;
    bool all_valid = true;
    for (int i = 0; i < 1000; ++i) {
      const auto q = generator.generate_random(config, used);
      const bool allowed = std::find(config.allowed_divisors.begin(), config.allowed_divisors.end(),
                                     q.divisor) != config.allowed_divisors.end();
      if (!q.consistent() || q.quotient > kMaxQuotient || q.quotient < 1 || !allowed ||
          q.dividend < config.min_dividend || q.dividend > config.max_dividend) {
        all_valid = false;
      }
    }
    suite.require(all_valid, "every generated question divides evenly within the configured range");
    suite.require(generator.repeats_accepted() > 0,
                  "1000 draws from 19 combinations must fall back to repeats");
  }
  {
    EventBus bus;
    GameConfig config;
    QuestionGenerator a(bus, 77);
    QuestionGenerator b(bus, 77);
    UsedQuestions used_a;
    UsedQuestions used_b;
    bool same = true;
    for (int i = 0; i < 10; ++i) {
      same = same && a.generate_random(config, used_a) == b.generate_random(config, used_b);
    }
    suite.require(same, "equal seeds should give equal question sequences");
  }
  {
    EventBus bus;
    GameConfig config;
    config.min_dividend = 4;
    config.max_dividend = 4;
    config.allowed_divisors = {2};
    QuestionGenerator generator(bus, 5);
    UsedQuestions used;
    const auto first = generator.generate_random(config, used);
    const auto second = generator.generate_random(config, used);
    suite.require(first == Question{4, 2, 2} && second == first,
                  "the only possible question is repeated after exhaustion");
    suite.require(generator.repeats_accepted() == 1, "exhaustion fallback counted once");
    suite.require(used.size() == 1, "used set restarts with the repeated question");
  }
  {
    EventBus bus;
    GameConfig config;
    QuestionGenerator generator(bus, 5);
    UsedQuestions used;
    config.allowed_divisors.clear();
    bool threw = false;
    try {
      generator.generate_random(config, used);
    } catch (const ConfigurationError&) {
      threw = true;
    }
    suite.require(threw, "empty divisor list throws ConfigurationError");

    config.allowed_divisors = {5};
    config.min_dividend = 31;
    config.max_dividend = 40;
    threw = false;
    try {
      generator.generate_random(config, used);
    } catch (const ConfigurationError&) {
      threw = true;
    }
    suite.require(threw, "divisor without legal quotient throws ConfigurationError");
  }
  {
    EventBus bus;
    Recorder<QuestionGenerated> generated(bus);
    GameConfig config;
    QuestionGenerator generator(bus, 3);
    const auto accepted = generator.submit_questions(
        {{6, 3}, {7, 2}, {8, 2}, {4, 9}, {0, 2}, {35, 5}, {-6, -3}}, config);
    suite.require(accepted == 2, "only valid submitted questions are queued");

    UsedQuestions used;
    const auto q1 = generator.next_question(config, used);
    const auto q2 = generator.next_question(config, used);
    suite.require(q1 == Question{6, 3, 2} && q2 == Question{8, 2, 4},
                  "submitted queue is served first, in order");
    suite.require(!generator.has_submitted_queue(), "queue consumed");
    const auto q3 = generator.next_question(config, used);
    suite.require(q3.consistent(), "random generation follows the queue");
    suite.require(generated.events.size() == 3, "every question is announced");
    suite.require(generated.events[0].dividend == 6 && generated.events[0].quotient == 2,
                  "QuestionGenerated carries the question");

    generator.rewind();
    suite.require(generator.has_submitted_queue(), "rewind restarts the queue");
    generator.clear_submitted();
    suite.require(generator.submitted_count() == 0, "clear empties the queue");
  }
}

void test_distribution_validator(TestSuite& suite) {
  using namespace cookie;
  {
    EventBus bus;
    DistributionValidator validator(bus, 5);
    validator.attach();
    validator.attach();
    suite.require(bus.subscriber_count<CookieDropped>() == 1, "attach twice keeps one handler");
    Recorder<AnswerSubmitted> answers(bus);
    Recorder<DistributionRoundCompleted> rounds(bus);
    Recorder<CookiePileUpdated> pile(bus);

    bus.publish(QuestionGenerated{6, 3, 2});
    suite.require(validator.accepting_input(), "new question opens input");
    suite.require(!pile.events.empty() && pile.events.back().remaining_cookies == 6,
                  "pile starts full");
    for (int round = 0; round < 2; ++round) {
      for (int monster = 0; monster < 3; ++monster) {
        bus.publish(CookieDropped{monster});
      }
    }
    suite.require(answers.events.empty(), "no verdict before submit");
    suite.require(rounds.events.size() == 2 && rounds.events.back().round_number == 2,
                  "two distribution rounds completed");
    suite.require(validator.state().cookies_remaining == 0, "all cookies handed out");

    suite.require(validator.on_submit(), "submit judged");
    suite.require(answers.events.size() == 1 && answers.events[0].is_correct,
                  "even distribution is correct");
    suite.require(answers.events[0].submitted_answer == 2 && answers.events[0].correct_answer == 2,
                  "correct answer reports the share");

    suite.require(!validator.on_submit(), "second submit is ignored");
    bus.publish(CookieDropped{0});
    suite.require(answers.events.size() == 1, "no further verdicts after judging");
    suite.require(validator.cookies_for(0) == 2, "drops after judging are ignored");
  }
  {
    EventBus bus;
    DistributionValidator validator(bus, 5);
    validator.attach();
    Recorder<AnswerSubmitted> answers(bus);
    bus.publish(QuestionGenerated{6, 3, 2});
    bus.publish(CookieDropped{0});
    bus.publish(CookieDropped{1});
    bus.publish(CookieDropped{2});
    suite.require(answers.events.empty(), "three monsters are allowed");
    bus.publish(CookieDropped{3});
    suite.require(answers.events.size() == 1 && !answers.events[0].is_correct,
                  "fourth distinct monster fails immediately");
    suite.require(answers.events[0].submitted_answer == -1, "failed answer has no share");
    suite.require(validator.cookies_for(3) == 0, "rejected drop is not counted");
    suite.require(!validator.on_submit(), "submit after early failure is ignored");
    suite.require(answers.events.size() == 1, "early failure is the only verdict");
  }
  {
    EventBus bus;
    DistributionValidator validator(bus, 5);
    validator.attach();
    Recorder<AnswerSubmitted> answers(bus);
    Recorder<RemainderError> remainder(bus);
    bus.publish(QuestionGenerated{4, 2, 2});
    for (int i = 0; i < 4; ++i) {
      bus.publish(CookieDropped{0});
    }
    bus.publish(CookieDropped{0});
    suite.require(remainder.events.size() == 1 && remainder.events[0].remaining_cookies == 0,
                  "dropping from an empty pile raises RemainderError");
    bus.publish(CookieDropped{9});
    suite.require(validator.cookies_for(9) == 0 && answers.events.empty(),
                  "unknown monster id is a no-op");
    validator.on_submit();
    suite.require(answers.events.size() == 1 && !answers.events[0].is_correct,
                  "one monster holding everything is wrong");
  }
  {
    EventBus bus;
    DistributionValidator validator(bus, 5);
    validator.attach();
    Recorder<AnswerSubmitted> answers(bus);
    bus.publish(QuestionGenerated{4, 2, 2});
    bus.publish(CookieDropped{0});
    bus.publish(CookieDropped{0});
    bus.publish(CookieDropped{0});
    bus.publish(CookieDropped{1});
    validator.tick(2.5);
    validator.on_submit();
    suite.require(answers.events.size() == 1 && !answers.events[0].is_correct,
                  "uneven shares are judged wrong on submit");
    suite.require(near(answers.events[0].time_taken, 2.5), "time taken measured from the question");

    bus.publish(QuestionGenerated{3, 1, 3});
    suite.require(validator.accepting_input() && validator.cookies_for(0) == 0,
                  "new question resets the distribution");
    validator.detach();
    bus.publish(CookieDropped{0});
    suite.require(validator.cookies_for(0) == 0, "detached validator ignores drops");
  }
}

void test_scoring(TestSuite& suite) {
  using namespace cookie;
  using namespace cookie::scoring;
  suite.require(near(multiplier_for(1.0), 2.0), "perfect accuracy doubles");
  suite.require(near(multiplier_for(0.81), 1.5), "above 80% gives 1.5");
  suite.require(near(multiplier_for(0.8), 1.0), "exactly 80% gives 1.0");
  suite.require(near(multiplier_for(0.0), 1.0), "zero accuracy gives 1.0");

  suite.require(grade_for(0.95) == "A+", "95% is A+");
  suite.require(grade_for(0.9499) == "A", "just below 95% is A");
  suite.require(grade_for(0.85) == "B+", "85% is B+");
  suite.require(grade_for(0.8) == "B", "80% is B");
  suite.require(grade_for(0.75) == "C+", "75% is C+");
  suite.require(grade_for(0.7) == "C", "70% is C");
  suite.require(grade_for(0.6) == "D", "60% is D");
  suite.require(grade_for(0.5999) == "F", "below 60% is F");

  EventBus bus;
  Recorder<ScoreUpdated> updates(bus);
  Recorder<RoundScoreAdded> rounds(bus);
  ScoreEngine engine(bus);
  suite.require(near(engine.accuracy(), 0.0), "accuracy is zero before any answer");
  suite.require(near(engine.projected_accuracy(true), 1.0), "first correct answer projects 100%");

  const int awarded = engine.add_answer_score(60, engine.projected_accuracy(true));
  suite.require(awarded == 120 && engine.score() == 120, "perfect run doubles the base");
  engine.add_wrong_answer();
  suite.require(engine.score() == 120 && near(engine.accuracy(), 0.5), "wrong answer counts");
  engine.add_round_score(5);
  suite.require(engine.score() == 125, "round points added");
  suite.require(rounds.events.size() == 1 && rounds.events[0].total_score == 125,
                "RoundScoreAdded carries the running total");
  suite.require(updates.events.size() == 3, "every mutation publishes ScoreUpdated");
  suite.require(updates.events.back().new_score == 125 &&
                    updates.events.back().total_questions == 2 &&
                    updates.events.back().correct_answers == 1,
                "ScoreUpdated mirrors the engine");
  engine.reset();
  suite.require(engine.score() == 0 && engine.total_questions() == 0, "reset clears the score");
}

void test_lives_and_timer(TestSuite& suite) {
  using namespace cookie;
  {
    EventBus bus;
    Recorder<LivesUpdated> updates(bus);
    Recorder<LivesDepleted> depleted(bus);
    LivesEngine lives(bus, 3, false);
    lives.start();
    lives.lose_life();
    lives.lose_life();
    suite.require(depleted.events.empty(), "lives remain after two losses");
    lives.lose_life();
    suite.require(updates.events.size() == 4 && updates.events[0].remaining_lives == 3 &&
                      updates.events[1].remaining_lives == 2 &&
                      updates.events[2].remaining_lives == 1 &&
                      updates.events[3].remaining_lives == 0,
                  "lives count down 3, 2, 1, 0");
    suite.require(depleted.events.size() == 1, "third loss publishes LivesDepleted");
    lives.lose_life();
    suite.require(lives.lives() == 0 && depleted.events.size() == 1,
                  "lives clamp at zero and deplete once");
  }
  {
    EventBus bus;
    Recorder<LivesDepleted> depleted(bus);
    LivesEngine lives(bus, 0, true);
    lives.start();
    for (int i = 0; i < 10; ++i) {
      lives.lose_life();
    }
    suite.require(lives.has_lives() && depleted.events.empty(), "unlimited lives never deplete");

    LivesEngine limited(bus, 2, false);
    limited.start();
    limited.pause();
    limited.lose_life();
    suite.require(limited.lives() == 2, "paused lives are not deducted");
    limited.resume();
    limited.lose_life();
    suite.require(limited.lives() == 1, "resumed lives are deducted");
    limited.add_life();
    suite.require(limited.lives() == 2, "add_life grants a life");
  }
  {
    EventBus bus;
    Recorder<TimerExpired> expired(bus);
    Recorder<TimerUpdated> updates(bus);
    TimerEngine timer(bus, 0.0, true);
    timer.start();
    for (int i = 0; i < 100; ++i) {
      timer.tick(1000.0);
    }
    suite.require(!timer.active() && expired.events.empty() && updates.events.empty(),
                  "unlimited timer never runs or expires");
    timer.resume();
    suite.require(!timer.active(), "unlimited timer cannot be resumed");
  }
  {
    EventBus bus;
    Recorder<TimerExpired> expired(bus);
    Recorder<TimerUpdated> updates(bus);
    TimerEngine timer(bus, 2.0, false);
    timer.start();
    timer.tick(0.5);
    suite.require(near(timer.remaining(), 1.5) && updates.events.size() == 1,
                  "tick counts down and publishes TimerUpdated");
    timer.pause();
    timer.tick(1.0);
    suite.require(near(timer.remaining(), 1.5), "paused timer holds");
    timer.resume();
    timer.tick(5.0);
    suite.require(near(timer.remaining(), 0.0) && updates.events.back().remaining_time == 0.0,
                  "timer clamps at zero");
    suite.require(expired.events.size() == 1 && timer.expired(), "timer expires once");
    timer.tick(1.0);
    timer.resume();
    timer.tick(1.0);
    suite.require(expired.events.size() == 1 && !timer.active(), "expired timer stays expired");
    timer.add_time(5.0);
    suite.require(!timer.has_time(), "expired timer ignores added time");
  }
  {
    EventBus bus;
    TimerEngine timer(bus, 1.0, false);
    timer.start();
    timer.add_time(2.0);
    timer.tick(2.5);
    suite.require(timer.has_time() && near(timer.remaining(), 0.5), "add_time extends the clock");
  }
}

void test_task_scheduler(TestSuite& suite) {
  cookie::TaskScheduler scheduler;
  std::vector<std::string> ran;
  scheduler.schedule(1.0, [&] { ran.push_back("late"); });
  scheduler.schedule(0.5, [&] { ran.push_back("early"); });
  scheduler.schedule(0.5, [&] { ran.push_back("early-second"); });
  scheduler.advance(0.6);
  suite.require(ran == std::vector<std::string>({"early", "early-second"}),
                "due tasks run in due order, ties in scheduling order");
  scheduler.advance(0.5);
  suite.require(ran.size() == 3 && ran.back() == "late", "remaining task runs when due");

  bool stale_ran = false;
  scheduler.schedule(0.1, [&] { stale_ran = true; });
  scheduler.cancel_all();
  scheduler.advance(1.0);
  suite.require(!stale_ran && scheduler.pending() == 0, "cancelled task never runs");

  int chained = 0;
  scheduler.schedule(0.0, [&] {
    ++chained;
    scheduler.schedule(0.0, [&] { ++chained; });
  });
  scheduler.advance(0.0);
  suite.require(chained == 1 && scheduler.pending() == 1,
                "task scheduled while running waits for the next advance");
  scheduler.advance(0.0);
  suite.require(chained == 2, "chained task runs on the next advance");

  bool cancelled_peer = false;
  scheduler.schedule(0.1, [&] { scheduler.cancel_all(); });
  scheduler.schedule(0.1, [&] { cancelled_peer = true; });
  scheduler.advance(0.2);
  suite.require(!cancelled_peer, "cancel_all inside a task drops tasks due in the same advance");

  bool threw = false;
  try {
    scheduler.schedule(1.0, cookie::TaskScheduler::Task());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "empty task is rejected");
}

void test_high_score(TestSuite& suite) {
  using namespace cookie;
  {
    InMemoryHighScoreStore store;
    auto first = update_high_score(store, 50);
    suite.require(first.new_record && first.high_score == 50, "first score is a record");
    auto lower = update_high_score(store, 30);
    suite.require(!lower.new_record && lower.high_score == 50, "lower score keeps the record");
    auto equal = update_high_score(store, 50);
    suite.require(!equal.new_record, "equal score is not a new record");
    auto higher = update_high_score(store, 80);
    suite.require(higher.new_record && store.get(kHighScoreKey, 0) == 80, "higher score replaces");
  }
  {
    const auto path = temp_file("highscore.json");
    {
      JsonFileHighScoreStore store(path);
      suite.require(store.get(kHighScoreKey, 7) == 7, "missing file yields the fallback");
      update_high_score(store, 120);
    }
    JsonFileHighScoreStore reopened(path);
    suite.require(reopened.get(kHighScoreKey, 0) == 120, "high score persists across instances");

    {
      std::ofstream out(path, std::ios::trunc);
      out << "corrupt";
    }
    suite.require(reopened.get(kHighScoreKey, 0) == 0, "corrupt file yields the fallback");
    reopened.set(kHighScoreKey, 10);
    suite.require(reopened.get(kHighScoreKey, 0) == 10, "write repairs a corrupt file");
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
}

} // namespace

int main() {
  cookie::logging::init_logging("error");
  TestSuite suite;

  test_event_bus(suite);
  test_config(suite);
  test_question_generator(suite);
  test_distribution_validator(suite);
  test_scoring(suite);
  test_lives_and_timer(suite);
  test_task_scheduler(suite);
  test_high_score(suite);

  if (!suite.ok) {
    std::cerr << "Cookie core tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Cookie core tests passed" << std::endl;
  return 0;
}

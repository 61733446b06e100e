#pragma once

#include "../include/cookie/config.hpp"
#include "../include/cookie/event_bus.hpp"
#include "../include/cookie/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace cookie {

class SeededRng;

/**
 * QuestionGenerator: hands out the operator-submitted queue first (test mode)
 * and falls back to constrained random generation. Every question handed out
 * through next_question() is announced as QuestionGenerated.
 */
class QuestionGenerator {
public:
  static constexpr int kMaxUniqueAttempts = 50;

  QuestionGenerator(EventBus& bus, std::uint64_t seed);
  ~QuestionGenerator();

  // Replaces the queue with the valid entries of `requests`; returns how many
  // were accepted. Invalid entries are logged and skipped.
  std::size_t submit_questions(const std::vector<QuestionRequest>& requests,
                               const GameConfig& config);
  void clear_submitted();
  // Restarts the queue from its first entry.
  void rewind();

  bool has_submitted_queue() const { return cursor_ < queue_.size(); }
  std::size_t submitted_count() const { return queue_.size(); }
  const std::vector<Question>& submitted() const { return queue_; }

  std::optional<Question> next_from_queue();

  // Throws ConfigurationError when no allowed divisor can produce a question.
  Question generate_random(const GameConfig& config, UsedQuestions& used);

  // Queue first, then random. Publishes QuestionGenerated.
  Question next_question(const GameConfig& config, UsedQuestions& used);

  std::size_t repeats_accepted() const { return repeats_accepted_; }

private:
  Question draw(const std::vector<int>& divisors, const GameConfig& config);

  EventBus& bus_;
  std::unique_ptr<SeededRng> rng_;
  std::vector<Question> queue_;
  std::size_t cursor_ = 0;
  std::size_t repeats_accepted_ = 0;
};

} // namespace cookie

#include "question_generator.hpp"

#include "../src/rng.hpp"
#include "cookie/logging.hpp"

#include <algorithm>

namespace cookie {
namespace {

std::vector<int> viable_divisors(const GameConfig& config) {
  std::vector<int> out;
  for (int divisor : config.allowed_divisors) {
    if (divisor >= 1 && has_quotients(config, divisor)) {
      out.push_back(divisor);
    }
  }
  return out;
}

} // namespace

QuestionGenerator::QuestionGenerator(EventBus& bus, std::uint64_t seed)
    : bus_(bus), rng_(std::make_unique<SeededRng>(seed)) {}

QuestionGenerator::~QuestionGenerator() = default;

std::size_t QuestionGenerator::submit_questions(const std::vector<QuestionRequest>& requests,
                                                const GameConfig& config) {
  auto logger = logging::get();
  clear_submitted();
  for (const auto& request : requests) {
    if (request.dividend <= 0 || request.divisor <= 0) {
      logger->warn("Submitted question {} / {} skipped: values must be positive", request.dividend,
                   request.divisor);
      continue;
    }
    if (request.divisor > config.max_monsters) {
      logger->warn("Submitted question {} / {} skipped: only {} monsters available",
                   request.dividend, request.divisor, config.max_monsters);
      continue;
    }
    if (request.dividend % request.divisor != 0) {
      logger->warn("Submitted question {} / {} skipped: not evenly divisible", request.dividend,
                   request.divisor);
      continue;
    }
    const int quotient = request.dividend / request.divisor;
    if (quotient > kMaxQuotient) {
      logger->warn("Submitted question {} / {} skipped: share {} exceeds {}", request.dividend,
                   request.divisor, quotient, kMaxQuotient);
      continue;
    }
    queue_.push_back(Question{request.dividend, request.divisor, quotient});
    logger->debug("Added submitted question {}", to_string(queue_.back()));
  }
  logger->info("Submitted {} of {} questions", queue_.size(), requests.size());
  return queue_.size();
}

void QuestionGenerator::clear_submitted() {
  queue_.clear();
  cursor_ = 0;
}

void QuestionGenerator::rewind() {
  cursor_ = 0;
}

std::optional<Question> QuestionGenerator::next_from_queue() {
  if (!has_submitted_queue()) {
    return std::nullopt;
  }
  return queue_[cursor_++];
}

Question QuestionGenerator::draw(const std::vector<int>& divisors, const GameConfig& config) {
  const int divisor = rng_->pick(divisors);
  const auto range = quotient_range(config, divisor);
  const int quotient = rng_->between(range.first, range.second);
  return Question{quotient * divisor, divisor, quotient};
}

Question QuestionGenerator::generate_random(const GameConfig& config, UsedQuestions& used) {
  if (config.allowed_divisors.empty()) {
    throw ConfigurationError("QuestionGenerator: allowedDivisors is empty");
  }
  const auto divisors = viable_divisors(config);
  if (divisors.empty()) {
    throw ConfigurationError("QuestionGenerator: no allowed divisor fits dividend range [" +
                             std::to_string(config.min_dividend) + "," +
                             std::to_string(config.max_dividend) + "]");
  }

  Question question;
  for (int attempt = 0; attempt < kMaxUniqueAttempts; ++attempt) {
    question = draw(divisors, config);
    if (used.insert({question.dividend, question.divisor}).second) {
      return question;
    }
  }

  // Every combination is spent (or we were unlucky): start a fresh cycle and
  // accept the repeat rather than stall the session.
  logging::get()->warn("Could not generate a unique question after {} attempts; accepting repeat {}",
                       kMaxUniqueAttempts, to_string(question));
  used.clear();
  used.insert({question.dividend, question.divisor});
  ++repeats_accepted_;
  return question;
}

Question QuestionGenerator::next_question(const GameConfig& config, UsedQuestions& used) {
  Question question;
  if (auto submitted = next_from_queue()) {
    question = *submitted;
    logging::get()->info("Using submitted question {}", to_string(question));
  } else {
    question = generate_random(config, used);
    logging::get()->info("Generated random question {}", to_string(question));
  }
  bus_.publish(QuestionGenerated{question.dividend, question.divisor, question.quotient});
  return question;
}

} // namespace cookie

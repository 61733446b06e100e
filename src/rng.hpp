#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace cookie {

/**
 * Xorshift64 stream. A fixed non-zero seed replays the same questions; seed 0
 * picks one from the steady clock.
 */
class SeededRng {
public:
  explicit SeededRng(std::uint64_t seed) : state_(seed != 0 ? seed : clock_seed()) {}

  std::uint64_t next() {
    state_ ^= state_ << 13;
    state_ ^= state_ >> 7;
    state_ ^= state_ << 17;
    return state_;
  }

  // Uniform over [lo, hi].
  int between(int lo, int hi) {
    if (hi < lo) {
      throw std::invalid_argument("SeededRng::between: empty range [" + std::to_string(lo) +
                                  "," + std::to_string(hi) + "]");
    }
    const auto width = static_cast<std::uint64_t>(hi - lo) + 1;
    return lo + static_cast<int>(next() % width);
  }

  template <typename T>
  const T& pick(const std::vector<T>& items) {
    if (items.empty()) {
      throw std::invalid_argument("SeededRng::pick: nothing to pick from");
    }
    return items[static_cast<std::size_t>(next() % items.size())];
  }

private:
  static std::uint64_t clock_seed() {
    const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto seed = static_cast<std::uint64_t>(ticks) ^ 0x2545F4914F6CDD1DULL;
    return seed != 0 ? seed : 0x2545F4914F6CDD1DULL;
  }

  std::uint64_t state_;
};

} // namespace cookie

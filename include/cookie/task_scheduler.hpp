#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace cookie {

/**
 * TaskScheduler: delayed callbacks driven by frame deltas.
 *
 * Each task remembers the generation it was scheduled in. cancel_all() bumps
 * the generation, so a task that comes due after its owner moved on is dropped
 * without running.
 */
class TaskScheduler {
public:
  using Task = std::function<void()>;

  void schedule(double delay, Task task);

  // Advances the clock and runs every due task of the current generation, in
  // due-time order (ties in scheduling order).
  void advance(double dt);

  void cancel_all();

  std::uint64_t generation() const { return generation_; }
  std::size_t pending() const { return tasks_.size(); }
  double now() const { return now_; }

private:
  struct Entry {
    double due = 0.0;
    std::uint64_t sequence = 0;
    std::uint64_t generation = 0;
    Task task;
  };

  std::vector<Entry> tasks_;
  double now_ = 0.0;
  std::uint64_t generation_ = 0;
  std::uint64_t next_sequence_ = 0;
};

} // namespace cookie

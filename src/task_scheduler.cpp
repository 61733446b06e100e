#include "cookie/task_scheduler.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace cookie {

void TaskScheduler::schedule(double delay, Task task) {
  if (!task) {
    throw std::invalid_argument("TaskScheduler::schedule requires a callable task");
  }
  Entry entry;
  entry.due = now_ + (delay > 0.0 ? delay : 0.0);
  entry.sequence = next_sequence_++;
  entry.generation = generation_;
  entry.task = std::move(task);
  tasks_.push_back(std::move(entry));
}

void TaskScheduler::advance(double dt) {
  if (dt > 0.0) {
    now_ += dt;
  }

  // Tasks may schedule or cancel while running, so pull due entries out first.
  std::vector<Entry> due;
  auto split = std::stable_partition(tasks_.begin(), tasks_.end(),
                                     [this](const Entry& e) { return e.due > now_; });
  std::move(split, tasks_.end(), std::back_inserter(due));
  tasks_.erase(split, tasks_.end());

  std::sort(due.begin(), due.end(), [](const Entry& a, const Entry& b) {
    if (a.due != b.due) {
      return a.due < b.due;
    }
    return a.sequence < b.sequence;
  });

  for (auto& entry : due) {
    if (entry.generation != generation_) {
      continue;
    }
    entry.task();
  }
}

void TaskScheduler::cancel_all() {
  ++generation_;
  tasks_.clear();
}

} // namespace cookie

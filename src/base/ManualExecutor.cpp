#include "ManualExecutor.hpp"

namespace jm {
ManualExecutor::ManualExecutor() : currentMs(0), nextSequence(0) {}

void ManualExecutor::post(function<void()> task) {
  tasks.push_back(std::move(task));
}

void ManualExecutor::schedule(const string& key, int64_t delayMs,
                              function<void()> task) {
  Timer timer;
  timer.deadline = currentMs + max<int64_t>(0, delayMs);
  timer.sequence = nextSequence++;
  timer.task = std::move(task);
  timers[key] = std::move(timer);
}

void ManualExecutor::cancel(const string& key) { timers.erase(key); }

void ManualExecutor::cancelAll() { timers.clear(); }

bool ManualExecutor::isScheduled(const string& key) {
  return timers.find(key) != timers.end();
}

int ManualExecutor::runPending() {
  int count = 0;
  while (!tasks.empty()) {
    auto task = std::move(tasks.front());
    tasks.pop_front();
    task();
    count++;
  }
  return count;
}

optional<int64_t> ManualExecutor::nextDeadline() {
  optional<int64_t> earliest;
  for (auto& it : timers) {
    if (!earliest || it.second.deadline < *earliest) {
      earliest = it.second.deadline;
    }
  }
  return earliest;
}

void ManualExecutor::advance(int64_t ms) {
  int64_t target = currentMs + max<int64_t>(0, ms);
  while (true) {
    runPending();
    auto earliest = timers.end();
    for (auto it = timers.begin(); it != timers.end(); ++it) {
      if (it->second.deadline > target) {
        continue;
      }
      if (earliest == timers.end() ||
          it->second.deadline < earliest->second.deadline ||
          (it->second.deadline == earliest->second.deadline &&
           it->second.sequence < earliest->second.sequence)) {
        earliest = it;
      }
    }
    if (earliest == timers.end()) {
      break;
    }
    currentMs = max(currentMs, earliest->second.deadline);
    auto task = std::move(earliest->second.task);
    timers.erase(earliest);
    task();
  }
  currentMs = target;
  runPending();
}

void ManualExecutor::runUntilIdle(int64_t limitMs) {
  int64_t limit = currentMs + limitMs;
  runPending();
  while (true) {
    auto deadline = nextDeadline();
    if (!deadline || *deadline > limit) {
      break;
    }
    advance(*deadline - currentMs);
  }
}
}  // namespace jm

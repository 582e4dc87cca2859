#ifndef __JM_MANUAL_EXECUTOR__
#define __JM_MANUAL_EXECUTOR__

#include "Executor.hpp"

namespace jm {
/**
 * @brief Deterministic executor driven by a virtual clock.
 *
 * Nothing runs until the owner calls `runPending()` or `advance()`.  Used by
 * the unit tests and by the replay tool.
 */
class ManualExecutor : public Executor {
 public:
  ManualExecutor();

  virtual void post(function<void()> task);
  virtual void schedule(const string& key, int64_t delayMs,
                        function<void()> task);
  virtual void cancel(const string& key);
  virtual void cancelAll();
  virtual bool isScheduled(const string& key);
  virtual int64_t nowMs() { return currentMs; }

  /** @brief Runs queued tasks, including ones they post, until none remain. */
  int runPending();

  /**
   * @brief Moves the clock forward by `ms`, firing every timer that comes due
   * in deadline order.
   */
  void advance(int64_t ms);

  /** @brief Advances until no timers remain or `limitMs` elapses. */
  void runUntilIdle(int64_t limitMs = 600000);

  /** @brief Deadline of the earliest pending timer, if any. */
  optional<int64_t> nextDeadline();

 protected:
  struct Timer {
    int64_t deadline;
    uint64_t sequence;
    function<void()> task;
  };

  int64_t currentMs;
  uint64_t nextSequence;
  deque<function<void()>> tasks;
  unordered_map<string, Timer> timers;
};
}  // namespace jm

#endif  // __JM_MANUAL_EXECUTOR__

#ifndef __JM_THREAD_EXECUTOR__
#define __JM_THREAD_EXECUTOR__

#include "Executor.hpp"

namespace jm {
/**
 * @brief Executor backed by one dedicated worker thread.
 */
class ThreadExecutor : public Executor {
 public:
  explicit ThreadExecutor(const string& _threadName = "jm-sync");
  virtual ~ThreadExecutor();

  virtual void post(function<void()> task);
  virtual void schedule(const string& key, int64_t delayMs,
                        function<void()> task);
  virtual void cancel(const string& key);
  virtual void cancelAll();
  virtual bool isScheduled(const string& key);
  virtual int64_t nowMs();

  /** @brief True when called from the worker thread. */
  bool isCurrentThread();

  /**
   * @brief Stops the worker and joins it.  Tasks that have not started are
   * dropped.
   */
  void shutdown();

 protected:
  struct Timer {
    int64_t deadline;
    uint64_t sequence;
    function<void()> task;
  };

  void run();

  string threadName;
  mutex executorMutex;
  condition_variable wakeup;
  deque<function<void()>> tasks;
  unordered_map<string, Timer> timers;
  uint64_t nextSequence;
  bool running;
  std::chrono::steady_clock::time_point epoch;
  std::unique_ptr<std::thread> worker;
};
}  // namespace jm

#endif  // __JM_THREAD_EXECUTOR__

#ifndef __JM_EXECUTOR__
#define __JM_EXECUTOR__

#include "Headers.hpp"

namespace jm {
/**
 * @brief Serialized execution context that owns all mutation of the sync
 * core.
 *
 * Tasks run one at a time in submission order.  Timers are keyed by purpose;
 * scheduling a key that is already pending replaces the pending task instead
 * of stacking a second one.
 */
class Executor {
 public:
  virtual ~Executor() {}

  /** @brief Queues a task to run on the executor. */
  virtual void post(function<void()> task) = 0;

  /**
   * @brief Runs `task` after `delayMs`.  Re-arming an existing key cancels the
   * previous task.
   */
  virtual void schedule(const string& key, int64_t delayMs,
                        function<void()> task) = 0;

  /** @brief Cancels the timer for `key` if one is pending. */
  virtual void cancel(const string& key) = 0;

  /** @brief Cancels every pending timer.  Queued tasks still run. */
  virtual void cancelAll() = 0;

  virtual bool isScheduled(const string& key) = 0;

  /** @brief Monotonic clock in milliseconds used for all timing decisions. */
  virtual int64_t nowMs() = 0;
};
}  // namespace jm

#endif  // __JM_EXECUTOR__

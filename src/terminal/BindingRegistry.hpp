#ifndef __JM_BINDING_REGISTRY__
#define __JM_BINDING_REGISTRY__

#include "Executor.hpp"

namespace jm {
enum class BindingPhase {
  UNBOUND,
  BOUND,
  /** @brief Torn down locally; the remote unbind waits for the grace timer. */
  PENDING_UNBIND,
};

struct BindingState {
  int refCount = 0;
  bool isBound = false;
  BindingPhase phase = BindingPhase::UNBOUND;
};

/**
 * @brief Ref-counted remote binding bookkeeping for terminal sessions.
 *
 * UNBOUND -> BOUND(refCount) on the first attach.  `finalize` moves a session
 * to PENDING_UNBIND and arms a grace timer; attaching again before it fires
 * cancels the timer and returns to BOUND without a new bind.  `detach` only
 * drops the count.
 */
class BindingRegistry {
 public:
  typedef function<void(const string& sessionId)> UnbindSender;

  BindingRegistry(shared_ptr<Executor> _executor, int64_t _graceMs);
  /** @brief Cancels any unbind still waiting out its grace window. */
  ~BindingRegistry();

  /**
   * @brief Adds a reference.
   * @return true when the caller must send a bind for this session.
   */
  bool attach(const string& sessionId);

  /** @brief Drops a reference.  Never unbinds. */
  void detach(const string& sessionId);

  /**
   * @brief Clears the session's bookkeeping and runs `sendUnbind` after the
   * grace window unless the session is attached again first.
   */
  void finalize(const string& sessionId, UnbindSender sendUnbind);

  BindingState getState(const string& sessionId) const;

  /** @brief Sessions currently in BOUND, for rebinding after reconnect. */
  vector<string> boundSessions() const;

  /** @brief Cancels every grace timer and forgets all sessions. */
  void reset();

 protected:
  string timerKey(const string& sessionId) const {
    return "unbind:" + sessionId;
  }

  shared_ptr<Executor> executor;
  int64_t graceMs;
  unordered_map<string, BindingState> states;
};
}  // namespace jm

#endif  // __JM_BINDING_REGISTRY__

#include "BindingRegistry.hpp"

namespace jm {
BindingRegistry::BindingRegistry(shared_ptr<Executor> _executor,
                                 int64_t _graceMs)
    : executor(_executor), graceMs(_graceMs) {}

bool BindingRegistry::attach(const string& sessionId) {
  auto& state = states[sessionId];
  state.refCount++;
  if (state.phase == BindingPhase::PENDING_UNBIND) {
    VLOG(1) << "Re-attached " << sessionId << " inside the unbind grace window";
    executor->cancel(timerKey(sessionId));
    state.phase = BindingPhase::BOUND;
    state.isBound = true;
    return false;
  }
  if (state.refCount == 1 && !state.isBound) {
    state.phase = BindingPhase::BOUND;
    state.isBound = true;
    return true;
  }
  return false;
}

void BindingRegistry::detach(const string& sessionId) {
  auto it = states.find(sessionId);
  if (it == states.end() || it->second.refCount == 0) {
    LOG(WARNING) << "Detach without attach for " << sessionId;
    return;
  }
  it->second.refCount--;
}

void BindingRegistry::finalize(const string& sessionId,
                               UnbindSender sendUnbind) {
  auto it = states.find(sessionId);
  if (it == states.end() || !it->second.isBound) {
    states.erase(sessionId);
    return;
  }
  it->second.refCount = 0;
  it->second.phase = BindingPhase::PENDING_UNBIND;
  VLOG(1) << "Unbinding " << sessionId << " in " << graceMs << "ms";
  executor->schedule(timerKey(sessionId), graceMs,
                     [this, sessionId, sendUnbind]() {
                       auto found = states.find(sessionId);
                       if (found == states.end() ||
                           found->second.phase != BindingPhase::PENDING_UNBIND) {
                         return;
                       }
                       states.erase(found);
                       sendUnbind(sessionId);
                     });
}

BindingState BindingRegistry::getState(const string& sessionId) const {
  auto it = states.find(sessionId);
  if (it == states.end()) {
    return BindingState();
  }
  return it->second;
}

vector<string> BindingRegistry::boundSessions() const {
  vector<string> sessions;
  for (const auto& it : states) {
    if (it.second.phase == BindingPhase::BOUND) {
      sessions.push_back(it.first);
    }
  }
  std::sort(sessions.begin(), sessions.end());
  return sessions;
}

BindingRegistry::~BindingRegistry() { reset(); }

void BindingRegistry::reset() {
  for (const auto& it : states) {
    executor->cancel(timerKey(it.first));
  }
  states.clear();
}
}  // namespace jm

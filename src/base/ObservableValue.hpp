#ifndef __JM_OBSERVABLE_VALUE__
#define __JM_OBSERVABLE_VALUE__

#include "Headers.hpp"

namespace jm {
/**
 * @brief Single-writer value cell that external consumers can watch.
 *
 * Only the owning executor calls `set`.  Readers may call `get` from any
 * thread; listeners run on the writer's thread.
 */
template <typename T>
class ObservableValue {
 public:
  typedef function<void(const T&)> Listener;

  explicit ObservableValue(const T& initial) : value(initial), nextToken(1) {}

  T get() const {
    lock_guard<recursive_mutex> guard(valueMutex);
    return value;
  }

  /**
   * @brief Registers a listener and immediately delivers the current value.
   * @return A token for `unsubscribe`.
   */
  int subscribe(Listener listener) {
    T current;
    int token;
    {
      lock_guard<recursive_mutex> guard(valueMutex);
      token = nextToken++;
      listeners[token] = listener;
      current = value;
    }
    listener(current);
    return token;
  }

  void unsubscribe(int token) {
    lock_guard<recursive_mutex> guard(valueMutex);
    listeners.erase(token);
  }

  void set(const T& newValue) {
    map<int, Listener> toNotify;
    {
      lock_guard<recursive_mutex> guard(valueMutex);
      value = newValue;
      toNotify = listeners;
    }
    for (auto& it : toNotify) {
      it.second(newValue);
    }
  }

  int listenerCount() const {
    lock_guard<recursive_mutex> guard(valueMutex);
    return int(listeners.size());
  }

 protected:
  mutable recursive_mutex valueMutex;
  T value;
  map<int, Listener> listeners;
  int nextToken;
};
}  // namespace jm

#endif  // __JM_OBSERVABLE_VALUE__

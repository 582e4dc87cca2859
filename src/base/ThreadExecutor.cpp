#include "ThreadExecutor.hpp"

namespace jm {
ThreadExecutor::ThreadExecutor(const string& _threadName)
    : threadName(_threadName),
      nextSequence(0),
      running(true),
      epoch(std::chrono::steady_clock::now()) {
  worker.reset(new std::thread(&ThreadExecutor::run, this));
}

ThreadExecutor::~ThreadExecutor() { shutdown(); }

void ThreadExecutor::post(function<void()> task) {
  {
    lock_guard<mutex> guard(executorMutex);
    if (!running) {
      LOG(WARNING) << "Dropping task posted after shutdown";
      return;
    }
    tasks.push_back(std::move(task));
  }
  wakeup.notify_one();
}

void ThreadExecutor::schedule(const string& key, int64_t delayMs,
                              function<void()> task) {
  {
    lock_guard<mutex> guard(executorMutex);
    if (!running) {
      return;
    }
    Timer timer;
    timer.deadline = nowMs() + max<int64_t>(0, delayMs);
    timer.sequence = nextSequence++;
    timer.task = std::move(task);
    timers[key] = std::move(timer);
  }
  wakeup.notify_one();
}

void ThreadExecutor::cancel(const string& key) {
  lock_guard<mutex> guard(executorMutex);
  timers.erase(key);
}

void ThreadExecutor::cancelAll() {
  lock_guard<mutex> guard(executorMutex);
  timers.clear();
}

bool ThreadExecutor::isScheduled(const string& key) {
  lock_guard<mutex> guard(executorMutex);
  return timers.find(key) != timers.end();
}

int64_t ThreadExecutor::nowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - epoch)
      .count();
}

bool ThreadExecutor::isCurrentThread() {
  return worker && std::this_thread::get_id() == worker->get_id();
}

void ThreadExecutor::shutdown() {
  {
    lock_guard<mutex> guard(executorMutex);
    if (!running) {
      return;
    }
    running = false;
    tasks.clear();
    timers.clear();
  }
  wakeup.notify_all();
  if (worker && worker->joinable()) {
    if (isCurrentThread()) {
      worker->detach();
    } else {
      worker->join();
    }
  }
}

void ThreadExecutor::run() {
  el::Helpers::setThreadName(threadName);
  unique_lock<mutex> lock(executorMutex);
  while (running) {
    if (!tasks.empty()) {
      auto task = std::move(tasks.front());
      tasks.pop_front();
      lock.unlock();
      task();
      lock.lock();
      continue;
    }

    auto earliest = timers.end();
    for (auto it = timers.begin(); it != timers.end(); ++it) {
      if (earliest == timers.end() ||
          it->second.deadline < earliest->second.deadline ||
          (it->second.deadline == earliest->second.deadline &&
           it->second.sequence < earliest->second.sequence)) {
        earliest = it;
      }
    }
    if (earliest == timers.end()) {
      wakeup.wait(lock);
      continue;
    }
    int64_t remaining = earliest->second.deadline - nowMs();
    if (remaining > 0) {
      wakeup.wait_for(lock, std::chrono::milliseconds(remaining));
      continue;
    }
    VLOG(3) << "Firing timer " << earliest->first;
    auto task = std::move(earliest->second.task);
    timers.erase(earliest);
    lock.unlock();
    task();
    lock.lock();
  }
}
}  // namespace jm

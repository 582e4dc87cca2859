#include "DerivedStateProjector.hpp"

namespace jm {
int DerivedState::sessionCounter(const string& sessionId,
                                 const string& family) const {
  auto sessionIt = sessionCounters.find(sessionId);
  if (sessionIt == sessionCounters.end()) {
    return 0;
  }
  auto familyIt = sessionIt->second.find(family);
  return familyIt == sessionIt->second.end() ? 0 : familyIt->second;
}

json DerivedState::toJson() const {
  json j;
  j["activeJobsCount"] = activeJobsCount;
  j["badgeCount"] = badgeCount;
  j["jobs"] = json::array();
  for (const auto& job : jobs) {
    j["jobs"].push_back(job->toJson());
  }
  j["sessionCounters"] = json::object();
  for (const auto& session : sessionCounters) {
    for (const auto& family : session.second) {
      j["sessionCounters"][session.first][family.first] = family.second;
    }
  }
  return j;
}

bool operator==(const DerivedState& a, const DerivedState& b) {
  if (a.activeJobsCount != b.activeJobsCount ||
      a.badgeCount != b.badgeCount ||
      a.sessionCounters != b.sessionCounters ||
      a.jobs.size() != b.jobs.size()) {
    return false;
  }
  for (size_t i = 0; i < a.jobs.size(); i++) {
    if (a.jobs[i]->id != b.jobs[i]->id ||
        a.jobs[i]->toJson() != b.jobs[i]->toJson()) {
      return false;
    }
  }
  return true;
}

DerivedStateProjector::DerivedStateProjector(const SyncConfig& _config)
    : config(_config) {}

DerivedState DerivedStateProjector::project(const JobStore& store) const {
  DerivedState state;
  state.jobs = store.all();
  std::sort(state.jobs.begin(), state.jobs.end(),
            &DerivedStateProjector::sortsBefore);
  for (const auto& job : state.jobs) {
    bumpCounters(&state, *job, 1);
  }
  return state;
}

void DerivedStateProjector::applyChange(DerivedState* state,
                                        const JobChange& change) const {
  if (change.before) {
    removeJob(state, change.before);
  }
  if (change.after) {
    addJob(state, change.after);
  }
}

bool DerivedStateProjector::isBadgeCountable(const Job& job) const {
  return job.isActive() && !config.isInternalTaskType(job.taskType);
}

bool DerivedStateProjector::sortsBefore(const JobPtr& a, const JobPtr& b) {
  int64_t aTs = a->timestamp().value_or(std::numeric_limits<int64_t>::min());
  int64_t bTs = b->timestamp().value_or(std::numeric_limits<int64_t>::min());
  if (aTs != bTs) {
    return aTs > bTs;
  }
  return a->id > b->id;
}

void DerivedStateProjector::addJob(DerivedState* state,
                                   const JobPtr& job) const {
  auto position = std::lower_bound(state->jobs.begin(), state->jobs.end(),
                                   job, &DerivedStateProjector::sortsBefore);
  state->jobs.insert(position, job);
  bumpCounters(state, *job, 1);
}

void DerivedStateProjector::removeJob(DerivedState* state,
                                      const JobPtr& job) const {
  auto it = std::find_if(state->jobs.begin(), state->jobs.end(),
                         [&job](const JobPtr& j) { return j->id == job->id; });
  if (it == state->jobs.end()) {
    LOG(WARNING) << "Job " << job->id << " missing from derived list";
    return;
  }
  // Counters follow the copy that was actually projected.
  bumpCounters(state, **it, -1);
  state->jobs.erase(it);
}

void DerivedStateProjector::bumpCounters(DerivedState* state, const Job& job,
                                         int delta) const {
  if (isBadgeCountable(job)) {
    state->activeJobsCount += delta;
    state->badgeCount = state->activeJobsCount;
  }
  if (!job.isActive()) {
    return;
  }
  auto family = config.counterFamilyFor(job.taskType);
  if (!family) {
    return;
  }
  auto& counters = state->sessionCounters[job.sessionId];
  counters[*family] += delta;
  if (counters[*family] <= 0) {
    counters.erase(*family);
    if (counters.empty()) {
      state->sessionCounters.erase(job.sessionId);
    }
  }
}
}  // namespace jm

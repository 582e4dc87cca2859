#include "JobStore.hpp"

namespace jm {
vector<JobChange> JobStore::reduce(const vector<Job>& incoming,
                                   MergeSource source) {
  vector<JobChange> changes;
  unordered_set<string> incomingIds;
  for (const auto& job : incoming) {
    incomingIds.insert(job.id);
    auto it = jobs.find(job.id);
    if (it == jobs.end()) {
      JobPtr inserted(new Job(job));
      jobs[job.id] = inserted;
      changes.push_back(JobChange{nullptr, inserted});
      continue;
    }
    if (!resolveConflict(*(it->second), job, source)) {
      VLOG(2) << "Keeping existing copy of job " << job.id;
      continue;
    }
    JobPtr replaced(new Job(job));
    changes.push_back(JobChange{it->second, replaced});
    it->second = replaced;
  }

  if (source == MergeSource::SNAPSHOT) {
    for (auto it = jobs.begin(); it != jobs.end();) {
      if (incomingIds.find(it->first) == incomingIds.end()) {
        VLOG(2) << "Pruning job " << it->first << " absent from snapshot";
        changes.push_back(JobChange{it->second, nullptr});
        it = jobs.erase(it);
      } else {
        ++it;
      }
    }
  }
  return changes;
}

bool JobStore::resolveConflict(const Job& existing, const Job& incoming,
                               MergeSource source) {
  auto existingTs = existing.timestamp();
  auto incomingTs = incoming.timestamp();
  if (existingTs && incomingTs) {
    if (*existingTs != *incomingTs) {
      return *incomingTs > *existingTs;
    }
    if (existing.isTerminal() && !incoming.isTerminal()) {
      return false;
    }
    return true;
  }
  if (existingTs) {
    return false;
  }
  if (incomingTs) {
    return true;
  }
  return source == MergeSource::SNAPSHOT;
}

optional<JobChange> JobStore::remove(const string& id) {
  auto it = jobs.find(id);
  if (it == jobs.end()) {
    return std::nullopt;
  }
  JobChange change{it->second, nullptr};
  jobs.erase(it);
  return change;
}

JobPtr JobStore::get(const string& id) const {
  auto it = jobs.find(id);
  if (it == jobs.end()) {
    return nullptr;
  }
  return it->second;
}

vector<JobPtr> JobStore::all() const {
  vector<JobPtr> result;
  result.reserve(jobs.size());
  for (const auto& it : jobs) {
    result.push_back(it.second);
  }
  return result;
}
}  // namespace jm

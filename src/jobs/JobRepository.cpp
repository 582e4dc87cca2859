#include "JobRepository.hpp"

namespace jm {
namespace {
const string DERIVED_PUBLISH_TIMER = "derived-publish";
}

JobRepository::JobRepository(shared_ptr<Executor> _executor,
                             const SyncConfig& _config)
    : executor(_executor),
      config(_config),
      projector(_config),
      published(DerivedState()),
      jobsStatus(JobsStatus()) {}

JobRepository::~JobRepository() { executor->cancel(DERIVED_PUBLISH_TIMER); }

void JobRepository::reduceJobs(const vector<Job>& incoming,
                               MergeSource source, bool highFrequency) {
  vector<Job> accepted;
  accepted.reserve(incoming.size());
  for (const auto& job : incoming) {
    if (config.isInternalTaskType(job.taskType)) {
      if (filteredJobIds.insert(job.id).second) {
        VLOG(2) << "Filtering internal job " << job.id << " (" << job.taskType
                << ")";
      }
      continue;
    }
    accepted.push_back(job);
  }
  auto changes = store.reduce(accepted, source);
  if (changes.empty()) {
    return;
  }
  publishChanges(changes, source, highFrequency);
}

void JobRepository::removeJob(const string& id) {
  auto change = store.remove(id);
  if (!change) {
    return;
  }
  publishChanges({*change}, MergeSource::EVENT, false);
}

void JobRepository::publishChanges(const vector<JobChange>& changes,
                                   MergeSource source, bool highFrequency) {
  if (highFrequency) {
    executor->schedule(DERIVED_PUBLISH_TIMER, config.derivedPublishDebounceMs,
                       [this]() { publishFullRecompute(); });
    return;
  }
  if (source == MergeSource::SNAPSHOT || changes.size() > 1 ||
      executor->isScheduled(DERIVED_PUBLISH_TIMER)) {
    // The incremental path only holds when `current` matches the store.
    executor->cancel(DERIVED_PUBLISH_TIMER);
    publishFullRecompute();
    return;
  }
  projector.applyChange(&current, changes.front());
  published.set(current);
}

void JobRepository::publishFullRecompute() {
  current = projector.project(store);
  VLOG(2) << "Publishing derived state: " << current.jobs.size() << " jobs, "
          << current.activeJobsCount << " active";
  published.set(current);
}

void JobRepository::flushDerivedState() {
  if (executor->isScheduled(DERIVED_PUBLISH_TIMER)) {
    executor->cancel(DERIVED_PUBLISH_TIMER);
    publishFullRecompute();
  }
}

void JobRepository::setLoading(bool loading) {
  auto status = jobsStatus.get();
  if (status.isLoading == loading) {
    return;
  }
  status.isLoading = loading;
  jobsStatus.set(status);
}

void JobRepository::setError(const optional<SyncError>& error) {
  auto status = jobsStatus.get();
  if (!status.error && !error) {
    return;
  }
  status.error = error;
  jobsStatus.set(status);
}

void JobRepository::markLoadedOnce() {
  auto status = jobsStatus.get();
  if (status.hasLoadedOnce) {
    return;
  }
  status.hasLoadedOnce = true;
  jobsStatus.set(status);
}

void JobRepository::reset() {
  executor->cancel(DERIVED_PUBLISH_TIMER);
  store.clear();
  filteredJobIds.clear();
  current = DerivedState();
  published.set(current);
  jobsStatus.set(JobsStatus());
}
}  // namespace jm

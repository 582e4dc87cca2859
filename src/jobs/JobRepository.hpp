#ifndef __JM_JOB_REPOSITORY__
#define __JM_JOB_REPOSITORY__

#include "DerivedStateProjector.hpp"
#include "Executor.hpp"
#include "JobStore.hpp"
#include "ObservableValue.hpp"
#include "SyncError.hpp"

namespace jm {
/** @brief Loading and error flags published next to the derived state. */
struct JobsStatus {
  bool isLoading = false;
  optional<SyncError> error;
  bool hasLoadedOnce = false;
};

/**
 * @brief Owns the JobStore and publishes its derived state.
 *
 * Every job entering the store passes the ingestion filter first.  The store
 * is always updated synchronously; only the published projection may lag
 * behind by the debounce window after high-frequency updates.
 */
class JobRepository {
 public:
  JobRepository(shared_ptr<Executor> _executor, const SyncConfig& _config);
  ~JobRepository();

  /**
   * @brief Filters and merges a batch into the store, then publishes.
   * @param highFrequency Coalesce the derived-state recompute instead of
   * publishing right away.
   */
  void reduceJobs(const vector<Job>& incoming, MergeSource source,
                  bool highFrequency = false);

  /** @brief Removes one job and publishes. */
  void removeJob(const string& id);

  /** @brief True when the id was dropped by the ingestion filter. */
  bool wasFiltered(const string& id) const {
    return filteredJobIds.find(id) != filteredJobIds.end();
  }

  JobPtr get(const string& id) const { return store.get(id); }
  bool contains(const string& id) const { return store.contains(id); }
  bool isEmpty() const { return store.empty(); }
  const JobStore& getStore() const { return store; }

  ObservableValue<DerivedState>& derivedState() { return published; }
  ObservableValue<JobsStatus>& status() { return jobsStatus; }

  void setLoading(bool loading);
  void setError(const optional<SyncError>& error);
  void markLoadedOnce();

  /** @brief Publishes any pending debounced projection immediately. */
  void flushDerivedState();

  /** @brief Clears the store, the projection and the status flags. */
  void reset();

 protected:
  void publishChanges(const vector<JobChange>& changes, MergeSource source,
                      bool highFrequency);
  void publishFullRecompute();

  shared_ptr<Executor> executor;
  SyncConfig config;
  JobStore store;
  DerivedStateProjector projector;
  /** @brief Last projection handed to `published`. */
  DerivedState current;
  ObservableValue<DerivedState> published;
  ObservableValue<JobsStatus> jobsStatus;
  unordered_set<string> filteredJobIds;
};
}  // namespace jm

#endif  // __JM_JOB_REPOSITORY__

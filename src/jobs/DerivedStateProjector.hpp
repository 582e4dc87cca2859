#ifndef __JM_DERIVED_STATE_PROJECTOR__
#define __JM_DERIVED_STATE_PROJECTOR__

#include "JobStore.hpp"
#include "SyncConfig.hpp"

namespace jm {
/**
 * @brief UI-facing aggregates computed from the JobStore.
 */
struct DerivedState {
  int activeJobsCount = 0;
  int badgeCount = 0;
  /** @brief Newest first by `updatedAt ?? createdAt`, then id descending. */
  vector<JobPtr> jobs;
  /** @brief sessionId -> counter family -> active job count. */
  map<string, map<string, int>> sessionCounters;

  int sessionCounter(const string& sessionId, const string& family) const;
  json toJson() const;
};

bool operator==(const DerivedState& a, const DerivedState& b);

class DerivedStateProjector {
 public:
  explicit DerivedStateProjector(const SyncConfig& _config);

  /** @brief Full recompute from the store. */
  DerivedState project(const JobStore& store) const;

  /**
   * @brief Applies one job change to `state` in place.  The result matches
   * what `project` would produce for the same store.
   */
  void applyChange(DerivedState* state, const JobChange& change) const;

  /** @brief Active jobs that count toward the badge. */
  bool isBadgeCountable(const Job& job) const;

  /** @brief Sort order of the projected list. */
  static bool sortsBefore(const JobPtr& a, const JobPtr& b);

 protected:
  void addJob(DerivedState* state, const JobPtr& job) const;
  void removeJob(DerivedState* state, const JobPtr& job) const;
  void bumpCounters(DerivedState* state, const Job& job, int delta) const;

  SyncConfig config;
};
}  // namespace jm

#endif  // __JM_DERIVED_STATE_PROJECTOR__

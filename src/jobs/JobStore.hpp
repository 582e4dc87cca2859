#ifndef __JM_JOB_STORE__
#define __JM_JOB_STORE__

#include "Job.hpp"

namespace jm {
typedef shared_ptr<const Job> JobPtr;

/** @brief Provenance of a batch handed to the reducer. */
enum class MergeSource {
  /** @brief Full authoritative listing; absent ids are pruned. */
  SNAPSHOT,
  /** @brief Incremental notification; never deletes. */
  EVENT,
};

/**
 * @brief One entry-level change produced by the reducer.  `before` is null for
 * inserts and `after` is null for removals.
 */
struct JobChange {
  JobPtr before;
  JobPtr after;
};

/**
 * @brief Canonical id -> job map.  All mutation goes through `reduce` or
 * `remove`.
 */
class JobStore {
 public:
  /**
   * @brief Merges `incoming` into the store.
   *
   * Existing entries are resolved with `resolveConflict`.  A SNAPSHOT merge
   * also removes every entry whose id is not in `incoming`.
   * @return The changes actually applied, in application order.
   */
  vector<JobChange> reduce(const vector<Job>& incoming, MergeSource source);

  /**
   * @brief Decides whether `incoming` replaces `existing`.
   *
   * Newer timestamp wins.  On a tie the terminal status wins, and incoming
   * wins if both or neither are terminal.  A timestamp beats no timestamp.
   * With no timestamps at all only a snapshot may overwrite.
   */
  static bool resolveConflict(const Job& existing, const Job& incoming,
                              MergeSource source);

  /** @brief Removes one job.  Returns the removal, if there was one. */
  optional<JobChange> remove(const string& id);

  JobPtr get(const string& id) const;
  bool contains(const string& id) const {
    return jobs.find(id) != jobs.end();
  }
  size_t size() const { return jobs.size(); }
  bool empty() const { return jobs.empty(); }
  vector<JobPtr> all() const;
  void clear() { jobs.clear(); }

 protected:
  unordered_map<string, JobPtr> jobs;
};
}  // namespace jm

#endif  // __JM_JOB_STORE__

#ifndef __JM_EVENT_APPLIER__
#define __JM_EVENT_APPLIER__

#include "JobRepository.hpp"
#include "RemoteChannel.hpp"
#include "RequestCoordinator.hpp"

namespace jm {
/**
 * @brief Turns remote job events into store mutations.
 *
 * Events for unknown jobs trigger one hydration fetch per id; later events for
 * the same id wait for it and are re-applied once it resolves.  Events that
 * lack the data they need fall back to a coalesced resync.  Owned by a
 * shared_ptr; fetch replies hold it weakly.
 */
class EventApplier : public std::enable_shared_from_this<EventApplier> {
 public:
  EventApplier(shared_ptr<JobRepository> _repository,
               shared_ptr<RequestCoordinator> _coordinator);

  /** @brief Applies one event.  Must run on the executor. */
  void apply(const RemoteEvent& event);

  static bool isJobEvent(const string& eventType);

  bool isHydrating(const string& jobId) const {
    return hydrationWaiters.find(jobId) != hydrationWaiters.end();
  }
  bool isRefetchPending(const string& jobId) const {
    return pendingRefetch.find(jobId) != pendingRefetch.end();
  }

  /** @brief Forgets waiters and pending refetches. */
  void reset();

 protected:
  void dispatch(const RemoteEvent& event, bool allowHydration);
  void applyCreated(const RemoteEvent& event, bool allowHydration);
  void applyToExistingJob(const RemoteEvent& event, const Job& existing);
  void applyResponseAppended(const RemoteEvent& event, const Job& existing);
  void applyFinalized(const RemoteEvent& event, const Job& existing);
  void hydrate(const string& jobId, const RemoteEvent& event);
  void refetch(const string& jobId);

  shared_ptr<JobRepository> repository;
  shared_ptr<RequestCoordinator> coordinator;
  unordered_map<string, vector<RemoteEvent>> hydrationWaiters;
  unordered_set<string> pendingRefetch;
  uint64_t generation;
};
}  // namespace jm

#endif  // __JM_EVENT_APPLIER__

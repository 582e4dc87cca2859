#ifndef __JM_REQUEST_COORDINATOR__
#define __JM_REQUEST_COORDINATOR__

#include "JobRepository.hpp"
#include "RemoteChannel.hpp"
#include "RpcCall.hpp"

namespace jm {
/**
 * @brief Session/project pair that scopes list and reconcile requests.
 */
struct JobScope {
  string sessionId;
  string projectDirectory;

  /**
   * @brief Builds a scope, dropping local placeholder session ids that the
   * remote side does not know about.
   */
  static JobScope normalize(const string& sessionId,
                            const string& projectDirectory);

  bool isValid() const {
    return !sessionId.empty() || !projectDirectory.empty();
  }

  bool operator==(const JobScope& other) const {
    return sessionId == other.sessionId &&
           projectDirectory == other.projectDirectory;
  }
  bool operator!=(const JobScope& other) const { return !(*this == other); }
};

struct ListJobsRequest {
  JobScope scope;
  vector<string> statusFilter;
  vector<string> taskTypeFilter;
  int page = 0;
  int pageSize = 50;
  /** @brief Merge the result as a snapshot, pruning absent jobs. */
  bool authoritative = false;
  /** @brief Skip the short de-dup window and ask the remote to skip its
   * cache. */
  bool bypassCache = false;
  bool includeContent = true;

  /** @brief Canonical coalescing key.  Merge flags are not part of it. */
  string key() const;
  json toParams() const;
  /** @brief Local filter equivalent of the remote query. */
  bool matches(const Job& job) const;
};

struct ListJobsResult {
  vector<JobPtr> jobs;
  int64_t totalCount = 0;
  bool hasMore = false;
};

typedef function<void(const ListJobsResult&, const optional<SyncError>&)>
    ListJobsCallback;
typedef function<void(const optional<SyncError>&)> SyncCompletion;
typedef function<void(JobPtr, const optional<SyncError>&)> JobCallback;

enum class ReconcileReason {
  INITIAL_LOAD,
  FOREGROUND_RESUME,
  CONNECTIVITY_RECONNECTED,
  PUSH_HINT,
  USER_REFRESH,
  LIST_INVALIDATED,
  RELAY_REGISTERED,
  SESSION_CHANGED,
  PERIODIC_SYNC,
};

string reconcileReasonName(ReconcileReason reason);
/** @brief Whether a reconcile for `reason` must skip every cache layer. */
bool reconcileBypassesCache(ReconcileReason reason);

/**
 * @brief De-duplicates list fetches and single-flights reconciliation.
 *
 * Must only be used from the executor, and must be owned by a shared_ptr:
 * remote replies and timers hold it weakly.
 */
class RequestCoordinator
    : public std::enable_shared_from_this<RequestCoordinator> {
 public:
  RequestCoordinator(shared_ptr<RemoteChannel> _channel,
                     shared_ptr<Executor> _executor,
                     shared_ptr<JobRepository> _repository,
                     const SyncConfig& _config);

  /**
   * @brief Fetches one page of jobs.
   *
   * Identical in-flight requests share one remote call.  A request repeated
   * within the de-dup window is answered from the store unless it bypasses
   * the cache.
   */
  void listJobs(const ListJobsRequest& request, ListJobsCallback callback);

  /**
   * @brief Fetches an authoritative snapshot for the current scope.  Callers
   * arriving while a reconcile for the same scope runs wait for that one.  If
   * the scope changed meanwhile, one more reconcile follows for the new scope.
   */
  void reconcile(ReconcileReason reason, SyncCompletion completion);

  /**
   * @brief Debounced event-merge fetch for the current scope.  Each call
   * re-arms the timer with a fresh random delay.
   */
  void scheduleCoalescedResync(const string& trigger);

  /**
   * @brief Fetches one job by id and merges it as an event.  The callback
   * receives the stored copy, which is null if the job was filtered out.
   */
  void fetchJob(const string& jobId, JobCallback callback);

  /**
   * @brief Asks the remote side to cancel a job.  On success the local copy
   * is marked canceled and a coalesced resync follows.
   */
  void cancelJob(const string& jobId, const string& reason,
                 SyncCompletion completion);

  /** @brief Deletes a job remotely, then locally. */
  void deleteJob(const string& jobId, SyncCompletion completion);

  void setScope(const JobScope& _scope) { scope = _scope; }
  const JobScope& getScope() const { return scope; }

  bool isReconciling() const { return reconcileInFlight; }
  int inFlightCount() const { return int(inFlight.size()); }

  /**
   * @brief Drops every registry.  Pending callers are failed and late
   * results are ignored.
   */
  void reset();

 protected:
  struct InFlightFetch {
    uint64_t generation;
    bool authoritative;
    vector<ListJobsCallback> waiters;
  };

  void startFetch(const string& deviceId, const ListJobsRequest& request,
                  shared_ptr<InFlightFetch> fetch);
  void completeFetch(const ListJobsRequest& request,
                     shared_ptr<InFlightFetch> fetch,
                     const RpcOutcome& outcome);
  /** @brief Fails `completion` and returns nullopt when offline. */
  optional<string> connectedDeviceOrFail(
      const function<void(const SyncError&)>& fail);
  ListJobsResult projectFromStore(const ListJobsRequest& request) const;
  void finishReconcile(const optional<SyncError>& error);

  shared_ptr<RemoteChannel> channel;
  shared_ptr<Executor> executor;
  shared_ptr<JobRepository> repository;
  SyncConfig config;
  JobScope scope;
  unordered_map<string, shared_ptr<InFlightFetch>> inFlight;
  unordered_map<string, int64_t> lastCompletedAt;
  bool reconcileInFlight;
  JobScope reconcileScope;
  vector<SyncCompletion> reconcileWaiters;
  optional<ReconcileReason> followUpReason;
  vector<SyncCompletion> followUpWaiters;
  uint64_t generation;
};
}  // namespace jm

#endif  // __JM_REQUEST_COORDINATOR__

#include "RequestCoordinator.hpp"

namespace jm {
namespace {
const string RESYNC_TIMER = "jobs-resync";
const string LOCAL_SESSION_PREFIX = "mobile-session-";

string joinSorted(vector<string> values) {
  std::sort(values.begin(), values.end());
  string joined;
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += value;
  }
  return joined;
}

bool containsValue(const vector<string>& values, const string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}
}  // namespace

JobScope JobScope::normalize(const string& sessionId,
                             const string& projectDirectory) {
  JobScope scope;
  if (!startsWith(sessionId, LOCAL_SESSION_PREFIX)) {
    scope.sessionId = sessionId;
  }
  scope.projectDirectory = projectDirectory;
  return scope;
}

string ListJobsRequest::key() const {
  ostringstream ss;
  ss << "s=" << scope.sessionId << "|p=" << scope.projectDirectory
     << "|st=" << joinSorted(statusFilter)
     << "|tt=" << joinSorted(taskTypeFilter) << "|pg=" << page
     << "|ps=" << pageSize;
  return ss.str();
}

json ListJobsRequest::toParams() const {
  json params;
  if (!scope.sessionId.empty()) {
    params["sessionId"] = scope.sessionId;
  }
  if (!scope.projectDirectory.empty()) {
    params["projectDirectory"] = scope.projectDirectory;
  }
  if (!statusFilter.empty()) {
    params["statusFilter"] = statusFilter;
  }
  if (!taskTypeFilter.empty()) {
    params["taskTypeFilter"] = taskTypeFilter;
  }
  params["page"] = page;
  params["pageSize"] = pageSize;
  params["bypassCache"] = bypassCache;
  params["includeContent"] = includeContent;
  return params;
}

bool ListJobsRequest::matches(const Job& job) const {
  if (!scope.sessionId.empty() && job.sessionId != scope.sessionId) {
    return false;
  }
  if (!scope.projectDirectory.empty() && !job.projectDirectory.empty() &&
      job.projectDirectory != scope.projectDirectory) {
    return false;
  }
  if (!statusFilter.empty() &&
      !containsValue(statusFilter, jobStatusToString(job.status))) {
    return false;
  }
  if (!taskTypeFilter.empty() &&
      !containsValue(taskTypeFilter, job.taskType)) {
    return false;
  }
  return true;
}

string reconcileReasonName(ReconcileReason reason) {
  switch (reason) {
    case ReconcileReason::INITIAL_LOAD:
      return "initialLoad";
    case ReconcileReason::FOREGROUND_RESUME:
      return "foregroundResume";
    case ReconcileReason::CONNECTIVITY_RECONNECTED:
      return "connectivityReconnected";
    case ReconcileReason::PUSH_HINT:
      return "pushHint";
    case ReconcileReason::USER_REFRESH:
      return "userRefresh";
    case ReconcileReason::LIST_INVALIDATED:
      return "listInvalidated";
    case ReconcileReason::RELAY_REGISTERED:
      return "relayRegistered";
    case ReconcileReason::SESSION_CHANGED:
      return "sessionChanged";
    case ReconcileReason::PERIODIC_SYNC:
      return "periodicSync";
  }
  return "unknown";
}

bool reconcileBypassesCache(ReconcileReason reason) {
  return reason != ReconcileReason::PERIODIC_SYNC;
}

RequestCoordinator::RequestCoordinator(shared_ptr<RemoteChannel> _channel,
                                       shared_ptr<Executor> _executor,
                                       shared_ptr<JobRepository> _repository,
                                       const SyncConfig& _config)
    : channel(_channel),
      executor(_executor),
      repository(_repository),
      config(_config),
      reconcileInFlight(false),
      generation(0) {}

void RequestCoordinator::listJobs(const ListJobsRequest& request,
                                  ListJobsCallback callback) {
  auto deviceId = channel->activeDeviceId();
  if (!deviceId || deviceId->empty() || !channel->isConnected(*deviceId)) {
    if (request.authoritative) {
      SyncError error = SyncError::connection("No connected device");
      LOG(WARNING) << "Cannot list jobs: " << error;
      repository->setError(error);
      repository->markLoadedOnce();
      executor->post([callback, error]() { callback(ListJobsResult(), error); });
    } else {
      VLOG(1) << "Skipping background job list while disconnected";
      executor->post(
          [callback]() { callback(ListJobsResult(), std::nullopt); });
    }
    return;
  }

  const string key = request.key();
  auto it = inFlight.find(key);
  if (it != inFlight.end()) {
    VLOG(2) << "Joining in-flight job list " << key;
    it->second->waiters.push_back(callback);
    if (request.authoritative) {
      it->second->authoritative = true;
    }
    return;
  }

  if (!request.bypassCache) {
    auto done = lastCompletedAt.find(key);
    if (done != lastCompletedAt.end() &&
        executor->nowMs() - done->second < config.listDedupWindowMs) {
      VLOG(2) << "Answering job list " << key << " from the store";
      auto result = projectFromStore(request);
      executor->post(
          [callback, result]() { callback(result, std::nullopt); });
      return;
    }
  }

  auto fetch = make_shared<InFlightFetch>();
  fetch->generation = generation;
  fetch->authoritative = request.authoritative;
  fetch->waiters.push_back(callback);
  inFlight[key] = fetch;
  if (repository->isEmpty()) {
    repository->setLoading(true);
  }
  startFetch(*deviceId, request, fetch);
}

void RequestCoordinator::startFetch(const string& deviceId,
                                    const ListJobsRequest& request,
                                    shared_ptr<InFlightFetch> fetch) {
  RpcRequest rpc;
  rpc.method = "job.list";
  rpc.params = request.toParams();
  RpcCall::invoke(channel, executor, deviceId, rpc, weak_from_this(),
                  [this, request, fetch](const RpcOutcome& outcome) {
                    completeFetch(request, fetch, outcome);
                  });
}

void RequestCoordinator::completeFetch(const ListJobsRequest& request,
                                       shared_ptr<InFlightFetch> fetch,
                                       const RpcOutcome& outcome) {
  if (fetch->generation != generation) {
    VLOG(1) << "Ignoring job list result from before a reset";
    return;
  }
  const string key = request.key();
  auto it = inFlight.find(key);
  if (it != inFlight.end() && it->second == fetch) {
    inFlight.erase(it);
  }

  ListJobsResult result;
  optional<SyncError> error = outcome.error;
  if (!error) {
    const json& body = outcome.result;
    if (!body.is_object() || !body.contains("jobs") ||
        !body["jobs"].is_array()) {
      error = SyncError::invalidResponse("job.list result has no jobs array");
    } else {
      vector<Job> jobs;
      for (const auto& entry : body["jobs"]) {
        auto job = Job::fromJson(entry);
        if (!job) {
          LOG(WARNING) << "Skipping job without id in job.list result";
          continue;
        }
        jobs.push_back(*job);
      }
      repository->reduceJobs(jobs, fetch->authoritative ? MergeSource::SNAPSHOT
                                                        : MergeSource::EVENT);
      for (const auto& job : jobs) {
        auto stored = repository->get(job.id);
        if (stored) {
          result.jobs.push_back(stored);
        }
      }
      result.totalCount =
          jsonInt64(body, "totalCount", "total_count").value_or(jobs.size());
      auto hasMore = body.find("hasMore");
      result.hasMore =
          hasMore != body.end() && hasMore->is_boolean() && hasMore->get<bool>();
      lastCompletedAt[key] = executor->nowMs();
      repository->setError(std::nullopt);
    }
  }

  if (error) {
    LOG(WARNING) << "Job list " << key << " failed: " << *error;
    if (fetch->authoritative || repository->isEmpty()) {
      repository->setError(error);
    }
  }
  repository->markLoadedOnce();
  if (inFlight.empty()) {
    repository->setLoading(false);
  }

  for (const auto& waiter : fetch->waiters) {
    waiter(result, error);
  }
}

ListJobsResult RequestCoordinator::projectFromStore(
    const ListJobsRequest& request) const {
  vector<JobPtr> matching;
  for (const auto& job : repository->getStore().all()) {
    if (request.matches(*job)) {
      matching.push_back(job);
    }
  }
  std::sort(matching.begin(), matching.end(),
            &DerivedStateProjector::sortsBefore);

  ListJobsResult result;
  result.totalCount = matching.size();
  size_t begin = size_t(max(0, request.page)) * size_t(max(1, request.pageSize));
  size_t end = min(matching.size(), begin + size_t(max(1, request.pageSize)));
  if (begin < matching.size()) {
    result.jobs.assign(matching.begin() + begin, matching.begin() + end);
  }
  result.hasMore = end < matching.size();
  return result;
}

void RequestCoordinator::reconcile(ReconcileReason reason,
                                   SyncCompletion completion) {
  if (reconcileInFlight) {
    if (scope == reconcileScope) {
      VLOG(1) << "Joining running reconcile (" << reconcileReasonName(reason)
              << ")";
      reconcileWaiters.push_back(completion);
    } else {
      VLOG(1) << "Queueing reconcile (" << reconcileReasonName(reason)
              << ") behind one for another scope";
      followUpReason = reason;
      followUpWaiters.push_back(completion);
    }
    return;
  }
  if (!scope.isValid()) {
    VLOG(1) << "Skipping reconcile (" << reconcileReasonName(reason)
            << "): no session or project";
    repository->markLoadedOnce();
    executor->post([completion]() { completion(std::nullopt); });
    return;
  }

  LOG(INFO) << "Reconciling jobs (" << reconcileReasonName(reason) << ")";
  reconcileInFlight = true;
  reconcileScope = scope;
  reconcileWaiters.push_back(completion);

  ListJobsRequest request;
  request.scope = scope;
  request.pageSize = config.defaultPageSize;
  request.authoritative = true;
  request.bypassCache = reconcileBypassesCache(reason);
  uint64_t startGeneration = generation;
  weak_ptr<RequestCoordinator> weakSelf = weak_from_this();
  listJobs(request, [weakSelf, startGeneration](
                        const ListJobsResult& result,
                        const optional<SyncError>& error) {
    auto self = weakSelf.lock();
    if (!self || startGeneration != self->generation) {
      return;
    }
    self->finishReconcile(error);
  });
}

void RequestCoordinator::finishReconcile(const optional<SyncError>& error) {
  reconcileInFlight = false;
  vector<SyncCompletion> waiters;
  waiters.swap(reconcileWaiters);
  if (error) {
    LOG(WARNING) << "Reconcile failed: " << *error;
  } else {
    VLOG(1) << "Reconcile finished";
  }
  for (const auto& waiter : waiters) {
    waiter(error);
  }

  if (followUpWaiters.empty() && scope == reconcileScope) {
    return;
  }
  ReconcileReason reason =
      followUpReason.value_or(ReconcileReason::SESSION_CHANGED);
  followUpReason.reset();
  vector<SyncCompletion> queued;
  queued.swap(followUpWaiters);
  LOG(INFO) << "Scope changed while reconciling, reconciling again";
  reconcile(reason, [queued](const optional<SyncError>& followUpError) {
    for (const auto& waiter : queued) {
      waiter(followUpError);
    }
  });
}

void RequestCoordinator::scheduleCoalescedResync(const string& trigger) {
  if (!scope.isValid()) {
    VLOG(2) << "No scope for coalesced resync (" << trigger << ")";
    return;
  }
  int64_t delay = randomInRange(config.resyncMinDelayMs, config.resyncMaxDelayMs);
  VLOG(1) << "Coalesced resync in " << delay << "ms (" << trigger << ")";
  weak_ptr<RequestCoordinator> weakSelf = weak_from_this();
  executor->schedule(RESYNC_TIMER, delay, [weakSelf]() {
    auto self = weakSelf.lock();
    if (!self || !self->scope.isValid()) {
      return;
    }
    ListJobsRequest request;
    request.scope = self->scope;
    request.pageSize = self->config.resyncPageSize;
    request.bypassCache = true;
    self->listJobs(request, [](const ListJobsResult& result,
                         const optional<SyncError>& error) {
      if (error) {
        LOG(WARNING) << "Coalesced resync failed: " << *error;
      }
    });
  });
}

optional<string> RequestCoordinator::connectedDeviceOrFail(
    const function<void(const SyncError&)>& fail) {
  try {
    return RpcCall::requireConnectedDevice(channel);
  } catch (const SyncError& error) {
    LOG(WARNING) << error;
    executor->post([fail, error]() { fail(error); });
    return std::nullopt;
  }
}

void RequestCoordinator::fetchJob(const string& jobId, JobCallback callback) {
  auto deviceId = connectedDeviceOrFail(
      [callback](const SyncError& error) { callback(nullptr, error); });
  if (!deviceId) {
    return;
  }
  RpcRequest rpc;
  rpc.method = "job.get";
  rpc.params = {{"jobId", jobId}};
  uint64_t startGeneration = generation;
  RpcCall::invoke(
      channel, executor, *deviceId, rpc, weak_from_this(),
      [this, jobId, callback, startGeneration](const RpcOutcome& outcome) {
        if (startGeneration != generation) {
          VLOG(1) << "Ignoring job.get result from before a reset";
          return;
        }
        if (!outcome.ok()) {
          callback(nullptr, outcome.error);
          return;
        }
        const json& body = outcome.result;
        auto job = Job::fromJson(body.is_object() && body.contains("job")
                                     ? body["job"]
                                     : body);
        if (!job) {
          callback(nullptr,
                   SyncError::invalidResponse("job.get returned no job for " +
                                              jobId));
          return;
        }
        repository->reduceJobs({*job}, MergeSource::EVENT);
        callback(repository->get(job->id), std::nullopt);
      });
}

void RequestCoordinator::cancelJob(const string& jobId, const string& reason,
                                   SyncCompletion completion) {
  auto deviceId = connectedDeviceOrFail(
      [completion](const SyncError& error) { completion(error); });
  if (!deviceId) {
    return;
  }
  RpcRequest rpc;
  rpc.method = "job.cancel";
  rpc.params = {{"jobId", jobId}};
  if (!reason.empty()) {
    rpc.params["reason"] = reason;
  }
  uint64_t startGeneration = generation;
  RpcCall::invoke(
      channel, executor, *deviceId, rpc, weak_from_this(),
      [this, jobId, completion, startGeneration](const RpcOutcome& outcome) {
        if (startGeneration != generation) {
          return;
        }
        if (!outcome.ok()) {
          completion(outcome.error);
          return;
        }
        const json& body = outcome.result;
        auto success = body.find("success");
        if (success == body.end() || !success->is_boolean()) {
          completion(
              SyncError::invalidResponse("job.cancel result has no success"));
          return;
        }
        if (!success->get<bool>()) {
          completion(SyncError::server(
              jsonString(body, "message").value_or("Cancel was rejected")));
          return;
        }
        LOG(INFO) << "Canceled job " << jobId;
        auto existing = repository->get(jobId);
        if (existing) {
          Job canceled = *existing;
          canceled.status = JobStatus::CANCELED;
          int64_t canceledAt =
              jsonInt64(body, "cancelledAt", "canceledAt").value_or(wallClockMs());
          canceled.updatedAt =
              max(canceledAt, existing->timestamp().value_or(0) + 1);
          repository->reduceJobs({canceled}, MergeSource::EVENT);
        }
        scheduleCoalescedResync("cancel");
        completion(std::nullopt);
      });
}

void RequestCoordinator::deleteJob(const string& jobId,
                                   SyncCompletion completion) {
  auto deviceId = connectedDeviceOrFail(
      [completion](const SyncError& error) { completion(error); });
  if (!deviceId) {
    return;
  }
  RpcRequest rpc;
  rpc.method = "job.delete";
  rpc.params = {{"jobId", jobId}};
  uint64_t startGeneration = generation;
  RpcCall::invoke(
      channel, executor, *deviceId, rpc, weak_from_this(),
      [this, jobId, completion, startGeneration](const RpcOutcome& outcome) {
        if (startGeneration != generation) {
          return;
        }
        if (!outcome.ok()) {
          completion(outcome.error);
          return;
        }
        LOG(INFO) << "Deleted job " << jobId;
        repository->removeJob(jobId);
        scheduleCoalescedResync("delete");
        completion(std::nullopt);
      });
}

void RequestCoordinator::reset() {
  generation++;
  executor->cancel(RESYNC_TIMER);
  auto abandoned = std::move(inFlight);
  inFlight.clear();
  lastCompletedAt.clear();
  reconcileInFlight = false;
  vector<SyncCompletion> reconcileAbandoned;
  reconcileAbandoned.swap(reconcileWaiters);
  reconcileAbandoned.insert(reconcileAbandoned.end(), followUpWaiters.begin(),
                            followUpWaiters.end());
  followUpWaiters.clear();
  followUpReason.reset();

  SyncError error = SyncError::connection("Job state was reset");
  for (const auto& it : abandoned) {
    for (const auto& waiter : it.second->waiters) {
      waiter(ListJobsResult(), error);
    }
  }
  for (const auto& waiter : reconcileAbandoned) {
    waiter(error);
  }
}
}  // namespace jm

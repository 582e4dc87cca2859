#include "EventApplier.hpp"

namespace jm {
namespace {
const string JOB_CREATED = "job:created";
const string JOB_DELETED = "job:deleted";
const string JOB_STATUS_CHANGED = "job:status-changed";
const string JOB_TOKENS_UPDATED = "job:tokens-updated";
const string JOB_COST_UPDATED = "job:cost-updated";
const string JOB_FINALIZED = "job:finalized";
const string JOB_METADATA_UPDATED = "job:metadata-updated";
const string JOB_RESPONSE_APPENDED = "job:response-appended";
const string JOB_STREAM_PROGRESS = "job:stream-progress";
const string PLAN_CREATED = "PlanCreated";
const string PLAN_MODIFIED = "PlanModified";

const set<string> JOB_EVENTS = {
    JOB_CREATED,       JOB_DELETED,          JOB_STATUS_CHANGED,
    JOB_TOKENS_UPDATED, JOB_COST_UPDATED,    JOB_FINALIZED,
    JOB_METADATA_UPDATED, JOB_RESPONSE_APPENDED, JOB_STREAM_PROGRESS,
};
}  // namespace

EventApplier::EventApplier(shared_ptr<JobRepository> _repository,
                           shared_ptr<RequestCoordinator> _coordinator)
    : repository(_repository), coordinator(_coordinator), generation(0) {}

bool EventApplier::isJobEvent(const string& eventType) {
  return JOB_EVENTS.find(eventType) != JOB_EVENTS.end() ||
         eventType == PLAN_CREATED || eventType == PLAN_MODIFIED;
}

void EventApplier::apply(const RemoteEvent& event) {
  if (!isJobEvent(event.eventType)) {
    VLOG(3) << "Ignoring event " << event.eventType;
    return;
  }
  dispatch(event, true);
}

void EventApplier::dispatch(const RemoteEvent& event, bool allowHydration) {
  VLOG(2) << "Applying " << event.eventType;
  if (event.eventType == PLAN_CREATED || event.eventType == PLAN_MODIFIED) {
    coordinator->scheduleCoalescedResync(event.eventType);
    return;
  }
  if (event.eventType == JOB_CREATED) {
    applyCreated(event, allowHydration);
    return;
  }

  auto jobId = extractJobId(event.payload);
  if (!jobId) {
    LOG(INFO) << event.eventType << " without a job id, resyncing";
    coordinator->scheduleCoalescedResync(event.eventType);
    return;
  }
  if (repository->wasFiltered(*jobId)) {
    VLOG(2) << "Dropping " << event.eventType << " for filtered job "
            << *jobId;
    return;
  }
  if (event.eventType == JOB_DELETED) {
    repository->removeJob(*jobId);
    return;
  }

  auto existing = repository->get(*jobId);
  if (!existing) {
    if (allowHydration) {
      hydrate(*jobId, event);
    } else {
      LOG(INFO) << "Job " << *jobId << " still unknown after hydration, dropping "
                << event.eventType;
    }
    return;
  }
  applyToExistingJob(event, *existing);
}

void EventApplier::applyCreated(const RemoteEvent& event,
                                bool allowHydration) {
  if (event.payload.is_object() && event.payload.contains("job")) {
    auto job = Job::fromJson(event.payload["job"]);
    if (job) {
      repository->reduceJobs({*job}, MergeSource::EVENT);
      return;
    }
  }
  auto jobId = extractJobId(event.payload);
  if (!jobId) {
    LOG(INFO) << "job:created without a job, resyncing";
    coordinator->scheduleCoalescedResync(event.eventType);
    return;
  }
  if (repository->contains(*jobId) || repository->wasFiltered(*jobId)) {
    return;
  }
  if (allowHydration) {
    hydrate(*jobId, event);
  }
}

void EventApplier::applyToExistingJob(const RemoteEvent& event,
                                      const Job& existing) {
  const json& payload = event.payload;
  Job updated = existing;
  bool highFrequency = false;

  if (event.eventType == JOB_STATUS_CHANGED) {
    auto status = jsonString(payload, "status");
    if (!status) {
      coordinator->scheduleCoalescedResync(event.eventType);
      return;
    }
    updated.status = jobStatusFromString(*status);
    auto updatedAt = jsonInt64(payload, "updatedAt", "updated_at");
    if (updatedAt) {
      updated.updatedAt = updatedAt;
    }
    auto subStatus = jsonString(payload, "subStatusMessage");
    if (subStatus) {
      updated.subStatusMessage = *subStatus;
    }
    auto startTime = jsonInt64(payload, "startTime", "start_time");
    if (startTime) {
      updated.startTime = startTime;
    }
    auto endTime = jsonInt64(payload, "endTime", "end_time");
    if (endTime) {
      updated.endTime = endTime;
    }
  } else if (event.eventType == JOB_TOKENS_UPDATED) {
    auto sent = jsonInt64(payload, "tokensSent", "tokens_sent");
    auto received = jsonInt64(payload, "tokensReceived", "tokens_received");
    auto cacheRead = jsonInt64(payload, "cacheReadTokens", "cache_read_tokens");
    auto cacheWrite =
        jsonInt64(payload, "cacheWriteTokens", "cache_write_tokens");
    if (!sent && !received && !cacheRead && !cacheWrite) {
      coordinator->scheduleCoalescedResync(event.eventType);
      return;
    }
    updated.tokensSent = sent.value_or(updated.tokensSent);
    updated.tokensReceived = received.value_or(updated.tokensReceived);
    updated.cacheReadTokens = cacheRead.value_or(updated.cacheReadTokens);
    updated.cacheWriteTokens = cacheWrite.value_or(updated.cacheWriteTokens);
    highFrequency = true;
  } else if (event.eventType == JOB_COST_UPDATED) {
    auto cost = jsonDouble(payload, "actualCost", "actual_cost");
    if (!cost) {
      coordinator->scheduleCoalescedResync(event.eventType);
      return;
    }
    updated.actualCost = *cost;
    highFrequency = true;
  } else if (event.eventType == JOB_METADATA_UPDATED) {
    auto patch = payload.find("metadataPatch");
    if (patch == payload.end() || !patch->is_object()) {
      coordinator->scheduleCoalescedResync(event.eventType);
      return;
    }
    updated.metadata = mergeMetadata(updated.metadata, *patch);
  } else if (event.eventType == JOB_STREAM_PROGRESS) {
    json taskData;
    for (const char* key : {"progress", "responseLength", "lastStreamUpdateTime"}) {
      auto it = payload.find(key);
      if (it != payload.end() && !it->is_null()) {
        taskData[key] = *it;
      }
    }
    if (taskData.is_null()) {
      coordinator->scheduleCoalescedResync(event.eventType);
      return;
    }
    updated.metadata = mergeMetadata(updated.metadata, {{"taskData", taskData}});
    highFrequency = true;
  } else if (event.eventType == JOB_RESPONSE_APPENDED) {
    applyResponseAppended(event, existing);
    return;
  } else if (event.eventType == JOB_FINALIZED) {
    applyFinalized(event, existing);
    return;
  }

  repository->reduceJobs({updated}, MergeSource::EVENT, highFrequency);
}

void EventApplier::applyResponseAppended(const RemoteEvent& event,
                                         const Job& existing) {
  auto chunk = jsonString(event.payload, "chunk");
  if (!chunk) {
    coordinator->scheduleCoalescedResync(event.eventType);
    return;
  }
  auto accumulated =
      jsonInt64(event.payload, "accumulatedLength", "accumulated_length");
  if (!accumulated) {
    refetch(existing.id);
    return;
  }
  int64_t localLength = int64_t(existing.response.size());
  if (*accumulated <= localLength) {
    VLOG(2) << "Dropping stale chunk for " << existing.id << " ("
            << *accumulated << " <= " << localLength << ")";
    return;
  }
  if (localLength + int64_t(chunk->size()) != *accumulated) {
    LOG(INFO) << "Response gap for " << existing.id << ": have "
              << localLength << ", chunk of " << chunk->size()
              << " claims " << *accumulated;
    refetch(existing.id);
    return;
  }
  Job updated = existing;
  updated.response += *chunk;
  repository->reduceJobs({updated}, MergeSource::EVENT, true);
}

void EventApplier::applyFinalized(const RemoteEvent& event,
                                  const Job& existing) {
  auto response = jsonString(event.payload, "response");
  if (!response) {
    refetch(existing.id);
    return;
  }
  Job updated = existing;
  updated.response = *response;
  updated.isFinalized = true;
  auto status = jsonString(event.payload, "status");
  if (status) {
    updated.status = jobStatusFromString(*status);
  }
  auto updatedAt = jsonInt64(event.payload, "updatedAt", "updated_at");
  if (updatedAt) {
    updated.updatedAt = updatedAt;
  }
  repository->reduceJobs({updated}, MergeSource::EVENT);
}

void EventApplier::hydrate(const string& jobId, const RemoteEvent& event) {
  auto it = hydrationWaiters.find(jobId);
  if (it != hydrationWaiters.end()) {
    it->second.push_back(event);
    return;
  }
  VLOG(1) << "Hydrating unknown job " << jobId;
  hydrationWaiters[jobId].push_back(event);
  uint64_t startGeneration = generation;
  weak_ptr<EventApplier> weakSelf = weak_from_this();
  coordinator->fetchJob(jobId, [this, weakSelf, jobId, startGeneration](
                                   JobPtr job, const optional<SyncError>& error) {
    auto self = weakSelf.lock();
    if (!self || startGeneration != generation) {
      return;
    }
    if (error) {
      LOG(WARNING) << "Hydration of " << jobId << " failed: " << *error;
    }
    auto waiters = std::move(hydrationWaiters[jobId]);
    hydrationWaiters.erase(jobId);
    for (const auto& waiter : waiters) {
      dispatch(waiter, false);
    }
  });
}

void EventApplier::refetch(const string& jobId) {
  if (!pendingRefetch.insert(jobId).second) {
    return;
  }
  VLOG(1) << "Refetching job " << jobId;
  uint64_t startGeneration = generation;
  weak_ptr<EventApplier> weakSelf = weak_from_this();
  coordinator->fetchJob(jobId, [this, weakSelf, jobId, startGeneration](
                                   JobPtr job, const optional<SyncError>& error) {
    auto self = weakSelf.lock();
    if (!self || startGeneration != generation) {
      return;
    }
    pendingRefetch.erase(jobId);
    if (error) {
      LOG(WARNING) << "Refetch of " << jobId << " failed: " << *error;
      coordinator->scheduleCoalescedResync("refetch-failed");
    }
  });
}

void EventApplier::reset() {
  generation++;
  hydrationWaiters.clear();
  pendingRefetch.clear();
}
}  // namespace jm

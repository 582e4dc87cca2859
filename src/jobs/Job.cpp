#include "Job.hpp"

namespace jm {
namespace {
const vector<pair<JobStatus, string>> STATUS_NAMES = {
    {JobStatus::IDLE, "idle"},
    {JobStatus::CREATED, "created"},
    {JobStatus::QUEUED, "queued"},
    {JobStatus::ACKNOWLEDGED_BY_WORKER, "acknowledged_by_worker"},
    {JobStatus::PREPARING, "preparing"},
    {JobStatus::PREPARING_INPUT, "preparing_input"},
    {JobStatus::GENERATING_STREAM, "generating_stream"},
    {JobStatus::PROCESSING_STREAM, "processing_stream"},
    {JobStatus::RUNNING, "running"},
    {JobStatus::COMPLETED_BY_TAG, "completed_by_tag"},
    {JobStatus::COMPLETED, "completed"},
    {JobStatus::FAILED, "failed"},
    {JobStatus::CANCELED, "canceled"},
    {JobStatus::UNKNOWN, "unknown"},
};

void putOptional(json* j, const string& key, const optional<int64_t>& value) {
  if (value) {
    (*j)[key] = *value;
  }
}
}  // namespace

JobStatus jobStatusFromString(const string& s) {
  for (const auto& it : STATUS_NAMES) {
    if (it.second == s) {
      return it.first;
    }
  }
  if (s == "cancelled") {
    return JobStatus::CANCELED;
  }
  if (s == "acknowledgedByWorker") {
    return JobStatus::ACKNOWLEDGED_BY_WORKER;
  }
  return JobStatus::UNKNOWN;
}

string jobStatusToString(JobStatus status) {
  for (const auto& it : STATUS_NAMES) {
    if (it.first == status) {
      return it.second;
    }
  }
  return "unknown";
}

bool isActiveStatus(JobStatus status) {
  switch (status) {
    case JobStatus::IDLE:
    case JobStatus::CREATED:
    case JobStatus::QUEUED:
    case JobStatus::ACKNOWLEDGED_BY_WORKER:
    case JobStatus::PREPARING:
    case JobStatus::PREPARING_INPUT:
    case JobStatus::GENERATING_STREAM:
    case JobStatus::PROCESSING_STREAM:
    case JobStatus::RUNNING:
      return true;
    default:
      return false;
  }
}

bool isTerminalStatus(JobStatus status) {
  switch (status) {
    case JobStatus::COMPLETED_BY_TAG:
    case JobStatus::COMPLETED:
    case JobStatus::FAILED:
    case JobStatus::CANCELED:
      return true;
    default:
      return false;
  }
}

optional<Job> Job::fromJson(const json& j) {
  auto id = jsonString(j, "id");
  if (!id || id->empty()) {
    return std::nullopt;
  }
  Job job;
  job.id = *id;
  job.sessionId = jsonString(j, "sessionId", "session_id").value_or("");
  job.projectDirectory =
      jsonString(j, "projectDirectory", "project_directory").value_or("");
  job.taskType = jsonString(j, "taskType", "task_type").value_or("");
  job.status = jobStatusFromString(jsonString(j, "status").value_or(""));
  job.subStatusMessage =
      jsonString(j, "subStatusMessage", "sub_status_message").value_or("");
  job.createdAt = jsonInt64(j, "createdAt", "created_at");
  job.updatedAt = jsonInt64(j, "updatedAt", "updated_at");
  job.startTime = jsonInt64(j, "startTime", "start_time");
  job.endTime = jsonInt64(j, "endTime", "end_time");
  job.durationMs = jsonInt64(j, "durationMs", "duration_ms");
  job.response = jsonString(j, "response").value_or("");
  job.actualCost = jsonDouble(j, "actualCost", "actual_cost");
  job.tokensSent = jsonInt64(j, "tokensSent", "tokens_sent").value_or(0);
  job.tokensReceived =
      jsonInt64(j, "tokensReceived", "tokens_received").value_or(0);
  job.cacheReadTokens =
      jsonInt64(j, "cacheReadTokens", "cache_read_tokens").value_or(0);
  job.cacheWriteTokens =
      jsonInt64(j, "cacheWriteTokens", "cache_write_tokens").value_or(0);

  job.isFinalized = jsonBool(j, "isFinalized", "is_finalized").value_or(false);

  const json* metadata = findField(j, "metadata");
  if (metadata) {
    if (metadata->is_string()) {
      // Some producers send metadata as an encoded JSON document.
      json parsed = json::parse(metadata->get<string>(), nullptr, false);
      job.metadata = parsed.is_discarded() ? *metadata : parsed;
    } else {
      job.metadata = *metadata;
    }
  }
  return job;
}

json Job::toJson() const {
  json j;
  j["id"] = id;
  j["sessionId"] = sessionId;
  if (!projectDirectory.empty()) {
    j["projectDirectory"] = projectDirectory;
  }
  j["taskType"] = taskType;
  j["status"] = jobStatusToString(status);
  if (!subStatusMessage.empty()) {
    j["subStatusMessage"] = subStatusMessage;
  }
  putOptional(&j, "createdAt", createdAt);
  putOptional(&j, "updatedAt", updatedAt);
  putOptional(&j, "startTime", startTime);
  putOptional(&j, "endTime", endTime);
  putOptional(&j, "durationMs", durationMs);
  j["response"] = response;
  if (!metadata.is_null()) {
    j["metadata"] = metadata;
  }
  if (actualCost) {
    j["actualCost"] = *actualCost;
  }
  j["tokensSent"] = tokensSent;
  j["tokensReceived"] = tokensReceived;
  j["cacheReadTokens"] = cacheReadTokens;
  j["cacheWriteTokens"] = cacheWriteTokens;
  j["isFinalized"] = isFinalized;
  return j;
}

optional<string> extractJobId(const json& payload) {
  auto id = jsonString(payload, "jobId", "job_id");
  if (id && !id->empty()) {
    return id;
  }
  id = jsonString(payload, "id");
  if (id && !id->empty()) {
    return id;
  }
  if (payload.is_object() && payload.contains("job")) {
    id = jsonString(payload["job"], "id");
    if (id && !id->empty()) {
      return id;
    }
  }
  return std::nullopt;
}

json mergeMetadata(const json& base, const json& patch) {
  if (!patch.is_object()) {
    return base;
  }
  json merged = base.is_object() ? base : json::object();
  for (auto it = patch.begin(); it != patch.end(); ++it) {
    if (it.value().is_object() && merged.contains(it.key()) &&
        merged[it.key()].is_object()) {
      for (auto inner = it.value().begin(); inner != it.value().end();
           ++inner) {
        merged[it.key()][inner.key()] = inner.value();
      }
    } else {
      merged[it.key()] = it.value();
    }
  }
  return merged;
}
}  // namespace jm

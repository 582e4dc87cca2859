#ifndef __JM_JOB__
#define __JM_JOB__

#include "Headers.hpp"
#include "JsonFields.hpp"

namespace jm {
enum class JobStatus {
  IDLE,
  CREATED,
  QUEUED,
  ACKNOWLEDGED_BY_WORKER,
  PREPARING,
  PREPARING_INPUT,
  GENERATING_STREAM,
  PROCESSING_STREAM,
  RUNNING,
  COMPLETED_BY_TAG,
  COMPLETED,
  FAILED,
  CANCELED,
  UNKNOWN,
};

/** @brief Parses a wire status.  Unrecognized values map to UNKNOWN. */
JobStatus jobStatusFromString(const string& s);
string jobStatusToString(JobStatus status);
/** @brief Queued or in progress on the remote worker. */
bool isActiveStatus(JobStatus status);
/** @brief Finished for good; no further transitions are expected. */
bool isTerminalStatus(JobStatus status);

/**
 * @brief Local copy of one background job.
 *
 * Jobs are immutable once they are in the JobStore; mutations build a new
 * copy and go through the reducer.
 */
struct Job {
  string id;
  string sessionId;
  string projectDirectory;
  string taskType;
  JobStatus status = JobStatus::UNKNOWN;
  string subStatusMessage;
  optional<int64_t> createdAt;
  optional<int64_t> updatedAt;
  optional<int64_t> startTime;
  optional<int64_t> endTime;
  optional<int64_t> durationMs;
  string response;
  json metadata;
  optional<double> actualCost;
  int64_t tokensSent = 0;
  int64_t tokensReceived = 0;
  int64_t cacheReadTokens = 0;
  int64_t cacheWriteTokens = 0;
  bool isFinalized = false;

  /** @brief `updatedAt`, falling back to `createdAt`. */
  optional<int64_t> timestamp() const {
    return updatedAt ? updatedAt : createdAt;
  }
  bool isActive() const { return isActiveStatus(status); }
  bool isTerminal() const { return isTerminalStatus(status); }

  /**
   * @brief Decodes a job from its camelCase wire form (snake_case accepted).
   * Returns nullopt when there is no id.
   */
  static optional<Job> fromJson(const json& j);
  json toJson() const;
};

/** @brief Extracts a job id from an event payload (`jobId`, `id`, `job.id`). */
optional<string> extractJobId(const json& payload);

/** @brief Merges `patch` into `base` one level deep. */
json mergeMetadata(const json& base, const json& patch);
}  // namespace jm

#endif  // __JM_JOB__

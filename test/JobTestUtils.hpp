#ifndef __JM_JOB_TEST_UTILS__
#define __JM_JOB_TEST_UTILS__

#include "Job.hpp"

namespace jm {
inline Job makeJob(const string& id, JobStatus status,
                   optional<int64_t> updatedAt,
                   const string& taskType = "implementation_plan",
                   const string& sessionId = "session-1") {
  Job job;
  job.id = id;
  job.status = status;
  job.updatedAt = updatedAt;
  job.createdAt = 100;
  job.taskType = taskType;
  job.sessionId = sessionId;
  job.projectDirectory = "/work/app";
  return job;
}

inline json makeJobJson(const string& id, const string& status,
                        int64_t updatedAt,
                        const string& taskType = "implementation_plan",
                        const string& sessionId = "session-1") {
  return {{"id", id},
          {"status", status},
          {"updatedAt", updatedAt},
          {"createdAt", 100},
          {"taskType", taskType},
          {"sessionId", sessionId},
          {"projectDirectory", "/work/app"}};
}
}  // namespace jm

#endif  // __JM_JOB_TEST_UTILS__

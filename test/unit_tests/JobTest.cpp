#include "Job.hpp"

#include "TestHeaders.hpp"

using namespace jm;

TEST_CASE("Jobs decode from camel and snake case", "[Job]") {
  SECTION("camelCase") {
    json j = {{"id", "j1"},
              {"sessionId", "s1"},
              {"taskType", "implementation_plan"},
              {"status", "running"},
              {"updatedAt", 200},
              {"actualCost", 0.25},
              {"tokensSent", 10},
              {"isFinalized", true},
              {"metadata", {{"taskData", {{"progress", 10}}}}}};
    auto job = Job::fromJson(j);
    REQUIRE(job);
    REQUIRE(job->id == "j1");
    REQUIRE(job->status == JobStatus::RUNNING);
    REQUIRE(job->timestamp() == optional<int64_t>(200));
    REQUIRE(job->actualCost == optional<double>(0.25));
    REQUIRE(job->tokensSent == 10);
    REQUIRE(job->isFinalized);
    REQUIRE(job->metadata["taskData"]["progress"] == 10);
    REQUIRE(job->isActive());
  }

  SECTION("snake_case with string numbers and encoded metadata") {
    json j = {{"id", "j2"},
              {"session_id", "s2"},
              {"task_type", "file_finder_workflow"},
              {"status", "cancelled"},
              {"created_at", "150"},
              {"metadata", "{\"planTitle\":\"Refactor\"}"}};
    auto job = Job::fromJson(j);
    REQUIRE(job);
    REQUIRE(job->sessionId == "s2");
    REQUIRE(job->status == JobStatus::CANCELED);
    REQUIRE_FALSE(job->updatedAt);
    REQUIRE(job->timestamp() == optional<int64_t>(150));
    REQUIRE(job->metadata["planTitle"] == "Refactor");
    REQUIRE(job->isTerminal());
  }

  SECTION("No id") {
    REQUIRE_FALSE(Job::fromJson({{"status", "queued"}}));
    REQUIRE_FALSE(Job::fromJson(json::array()));
  }
}

TEST_CASE("Job statuses", "[Job]") {
  REQUIRE(jobStatusFromString("acknowledged_by_worker") ==
          JobStatus::ACKNOWLEDGED_BY_WORKER);
  REQUIRE(jobStatusFromString("acknowledgedByWorker") ==
          JobStatus::ACKNOWLEDGED_BY_WORKER);
  REQUIRE(jobStatusFromString("bogus") == JobStatus::UNKNOWN);
  REQUIRE(jobStatusToString(JobStatus::COMPLETED_BY_TAG) ==
          "completed_by_tag");
  REQUIRE(isActiveStatus(JobStatus::QUEUED));
  REQUIRE_FALSE(isActiveStatus(JobStatus::FAILED));
  REQUIRE(isTerminalStatus(JobStatus::FAILED));
  REQUIRE_FALSE(isTerminalStatus(JobStatus::UNKNOWN));
  REQUIRE_FALSE(isActiveStatus(JobStatus::UNKNOWN));
}

TEST_CASE("Event payload helpers", "[Job]") {
  REQUIRE(extractJobId({{"jobId", "a"}}) == optional<string>("a"));
  REQUIRE(extractJobId({{"id", "b"}}) == optional<string>("b"));
  REQUIRE(extractJobId({{"job", {{"id", "c"}}}}) == optional<string>("c"));
  REQUIRE_FALSE(extractJobId({{"other", 1}}));

  json base = {{"taskData", {{"progress", 1}, {"phase", "read"}}},
               {"planTitle", "x"}};
  json merged =
      mergeMetadata(base, {{"taskData", {{"progress", 2}}}, {"extra", true}});
  REQUIRE(merged["taskData"]["progress"] == 2);
  REQUIRE(merged["taskData"]["phase"] == "read");
  REQUIRE(merged["planTitle"] == "x");
  REQUIRE(merged["extra"] == true);
  REQUIRE(mergeMetadata(nullptr, {{"a", 1}}) == json({{"a", 1}}));
}

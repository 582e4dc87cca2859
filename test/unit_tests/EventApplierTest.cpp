#include "EventApplier.hpp"

#include "FakeRemoteChannel.hpp"
#include "JobTestUtils.hpp"
#include "ManualExecutor.hpp"
#include "TestHeaders.hpp"

using namespace jm;

namespace {
struct ApplierFixture {
  ApplierFixture()
      : channel(new FakeRemoteChannel()), executor(new ManualExecutor()) {
    channel->connectQuietly("desk");
    repository.reset(new JobRepository(executor, config));
    coordinator.reset(
        new RequestCoordinator(channel, executor, repository, config));
    coordinator->setScope(JobScope::normalize("session-1", "/work/app"));
    applier.reset(new EventApplier(repository, coordinator));
  }

  void apply(const string& type, const json& payload) {
    RemoteEvent event;
    event.eventType = type;
    event.payload = payload;
    applier->apply(event);
  }

  void seed(const Job& job) {
    repository->reduceJobs({job}, MergeSource::EVENT);
  }

  shared_ptr<FakeRemoteChannel> channel;
  shared_ptr<ManualExecutor> executor;
  SyncConfig config;
  shared_ptr<JobRepository> repository;
  shared_ptr<RequestCoordinator> coordinator;
  shared_ptr<EventApplier> applier;
};
}  // namespace

TEST_CASE("Created events insert or hydrate", "[EventApplier]") {
  ApplierFixture f;

  SECTION("Payload with the job") {
    f.apply("job:created", {{"job", makeJobJson("a", "queued", 100)}});
    REQUIRE(f.repository->contains("a"));
    REQUIRE(f.channel->calls.empty());
  }

  SECTION("Payload with only an id") {
    f.apply("job:created", {{"jobId", "a"}});
    REQUIRE(f.applier->isHydrating("a"));
    f.channel->respondTo("job.get", makeJobJson("a", "queued", 100));
    f.executor->runPending();
    REQUIRE(f.repository->contains("a"));
    REQUIRE_FALSE(f.applier->isHydrating("a"));
  }

  SECTION("Internal jobs are filtered for good") {
    f.apply("job:created",
            {{"job", makeJobJson("x", "running", 100, "path_correction")}});
    REQUIRE_FALSE(f.repository->contains("x"));
    f.apply("job:status-changed", {{"jobId", "x"}, {"status", "completed"}});
    REQUIRE(f.channel->calls.empty());
    REQUIRE_FALSE(f.repository->contains("x"));
  }
}

TEST_CASE("Events for unknown jobs wait for one hydration", "[EventApplier]") {
  ApplierFixture f;
  f.apply("job:status-changed",
          {{"jobId", "a"}, {"status", "running"}, {"updatedAt", 200}});
  f.apply("job:tokens-updated", {{"jobId", "a"}, {"tokensReceived", 50}});
  REQUIRE(f.channel->countCalls("job.get") == 1);

  SECTION("Queued events apply after the fetch") {
    f.channel->respondTo("job.get", makeJobJson("a", "queued", 100));
    f.executor->runPending();
    auto job = f.repository->get("a");
    REQUIRE(job->status == JobStatus::RUNNING);
    REQUIRE(job->tokensReceived == 50);
    REQUIRE(*job->updatedAt == 200);
  }

  SECTION("A failed fetch drops them without retrying") {
    f.channel->failNext("job.get", SyncError::server("missing"));
    f.executor->runPending();
    REQUIRE_FALSE(f.repository->contains("a"));
    REQUIRE(f.channel->countCalls("job.get") == 1);
  }
}

TEST_CASE("Status changes", "[EventApplier]") {
  ApplierFixture f;
  f.seed(makeJob("a", JobStatus::RUNNING, 100));

  SECTION("Fields are applied") {
    f.apply("job:status-changed", {{"jobId", "a"},
                                   {"status", "completed"},
                                   {"updatedAt", 300},
                                   {"subStatusMessage", "done"},
                                   {"endTime", 299}});
    auto job = f.repository->get("a");
    REQUIRE(job->status == JobStatus::COMPLETED);
    REQUIRE(job->subStatusMessage == "done");
    REQUIRE(*job->endTime == 299);
  }

  SECTION("A terminal status is not regressed by an undated event") {
    f.apply("job:status-changed",
            {{"jobId", "a"}, {"status", "failed"}, {"updatedAt", 300}});
    f.apply("job:status-changed", {{"jobId", "a"}, {"status", "running"}});
    REQUIRE(f.repository->get("a")->status == JobStatus::FAILED);
  }

  SECTION("A missing status triggers a resync") {
    f.apply("job:status-changed", {{"jobId", "a"}});
    f.executor->advance(700);
    REQUIRE(f.channel->countCalls("job.list") == 1);
  }
}

TEST_CASE("Response chunks must be contiguous", "[EventApplier]") {
  ApplierFixture f;
  f.seed(makeJob("a", JobStatus::GENERATING_STREAM, 100));

  f.apply("job:response-appended",
          {{"jobId", "a"}, {"chunk", "Hel"}, {"accumulatedLength", 3}});
  f.apply("job:response-appended",
          {{"jobId", "a"}, {"chunk", "lo"}, {"accumulatedLength", 5}});
  REQUIRE(f.repository->get("a")->response == "Hello");

  SECTION("Duplicates are dropped") {
    f.apply("job:response-appended",
            {{"jobId", "a"}, {"chunk", "lo"}, {"accumulatedLength", 5}});
    REQUIRE(f.repository->get("a")->response == "Hello");
    REQUIRE(f.channel->calls.empty());
  }

  SECTION("A gap refetches the job once") {
    f.apply("job:response-appended",
            {{"jobId", "a"}, {"chunk", "xyz"}, {"accumulatedLength", 20}});
    f.apply("job:response-appended",
            {{"jobId", "a"}, {"chunk", "uvw"}, {"accumulatedLength", 23}});
    REQUIRE(f.repository->get("a")->response == "Hello");
    REQUIRE(f.channel->countCalls("job.get") == 1);
    REQUIRE(f.applier->isRefetchPending("a"));

    json full = makeJobJson("a", "generating_stream", 150);
    full["response"] = "Hello, world!";
    f.channel->respondTo("job.get", full);
    f.executor->runPending();
    REQUIRE(f.repository->get("a")->response == "Hello, world!");
    REQUIRE_FALSE(f.applier->isRefetchPending("a"));
  }

  SECTION("A chunk without a length refetches") {
    f.apply("job:response-appended", {{"jobId", "a"}, {"chunk", "!"}});
    REQUIRE(f.channel->countCalls("job.get") == 1);
  }

  SECTION("A failed refetch falls back to a resync") {
    f.apply("job:response-appended",
            {{"jobId", "a"}, {"chunk", "xyz"}, {"accumulatedLength", 20}});
    f.channel->failNext("job.get", SyncError::network("reset"));
    f.executor->runPending();
    f.executor->advance(700);
    REQUIRE(f.channel->countCalls("job.list") == 1);
  }
}

TEST_CASE("Finalize replaces the response", "[EventApplier]") {
  ApplierFixture f;
  Job job = makeJob("a", JobStatus::GENERATING_STREAM, 100);
  job.response = "partial";
  f.seed(job);

  SECTION("With the full text") {
    f.apply("job:finalized", {{"jobId", "a"},
                              {"response", "complete text"},
                              {"status", "completed"},
                              {"updatedAt", 500}});
    auto stored = f.repository->get("a");
    REQUIRE(stored->response == "complete text");
    REQUIRE(stored->isFinalized);
    REQUIRE(stored->status == JobStatus::COMPLETED);
  }

  SECTION("Without the text") {
    f.apply("job:finalized", {{"jobId", "a"}});
    REQUIRE(f.channel->countCalls("job.get") == 1);
    REQUIRE(f.repository->get("a")->response == "partial");
  }
}

TEST_CASE("Metadata, cost and deletion", "[EventApplier]") {
  ApplierFixture f;
  Job job = makeJob("a", JobStatus::RUNNING, 100);
  job.metadata = {{"planTitle", "Plan"}, {"taskData", {{"phase", "read"}}}};
  f.seed(job);

  f.apply("job:stream-progress",
          {{"jobId", "a"}, {"progress", 40}, {"responseLength", 1200}});
  auto stored = f.repository->get("a");
  REQUIRE(stored->metadata["taskData"]["progress"] == 40);
  REQUIRE(stored->metadata["taskData"]["phase"] == "read");

  f.apply("job:metadata-updated",
          {{"jobId", "a"}, {"metadataPatch", {{"planTitle", "Renamed"}}}});
  REQUIRE(f.repository->get("a")->metadata["planTitle"] == "Renamed");

  f.apply("job:cost-updated", {{"jobId", "a"}, {"actualCost", 1.5}});
  REQUIRE(*f.repository->get("a")->actualCost == 1.5);

  f.apply("job:deleted", {{"jobId", "a"}});
  REQUIRE_FALSE(f.repository->contains("a"));
}

TEST_CASE("Counter events accept strings and snake case", "[EventApplier]") {
  ApplierFixture f;
  f.seed(makeJob("a", JobStatus::RUNNING, 100));

  f.apply("job:cost-updated", {{"jobId", "a"}, {"actual_cost", "2.25"}});
  REQUIRE(*f.repository->get("a")->actualCost == 2.25);

  f.apply("job:tokens-updated",
          {{"jobId", "a"}, {"tokensSent", "12"}, {"tokens_received", 30}});
  auto stored = f.repository->get("a");
  REQUIRE(stored->tokensSent == 12);
  REQUIRE(stored->tokensReceived == 30);
  REQUIRE_FALSE(f.executor->isScheduled("jobs-resync"));
}

TEST_CASE("Existing-job events without data resync", "[EventApplier]") {
  ApplierFixture f;
  f.seed(makeJob("a", JobStatus::RUNNING, 100));
  Job before = *f.repository->get("a");

  SECTION("Tokens") {
    f.apply("job:tokens-updated", {{"jobId", "a"}});
  }
  SECTION("Cost") {
    f.apply("job:cost-updated", {{"jobId", "a"}, {"actualCost", "free"}});
  }
  SECTION("Stream progress") {
    f.apply("job:stream-progress", {{"jobId", "a"}});
  }

  REQUIRE(f.executor->isScheduled("jobs-resync"));
  REQUIRE(f.channel->calls.empty());
  auto after = f.repository->get("a");
  REQUIRE(after->tokensSent == before.tokensSent);
  REQUIRE_FALSE(after->actualCost);
  REQUIRE(after->metadata == before.metadata);
  f.executor->advance(700);
  REQUIRE(f.channel->countCalls("job.list") == 1);
}

TEST_CASE("Events without a job id resync", "[EventApplier]") {
  ApplierFixture f;
  f.apply("job:tokens-updated", {{"tokensReceived", 1}});
  f.apply("PlanCreated", {{"planId", "p"}});
  f.apply("terminal.exit", {{"sessionId", "t"}});
  REQUIRE(f.channel->calls.empty());
  f.executor->advance(700);
  REQUIRE(f.channel->countCalls("job.list") == 1);
  REQUIRE(EventApplier::isJobEvent("PlanModified"));
  REQUIRE_FALSE(EventApplier::isJobEvent("terminal.exit"));
}

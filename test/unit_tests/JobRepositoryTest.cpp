#include "JobRepository.hpp"

#include "JobTestUtils.hpp"
#include "ManualExecutor.hpp"
#include "TestHeaders.hpp"

using namespace jm;

TEST_CASE("JobRepository publishes derived state", "[JobRepository]") {
  shared_ptr<ManualExecutor> executor(new ManualExecutor());
  SyncConfig config;
  JobRepository repository(executor, config);
  vector<DerivedState> published;
  repository.derivedState().subscribe(
      [&published](const DerivedState& state) { published.push_back(state); });
  REQUIRE(published.size() == 1);

  SECTION("Internal task types never enter the store") {
    repository.reduceJobs(
        {makeJob("a", JobStatus::RUNNING, 100),
         makeJob("x", JobStatus::RUNNING, 100, "web_search_execution")},
        MergeSource::SNAPSHOT);
    REQUIRE(repository.contains("a"));
    REQUIRE_FALSE(repository.contains("x"));
    REQUIRE(repository.wasFiltered("x"));
    REQUIRE(published.back().jobs.size() == 1);
  }

  SECTION("Single event changes publish immediately") {
    repository.reduceJobs({makeJob("a", JobStatus::RUNNING, 100)},
                          MergeSource::EVENT);
    REQUIRE(published.size() == 2);
    REQUIRE(published.back().activeJobsCount == 1);
  }

  SECTION("High frequency changes are debounced") {
    repository.reduceJobs({makeJob("a", JobStatus::RUNNING, 100)},
                          MergeSource::EVENT);
    size_t before = published.size();
    for (int i = 1; i <= 5; i++) {
      Job job = makeJob("a", JobStatus::RUNNING, 100);
      job.tokensReceived = i;
      repository.reduceJobs({job}, MergeSource::EVENT, true);
      executor->advance(10);
    }
    REQUIRE(published.size() == before);
    executor->advance(100);
    REQUIRE(published.size() == before + 1);
    REQUIRE(published.back().jobs[0]->tokensReceived == 5);
  }

  SECTION("A normal change flushes a pending debounce") {
    Job job = makeJob("a", JobStatus::RUNNING, 100);
    repository.reduceJobs({job}, MergeSource::EVENT);
    job.tokensReceived = 7;
    repository.reduceJobs({job}, MergeSource::EVENT, true);
    repository.reduceJobs({makeJob("b", JobStatus::QUEUED, 100)},
                          MergeSource::EVENT);
    REQUIRE(published.back().jobs.size() == 2);
    size_t count = published.size();
    executor->advance(1000);
    REQUIRE(published.size() == count);
    for (const auto& j : published.back().jobs) {
      if (j->id == "a") {
        REQUIRE(j->tokensReceived == 7);
      }
    }
  }

  SECTION("Removing a job publishes") {
    repository.reduceJobs({makeJob("a", JobStatus::RUNNING, 100)},
                          MergeSource::EVENT);
    repository.removeJob("a");
    REQUIRE(published.back().jobs.empty());
    repository.removeJob("a");
    REQUIRE(published.size() == 3);
  }

  SECTION("Reset clears everything") {
    repository.reduceJobs({makeJob("a", JobStatus::RUNNING, 100)},
                          MergeSource::EVENT);
    repository.setError(SyncError::server("boom"));
    repository.markLoadedOnce();
    repository.reset();
    REQUIRE(repository.isEmpty());
    REQUIRE(published.back().jobs.empty());
    auto status = repository.status().get();
    REQUIRE_FALSE(status.error);
    REQUIRE_FALSE(status.hasLoadedOnce);
  }
}

TEST_CASE("JobRepository status flags", "[JobRepository]") {
  shared_ptr<ManualExecutor> executor(new ManualExecutor());
  JobRepository repository(executor, SyncConfig());
  int notifications = 0;
  repository.status().subscribe(
      [&notifications](const JobsStatus&) { notifications++; });

  repository.setLoading(true);
  repository.setLoading(true);
  REQUIRE(notifications == 2);
  REQUIRE(repository.status().get().isLoading);

  repository.setError(std::nullopt);
  REQUIRE(notifications == 2);
  repository.setError(SyncError::timeout("slow"));
  REQUIRE(repository.status().get().error->getKind() ==
          SyncErrorKind::TIMEOUT);
}

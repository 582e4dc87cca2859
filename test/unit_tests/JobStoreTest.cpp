#include "JobStore.hpp"

#include "JobTestUtils.hpp"
#include "TestHeaders.hpp"

using namespace jm;

TEST_CASE("Conflict resolution prefers newer timestamps", "[JobStore]") {
  Job older = makeJob("j", JobStatus::RUNNING, 100);
  Job newer = makeJob("j", JobStatus::RUNNING, 200);

  REQUIRE(JobStore::resolveConflict(older, newer, MergeSource::EVENT));
  REQUIRE_FALSE(JobStore::resolveConflict(newer, older, MergeSource::EVENT));
  REQUIRE_FALSE(JobStore::resolveConflict(newer, older, MergeSource::SNAPSHOT));

  SECTION("Terminal copies win ties") {
    Job done = makeJob("j", JobStatus::COMPLETED, 200);
    REQUIRE_FALSE(JobStore::resolveConflict(done, newer, MergeSource::SNAPSHOT));
    REQUIRE(JobStore::resolveConflict(newer, done, MergeSource::EVENT));
  }

  SECTION("Missing timestamps") {
    Job bare = makeJob("j", JobStatus::RUNNING, std::nullopt);
    bare.createdAt = std::nullopt;
    REQUIRE_FALSE(JobStore::resolveConflict(older, bare, MergeSource::SNAPSHOT));
    REQUIRE(JobStore::resolveConflict(bare, older, MergeSource::EVENT));
    REQUIRE(JobStore::resolveConflict(bare, bare, MergeSource::SNAPSHOT));
    REQUIRE_FALSE(JobStore::resolveConflict(bare, bare, MergeSource::EVENT));
  }
}

TEST_CASE("Snapshots prune and events do not", "[JobStore]") {
  JobStore store;
  auto changes = store.reduce({makeJob("a", JobStatus::RUNNING, 100),
                               makeJob("b", JobStatus::QUEUED, 100)},
                              MergeSource::SNAPSHOT);
  REQUIRE(changes.size() == 2);
  REQUIRE(store.size() == 2);

  SECTION("Event merges keep absent jobs") {
    store.reduce({makeJob("c", JobStatus::QUEUED, 100)}, MergeSource::EVENT);
    REQUIRE(store.size() == 3);
    REQUIRE(store.contains("a"));
  }

  SECTION("Snapshot merges drop absent jobs") {
    changes = store.reduce({makeJob("b", JobStatus::RUNNING, 150)},
                           MergeSource::SNAPSHOT);
    REQUIRE(store.size() == 1);
    REQUIRE_FALSE(store.contains("a"));
    REQUIRE(changes.size() == 2);
    REQUIRE(store.get("b")->status == JobStatus::RUNNING);
  }

  SECTION("Stale copies are ignored") {
    changes = store.reduce({makeJob("a", JobStatus::QUEUED, 50)},
                           MergeSource::EVENT);
    REQUIRE(changes.empty());
    REQUIRE(store.get("a")->status == JobStatus::RUNNING);
  }

  SECTION("Remove reports the removed copy") {
    auto removed = store.remove("a");
    REQUIRE(removed);
    REQUIRE(removed->before->id == "a");
    REQUIRE_FALSE(removed->after);
    REQUIRE_FALSE(store.remove("a"));
  }
}

TEST_CASE("A cancel is not undone by a stale snapshot", "[JobStore]") {
  JobStore store;
  store.reduce({makeJob("a", JobStatus::RUNNING, 100)}, MergeSource::SNAPSHOT);
  store.reduce({makeJob("a", JobStatus::CANCELED, 101)}, MergeSource::EVENT);
  store.reduce({makeJob("a", JobStatus::RUNNING, 100)}, MergeSource::SNAPSHOT);
  REQUIRE(store.get("a")->status == JobStatus::CANCELED);
}

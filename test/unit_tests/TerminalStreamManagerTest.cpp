#include "TerminalStreamManager.hpp"

#include "FakeRemoteChannel.hpp"
#include "ManualExecutor.hpp"
#include "TestHeaders.hpp"

using namespace jm;

namespace {
struct StreamFixture {
  StreamFixture()
      : channel(new FakeRemoteChannel()), executor(new ManualExecutor()) {
    config.unbindGraceMs = 1000;
    manager.reset(new TerminalStreamManager(channel, executor, config));
    channel->connectQuietly("desk");
    manager->onConnectivityChanged("desk", true);
  }

  TerminalConsumer collector(string* out) {
    return [out](const string& bytes) { out->append(bytes); };
  }

  const TerminalBinaryBind& lastBind() {
    for (auto it = channel->controls.rbegin(); it != channel->controls.rend();
         ++it) {
      if (it->second.has_bind()) {
        return it->second.bind();
      }
    }
    throw std::runtime_error("No bind sent");
  }

  shared_ptr<FakeRemoteChannel> channel;
  shared_ptr<ManualExecutor> executor;
  SyncConfig config;
  shared_ptr<TerminalStreamManager> manager;
};
}  // namespace

TEST_CASE("Attaching binds once and streams live bytes",
          "[TerminalStreamManager]") {
  StreamFixture f;
  REQUIRE(f.manager->isSubscribed());

  string first;
  string second;
  int firstToken = f.manager->attach("s1", f.collector(&first));
  f.manager->attach("s1", f.collector(&second));
  REQUIRE(f.channel->countBinds("s1") == 1);
  REQUIRE(f.lastBind().include_snapshot());
  REQUIRE(f.lastBind().producer_device_id() == "desk");
  REQUIRE(f.manager->getLastBoundSessionId() == "s1");

  f.channel->pushFrame("s1", "hello");
  f.executor->runPending();
  REQUIRE(first == "hello");
  REQUIRE(second == "hello");
  REQUIRE(f.manager->snapshot("s1") == "hello");
  REQUIRE(f.manager->lastActivityMs("s1") == optional<int64_t>(0));

  f.manager->detach("s1", firstToken);
  f.channel->pushFrame("s1", " world");
  f.executor->runPending();
  REQUIRE(first == "hello");
  REQUIRE(second == "hello world");
  REQUIRE(f.channel->countUnbinds("s1") == 0);
}

TEST_CASE("Buffered bytes reach a new consumer before live bytes",
          "[TerminalStreamManager]") {
  StreamFixture f;
  f.manager->appendLocal("s1", "initial log\r\n");

  vector<string> chunks;
  f.manager->attach("s1", [&chunks](const string& bytes) {
    chunks.push_back(bytes);
  });
  REQUIRE(chunks == vector<string>{"initial log\r\n"});
  // The local buffer already has history, so the producer must not replay it.
  REQUIRE(f.channel->countBinds("s1") == 1);
  REQUIRE_FALSE(f.lastBind().include_snapshot());

  f.channel->pushFrame("s1", "$ ");
  f.executor->runPending();
  REQUIRE(chunks == vector<string>{"initial log\r\n", "$ "});
}

TEST_CASE("Frames are routed by session", "[TerminalStreamManager]") {
  StreamFixture f;
  string a;
  string b;
  f.manager->attach("a", f.collector(&a));
  f.manager->attach("b", f.collector(&b));

  SECTION("Tagged frames go to their session") {
    f.channel->pushFrame("a", "to-a");
    f.channel->pushFrame("b", "to-b");
    f.executor->runPending();
    REQUIRE(a == "to-a");
    REQUIRE(b == "to-b");
  }

  SECTION("Untagged frames go to the last bound session") {
    f.channel->pushRaw("untagged");
    f.executor->runPending();
    REQUIRE(a == "");
    REQUIRE(b == "untagged");
  }

  SECTION("Frames for unknown sessions are dropped") {
    f.channel->pushFrame("ghost", "boo");
    f.executor->runPending();
    REQUIRE_FALSE(f.manager->hasBuffer("ghost"));
    REQUIRE(a == "");
    REQUIRE(b == "");
  }
}

TEST_CASE("Bound sessions are rebound after a reconnect",
          "[TerminalStreamManager]") {
  StreamFixture f;
  string out;
  f.manager->attach("s1", f.collector(&out));
  f.channel->pushFrame("s1", "before ");
  f.executor->runPending();

  f.channel->connected = false;
  f.manager->onConnectivityChanged("desk", false);
  REQUIRE_FALSE(f.manager->isSubscribed());
  // Bytes produced while offline never arrive.
  f.channel->pushFrame("s1", "lost ");
  f.executor->runPending();
  REQUIRE(out == "before ");

  f.channel->connected = true;
  f.manager->onConnectivityChanged("desk", true);
  REQUIRE(f.manager->isSubscribed());
  REQUIRE(f.channel->countBinds("s1") == 2);
  REQUIRE(f.lastBind().include_snapshot());

  f.channel->pushFrame("s1", "after");
  f.executor->runPending();
  REQUIRE(out == "before after");
  REQUIRE(f.manager->snapshot("s1") == "before after");
}

TEST_CASE("The rebind snapshot restores producer-buffered bytes",
          "[TerminalStreamManager]") {
  StreamFixture f;
  string out;
  f.manager->attach("s1", f.collector(&out));
  f.channel->pushFrame("s1", "$ make\r\n");
  f.executor->runPending();

  f.channel->connected = false;
  f.manager->onConnectivityChanged("desk", false);
  // Output the producer kept while this client was away.
  f.channel->producerBuffers["s1"] = "[100%] Built target app\r\n";
  f.channel->connected = true;
  f.manager->onConnectivityChanged("desk", true);
  REQUIRE(f.lastBind().session_id() == "s1");
  REQUIRE(f.lastBind().include_snapshot());

  f.executor->runPending();
  REQUIRE(out == "$ make\r\n[100%] Built target app\r\n");
  REQUIRE(f.manager->snapshot("s1") == out);

  string late;
  f.manager->attach("s1", f.collector(&late));
  REQUIRE(late == out);
  REQUIRE(f.channel->countBinds("s1") == 2);
}

TEST_CASE("Late frames from a dropped feed are ignored",
          "[TerminalStreamManager]") {
  StreamFixture f;
  string out;
  f.manager->attach("s1", f.collector(&out));
  f.channel->pushFrame("s1", "stale");
  f.manager->onConnectivityChanged("desk", false);
  f.executor->runPending();
  REQUIRE(out == "");
}

TEST_CASE("Finalize unbinds after the grace window",
          "[TerminalStreamManager]") {
  StreamFixture f;
  string out;
  f.manager->attach("s1", f.collector(&out));

  SECTION("Without a new consumer") {
    f.manager->finalize("s1");
    f.executor->advance(999);
    REQUIRE(f.channel->countUnbinds("s1") == 0);
    f.executor->advance(1);
    REQUIRE(f.channel->countUnbinds("s1") == 1);
    REQUIRE(f.manager->getLastBoundSessionId() == "");
    // The buffer outlives the binding.
    REQUIRE(f.manager->hasBuffer("s1"));
  }

  SECTION("Re-attaching inside the window keeps the binding") {
    f.manager->finalize("s1");
    f.executor->advance(300);
    string again;
    f.manager->attach("s1", f.collector(&again));
    f.executor->advance(5000);
    REQUIRE(f.channel->countUnbinds("s1") == 0);
    REQUIRE(f.channel->countBinds("s1") == 1);
  }
}

TEST_CASE("Binds wait for connectivity", "[TerminalStreamManager]") {
  shared_ptr<FakeRemoteChannel> channel(new FakeRemoteChannel());
  shared_ptr<ManualExecutor> executor(new ManualExecutor());
  SyncConfig config;
  shared_ptr<TerminalStreamManager> manager(
      new TerminalStreamManager(channel, executor, config));

  string out;
  manager->attach("s1", [&out](const string& bytes) { out.append(bytes); });
  REQUIRE(channel->controls.empty());

  channel->connectQuietly("desk");
  manager->onConnectivityChanged("desk", true);
  REQUIRE(channel->countBinds("s1") == 1);

  manager->reset();
  REQUIRE_FALSE(manager->hasBuffer("s1"));
  REQUIRE(channel->byteSubscriberCount() == 0);
}

TEST_CASE("Frames queued for a destroyed manager are dropped",
          "[TerminalStreamManager]") {
  StreamFixture f;
  string out;
  f.manager->attach("s1", f.collector(&out));
  f.channel->pushFrame("s1", "queued");
  f.manager.reset();
  REQUIRE(f.channel->byteSubscriberCount() == 0);
  f.executor->runPending();
  f.executor->advance(5000);
  REQUIRE(out == "");
}

#include "PatchDispatcher.hpp"
#include "RecordingConnection.hpp"
#include "TestHeaders.hpp"

#include <future>

using namespace lp;

namespace {
/** Holds every send until released, like a tab that stopped reading. */
class GatedConnection : public RecordingConnection {
 public:
  explicit GatedConnection(const string& sessionId)
      : RecordingConnection(sessionId), entered(false), open(false) {}

  virtual bool send(const string& text) {
    {
      std::unique_lock<std::mutex> lock(gateMutex);
      entered = true;
      gateCv.notify_all();
      gateCv.wait(lock, [this]() { return open; });
    }
    return RecordingConnection::send(text);
  }

  void waitUntilEntered() {
    std::unique_lock<std::mutex> lock(gateMutex);
    gateCv.wait(lock, [this]() { return entered; });
  }

  void release() {
    lock_guard<std::mutex> guard(gateMutex);
    open = true;
    gateCv.notify_all();
  }

 private:
  std::mutex gateMutex;
  std::condition_variable gateCv;
  bool entered;
  bool open;
};

// Checks that each producer's patches appear in increasing order
void requireProducerOrder(const vector<Patch>& stream) {
  map<string, int> last;
  for (const auto& patch : stream) {
    int value = stoi(patch.html);
    auto it = last.find(patch.targetId);
    if (it != last.end()) {
      REQUIRE(it->second < value);
    }
    last[patch.targetId] = value;
  }
}
}  // namespace

TEST_CASE("Patches wait in the queue until someone collects them",
          "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  dispatcher.queuePatch("s", Patch("a", SwapMode::INLINE, "1"));
  dispatcher.queuePatch("s", Patch("b", SwapMode::PREPEND, "2"));
  dispatcher.queuePatch("t", Patch("c", SwapMode::INLINE, "3"));

  auto drained = dispatcher.drainPatches("s");
  REQUIRE(drained == vector<Patch>({Patch("a", SwapMode::INLINE, "1"),
                                    Patch("b", SwapMode::PREPEND, "2")}));
  REQUIRE(dispatcher.drainPatches("s").empty());
  REQUIRE(dispatcher.getQueue()->pendingCount("t") == 1);
  REQUIRE(dispatcher.drainPatches("").empty());
}

TEST_CASE("Open connections get patches pushed immediately",
          "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  auto connection = make_shared<RecordingConnection>("s");
  dispatcher.attachConnection("s", connection);

  dispatcher.queuePatch("s", Patch("clock", SwapMode::INLINE, "12:00"));
  REQUIRE(connection->getPatches() ==
          vector<Patch>({Patch("clock", SwapMode::INLINE, "12:00")}));
  REQUIRE(dispatcher.getQueue()->pendingCount() == 0);
  REQUIRE(dispatcher.drainPatches("s").empty());
}

TEST_CASE("Attaching flushes what queued up while offline",
          "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  dispatcher.queuePatch("s", Patch("a", SwapMode::APPEND, "x"));
  dispatcher.queuePatch("s", Patch("a", SwapMode::APPEND, "y"));

  auto connection = make_shared<RecordingConnection>("s");
  dispatcher.attachConnection("s", connection);
  REQUIRE(connection->getMessages().size() == 1);
  REQUIRE(connection->getPatches().size() == 2);
  REQUIRE(connection->getPatches()[1].html == "y");
  REQUIRE(dispatcher.getQueue()->pendingCount() == 0);

  dispatcher.detachConnection("s", connection);
  dispatcher.queuePatch("s", Patch("a", SwapMode::APPEND, "z"));
  REQUIRE(connection->getPatches().size() == 2);
  REQUIRE(dispatcher.getQueue()->pendingCount("s") == 1);
}

TEST_CASE("A push nobody accepts stays queued", "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  auto broken = make_shared<RecordingConnection>("s", false);
  dispatcher.attachConnection("s", broken);

  dispatcher.queuePatch("s", Patch("a", SwapMode::INLINE, "1"));
  REQUIRE(dispatcher.getRegistry()->connectionCount("s") == 0);
  REQUIRE(dispatcher.drainPatches("s") ==
          vector<Patch>({Patch("a", SwapMode::INLINE, "1")}));
}

TEST_CASE("Reports of a missing target run its cleanup once",
          "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  int runs = 0;
  dispatcher.queuePatch("s", Patch("clock", SwapMode::INLINE, "1"),
                        [&runs]() { runs++; });
  REQUIRE(dispatcher.getQueue()->cleanupCount() == 1);

  dispatcher.notifyInvalid("other", "clock");
  dispatcher.notifyInvalid("s", "other");
  REQUIRE(runs == 0);

  dispatcher.notifyInvalid("s", "clock");
  REQUIRE(runs == 1);
  dispatcher.notifyInvalid("s", "clock");
  REQUIRE(runs == 1);
  REQUIRE(dispatcher.getQueue()->cleanupCount() == 0);
}

TEST_CASE("A newer cleanup replaces the older one", "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  int oldRuns = 0;
  int newRuns = 0;
  dispatcher.queuePatch("s", Patch("clock", SwapMode::INLINE, "1"),
                        [&oldRuns]() { oldRuns++; });
  dispatcher.queuePatch("s", Patch("clock", SwapMode::INLINE, "2"),
                        [&newRuns]() { newRuns++; });
  // A patch without a cleanup leaves the registered one alone
  dispatcher.queuePatch("s", Patch("clock", SwapMode::INLINE, "3"));
  REQUIRE(dispatcher.getQueue()->cleanupCount() == 1);

  dispatcher.notifyInvalid("s", "clock");
  REQUIRE(oldRuns == 0);
  REQUIRE(newRuns == 1);
}

TEST_CASE("Patches without a session or target only clean up",
          "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  int runs = 0;
  dispatcher.queuePatch("", Patch("clock", SwapMode::INLINE, "1"),
                        [&runs]() { runs++; });
  dispatcher.queuePatch("s", Patch("", SwapMode::INLINE, "1"),
                        [&runs]() { runs++; });
  REQUIRE(runs == 2);
  REQUIRE(dispatcher.getQueue()->pendingCount() == 0);
  REQUIRE(dispatcher.getQueue()->cleanupCount() == 0);
}

TEST_CASE("A throwing cleanup is contained", "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  dispatcher.queuePatch("s", Patch("clock", SwapMode::INLINE, "1"), []() {
    throw std::runtime_error("cleanup failed");
  });
  REQUIRE_NOTHROW(dispatcher.notifyInvalid("s", "clock"));
  REQUIRE(dispatcher.getQueue()->cleanupCount() == 0);
}

TEST_CASE("Reload goes to every session", "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  auto a = make_shared<RecordingConnection>("a");
  auto b = make_shared<RecordingConnection>("b");
  dispatcher.attachConnection("a", a);
  dispatcher.attachConnection("b", b);
  REQUIRE(dispatcher.broadcastReload() == 2);
  REQUIRE(json::parse(b->getMessages()[0])["type"] == "reload");
}

TEST_CASE("Html that is not valid UTF-8 does not block later pushes",
          "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  auto connection = make_shared<RecordingConnection>("s");
  dispatcher.attachConnection("s", connection);

  dispatcher.queuePatch("s", Patch("menu", SwapMode::INLINE, "caf\xe9"));
  dispatcher.queuePatch("s", Patch("clock", SwapMode::INLINE, "12:00"));

  auto patches = connection->getPatches();
  REQUIRE(patches.size() == 2);
  REQUIRE(patches[0].html == "caf\xEF\xBF\xBD");
  REQUIRE(patches[1] == Patch("clock", SwapMode::INLINE, "12:00"));
  REQUIRE(dispatcher.getQueue()->pendingCount("s") == 0);
}

TEST_CASE("A stalled session does not hold up other sessions",
          "[PatchDispatcher]") {
  PatchDispatcher dispatcher;
  auto slow = make_shared<GatedConnection>("slow");
  auto fast = make_shared<RecordingConnection>("fast");
  dispatcher.attachConnection("slow", slow);
  dispatcher.attachConnection("fast", fast);

  thread slowPush([&dispatcher]() {
    dispatcher.queuePatch("slow", Patch("a", SwapMode::INLINE, "1"));
  });
  slow->waitUntilEntered();

  auto fastPush = std::async(std::launch::async, [&dispatcher]() {
    dispatcher.queuePatch("fast", Patch("b", SwapMode::INLINE, "2"));
  });
  bool fastFinished = fastPush.wait_for(std::chrono::seconds(5)) ==
                      std::future_status::ready;
  slow->release();
  slowPush.join();
  fastPush.get();

  REQUIRE(fastFinished);
  REQUIRE(fast->getPatches().size() == 1);
  REQUIRE(slow->getPatches().size() == 1);
}

TEST_CASE("Concurrent producers keep their order and lose nothing",
          "[PatchDispatcher]") {
  const int PRODUCERS = 4;
  const int PATCHES_PER_PRODUCER = 200;
  PatchDispatcher dispatcher;

  atomic<bool> producing(true);
  vector<Patch> drained;
  vector<shared_ptr<RecordingConnection>> connections;
  thread consumer([&]() {
    shared_ptr<RecordingConnection> current;
    int round = 0;
    while (producing) {
      if (round % 2 == 0) {
        auto batch = dispatcher.drainPatches("s");
        drained.insert(drained.end(), batch.begin(), batch.end());
      } else {
        if (current) {
          dispatcher.detachConnection("s", current);
        }
        current = make_shared<RecordingConnection>("s");
        connections.push_back(current);
        dispatcher.attachConnection("s", current);
      }
      round++;
      std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
    if (current) {
      dispatcher.detachConnection("s", current);
    }
  });

  vector<thread> producers;
  for (int p = 0; p < PRODUCERS; p++) {
    producers.emplace_back([&dispatcher, p]() {
      string target = string("p") + to_string(p);
      for (int i = 0; i < PATCHES_PER_PRODUCER; i++) {
        dispatcher.queuePatch("s", Patch(target, SwapMode::APPEND,
                                         to_string(i)));
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }
  producing = false;
  consumer.join();
  auto rest = dispatcher.drainPatches("s");
  drained.insert(drained.end(), rest.begin(), rest.end());

  set<pair<string, string>> seen;
  requireProducerOrder(drained);
  for (const auto& patch : drained) {
    seen.insert(make_pair(patch.targetId, patch.html));
  }
  for (const auto& connection : connections) {
    auto delivered = connection->getPatches();
    requireProducerOrder(delivered);
    for (const auto& patch : delivered) {
      seen.insert(make_pair(patch.targetId, patch.html));
    }
  }
  REQUIRE(seen.size() == size_t(PRODUCERS * PATCHES_PER_PRODUCER));
  REQUIRE(dispatcher.getQueue()->pendingCount("s") == 0);
}

TEST_CASE("Envelopes replace bytes that are not UTF-8", "[Patch]") {
  string wire = envelopeToString(
      makePatchEnvelope({Patch("menu", SwapMode::INLINE, "caf\xe9")}));
  json parsed = json::parse(wire);
  REQUIRE(parsed["patches"][0]["html"] == "caf\xEF\xBF\xBD");
  REQUIRE(envelopeToString(makeReloadEnvelope()) == "{\"type\":\"reload\"}");
}

TEST_CASE("Patches serialize to the wire shape", "[Patch]") {
  json j = Patch("log", SwapMode::OUTLINE, "<ul id=\"log\"></ul>");
  REQUIRE(j["id"] == "log");
  REQUIRE(j["swap"] == "outline");
  REQUIRE(j["html"] == "<ul id=\"log\"></ul>");

  Patch parsed = json::parse("{\"id\":\"x\",\"html\":\"y\"}").get<Patch>();
  REQUIRE(parsed == Patch("x", SwapMode::INLINE, "y"));
  parsed = json::parse("{\"id\":\"x\",\"swap\":\"sideways\"}").get<Patch>();
  REQUIRE(parsed.swap == SwapMode::INLINE);
  REQUIRE(parsed.html == "");
  parsed = json::parse("{\"id\":\"x\",\"swap\":\"none\"}").get<Patch>();
  REQUIRE(parsed.swap == SwapMode::NONE);

  for (auto swap : {SwapMode::INLINE, SwapMode::OUTLINE, SwapMode::APPEND,
                    SwapMode::PREPEND, SwapMode::NONE}) {
    REQUIRE(swapModeFromString(swapModeToString(swap)) == swap);
  }
}

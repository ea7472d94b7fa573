#include "PatchQueue.hpp"
#include "TestHeaders.hpp"

using namespace lp;

TEST_CASE("Queued patches keep their order", "[PatchQueue]") {
  PatchQueue queue;
  uint64_t first = queue.enqueue("s", Patch("a", SwapMode::INLINE, "1"));
  uint64_t second = queue.enqueue("s", Patch("b", SwapMode::INLINE, "2"));
  queue.enqueue("other", Patch("c", SwapMode::INLINE, "3"));
  REQUIRE(second > first);
  REQUIRE(queue.pendingCount() == 3);
  REQUIRE(queue.pendingCount("s") == 2);

  auto snapshot = queue.snapshot("s");
  REQUIRE(snapshot.size() == 2);
  REQUIRE(snapshot[0].sequence == first);
  REQUIRE(snapshot[1].patch.targetId == "b");
  // A snapshot does not consume
  REQUIRE(queue.pendingCount("s") == 2);

  auto drained = queue.drain("s");
  REQUIRE(drained.size() == 2);
  REQUIRE(drained[0].targetId == "a");
  REQUIRE(drained[1].targetId == "b");
  REQUIRE(queue.drain("s").empty());
  REQUIRE(queue.pendingCount() == 1);
}

TEST_CASE("Removal stops at the delivered sequence", "[PatchQueue]") {
  PatchQueue queue;
  queue.enqueue("s", Patch("a", SwapMode::INLINE, "1"));
  uint64_t delivered = queue.enqueue("s", Patch("b", SwapMode::INLINE, "2"));
  // Arrives after the snapshot that was pushed
  queue.enqueue("s", Patch("c", SwapMode::INLINE, "3"));

  queue.removeThrough("s", delivered);
  auto left = queue.drain("s");
  REQUIRE(left.size() == 1);
  REQUIRE(left[0].targetId == "c");

  queue.removeThrough("unknown", delivered);
  REQUIRE(queue.pendingCount() == 0);
}

TEST_CASE("One cleanup per session and target", "[PatchQueue]") {
  PatchQueue queue;
  int firstRuns = 0;
  int secondRuns = 0;
  REQUIRE(queue
              .replaceCleanup("s", "clock",
                              CleanupAction([&firstRuns]() { firstRuns++; }))
              .empty());
  CleanupAction previous = queue.replaceCleanup(
      "s", "clock", CleanupAction([&secondRuns]() { secondRuns++; }));
  REQUIRE_FALSE(previous.empty());
  REQUIRE(queue.cleanupCount() == 1);

  CleanupAction taken = queue.takeCleanup("s", "clock");
  REQUIRE(queue.cleanupCount() == 0);
  REQUIRE(taken.invoke());
  REQUIRE_FALSE(taken.invoke());
  REQUIRE(secondRuns == 1);
  REQUIRE(firstRuns == 0);
  REQUIRE(queue.takeCleanup("s", "clock").empty());
}

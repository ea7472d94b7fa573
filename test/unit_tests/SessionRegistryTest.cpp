#include "RecordingConnection.hpp"
#include "SessionRegistry.hpp"
#include "TestHeaders.hpp"

using namespace lp;

TEST_CASE("Connections register per session", "[SessionRegistry]") {
  SessionRegistry registry;
  auto a1 = make_shared<RecordingConnection>("a");
  auto a2 = make_shared<RecordingConnection>("a");
  auto b1 = make_shared<RecordingConnection>("b");

  registry.registerConnection("a", a1);
  registry.registerConnection("a", a2);
  registry.registerConnection("a", a1);
  registry.registerConnection("b", b1);
  registry.registerConnection("", b1);
  REQUIRE(registry.sessionCount() == 2);
  REQUIRE(registry.connectionCount() == 3);
  REQUIRE(registry.connectionCount("a") == 2);

  registry.unregisterConnection("a", a1);
  REQUIRE(registry.connectionCount("a") == 1);
  registry.unregisterConnection("a", a2);
  REQUIRE(registry.connectionCount("a") == 0);
  REQUIRE(registry.sessionCount() == 1);

  // Unknown sessions and connections are ignored
  registry.unregisterConnection("zzz", a1);
  registry.unregisterConnection("b", a1);
  REQUIRE(registry.connectionCount("b") == 1);
}

TEST_CASE("Patches reach every tab of their session only",
          "[SessionRegistry]") {
  SessionRegistry registry;
  auto a1 = make_shared<RecordingConnection>("a");
  auto a2 = make_shared<RecordingConnection>("a");
  auto b1 = make_shared<RecordingConnection>("b");
  registry.registerConnection("a", a1);
  registry.registerConnection("a", a2);
  registry.registerConnection("b", b1);

  vector<Patch> patches = {Patch("clock", SwapMode::INLINE, "12:00"),
                           Patch("log", SwapMode::APPEND, "<li>x</li>")};
  REQUIRE(registry.sendPatches("a", patches));
  REQUIRE(a1->getPatches() == patches);
  REQUIRE(a2->getPatches() == patches);
  REQUIRE(b1->getMessages().empty());

  json envelope = json::parse(a1->getMessages()[0]);
  REQUIRE(envelope["type"] == "patch");
  REQUIRE(envelope["patches"][1]["swap"] == "append");

  REQUIRE_FALSE(registry.sendPatches("nobody", patches));
  REQUIRE_FALSE(registry.sendPatches("a", {}));
}

TEST_CASE("Failed sends drop the connection", "[SessionRegistry]") {
  SessionRegistry registry;
  auto good = make_shared<RecordingConnection>("a");
  auto broken = make_shared<RecordingConnection>("a", false);
  registry.registerConnection("a", good);
  registry.registerConnection("a", broken);

  vector<Patch> patches = {Patch("x", SwapMode::INLINE, "1")};
  REQUIRE(registry.sendPatches("a", patches));
  REQUIRE(registry.connectionCount("a") == 1);

  good->setAccept(false);
  REQUIRE_FALSE(registry.sendPatches("a", patches));
  REQUIRE(registry.connectionCount("a") == 0);
  REQUIRE(registry.sessionCount() == 0);
}

TEST_CASE("Reload reaches every open connection", "[SessionRegistry]") {
  SessionRegistry registry;
  auto a1 = make_shared<RecordingConnection>("a");
  auto b1 = make_shared<RecordingConnection>("b");
  auto b2 = make_shared<RecordingConnection>("b", false);
  registry.registerConnection("a", a1);
  registry.registerConnection("b", b1);
  registry.registerConnection("b", b2);

  REQUIRE(registry.broadcastReload() == 2);
  REQUIRE(a1->getMessages() == vector<string>({"{\"type\":\"reload\"}"}));
  REQUIRE(b1->getMessages().size() == 1);
  REQUIRE(registry.connectionCount() == 2);

  registry.closeAll();
  REQUIRE(registry.connectionCount() == 0);
  REQUIRE(registry.broadcastReload() == 0);
}

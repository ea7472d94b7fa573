#include "ClientScript.hpp"
#include "LivePatchServer.hpp"
#include "PatchClient.hpp"
#include "PipeSocketHandler.hpp"
#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"
#include "httplib.h"

namespace lp {
namespace {
bool waitFor(std::function<bool()> condition) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

bool pumpUntil(PatchClient* client, std::function<bool()> condition) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    client->pump(std::chrono::milliseconds(50));
  }
  return condition();
}

class ServerFixture {
 public:
  explicit ServerFixture(const string& controlPath = "")
      : socketHandler(make_shared<TcpSocketHandler>()),
        dispatcher(make_shared<PatchDispatcher>()) {
    SocketEndpoint listenEndpoint;
    listenEndpoint.set_name("127.0.0.1");
    listenEndpoint.set_port(0);
    server = make_shared<LivePatchServer>(socketHandler, listenEndpoint,
                                          dispatcher);
    if (!controlPath.empty()) {
      controlEndpoint.set_name(controlPath);
      server->enableControlChannel(make_shared<PipeSocketHandler>(),
                                   controlEndpoint);
    }
    endpoint.set_name("127.0.0.1");
    endpoint.set_port(server->getPort());
    serverThread = thread([this]() { server->run(); });
  }

  ~ServerFixture() {
    server->halt();
    serverThread.join();
  }

  shared_ptr<PatchClient> newClient(shared_ptr<Document> document,
                                    const string& sessionId = "") {
    return make_shared<PatchClient>(make_shared<TcpSocketHandler>(), endpoint,
                                    document, sessionId);
  }

  shared_ptr<TcpSocketHandler> socketHandler;
  shared_ptr<PatchDispatcher> dispatcher;
  shared_ptr<LivePatchServer> server;
  SocketEndpoint endpoint;
  SocketEndpoint controlEndpoint;
  thread serverThread;
};
}  // namespace

TEST_CASE("Patches are pushed to an open page exactly once",
          "[LivePatchServer]") {
  ServerFixture fixture;
  auto document = make_shared<MemoryDocument>();
  document->addElement("clock", "--:--");
  auto client = fixture.newClient(document);

  REQUIRE(client->openSocket());
  string sessionId = client->getSessionId();
  REQUIRE(LivePatchServer::isValidSessionId(sessionId));
  auto registry = fixture.dispatcher->getRegistry();
  REQUIRE(waitFor(
      [registry, sessionId]() { return registry->connectionCount(sessionId) == 1; }));

  fixture.dispatcher->queuePatch(sessionId,
                                 Patch("clock", SwapMode::INLINE, "12:00"));
  REQUIRE(pumpUntil(client.get(), [document]() {
    return document->getContent("clock") == "12:00";
  }));
  REQUIRE(fixture.dispatcher->getQueue()->pendingCount(sessionId) == 0);

  // Nothing is left for the poll endpoint
  document->setInner("clock", "local");
  REQUIRE(client->poll());
  REQUIRE(document->getContent("clock") == "local");

  REQUIRE(client->sendPing("hello"));
  REQUIRE(pumpUntil(client.get(),
                    [client]() { return client->getPongCount() == 1; }));

  client->closeSocket();
  REQUIRE(waitFor(
      [registry, sessionId]() { return registry->connectionCount(sessionId) == 0; }));
}

TEST_CASE("Offline pages collect their patches by polling",
          "[LivePatchServer]") {
  ServerFixture fixture;
  auto document = make_shared<MemoryDocument>();
  document->addElement("log", "");
  auto client = fixture.newClient(document, "sess-offline-1");

  fixture.dispatcher->queuePatch("sess-offline-1",
                                 Patch("log", SwapMode::APPEND, "a"));
  fixture.dispatcher->queuePatch("sess-offline-1",
                                 Patch("log", SwapMode::APPEND, "b"));
  fixture.dispatcher->queuePatch("sess-someone-else",
                                 Patch("log", SwapMode::APPEND, "c"));

  REQUIRE(client->poll());
  REQUIRE(document->getContent("log") == "ab");
  REQUIRE(client->poll());
  REQUIRE(document->getContent("log") == "ab");
  REQUIRE(fixture.dispatcher->getQueue()->pendingCount() == 1);
  REQUIRE(client->getSessionId() == "sess-offline-1");
}

TEST_CASE("Latin-1 html still reaches the page", "[LivePatchServer]") {
  ServerFixture fixture;
  auto document = make_shared<MemoryDocument>();
  document->addElement("menu", "");
  document->addElement("clock", "");
  auto client = fixture.newClient(document, "sess-latin1-1");

  fixture.dispatcher->queuePatch("sess-latin1-1",
                                 Patch("menu", SwapMode::INLINE, "caf\xe9"));
  REQUIRE(client->poll());
  REQUIRE(document->getContent("menu") == "caf\xEF\xBF\xBD");

  fixture.dispatcher->queuePatch("sess-latin1-1",
                                 Patch("menu", SwapMode::INLINE, "th\xe9"));
  REQUIRE(client->openSocket());
  REQUIRE(pumpUntil(client.get(), [document]() {
    return document->getContent("menu") == "th\xEF\xBF\xBD";
  }));
  auto registry = fixture.dispatcher->getRegistry();
  REQUIRE(registry->connectionCount("sess-latin1-1") == 1);

  fixture.dispatcher->queuePatch("sess-latin1-1",
                                 Patch("clock", SwapMode::INLINE, "12:00"));
  REQUIRE(pumpUntil(client.get(), [document]() {
    return document->getContent("clock") == "12:00";
  }));
  REQUIRE(fixture.dispatcher->getQueue()->pendingCount() == 0);
  client->closeSocket();
}

TEST_CASE("A silent control peer does not stall the server",
          "[LivePatchServer]") {
  string tmpPath = GetTempDirectory() + string("lp_test_server_XXXXXXXX");
  string pipeDirectory = string(mkdtemp(&tmpPath[0]));
  {
    ServerFixture fixture(pipeDirectory + "/control.sock");
    auto pipeHandler = make_shared<PipeSocketHandler>();
    int silentFd = pipeHandler->connect(fixture.controlEndpoint);
    REQUIRE(silentFd >= 0);
    // Let the accept loop pick up the silent peer first
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    httplib::Client http("127.0.0.1", fixture.endpoint.port());
    http.set_connection_timeout(3, 0);
    http.set_read_timeout(5, 0);
    auto start = std::chrono::steady_clock::now();
    auto res = http.Get(CLIENT_SCRIPT_PATH.c_str());
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(elapsed < std::chrono::seconds(3));

    ControlRequest request;
    request.set_type(CONTROL_STATS);
    auto response = ControlRouter::sendRequest(
        make_shared<PipeSocketHandler>(), fixture.controlEndpoint, request);
    REQUIRE(response.ok());
    pipeHandler->close(silentFd);
  }
  fs::remove_all(pipeDirectory);
}

TEST_CASE("Patches queued while offline arrive when the socket opens",
          "[LivePatchServer]") {
  ServerFixture fixture;
  auto document = make_shared<MemoryDocument>();
  document->addElement("status", "");
  auto client = fixture.newClient(document, "sess-late-1");

  fixture.dispatcher->queuePatch("sess-late-1",
                                 Patch("status", SwapMode::INLINE, "ready"));
  REQUIRE(client->openSocket());
  REQUIRE(pumpUntil(client.get(), [document]() {
    return document->getContent("status") == "ready";
  }));
  REQUIRE(fixture.dispatcher->getQueue()->pendingCount() == 0);
}

TEST_CASE("A missing target stops the producer", "[LivePatchServer]") {
  ServerFixture fixture;
  auto document = make_shared<MemoryDocument>();
  auto client = fixture.newClient(document, "sess-gone-1");

  atomic<int> cleanups(0);
  fixture.dispatcher->queuePatch("sess-gone-1",
                                 Patch("clock", SwapMode::INLINE, "12:00"),
                                 [&cleanups]() { cleanups++; });
  REQUIRE(client->poll());
  REQUIRE(cleanups == 1);
  REQUIRE(fixture.dispatcher->getQueue()->cleanupCount() == 0);
}

TEST_CASE("The run loop connects and applies pushes", "[LivePatchServer]") {
  ServerFixture fixture;
  auto document = make_shared<MemoryDocument>();
  document->addElement("counter", "0");
  auto client = fixture.newClient(document);

  atomic<bool> halt(false);
  thread clientThread([client, &halt]() { client->run(halt); });
  REQUIRE(waitFor([client]() {
    return client->getReconciler()->getState() == ReconcilerState::CONNECTED;
  }));
  string sessionId = client->getSessionId();
  auto registry = fixture.dispatcher->getRegistry();
  REQUIRE(waitFor(
      [registry, sessionId]() { return registry->connectionCount(sessionId) == 1; }));

  fixture.dispatcher->queuePatch(sessionId,
                                 Patch("counter", SwapMode::INLINE, "1"));
  REQUIRE(waitFor(
      [document]() { return document->getContent("counter") == "1"; }));
  REQUIRE(fixture.dispatcher->broadcastReload() == 1);
  REQUIRE(waitFor([document]() { return document->getReloadCount() == 1; }));

  halt = true;
  clientThread.join();
  REQUIRE_FALSE(client->isConnected());
}

TEST_CASE("Pages, actions and protocol endpoints over HTTP",
          "[LivePatchServer]") {
  ServerFixture fixture;
  fixture.server->registerPage("/hello", [](RequestContext& context) {
    return string("<p>hello ") + context.getSessionId() + "</p>";
  });
  fixture.server->registerAction("/append", [](RequestContext& context) {
    context.patch("log", SwapMode::APPEND,
                  "<li>" + context.getRequest().body + "</li>");
    return string("");
  });
  fixture.server->registerPage("/broken", [](RequestContext&) -> string {
    throw std::runtime_error("handler failed");
  });

  httplib::Client http("127.0.0.1", fixture.endpoint.port());
  http.set_connection_timeout(3, 0);
  http.set_read_timeout(5, 0);

  SECTION("New visitors get a session cookie") {
    auto res = http.Get("/hello");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    string setCookie = res->get_header_value("Set-Cookie");
    REQUIRE(setCookie.find(SESSION_COOKIE_NAME + "=sess-") == 0);
    REQUIRE(setCookie.find("HttpOnly") != string::npos);
    REQUIRE(res->body.find("<p>hello sess-") == 0);
  }

  SECTION("Known sessions keep their id") {
    httplib::Headers headers = {{"Cookie", SESSION_COOKIE_NAME + "=sess-k1"}};
    auto res = http.Get("/hello", headers);
    REQUIRE(res);
    REQUIRE(res->body == "<p>hello sess-k1</p>");
    REQUIRE_FALSE(res->has_header("Set-Cookie"));
  }

  SECTION("Actions queue patches for the caller's session") {
    httplib::Headers headers = {{"Cookie", SESSION_COOKIE_NAME + "=sess-a1"}};
    auto res = http.Post("/append", headers, "item", "text/plain");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    auto patches = fixture.dispatcher->drainPatches("sess-a1");
    REQUIRE(patches ==
            vector<Patch>({Patch("log", SwapMode::APPEND, "<li>item</li>")}));
  }

  SECTION("Protocol endpoints check their method") {
    auto poll = http.Get(POLL_PATH.c_str());
    REQUIRE(poll);
    REQUIRE(poll->status == 200);
    REQUIRE(json::parse(poll->body) == makePatchEnvelope({}));
    REQUIRE(poll->get_header_value("Cache-Control") == "no-store");

    auto wrongPoll = http.Post(POLL_PATH.c_str(), string(), "text/plain");
    REQUIRE(wrongPoll);
    REQUIRE(wrongPoll->status == 405);

    auto wrongInvalid = http.Get(INVALID_TARGET_PATH.c_str());
    REQUIRE(wrongInvalid);
    REQUIRE(wrongInvalid->status == 405);

    auto junkInvalid =
        http.Post(INVALID_TARGET_PATH.c_str(), "{not json", "application/json");
    REQUIRE(junkInvalid);
    REQUIRE(junkInvalid->status == 204);

    auto script = http.Get(CLIENT_SCRIPT_PATH.c_str());
    REQUIRE(script);
    REQUIRE(script->status == 200);
    REQUIRE(script->body == ClientScript::source());
    REQUIRE(script->body.find(WEBSOCKET_PATH) != string::npos);
  }

  SECTION("Unknown routes and failing handlers") {
    auto missing = http.Get("/nothing-here");
    REQUIRE(missing);
    REQUIRE(missing->status == 404);

    auto broken = http.Get("/broken");
    REQUIRE(broken);
    REQUIRE(broken->status == 500);

    auto plainUpgrade = http.Get(WEBSOCKET_PATH.c_str());
    REQUIRE(plainUpgrade);
    REQUIRE(plainUpgrade->status == 400);
  }
}
}  // namespace lp

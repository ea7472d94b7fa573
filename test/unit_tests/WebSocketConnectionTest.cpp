#include "SocketPairHandler.hpp"
#include "TestHeaders.hpp"
#include "WebSocketConnection.hpp"

using namespace lp;

namespace {
WebSocketFrame readOneFrame(shared_ptr<SocketPairHandler> socketHandler,
                            int fd) {
  return WebSocketCodec::readFrame(socketHandler.get(), fd, true);
}

void writeMasked(shared_ptr<SocketPairHandler> socketHandler, int fd,
                 uint8_t opcode, const string& payload) {
  string frame = WebSocketCodec::encodeMaskedFrame(opcode, payload);
  socketHandler->writeAllOrThrow(fd, frame.data(), frame.length(), true);
}
}  // namespace

TEST_CASE("Sent text arrives as one unmasked frame", "[WebSocketConnection]") {
  auto socketHandler = make_shared<SocketPairHandler>();
  auto fds = socketHandler->createPair();
  {
    WebSocketConnection connection(socketHandler, fds.first, "sess-a");
    REQUIRE(connection.isOpen());
    REQUIRE(connection.getSessionId() == "sess-a");
    REQUIRE(connection.send("{\"type\":\"reload\"}"));

    string wire = socketHandler->readAvailable(fds.second);
    REQUIRE((uint8_t(wire[1]) & 0x80) == 0);
    size_t consumed = 0;
    auto frame = WebSocketCodec::decodeFrame(wire, &consumed);
    REQUIRE(frame);
    REQUIRE(frame->opcode == WS_OPCODE_TEXT);
    REQUIRE(frame->payload == "{\"type\":\"reload\"}");
  }
  socketHandler->close(fds.second);
}

TEST_CASE("Connections get distinct ids", "[WebSocketConnection]") {
  WebSocketConnection first(nullptr, -1, "s");
  WebSocketConnection second(nullptr, -1, "s");
  REQUIRE(first.getId() != second.getId());
  REQUIRE_FALSE(first.isOpen());
  REQUIRE_FALSE(first.send("x"));
}

TEST_CASE("The receive loop answers pings and honors close",
          "[WebSocketConnection]") {
  auto socketHandler = make_shared<SocketPairHandler>();
  auto fds = socketHandler->createPair();
  auto connection =
      make_shared<WebSocketConnection>(socketHandler, fds.first, "sess-b");
  thread receiveThread([connection]() { connection->run(); });

  writeMasked(socketHandler, fds.second, WS_OPCODE_TEXT, "ignored");
  writeMasked(socketHandler, fds.second, WS_OPCODE_PING, "are you there");
  WebSocketFrame pong = readOneFrame(socketHandler, fds.second);
  REQUIRE(pong.opcode == WS_OPCODE_PONG);
  REQUIRE(pong.payload == "are you there");

  writeMasked(socketHandler, fds.second, WS_OPCODE_CLOSE, string("\x03\xe8", 2));
  WebSocketFrame closeEcho = readOneFrame(socketHandler, fds.second);
  REQUIRE(closeEcho.opcode == WS_OPCODE_CLOSE);
  REQUIRE(closeEcho.payload == string("\x03\xe8", 2));

  receiveThread.join();
  REQUIRE_FALSE(connection->isOpen());
  REQUIRE_FALSE(connection->send("too late"));
  socketHandler->close(fds.second);
}

TEST_CASE("Shutdown ends the receive loop", "[WebSocketConnection]") {
  auto socketHandler = make_shared<SocketPairHandler>();
  auto fds = socketHandler->createPair();
  auto connection =
      make_shared<WebSocketConnection>(socketHandler, fds.first, "sess-c");
  thread receiveThread([connection]() { connection->run(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  connection->shutdown();
  receiveThread.join();
  REQUIRE_FALSE(connection->isOpen());
  // The receive loop released the descriptor
  auto active = socketHandler->getActiveSockets();
  REQUIRE(std::find(active.begin(), active.end(), fds.first) == active.end());
  socketHandler->close(fds.second);
}

TEST_CASE("A failed write closes the connection", "[WebSocketConnection]") {
  auto socketHandler = make_shared<SocketPairHandler>();
  auto fds = socketHandler->createPair();
  WebSocketConnection connection(socketHandler, fds.first, "sess-d");
  socketHandler->close(fds.second);
  REQUIRE_FALSE(connection.send("nobody listening"));
  REQUIRE_FALSE(connection.isOpen());
}

TEST_CASE("A peer that vanishes ends the receive loop",
          "[WebSocketConnection]") {
  auto socketHandler = make_shared<SocketPairHandler>();
  auto fds = socketHandler->createPair();
  auto connection =
      make_shared<WebSocketConnection>(socketHandler, fds.first, "sess-e");
  thread receiveThread([connection]() { connection->run(); });
  socketHandler->close(fds.second);
  receiveThread.join();
  REQUIRE_FALSE(connection->isOpen());
}
